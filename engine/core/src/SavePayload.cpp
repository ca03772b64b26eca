#include "slide/core/SavePayload.hpp"

#include <stdexcept>

namespace slide::core {

Json SavePayload::ToJson() const {
    Json json;
    json["version"] = version;
    json["mode"] = mode;
    json["meta"] = meta;
    json["data"] = data;
    return json;
}

SavePayload SavePayload::FromJson(const Json& json) {
    SavePayload payload;
    if (json.contains("version")) {
        payload.version = json["version"].get<int>();
    }
    if (json.contains("mode") && json["mode"].is_string()) {
        payload.mode = json["mode"].get<std::string>();
    }
    if (json.contains("meta") && json["meta"].is_object()) {
        payload.meta = json["meta"];
    }
    if (json.contains("data") && json["data"].is_object()) {
        payload.data = json["data"];
    }
    return payload;
}

std::string SavePayload::Serialize() const {
    return ToJson().dump();
}

SavePayload SavePayload::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

std::vector<std::uint8_t> SavePayload::SerializeBinary() const {
    return Json::to_msgpack(ToJson());
}

SavePayload SavePayload::DeserializeBinary(const std::vector<std::uint8_t>& bytes) {
    auto json = Json::from_msgpack(bytes);
    return FromJson(json);
}

SavePayload SavePayload::FromGame(const Game& game, std::int64_t timestamp) {
    SavePayload payload;
    payload.mode = kClassicMode;
    payload.meta["timestamp"] = timestamp;
    payload.meta["score"] = game.score();
    payload.meta["max_tile"] = game.maxTile();
    payload.data["game"] = game.ToJson();
    return payload;
}

Game SavePayload::ToGame(std::uint32_t seed) const {
    if (version != kSavePayloadVersion) {
        throw std::invalid_argument("unsupported save version " + std::to_string(version));
    }
    if (mode != kClassicMode) {
        throw std::invalid_argument("unsupported save mode '" + mode + "'");
    }
    if (!data.contains("game")) {
        throw std::invalid_argument("save has no game section");
    }
    return Game::FromJson(data["game"], seed);
}

std::int64_t SavePayload::timestamp() const {
    if (meta.contains("timestamp") && meta["timestamp"].is_number_integer()) {
        return meta["timestamp"].get<std::int64_t>();
    }
    return 0;
}

}  // namespace slide::core
