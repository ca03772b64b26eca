#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "slide/core/Game.hpp"
#include "slide/core/Json.hpp"

namespace slide::core {

inline constexpr int kSavePayloadVersion = 1;
inline constexpr const char* kClassicMode = "classic";

struct SavePayload {
    int version = kSavePayloadVersion;
    std::string mode;
    Json meta = Json::object();
    Json data = Json::object();

    Json ToJson() const;
    static SavePayload FromJson(const Json& json);

    std::string Serialize() const;
    static SavePayload Deserialize(const std::string& json_string);

    std::vector<std::uint8_t> SerializeBinary() const;
    static SavePayload DeserializeBinary(const std::vector<std::uint8_t>& bytes);

    static SavePayload FromGame(const Game& game, std::int64_t timestamp);
    // Throws std::invalid_argument for an unsupported version or mode, and
    // propagates Game::FromJson errors for a damaged session.
    Game ToGame(std::uint32_t seed = std::random_device{}()) const;
    std::int64_t timestamp() const;
};

}  // namespace slide::core
