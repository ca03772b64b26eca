#include "slide/core/GameConfig.hpp"

#include <algorithm>

namespace slide::core {

namespace {

constexpr int kMinResolution = 320;
constexpr int kMaxResolution = 7680;

}  // namespace

std::string ThemeToString(Theme theme) {
    return theme == Theme::Light ? "light" : "dark";
}

std::optional<Theme> ThemeFromString(const std::string& token) {
    if (token == "dark") {
        return Theme::Dark;
    }
    if (token == "light") {
        return Theme::Light;
    }
    return std::nullopt;
}

Game::Rules GameConfig::rules() const {
    Game::Rules rules;
    rules.difficulty = difficulty;
    rules.win_target = win_target;
    return rules;
}

Json GameConfig::ToJson() const {
    Json json;
    json["display_mode"] = display_mode;
    json["screen_width"] = resolution[0];
    json["screen_height"] = resolution[1];
    json["theme"] = ThemeToString(theme);
    json["particle_effects"] = particle_effects;
    json["sound_volume"] = sound_volume;
    json["difficulty"] = DifficultyToString(difficulty);
    json["win_target"] = win_target;
    json["rumble_on"] = rumble_on;
    return json;
}

GameConfig GameConfig::FromJson(const Json& json) {
    GameConfig config;
    if (!json.is_object()) {
        return config;
    }
    if (json.contains("display_mode") && json["display_mode"].is_string()) {
        const auto mode = json["display_mode"].get<std::string>();
        if (mode == "windowed" || mode == "fullscreen") {
            config.display_mode = mode;
        }
    }
    if (json.contains("screen_width") && json["screen_width"].is_number_integer()) {
        config.resolution[0] =
            std::clamp(json["screen_width"].get<int>(), kMinResolution, kMaxResolution);
    }
    if (json.contains("screen_height") && json["screen_height"].is_number_integer()) {
        config.resolution[1] =
            std::clamp(json["screen_height"].get<int>(), kMinResolution, kMaxResolution);
    }
    if (json.contains("theme") && json["theme"].is_string()) {
        if (auto theme = ThemeFromString(json["theme"].get<std::string>())) {
            config.theme = *theme;
        }
    }
    if (json.contains("particle_effects") && json["particle_effects"].is_boolean()) {
        config.particle_effects = json["particle_effects"].get<bool>();
    }
    if (json.contains("sound_volume") && json["sound_volume"].is_number()) {
        config.sound_volume = std::clamp(json["sound_volume"].get<float>(), 0.0f, 1.0f);
    }
    if (json.contains("difficulty") && json["difficulty"].is_string()) {
        if (auto difficulty = DifficultyFromString(json["difficulty"].get<std::string>())) {
            config.difficulty = *difficulty;
        }
    }
    if (json.contains("win_target") && json["win_target"].is_number_integer()) {
        const int target = json["win_target"].get<int>();
        if (IsValidWinTarget(target)) {
            config.win_target = target;
        }
    }
    if (json.contains("rumble_on") && json["rumble_on"].is_boolean()) {
        config.rumble_on = json["rumble_on"].get<bool>();
    }
    return config;
}

std::string GameConfig::Serialize() const {
    return ToJson().dump(4);
}

GameConfig GameConfig::Deserialize(const std::string& json_string) {
    auto json = Json::parse(json_string);
    return FromJson(json);
}

}  // namespace slide::core
