#pragma once

#include <array>
#include <string>

#include "slide/core/Game.hpp"
#include "slide/core/Json.hpp"

namespace slide::core {

enum class Theme { Dark, Light };

std::string ThemeToString(Theme theme);
std::optional<Theme> ThemeFromString(const std::string& token);

struct GameConfig {
    std::string display_mode = "windowed";
    std::array<int, 2> resolution{{800, 900}};
    Theme theme = Theme::Dark;
    bool particle_effects = true;
    float sound_volume = 0.5f;
    Difficulty difficulty = Difficulty::Medium;
    int win_target = kDefaultWinTarget;
    bool rumble_on = true;

    bool fullscreen() const { return display_mode == "fullscreen"; }
    Game::Rules rules() const;

    Json ToJson() const;
    // Keys that are missing or of the wrong type keep their default value.
    static GameConfig FromJson(const Json& json);

    std::string Serialize() const;
    static GameConfig Deserialize(const std::string& json_string);
};

}  // namespace slide::core
