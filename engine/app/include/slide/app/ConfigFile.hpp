#pragma once

#include "slide/core/GameConfig.hpp"
#include "slide/platform/SdlSaveService.hpp"

namespace slide::app {

inline constexpr const char* kConfigFileName = "game_config.json";

// Reads game_config.json from the save root, then from the working
// directory. A missing or unreadable file yields the defaults.
slide::core::GameConfig LoadConfig(const slide::platform::SdlSaveService& saves);

bool SaveConfig(slide::platform::SdlSaveService& saves, const slide::core::GameConfig& config);

}  // namespace slide::app
