#include "slide/app/ConfigFile.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <sstream>

namespace slide::app {

namespace {

bool ReadWorkingDirectoryConfig(std::string& out_text) {
    std::ifstream in(kConfigFileName);
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out_text = buffer.str();
    return true;
}

}  // namespace

slide::core::GameConfig LoadConfig(const slide::platform::SdlSaveService& saves) {
    std::string text;
    std::string source = saves.PathFor(kConfigFileName).string();
    if (!saves.ReadText(kConfigFileName, text)) {
        source = kConfigFileName;
        if (!ReadWorkingDirectoryConfig(text)) {
            SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "No %s found, using defaults", kConfigFileName);
            return slide::core::GameConfig{};
        }
    }
    try {
        auto config = slide::core::GameConfig::Deserialize(text);
        SDL_LogInfo(SDL_LOG_CATEGORY_APPLICATION, "Loaded config from %s", source.c_str());
        return config;
    } catch (const std::exception& ex) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Ignoring malformed %s: %s", source.c_str(), ex.what());
    }
    return slide::core::GameConfig{};
}

bool SaveConfig(slide::platform::SdlSaveService& saves, const slide::core::GameConfig& config) {
    if (!saves.WriteText(kConfigFileName, config.Serialize())) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to write %s", kConfigFileName);
        return false;
    }
    return true;
}

}  // namespace slide::app
