#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace slide::platform {

// Owns the per-user data directory: the autosave slot, the config file and
// the score database all live under root().
class SdlSaveService {
public:
    // An empty |root| resolves to SDL_GetPrefPath, falling back to ./saves.
    explicit SdlSaveService(std::filesystem::path root = {});

    bool Initialize();

    bool HasAutoSave() const;
    bool AutoSave(const std::vector<std::uint8_t>& payload);
    bool LoadAutoSave(std::vector<std::uint8_t>& out_payload) const;
    bool DeleteAutoSave();

    bool WriteText(const std::string& filename, const std::string& text);
    bool ReadText(const std::string& filename, std::string& out_text) const;

    std::filesystem::path PathFor(const std::string& filename) const;
    const std::filesystem::path& root() const { return root_; }

private:
    bool EnsureRootExists() const;

    std::filesystem::path root_;
    std::filesystem::path autosave_path_;
};

}  // namespace slide::platform
