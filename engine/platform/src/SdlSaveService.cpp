#include "slide/platform/SdlSaveService.hpp"

#include <SDL2/SDL.h>

#include <fstream>
#include <sstream>

namespace slide::platform {

namespace {

constexpr const char* kAutoSaveFile = "autosave.bin";

std::filesystem::path DefaultSaveRoot() {
    std::filesystem::path base;
    if (char* pref = SDL_GetPrefPath("Slide2048", "Slide2048")) {
        base = pref;
        SDL_free(pref);
    }
    if (base.empty()) {
        base = std::filesystem::current_path() / "saves";
    }
    return base;
}

std::filesystem::path NormalizeFilename(const std::string& name) {
    std::filesystem::path path{name};
    return path.filename();
}

bool WriteBytes(const std::filesystem::path& path, const char* data, std::size_t size) {
    std::filesystem::path temp = path;
    temp += ".tmp";
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot open %s for writing",
                        temp.string().c_str());
            return false;
        }
        out.write(data, static_cast<std::streamsize>(size));
        if (!out.good()) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Short write to %s", temp.string().c_str());
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, path, ec);
    if (ec) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Cannot replace %s: %s", path.string().c_str(),
                    ec.message().c_str());
        std::filesystem::remove(temp, ec);
        return false;
    }
    return true;
}

}  // namespace

SdlSaveService::SdlSaveService(std::filesystem::path root)
    : root_(root.empty() ? DefaultSaveRoot() : std::move(root)) {
    autosave_path_ = root_ / kAutoSaveFile;
}

bool SdlSaveService::Initialize() {
    if (!EnsureRootExists()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Save directory %s unavailable",
                    root_.string().c_str());
        return false;
    }
    return true;
}

bool SdlSaveService::EnsureRootExists() const {
    std::error_code ec;
    if (std::filesystem::exists(root_, ec)) {
        return true;
    }
    return std::filesystem::create_directories(root_, ec);
}

std::filesystem::path SdlSaveService::PathFor(const std::string& filename) const {
    return root_ / NormalizeFilename(filename);
}

bool SdlSaveService::HasAutoSave() const {
    std::error_code ec;
    return std::filesystem::is_regular_file(autosave_path_, ec);
}

bool SdlSaveService::AutoSave(const std::vector<std::uint8_t>& payload) {
    if (!EnsureRootExists()) {
        return false;
    }
    return WriteBytes(autosave_path_, reinterpret_cast<const char*>(payload.data()), payload.size());
}

bool SdlSaveService::LoadAutoSave(std::vector<std::uint8_t>& out_payload) const {
    std::ifstream in(autosave_path_, std::ios::binary);
    if (!in) {
        return false;
    }
    in.seekg(0, std::ios::end);
    std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);
    if (size < 0) {
        return false;
    }
    out_payload.resize(static_cast<std::size_t>(size));
    if (size > 0) {
        in.read(reinterpret_cast<char*>(out_payload.data()), size);
    }
    return in.good();
}

bool SdlSaveService::DeleteAutoSave() {
    std::error_code ec;
    const bool removed = std::filesystem::remove(autosave_path_, ec);
    if (ec) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "Failed to delete autosave %s: %s",
                    autosave_path_.string().c_str(), ec.message().c_str());
    }
    return removed;
}

bool SdlSaveService::WriteText(const std::string& filename, const std::string& text) {
    if (!EnsureRootExists()) {
        return false;
    }
    return WriteBytes(PathFor(filename), text.data(), text.size());
}

bool SdlSaveService::ReadText(const std::string& filename, std::string& out_text) const {
    std::ifstream in(PathFor(filename));
    if (!in) {
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    out_text = buffer.str();
    return !in.bad();
}

}  // namespace slide::platform
