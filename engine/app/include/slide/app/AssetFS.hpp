#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace slide::app {

bool FileExists(const std::filesystem::path& path);

// Directories named "assets" found walking up from the working directory,
// $SLIDE_ASSETS and the executable directory, in that order.
const std::vector<std::filesystem::path>& AssetRoots();

// First existing match of |relative| under AssetRoots(); the bare relative
// path when nothing matches.
std::filesystem::path AssetPath(const std::string& relative);

}  // namespace slide::app
