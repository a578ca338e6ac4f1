#pragma once
// FileUtils.hpp - Filesystem helpers and XDG directory lookup

#include <filesystem>
#include <string>
#include <string_view>

namespace cal::file {

namespace fs = std::filesystem;

// $XDG_CONFIG_HOME/cmus-auto-lyrics (or ~/.config/cmus-auto-lyrics)
fs::path configDir();
// $XDG_CACHE_HOME/cmus-auto-lyrics (or ~/.cache/cmus-auto-lyrics)
fs::path cacheDir();

bool ensureDir(const fs::path& dir);

// "~/x" -> "$HOME/x"; anything else is returned unchanged
fs::path expandHome(std::string_view path);

} // namespace cal::file
