#include "FileUtils.hpp"
#include <cstdlib>

namespace cal::file {

namespace {

constexpr const char* kAppDirName = "cmus-auto-lyrics";

fs::path homeDir() {
    if (const char* home = std::getenv("HOME"); home && *home) {
        return fs::path(home);
    }
    return fs::temp_directory_path();
}

fs::path xdgDir(const char* envName, const char* fallback) {
    if (const char* xdg = std::getenv(envName); xdg && *xdg) {
        return fs::path(xdg) / kAppDirName;
    }
    return homeDir() / fallback / kAppDirName;
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

bool ensureDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec)) {
        return true;
    }
    return fs::create_directories(dir, ec) && !ec;
}

fs::path expandHome(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/")) {
        return homeDir() / p.substr(2);
    }
    return fs::path(p);
}

} // namespace cal::file
