#include "Config.hpp"
#include "ConfigLoader.hpp"

namespace cal {

Result<void> Config::load(const fs::path& path) {
    configPath_ = path;
    return ConfigLoader::load(*this, path);
}

Result<void> Config::loadDefault() {
    return ConfigLoader::loadDefault(*this);
}

Result<void> Config::save(const fs::path& path) const {
    return ConfigLoader::save(*this, path);
}

} // namespace cal
