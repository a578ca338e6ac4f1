#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace cal {

Result<void> ConfigLoader::load(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        if (auto gen = tbl["general"].as_table()) {
            if (auto debug = (*gen)["debug"].value<bool>())
                config.setDebug(*debug);
        }

        ConfigParsers::parseLyrics(tbl, config.lyrics());
        ConfigParsers::parseScroll(tbl, config.scroll());
        ConfigParsers::parsePlayer(tbl, config.player());
        ConfigParsers::parseUI(tbl, config.ui());

        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(std::string("Config parse error: ") +
                                 err.what());
    }
}

Result<void> ConfigLoader::loadDefault(Config& config) {
    auto defaultPath = file::configDir() / "config.toml";
    config.configPath_ = defaultPath;

    std::error_code ec;
    if (fs::exists(defaultPath, ec)) {
        return load(config, defaultPath);
    }

    LOG_INFO("No config file at {}, using built-in defaults",
             defaultPath.string());
    return Result<void>::ok();
}

Result<void> ConfigLoader::save(const Config& config, const fs::path& path) {
    try {
        auto tbl = ConfigParsers::serialize(config.lyrics(),
                                            config.scroll(),
                                            config.player(),
                                            config.ui(),
                                            config.debug());
        if (path.has_parent_path())
            file::ensureDir(path.parent_path());

        fs::path tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath);
            if (!file)
                return Result<void>::err("Failed to open temp config file");
            file << tbl;
        }
        fs::rename(tempPath, path);
        LOG_DEBUG("Config saved to: {}", path.string());
        return Result<void>::ok();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to save config: {}", e.what());
        return Result<void>::err(std::string("Failed to save config: ") +
                                 e.what());
    }
}

} // namespace cal
