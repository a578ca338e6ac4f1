/**
 * @file Config.hpp
 * @brief Application configuration.
 *
 * Holds every configuration section. Built once at startup by the
 * Application (file first, then command line overrides) and handed to the
 * components as const references; nothing mutates it afterwards.
 *
 * @section Dependencies
 * - ConfigData
 * - ConfigLoader
 */

#pragma once
#include <filesystem>
#include "ConfigData.hpp"
#include "util/Result.hpp"

namespace cal {

namespace fs = std::filesystem;

class Config {
public:
    Result<void> load(const fs::path& path);
    Result<void> loadDefault();
    Result<void> save(const fs::path& path) const;

    fs::path configPath() const {
        return configPath_;
    }
    bool debug() const {
        return debug_;
    }
    void setDebug(bool v) {
        debug_ = v;
    }

    // Section accessors (const)
    const LyricsConfig& lyrics() const {
        return lyrics_;
    }
    const ScrollConfig& scroll() const {
        return scroll_;
    }
    const PlayerConfig& player() const {
        return player_;
    }
    const UIConfig& ui() const {
        return ui_;
    }

    // Section accessors (mutable, startup only)
    LyricsConfig& lyrics() {
        return lyrics_;
    }
    ScrollConfig& scroll() {
        return scroll_;
    }
    PlayerConfig& player() {
        return player_;
    }
    UIConfig& ui() {
        return ui_;
    }

private:
    friend class ConfigLoader;

    fs::path configPath_;
    bool debug_{false};

    LyricsConfig lyrics_;
    ScrollConfig scroll_;
    PlayerConfig player_;
    UIConfig ui_;
};

} // namespace cal
