/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * Converts between toml++ tables and the configuration structs.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace cal {

class ConfigParsers {
public:
    static void parseLyrics(const toml::table& tbl, LyricsConfig& cfg);
    static void parseScroll(const toml::table& tbl, ScrollConfig& cfg);
    static void parsePlayer(const toml::table& tbl, PlayerConfig& cfg);
    static void parseUI(const toml::table& tbl, UIConfig& cfg);

    static toml::table serialize(const LyricsConfig& lyrics,
                                 const ScrollConfig& scroll,
                                 const PlayerConfig& player,
                                 const UIConfig& ui,
                                 bool debug);
};

} // namespace cal
