#include "ConfigParsers.hpp"
#include <algorithm>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace cal {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(*val);
        }
    }
    return defaultVal;
}

// Signed read for fields that are later clamped, so negative input does not
// wrap around in an unsigned field
i64 getInt(const toml::table& tbl, std::string_view key, i64 defaultVal) {
    return get<i64>(tbl, key, defaultVal);
}

std::string trimSlash(std::string url) {
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    return url;
}
} // namespace

void ConfigParsers::parseLyrics(const toml::table& tbl, LyricsConfig& cfg) {
    if (auto lyrics = tbl["lyrics"].as_table()) {
        cfg.geniusToken = get(*lyrics, "genius_token", std::string());
        cfg.clearHeaders = get(*lyrics, "clear_headers", false);
        cfg.saveTags = get(*lyrics, "save_tags", false);
        cfg.offline = get(*lyrics, "offline", false);
        cfg.requestTimeoutMs = static_cast<u32>(std::clamp<i64>(
                getInt(*lyrics, "request_timeout_ms", 10000), 1000, 60000));
        cfg.geniusApiUrl = trimSlash(get(*lyrics,
                                         "genius_api_url",
                                         std::string("https://api.genius.com")));
        cfg.azlyricsUrl = trimSlash(get(*lyrics,
                                        "azlyrics_url",
                                        std::string("https://www.azlyrics.com")));
    }
}

void ConfigParsers::parseScroll(const toml::table& tbl, ScrollConfig& cfg) {
    if (auto scroll = tbl["scroll"].as_table()) {
        cfg.autoScroll = get(*scroll, "auto_scroll", false);
    }
}

void ConfigParsers::parsePlayer(const toml::table& tbl, PlayerConfig& cfg) {
    if (auto player = tbl["player"].as_table()) {
        cfg.remoteCommand = file::expandHome(
                get(*player, "remote_command", std::string("cmus-remote")))
                                    .string();
        cfg.pollIntervalMs = static_cast<u32>(std::clamp<i64>(
                getInt(*player, "poll_interval_ms", 1000), 100, 10000));
        cfg.maxBackoffMs = static_cast<u32>(
                std::max<i64>(getInt(*player, "max_backoff_ms", 8000),
                              cfg.pollIntervalMs));
        cfg.commandTimeoutMs = static_cast<u32>(std::clamp<i64>(
                getInt(*player, "command_timeout_ms", 2000), 100, 30000));
    }
    if (cfg.remoteCommand.empty()) {
        LOG_WARN("Config: empty player.remote_command, using cmus-remote");
        cfg.remoteCommand = "cmus-remote";
    }
}

void ConfigParsers::parseUI(const toml::table& tbl, UIConfig& cfg) {
    if (auto uiTbl = tbl["ui"].as_table()) {
        cfg.center = get(*uiTbl, "center", false);
        cfg.limitHeight = static_cast<u32>(
                std::clamp<i64>(getInt(*uiTbl, "limit_height", 0), 0, 1000));
        cfg.color = static_cast<i32>(
                std::clamp<i64>(getInt(*uiTbl, "color", -1), -1, 255));
        cfg.colorCurrent = static_cast<i32>(
                std::clamp<i64>(getInt(*uiTbl, "color_current", 3), -1, 255));
    }
}

toml::table ConfigParsers::serialize(const LyricsConfig& lyrics,
                                     const ScrollConfig& scroll,
                                     const PlayerConfig& player,
                                     const UIConfig& ui,
                                     bool debug) {
    toml::table tbl;

    tbl.insert("general", toml::table{{"debug", debug}});

    tbl.insert("lyrics",
               toml::table{
                       {"genius_token", lyrics.geniusToken},
                       {"clear_headers", lyrics.clearHeaders},
                       {"save_tags", lyrics.saveTags},
                       {"offline", lyrics.offline},
                       {"request_timeout_ms",
                        static_cast<i64>(lyrics.requestTimeoutMs)},
                       {"genius_api_url", lyrics.geniusApiUrl},
                       {"azlyrics_url", lyrics.azlyricsUrl},
               });

    tbl.insert("scroll", toml::table{{"auto_scroll", scroll.autoScroll}});

    tbl.insert("player",
               toml::table{
                       {"remote_command", player.remoteCommand},
                       {"poll_interval_ms",
                        static_cast<i64>(player.pollIntervalMs)},
                       {"max_backoff_ms", static_cast<i64>(player.maxBackoffMs)},
                       {"command_timeout_ms",
                        static_cast<i64>(player.commandTimeoutMs)},
               });

    tbl.insert("ui",
               toml::table{
                       {"center", ui.center},
                       {"limit_height", static_cast<i64>(ui.limitHeight)},
                       {"color", static_cast<i64>(ui.color)},
                       {"color_current", static_cast<i64>(ui.colorCurrent)},
               });

    return tbl;
}

} // namespace cal
