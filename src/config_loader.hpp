#pragma once
// =============================================================================
// c64view Config Loader
// =============================================================================
// Loads viewer settings from a JSON file with nlohmann/json, then applies
// C64VIEW_* environment overrides. Missing file -> defaults.
//
// {
//   "network": { "bind_address": "0.0.0.0", "video_port": 11000, "audio_port": 11001,
//                "audio_enabled": true, "socket_rcvbuf_bytes": 4194304 },
//   "video":   { "standard": "PAL", "height": 272, "nominal_fps": 50.0,
//                "retention_window": 4, "lookahead_depth": 2, "stall_timeout_ms": 500 },
//   "audio":   { "ring_ms": 200 },
//   "output":  { "scale": 2, "save_dir": "", "headless": true, "stats_interval_ms": 1000 },
//   "log":     { "level": "info", "file": "" }
// }
// =============================================================================

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

#include <nlohmann/json.hpp>

#include "c64view_log.hpp"
#include "stream_config.hpp"

namespace c64view {
namespace config {

struct LogConfig {
    std::string level = "info";
    std::string file;               // empty = stderr only
};

struct AppConfig {
    StreamConfig stream;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value.
// Integers outside the range of T keep the default instead of wrapping.
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (!j.contains(section) || !j[section].contains(key)) return def;
        const nlohmann::json& v = j[section][key];

        if constexpr (std::is_integral_v<T> && !std::is_same_v<T, bool>) {
            if (!v.is_number_integer()) {
                CVLOG_WARN("config", "%s.%s: expected an integer (using default)",
                           section.c_str(), key.c_str());
                return def;
            }
            bool in_range;
            if (v.is_number_unsigned()) {
                in_range = v.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<T>::max());
            } else {
                int64_t n = v.get<int64_t>();
                in_range = n >= static_cast<int64_t>(std::numeric_limits<T>::min()) &&
                           n <= static_cast<int64_t>(std::numeric_limits<T>::max());
            }
            if (!in_range) {
                CVLOG_WARN("config", "%s.%s: %s out of range (using default)",
                           section.c_str(), key.c_str(), v.dump().c_str());
                return def;
            }
        }
        return v.get<T>();
    } catch (const nlohmann::json::exception& e) {
        CVLOG_WARN("config", "%s.%s: %s (using default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

// "PAL" / "NTSC" (any case). Anything else -> nullopt.
inline std::optional<VideoStandard> parseVideoStandard(std::string name) {
    for (auto& c : name) c = static_cast<char>(toupper(static_cast<unsigned char>(c)));
    if (name == "PAL") return VideoStandard::PAL;
    if (name == "NTSC") return VideoStandard::NTSC;
    return std::nullopt;
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;
    StreamConfig& s = config.stream;
    const StreamConfig def;

    s.bind_address = jsonGet<std::string>(j, "network", "bind_address", def.bind_address);
    s.video_port = jsonGet<uint16_t>(j, "network", "video_port", def.video_port);
    s.audio_port = jsonGet<uint16_t>(j, "network", "audio_port", def.audio_port);
    s.audio_enabled = jsonGet<bool>(j, "network", "audio_enabled", def.audio_enabled);
    s.socket_rcvbuf_bytes = jsonGet<int>(j, "network", "socket_rcvbuf_bytes", def.socket_rcvbuf_bytes);

    auto standard_name = jsonGet<std::string>(j, "video", "standard", "PAL");
    auto standard = parseVideoStandard(standard_name);
    if (!standard) {
        CVLOG_WARN("config", "Unknown video standard '%s', using PAL", standard_name.c_str());
        standard = VideoStandard::PAL;
    }
    applyVideoStandard(s, *standard);

    // Explicit geometry/rate settings override the preset
    uint16_t height = jsonGet<uint16_t>(j, "video", "height", s.geometry.height);
    if (height != s.geometry.height) {
        s.geometry = FrameGeometry::withHeight(height);
        s.standard = VideoStandard::Custom;
    }
    s.nominal_fps = jsonGet<double>(j, "video", "nominal_fps", s.nominal_fps);
    s.retention_window = jsonGet<uint32_t>(j, "video", "retention_window", def.retention_window);
    s.lookahead_depth = jsonGet<uint32_t>(j, "video", "lookahead_depth", def.lookahead_depth);
    s.stall_timeout = std::chrono::milliseconds(
        jsonGet<int>(j, "video", "stall_timeout_ms", static_cast<int>(def.stall_timeout.count())));

    s.audio_ring_ms = jsonGet<uint32_t>(j, "audio", "ring_ms", def.audio_ring_ms);

    s.display_scale = jsonGet<int>(j, "output", "scale", def.display_scale);
    s.save_dir = jsonGet<std::string>(j, "output", "save_dir", def.save_dir);
    s.headless = jsonGet<bool>(j, "output", "headless", def.headless);
    s.stats_interval = std::chrono::milliseconds(
        jsonGet<int>(j, "output", "stats_interval_ms", static_cast<int>(def.stats_interval.count())));

    config.log.level = jsonGet<std::string>(j, "log", "level", config.log.level);
    config.log.file = jsonGet<std::string>(j, "log", "file", config.log.file);
    return config;
}

// Parses JSON text. Syntax errors are logged and yield defaults.
inline AppConfig parseConfigText(const std::string& text) {
    try {
        return parseConfig(nlohmann::json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        CVLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }
}

// @param configPath  Path to config file
inline AppConfig loadConfig(const std::string& configPath = "c64view.json") {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        CVLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return AppConfig{};
    }

    AppConfig config;
    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        CVLOG_ERROR("config", "JSON parse error in %s: %s", configPath.c_str(), e.what());
        return AppConfig{};
    }

    CVLOG_INFO("config", "Loaded %s: video_port=%u, audio=%s, standard=%s",
               configPath.c_str(), (unsigned)config.stream.video_port,
               config.stream.audio_enabled ? "on" : "off",
               videoStandardName(config.stream.standard));
    return config;
}

// =============================================================================
// Environment variable overrides
// =============================================================================

namespace detail {

inline bool envInt(const char* name, long min, long max, long& out) {
    const char* val = std::getenv(name);
    if (!val || !*val) return false;
    char* end = nullptr;
    long v = std::strtol(val, &end, 10);
    if (*end != '\0' || v < min || v > max) {
        CVLOG_WARN("config", "Ignoring %s=%s (expected %ld..%ld)", name, val, min, max);
        return false;
    }
    out = v;
    return true;
}

inline bool envBool(const char* name, bool& out) {
    const char* val = std::getenv(name);
    if (!val || !*val) return false;
    std::string s(val);
    if (s == "1" || s == "true" || s == "on" || s == "yes") { out = true; return true; }
    if (s == "0" || s == "false" || s == "off" || s == "no") { out = false; return true; }
    CVLOG_WARN("config", "Ignoring %s=%s (expected a boolean)", name, val);
    return false;
}

} // namespace detail

inline void applyEnvironmentOverrides(AppConfig& config) {
    StreamConfig& s = config.stream;
    const char* val;
    long n;
    bool b;

    if ((val = std::getenv("C64VIEW_BIND")) && *val) s.bind_address = val;
    if (detail::envInt("C64VIEW_VIDEO_PORT", 0, 65535, n)) s.video_port = static_cast<uint16_t>(n);
    if (detail::envInt("C64VIEW_AUDIO_PORT", 0, 65535, n)) s.audio_port = static_cast<uint16_t>(n);
    if (detail::envBool("C64VIEW_AUDIO", b)) s.audio_enabled = b;
    if ((val = std::getenv("C64VIEW_STANDARD")) && *val) {
        auto standard = parseVideoStandard(val);
        if (standard) {
            applyVideoStandard(s, *standard);
        } else {
            CVLOG_WARN("config", "Ignoring C64VIEW_STANDARD=%s", val);
        }
    }
    if (detail::envInt("C64VIEW_SCALE", 1, 8, n)) s.display_scale = static_cast<int>(n);
    if ((val = std::getenv("C64VIEW_SAVE_DIR"))) s.save_dir = val;
    if (detail::envBool("C64VIEW_HEADLESS", b)) s.headless = b;
    if ((val = std::getenv("C64VIEW_LOG_LEVEL")) && *val) config.log.level = val;
    if ((val = std::getenv("C64VIEW_LOG_FILE"))) config.log.file = val;
}

} // namespace config
} // namespace c64view
