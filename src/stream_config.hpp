// =============================================================================
// c64view - Stream Configuration
// =============================================================================
// Settings consumed by the core. Filled by config_loader.hpp (JSON + env) or
// directly by tests. The core defines no file format of its own.
// =============================================================================
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "c64_protocol.hpp"
#include "result.hpp"

namespace c64view {

enum class VideoStandard { PAL, NTSC, Custom };

inline const char* videoStandardName(VideoStandard s) {
    switch (s) {
        case VideoStandard::PAL:    return "PAL";
        case VideoStandard::NTSC:   return "NTSC";
        case VideoStandard::Custom: return "custom";
    }
    return "?";
}

/**
 * Raster format agreed with the device out of band.
 * Fragment i covers raster lines [i*lines_per_fragment, (i+1)*lines_per_fragment).
 */
struct FrameGeometry {
    uint16_t width = protocol::PIXELS_PER_LINE;
    uint16_t height = protocol::PAL_HEIGHT;
    uint8_t bits_per_pixel = protocol::BITS_PER_PIXEL;
    uint8_t lines_per_fragment = protocol::LINES_PER_PACKET;

    size_t bytesPerLine() const { return static_cast<size_t>(width) * bits_per_pixel / 8; }
    size_t fragmentBytes() const { return bytesPerLine() * lines_per_fragment; }
    size_t frameBytes() const { return bytesPerLine() * height; }
    uint32_t fragmentCount() const {
        return lines_per_fragment ? static_cast<uint32_t>(height / lines_per_fragment) : 0;
    }

    static FrameGeometry pal() { return FrameGeometry{}; }
    static FrameGeometry ntsc() {
        FrameGeometry g;
        g.height = protocol::NTSC_HEIGHT;
        return g;
    }
    static FrameGeometry withHeight(uint16_t h) {
        FrameGeometry g;
        g.height = h;
        return g;
    }

    bool operator==(const FrameGeometry& o) const {
        return width == o.width && height == o.height &&
               bits_per_pixel == o.bits_per_pixel && lines_per_fragment == o.lines_per_fragment;
    }
};

// The device always sends 384-pixel, 4-bpp, 4-line packets; only the height
// differs between standards.
inline Result<void> validateGeometry(const FrameGeometry& g) {
    if (g.width != protocol::PIXELS_PER_LINE) {
        return Error(Error::Kind::InvalidGeometry,
                     "width must be " + std::to_string(protocol::PIXELS_PER_LINE) +
                     ", got " + std::to_string(g.width));
    }
    if (g.bits_per_pixel != protocol::BITS_PER_PIXEL) {
        return Error(Error::Kind::InvalidGeometry,
                     "bits_per_pixel must be 4, got " + std::to_string(g.bits_per_pixel));
    }
    if (g.lines_per_fragment != protocol::LINES_PER_PACKET) {
        return Error(Error::Kind::InvalidGeometry,
                     "lines_per_fragment must be 4, got " + std::to_string(g.lines_per_fragment));
    }
    if (g.height == 0 || g.height % g.lines_per_fragment != 0) {
        return Error(Error::Kind::InvalidGeometry,
                     "height must be a non-zero multiple of 4, got " + std::to_string(g.height));
    }
    if (g.height > protocol::LINE_MASK) {
        return Error(Error::Kind::InvalidGeometry, "height exceeds line field range");
    }
    return Ok();
}

struct StreamConfig {
    // Network
    std::string bind_address = "0.0.0.0";
    uint16_t video_port = protocol::DEFAULT_VIDEO_PORT;
    uint16_t audio_port = protocol::DEFAULT_AUDIO_PORT;
    bool audio_enabled = true;
    int socket_rcvbuf_bytes = 4 * 1024 * 1024;

    // Video
    VideoStandard standard = VideoStandard::PAL;
    FrameGeometry geometry = FrameGeometry::pal();
    double nominal_fps = 50.0;
    uint32_t retention_window = 4;      // in-flight frame sequence numbers
    uint32_t lookahead_depth = 2;       // completed frames buffered ahead of the clock
    std::chrono::milliseconds stall_timeout{500};

    // Audio
    uint32_t audio_ring_ms = 200;

    // Sink-only settings (not interpreted by the core)
    int display_scale = 2;
    std::string save_dir;               // empty = do not persist frames
    bool headless = true;
    std::chrono::milliseconds stats_interval{1000};
};

static constexpr uint32_t MAX_RETENTION_WINDOW = 16;
static constexpr uint32_t MAX_LOOKAHEAD_DEPTH = 3;

inline Result<void> validateConfig(const StreamConfig& c) {
    auto geo = validateGeometry(c.geometry);
    if (geo.is_err()) return geo;

    auto bad = [](const std::string& msg) {
        return Result<void>(Error(Error::Kind::InvalidConfig, msg));
    };
    if (c.bind_address.empty()) return bad("bind_address is empty");
    if (c.audio_enabled && c.audio_port == c.video_port && c.video_port != 0) {
        return bad("audio_port must differ from video_port");
    }
    if (c.nominal_fps <= 0.0 || c.nominal_fps > 1000.0) {
        return bad("nominal_fps out of range: " + std::to_string(c.nominal_fps));
    }
    if (c.retention_window == 0 || c.retention_window > MAX_RETENTION_WINDOW) {
        return bad("retention_window must be 1.." + std::to_string(MAX_RETENTION_WINDOW));
    }
    if (c.lookahead_depth == 0 || c.lookahead_depth > MAX_LOOKAHEAD_DEPTH) {
        return bad("lookahead_depth must be 1.." + std::to_string(MAX_LOOKAHEAD_DEPTH));
    }
    if (c.stall_timeout.count() <= 0) return bad("stall_timeout must be positive");
    if (c.audio_ring_ms < 10 || c.audio_ring_ms > 5000) {
        return bad("audio_ring_ms must be 10..5000");
    }
    if (c.display_scale < 1 || c.display_scale > 8) return bad("scale must be 1..8");
    if (c.socket_rcvbuf_bytes <= 0) return bad("socket_rcvbuf_bytes must be positive");
    return Ok();
}

// Applies the PAL/NTSC preset to geometry and nominal frame rate.
inline void applyVideoStandard(StreamConfig& c, VideoStandard s) {
    c.standard = s;
    if (s == VideoStandard::PAL) {
        c.geometry = FrameGeometry::pal();
        c.nominal_fps = 50.0;
    } else if (s == VideoStandard::NTSC) {
        c.geometry = FrameGeometry::ntsc();
        c.nominal_fps = 60.0;
    }
}

} // namespace c64view
