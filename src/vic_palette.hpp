// =============================================================================
// c64view - VIC-II Palette Rendering
// =============================================================================
// CompletedFrame (packed 4-bit colour indices) -> RGBA8 image.
// Each byte holds two pixels, low nibble first.
// =============================================================================
#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "stream_types.hpp"

namespace c64view {

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;
};

/**
 * RGBA image, row-major, 4 bytes per pixel.
 */
struct RgbaImage {
    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;
};

// The 16 VIC-II colours as sent by the device firmware.
const std::array<Rgba, 16>& vicPalette();

// Renders `frame` with nearest-neighbour integer scaling (scale >= 1).
RgbaImage renderFrame(const CompletedFrame& frame, int scale = 1);

// Same, into a caller-owned image (reuses its buffer between frames).
void renderFrame(const CompletedFrame& frame, int scale, RgbaImage& out);

} // namespace c64view
