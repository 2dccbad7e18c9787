// =============================================================================
// c64view - Frame Capture
// =============================================================================
// RGBA8 buffer -> PNG file through stb_image_write.
// =============================================================================
#pragma once

#include <cstdint>
#include <string>

#include "result.hpp"
#include "vic_palette.hpp"

namespace c64view {

// Writes a tightly packed RGBA8 buffer (w * 4 bytes per row). Error::Kind::Io
// when the file cannot be written, Error::Kind::Other for an empty image.
Result<void> savePng(const std::string& path, int w, int h, const uint8_t* rgba);

inline Result<void> savePng(const std::string& path, const RgbaImage& image) {
    return savePng(path, image.width, image.height, image.rgba.data());
}

} // namespace c64view
