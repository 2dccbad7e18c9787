// =============================================================================
// c64view - Frame Capture Implementation
// =============================================================================
// Owns STB_IMAGE_WRITE_IMPLEMENTATION to avoid duplicate definitions.
// =============================================================================
#include "frame_capture.hpp"

#include "c64view_log.hpp"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

namespace c64view {

Result<void> savePng(const std::string& path, int w, int h, const uint8_t* rgba) {
    if (w <= 0 || h <= 0 || rgba == nullptr) {
        return Error(Error::Kind::Other, "invalid image " + std::to_string(w) + "x" +
                                             std::to_string(h));
    }

    int ok = stbi_write_png(path.c_str(), w, h, 4, rgba, w * 4);
    if (!ok) {
        return Error(Error::Kind::Io, "stbi_write_png failed: " + path);
    }
    CVLOG_TRACE("capture", "Frame saved: %s (%dx%d)", path.c_str(), w, h);
    return Ok();
}

} // namespace c64view
