#include "vic_palette.hpp"

#include <algorithm>
#include <cstring>

namespace c64view {

namespace {

// 0xAABBGGRR words, red in the low byte (device colour table layout)
constexpr uint32_t kDeviceColours[16] = {
    0xFF000000, 0xFFEFEFEF, 0xFF342F8D, 0xFFCDD46A,
    0xFFA43598, 0xFF42B44C, 0xFFB1292C, 0xFF5DEFEF,
    0xFF204E98, 0xFF00385B, 0xFF6D67D1, 0xFF4A4A4A,
    0xFF7B7B7B, 0xFF93EF9F, 0xFFEF6A6D, 0xFFB2B2B2,
};

std::array<Rgba, 16> buildPalette() {
    std::array<Rgba, 16> p{};
    for (size_t i = 0; i < p.size(); i++) {
        uint32_t v = kDeviceColours[i];
        p[i].r = static_cast<uint8_t>(v & 0xFF);
        p[i].g = static_cast<uint8_t>((v >> 8) & 0xFF);
        p[i].b = static_cast<uint8_t>((v >> 16) & 0xFF);
        p[i].a = 255;
    }
    return p;
}

} // namespace

const std::array<Rgba, 16>& vicPalette() {
    static const std::array<Rgba, 16> palette = buildPalette();
    return palette;
}

RgbaImage renderFrame(const CompletedFrame& frame, int scale) {
    RgbaImage img;
    renderFrame(frame, scale, img);
    return img;
}

void renderFrame(const CompletedFrame& frame, int scale, RgbaImage& out) {
    if (scale < 1) scale = 1;
    const auto& pal = vicPalette();
    const int src_w = frame.geometry.width;
    const int src_h = frame.geometry.height;
    const size_t src_stride = frame.geometry.bytesPerLine();

    out.width = src_w * scale;
    out.height = src_h * scale;
    out.rgba.resize(static_cast<size_t>(out.width) * out.height * 4);

    if (frame.pixels.size() < src_stride * src_h) {
        std::fill(out.rgba.begin(), out.rgba.end(), 0);
        return;
    }

    const size_t dst_stride = static_cast<size_t>(out.width) * 4;
    for (int y = 0; y < src_h; y++) {
        const uint8_t* src = frame.pixels.data() + y * src_stride;
        uint8_t* row = out.rgba.data() + static_cast<size_t>(y) * scale * dst_stride;

        uint8_t* dst = row;
        for (int x = 0; x < src_w; x++) {
            uint8_t byte = src[x >> 1];
            uint8_t index = (x & 1) ? (byte >> 4) : (byte & 0x0F);
            const Rgba& c = pal[index];
            for (int s = 0; s < scale; s++) {
                dst[0] = c.r;
                dst[1] = c.g;
                dst[2] = c.b;
                dst[3] = c.a;
                dst += 4;
            }
        }
        // Vertical scaling: duplicate the finished row
        for (int s = 1; s < scale; s++) {
            std::memcpy(row + s * dst_stride, row, dst_stride);
        }
    }
}

} // namespace c64view
