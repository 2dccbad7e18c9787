// =============================================================================
// c64view - Device Stream Wire Format
// =============================================================================
// Ultimate64 video/audio UDP stream layout. Fixed contract with the device,
// never renegotiated at runtime. All multi-byte fields are little endian.
//
// Video datagram (780 bytes):
//   seq:        2 bytes  packet sequence number
//   frame:      2 bytes  frame number (wraps at 65536)
//   line:       2 bytes  first raster line; bit 15 = last packet of the frame
//   width:      2 bytes  pixels per line (384)
//   lines:      1 byte   lines per packet (4)
//   bpp:        1 byte   bits per pixel (4)
//   reserved:   2 bytes
//   pixels:   768 bytes  4 lines x 192 bytes, two VIC-II colour indices per byte
//
// Audio datagram (770 bytes):
//   seq:        2 bytes
//   samples:  768 bytes  192 stereo frames of int16 PCM at 47976 Hz
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>

namespace c64view::protocol {

static constexpr uint16_t DEFAULT_VIDEO_PORT = 11000;
static constexpr uint16_t DEFAULT_AUDIO_PORT = 11001;

// Video
static constexpr size_t   VIDEO_PACKET_SIZE     = 780;
static constexpr size_t   VIDEO_HEADER_SIZE     = 12;
static constexpr size_t   VIDEO_PAYLOAD_SIZE    = VIDEO_PACKET_SIZE - VIDEO_HEADER_SIZE;
static constexpr uint16_t PIXELS_PER_LINE       = 384;
static constexpr uint8_t  LINES_PER_PACKET      = 4;
static constexpr uint8_t  BITS_PER_PIXEL        = 4;
static constexpr size_t   BYTES_PER_LINE        = PIXELS_PER_LINE * BITS_PER_PIXEL / 8;  // 192
static constexpr uint16_t LAST_PACKET_FLAG      = 0x8000;
static constexpr uint16_t LINE_MASK             = 0x7FFF;
static constexpr uint16_t PAL_HEIGHT            = 272;
static constexpr uint16_t NTSC_HEIGHT           = 240;

static_assert(VIDEO_PAYLOAD_SIZE == BYTES_PER_LINE * LINES_PER_PACKET,
              "video payload must hold exactly LINES_PER_PACKET raster lines");

// Audio
static constexpr size_t   AUDIO_PACKET_SIZE      = 770;
static constexpr size_t   AUDIO_HEADER_SIZE      = 2;
static constexpr size_t   AUDIO_PAYLOAD_SIZE     = AUDIO_PACKET_SIZE - AUDIO_HEADER_SIZE;
static constexpr uint32_t AUDIO_SAMPLE_RATE      = 47976;
static constexpr uint16_t AUDIO_CHANNELS         = 2;
static constexpr size_t   AUDIO_FRAMES_PER_PACKET = AUDIO_PAYLOAD_SIZE / (AUDIO_CHANNELS * sizeof(int16_t));  // 192

static inline uint16_t rd16le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

static inline void wr16le(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>(v >> 8);
}

struct VideoHeader {
    uint16_t packet_seq = 0;
    uint16_t frame_num = 0;
    uint16_t line = 0;        // LINE_MASK applied
    bool last = false;
    uint16_t pixels_per_line = 0;
    uint8_t lines_per_packet = 0;
    uint8_t bits_per_pixel = 0;
};

// Decodes the header of a video datagram. Returns nullopt when the size or the
// format fields disagree with the device raster contract.
inline std::optional<VideoHeader> parseVideoHeader(const uint8_t* data, size_t len) {
    if (data == nullptr || len != VIDEO_PACKET_SIZE) return std::nullopt;

    VideoHeader h;
    h.packet_seq = rd16le(data + 0);
    h.frame_num = rd16le(data + 2);
    uint16_t raw_line = rd16le(data + 4);
    h.last = (raw_line & LAST_PACKET_FLAG) != 0;
    h.line = raw_line & LINE_MASK;
    h.pixels_per_line = rd16le(data + 6);
    h.lines_per_packet = data[8];
    h.bits_per_pixel = data[9];

    if (h.pixels_per_line != PIXELS_PER_LINE ||
        h.lines_per_packet != LINES_PER_PACKET ||
        h.bits_per_pixel != BITS_PER_PIXEL) {
        return std::nullopt;
    }
    if (h.line % LINES_PER_PACKET != 0) return std::nullopt;
    return h;
}

// Writes a video header into `out` (VIDEO_HEADER_SIZE bytes). Used by the
// loopback sender in tests.
inline void writeVideoHeader(uint8_t* out, uint16_t packet_seq, uint16_t frame_num,
                             uint16_t line, bool last) {
    wr16le(out + 0, packet_seq);
    wr16le(out + 2, frame_num);
    wr16le(out + 4, static_cast<uint16_t>((line & LINE_MASK) | (last ? LAST_PACKET_FLAG : 0)));
    wr16le(out + 6, PIXELS_PER_LINE);
    out[8] = LINES_PER_PACKET;
    out[9] = BITS_PER_PIXEL;
    out[10] = 0;
    out[11] = 0;
}

inline std::optional<uint16_t> parseAudioSequence(const uint8_t* data, size_t len) {
    if (data == nullptr || len != AUDIO_PACKET_SIZE) return std::nullopt;
    return rd16le(data);
}

} // namespace c64view::protocol
