// =============================================================================
// c64view - Pipeline Data Types
// =============================================================================
// Datagram -> (FrameFragment) -> CompletedFrame / AudioChunk
// =============================================================================
#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

#include "stream_config.hpp"

namespace c64view {

using Clock = std::chrono::steady_clock;

enum class StreamKind { Video, Audio };

inline const char* streamKindName(StreamKind k) {
    return k == StreamKind::Video ? "video" : "audio";
}

/**
 * One received UDP payload. Created by PacketReceiver, consumed by a reassembler.
 */
struct Datagram {
    StreamKind stream = StreamKind::Video;
    std::vector<uint8_t> payload;
    Clock::time_point arrival;
};

/**
 * Parsed view of a video datagram. `pixels` points into the owning Datagram.
 */
struct FrameFragment {
    uint16_t packet_seq = 0;
    uint16_t frame_seq = 0;
    uint16_t line = 0;
    bool last = false;
    uint32_t index = 0;             // line / lines_per_fragment
    const uint8_t* pixels = nullptr;
    size_t pixel_bytes = 0;
};

/**
 * Reassembled raster: geometry.frameBytes() bytes of packed 4-bit colour
 * indices, row-major. Immutable once built.
 */
struct CompletedFrame {
    FrameGeometry geometry;
    uint16_t sequence = 0;          // device frame number
    uint64_t frame_number = 0;      // extended (wrap-free) sequence
    Clock::time_point completed_at;
    std::vector<uint8_t> pixels;
};

using FramePtr = std::shared_ptr<const CompletedFrame>;

/**
 * Interleaved int16 PCM slice read from the audio ring.
 */
struct AudioChunk {
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
    uint64_t index = 0;             // monotonic read order
    size_t silent_frames = 0;       // frames synthesized on underrun (at the tail)
    std::vector<int16_t> samples;   // frames() * channels values

    size_t frames() const { return channels ? samples.size() / channels : 0; }
};

} // namespace c64view
