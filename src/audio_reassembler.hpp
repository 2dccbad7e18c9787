// =============================================================================
// c64view - Audio Reassembly
// =============================================================================
// AudioRingBuffer: fixed-capacity interleaved int16 PCM ring.
//   - write() never blocks; a full ring overwrites the oldest unread frames
//   - read() never blocks; missing frames are returned as silence
//   - read cursor <= write cursor at all times (64-bit monotonic cursors)
//
// AudioReassembler: audio datagram -> ring. Single producer (receive thread),
// single consumer (presentation path).
// =============================================================================
#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "stream_stats.hpp"
#include "stream_types.hpp"

namespace c64view {

class AudioRingBuffer {
public:
    AudioRingBuffer(size_t capacity_frames, uint16_t channels, StreamStats& stats);

    // Appends `frames` interleaved frames. Returns the number of unread frames
    // that were overwritten to make room.
    size_t write(const int16_t* samples, size_t frames);

    // Reads exactly `frames` frames into `out` (resized). Returns the number of
    // frames that came from the ring; the rest is zero-filled.
    size_t read(std::vector<int16_t>& out, size_t frames);

    size_t available() const;
    size_t capacity() const { return capacity_; }
    uint16_t channels() const { return channels_; }
    uint64_t readPosition() const;
    uint64_t writePosition() const;
    void clear();

private:
    void publishLevel();  // mutex_ held

    const size_t capacity_;
    const uint16_t channels_;
    StreamStats& stats_;

    mutable std::mutex mutex_;
    std::vector<int16_t> data_;
    uint64_t read_pos_ = 0;   // in frames
    uint64_t write_pos_ = 0;
};

class AudioReassembler {
public:
    // ring_ms of audio at the device sample rate
    AudioReassembler(uint32_t ring_ms, StreamStats& stats);

    // Accepts one audio datagram. False (and packets_discarded) if malformed.
    bool submit(const Datagram& d);

    // Never blocks. Short reads are padded with silence (audio_underruns).
    AudioChunk read(size_t frames);

    size_t available() const { return ring_.available(); }
    const AudioRingBuffer& ring() const { return ring_; }

    uint32_t sampleRate() const { return sample_rate_; }
    uint16_t channels() const { return ring_.channels(); }

    void reset();

    static size_t framesForMs(uint32_t ms);

private:
    StreamStats& stats_;
    AudioRingBuffer ring_;
    uint32_t sample_rate_;

    // Producer side
    std::optional<uint16_t> last_seq_;
    std::vector<int16_t> decode_buf_;

    // Consumer side
    std::mutex read_mutex_;
    uint64_t next_chunk_index_ = 0;
};

} // namespace c64view
