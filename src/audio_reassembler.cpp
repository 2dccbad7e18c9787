#include "audio_reassembler.hpp"

#include <algorithm>
#include <cstring>

#include "c64_protocol.hpp"
#include "c64view_log.hpp"

namespace c64view {

// =============================================================================
// AudioRingBuffer
// =============================================================================

AudioRingBuffer::AudioRingBuffer(size_t capacity_frames, uint16_t channels, StreamStats& stats)
    : capacity_(capacity_frames == 0 ? 1 : capacity_frames)
    , channels_(channels == 0 ? 1 : channels)
    , stats_(stats)
    , data_(capacity_ * channels_, 0) {}

size_t AudioRingBuffer::write(const int16_t* samples, size_t frames) {
    if (samples == nullptr || frames == 0) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    size_t overwritten = 0;

    // A single write larger than the ring keeps only its newest frames
    if (frames > capacity_) {
        size_t skip = frames - capacity_;
        samples += skip * channels_;
        frames = capacity_;
        overwritten += skip;
    }

    uint64_t used = write_pos_ - read_pos_;
    if (used + frames > capacity_) {
        size_t drop = static_cast<size_t>(used + frames - capacity_);
        read_pos_ += drop;
        overwritten += drop;
    }

    size_t start = static_cast<size_t>(write_pos_ % capacity_);
    size_t first = std::min(frames, capacity_ - start);
    std::memcpy(&data_[start * channels_], samples, first * channels_ * sizeof(int16_t));
    if (first < frames) {
        std::memcpy(&data_[0], samples + first * channels_,
                    (frames - first) * channels_ * sizeof(int16_t));
    }
    write_pos_ += frames;

    if (overwritten > 0) {
        stats_.audio_overruns.fetch_add(1, std::memory_order_relaxed);
    }
    publishLevel();
    return overwritten;
}

size_t AudioRingBuffer::read(std::vector<int16_t>& out, size_t frames) {
    out.assign(frames * channels_, 0);
    if (frames == 0) return 0;

    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = static_cast<size_t>(std::min<uint64_t>(frames, write_pos_ - read_pos_));

    size_t start = static_cast<size_t>(read_pos_ % capacity_);
    size_t first = std::min(n, capacity_ - start);
    if (first > 0) {
        std::memcpy(out.data(), &data_[start * channels_], first * channels_ * sizeof(int16_t));
    }
    if (first < n) {
        std::memcpy(out.data() + first * channels_, &data_[0],
                    (n - first) * channels_ * sizeof(int16_t));
    }
    read_pos_ += n;

    if (n < frames) {
        stats_.audio_underruns.fetch_add(1, std::memory_order_relaxed);
    }
    publishLevel();
    return n;
}

size_t AudioRingBuffer::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(write_pos_ - read_pos_);
}

uint64_t AudioRingBuffer::readPosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read_pos_;
}

uint64_t AudioRingBuffer::writePosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return write_pos_;
}

void AudioRingBuffer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    read_pos_ = write_pos_;
    publishLevel();
}

void AudioRingBuffer::publishLevel() {
    stats_.audio_buffered_frames.store(write_pos_ - read_pos_, std::memory_order_relaxed);
}

// =============================================================================
// AudioReassembler
// =============================================================================

size_t AudioReassembler::framesForMs(uint32_t ms) {
    return static_cast<size_t>(static_cast<uint64_t>(protocol::AUDIO_SAMPLE_RATE) * ms / 1000);
}

AudioReassembler::AudioReassembler(uint32_t ring_ms, StreamStats& stats)
    : stats_(stats)
    , ring_(framesForMs(ring_ms), protocol::AUDIO_CHANNELS, stats)
    , sample_rate_(protocol::AUDIO_SAMPLE_RATE)
    , decode_buf_(protocol::AUDIO_FRAMES_PER_PACKET * protocol::AUDIO_CHANNELS) {
    CVLOG_DEBUG("audio", "Ring: %zu frames (%u ms) at %u Hz", ring_.capacity(), ring_ms,
                sample_rate_);
}

bool AudioReassembler::submit(const Datagram& d) {
    auto seq = protocol::parseAudioSequence(d.payload.data(), d.payload.size());
    if (d.stream != StreamKind::Audio || !seq) {
        stats_.packets_discarded.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    stats_.audio_packets_received.fetch_add(1, std::memory_order_relaxed);

    if (!last_seq_) {
        CVLOG_INFO("audio", "First audio packet: seq %u", (unsigned)*seq);
        last_seq_ = *seq;
    } else {
        auto delta = static_cast<int16_t>(static_cast<uint16_t>(*seq - *last_seq_));
        if (delta > 1) {
            stats_.audio_packets_lost.fetch_add(static_cast<uint64_t>(delta - 1),
                                                std::memory_order_relaxed);
        }
        // Reordered packets keep the highest sequence; a large step back is a restart
        if (delta > 0 || delta < -64) last_seq_ = *seq;
    }

    const uint8_t* p = d.payload.data() + protocol::AUDIO_HEADER_SIZE;
    for (size_t i = 0; i < decode_buf_.size(); i++) {
        decode_buf_[i] = static_cast<int16_t>(protocol::rd16le(p + i * 2));
    }
    ring_.write(decode_buf_.data(), protocol::AUDIO_FRAMES_PER_PACKET);
    return true;
}

AudioChunk AudioReassembler::read(size_t frames) {
    std::lock_guard<std::mutex> lock(read_mutex_);
    AudioChunk chunk;
    chunk.sample_rate = sample_rate_;
    chunk.channels = ring_.channels();
    chunk.index = next_chunk_index_++;
    size_t got = ring_.read(chunk.samples, frames);
    chunk.silent_frames = frames - got;
    return chunk;
}

void AudioReassembler::reset() {
    ring_.clear();
    last_seq_.reset();
    std::lock_guard<std::mutex> lock(read_mutex_);
    next_chunk_index_ = 0;
}

} // namespace c64view
