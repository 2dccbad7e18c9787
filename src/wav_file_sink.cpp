#include "wav_file_sink.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <limits>
#include <vector>

#include "c64_protocol.hpp"
#include "c64view_log.hpp"

namespace c64view {

namespace {

void put16(uint8_t* p, uint16_t v) {
    p[0] = v & 0xFF;
    p[1] = (v >> 8) & 0xFF;
}

void put32(uint8_t* p, uint32_t v) {
    p[0] = v & 0xFF;
    p[1] = (v >> 8) & 0xFF;
    p[2] = (v >> 16) & 0xFF;
    p[3] = (v >> 24) & 0xFF;
}

constexpr size_t kHeaderSize = 44;

} // namespace

WavFileSink::~WavFileSink() {
    close();
}

Result<void> WavFileSink::open(const StreamConfig& config) {
    if (config.save_dir.empty() || !config.audio_enabled) return Ok();

    std::error_code ec;
    std::filesystem::create_directories(config.save_dir, ec);
    if (ec) {
        return Error(Error::Kind::Io, "cannot create " + config.save_dir + ": " + ec.message());
    }
    auto path = (std::filesystem::path(config.save_dir) / FILE_NAME).string();
    return openFile(path, protocol::AUDIO_SAMPLE_RATE, protocol::AUDIO_CHANNELS);
}

Result<void> WavFileSink::openFile(const std::string& path, uint32_t sample_rate,
                                   uint16_t channels) {
    close();
    file_ = fopen(path.c_str(), "wb");
    if (!file_) {
        int err = errno;
        return Error(Error::Kind::Io, "cannot open " + path + ": " + strerror(err), err);
    }
    path_ = path;
    sample_rate_ = sample_rate;
    channels_ = channels;
    frames_written_ = 0;
    write_failed_ = false;
    dc_ = DcBlocker(channels);

    if (!writeHeader(0)) {
        close();
        return Error(Error::Kind::Io, "cannot write WAV header to " + path);
    }
    CVLOG_INFO("wav", "Recording audio to %s (%u Hz, %u ch)", path.c_str(), sample_rate, channels);
    return Ok();
}

bool WavFileSink::writeHeader(uint32_t data_bytes) {
    uint8_t h[kHeaderSize];
    const uint16_t block_align = static_cast<uint16_t>(channels_ * sizeof(int16_t));
    std::memcpy(h + 0, "RIFF", 4);
    put32(h + 4, 36 + data_bytes);
    std::memcpy(h + 8, "WAVE", 4);
    std::memcpy(h + 12, "fmt ", 4);
    put32(h + 16, 16);              // PCM fmt chunk size
    put16(h + 20, 1);               // PCM
    put16(h + 22, channels_);
    put32(h + 24, sample_rate_);
    put32(h + 28, sample_rate_ * block_align);
    put16(h + 32, block_align);
    put16(h + 34, 16);              // bits per sample
    std::memcpy(h + 36, "data", 4);
    put32(h + 40, data_bytes);

    if (fseek(file_, 0, SEEK_SET) != 0) return false;
    return fwrite(h, 1, kHeaderSize, file_) == kHeaderSize;
}

void WavFileSink::onAudio(const AudioChunk& chunk) {
    if (!file_ || write_failed_ || chunk.channels != channels_) return;

    // Synthesized underrun silence is not part of the recording
    size_t frames = chunk.frames() - std::min(chunk.silent_frames, chunk.frames());
    if (frames == 0) return;

    std::vector<int16_t> pcm(chunk.samples.begin(), chunk.samples.begin() + frames * channels_);
    dc_.process(pcm.data(), frames);

    std::vector<uint8_t> bytes(pcm.size() * 2);
    for (size_t i = 0; i < pcm.size(); i++) {
        put16(&bytes[i * 2], static_cast<uint16_t>(pcm[i]));
    }
    if (fwrite(bytes.data(), 1, bytes.size(), file_) != bytes.size()) {
        write_failed_ = true;
        CVLOG_ERROR("wav", "Write to %s failed: %s (recording stopped)", path_.c_str(),
                    strerror(errno));
        return;
    }
    frames_written_ += frames;
}

void WavFileSink::close() {
    if (!file_) return;

    uint64_t data_bytes = frames_written_ * channels_ * sizeof(int16_t);
    if (data_bytes > std::numeric_limits<uint32_t>::max() - 36) {
        data_bytes = std::numeric_limits<uint32_t>::max() - 36;
    }
    if (!writeHeader(static_cast<uint32_t>(data_bytes))) {
        CVLOG_ERROR("wav", "Failed to finalize header of %s", path_.c_str());
    }
    if (fclose(file_) != 0) {
        CVLOG_ERROR("wav", "Closing %s failed: %s", path_.c_str(), strerror(errno));
    }
    file_ = nullptr;
    CVLOG_INFO("wav", "Wrote %llu audio frames to %s", (unsigned long long)frames_written_,
               path_.c_str());
}

} // namespace c64view
