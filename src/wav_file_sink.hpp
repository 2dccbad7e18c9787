// =============================================================================
// c64view - WAV Recording Sink
// =============================================================================
// Appends received audio (DC-blocked, 16-bit PCM) to <save_dir>/audio.wav.
// RIFF sizes are patched on close(); a killed process leaves a file whose
// header still says 0 bytes, which most players tolerate.
// =============================================================================
#pragma once

#include <cstdio>
#include <string>

#include "dc_blocker.hpp"
#include "presentation_sink.hpp"

namespace c64view {

class WavFileSink : public PresentationSink {
public:
    static constexpr const char* FILE_NAME = "audio.wav";

    WavFileSink() = default;
    ~WavFileSink() override;

    WavFileSink(const WavFileSink&) = delete;
    WavFileSink& operator=(const WavFileSink&) = delete;

    const char* name() const override { return "wav"; }
    Result<void> open(const StreamConfig& config) override;
    void onAudio(const AudioChunk& chunk) override;
    void close() override;

    // Opens an explicit path (tests, tools).
    Result<void> openFile(const std::string& path, uint32_t sample_rate, uint16_t channels);

    uint64_t framesWritten() const { return frames_written_; }
    const std::string& path() const { return path_; }

private:
    bool writeHeader(uint32_t data_bytes);

    FILE* file_ = nullptr;
    std::string path_;
    uint32_t sample_rate_ = 0;
    uint16_t channels_ = 0;
    uint64_t frames_written_ = 0;
    bool write_failed_ = false;
    DcBlocker dc_;
};

} // namespace c64view
