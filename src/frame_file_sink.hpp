// =============================================================================
// c64view - Frame File Sink
// =============================================================================
// Writes every presented frame to <save_dir>/frame_NNNNNN.png (counter starts
// at 1) at native resolution. Inactive when save_dir is empty.
// =============================================================================
#pragma once

#include <cstdint>
#include <string>

#include "presentation_sink.hpp"
#include "vic_palette.hpp"

namespace c64view {

class FrameFileSink : public PresentationSink {
public:
    const char* name() const override { return "frames"; }
    Result<void> open(const StreamConfig& config) override;
    void onFrame(const CompletedFrame& frame) override;
    void close() override;

    bool active() const { return !dir_.empty(); }
    uint64_t framesWritten() const { return written_; }
    uint64_t writeErrors() const { return errors_; }

    // frame_000001.png for index 1
    static std::string fileName(uint64_t index);

private:
    std::string dir_;
    uint64_t counter_ = 0;
    uint64_t written_ = 0;
    uint64_t errors_ = 0;
    RgbaImage image_;
};

} // namespace c64view
