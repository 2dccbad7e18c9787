// =============================================================================
// c64view - Statistics Sink (headless diagnostics)
// =============================================================================
// Logs the video format on the first frame, one statistics line per
// stats_interval, stream state transitions, and totals on close().
// =============================================================================
#pragma once

#include <string>

#include "presentation_sink.hpp"
#include "stream_stats.hpp"

namespace c64view {

class StatsSink : public PresentationSink {
public:
    explicit StatsSink(const StreamStats& stats);

    const char* name() const override { return "stats"; }
    Result<void> open(const StreamConfig& config) override;
    void onFrame(const CompletedFrame& frame) override;
    void onStateChange(const StreamStateEvent& ev) override;
    void onTick(Clock::time_point now) override;
    void close() override;

    // "PAL (384x272)"; custom heights are named by their size only
    static std::string formatName(const FrameGeometry& g);

    const StatsCollector& collector() const { return collector_; }
    uint64_t linesPrinted() const { return lines_printed_; }

private:
    StatsCollector collector_;
    std::chrono::milliseconds interval_{1000};
    Clock::time_point last_print_;
    bool started_ = false;
    bool format_logged_ = false;
    FrameGeometry last_geometry_;
    uint64_t lines_printed_ = 0;
};

} // namespace c64view
