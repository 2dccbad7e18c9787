#include "stats_sink.hpp"

#include "c64_protocol.hpp"
#include "c64view_log.hpp"

namespace c64view {

StatsSink::StatsSink(const StreamStats& stats) : collector_(stats) {}

std::string StatsSink::formatName(const FrameGeometry& g) {
    std::string size = std::to_string(g.width) + "x" + std::to_string(g.height);
    if (g.width == protocol::PIXELS_PER_LINE && g.height == protocol::PAL_HEIGHT) {
        return "PAL (" + size + ")";
    }
    if (g.width == protocol::PIXELS_PER_LINE && g.height == protocol::NTSC_HEIGHT) {
        return "NTSC (" + size + ")";
    }
    return size;
}

Result<void> StatsSink::open(const StreamConfig& config) {
    interval_ = config.stats_interval.count() > 0 ? config.stats_interval
                                                  : std::chrono::milliseconds(1000);
    collector_.reset();
    started_ = false;
    format_logged_ = false;
    lines_printed_ = 0;
    return Ok();
}

void StatsSink::onFrame(const CompletedFrame& frame) {
    if (!format_logged_ || !(frame.geometry == last_geometry_)) {
        format_logged_ = true;
        last_geometry_ = frame.geometry;
        CVLOG_INFO("stats", "Format: %s", formatName(frame.geometry).c_str());
    }
}

void StatsSink::onStateChange(const StreamStateEvent& ev) {
    if (ev.new_state == StreamState::Stalled) {
        CVLOG_WARN("stats", "Stream stalled (last frame %llu, %lld ms without frames)",
                   (unsigned long long)ev.last_frame_seq, (long long)ev.stalled_ms);
    } else if (ev.new_state == StreamState::Recovered) {
        CVLOG_INFO("stats", "Stream recovered after %lld ms", (long long)ev.stalled_ms);
    }
}

void StatsSink::onTick(Clock::time_point now) {
    if (!started_) {
        started_ = true;
        last_print_ = now;
        collector_.update(now);
        return;
    }
    if (now - last_print_ < interval_) return;

    last_print_ = now;
    collector_.update(now);
    CVLOG_INFO("stats", "%s", formatSnapshot(collector_.snapshot()).c_str());
    lines_printed_++;
}

void StatsSink::close() {
    auto s = collector_.snapshot();
    CVLOG_INFO("stats", "Totals: %llu packets (%llu discarded), %llu frames completed, "
               "%llu emitted, %llu dropped incomplete, %llu dropped pacing, %llu stalls, "
               "audio %llu packets / %llu lost / %llu underruns / %llu overruns",
               (unsigned long long)s.packets_received, (unsigned long long)s.packets_discarded,
               (unsigned long long)s.frames_completed, (unsigned long long)s.frames_emitted,
               (unsigned long long)s.frames_dropped_incomplete,
               (unsigned long long)s.frames_dropped_pacing, (unsigned long long)s.stall_events,
               (unsigned long long)s.audio_packets_received,
               (unsigned long long)s.audio_packets_lost, (unsigned long long)s.audio_underruns,
               (unsigned long long)s.audio_overruns);
}

} // namespace c64view
