#include "stream_stats.hpp"

#include <cstdio>

namespace c64view {

StatsSnapshot StreamStats::load() const {
    StatsSnapshot s;
    s.packets_received = packets_received.load(std::memory_order_relaxed);
    s.packets_discarded = packets_discarded.load(std::memory_order_relaxed);
    s.bytes_received = bytes_received.load(std::memory_order_relaxed);

    s.fragments_duplicate = fragments_duplicate.load(std::memory_order_relaxed);
    s.fragments_late = fragments_late.load(std::memory_order_relaxed);
    s.frames_completed = frames_completed.load(std::memory_order_relaxed);
    s.frames_dropped_incomplete = frames_dropped_incomplete.load(std::memory_order_relaxed);
    s.stream_resyncs = stream_resyncs.load(std::memory_order_relaxed);

    s.frames_dropped_pacing = frames_dropped_pacing.load(std::memory_order_relaxed);
    s.frames_emitted = frames_emitted.load(std::memory_order_relaxed);
    s.stall_events = stall_events.load(std::memory_order_relaxed);

    s.audio_packets_received = audio_packets_received.load(std::memory_order_relaxed);
    s.audio_packets_lost = audio_packets_lost.load(std::memory_order_relaxed);
    s.audio_underruns = audio_underruns.load(std::memory_order_relaxed);
    s.audio_overruns = audio_overruns.load(std::memory_order_relaxed);

    s.queue_depth = queue_depth.load(std::memory_order_relaxed);
    s.pending_frames = pending_frames.load(std::memory_order_relaxed);
    s.audio_buffered_frames = audio_buffered_frames.load(std::memory_order_relaxed);
    s.stalled = stalled.load(std::memory_order_relaxed);
    return s;
}

void StreamStats::reset() {
    packets_received = 0;
    packets_discarded = 0;
    bytes_received = 0;
    fragments_duplicate = 0;
    fragments_late = 0;
    frames_completed = 0;
    frames_dropped_incomplete = 0;
    stream_resyncs = 0;
    frames_dropped_pacing = 0;
    frames_emitted = 0;
    stall_events = 0;
    audio_packets_received = 0;
    audio_packets_lost = 0;
    audio_underruns = 0;
    audio_overruns = 0;
    queue_depth = 0;
    pending_frames = 0;
    audio_buffered_frames = 0;
    stalled = false;
}

StatsCollector::StatsCollector(const StreamStats& stats)
    : stats_(stats), last_update_(std::chrono::steady_clock::now()) {}

StatsSnapshot StatsCollector::snapshot() const {
    StatsSnapshot s = stats_.load();
    s.emitted_fps = emitted_fps_.get();
    s.completed_fps = completed_fps_.get();
    s.receive_mbps = receive_mbps_.get();
    return s;
}

void StatsCollector::update() {
    update(std::chrono::steady_clock::now());
}

void StatsCollector::update(std::chrono::steady_clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now - last_update_).count();
    if (elapsed_ms < MIN_UPDATE_INTERVAL_MS) return;

    const uint64_t emitted = stats_.frames_emitted.load(std::memory_order_relaxed);
    const uint64_t completed = stats_.frames_completed.load(std::memory_order_relaxed);
    const uint64_t bytes = stats_.bytes_received.load(std::memory_order_relaxed);

    const double seconds = static_cast<double>(elapsed_ms) / 1000.0;
    emitted_fps_.update(static_cast<double>(emitted - prev_emitted_) / seconds);
    completed_fps_.update(static_cast<double>(completed - prev_completed_) / seconds);
    receive_mbps_.update(static_cast<double>(bytes - prev_bytes_) * 8.0 / seconds / 1e6);

    prev_emitted_ = emitted;
    prev_completed_ = completed;
    prev_bytes_ = bytes;
    last_update_ = now;
}

void StatsCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    emitted_fps_.reset();
    completed_fps_.reset();
    receive_mbps_.reset();
    prev_emitted_ = stats_.frames_emitted.load(std::memory_order_relaxed);
    prev_completed_ = stats_.frames_completed.load(std::memory_order_relaxed);
    prev_bytes_ = stats_.bytes_received.load(std::memory_order_relaxed);
    last_update_ = std::chrono::steady_clock::now();
}

std::string formatSnapshot(const StatsSnapshot& s) {
    char buf[512];
    snprintf(buf, sizeof(buf),
             "FPS: %.1f | Frames: %llu | Dropped: %llu incomplete, %llu paced | "
             "Pkts: %llu (%llu bad, %llu late, %llu dup) | %.2f Mbps | "
             "Audio: %llu pkts (lost %llu, underrun %llu, overrun %llu)%s",
             s.emitted_fps,
             (unsigned long long)s.frames_emitted,
             (unsigned long long)s.frames_dropped_incomplete,
             (unsigned long long)s.frames_dropped_pacing,
             (unsigned long long)s.packets_received,
             (unsigned long long)s.packets_discarded,
             (unsigned long long)s.fragments_late,
             (unsigned long long)s.fragments_duplicate,
             s.receive_mbps,
             (unsigned long long)s.audio_packets_received,
             (unsigned long long)s.audio_packets_lost,
             (unsigned long long)s.audio_underruns,
             (unsigned long long)s.audio_overruns,
             s.stalled ? " | STALLED" : "");
    return std::string(buf);
}

} // namespace c64view
