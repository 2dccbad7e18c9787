#pragma once
// =============================================================================
// c64view - Stream Statistics
// =============================================================================
// StreamStats: lock-free counters incremented by every pipeline stage.
// StatsCollector: read-only aggregator. snapshot() never blocks producers;
// update() derives smoothed rates once per interval (headless diagnostics).
// =============================================================================

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace c64view {

// =============================================================================
// AtomicEMA - lock-free exponential moving average
// =============================================================================
class AtomicEMA {
public:
    explicit AtomicEMA(double alpha = 0.3) : alpha_(alpha), value_(0.0) {}

    void update(double new_value) {
        double old_val, new_val;
        do {
            old_val = value_.load(std::memory_order_relaxed);
            new_val = primed_.load(std::memory_order_relaxed)
                ? old_val * (1.0 - alpha_) + new_value * alpha_
                : new_value;
        } while (!value_.compare_exchange_weak(old_val, new_val,
                                                std::memory_order_release,
                                                std::memory_order_relaxed));
        primed_.store(true, std::memory_order_relaxed);
    }

    double get() const { return value_.load(std::memory_order_acquire); }

    void reset() {
        value_.store(0.0, std::memory_order_release);
        primed_.store(false, std::memory_order_relaxed);
    }

private:
    double alpha_;
    std::atomic<double> value_;
    std::atomic<bool> primed_{false};
};

/**
 * Plain copy of the counters at one instant.
 */
struct StatsSnapshot {
    // Receiver
    uint64_t packets_received = 0;
    uint64_t packets_discarded = 0;
    uint64_t bytes_received = 0;

    // Frame reassembly
    uint64_t fragments_duplicate = 0;
    uint64_t fragments_late = 0;
    uint64_t frames_completed = 0;
    uint64_t frames_dropped_incomplete = 0;
    uint64_t stream_resyncs = 0;

    // Pacing
    uint64_t frames_dropped_pacing = 0;
    uint64_t frames_emitted = 0;
    uint64_t stall_events = 0;

    // Audio
    uint64_t audio_packets_received = 0;
    uint64_t audio_packets_lost = 0;
    uint64_t audio_underruns = 0;
    uint64_t audio_overruns = 0;

    // Gauges
    uint32_t queue_depth = 0;
    uint32_t pending_frames = 0;
    uint64_t audio_buffered_frames = 0;
    bool stalled = false;

    // Derived by StatsCollector::update()
    double emitted_fps = 0.0;
    double completed_fps = 0.0;
    double receive_mbps = 0.0;
};

/**
 * Process-wide counters for one stream. Any component may increment; only
 * reset() (stream restart) clears them.
 */
struct StreamStats {
    std::atomic<uint64_t> packets_received{0};
    std::atomic<uint64_t> packets_discarded{0};
    std::atomic<uint64_t> bytes_received{0};

    std::atomic<uint64_t> fragments_duplicate{0};
    std::atomic<uint64_t> fragments_late{0};
    std::atomic<uint64_t> frames_completed{0};
    std::atomic<uint64_t> frames_dropped_incomplete{0};
    std::atomic<uint64_t> stream_resyncs{0};

    std::atomic<uint64_t> frames_dropped_pacing{0};
    std::atomic<uint64_t> frames_emitted{0};
    std::atomic<uint64_t> stall_events{0};

    std::atomic<uint64_t> audio_packets_received{0};
    std::atomic<uint64_t> audio_packets_lost{0};
    std::atomic<uint64_t> audio_underruns{0};
    std::atomic<uint64_t> audio_overruns{0};

    std::atomic<uint32_t> queue_depth{0};
    std::atomic<uint32_t> pending_frames{0};
    std::atomic<uint64_t> audio_buffered_frames{0};
    std::atomic<bool> stalled{false};

    StatsSnapshot load() const;
    void reset();
};

class StatsCollector {
public:
    explicit StatsCollector(const StreamStats& stats);

    // Consistent-enough copy of all counters plus the last derived rates.
    StatsSnapshot snapshot() const;

    // Recomputes fps / Mbps from counter deltas. Call periodically; calls
    // closer together than MIN_UPDATE_INTERVAL_MS are ignored.
    void update();
    void update(std::chrono::steady_clock::time_point now);

    void reset();

private:
    const StreamStats& stats_;

    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point last_update_;
    uint64_t prev_emitted_ = 0;
    uint64_t prev_completed_ = 0;
    uint64_t prev_bytes_ = 0;

    AtomicEMA emitted_fps_;
    AtomicEMA completed_fps_;
    AtomicEMA receive_mbps_;

    static constexpr int MIN_UPDATE_INTERVAL_MS = 100;
};

// One-line diagnostic for headless mode, starting "FPS: 50.0 | Frames: 1234 | ..."
std::string formatSnapshot(const StatsSnapshot& s);

} // namespace c64view
