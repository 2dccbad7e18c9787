// =============================================================================
// c64view - Frame Pacing Controller
// =============================================================================
// Sits between the frame reassembler (receive thread) and the presentation
// path. The only component that makes clock-based decisions.
//
//   offer()            receive thread; keeps the lookahead queue in frame
//                      order and drops the oldest queued frame when it is full.
//                      A frame not newer than the last emitted one is dropped
//                      (both count as frames_dropped_pacing)
//   tryGetNextFrame()  at most one frame per nominal period; re-anchors to
//                      `now` when more than one period behind (no bursts)
//   waitForFrame()     blocking variant with timeout
//   audioFramesDue()   PCM frames a clockless consumer should pull now
//
// Stall: no emission for stall_timeout while streaming -> Stalled (reported
// once through the EventBus); the next emitted frame -> Recovered -> Streaming.
// =============================================================================
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <vector>

#include "event_bus.hpp"
#include "stream_config.hpp"
#include "stream_stats.hpp"
#include "stream_types.hpp"

namespace c64view {

class PacingController {
public:
    PacingController(const StreamConfig& config, StreamStats& stats, EventBus* events = nullptr);

    void offer(FramePtr frame);

    FramePtr tryGetNextFrame(Clock::time_point now);
    FramePtr tryGetNextFrame() { return tryGetNextFrame(Clock::now()); }

    // Blocks until a frame is due, the controller is closed, or timeout.
    FramePtr waitForFrame(std::chrono::milliseconds timeout);

    size_t audioFramesDue(Clock::time_point now);

    // Re-evaluates the stall timer without emitting (idle presentation loops).
    void poll(Clock::time_point now);

    // Last emitted frame; the sink keeps showing it while nothing is due.
    FramePtr lastFrame() const;

    StreamState state() const;
    size_t queueDepth() const;
    Clock::duration period() const { return period_; }
    uint32_t lookaheadDepth() const { return depth_; }

    // No more offers. Queued frames are still handed out, without pacing.
    void close();
    bool closed() const;
    bool drained() const;  // closed and queue empty

    void reset();

private:
    using StateEvents = std::vector<StreamStateEvent>;

    // Both run with mutex_ held; events are published after unlock.
    FramePtr popIfDue(Clock::time_point now, StateEvents& events);
    void checkStall(Clock::time_point now, StateEvents& events);
    void publish(const StateEvents& events);

    StreamStats& stats_;
    EventBus* events_;
    const uint32_t depth_;
    const Clock::duration period_;
    const Clock::duration stall_timeout_;
    const uint32_t audio_rate_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<FramePtr> queue_;
    FramePtr last_frame_;
    bool closed_ = false;

    StreamState state_ = StreamState::Waiting;
    bool scheduled_ = false;
    Clock::time_point next_due_;
    Clock::time_point last_emit_;

    bool audio_anchored_ = false;
    Clock::time_point audio_anchor_;
    uint64_t audio_taken_ = 0;
};

} // namespace c64view
