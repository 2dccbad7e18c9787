#include "pacing_controller.hpp"

#include <algorithm>

#include "c64view_log.hpp"

namespace c64view {

namespace {

Clock::duration periodFor(double fps) {
    if (fps <= 0.0) fps = 50.0;
    return std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / fps));
}

int64_t toMs(Clock::duration d) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
}

} // namespace

PacingController::PacingController(const StreamConfig& config, StreamStats& stats,
                                   EventBus* events)
    : stats_(stats)
    , events_(events)
    , depth_(std::max<uint32_t>(1, std::min(config.lookahead_depth, MAX_LOOKAHEAD_DEPTH)))
    , period_(periodFor(config.nominal_fps))
    , stall_timeout_(config.stall_timeout)
    , audio_rate_(protocol::AUDIO_SAMPLE_RATE) {
    CVLOG_DEBUG("pacing", "Pacing at %.2f fps, lookahead %u, stall after %lld ms",
                config.nominal_fps, depth_, (long long)config.stall_timeout.count());
}

void PacingController::offer(FramePtr frame) {
    if (!frame) return;

    std::vector<uint64_t> dropped;
    bool queued = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;

        // Frames may complete out of order; the queue stays sorted by number
        const uint64_t n = frame->frame_number;
        auto pos = std::find_if(queue_.begin(), queue_.end(),
                                [n](const FramePtr& q) { return q->frame_number >= n; });
        bool stale = (last_frame_ && n <= last_frame_->frame_number) ||
                     (pos != queue_.end() && (*pos)->frame_number == n);
        if (stale) {
            dropped.push_back(n);
            stats_.frames_dropped_pacing.fetch_add(1, std::memory_order_relaxed);
        } else {
            queue_.insert(pos, std::move(frame));
            queued = true;
            // Drop oldest to keep latency bounded
            while (queue_.size() > depth_) {
                dropped.push_back(queue_.front()->frame_number);
                queue_.pop_front();
                stats_.frames_dropped_pacing.fetch_add(1, std::memory_order_relaxed);
            }
            stats_.queue_depth.store(static_cast<uint32_t>(queue_.size()),
                                     std::memory_order_relaxed);
        }
    }
    if (queued) cv_.notify_one();

    if (!dropped.empty() && events_ && events_->has_subscribers<FrameDroppedEvent>()) {
        for (uint64_t seq : dropped) {
            FrameDroppedEvent ev;
            ev.reason = FrameDroppedEvent::Reason::Pacing;
            ev.frame_seq = seq;
            events_->publish(ev);
        }
    }
}

FramePtr PacingController::popIfDue(Clock::time_point now, StateEvents& events) {
    if (queue_.empty()) return nullptr;
    if (!closed_ && scheduled_ && now < next_due_) return nullptr;

    FramePtr frame = std::move(queue_.front());
    queue_.pop_front();
    stats_.queue_depth.store(static_cast<uint32_t>(queue_.size()), std::memory_order_relaxed);

    if (!scheduled_) {
        scheduled_ = true;
        next_due_ = now + period_;
    } else if (now - next_due_ > period_) {
        // Fell behind by more than a period: re-anchor instead of bursting
        next_due_ = now + period_;
    } else {
        next_due_ += period_;
    }

    if (state_ == StreamState::Stalled) {
        StreamStateEvent ev;
        ev.old_state = StreamState::Stalled;
        ev.new_state = StreamState::Recovered;
        ev.last_frame_seq = frame->frame_number;
        ev.stalled_ms = toMs(now - last_emit_);
        stats_.stalled.store(false, std::memory_order_relaxed);
        CVLOG_INFO("pacing", "Stream recovered after %lld ms", (long long)ev.stalled_ms);
        state_ = StreamState::Recovered;
        events.push_back(ev);
    } else if (state_ == StreamState::Waiting) {
        CVLOG_INFO("pacing", "Stream started (frame %u)", (unsigned)frame->sequence);
    }
    if (state_ != StreamState::Streaming) {
        StreamStateEvent ev;
        ev.old_state = state_;
        ev.new_state = StreamState::Streaming;
        ev.last_frame_seq = frame->frame_number;
        state_ = StreamState::Streaming;
        events.push_back(ev);
    }

    last_frame_ = frame;
    last_emit_ = now;
    stats_.frames_emitted.fetch_add(1, std::memory_order_relaxed);
    return frame;
}

void PacingController::checkStall(Clock::time_point now, StateEvents& events) {
    if (state_ != StreamState::Streaming || !queue_.empty()) return;
    if (now - last_emit_ < stall_timeout_) return;

    state_ = StreamState::Stalled;
    stats_.stall_events.fetch_add(1, std::memory_order_relaxed);
    stats_.stalled.store(true, std::memory_order_relaxed);

    StreamStateEvent ev;
    ev.old_state = StreamState::Streaming;
    ev.new_state = StreamState::Stalled;
    ev.last_frame_seq = last_frame_ ? last_frame_->frame_number : 0;
    ev.stalled_ms = toMs(now - last_emit_);
    events.push_back(ev);
    CVLOG_WARN("pacing", "Stream stalled: no frame for %lld ms", (long long)ev.stalled_ms);
}

void PacingController::publish(const StateEvents& events) {
    if (!events_) return;
    for (const auto& ev : events) {
        events_->publish(ev);
    }
}

FramePtr PacingController::tryGetNextFrame(Clock::time_point now) {
    StateEvents events;
    FramePtr frame;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStall(now, events);
        frame = popIfDue(now, events);
    }
    publish(events);
    return frame;
}

FramePtr PacingController::waitForFrame(std::chrono::milliseconds timeout) {
    auto deadline = Clock::now() + timeout;
    StateEvents events;
    FramePtr frame;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        for (;;) {
            auto now = Clock::now();
            checkStall(now, events);
            frame = popIfDue(now, events);
            if (frame || closed_ || now >= deadline) break;

            auto wake = deadline;
            if (!queue_.empty() && scheduled_ && next_due_ < wake) wake = next_due_;
            if (state_ == StreamState::Streaming && last_emit_ + stall_timeout_ < wake) {
                wake = last_emit_ + stall_timeout_;
            }
            cv_.wait_until(lock, wake);
        }
    }
    publish(events);
    return frame;
}

void PacingController::poll(Clock::time_point now) {
    StateEvents events;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        checkStall(now, events);
    }
    publish(events);
}

size_t PacingController::audioFramesDue(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!audio_anchored_) {
        audio_anchored_ = true;
        audio_anchor_ = now;
        audio_taken_ = 0;
        return 0;
    }
    if (now < audio_anchor_) return 0;

    auto elapsed_us = std::chrono::duration_cast<std::chrono::microseconds>(now - audio_anchor_).count();
    uint64_t total = static_cast<uint64_t>(elapsed_us) * audio_rate_ / 1000000;
    if (total <= audio_taken_) return 0;

    uint64_t due = total - audio_taken_;
    // Consumer paused for a while: hand out 100 ms and restart the count
    const uint64_t max_burst = audio_rate_ / 10;
    if (due > max_burst) {
        audio_anchor_ = now;
        audio_taken_ = 0;
        return static_cast<size_t>(max_burst);
    }
    audio_taken_ += due;
    return static_cast<size_t>(due);
}

FramePtr PacingController::lastFrame() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_frame_;
}

StreamState PacingController::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

size_t PacingController::queueDepth() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void PacingController::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool PacingController::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

bool PacingController::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_ && queue_.empty();
}

void PacingController::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
    last_frame_.reset();
    closed_ = false;
    state_ = StreamState::Waiting;
    scheduled_ = false;
    audio_anchored_ = false;
    audio_taken_ = 0;
    stats_.queue_depth.store(0, std::memory_order_relaxed);
    stats_.stalled.store(false, std::memory_order_relaxed);
}

} // namespace c64view
