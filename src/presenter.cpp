#include "presenter.hpp"

#include "c64view_log.hpp"

namespace c64view {

Presenter::Presenter(StreamPipeline& pipeline) : pipeline_(pipeline) {}

Presenter::~Presenter() {
    finish();
}

void Presenter::addSink(std::unique_ptr<PresentationSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

Result<void> Presenter::open() {
    if (opened_) return Ok();

    const StreamConfig& cfg = pipeline_.config();
    for (size_t i = 0; i < sinks_.size(); i++) {
        auto r = sinks_[i]->open(cfg);
        if (r.is_err()) {
            CVLOG_ERROR("present", "Sink '%s' failed to open: %s", sinks_[i]->name(),
                        r.error().message.c_str());
            for (size_t k = 0; k < i; k++) sinks_[k]->close();
            return r;
        }
        CVLOG_DEBUG("present", "Sink '%s' ready", sinks_[i]->name());
    }

    state_sub_ = pipeline_.context().events.subscribe<StreamStateEvent>(
        [this](const StreamStateEvent& ev) {
            for (auto& sink : sinks_) sink->onStateChange(ev);
        });
    shutdown_.store(false);
    shutdown_sub_ = pipeline_.context().events.subscribe<ShutdownEvent>(
        [this](const ShutdownEvent&) { shutdown_.store(true); });
    opened_ = true;
    frames_presented_ = 0;
    audio_frames_ = 0;
    return Ok();
}

void Presenter::present(const CompletedFrame& frame) {
    for (auto& sink : sinks_) sink->onFrame(frame);
    frames_presented_++;
}

void Presenter::pumpAudio(Clock::time_point now) {
    if (!pipeline_.audioEnabled()) return;
    size_t due = pipeline_.audioFramesDue(now);
    if (due == 0) return;

    AudioChunk chunk = pipeline_.readAudio(due);
    for (auto& sink : sinks_) sink->onAudio(chunk);
    audio_frames_ += chunk.frames();
}

bool Presenter::step() {
    FramePtr frame = pipeline_.waitNextFrame(FRAME_WAIT);
    auto now = Clock::now();
    if (frame) present(*frame);
    pumpAudio(now);
    for (auto& sink : sinks_) sink->onTick(now);
    return frame != nullptr;
}

void Presenter::run(const std::atomic<bool>& stop) {
    if (!pipeline_.running()) {
        CVLOG_WARN("present", "Pipeline is not running");
        finish();
        return;
    }
    CVLOG_INFO("present", "Presentation loop running (%zu sinks)", sinks_.size());
    while (!stop.load() && !shutdown_.load()) {
        step();
    }
    if (shutdown_.load()) {
        CVLOG_INFO("present", "Pipeline shut down, leaving presentation loop");
    }
    finish();
}

void Presenter::finish() {
    if (!opened_) return;

    pipeline_.stop();
    // Frames already queued are still shown, without pacing
    size_t drained = 0;
    while (!pipeline_.finished()) {
        FramePtr frame = pipeline_.waitNextFrame(std::chrono::milliseconds(0));
        if (!frame) break;
        present(*frame);
        drained++;
    }
    if (drained > 0) {
        CVLOG_DEBUG("present", "Drained %zu queued frames", drained);
    }

    state_sub_ = SubscriptionHandle();
    shutdown_sub_ = SubscriptionHandle();
    for (auto& sink : sinks_) sink->close();
    opened_ = false;
    CVLOG_INFO("present", "Presentation loop finished: %llu frames, %llu audio frames",
               (unsigned long long)frames_presented_, (unsigned long long)audio_frames_);
}

} // namespace c64view
