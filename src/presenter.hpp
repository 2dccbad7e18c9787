// =============================================================================
// c64view - Presenter
// =============================================================================
// Presentation loop on the caller's thread. Pulls frames and audio from the
// StreamPipeline and fans them out to the registered sinks. Stream state
// events from the pipeline's EventBus are forwarded to every sink.
//
//   Presenter p(pipeline);
//   p.addSink(std::make_unique<StatsSink>(ctx.stats));
//   p.run(stop_flag);        // returns after stop_flag is set and drained
// =============================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <vector>

#include "event_bus.hpp"
#include "presentation_sink.hpp"
#include "stream_pipeline.hpp"

namespace c64view {

class Presenter {
public:
    // Upper bound of one wait for the next frame
    static constexpr std::chrono::milliseconds FRAME_WAIT{10};

    explicit Presenter(StreamPipeline& pipeline);
    ~Presenter();

    Presenter(const Presenter&) = delete;
    Presenter& operator=(const Presenter&) = delete;

    void addSink(std::unique_ptr<PresentationSink> sink);
    size_t sinkCount() const { return sinks_.size(); }

    // Opens every sink. The first failure closes the ones already opened.
    Result<void> open();

    // One iteration: at most one frame plus the audio due now.
    // Returns true if a frame was presented.
    bool step();

    // Loops step() until `stop` is set or the pipeline publishes ShutdownEvent,
    // then stops the pipeline, drains the queued frames and closes the sinks.
    void run(const std::atomic<bool>& stop);

    // Drain + close without running (used by run() and on early exit).
    void finish();

    uint64_t framesPresented() const { return frames_presented_; }
    uint64_t audioFramesPresented() const { return audio_frames_; }

private:
    void present(const CompletedFrame& frame);
    void pumpAudio(Clock::time_point now);

    StreamPipeline& pipeline_;
    std::vector<std::unique_ptr<PresentationSink>> sinks_;
    std::atomic<bool> shutdown_{false};
    SubscriptionHandle state_sub_;
    SubscriptionHandle shutdown_sub_;
    bool opened_ = false;

    uint64_t frames_presented_ = 0;
    uint64_t audio_frames_ = 0;
};

} // namespace c64view
