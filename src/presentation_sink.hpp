// =============================================================================
// c64view - Presentation Sink Interface
// =============================================================================
// Consumers of the pull interface. The Presenter owns the sinks and calls
// them from its own thread only; sinks need no locking of their own.
// =============================================================================
#pragma once

#include "event_bus.hpp"
#include "result.hpp"
#include "stream_config.hpp"
#include "stream_stats.hpp"
#include "stream_types.hpp"

namespace c64view {

class PresentationSink {
public:
    virtual ~PresentationSink() = default;

    virtual const char* name() const = 0;

    // Fatal sink errors (e.g. save_dir not writable) abort startup.
    virtual Result<void> open(const StreamConfig& config) { (void)config; return Ok(); }

    virtual void onFrame(const CompletedFrame& frame) { (void)frame; }
    virtual void onAudio(const AudioChunk& chunk) { (void)chunk; }
    virtual void onStateChange(const StreamStateEvent& ev) { (void)ev; }

    // Called every presenter iteration, frame or not.
    virtual void onTick(Clock::time_point now) { (void)now; }

    virtual void close() {}
};

} // namespace c64view
