// =============================================================================
// c64view - Stream Pipeline
// =============================================================================
// Wires the core together for one device stream:
//
//   receive thread:  PacketReceiver(s) -> FrameReassembler -> PacingController
//                                      -> AudioReassembler (ring)
//   caller thread:   tryGetNextFrame() / waitNextFrame() / readAudio()
//
// start() reports fatal errors (invalid config, bind failure) before any
// stream processing begins. stop() is the single shutdown signal: polling
// stops, sockets close, waiters wake; queued frames can still be drained.
// A stopped pipeline only runs again after an explicit start(), which reuses
// the components built by the first start() and resets them. The context's
// configuration is therefore read once.
// =============================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "audio_reassembler.hpp"
#include "frame_reassembler.hpp"
#include "pacing_controller.hpp"
#include "packet_receiver.hpp"
#include "result.hpp"
#include "stream_context.hpp"

namespace c64view {

class StreamPipeline {
public:
    // Poll granularity of the receive loop; bounds stop() latency
    static constexpr std::chrono::milliseconds POLL_INTERVAL{20};

    explicit StreamPipeline(StreamContext& ctx);
    ~StreamPipeline();

    StreamPipeline(const StreamPipeline&) = delete;
    StreamPipeline& operator=(const StreamPipeline&) = delete;

    Result<void> start();
    void stop();
    bool running() const { return ctx_.running.load(); }

    // ---- Pull interface -------------------------------------------------------
    FramePtr tryGetNextFrame(Clock::time_point now = Clock::now());
    FramePtr waitNextFrame(std::chrono::milliseconds timeout);
    AudioChunk readAudio(size_t frames);
    size_t audioFramesDue(Clock::time_point now = Clock::now());
    FramePtr lastFrame() const;
    StreamState state() const;

    // Stopped and every queued frame handed out
    bool finished() const;

    // ---- Diagnostics ----------------------------------------------------------
    StatsSnapshot stats() const { return ctx_.stats.load(); }
    uint16_t videoPort() const { return video_port_; }
    uint16_t audioPort() const { return audio_port_; }
    bool audioEnabled() const { return audio_ != nullptr; }
    const StreamConfig& config() const { return ctx_.config; }
    StreamContext& context() { return ctx_; }

private:
    void createComponents();
    void receiveLoop();
    void dispatch(const Datagram& d);

    StreamContext& ctx_;

    std::unique_ptr<FrameReassembler> reassembler_;
    std::unique_ptr<AudioReassembler> audio_;
    std::unique_ptr<PacingController> pacing_;

    std::vector<PacketReceiver> receivers_;
    uint16_t video_port_ = 0;
    uint16_t audio_port_ = 0;

    std::thread thread_;
};

} // namespace c64view
