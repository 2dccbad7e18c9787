#include "stream_pipeline.hpp"

#include "c64view_log.hpp"

namespace c64view {

StreamPipeline::StreamPipeline(StreamContext& ctx) : ctx_(ctx) {}

StreamPipeline::~StreamPipeline() {
    stop();
}

Result<void> StreamPipeline::start() {
    if (ctx_.running.load()) {
        CVLOG_WARN("pipeline", "start() called while running");
        return Ok();
    }
    if (thread_.joinable()) thread_.join();

    const StreamConfig& cfg = ctx_.config;
    auto valid = validateConfig(cfg);
    if (valid.is_err()) {
        CVLOG_ERROR("pipeline", "Invalid configuration: %s", valid.error().message.c_str());
        return valid;
    }

    // New stream: counters start from zero
    ctx_.stats.reset();
    receivers_.clear();

    auto video = PacketReceiver::open(StreamKind::Video, cfg.bind_address, cfg.video_port,
                                      ctx_.stats, cfg.socket_rcvbuf_bytes);
    if (video.is_err()) {
        CVLOG_ERROR("pipeline", "%s", video.error().message.c_str());
        return video.error();
    }
    receivers_.push_back(std::move(video).value());
    video_port_ = receivers_.back().port();

    audio_port_ = 0;
    if (cfg.audio_enabled) {
        auto audio = PacketReceiver::open(StreamKind::Audio, cfg.bind_address, cfg.audio_port,
                                          ctx_.stats, cfg.socket_rcvbuf_bytes);
        if (audio.is_err()) {
            CVLOG_ERROR("pipeline", "%s", audio.error().message.c_str());
            receivers_.clear();
            return audio.error();
        }
        receivers_.push_back(std::move(audio).value());
        audio_port_ = receivers_.back().port();
    }

    if (!reassembler_) {
        createComponents();
    } else {
        // Restart: same arena and queues, fresh sequence history
        reassembler_->reset();
        pacing_->reset();
        if (audio_) audio_->reset();
    }

    CVLOG_INFO("pipeline", "Stream started: %s %ux%u @ %.2f fps, video port %u, audio %s",
               videoStandardName(cfg.standard), (unsigned)cfg.geometry.width,
               (unsigned)cfg.geometry.height, cfg.nominal_fps, (unsigned)video_port_,
               audio_ ? std::to_string(audio_port_).c_str() : "off");

    ctx_.running.store(true);
    thread_ = std::thread(&StreamPipeline::receiveLoop, this);
    return Ok();
}

void StreamPipeline::createComponents() {
    const StreamConfig& cfg = ctx_.config;
    if (cfg.audio_enabled) {
        audio_ = std::make_unique<AudioReassembler>(cfg.audio_ring_ms, ctx_.stats);
    }
    reassembler_ = std::make_unique<FrameReassembler>(cfg.geometry, cfg.retention_window,
                                                      ctx_.stats);
    EventBus* bus = &ctx_.events;
    reassembler_->setDropCallback([bus](uint64_t seq) {
        if (!bus->has_subscribers<FrameDroppedEvent>()) return;
        FrameDroppedEvent ev;
        ev.reason = FrameDroppedEvent::Reason::Incomplete;
        ev.frame_seq = seq;
        bus->publish(ev);
    });
    pacing_ = std::make_unique<PacingController>(cfg, ctx_.stats, &ctx_.events);
}

void StreamPipeline::stop() {
    bool was_running = ctx_.running.exchange(false);
    if (thread_.joinable()) thread_.join();

    if (!was_running) return;

    for (auto& rx : receivers_) rx.close();
    receivers_.clear();
    if (pacing_) pacing_->close();

    auto s = ctx_.stats.load();
    CVLOG_INFO("pipeline", "Stream stopped: %llu packets, %llu frames completed, %llu emitted",
               (unsigned long long)s.packets_received, (unsigned long long)s.frames_completed,
               (unsigned long long)s.frames_emitted);
    ctx_.events.publish(ShutdownEvent{});
}

void StreamPipeline::receiveLoop() {
    CVLOG_DEBUG("pipeline", "Receive thread started");
    std::vector<PacketReceiver*> rx;
    for (auto& r : receivers_) rx.push_back(&r);

    while (ctx_.running.load(std::memory_order_relaxed)) {
        auto batch = PacketReceiver::pollAll(rx, POLL_INTERVAL);
        for (const auto& d : batch) {
            dispatch(d);
        }
    }
    CVLOG_DEBUG("pipeline", "Receive thread exiting");
}

void StreamPipeline::dispatch(const Datagram& d) {
    if (d.stream == StreamKind::Video) {
        FramePtr frame = reassembler_->submit(d);
        if (frame) pacing_->offer(std::move(frame));
    } else if (audio_) {
        audio_->submit(d);
    }
}

FramePtr StreamPipeline::tryGetNextFrame(Clock::time_point now) {
    return pacing_ ? pacing_->tryGetNextFrame(now) : nullptr;
}

FramePtr StreamPipeline::waitNextFrame(std::chrono::milliseconds timeout) {
    if (!pacing_) return nullptr;
    return pacing_->waitForFrame(timeout);
}

AudioChunk StreamPipeline::readAudio(size_t frames) {
    if (!audio_) return AudioChunk{};
    return audio_->read(frames);
}

size_t StreamPipeline::audioFramesDue(Clock::time_point now) {
    if (!pacing_ || !audio_) return 0;
    return pacing_->audioFramesDue(now);
}

FramePtr StreamPipeline::lastFrame() const {
    return pacing_ ? pacing_->lastFrame() : nullptr;
}

StreamState StreamPipeline::state() const {
    return pacing_ ? pacing_->state() : StreamState::Waiting;
}

bool StreamPipeline::finished() const {
    return !ctx_.running.load() && (!pacing_ || pacing_->drained());
}

} // namespace c64view
