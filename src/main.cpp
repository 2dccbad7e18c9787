// =============================================================================
// c64view - Main Entry Point
// =============================================================================
// Usage: c64view [config.json]
//
// Receives the Ultimate64 video (and audio) stream and presents it headless:
// statistics on the log, optionally frame_NNNNNN.png files and audio.wav in
// output.save_dir. Ctrl+C (SIGINT) or SIGTERM stops the stream cleanly.
// Exit code 1 on fatal startup errors.
// =============================================================================

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <memory>

#include "c64view_log.hpp"
#include "config_loader.hpp"
#include "frame_file_sink.hpp"
#include "presenter.hpp"
#include "stats_sink.hpp"
#include "stream_context.hpp"
#include "stream_pipeline.hpp"
#include "wav_file_sink.hpp"

namespace {

std::atomic<bool> g_stop{false};

void onSignal(int) {
    g_stop.store(true);
}

void installSignalHandlers() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void printUsage(const char* argv0) {
    fprintf(stderr, "Usage: %s [config.json]\n", argv0);
    fprintf(stderr, "Environment overrides: C64VIEW_BIND, C64VIEW_VIDEO_PORT, C64VIEW_AUDIO_PORT,\n"
                    "  C64VIEW_AUDIO, C64VIEW_STANDARD, C64VIEW_SCALE, C64VIEW_SAVE_DIR,\n"
                    "  C64VIEW_HEADLESS, C64VIEW_LOG_LEVEL, C64VIEW_LOG_FILE\n");
}

} // namespace

int main(int argc, char** argv) {
    using namespace c64view;

    if (argc > 2 || (argc == 2 && (std::strcmp(argv[1], "-h") == 0 ||
                                   std::strcmp(argv[1], "--help") == 0))) {
        printUsage(argv[0]);
        return argc > 2 ? 1 : 0;
    }

    config::AppConfig app = argc == 2 ? config::loadConfig(argv[1]) : config::loadConfig();
    config::applyEnvironmentOverrides(app);

    log::setLogLevel(log::parseLevel(app.log.level, log::Level::Info));
    if (!app.log.file.empty() && !log::openLogFile(app.log.file.c_str())) {
        CVLOG_WARN("main", "Cannot open log file %s", app.log.file.c_str());
    }

    if (!app.stream.headless) {
        CVLOG_WARN("main", "No display backend in this build, running headless");
    }

    installSignalHandlers();

    StreamContext ctx(app.stream);
    StreamPipeline pipeline(ctx);

    Presenter presenter(pipeline);
    presenter.addSink(std::make_unique<StatsSink>(ctx.stats));
    presenter.addSink(std::make_unique<FrameFileSink>());
    presenter.addSink(std::make_unique<WavFileSink>());

    auto sinks = presenter.open();
    if (sinks.is_err()) {
        CVLOG_FATAL("main", "%s", sinks.error().message.c_str());
        log::closeLogFile();
        return 1;
    }

    auto started = pipeline.start();
    if (started.is_err()) {
        CVLOG_FATAL("main", "Cannot start stream (%s): %s",
                    errorKindName(started.error().kind), started.error().message.c_str());
        presenter.finish();
        log::closeLogFile();
        return 1;
    }

    CVLOG_INFO("main", "Listening for C64 video stream on UDP port %u... (Ctrl+C to quit)",
               (unsigned)pipeline.videoPort());
    presenter.run(g_stop);

    log::closeLogFile();
    return 0;
}
