#include "frame_file_sink.hpp"

#include <cstdio>
#include <filesystem>

#include "c64view_log.hpp"
#include "frame_capture.hpp"

namespace c64view {

std::string FrameFileSink::fileName(uint64_t index) {
    char buf[32];
    snprintf(buf, sizeof(buf), "frame_%06llu.png", (unsigned long long)index);
    return buf;
}

Result<void> FrameFileSink::open(const StreamConfig& config) {
    dir_.clear();
    counter_ = written_ = errors_ = 0;
    if (config.save_dir.empty()) return Ok();

    std::error_code ec;
    std::filesystem::create_directories(config.save_dir, ec);
    if (ec) {
        return Error(Error::Kind::Io, "cannot create " + config.save_dir + ": " + ec.message());
    }
    dir_ = config.save_dir;
    CVLOG_INFO("frames", "Saving frames to: %s", dir_.c_str());
    return Ok();
}

void FrameFileSink::onFrame(const CompletedFrame& frame) {
    if (dir_.empty()) return;

    counter_++;
    renderFrame(frame, 1, image_);
    auto path = (std::filesystem::path(dir_) / fileName(counter_)).string();
    auto r = savePng(path, image_);
    if (r.is_err()) {
        // Log the first failure and then every 100th
        if (errors_++ % 100 == 0) {
            CVLOG_ERROR("frames", "%s (%llu failures)", r.error().message.c_str(),
                        (unsigned long long)errors_);
        }
        return;
    }
    written_++;
}

void FrameFileSink::close() {
    if (dir_.empty()) return;
    CVLOG_INFO("frames", "Saved %llu frames to %s (%llu errors)", (unsigned long long)written_,
               dir_.c_str(), (unsigned long long)errors_);
    dir_.clear();
}

} // namespace c64view
