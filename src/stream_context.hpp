// =============================================================================
// c64view - Stream Context
// =============================================================================
// Per-stream shared state handed to each component at construction. Several
// contexts can coexist in one process (e.g. a test with receiver and sender).
// =============================================================================
#pragma once
#include <atomic>

#include "event_bus.hpp"
#include "stream_config.hpp"
#include "stream_stats.hpp"

namespace c64view {

struct StreamContext {
    explicit StreamContext(StreamConfig cfg = StreamConfig{}) : config(std::move(cfg)) {}

    StreamContext(const StreamContext&) = delete;
    StreamContext& operator=(const StreamContext&) = delete;

    StreamConfig config;
    StreamStats stats;
    EventBus events;
    std::atomic<bool> running{false};
};

} // namespace c64view
