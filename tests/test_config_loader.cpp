// =============================================================================
// Unit tests for config_loader.hpp
// Tests: defaults, JSON sections, file loading, environment overrides
// =============================================================================
#include <gtest/gtest.h>
#include <fstream>
#include <cstdio>
#include <cstdlib>
#include "config_loader.hpp"

using namespace c64view;
using namespace c64view::config;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static void writeTmpJson(const char* path, const char* content) {
    std::ofstream f(path);
    f << content;
}

// Clears every C64VIEW_* variable before and after each env test
class EnvOverrideTest : public ::testing::Test {
protected:
    static constexpr const char* kVars[] = {
        "C64VIEW_BIND", "C64VIEW_VIDEO_PORT", "C64VIEW_AUDIO_PORT", "C64VIEW_AUDIO",
        "C64VIEW_STANDARD", "C64VIEW_SCALE", "C64VIEW_SAVE_DIR", "C64VIEW_HEADLESS",
        "C64VIEW_LOG_LEVEL", "C64VIEW_LOG_FILE"};

    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* v : kVars) unsetenv(v);
    }
};

// ---------------------------------------------------------------------------
// Defaults
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, DefaultValues) {
    AppConfig cfg;
    EXPECT_EQ(cfg.stream.bind_address, "0.0.0.0");
    EXPECT_EQ(cfg.stream.video_port, 11000);
    EXPECT_EQ(cfg.stream.audio_port, 11001);
    EXPECT_TRUE(cfg.stream.audio_enabled);
    EXPECT_EQ(cfg.stream.standard, VideoStandard::PAL);
    EXPECT_EQ(cfg.stream.geometry.height, 272);
    EXPECT_EQ(cfg.stream.display_scale, 2);
    EXPECT_TRUE(cfg.stream.save_dir.empty());
    EXPECT_EQ(cfg.log.level, "info");
    EXPECT_TRUE(cfg.log.file.empty());
}

TEST(ConfigLoaderTest, LoadConfigMissingFileReturnsDefaults) {
    AppConfig cfg = loadConfig("__nonexistent_config_xyz.json");
    EXPECT_EQ(cfg.stream.video_port, 11000);
    EXPECT_EQ(cfg.log.level, "info");
}

TEST(ConfigLoaderTest, EmptyObjectGivesDefaults) {
    AppConfig cfg = parseConfigText("{}");
    EXPECT_EQ(cfg.stream.video_port, 11000);
    EXPECT_EQ(cfg.stream.retention_window, 4u);
    EXPECT_TRUE(validateConfig(cfg.stream).is_ok());
}

// ---------------------------------------------------------------------------
// Sections
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, ParsesAllSections) {
    AppConfig cfg = parseConfigText(R"({
        "network": { "bind_address": "192.168.1.10", "video_port": 12000,
                     "audio_port": 12001, "audio_enabled": false,
                     "socket_rcvbuf_bytes": 1048576 },
        "video":   { "retention_window": 8, "lookahead_depth": 3, "stall_timeout_ms": 750 },
        "audio":   { "ring_ms": 300 },
        "output":  { "scale": 3, "save_dir": "/tmp/c64", "headless": false,
                     "stats_interval_ms": 2000 },
        "log":     { "level": "debug", "file": "c64view.log" }
    })");

    EXPECT_EQ(cfg.stream.bind_address, "192.168.1.10");
    EXPECT_EQ(cfg.stream.video_port, 12000);
    EXPECT_EQ(cfg.stream.audio_port, 12001);
    EXPECT_FALSE(cfg.stream.audio_enabled);
    EXPECT_EQ(cfg.stream.socket_rcvbuf_bytes, 1048576);
    EXPECT_EQ(cfg.stream.retention_window, 8u);
    EXPECT_EQ(cfg.stream.lookahead_depth, 3u);
    EXPECT_EQ(cfg.stream.stall_timeout.count(), 750);
    EXPECT_EQ(cfg.stream.audio_ring_ms, 300u);
    EXPECT_EQ(cfg.stream.display_scale, 3);
    EXPECT_EQ(cfg.stream.save_dir, "/tmp/c64");
    EXPECT_FALSE(cfg.stream.headless);
    EXPECT_EQ(cfg.stream.stats_interval.count(), 2000);
    EXPECT_EQ(cfg.log.level, "debug");
    EXPECT_EQ(cfg.log.file, "c64view.log");
}

TEST(ConfigLoaderTest, NtscStandard) {
    AppConfig cfg = parseConfigText(R"({ "video": { "standard": "ntsc" } })");
    EXPECT_EQ(cfg.stream.standard, VideoStandard::NTSC);
    EXPECT_EQ(cfg.stream.geometry.height, 240);
    EXPECT_DOUBLE_EQ(cfg.stream.nominal_fps, 60.0);
}

TEST(ConfigLoaderTest, ExplicitHeightMakesCustomGeometry) {
    AppConfig cfg = parseConfigText(R"({ "video": { "height": 200, "nominal_fps": 25.0 } })");
    EXPECT_EQ(cfg.stream.standard, VideoStandard::Custom);
    EXPECT_EQ(cfg.stream.geometry.height, 200);
    EXPECT_EQ(cfg.stream.geometry.fragmentCount(), 50u);
    EXPECT_DOUBLE_EQ(cfg.stream.nominal_fps, 25.0);
}

TEST(ConfigLoaderTest, UnknownStandardFallsBackToPal) {
    AppConfig cfg = parseConfigText(R"({ "video": { "standard": "SECAM" } })");
    EXPECT_EQ(cfg.stream.standard, VideoStandard::PAL);
}

TEST(ConfigLoaderTest, WrongTypeKeepsDefault) {
    AppConfig cfg = parseConfigText(R"({ "network": { "video_port": "eleven thousand" } })");
    EXPECT_EQ(cfg.stream.video_port, 11000);
}

TEST(ConfigLoaderTest, OutOfRangeIntegersKeepDefault) {
    AppConfig cfg = parseConfigText(R"({
        "network": { "video_port": 70000, "audio_port": -1 },
        "video":   { "retention_window": -1, "height": 65536 }
    })");
    EXPECT_EQ(cfg.stream.video_port, 11000);
    EXPECT_EQ(cfg.stream.audio_port, 11001);
    EXPECT_EQ(cfg.stream.retention_window, 4u);
    EXPECT_EQ(cfg.stream.geometry, FrameGeometry::pal());
    EXPECT_EQ(cfg.stream.standard, VideoStandard::PAL);
}

TEST(ConfigLoaderTest, BoundaryPortAccepted) {
    AppConfig cfg = parseConfigText(R"({ "network": { "video_port": 65535 } })");
    EXPECT_EQ(cfg.stream.video_port, 65535);
}

TEST(ConfigLoaderTest, FractionalIntegerKeepsDefault) {
    AppConfig cfg = parseConfigText(R"({
        "network": { "video_port": 11000.5 },
        "video":   { "lookahead_depth": 2.5, "nominal_fps": 60 }
    })");
    EXPECT_EQ(cfg.stream.video_port, 11000);
    EXPECT_EQ(cfg.stream.lookahead_depth, 2u);
    EXPECT_DOUBLE_EQ(cfg.stream.nominal_fps, 60.0);
}

TEST(ConfigLoaderTest, BadJsonGivesDefaults) {
    AppConfig cfg = parseConfigText("{ \"network\": { ");
    EXPECT_EQ(cfg.stream.video_port, 11000);
}

TEST(ConfigLoaderTest, ParseVideoStandardNames) {
    EXPECT_EQ(parseVideoStandard("PAL"), VideoStandard::PAL);
    EXPECT_EQ(parseVideoStandard("Ntsc"), VideoStandard::NTSC);
    EXPECT_FALSE(parseVideoStandard("").has_value());
}

// ---------------------------------------------------------------------------
// File loading
// ---------------------------------------------------------------------------
TEST(ConfigLoaderTest, LoadConfigFromFile) {
    const char* path = "__c64view_test_config.json";
    writeTmpJson(path, R"({ "network": { "video_port": 11500 }, "log": { "level": "warn" } })");
    AppConfig cfg = loadConfig(path);
    std::remove(path);

    EXPECT_EQ(cfg.stream.video_port, 11500);
    EXPECT_EQ(cfg.log.level, "warn");
}

TEST(ConfigLoaderTest, LoadConfigBadFileGivesDefaults) {
    const char* path = "__c64view_bad_config.json";
    writeTmpJson(path, "not json at all");
    AppConfig cfg = loadConfig(path);
    std::remove(path);

    EXPECT_EQ(cfg.stream.video_port, 11000);
}

// ---------------------------------------------------------------------------
// Environment overrides
// ---------------------------------------------------------------------------
TEST_F(EnvOverrideTest, OverridesNetworkAndOutput) {
    setenv("C64VIEW_BIND", "127.0.0.1", 1);
    setenv("C64VIEW_VIDEO_PORT", "12345", 1);
    setenv("C64VIEW_AUDIO", "off", 1);
    setenv("C64VIEW_SCALE", "4", 1);
    setenv("C64VIEW_SAVE_DIR", "/tmp/frames", 1);
    setenv("C64VIEW_LOG_LEVEL", "trace", 1);

    AppConfig cfg;
    applyEnvironmentOverrides(cfg);
    EXPECT_EQ(cfg.stream.bind_address, "127.0.0.1");
    EXPECT_EQ(cfg.stream.video_port, 12345);
    EXPECT_FALSE(cfg.stream.audio_enabled);
    EXPECT_EQ(cfg.stream.display_scale, 4);
    EXPECT_EQ(cfg.stream.save_dir, "/tmp/frames");
    EXPECT_EQ(cfg.log.level, "trace");
}

TEST_F(EnvOverrideTest, StandardOverride) {
    setenv("C64VIEW_STANDARD", "NTSC", 1);
    AppConfig cfg;
    applyEnvironmentOverrides(cfg);
    EXPECT_EQ(cfg.stream.geometry.height, 240);
}

TEST_F(EnvOverrideTest, InvalidValuesIgnored) {
    setenv("C64VIEW_VIDEO_PORT", "70000", 1);
    setenv("C64VIEW_AUDIO_PORT", "12x", 1);
    setenv("C64VIEW_SCALE", "9", 1);
    setenv("C64VIEW_HEADLESS", "maybe", 1);
    setenv("C64VIEW_STANDARD", "SECAM", 1);

    AppConfig cfg;
    applyEnvironmentOverrides(cfg);
    EXPECT_EQ(cfg.stream.video_port, 11000);
    EXPECT_EQ(cfg.stream.audio_port, 11001);
    EXPECT_EQ(cfg.stream.display_scale, 2);
    EXPECT_TRUE(cfg.stream.headless);
    EXPECT_EQ(cfg.stream.standard, VideoStandard::PAL);
}

TEST_F(EnvOverrideTest, NothingSetChangesNothing) {
    AppConfig cfg = parseConfigText(R"({ "network": { "video_port": 11500 } })");
    applyEnvironmentOverrides(cfg);
    EXPECT_EQ(cfg.stream.video_port, 11500);
}
