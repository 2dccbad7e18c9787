// =============================================================================
// c64view - Video Frame Reassembler
// =============================================================================
// Fragments -> fixed arena of PendingFrame slots -> CompletedFrame.
//
// Slot for extended sequence S is slots_[S % window]. The arena is allocated
// once at construction (window x frameBytes) and never grows.
//
// Sequence rules:
//   - 16-bit device frame numbers are extended to 64 bits by signed distance
//     from the highest sequence seen
//   - below the floor            -> fragments_late
//   - far below the floor        -> resync once a second fragment of the
//                                   same frame confirms the device restarted
//   - above the highest          -> window slides, stragglers abandoned
//
// Frames are abandoned only when the window slides past them (or on resync),
// so an older frame may complete after a newer one. Ordering is restored by
// the PacingController. Extended numbers keep growing across a resync.
//
// The last-packet flag tells the frame height the device actually sends.
// When it disagrees with the geometry for GEOMETRY_SWITCH_FRAMES frames in a
// row and matches the PAL or NTSC preset, the arena switches to that preset.
//
// Clock-agnostic: all timestamps come from the datagram arrival time.
// Single-threaded: owned by the receive thread.
// =============================================================================
#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "stream_config.hpp"
#include "stream_stats.hpp"
#include "stream_types.hpp"

namespace c64view {

class FrameReassembler {
public:
    // Distance behind the floor treated as a device restart
    static constexpr uint64_t RESYNC_DISTANCE = 64;
    // Consecutive frames ending at the same unexpected line before switching
    static constexpr uint32_t GEOMETRY_SWITCH_FRAMES = 3;

    struct PendingFrame {
        enum class State { Empty, Accumulating, Complete, Abandoned };

        State state = State::Empty;
        uint64_t sequence = 0;          // extended
        uint16_t raw_sequence = 0;
        std::vector<uint8_t> pixels;    // geometry.frameBytes()
        std::vector<bool> received;     // one bit per fragment index
        uint32_t received_count = 0;
        Clock::time_point first_arrival;
        Clock::time_point last_arrival;
    };

    // Called with the extended sequence of every abandoned frame
    using DropCallback = std::function<void(uint64_t sequence)>;

    // Geometry and window must already be validated (validateConfig).
    FrameReassembler(const FrameGeometry& geometry, uint32_t window, StreamStats& stats);

    void setDropCallback(DropCallback cb) { on_drop_ = std::move(cb); }

    // Decodes a video datagram. nullopt (and packets_discarded) when the
    // datagram is malformed or its line lies outside the geometry.
    std::optional<FrameFragment> parse(const Datagram& d);

    // Accepts one fragment. Returns the frame it completed, or nullptr.
    FramePtr submit(const FrameFragment& fragment, Clock::time_point arrival);

    // parse() + submit()
    FramePtr submit(const Datagram& d);

    // Drops every pending frame, forgets the sequence history and returns to
    // the configured geometry.
    void reset();

    // Current geometry (differs from the configured one after a switch)
    const FrameGeometry& geometry() const { return geometry_; }
    uint32_t window() const { return window_; }
    uint32_t pendingFrames() const;
    bool started() const { return started_; }
    uint64_t highestSequence() const { return highest_; }
    uint64_t floorSequence() const { return floor_; }

    // Extended sequence a raw frame number would map to right now.
    uint64_t extend(uint16_t raw) const;

private:
    // First far-behind fragment, kept until the next fragment shows whether
    // the device restarted or it was a stray datagram
    struct HeldFragment {
        bool valid = false;
        uint16_t frame_seq = 0;
        uint16_t line = 0;
        uint32_t index = 0;
        bool last = false;
        std::vector<uint8_t> pixels;
        Clock::time_point arrival;
    };

    PendingFrame& slotFor(uint64_t seq) { return slots_[seq % window_]; }

    // Copies the fragment into its slot; returns the frame it completed.
    FramePtr accept(uint64_t seq, const FrameFragment& fragment, Clock::time_point arrival);
    FramePtr resync(const FrameFragment& fragment, Clock::time_point arrival);
    void hold(const FrameFragment& fragment, Clock::time_point arrival);
    void dropHeld();

    void noteFrameEnd(uint16_t frame_seq, uint32_t fragments);
    void switchGeometry(const FrameGeometry& geometry, const char* name);
    void allocateSlots();

    // Abandons accumulating frames with sequence < limit.
    void abandonBefore(uint64_t limit);
    void abandon(PendingFrame& slot);
    void rebase(uint64_t seq);
    void updateGauge();

    const FrameGeometry configured_geometry_;
    FrameGeometry geometry_;
    uint32_t window_;
    uint32_t expected_fragments_;
    size_t fragment_bytes_;
    StreamStats& stats_;

    std::vector<PendingFrame> slots_;
    DropCallback on_drop_;

    bool started_ = false;
    uint64_t highest_ = 0;
    uint64_t floor_ = 0;
    HeldFragment held_;

    uint32_t mismatch_fragments_ = 0;
    uint32_t mismatch_frames_ = 0;
    uint16_t mismatch_frame_ = 0;
    bool mismatch_warned_ = false;

    // Initial extended value keeps early backward steps from underflowing
    static constexpr uint64_t SEQUENCE_BASE = 1ULL << 32;
};

} // namespace c64view
