#include "frame_reassembler.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

#include "c64_protocol.hpp"
#include "c64view_log.hpp"

namespace c64view {

FrameReassembler::FrameReassembler(const FrameGeometry& geometry, uint32_t window,
                                   StreamStats& stats)
    : configured_geometry_(geometry)
    , geometry_(geometry)
    , window_(window == 0 ? 1 : window)
    , expected_fragments_(geometry.fragmentCount())
    , fragment_bytes_(geometry.fragmentBytes())
    , stats_(stats)
    , slots_(window_) {
    allocateSlots();
    CVLOG_DEBUG("reasm", "Frame arena: %u slots x %zu bytes (%u fragments/frame)",
                window_, geometry_.frameBytes(), expected_fragments_);
}

void FrameReassembler::allocateSlots() {
    for (auto& slot : slots_) {
        slot.state = PendingFrame::State::Empty;
        slot.received_count = 0;
        slot.pixels.assign(geometry_.frameBytes(), 0);
        slot.received.assign(expected_fragments_, false);
    }
}

std::optional<FrameFragment> FrameReassembler::parse(const Datagram& d) {
    auto header = protocol::parseVideoHeader(d.payload.data(), d.payload.size());
    if (d.stream != StreamKind::Video || !header) {
        stats_.packets_discarded.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    if (header->last) {
        noteFrameEnd(header->frame_num, header->line / geometry_.lines_per_fragment + 1u);
    }

    FrameFragment f;
    f.packet_seq = header->packet_seq;
    f.frame_seq = header->frame_num;
    f.line = header->line;
    f.last = header->last;
    f.index = header->line / geometry_.lines_per_fragment;
    f.pixels = d.payload.data() + protocol::VIDEO_HEADER_SIZE;
    f.pixel_bytes = protocol::VIDEO_PAYLOAD_SIZE;

    if (f.index >= expected_fragments_) {
        stats_.packets_discarded.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    return f;
}

FramePtr FrameReassembler::submit(const Datagram& d) {
    auto fragment = parse(d);
    if (!fragment) return nullptr;
    return submit(*fragment, d.arrival);
}

uint64_t FrameReassembler::extend(uint16_t raw) const {
    if (!started_) return SEQUENCE_BASE | raw;
    auto delta = static_cast<int16_t>(static_cast<uint16_t>(raw - static_cast<uint16_t>(highest_)));
    return static_cast<uint64_t>(static_cast<int64_t>(highest_) + delta);
}

FramePtr FrameReassembler::submit(const FrameFragment& fragment, Clock::time_point arrival) {
    if (fragment.index >= expected_fragments_ || fragment.pixels == nullptr ||
        fragment.pixel_bytes != fragment_bytes_) {
        stats_.packets_discarded.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    uint64_t seq = extend(fragment.frame_seq);

    if (!started_) {
        started_ = true;
        rebase(seq);
        CVLOG_INFO("reasm", "First video fragment: frame %u", (unsigned)fragment.frame_seq);
    } else if (seq < floor_) {
        if (floor_ - seq <= RESYNC_DISTANCE) {
            dropHeld();
            stats_.fragments_late.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        if (held_.valid && held_.frame_seq == fragment.frame_seq) {
            return resync(fragment, arrival);
        }
        dropHeld();
        hold(fragment, arrival);
        return nullptr;
    }

    dropHeld();
    if (seq > highest_) {
        highest_ = seq;
        uint64_t new_floor = seq >= window_ - 1 ? seq - (window_ - 1) : 0;
        if (new_floor > floor_) {
            abandonBefore(new_floor);
            floor_ = new_floor;
        }
    }
    return accept(seq, fragment, arrival);
}

FramePtr FrameReassembler::accept(uint64_t seq, const FrameFragment& fragment,
                                  Clock::time_point arrival) {
    PendingFrame& slot = slotFor(seq);
    if (slot.state != PendingFrame::State::Empty && slot.sequence == seq) {
        if (slot.state != PendingFrame::State::Accumulating) {
            stats_.fragments_late.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    } else {
        // Whatever the slot held is below the floor by now
        if (slot.state == PendingFrame::State::Accumulating) abandon(slot);
        slot.state = PendingFrame::State::Accumulating;
        slot.sequence = seq;
        slot.raw_sequence = fragment.frame_seq;
        std::fill(slot.received.begin(), slot.received.end(), false);
        slot.received_count = 0;
        slot.first_arrival = arrival;
    }

    std::memcpy(slot.pixels.data() + static_cast<size_t>(fragment.index) * fragment_bytes_,
                fragment.pixels, fragment_bytes_);
    slot.last_arrival = arrival;
    if (slot.received[fragment.index]) {
        stats_.fragments_duplicate.fetch_add(1, std::memory_order_relaxed);
    } else {
        slot.received[fragment.index] = true;
        slot.received_count++;
    }

    if (slot.received_count < expected_fragments_) {
        updateGauge();
        return nullptr;
    }

    auto frame = std::make_shared<CompletedFrame>();
    frame->geometry = geometry_;
    frame->sequence = slot.raw_sequence;
    frame->frame_number = seq;
    frame->completed_at = arrival;
    frame->pixels = slot.pixels;
    slot.state = PendingFrame::State::Complete;
    stats_.frames_completed.fetch_add(1, std::memory_order_relaxed);

    updateGauge();
    return frame;
}

// =============================================================================
// Device restart
// =============================================================================

void FrameReassembler::hold(const FrameFragment& fragment, Clock::time_point arrival) {
    held_.valid = true;
    held_.frame_seq = fragment.frame_seq;
    held_.line = fragment.line;
    held_.index = fragment.index;
    held_.last = fragment.last;
    held_.pixels.assign(fragment.pixels, fragment.pixels + fragment_bytes_);
    held_.arrival = arrival;
}

void FrameReassembler::dropHeld() {
    if (!held_.valid) return;
    held_.valid = false;
    stats_.fragments_late.fetch_add(1, std::memory_order_relaxed);
    CVLOG_DEBUG("reasm", "Discarded stray fragment of frame %u", (unsigned)held_.frame_seq);
}

FramePtr FrameReassembler::resync(const FrameFragment& fragment, Clock::time_point arrival) {
    CVLOG_WARN("reasm", "Frame %u is %llu frames behind the window, resyncing",
               (unsigned)fragment.frame_seq,
               (unsigned long long)(floor_ - extend(fragment.frame_seq)));
    stats_.stream_resyncs.fetch_add(1, std::memory_order_relaxed);
    abandonBefore(std::numeric_limits<uint64_t>::max());

    // Continue above everything seen so far; the low 16 bits stay the device's
    uint64_t seq = (((highest_ >> 16) + 1) << 16) | fragment.frame_seq;
    rebase(seq);

    FrameFragment first;
    first.frame_seq = held_.frame_seq;
    first.line = held_.line;
    first.index = held_.index;
    first.last = held_.last;
    first.pixels = held_.pixels.data();
    first.pixel_bytes = held_.pixels.size();
    held_.valid = false;

    FramePtr a = accept(seq, first, held_.arrival);
    FramePtr b = accept(seq, fragment, arrival);
    return b ? b : a;
}

// =============================================================================
// Frame height detection
// =============================================================================

void FrameReassembler::noteFrameEnd(uint16_t frame_seq, uint32_t fragments) {
    if (fragments == expected_fragments_) {
        mismatch_frames_ = 0;
        return;
    }
    if (fragments != mismatch_fragments_) {
        mismatch_fragments_ = fragments;
        mismatch_frames_ = 0;
    } else if (mismatch_frames_ > 0 && frame_seq == mismatch_frame_) {
        return;  // repeated last packet of the same frame
    }
    mismatch_frame_ = frame_seq;
    if (++mismatch_frames_ < GEOMETRY_SWITCH_FRAMES) return;
    mismatch_frames_ = 0;

    const FrameGeometry pal = FrameGeometry::pal();
    const FrameGeometry ntsc = FrameGeometry::ntsc();
    if (fragments == pal.fragmentCount()) {
        switchGeometry(pal, "PAL");
    } else if (fragments == ntsc.fragmentCount()) {
        switchGeometry(ntsc, "NTSC");
    } else if (!mismatch_warned_) {
        mismatch_warned_ = true;
        CVLOG_ERROR("reasm", "Device ends frames at line %u but geometry expects %u lines",
                    (unsigned)(fragments * geometry_.lines_per_fragment),
                    (unsigned)geometry_.height);
    }
}

void FrameReassembler::switchGeometry(const FrameGeometry& geometry, const char* name) {
    CVLOG_WARN("reasm", "Device sends %s frames (%u lines), switching from %u lines",
               name, (unsigned)geometry.height, (unsigned)geometry_.height);
    abandonBefore(std::numeric_limits<uint64_t>::max());
    geometry_ = geometry;
    expected_fragments_ = geometry.fragmentCount();
    fragment_bytes_ = geometry.fragmentBytes();
    allocateSlots();
    updateGauge();
}

// =============================================================================
// Window bookkeeping
// =============================================================================

void FrameReassembler::abandonBefore(uint64_t limit) {
    for (auto& slot : slots_) {
        if (slot.state == PendingFrame::State::Accumulating && slot.sequence < limit) {
            abandon(slot);
        }
    }
}

void FrameReassembler::abandon(PendingFrame& slot) {
    slot.state = PendingFrame::State::Abandoned;
    stats_.frames_dropped_incomplete.fetch_add(1, std::memory_order_relaxed);
    CVLOG_DEBUG("reasm", "Abandoned frame %u (%u/%u fragments)",
                (unsigned)slot.raw_sequence, slot.received_count, expected_fragments_);
    if (on_drop_) on_drop_(slot.sequence);
}

void FrameReassembler::rebase(uint64_t seq) {
    for (auto& slot : slots_) {
        slot.state = PendingFrame::State::Empty;
        slot.received_count = 0;
    }
    highest_ = seq;
    floor_ = seq >= window_ - 1 ? seq - (window_ - 1) : 0;
}

void FrameReassembler::reset() {
    if (geometry_ == configured_geometry_) {
        for (auto& slot : slots_) {
            slot.state = PendingFrame::State::Empty;
            slot.received_count = 0;
        }
    } else {
        geometry_ = configured_geometry_;
        expected_fragments_ = geometry_.fragmentCount();
        fragment_bytes_ = geometry_.fragmentBytes();
        allocateSlots();
    }
    started_ = false;
    highest_ = 0;
    floor_ = 0;
    held_.valid = false;
    mismatch_fragments_ = 0;
    mismatch_frames_ = 0;
    mismatch_warned_ = false;
    updateGauge();
}

uint32_t FrameReassembler::pendingFrames() const {
    uint32_t n = 0;
    for (const auto& slot : slots_) {
        if (slot.state == PendingFrame::State::Accumulating) n++;
    }
    return n;
}

void FrameReassembler::updateGauge() {
    stats_.pending_frames.store(pendingFrames(), std::memory_order_relaxed);
}

} // namespace c64view
