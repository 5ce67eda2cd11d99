#pragma once
#include "byte_reservoir.hpp"
#include "vbus_codec.hpp"
#include <array>
#include <cstdint>

namespace vbl {

enum class SyncStatus {
    Frame,          // a valid frame was decoded and consumed
    Rejected,       // sync matched but the frame failed; one byte discarded
    NeedMoreData,   // input still open and exhausted for now
    Truncated,      // input closed mid-frame; terminal
    EndOfStream,    // input closed and exhausted; terminal
};

struct SyncResult {
    SyncStatus status = SyncStatus::EndOfStream;
    FrameError error = FrameError::None;
    uint64_t offset = 0;   // position of the sync byte involved
};

struct SyncCounters {
    uint64_t frames_valid = 0;
    uint64_t corruption = 0;      // rejected sync attempts
    uint64_t skipped_bytes = 0;   // bytes discarded while hunting for sync
    std::array<uint64_t, 7> by_error{};  // indexed by FrameError

    uint64_t rejected(FrameError e) const { return by_error[static_cast<size_t>(e)]; }
};

// Parse one frame whose sync byte is p[0], with `avail` bytes readable.
// Returns FrameError::Truncated when the frame continues past `avail`.
FrameError parse_frame(const uint8_t* p, size_t avail, Frame& out);

// Scans a reservoir for frames and resynchronizes byte-at-a-time after any
// rejected sync attempt.
class FrameSynchronizer {
public:
    explicit FrameSynchronizer(ByteReservoir& reservoir) : in_(reservoir) {}

    SyncResult next(Frame& out);

    const SyncCounters& counters() const { return counters_; }

private:
    ByteReservoir& in_;
    SyncCounters counters_;
};

} // namespace vbl
