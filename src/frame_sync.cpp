#include "frame_sync.hpp"
#include <utility>

namespace vbl {

// ------------------ helpers ------------------
static inline uint16_t read_u16_le(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

// Bytes [from, to) must be readable and 7-bit clean. Inside the header any
// high bit is a malformed header; inside the body a sync byte means the frame
// is shorter than its header declares.
static FrameError check_span(const uint8_t* p, size_t avail, size_t from, size_t to, bool header) {
    for (size_t i = from; i < to; ++i) {
        if (i >= avail) return FrameError::Truncated;
        if ((p[i] & 0x80) == 0) continue;
        if (header) return FrameError::MalformedHeader;
        return p[i] == kSyncByte ? FrameError::HeaderLengthMismatch
                                 : FrameError::MalformedSeptetGroup;
    }
    return FrameError::None;
}

// Decode `count` groups of (width data, septet, checksum) starting at p[at].
static FrameError decode_groups(const uint8_t* p, size_t avail, size_t at, size_t count,
                                size_t width, std::vector<uint8_t>& payload) {
    const size_t group_bytes = width + 2;
    const uint8_t unused_bits = static_cast<uint8_t>(0x7F & ~((1u << width) - 1));
    payload.assign(count * width, 0);
    for (size_t g = 0; g < count; ++g) {
        const size_t base = at + g * group_bytes;
        const FrameError e = check_span(p, avail, base, base + group_bytes, false);
        if (e != FrameError::None) return e;

        const uint8_t septet = p[base + width];
        if (septet & unused_bits) return FrameError::MalformedSeptetGroup;
        if (vbus_checksum(p + base, width + 1) != p[base + width + 1])
            return FrameError::ChecksumMismatch;
        septet_decode(p + base, width, septet, &payload[g * width]);
    }
    return FrameError::None;
}

FrameError parse_frame(const uint8_t* p, size_t avail, Frame& out) {
    if (avail == 0 || p[0] != kSyncByte) return FrameError::MalformedHeader;

    FrameError e = check_span(p, avail, 1, 6, true);
    if (e != FrameError::None) return e;

    Frame f;
    f.destination_id = read_u16_le(p + 1);
    f.source_id = read_u16_le(p + 3);
    f.protocol_version = p[5];
    const size_t width = septet_group_width(f.protocol_version);

    switch (f.protocol_version & 0xF0) {
    case kVersionPacket: {
        e = check_span(p, avail, 6, kPacketHeaderBytes, true);
        if (e != FrameError::None) return e;
        if (vbus_checksum(p + 1, 8) != p[9]) return FrameError::ChecksumMismatch;

        f.command_id = read_u16_le(p + 6);
        const size_t frames = p[8];
        e = decode_groups(p, avail, kPacketHeaderBytes, frames, width, f.payload);
        if (e != FrameError::None) return e;
        f.wire_length = kPacketHeaderBytes + frames * kPacketFrameBytes;
        break;
    }
    case kVersionDatagram: {
        e = check_span(p, avail, 6, 8, true);
        if (e != FrameError::None) return e;
        e = check_span(p, avail, 8, kDatagramBytes, false);
        if (e != FrameError::None) return e;

        const uint8_t septet = p[8 + width];
        if (septet & 0x40) return FrameError::MalformedSeptetGroup;
        if (vbus_checksum(p + 1, kDatagramBytes - 2) != p[kDatagramBytes - 1])
            return FrameError::ChecksumMismatch;

        f.command_id = read_u16_le(p + 6);
        f.payload.assign(width, 0);
        septet_decode(p + 8, width, septet, f.payload.data());
        f.wire_length = kDatagramBytes;
        break;
    }
    case kVersionTelegram: {
        e = check_span(p, avail, 6, kTelegramHeaderBytes, true);
        if (e != FrameError::None) return e;
        if (vbus_checksum(p + 1, 6) != p[7]) return FrameError::ChecksumMismatch;

        f.command_id = p[6] & 0x1F;
        const size_t frames = (p[6] >> 5) & 0x03;
        e = decode_groups(p, avail, kTelegramHeaderBytes, frames, width, f.payload);
        if (e != FrameError::None) return e;
        f.wire_length = kTelegramHeaderBytes + frames * kTelegramFrameBytes;
        break;
    }
    default:
        return FrameError::UnsupportedVersion;
    }

    out = std::move(f);
    return FrameError::None;
}

SyncResult FrameSynchronizer::next(Frame& out) {
    // Hunt for the next sync byte.
    while (in_.remaining() > 0 && *in_.peek(1) != kSyncByte) {
        in_.consume(1);
        ++counters_.skipped_bytes;
    }

    SyncResult r;
    r.offset = in_.position();
    if (in_.remaining() == 0) {
        r.status = in_.closed() ? SyncStatus::EndOfStream : SyncStatus::NeedMoreData;
        return r;
    }

    const size_t avail = in_.remaining();
    const FrameError e = parse_frame(in_.peek(avail), avail, out);

    if (e == FrameError::None) {
        out.frame_offset = r.offset;
        in_.consume(out.wire_length);   // parse_frame saw all wire_length bytes
        ++counters_.frames_valid;
        r.status = SyncStatus::Frame;
        return r;
    }

    if (e == FrameError::Truncated) {
        // Keep the sync position; the rest of the frame may still arrive.
        if (!in_.closed()) {
            r.status = SyncStatus::NeedMoreData;
            return r;
        }
        in_.consume(avail);
        ++counters_.by_error[static_cast<size_t>(e)];
        r.status = SyncStatus::Truncated;
        r.error = e;
        return r;
    }

    in_.consume(1);
    ++counters_.corruption;
    ++counters_.by_error[static_cast<size_t>(e)];
    r.status = SyncStatus::Rejected;
    r.error = e;
    return r;
}

} // namespace vbl
