#include <catch2/catch_all.hpp>

#include "src/frame_sync.hpp"
#include "test_support.hpp"
#include <vector>

using namespace vbl;

namespace {

struct Drained {
    std::vector<Frame> frames;
    size_t rejected = 0;
    bool truncated = false;
    size_t calls = 0;
};

// Run the synchronizer over a closed reservoir until a terminal status.
Drained drain(const std::vector<uint8_t>& bytes) {
    ByteReservoir r;
    r.append(bytes);
    r.close();
    FrameSynchronizer sync(r);

    Drained d;
    Frame f;
    for (;;) {
        ++d.calls;
        REQUIRE(d.calls <= bytes.size() + 2);   // forward progress
        const SyncResult res = sync.next(f);
        if (res.status == SyncStatus::Frame) d.frames.push_back(f);
        else if (res.status == SyncStatus::Rejected) ++d.rejected;
        else if (res.status == SyncStatus::Truncated) d.truncated = true;
        else if (res.status == SyncStatus::EndOfStream) break;
        else FAIL("NeedMoreData on a closed reservoir");
    }
    return d;
}

} // namespace

TEST_CASE("FrameSynchronizer: back-to-back frames") {
    std::vector<uint8_t> bytes;
    for (int i = 0; i < 3; ++i) append_bytes(bytes, speed_temp_packet());

    const Drained d = drain(bytes);
    REQUIRE(d.frames.size() == 3);
    CHECK(d.rejected == 0);
    CHECK_FALSE(d.truncated);
    CHECK(d.frames[0].frame_offset == 0);
    CHECK(d.frames[1].frame_offset == 16);
    CHECK(d.frames[2].frame_offset == 32);
}

TEST_CASE("FrameSynchronizer: resynchronizes across noise") {
    uint32_t seed = 12345;
    size_t false_syncs = 0;
    const size_t n = 25;

    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < n; ++i) {
        append_bytes(bytes, make_noise(1 + (i * 13) % 40, seed, &false_syncs));
        append_bytes(bytes, speed_temp_packet());
    }

    ByteReservoir r;
    r.append(bytes);
    r.close();
    FrameSynchronizer sync(r);
    Frame f;
    size_t frames = 0;
    for (size_t guard = 0; guard <= bytes.size(); ++guard) {
        const SyncResult res = sync.next(f);
        if (res.status == SyncStatus::EndOfStream) break;
        if (res.status == SyncStatus::Frame) {
            ++frames;
            CHECK(f.payload == std::vector<uint8_t>{0x64, 0x00, 0xFA, 0x00});
        }
    }

    CHECK(frames == n);
    CHECK(sync.counters().frames_valid == n);
    CHECK(sync.counters().corruption >= false_syncs);
    CHECK(sync.counters().skipped_bytes > 0);
}

TEST_CASE("FrameSynchronizer: false syncs with valid headers run into the next frame") {
    uint32_t seed = 777;
    size_t false_syncs = 0;
    size_t fake_headers = 0;
    const size_t n = 40;

    std::vector<uint8_t> bytes;
    for (size_t i = 0; i < n; ++i) {
        append_bytes(bytes, make_noise(1 + i % 9, seed, &false_syncs));

        // A checksum-valid header declaring more groups than follow it; the
        // body is cut somewhere inside, right before the real frame.
        seed = seed * 1664525u + 1013904223u;
        const size_t groups = 2 + (seed >> 24) % 5;
        std::vector<uint8_t> fake = make_packet(0x7E11, 0x0010, 0x0100,
                                                std::vector<uint8_t>(groups * 4, 0x5A));
        const size_t body = (seed >> 8) % ((groups - 1) * kPacketFrameBytes);
        fake.resize(kPacketHeaderBytes + body);
        append_bytes(bytes, fake);
        ++fake_headers;

        append_bytes(bytes, speed_temp_packet());
    }

    ByteReservoir r;
    r.append(bytes);
    r.close();
    FrameSynchronizer sync(r);
    Frame f;
    size_t frames = 0;
    bool truncated = false;
    for (size_t guard = 0; guard <= bytes.size(); ++guard) {
        const SyncResult res = sync.next(f);
        if (res.status == SyncStatus::EndOfStream) break;
        if (res.status == SyncStatus::Truncated) truncated = true;
        if (res.status == SyncStatus::Frame) {
            ++frames;
            CHECK(f.source_id == 1);
        }
    }

    CHECK(frames == n);
    CHECK_FALSE(truncated);
    CHECK(sync.counters().corruption >= false_syncs + fake_headers);
    CHECK(sync.counters().rejected(FrameError::HeaderLengthMismatch) == fake_headers);
}

TEST_CASE("FrameSynchronizer: a corrupted frame costs only that frame") {
    std::vector<uint8_t> bytes;
    append_bytes(bytes, speed_temp_packet());
    auto bad = speed_temp_packet();
    bad[12] ^= 0x01;   // payload byte, group checksum now wrong
    append_bytes(bytes, bad);
    append_bytes(bytes, speed_temp_packet());

    ByteReservoir r;
    r.append(bytes);
    r.close();
    FrameSynchronizer sync(r);
    Frame f;

    CHECK(sync.next(f).status == SyncStatus::Frame);
    const SyncResult rejected = sync.next(f);
    CHECK(rejected.status == SyncStatus::Rejected);
    CHECK(rejected.error == FrameError::ChecksumMismatch);
    CHECK(rejected.offset == 16);
    CHECK(sync.next(f).status == SyncStatus::Frame);
    CHECK(f.frame_offset == 32);
    CHECK(sync.next(f).status == SyncStatus::EndOfStream);
    CHECK(sync.counters().corruption == 1);
    CHECK(sync.counters().rejected(FrameError::ChecksumMismatch) == 1);
}

TEST_CASE("FrameSynchronizer: truncated tail") {
    std::vector<uint8_t> bytes;
    append_bytes(bytes, speed_temp_packet());
    append_bytes(bytes, speed_temp_packet());
    const auto third = speed_temp_packet();
    bytes.insert(bytes.end(), third.begin(), third.begin() + 7);

    const Drained d = drain(bytes);
    CHECK(d.frames.size() == 2);
    CHECK(d.truncated);
    CHECK(d.rejected == 0);
}

TEST_CASE("FrameSynchronizer: frames split across chunks") {
    std::vector<uint8_t> bytes;
    for (int i = 0; i < 3; ++i) append_bytes(bytes, speed_temp_packet());

    for (size_t cut = 0; cut <= bytes.size(); ++cut) {
        ByteReservoir r;
        FrameSynchronizer sync(r);
        Frame f;
        size_t frames = 0;

        r.append(bytes.data(), cut);
        for (;;) {
            const SyncResult res = sync.next(f);
            if (res.status == SyncStatus::Frame) { ++frames; continue; }
            REQUIRE(res.status == SyncStatus::NeedMoreData);
            break;
        }

        r.append(bytes.data() + cut, bytes.size() - cut);
        r.close();
        for (;;) {
            const SyncResult res = sync.next(f);
            if (res.status == SyncStatus::Frame) { ++frames; continue; }
            REQUIRE(res.status == SyncStatus::EndOfStream);
            break;
        }

        CHECK(frames == 3);
        CHECK(sync.counters().corruption == 0);
    }
}

TEST_CASE("FrameSynchronizer: random bytes always terminate") {
    uint32_t seed = GENERATE(1u, 7u, 99u, 2024u);
    std::vector<uint8_t> bytes;
    for (int i = 0; i < 4000; ++i) {
        seed = seed * 1103515245u + 12345u;
        bytes.push_back(static_cast<uint8_t>(seed >> 16));
    }
    const Drained d = drain(bytes);
    CHECK(d.calls <= bytes.size() + 2);
}
