#include <catch2/catch_all.hpp>

#include "src/frame_sync.hpp"
#include "src/vbus_codec.hpp"
#include "test_support.hpp"
#include <vector>

using namespace vbl;

TEST_CASE("vbus_checksum: DeltaSol BS Plus header") {
    const uint8_t header[] = {0x10, 0x00, 0x21, 0x42, 0x10, 0x00, 0x01, 0x07};
    CHECK(vbus_checksum(header, sizeof(header)) == 0x74);
    CHECK(vbus_checksum(header, 0) == 0x7F);
}

TEST_CASE("septet: high bits move into the septet byte and back") {
    const uint8_t data[4] = {0x64, 0x80, 0xFA, 0x7F};
    uint8_t wire[4] = {};
    const uint8_t septet = septet_encode(data, 4, wire);

    CHECK(septet == 0x06);
    CHECK(wire[0] == 0x64);
    CHECK(wire[1] == 0x00);
    CHECK(wire[2] == 0x7A);
    CHECK(wire[3] == 0x7F);

    uint8_t back[4] = {};
    septet_decode(wire, 4, septet, back);
    CHECK(std::vector<uint8_t>(back, back + 4) == std::vector<uint8_t>(data, data + 4));
}

TEST_CASE("build_frame: packet wire layout") {
    const auto wire = speed_temp_packet();
    const std::vector<uint8_t> expected = {
        0xAA, 0x02, 0x00, 0x01, 0x00, 0x10, 0x00, 0x01, 0x01, 0x6A,
        0x64, 0x00, 0x7A, 0x00, 0x04, 0x1D,
    };
    CHECK(wire == expected);
    CHECK(to_hex(wire).substr(0, 4) == "AA02");
}

TEST_CASE("parse_frame: synthetic frames decode to their payload") {
    SECTION("packet, payload padded to whole groups") {
        const std::vector<uint8_t> payload = {0xFF, 0x80, 0x01, 0xAA, 0x55, 0x00};
        const auto wire = make_packet(0x4221, 0x0010, 0x0100, payload);
        REQUIRE(wire.size() == kPacketHeaderBytes + 2 * kPacketFrameBytes);

        Frame f;
        REQUIRE(parse_frame(wire.data(), wire.size(), f) == FrameError::None);
        CHECK(f.source_id == 0x4221);
        CHECK(f.destination_id == 0x0010);
        CHECK(f.command_id == 0x0100);
        CHECK(f.wire_length == wire.size());
        const std::vector<uint8_t> padded = {0xFF, 0x80, 0x01, 0xAA, 0x55, 0x00, 0x00, 0x00};
        CHECK(f.payload == padded);
    }
    SECTION("datagram") {
        const std::vector<uint8_t> payload = {0x34, 0x12, 0xEF, 0xBE, 0xAD, 0xDE};
        const auto wire = make_packet(0x7E11, 0x0020, 0x0300, payload, kVersionDatagram);
        REQUIRE(wire.size() == kDatagramBytes);

        Frame f;
        REQUIRE(parse_frame(wire.data(), wire.size(), f) == FrameError::None);
        CHECK(f.is_datagram());
        CHECK(f.command_id == 0x0300);
        CHECK(f.payload == payload);
    }
    SECTION("telegram") {
        const std::vector<uint8_t> payload = {1, 2, 3, 0x84, 5, 6, 0xF7, 8};
        const auto wire = make_packet(0x7E11, 0x0010, 0x05, payload, kVersionTelegram);
        REQUIRE(wire.size() == kTelegramHeaderBytes + 2 * kTelegramFrameBytes);

        Frame f;
        REQUIRE(parse_frame(wire.data(), wire.size(), f) == FrameError::None);
        CHECK(f.command_id == 0x05);
        REQUIRE(f.payload.size() == 14);
        CHECK(std::vector<uint8_t>(f.payload.begin(), f.payload.begin() + 8) == payload);
    }
}

TEST_CASE("parse_frame: rejections") {
    auto wire = make_packet(1, 2, 0x0100, {0x64, 0x00, 0xFA, 0x00, 0x11, 0x22, 0x33, 0x44});
    Frame f;

    SECTION("header checksum") {
        wire[9] ^= 0x01;
        CHECK(parse_frame(wire.data(), wire.size(), f) == FrameError::ChecksumMismatch);
    }
    SECTION("group checksum") {
        wire[kPacketHeaderBytes + kPacketFrameBytes - 1] ^= 0x01;
        CHECK(parse_frame(wire.data(), wire.size(), f) == FrameError::ChecksumMismatch);
    }
    SECTION("septet bits beyond the group width") {
        wire[kPacketHeaderBytes + 4] |= 0x10;
        CHECK(parse_frame(wire.data(), wire.size(), f) == FrameError::MalformedSeptetGroup);
    }
    SECTION("high bit inside a group") {
        wire[kPacketHeaderBytes + 1] |= 0x80;
        CHECK(parse_frame(wire.data(), wire.size(), f) == FrameError::MalformedSeptetGroup);
    }
    SECTION("high bit inside the header") {
        wire[3] = 0x81;
        CHECK(parse_frame(wire.data(), wire.size(), f) == FrameError::MalformedHeader);
    }
    SECTION("unsupported version") {
        wire[5] = 0x50;
        CHECK(parse_frame(wire.data(), wire.size(), f) == FrameError::UnsupportedVersion);
    }
    SECTION("next sync byte before the declared length") {
        std::vector<uint8_t> cut(wire.begin(), wire.begin() + kPacketHeaderBytes + kPacketFrameBytes);
        append_bytes(cut, speed_temp_packet());
        CHECK(parse_frame(cut.data(), cut.size(), f) == FrameError::HeaderLengthMismatch);
    }
    SECTION("frame continues past the available bytes") {
        CHECK(parse_frame(wire.data(), 4, f) == FrameError::Truncated);
        CHECK(parse_frame(wire.data(), wire.size() - 1, f) == FrameError::Truncated);
    }
}
