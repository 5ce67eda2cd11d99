#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace vbl {

constexpr uint8_t kSyncByte = 0xAA;

// Protocol version nibble (upper 4 bits of the version byte).
constexpr uint8_t kVersionPacket   = 0x10;   // 1.0: frames of 4 data bytes
constexpr uint8_t kVersionDatagram = 0x20;   // 2.0: one group of 6 data bytes
constexpr uint8_t kVersionTelegram = 0x30;   // 3.0: frames of 7 data bytes

constexpr size_t kPacketHeaderBytes   = 10;
constexpr size_t kPacketFrameBytes    = 6;   // 4 data + septet + checksum
constexpr size_t kDatagramBytes       = 16;
constexpr size_t kTelegramHeaderBytes = 8;
constexpr size_t kTelegramFrameBytes  = 9;   // 7 data + septet + checksum

enum class FrameError {
    None = 0,
    Truncated,
    MalformedHeader,
    UnsupportedVersion,
    HeaderLengthMismatch,
    MalformedSeptetGroup,
    ChecksumMismatch,
};

const char* to_string(FrameError e);

// ---------- Data model ----------
struct Frame {
    uint16_t destination_id = 0;
    uint16_t source_id = 0;
    uint8_t protocol_version = 0;
    uint16_t command_id = 0;
    std::vector<uint8_t> payload;   // decoded, 8-bit clean
    uint64_t frame_offset = 0;      // absolute position of the sync byte
    size_t wire_length = 0;         // sync byte .. last checksum byte

    bool is_datagram() const { return (protocol_version & 0xF0) == kVersionDatagram; }
};

// Group width (data bytes per septet) for a version byte, 0 if unsupported.
size_t septet_group_width(uint8_t version);

// ---------- Checksum ----------
// VBus checksum: 0x7F minus the byte sum, kept 7-bit clean.
uint8_t vbus_checksum(const uint8_t* data, size_t len);

// ---------- Septet coding ----------
// Restore the high bits of `width` data bytes from their septet byte.
void septet_decode(const uint8_t* wire, size_t width, uint8_t septet, uint8_t* out);

// Strip the high bits of `width` bytes into `out` and return the septet byte.
uint8_t septet_encode(const uint8_t* data, size_t width, uint8_t* out);

// ---------- Frame building ----------
// Serialize a frame to its wire form. Payloads of packets and telegrams are
// zero-padded to a whole number of groups; datagram payloads are exactly 6
// bytes (value id, value). Used for synthetic recordings and tests.
std::vector<uint8_t> build_frame(const Frame& frame);

// Uppercase hex, no separators.
std::string to_hex(const std::vector<uint8_t>& bytes);

} // namespace vbl
