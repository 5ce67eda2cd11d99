#include "vbus_codec.hpp"
#include <iomanip>
#include <sstream>

namespace vbl {

const char* to_string(FrameError e) {
    switch (e) {
    case FrameError::None:                 return "none";
    case FrameError::Truncated:            return "truncated";
    case FrameError::MalformedHeader:      return "malformed header";
    case FrameError::UnsupportedVersion:   return "unsupported version";
    case FrameError::HeaderLengthMismatch: return "header length mismatch";
    case FrameError::MalformedSeptetGroup: return "malformed septet group";
    case FrameError::ChecksumMismatch:     return "checksum mismatch";
    }
    return "unknown";
}

size_t septet_group_width(uint8_t version) {
    switch (version & 0xF0) {
    case kVersionPacket:   return 4;
    case kVersionDatagram: return 6;
    case kVersionTelegram: return 7;
    default:               return 0;
    }
}

uint8_t vbus_checksum(const uint8_t* data, size_t len) {
    uint8_t crc = 0x7F;
    for (size_t i = 0; i < len; ++i) {
        crc = static_cast<uint8_t>((crc - data[i]) & 0x7F);
    }
    return crc;
}

void septet_decode(const uint8_t* wire, size_t width, uint8_t septet, uint8_t* out) {
    for (size_t k = 0; k < width; ++k) {
        out[k] = static_cast<uint8_t>((wire[k] & 0x7F) | (((septet >> k) & 0x01) << 7));
    }
}

uint8_t septet_encode(const uint8_t* data, size_t width, uint8_t* out) {
    uint8_t septet = 0;
    for (size_t k = 0; k < width; ++k) {
        if (data[k] & 0x80) septet |= static_cast<uint8_t>(1u << k);
        out[k] = data[k] & 0x7F;
    }
    return septet;
}

// ------------------ builder ------------------
static void put_u16_le(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

// Append one group (data bytes, septet, checksum over both).
static void put_group(std::vector<uint8_t>& out, const uint8_t* data, size_t width) {
    const size_t start = out.size();
    out.resize(start + width);
    const uint8_t septet = septet_encode(data, width, &out[start]);
    out.push_back(septet);
    out.push_back(vbus_checksum(&out[start], width + 1));
}

std::vector<uint8_t> build_frame(const Frame& frame) {
    const size_t width = septet_group_width(frame.protocol_version);
    std::vector<uint8_t> out;
    if (width == 0) return out;

    out.push_back(kSyncByte);
    put_u16_le(out, frame.destination_id);
    put_u16_le(out, frame.source_id);
    out.push_back(frame.protocol_version);

    std::vector<uint8_t> data = frame.payload;

    switch (frame.protocol_version & 0xF0) {
    case kVersionPacket: {
        const size_t frames = (data.size() + width - 1) / width;
        data.resize(frames * width, 0);
        put_u16_le(out, frame.command_id);
        out.push_back(static_cast<uint8_t>(frames & 0x7F));
        out.push_back(vbus_checksum(&out[1], 8));
        for (size_t f = 0; f < frames; ++f) put_group(out, &data[f * width], width);
        break;
    }
    case kVersionDatagram: {
        data.resize(width, 0);
        put_u16_le(out, frame.command_id);
        // The datagram checksum covers the whole frame after the sync byte.
        const size_t start = out.size();
        out.resize(start + width);
        const uint8_t septet = septet_encode(data.data(), width, &out[start]);
        out.push_back(septet);
        out.push_back(vbus_checksum(&out[1], out.size() - 1));
        break;
    }
    case kVersionTelegram: {
        const size_t frames = (data.size() + width - 1) / width;
        data.resize(frames * width, 0);
        out.push_back(static_cast<uint8_t>((frame.command_id & 0x1F) | ((frames & 0x03) << 5)));
        out.push_back(vbus_checksum(&out[1], 6));
        for (size_t f = 0; f < frames; ++f) put_group(out, &data[f * width], width);
        break;
    }
    }
    return out;
}

std::string to_hex(const std::vector<uint8_t>& bytes) {
    std::ostringstream os;
    os << std::uppercase << std::hex << std::setfill('0');
    for (uint8_t b : bytes) os << std::setw(2) << static_cast<unsigned>(b);
    return os.str();
}

} // namespace vbl
