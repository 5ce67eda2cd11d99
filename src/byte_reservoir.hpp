#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace vbl {

// Resumable cursor over the bytes of one recording. Input may arrive whole or
// in chunks; close() marks the end of the file.
class ByteReservoir {
public:
    void append(const uint8_t* data, size_t size);
    void append(const std::vector<uint8_t>& data) { append(data.data(), data.size()); }
    void close() { closed_ = true; }

    // Pointer to the next n bytes, or nullptr when fewer than n remain.
    // Valid until the next append() or consume().
    const uint8_t* peek(size_t n) const;

    // Advance by n bytes; false (and no movement) when fewer than n remain.
    bool consume(size_t n);

    uint64_t position() const { return base_ + cursor_; }
    size_t remaining() const { return buffer_.size() - cursor_; }
    bool closed() const { return closed_; }
    bool exhausted() const { return closed_ && remaining() == 0; }

private:
    void compact();

    std::vector<uint8_t> buffer_;
    size_t cursor_ = 0;   // index into buffer_
    uint64_t base_ = 0;   // absolute offset of buffer_[0]
    bool closed_ = false;
};

} // namespace vbl
