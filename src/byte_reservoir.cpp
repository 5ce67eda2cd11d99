#include "byte_reservoir.hpp"

namespace vbl {

// Drop the consumed prefix once it dominates the buffer.
static constexpr size_t kCompactThreshold = 64 * 1024;

void ByteReservoir::append(const uint8_t* data, size_t size) {
    if (size == 0) return;
    compact();
    buffer_.insert(buffer_.end(), data, data + size);
}

const uint8_t* ByteReservoir::peek(size_t n) const {
    if (n > remaining()) return nullptr;
    if (n == 0) return buffer_.data() + cursor_;
    return &buffer_[cursor_];
}

bool ByteReservoir::consume(size_t n) {
    if (n > remaining()) return false;
    cursor_ += n;
    return true;
}

void ByteReservoir::compact() {
    if (cursor_ == 0) return;
    if (cursor_ < kCompactThreshold && cursor_ * 2 < buffer_.size()) return;
    buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(cursor_));
    base_ += cursor_;
    cursor_ = 0;
}

} // namespace vbl
