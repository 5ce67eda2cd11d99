#include "field_resolver.hpp"
#include <algorithm>
#include <cstring>

namespace vbl {

// dbcppp reads whole 64-bit words around a signal, so the decode buffer
// carries zero padding behind the payload.
static constexpr size_t kDecodePadding = 16;

Resolution FieldResolver::resolve(const Frame& frame) const {
    Resolution res;
    res.spec = table_.find(SpecKey{frame.source_id, frame.destination_id, frame.command_id});
    if (!res.spec) return res;

    std::vector<uint8_t> buf(std::max<size_t>(frame.payload.size(), 8) + kDecodePadding, 0);
    if (!frame.payload.empty()) std::memcpy(buf.data(), frame.payload.data(), frame.payload.size());

    res.fields.reserve(res.spec->fields.size());
    for (const FieldDescriptor& fd : res.spec->fields) {
        // Older firmware sends shorter payloads than the table describes.
        if (!fd.fits(frame.payload.size())) {
            ++res.skipped;
            continue;
        }
        const auto raw = fd.signal->Decode(buf.data());
        ResolvedField rf;
        rf.descriptor = &fd;
        rf.raw_value = static_cast<int64_t>(raw);
        rf.scaled_value = fd.signal->RawToPhys(raw);
        res.fields.push_back(rf);
    }
    return res;
}

} // namespace vbl
