#pragma once
#include "spec_table.hpp"
#include "vbus_codec.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace vbl {

struct ResolvedField {
    const FieldDescriptor* descriptor = nullptr;
    int64_t raw_value = 0;
    double scaled_value = 0.0;   // raw_value * scale_factor + value_offset

    const std::string& label() const { return descriptor->label; }
    const std::string& unit_label() const { return descriptor->unit_label; }
};

struct Resolution {
    const MessageSpec* spec = nullptr;   // null: unrecognized command
    std::vector<ResolvedField> fields;
    size_t skipped = 0;                  // descriptors past the end of the payload

    bool recognized() const { return spec != nullptr; }
};

// Maps frames to field values using a specification table.
class FieldResolver {
public:
    explicit FieldResolver(const SpecificationTable& table) : table_(table) {}

    Resolution resolve(const Frame& frame) const;

private:
    const SpecificationTable& table_;
};

} // namespace vbl
