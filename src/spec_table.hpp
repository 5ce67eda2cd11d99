#pragma once
#include <dbcppp/Network.h>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace vbl {

// Lookup key of one message layout.
struct SpecKey {
    uint16_t source_id = 0;
    uint16_t destination_id = 0;
    uint16_t command_id = 0;

    // DBC message id: source << 32 | destination << 16 | command
    uint64_t message_id() const {
        return (uint64_t(source_id) << 32) | (uint64_t(destination_id) << 16) | command_id;
    }
    static SpecKey from_message_id(uint64_t id) {
        return SpecKey{static_cast<uint16_t>(id >> 32),
                       static_cast<uint16_t>(id >> 16),
                       static_cast<uint16_t>(id)};
    }
};

struct FieldDescriptor {
    std::string label;
    uint16_t byte_offset = 0;
    uint8_t byte_width = 1;      // 1..4
    bool is_signed = false;
    double scale_factor = 1.0;
    double value_offset = 0.0;
    std::string unit_label;
    int precision = 0;           // decimals needed to print one scale step
    const dbcppp::ISignal* signal = nullptr;

    bool fits(size_t payload_size) const { return size_t(byte_offset) + byte_width <= payload_size; }
};

struct MessageSpec {
    SpecKey key;
    std::string name;
    std::vector<FieldDescriptor> fields;   // ordered by byte offset
};

// Decimal digits needed to represent `step` exactly (0..6).
int decimals_for(double step);

// Immutable field-layout table built from DBC text. Safe to share between
// decode sessions running on different threads.
class SpecificationTable {
public:
    // Null on parse failure or on a signal layout the decoder cannot handle.
    static std::unique_ptr<SpecificationTable> from_dbc(std::istream& is, std::string* err = nullptr);
    static std::unique_ptr<SpecificationTable> from_string(const std::string& dbc, std::string* err = nullptr);
    static std::unique_ptr<SpecificationTable> from_file(const std::string& path, std::string* err = nullptr);

    const MessageSpec* find(const SpecKey& key) const;
    size_t size() const { return messages_.size(); }

private:
    SpecificationTable() = default;

    std::unique_ptr<dbcppp::INetwork> net_;
    std::unordered_map<uint64_t, MessageSpec> messages_;
};

// Table for the RESOL controllers known to this tool.
std::unique_ptr<SpecificationTable> load_builtin_specification(std::string* err = nullptr);

} // namespace vbl
