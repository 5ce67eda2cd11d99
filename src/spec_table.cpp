#include "spec_table.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace vbl {

int decimals_for(double step) {
    double v = std::fabs(step);
    for (int d = 0; d < 6; ++d) {
        if (std::fabs(v - std::round(v)) < 1e-9 * std::max(1.0, v)) return d;
        v *= 10.0;
    }
    return 6;
}

// ------------------ loading ------------------
static bool make_descriptor(const dbcppp::IMessage& msg, const dbcppp::ISignal& sig,
                            FieldDescriptor& out, std::string* err) {
    auto fail = [&](const char* why) {
        if (err) *err = "Signal " + msg.Name() + "." + sig.Name() + ": " + why;
        return false;
    };
    if (sig.MultiplexerIndicator() != dbcppp::ISignal::EMultiplexer::NoMux)
        return fail("multiplexed signals are not supported");
    if (sig.ByteOrder() != dbcppp::ISignal::EByteOrder::LittleEndian)
        return fail("only little-endian (@1) signals are supported");
    if (sig.StartBit() % 8 != 0 || sig.BitSize() % 8 != 0)
        return fail("signal must be byte aligned");
    if (sig.BitSize() < 8 || sig.BitSize() > 32)
        return fail("signal width must be 1 to 4 bytes");

    out.label = sig.Name();
    out.byte_offset = static_cast<uint16_t>(sig.StartBit() / 8);
    out.byte_width = static_cast<uint8_t>(sig.BitSize() / 8);
    out.is_signed = sig.ValueType() == dbcppp::ISignal::EValueType::Signed;
    out.scale_factor = sig.Factor();
    out.value_offset = sig.Offset();
    out.unit_label = sig.Unit();
    out.precision = std::max(decimals_for(out.scale_factor), decimals_for(out.value_offset));
    out.signal = &sig;
    return true;
}

std::unique_ptr<SpecificationTable> SpecificationTable::from_dbc(std::istream& is, std::string* err) {
    std::unique_ptr<SpecificationTable> table(new SpecificationTable());
    table->net_ = dbcppp::INetwork::LoadDBCFromIs(is);
    if (!table->net_) {
        if (err) *err = "Failed to parse DBC specification";
        return nullptr;
    }

    for (const dbcppp::IMessage& msg : table->net_->Messages()) {
        MessageSpec spec;
        spec.key = SpecKey::from_message_id(msg.Id());
        spec.name = msg.Name();
        for (const dbcppp::ISignal& sig : msg.Signals()) {
            FieldDescriptor fd;
            if (!make_descriptor(msg, sig, fd, err)) return nullptr;
            spec.fields.push_back(std::move(fd));
        }
        std::stable_sort(spec.fields.begin(), spec.fields.end(),
                         [](const FieldDescriptor& a, const FieldDescriptor& b) {
                             return a.byte_offset < b.byte_offset;
                         });
        if (!table->messages_.emplace(msg.Id(), std::move(spec)).second) {
            if (err) *err = "Duplicate message id for " + msg.Name();
            return nullptr;
        }
    }

    if (err) *err = "";
    return table;
}

std::unique_ptr<SpecificationTable> SpecificationTable::from_string(const std::string& dbc, std::string* err) {
    std::istringstream is(dbc);
    return from_dbc(is, err);
}

std::unique_ptr<SpecificationTable> SpecificationTable::from_file(const std::string& path, std::string* err) {
    std::ifstream is(path);
    if (!is) {
        if (err) *err = "Failed to open " + path;
        return nullptr;
    }
    return from_dbc(is, err);
}

const MessageSpec* SpecificationTable::find(const SpecKey& key) const {
    auto it = messages_.find(key.message_id());
    if (it == messages_.end()) return nullptr;
    return &it->second;
}

} // namespace vbl
