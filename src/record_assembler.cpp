#include "record_assembler.hpp"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace vbl {

// ------------------ cycle rules ------------------
bool RepeatedCommandRule::starts_new_cycle(const std::vector<uint16_t>& open, const Frame& frame) const {
    return std::find(open.begin(), open.end(), frame.command_id) != open.end();
}

bool LeadCommandRule::starts_new_cycle(const std::vector<uint16_t>& open, const Frame& frame) const {
    return frame.command_id == command_ && !open.empty();
}

bool LeadCommandRule::is_complete(const std::vector<uint16_t>& closed) const {
    return !closed.empty() && closed.front() == command_;
}

bool FixedCountRule::starts_new_cycle(const std::vector<uint16_t>& open, const Frame& /*frame*/) const {
    return open.size() >= frames_;
}

bool FixedCountRule::completes_cycle(const std::vector<uint16_t>& open) const {
    return open.size() >= frames_;
}

std::shared_ptr<const CycleRule> make_cycle_rule(const std::string& spec, std::string* err) {
    if (spec == "repeat") return std::make_shared<RepeatedCommandRule>();

    const auto colon = spec.find(':');
    const std::string kind = spec.substr(0, colon);
    const std::string arg = colon == std::string::npos ? std::string() : spec.substr(colon + 1);
    try {
        if (kind == "count" && !arg.empty()) {
            const unsigned long n = std::stoul(arg, nullptr, 10);
            if (n > 0) return std::make_shared<FixedCountRule>(n);
        } else if (kind == "lead" && !arg.empty()) {
            const unsigned long cmd = std::stoul(arg, nullptr, 0);
            if (cmd <= 0xFFFF) return std::make_shared<LeadCommandRule>(static_cast<uint16_t>(cmd));
        }
    } catch (const std::logic_error&) {
        // fall through to the error below
    }
    if (err) *err = "Invalid cycle rule '" + spec + "' (expected repeat, count:N or lead:0xCMD)";
    return nullptr;
}

// ------------------ assembler ------------------
RecordAssembler::RecordAssembler(std::shared_ptr<const CycleRule> rule, int64_t start_time_ms,
                                 int64_t interval_ms)
    : rule_(rule ? std::move(rule) : std::make_shared<RepeatedCommandRule>()),
      start_time_ms_(start_time_ms),
      interval_ms_(interval_ms) {}

RecordAssembler::PairState& RecordAssembler::state_for(const DevicePair& pair) {
    auto it = index_.find(pair);
    if (it != index_.end()) return pairs_[it->second];
    index_.emplace(pair, pairs_.size());
    pairs_.emplace_back();
    pairs_.back().pair = pair;
    return pairs_.back();
}

void RecordAssembler::add(const Frame& frame, const Resolution& res, std::vector<Record>& out) {
    PairState& ps = state_for(DevicePair{frame.source_id, frame.destination_id});

    if (!ps.commands.empty() && rule_->starts_new_cycle(ps.commands, frame)) close_cycle(ps, out, false);
    ps.commands.push_back(frame.command_id);

    if (res.recognized()) {
        for (const ResolvedField& rf : res.fields) {
            const FieldDescriptor& fd = *rf.descriptor;
            OpenValue v;
            v.column.kind = ColumnKind::Field;
            v.column.command_id = frame.command_id;
            v.column.byte_offset = fd.byte_offset;
            v.column.label = fd.label;
            v.column.unit = fd.unit_label;
            v.column.precision = fd.precision;
            v.cell.kind = Cell::Kind::Number;
            v.cell.number = rf.scaled_value;
            put_value(ps.values, std::move(v.column), std::move(v.cell));
        }
    } else {
        char label[16];
        std::snprintf(label, sizeof(label), "cmd_0x%04X", static_cast<unsigned>(frame.command_id));
        OpenValue v;
        v.column.kind = ColumnKind::Raw;
        v.column.command_id = frame.command_id;
        v.column.label = label;
        v.column.unit = "raw";
        v.cell.kind = Cell::Kind::Text;
        v.cell.text = to_hex(frame.payload);
        put_value(ps.values, std::move(v.column), std::move(v.cell));
    }

    if (rule_->completes_cycle(ps.commands)) close_cycle(ps, out, false);
}

// Later values of the same column within one cycle replace earlier ones.
void RecordAssembler::put_value(std::vector<OpenValue>& values, Column column, Cell cell) {
    for (auto& v : values) {
        if (v.column.same_as(column)) {
            v.cell = std::move(cell);
            return;
        }
    }
    values.push_back(OpenValue{std::move(column), std::move(cell)});
}

void RecordAssembler::close_cycle(PairState& ps, std::vector<Record>& out, bool at_end) {
    if (ps.state == SchemaState::Discovering) {
        if (ps.commands.empty() && ps.held.empty()) return;
        if (!at_end && !rule_->is_complete(ps.commands)) {
            ps.held.push_back(HeldCycle{ps.cycle_index, std::move(ps.values)});
            ++ps.cycle_index;
            ps.commands.clear();
            ps.values.clear();
            return;
        }
        freeze_schema(ps);
        for (auto& h : ps.held) out.push_back(make_record(ps, h.cycle_index, h.values));
        ps.held.clear();
    }
    if (ps.commands.empty()) return;

    out.push_back(make_record(ps, ps.cycle_index, ps.values));
    ++ps.cycle_index;
    ps.commands.clear();
    ps.values.clear();
}

// Columns of the held fragments and the closing cycle, deduplicated.
void RecordAssembler::freeze_schema(PairState& ps) {
    Schema seen;
    auto collect = [&seen](const std::vector<OpenValue>& values) {
        for (const auto& v : values)
            if (seen.index_of(v.column) < 0) seen.columns.push_back(v.column);
    };
    for (const auto& h : ps.held) collect(h.values);
    collect(ps.values);

    // Fields of a command by byte offset, its raw column (if any) last.
    std::stable_sort(seen.columns.begin(), seen.columns.end(), [](const Column& a, const Column& b) {
        if (a.command_id != b.command_id) return a.command_id < b.command_id;
        if (a.kind != b.kind) return a.kind == ColumnKind::Field;
        return a.byte_offset < b.byte_offset;
    });
    ps.schema = std::move(seen);
    ps.state = SchemaState::Frozen;
}

Record RecordAssembler::make_record(const PairState& ps, uint64_t cycle_index,
                                    std::vector<OpenValue>& values) {
    Record rec;
    rec.pair = ps.pair;
    rec.cycle_index = cycle_index;
    rec.timestamp_ms = start_time_ms_ + static_cast<int64_t>(cycle_index) * interval_ms_;
    rec.cells.resize(ps.schema.columns.size());
    for (auto& v : values) {
        const int idx = ps.schema.index_of(v.column);
        if (idx < 0) {
            ++fields_dropped_;
            continue;
        }
        rec.cells[static_cast<size_t>(idx)] = std::move(v.cell);
    }
    return rec;
}

void RecordAssembler::flush(std::vector<Record>& out) {
    for (auto& ps : pairs_) close_cycle(ps, out, true);
}

const Schema* RecordAssembler::schema(const DevicePair& pair) const {
    auto it = index_.find(pair);
    if (it == index_.end() || pairs_[it->second].state != SchemaState::Frozen) return nullptr;
    return &pairs_[it->second].schema;
}

SchemaState RecordAssembler::state(const DevicePair& pair) const {
    auto it = index_.find(pair);
    if (it == index_.end()) return SchemaState::Discovering;
    return pairs_[it->second].state;
}

} // namespace vbl
