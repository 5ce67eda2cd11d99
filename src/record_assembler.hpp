#pragma once
#include "field_resolver.hpp"
#include "record.hpp"
#include "vbus_codec.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace vbl {

// ---------- Cycle boundary rules ----------
// Decides where one sampling cycle of a device pair ends. `open` holds the
// commands already collected in the current cycle, in arrival order.
class CycleRule {
public:
    virtual ~CycleRule() = default;

    // The frame belongs to the next cycle; the open one closes first.
    virtual bool starts_new_cycle(const std::vector<uint16_t>& open, const Frame& frame) const = 0;

    // The open cycle is complete after its latest frame.
    virtual bool completes_cycle(const std::vector<uint16_t>& /*open*/) const { return false; }

    // A closed cycle holds a whole sampling cycle. False for the fragment a
    // recording starts with when it begins mid-cycle.
    virtual bool is_complete(const std::vector<uint16_t>& /*closed*/) const { return true; }
};

// A command seen twice marks the start of the next cycle.
class RepeatedCommandRule : public CycleRule {
public:
    bool starts_new_cycle(const std::vector<uint16_t>& open, const Frame& frame) const override;
};

// A fixed leading command marks the start of every cycle.
class LeadCommandRule : public CycleRule {
public:
    explicit LeadCommandRule(uint16_t command) : command_(command) {}
    bool starts_new_cycle(const std::vector<uint16_t>& open, const Frame& frame) const override;
    bool is_complete(const std::vector<uint16_t>& closed) const override;

private:
    uint16_t command_;
};

// Every cycle holds exactly n frames.
class FixedCountRule : public CycleRule {
public:
    explicit FixedCountRule(size_t frames) : frames_(frames == 0 ? 1 : frames) {}
    bool starts_new_cycle(const std::vector<uint16_t>& open, const Frame& frame) const override;
    bool completes_cycle(const std::vector<uint16_t>& open) const override;

private:
    size_t frames_;
};

// Parse "repeat", "count:N" or "lead:0xCMD". Null with *err set on bad input.
std::shared_ptr<const CycleRule> make_cycle_rule(const std::string& spec, std::string* err = nullptr);

// ---------- Assembler ----------
enum class SchemaState {
    Discovering,
    Frozen,
};

// Groups resolved frames into one record per device pair and sampling cycle.
// The first complete cycle of a pair fixes its schema. Incomplete cycles
// before it are held back and emitted under that schema.
class RecordAssembler {
public:
    RecordAssembler(std::shared_ptr<const CycleRule> rule, int64_t start_time_ms, int64_t interval_ms);

    // Closed cycles are appended to `out`.
    void add(const Frame& frame, const Resolution& res, std::vector<Record>& out);

    // Close every open cycle, pairs in order of first observation.
    void flush(std::vector<Record>& out);

    const Schema* schema(const DevicePair& pair) const;
    SchemaState state(const DevicePair& pair) const;
    uint64_t fields_dropped() const { return fields_dropped_; }

private:
    struct OpenValue {
        Column column;
        Cell cell;
    };

    struct HeldCycle {
        uint64_t cycle_index = 0;
        std::vector<OpenValue> values;
    };

    struct PairState {
        DevicePair pair;
        SchemaState state = SchemaState::Discovering;
        Schema schema;
        uint64_t cycle_index = 0;
        std::vector<uint16_t> commands;
        std::vector<OpenValue> values;
        std::vector<HeldCycle> held;   // incomplete cycles seen while discovering
    };

    static void put_value(std::vector<OpenValue>& values, Column column, Cell cell);
    PairState& state_for(const DevicePair& pair);
    void close_cycle(PairState& ps, std::vector<Record>& out, bool at_end);
    void freeze_schema(PairState& ps);
    Record make_record(const PairState& ps, uint64_t cycle_index, std::vector<OpenValue>& values);

    std::shared_ptr<const CycleRule> rule_;
    int64_t start_time_ms_;
    int64_t interval_ms_;
    std::vector<PairState> pairs_;
    std::map<DevicePair, size_t> index_;
    uint64_t fields_dropped_ = 0;
};

} // namespace vbl
