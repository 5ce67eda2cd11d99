#pragma once
#include "byte_reservoir.hpp"
#include "field_resolver.hpp"
#include "frame_sync.hpp"
#include "record_assembler.hpp"
#include "sink.hpp"
#include "spec_table.hpp"
#include "tabular_writer.hpp"
#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace vbl {

enum class SessionStatus {
    Ok,
    Truncated,          // input ended mid-frame; everything before it was written
    SinkWriteFailure,
    SchemaViolation,
};

const char* to_string(SessionStatus s);

struct SessionConfig {
    int64_t start_time_ms = 0;
    int64_t interval_ms = 60000;
    std::shared_ptr<const CycleRule> cycle_rule;   // null: RepeatedCommandRule
    bool include_datagrams = false;
    std::optional<int64_t> min_time_ms;            // rows outside are not written
    std::optional<int64_t> max_time_ms;
    WriterOptions writer;
    bool verbose = false;                          // log every rejected frame
};

struct DecodeSummary {
    uint64_t frames_seen = 0;          // sync attempts that reached a verdict
    uint64_t frames_valid = 0;
    uint64_t frames_rejected = 0;      // corruption counter
    uint64_t frames_unrecognized = 0;
    uint64_t datagrams_skipped = 0;
    uint64_t bytes_skipped = 0;
    uint64_t records_emitted = 0;
    uint64_t records_filtered = 0;
    uint64_t fields_dropped = 0;
    std::array<uint64_t, 7> rejected_by_error{};
    bool truncated = false;
    SessionStatus status = SessionStatus::Ok;
    std::string message;

    uint64_t rejected(FrameError e) const { return rejected_by_error[static_cast<size_t>(e)]; }
    bool failed() const {
        return status == SessionStatus::SinkWriteFailure || status == SessionStatus::SchemaViolation;
    }
};

// One line: "frames=.. valid=.. rejected=.. unrecognized=.. records=.."
std::string describe(const DecodeSummary& s);

using FrameObserver = std::function<void(const Frame&, const Resolution&)>;

// Converts one recording file. Feed the bytes whole or in chunks, then call
// finish(). A session must not be reused for another file.
class DecodeSession {
public:
    DecodeSession(const SpecificationTable& table, SinkProvider& sinks, SessionConfig config = {});

    SessionStatus feed(const uint8_t* data, size_t size);
    SessionStatus feed(const std::vector<uint8_t>& data) { return feed(data.data(), data.size()); }

    // Flushes open cycles and completes the summary. Idempotent.
    const DecodeSummary& finish();

    // feed() + finish() over a whole file.
    const DecodeSummary& convert(const std::vector<uint8_t>& bytes);

    // Called for every valid frame, recognized or not, before assembly.
    void set_frame_observer(FrameObserver obs) { observer_ = std::move(obs); }
    void set_log(std::ostream* log) { log_ = log; }

    const DecodeSummary& summary() const { return summary_; }
    const Schema* schema(const DevicePair& pair) const { return assembler_.schema(pair); }

private:
    void pump();
    void handle_frame(const Frame& frame);
    void emit(std::vector<Record>& records);
    void fail(SessionStatus status, const std::string& message);
    void update_counters();

    SessionConfig config_;
    SinkProvider& sinks_;
    ByteReservoir reservoir_;
    FrameSynchronizer sync_;
    FieldResolver resolver_;
    RecordAssembler assembler_;
    std::map<DevicePair, std::unique_ptr<TabularWriter>> writers_;
    std::set<uint64_t> unrecognized_logged_;
    std::vector<Record> pending_;
    FrameObserver observer_;
    std::ostream* log_ = nullptr;
    DecodeSummary summary_;
    bool finished_ = false;
};

} // namespace vbl
