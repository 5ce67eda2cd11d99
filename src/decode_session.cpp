#include "decode_session.hpp"
#include <iomanip>
#include <sstream>

namespace vbl {

const char* to_string(SessionStatus s) {
    switch (s) {
    case SessionStatus::Ok:               return "ok";
    case SessionStatus::Truncated:        return "truncated";
    case SessionStatus::SinkWriteFailure: return "sink write failure";
    case SessionStatus::SchemaViolation:  return "schema violation";
    }
    return "unknown";
}

std::string describe(const DecodeSummary& s) {
    std::ostringstream os;
    os << "frames=" << s.frames_seen
       << " valid=" << s.frames_valid
       << " rejected=" << s.frames_rejected
       << " unrecognized=" << s.frames_unrecognized
       << " records=" << s.records_emitted;
    if (s.records_filtered) os << " filtered=" << s.records_filtered;
    if (s.datagrams_skipped) os << " datagrams=" << s.datagrams_skipped;
    if (s.truncated) os << " truncated=yes";
    if (s.status != SessionStatus::Ok) os << " status=\"" << to_string(s.status) << "\"";
    return os.str();
}

static std::string hex16(uint16_t v) {
    std::ostringstream os;
    os << "0x" << std::uppercase << std::hex << std::setw(4) << std::setfill('0') << v;
    return os.str();
}

DecodeSession::DecodeSession(const SpecificationTable& table, SinkProvider& sinks, SessionConfig config)
    : config_(std::move(config)),
      sinks_(sinks),
      sync_(reservoir_),
      resolver_(table),
      assembler_(config_.cycle_rule, config_.start_time_ms, config_.interval_ms) {}

SessionStatus DecodeSession::feed(const uint8_t* data, size_t size) {
    if (finished_ || summary_.failed()) return summary_.status;
    reservoir_.append(data, size);
    pump();
    return summary_.status;
}

const DecodeSummary& DecodeSession::finish() {
    if (finished_) return summary_;
    finished_ = true;
    if (summary_.failed()) return summary_;

    reservoir_.close();
    pump();
    if (!summary_.failed()) {
        assembler_.flush(pending_);
        emit(pending_);
    }
    update_counters();
    if (summary_.truncated && !summary_.failed()) summary_.status = SessionStatus::Truncated;
    return summary_;
}

const DecodeSummary& DecodeSession::convert(const std::vector<uint8_t>& bytes) {
    feed(bytes);
    return finish();
}

void DecodeSession::pump() {
    Frame frame;
    while (!summary_.failed()) {
        const SyncResult r = sync_.next(frame);
        switch (r.status) {
        case SyncStatus::Frame:
            handle_frame(frame);
            break;
        case SyncStatus::Rejected:
            if (log_ && config_.verbose)
                *log_ << "rejected frame at offset " << r.offset << ": " << to_string(r.error) << "\n";
            break;
        case SyncStatus::Truncated:
            summary_.truncated = true;
            if (log_) *log_ << "recording truncated inside frame at offset " << r.offset << "\n";
            update_counters();
            return;
        case SyncStatus::NeedMoreData:
        case SyncStatus::EndOfStream:
            update_counters();
            return;
        }
    }
    update_counters();
}

void DecodeSession::handle_frame(const Frame& frame) {
    if (frame.is_datagram() && !config_.include_datagrams) {
        ++summary_.datagrams_skipped;
        if (observer_) observer_(frame, Resolution{});
        return;
    }

    const Resolution res = resolver_.resolve(frame);
    if (!res.recognized()) {
        ++summary_.frames_unrecognized;
        const uint64_t key = SpecKey{frame.source_id, frame.destination_id, frame.command_id}.message_id();
        if (log_ && unrecognized_logged_.insert(key).second) {
            *log_ << "unrecognized command " << hex16(frame.command_id)
                  << " src=" << hex16(frame.source_id)
                  << " dst=" << hex16(frame.destination_id)
                  << " offset=" << frame.frame_offset
                  << " payload=" << to_hex(frame.payload) << "\n";
        }
    }
    if (observer_) observer_(frame, res);

    assembler_.add(frame, res, pending_);
    emit(pending_);
}

void DecodeSession::emit(std::vector<Record>& records) {
    for (const Record& rec : records) {
        if (summary_.failed()) break;
        if ((config_.min_time_ms && rec.timestamp_ms < *config_.min_time_ms) ||
            (config_.max_time_ms && rec.timestamp_ms > *config_.max_time_ms)) {
            ++summary_.records_filtered;
            continue;
        }

        auto it = writers_.find(rec.pair);
        if (it == writers_.end()) {
            const Schema* schema = assembler_.schema(rec.pair);
            if (!schema) {
                fail(SessionStatus::SchemaViolation, "record emitted before its schema was frozen");
                break;
            }
            const SinkHandle h = sinks_.open(rec.pair, header_line(*schema, config_.writer));
            if (h.status == OpenStatus::HeaderMismatch) {
                fail(SessionStatus::SchemaViolation, h.error);
                break;
            }
            if (h.status != OpenStatus::Ok || !h.sink) {
                fail(SessionStatus::SinkWriteFailure, h.error);
                break;
            }
            auto writer = std::make_unique<TabularWriter>(*h.sink, *schema, config_.writer);
            if (!h.header_present && writer->write_header() != WriteStatus::Ok) {
                fail(SessionStatus::SinkWriteFailure, "failed to write header");
                break;
            }
            it = writers_.emplace(rec.pair, std::move(writer)).first;
        }

        const WriteStatus ws = it->second->write_record(rec);
        if (ws == WriteStatus::SinkWriteFailure) {
            fail(SessionStatus::SinkWriteFailure, "failed to write row");
            break;
        }
        if (ws == WriteStatus::SchemaViolation) {
            fail(SessionStatus::SchemaViolation, "row does not match the frozen schema");
            break;
        }
        ++summary_.records_emitted;
    }
    records.clear();
}

void DecodeSession::fail(SessionStatus status, const std::string& message) {
    summary_.status = status;
    summary_.message = message;
    if (log_) *log_ << to_string(status) << ": " << message << "\n";
}

void DecodeSession::update_counters() {
    const SyncCounters& c = sync_.counters();
    summary_.frames_valid = c.frames_valid;
    summary_.frames_rejected = c.corruption;
    summary_.bytes_skipped = c.skipped_bytes;
    summary_.rejected_by_error = c.by_error;
    summary_.frames_seen = c.frames_valid + c.corruption + (summary_.truncated ? 1 : 0);
    summary_.fields_dropped = assembler_.fields_dropped();
}

} // namespace vbl
