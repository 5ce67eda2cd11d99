#pragma once
#include "record.hpp"
#include "sink.hpp"
#include <cstdint>
#include <string>

namespace vbl {

struct WriterOptions {
    char delimiter = ',';
    std::string timestamp_label = "timestamp";
    std::string timestamp_format = "%d.%m.%Y %H:%M:%S";   // strftime
    bool local_time = false;   // render in the process time zone (TZ) instead of UTC
    std::string empty_cell;
};

enum class WriteStatus {
    Ok,
    SinkWriteFailure,
    SchemaViolation,   // row does not match the frozen schema
};

// "label[unit]", or "label" when the unit is empty.
std::string column_header(const Column& c);

// Fixed notation, '.' as decimal point regardless of the global locale.
std::string format_number(double value, int precision);

// Milliseconds since the epoch, formatted in UTC or in the process time zone.
std::string format_timestamp(int64_t ms, const std::string& format, bool local_time = false);

// Full header line of a schema, newline-terminated.
std::string header_line(const Schema& schema, const WriterOptions& opts);

// Emits the rows of one device pair. Rows are written in the order given and
// never rewritten, so an existing file can be extended while the schema holds.
class TabularWriter {
public:
    TabularWriter(TextSink& sink, Schema schema, WriterOptions opts);

    WriteStatus write_header();
    WriteStatus write_record(const Record& rec);

    const Schema& schema() const { return schema_; }
    uint64_t rows_written() const { return rows_; }

private:
    std::string format_cell(const Column& col, const Cell& cell) const;
    std::string quote(const std::string& cell) const;

    TextSink& sink_;
    Schema schema_;
    WriterOptions opts_;
    uint64_t rows_ = 0;
};

} // namespace vbl
