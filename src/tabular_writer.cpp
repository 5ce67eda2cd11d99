#include "tabular_writer.hpp"
#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>
#include <utility>

namespace vbl {

std::string column_header(const Column& c) {
    if (c.unit.empty()) return c.label;
    return c.label + "[" + c.unit + "]";
}

std::string format_number(double value, int precision) {
    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

std::string format_timestamp(int64_t ms, const std::string& format, bool local_time) {
    int64_t secs = ms / 1000;
    if (ms % 1000 < 0) --secs;   // floor for times before the epoch
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
    if (local_time) localtime_r(&t, &tm);
    else gmtime_r(&t, &tm);

    std::ostringstream os;
    os.imbue(std::locale::classic());
    os << std::put_time(&tm, format.c_str());
    return os.str();
}

static std::string quote_cell(const std::string& cell, char delimiter) {
    if (cell.find_first_of(std::string(1, delimiter) + "\"\r\n") == std::string::npos) return cell;
    std::string out = "\"";
    for (char ch : cell) {
        if (ch == '"') out += '"';
        out += ch;
    }
    out += '"';
    return out;
}

std::string header_line(const Schema& schema, const WriterOptions& opts) {
    std::string line = quote_cell(opts.timestamp_label, opts.delimiter);
    for (const Column& c : schema.columns) {
        line += opts.delimiter;
        line += quote_cell(column_header(c), opts.delimiter);
    }
    line += '\n';
    return line;
}

TabularWriter::TabularWriter(TextSink& sink, Schema schema, WriterOptions opts)
    : sink_(sink), schema_(std::move(schema)), opts_(std::move(opts)) {}

WriteStatus TabularWriter::write_header() {
    return sink_.write(header_line(schema_, opts_)) ? WriteStatus::Ok : WriteStatus::SinkWriteFailure;
}

std::string TabularWriter::quote(const std::string& cell) const {
    return quote_cell(cell, opts_.delimiter);
}

std::string TabularWriter::format_cell(const Column& col, const Cell& cell) const {
    switch (cell.kind) {
    case Cell::Kind::Number: return format_number(cell.number, col.precision);
    case Cell::Kind::Text:   return quote(cell.text);
    case Cell::Kind::Empty:  break;
    }
    return opts_.empty_cell;
}

WriteStatus TabularWriter::write_record(const Record& rec) {
    if (rec.cells.size() != schema_.columns.size()) return WriteStatus::SchemaViolation;

    std::string line = quote(format_timestamp(rec.timestamp_ms, opts_.timestamp_format, opts_.local_time));
    for (size_t i = 0; i < rec.cells.size(); ++i) {
        line += opts_.delimiter;
        line += format_cell(schema_.columns[i], rec.cells[i]);
    }
    line += '\n';

    if (!sink_.write(line)) return WriteStatus::SinkWriteFailure;
    ++rows_;
    return WriteStatus::Ok;
}

} // namespace vbl
