#pragma once
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace vbl {

// (source, destination) addresses of the module that produced a frame.
struct DevicePair {
    uint16_t source_id = 0;
    uint16_t destination_id = 0;

    bool operator==(const DevicePair& o) const {
        return source_id == o.source_id && destination_id == o.destination_id;
    }
    bool operator<(const DevicePair& o) const {
        return std::tie(source_id, destination_id) < std::tie(o.source_id, o.destination_id);
    }
};

enum class ColumnKind {
    Field,   // resolved field value
    Raw,     // hex payload of an unrecognized command
};

struct Column {
    ColumnKind kind = ColumnKind::Field;
    uint16_t command_id = 0;
    uint16_t byte_offset = 0;
    std::string label;
    std::string unit;
    int precision = 0;

    bool same_as(const Column& o) const {
        return kind == o.kind && command_id == o.command_id && label == o.label;
    }
};

struct Schema {
    std::vector<Column> columns;

    // Index of the matching column, or -1.
    int index_of(const Column& c) const {
        for (size_t i = 0; i < columns.size(); ++i)
            if (columns[i].same_as(c)) return static_cast<int>(i);
        return -1;
    }
};

struct Cell {
    enum class Kind { Empty, Number, Text };
    Kind kind = Kind::Empty;
    double number = 0.0;
    std::string text;
};

// One output row, cells aligned to the pair's schema.
struct Record {
    DevicePair pair;
    int64_t timestamp_ms = 0;
    uint64_t cycle_index = 0;
    std::vector<Cell> cells;
};

} // namespace vbl
