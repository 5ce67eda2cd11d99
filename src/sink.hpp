#pragma once
#include "record.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace vbl {

// Destination of delimited text. write() returns false when the text could
// not be written; callers do not retry.
class TextSink {
public:
    virtual ~TextSink() = default;
    virtual bool write(const std::string& text) = 0;
};

class StreamSink : public TextSink {
public:
    explicit StreamSink(std::ostream& os) : os_(os) {}
    bool write(const std::string& text) override;

private:
    std::ostream& os_;
};

enum class OpenStatus {
    Ok,
    Failed,           // destination could not be opened
    HeaderMismatch,   // append target already holds a different schema
};

struct SinkHandle {
    OpenStatus status = OpenStatus::Failed;
    TextSink* sink = nullptr;     // owned by the provider
    bool header_present = false;  // destination already starts with this header
    std::string error;
};

// Hands out one sink per device pair. Called once per pair, when its first
// row is about to be written; `header` is the full header line.
class SinkProvider {
public:
    virtual ~SinkProvider() = default;
    virtual SinkHandle open(const DevicePair& pair, const std::string& header) = 0;
};

// Keeps every pair's output in memory.
class MemorySinkProvider : public SinkProvider {
public:
    SinkHandle open(const DevicePair& pair, const std::string& header) override;

    std::string text(const DevicePair& pair) const;
    std::vector<DevicePair> pairs() const;

private:
    struct Entry {
        std::ostringstream os;
        std::unique_ptr<StreamSink> sink;
    };
    std::map<DevicePair, std::unique_ptr<Entry>> entries_;
};

// Writes <dir>/<stem>_<SRC>_<DST>.csv per pair. In append mode an existing
// file is extended when its first line equals the header.
class FileSinkProvider : public SinkProvider {
public:
    FileSinkProvider(std::string dir, std::string stem, bool append)
        : dir_(std::move(dir)), stem_(std::move(stem)), append_(append) {}

    SinkHandle open(const DevicePair& pair, const std::string& header) override;

    std::string path_for(const DevicePair& pair) const;
    const std::vector<std::string>& written_paths() const { return paths_; }

private:
    struct Entry {
        std::ofstream file;
        std::unique_ptr<StreamSink> sink;
    };
    std::string dir_;
    std::string stem_;
    bool append_;
    std::map<DevicePair, std::unique_ptr<Entry>> entries_;
    std::vector<std::string> paths_;
};

} // namespace vbl
