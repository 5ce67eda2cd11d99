#include "sink.hpp"
#include <cstdio>
#include <filesystem>
#include <memory>

namespace fs = std::filesystem;

namespace vbl {

bool StreamSink::write(const std::string& text) {
    os_.write(text.data(), static_cast<std::streamsize>(text.size()));
    return static_cast<bool>(os_);
}

// ------------------ memory ------------------
SinkHandle MemorySinkProvider::open(const DevicePair& pair, const std::string& /*header*/) {
    auto& entry = entries_[pair];
    if (!entry) {
        entry = std::make_unique<Entry>();
        entry->sink = std::make_unique<StreamSink>(entry->os);
    }
    SinkHandle h;
    h.status = OpenStatus::Ok;
    h.sink = entry->sink.get();
    return h;
}

std::string MemorySinkProvider::text(const DevicePair& pair) const {
    auto it = entries_.find(pair);
    if (it == entries_.end()) return {};
    return it->second->os.str();
}

std::vector<DevicePair> MemorySinkProvider::pairs() const {
    std::vector<DevicePair> out;
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

// ------------------ files ------------------
std::string FileSinkProvider::path_for(const DevicePair& pair) const {
    char suffix[32];
    std::snprintf(suffix, sizeof(suffix), "_%04X_%04X.csv",
                  static_cast<unsigned>(pair.source_id), static_cast<unsigned>(pair.destination_id));
    return (fs::path(dir_) / (stem_ + suffix)).string();
}

SinkHandle FileSinkProvider::open(const DevicePair& pair, const std::string& header) {
    SinkHandle h;
    const std::string path = path_for(pair);

    std::ios::openmode mode = std::ios::out | std::ios::binary | std::ios::trunc;
    std::error_code ec;
    if (append_ && fs::exists(path, ec) && fs::file_size(path, ec) > 0 && !ec) {
        std::ifstream existing(path, std::ios::binary);
        std::string first;
        std::getline(existing, first);
        if (first + "\n" != header) {
            h.status = OpenStatus::HeaderMismatch;
            h.error = "Existing header of " + path + " differs";
            return h;
        }
        mode = std::ios::out | std::ios::binary | std::ios::app;
        h.header_present = true;
    }

    auto entry = std::make_unique<Entry>();
    entry->file.open(path, mode);
    if (!entry->file) {
        h.status = OpenStatus::Failed;
        h.header_present = false;
        h.error = "Could not create " + path;
        return h;
    }
    entry->sink = std::make_unique<StreamSink>(entry->file);

    h.status = OpenStatus::Ok;
    h.sink = entry->sink.get();
    entries_[pair] = std::move(entry);
    paths_.push_back(path);
    return h;
}

} // namespace vbl
