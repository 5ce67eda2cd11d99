#include "src/decode_session.hpp"
#include "src/recording_files.hpp"
#include "src/spec_table.hpp"
#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

static constexpr size_t kChunkBytes = 64 * 1024;

static bool parse_delimiter(const std::string& s, char& out) {
    if (s == "tab" || s == "\\t" || s == "\t") { out = '\t'; return true; }
    if (s.size() != 1 || s[0] == '"' || s[0] == '\n' || s[0] == '\r') return false;
    out = s[0];
    return true;
}

struct FileResult {
    std::string path;
    bool ok = false;
    std::string report;
};

static FileResult convert_file(const std::string& path,
                               const vbl::SpecificationTable& table,
                               vbl::SessionConfig config,
                               std::optional<vbl::Datecode> start,
                               bool clip_day,
                               const std::string& out_dir,
                               bool append) {
    FileResult res;
    res.path = path;
    std::ostringstream log;

    // The appliance names its recordings after the UTC day: 20240131_packets.vbus
    vbl::Datecode date;
    if (start) {
        date = *start;
    } else if (!vbl::datecode_from_filename(path, date)) {
        log << "warning: no datecode in file name, timestamps start at the epoch\n";
    }
    config.start_time_ms = vbl::utc_ms(date);
    if (clip_day) {
        int64_t first = 0, last = 0;
        vbl::day_window(date, config.writer.local_time, first, last);
        config.min_time_ms = first;
        config.max_time_ms = last;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        log << "error: could not open " << path << "\n";
        res.report = log.str();
        return res;
    }

    vbl::FileSinkProvider sinks(out_dir, vbl::output_stem(path), append);
    vbl::DecodeSession session(table, sinks, config);
    session.set_log(&log);

    std::vector<uint8_t> chunk(kChunkBytes);
    while (in) {
        in.read(reinterpret_cast<char*>(chunk.data()), static_cast<std::streamsize>(chunk.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) break;
        session.feed(chunk.data(), static_cast<size_t>(got));
    }
    if (in.bad()) {
        log << "error: read failed for " << path << "\n";
        res.report = log.str();
        return res;
    }

    const vbl::DecodeSummary& summary = session.finish();
    log << vbl::describe(summary) << "\n";
    for (const auto& p : sinks.written_paths()) log << "  -> " << p << "\n";
    if (sinks.written_paths().empty() && !summary.failed())
        log << "  no rows, nothing written\n";

    res.ok = !summary.failed();
    res.report = log.str();
    return res;
}

int main(int argc, char** argv) {
    std::vector<std::string> files;
    std::string out_dir = ".";
    std::string spec_path;
    std::string start;
    double interval_s = 60.0;
    std::string cycle = "repeat";
    std::string delimiter = ",";
    std::string time_format = "%d.%m.%Y %H:%M:%S";
    std::string time_label = "timestamp";
    std::string time_zone = "UTC";
    bool clip_day = false, append = false, datagrams = false, verbose = false;
    unsigned jobs = 1;

    CLI::App app{"Convert VBus datalogger recordings to delimited text"};
    app.set_config("--config", "", "INI file with option defaults");

    app.add_option("files", files, "Recording files (e.g. 20240131_packets.vbus)")->required()->check(CLI::ExistingFile);
    app.add_option("--out-dir", out_dir, "Output directory")->capture_default_str();
    app.add_option("--spec", spec_path, "DBC specification table (default: built-in)")->check(CLI::ExistingFile);
    app.add_option("--start", start, "Start time YYYYMMDD[HHMMSS] UTC (default: from file name)");
    app.add_option("--interval", interval_s, "Sampling interval in seconds")->capture_default_str()->check(CLI::PositiveNumber);
    app.add_option("--cycle", cycle, "Cycle boundary rule: repeat|count:N|lead:0xCMD")->capture_default_str();
    app.add_option("--delimiter", delimiter, "Column delimiter (single character or 'tab')")->capture_default_str();
    app.add_option("--time-format", time_format, "strftime format of the timestamp column")->capture_default_str();
    app.add_option("--time-label", time_label, "Header of the timestamp column")->capture_default_str();
    app.add_option("--timezone", time_zone, "Time zone of timestamps and --clip-day (e.g. Europe/Berlin)")->capture_default_str();
    app.add_flag("--clip-day", clip_day, "Only write rows within the start day (in --timezone)");
    app.add_flag("--append", append, "Extend existing outputs whose header matches");
    app.add_flag("--datagrams", datagrams, "Include VBus 2.0 datagrams in the records");
    app.add_option("--jobs,-j", jobs, "Files converted in parallel")->capture_default_str()->check(CLI::Range(1u, 64u));
    app.add_flag("--verbose,-v", verbose, "Log every rejected frame");

    CLI11_PARSE(app, argc, argv);

    vbl::SessionConfig config;
    config.interval_ms = static_cast<int64_t>(interval_s * 1000.0 + 0.5);
    config.include_datagrams = datagrams;
    config.verbose = verbose;
    config.writer.timestamp_format = time_format;
    config.writer.timestamp_label = time_label;

    std::string err;
    config.cycle_rule = vbl::make_cycle_rule(cycle, &err);
    if (!config.cycle_rule) {
        std::cerr << err << "\n";
        return 2;
    }
    if (!parse_delimiter(delimiter, config.writer.delimiter)) {
        std::cerr << "Invalid delimiter '" << delimiter << "'\n";
        return 2;
    }
    std::optional<vbl::Datecode> start_date;
    if (!start.empty()) {
        vbl::Datecode d;
        if (!vbl::parse_datecode(start, d)) {
            std::cerr << "Invalid --start '" << start << "' (expected YYYYMMDD or YYYYMMDDHHMMSS)\n";
            return 2;
        }
        start_date = d;
    }
    if (!vbl::known_time_zone(time_zone)) {
        std::cerr << "Unknown --timezone '" << time_zone << "'\n";
        return 2;
    }
    if (time_zone != "UTC") {
        // Set once, before any worker formats a timestamp.
        setenv("TZ", time_zone.c_str(), 1);
        tzset();
        config.writer.local_time = true;
    }
    const std::vector<std::string> dups = vbl::duplicate_stems(files);
    if (!dups.empty()) {
        std::cerr << "Inputs share the output name '" << dups.front()
                  << "'; convert them in separate runs or into separate --out-dir\n";
        return 2;
    }

    std::error_code ec;
    fs::create_directories(out_dir, ec);
    if (ec) {
        std::cerr << "Could not create " << out_dir << ": " << ec.message() << "\n";
        return 1;
    }

    // One table for all sessions; it is never modified after loading.
    std::unique_ptr<vbl::SpecificationTable> table =
        spec_path.empty() ? vbl::load_builtin_specification(&err)
                          : vbl::SpecificationTable::from_file(spec_path, &err);
    if (!table) {
        std::cerr << "Specification load failed: " << err << "\n";
        return 1;
    }

    std::vector<FileResult> results(files.size());
    std::atomic<size_t> next{0};
    std::mutex out_mutex;

    auto worker = [&]() {
        for (size_t i = next++; i < files.size(); i = next++) {
            results[i] = convert_file(files[i], *table, config, start_date, clip_day, out_dir, append);
            std::lock_guard<std::mutex> lock(out_mutex);
            std::cout << files[i] << ": " << (results[i].ok ? "converted" : "FAILED") << "\n";
            std::cerr << results[i].report;
        }
    };

    const unsigned n = std::min<unsigned>(jobs, static_cast<unsigned>(files.size()));
    std::vector<std::thread> pool;
    for (unsigned t = 1; t < n; ++t) pool.emplace_back(worker);
    worker();
    for (auto& th : pool) th.join();

    const bool all_ok = std::all_of(results.begin(), results.end(), [](const FileResult& r) { return r.ok; });
    return all_ok ? 0 : 1;
}
