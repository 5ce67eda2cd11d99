#include "recording_files.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <map>

namespace fs = std::filesystem;

namespace vbl {

// ------------------ helpers ------------------
static std::tm to_tm(const Datecode& d) {
    std::tm tm{};
    tm.tm_year = d.year - 1900;
    tm.tm_mon = d.month - 1;
    tm.tm_mday = d.day;
    tm.tm_hour = d.hour;
    tm.tm_min = d.minute;
    tm.tm_sec = d.second;
    return tm;
}

static int two_digits(const std::string& s, size_t at) {
    return (s[at] - '0') * 10 + (s[at + 1] - '0');
}

// ------------------ datecodes ------------------
bool parse_datecode(const std::string& s, Datecode& out) {
    if (s.size() != 8 && s.size() != 14) return false;
    if (!std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); })) return false;

    Datecode d;
    d.year = two_digits(s, 0) * 100 + two_digits(s, 2);
    d.month = two_digits(s, 4);
    d.day = two_digits(s, 6);
    if (s.size() == 14) {
        d.hour = two_digits(s, 8);
        d.minute = two_digits(s, 10);
        d.second = two_digits(s, 12);
    }

    // timegm normalizes out-of-range fields; a real date survives unchanged.
    std::tm tm = to_tm(d);
    const std::time_t t = timegm(&tm);
    std::tm back{};
    gmtime_r(&t, &back);
    if (back.tm_year != d.year - 1900 || back.tm_mon != d.month - 1 || back.tm_mday != d.day ||
        back.tm_hour != d.hour || back.tm_min != d.minute || back.tm_sec != d.second)
        return false;

    out = d;
    return true;
}

bool datecode_from_filename(const std::string& path, Datecode& out) {
    const std::string name = fs::path(path).filename().string();
    return name.size() >= 8 && parse_datecode(name.substr(0, 8), out);
}

int64_t utc_ms(const Datecode& d) {
    std::tm tm = to_tm(d);
    return static_cast<int64_t>(timegm(&tm)) * 1000;
}

void day_window(const Datecode& d, bool local_time, int64_t& first_ms, int64_t& last_ms) {
    Datecode midnight = d;
    midnight.hour = midnight.minute = midnight.second = 0;

    std::tm begin = to_tm(midnight);
    std::tm next = begin;
    next.tm_mday += 1;

    std::time_t b, n;
    if (local_time) {
        begin.tm_isdst = -1;
        next.tm_isdst = -1;
        b = std::mktime(&begin);
        n = std::mktime(&next);
    } else {
        b = timegm(&begin);
        n = timegm(&next);
    }
    first_ms = static_cast<int64_t>(b) * 1000;
    last_ms = static_cast<int64_t>(n) * 1000 - 1;
}

// ------------------ outputs ------------------
std::string output_stem(const std::string& path) {
    return fs::path(path).stem().string();
}

std::vector<std::string> duplicate_stems(const std::vector<std::string>& paths) {
    std::map<std::string, int> count;
    std::vector<std::string> dups;
    for (const auto& p : paths) {
        if (++count[output_stem(p)] == 2) dups.push_back(output_stem(p));
    }
    return dups;
}

bool known_time_zone(const std::string& tz) {
    if (tz.empty()) return false;
    if (tz == "UTC") return true;
    if (std::any_of(tz.begin(), tz.end(), [](unsigned char c) { return std::isdigit(c); })) return true;

    const std::string name = tz[0] == ':' ? tz.substr(1) : tz;
    if (name.empty() || name[0] == '/' || name.find("..") != std::string::npos) return false;
    const char* dir = std::getenv("TZDIR");
    std::error_code ec;
    return fs::is_regular_file(fs::path(dir ? dir : "/usr/share/zoneinfo") / name, ec);
}

} // namespace vbl
