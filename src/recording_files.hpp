#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vbl {

// Calendar date (and optional time) of a recording, as named by the appliance.
struct Datecode {
    int year = 1970;
    int month = 1;     // 1..12
    int day = 1;       // 1..31
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// "YYYYMMDD" or "YYYYMMDDHHMMSS". Rejects dates that do not exist (20240231).
bool parse_datecode(const std::string& s, Datecode& out);

// Leading "YYYYMMDD" of a file name such as 20240131_packets.vbus.
bool datecode_from_filename(const std::string& path, Datecode& out);

// The datecode read as UTC, in milliseconds since the epoch.
int64_t utc_ms(const Datecode& d);

// First and last millisecond of the calendar day of `d`, either the UTC day
// or the day in the process time zone (TZ). Local days may be 23 or 25 hours.
void day_window(const Datecode& d, bool local_time, int64_t& first_ms, int64_t& last_ms);

// Stem of the output files written for one input (file name without extension).
std::string output_stem(const std::string& path);

// Stems shared by more than one input, each listed once.
std::vector<std::string> duplicate_stems(const std::vector<std::string>& paths);

// Whether a TZ value names a zone this system can resolve. "UTC", POSIX rules
// such as "CET-1CEST,M3.5.0,M10.5.0/3" and tzdata names are accepted.
bool known_time_zone(const std::string& tz);

} // namespace vbl
