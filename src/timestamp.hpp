#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace onthisday {

// Archive timestamps are nanoseconds since 2001-01-01T00:00:00 UTC.
constexpr int64_t kArchiveEpochOffset = 978307200;
constexpr double kNanosPerSecond = 1e9;
constexpr int64_t kNanosPerSecondInt = 1000000000;

// Archive nanoseconds -> Unix seconds. Absent for null or zero.
std::optional<double> from_archive_epoch(std::optional<int64_t> archive_ns);

// Unix seconds -> archive nanoseconds. Absent for absent input or for the
// archive origin itself (0 means "unset" in the store).
std::optional<int64_t> to_archive_epoch(std::optional<double> unix_seconds);

// ISO 8601 in local time, e.g. "2021-03-15T09:30:00" (microseconds appended
// when non-zero). Absent for absent input.
std::optional<std::string> to_local_iso(std::optional<double> unix_seconds);

// Local civil year of a Unix timestamp.
int local_year(double unix_seconds);

// Whole Unix seconds of an archive timestamp, truncated toward zero like the
// store's integer division, so results land on the same local day as the
// SQL date predicate.
int64_t archive_unix_seconds(int64_t archive_ns);

// Same as to_local_iso, read straight from archive nanoseconds. Sub-second
// digits are truncated to microseconds, never rounded into the next second.
std::optional<std::string> archive_to_local_iso(std::optional<int64_t> archive_ns);

// Local civil year of an archive timestamp, as the SQL predicate sees it.
int archive_local_year(int64_t archive_ns);

// "MM-DD", zero padded.
std::string month_day_key(int month, int day);

struct MonthDay {
    int month = 1;
    int day = 1;
};

// Current local calendar date.
MonthDay today();

} // namespace onthisday
