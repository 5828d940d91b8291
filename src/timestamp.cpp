#include "timestamp.hpp"

#include <cmath>
#include <cstdio>
#include <ctime>

namespace onthisday {

std::optional<double> from_archive_epoch(std::optional<int64_t> archive_ns) {
    if (!archive_ns || *archive_ns == 0) return std::nullopt;
    return static_cast<double>(*archive_ns) / kNanosPerSecond +
           static_cast<double>(kArchiveEpochOffset);
}

std::optional<int64_t> to_archive_epoch(std::optional<double> unix_seconds) {
    if (!unix_seconds) return std::nullopt;
    double ns = (*unix_seconds - static_cast<double>(kArchiveEpochOffset)) * kNanosPerSecond;
    auto value = static_cast<int64_t>(std::llround(ns));
    if (value == 0) return std::nullopt;
    return value;
}

static std::tm local_tm(std::time_t t) {
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    return tm_buf;
}

static std::string format_local(std::time_t whole, long micros) {
    std::tm tm_buf = local_tm(whole);
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    std::string out = buf;
    if (micros > 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%06ld", micros);
        out += frac;
    }
    return out;
}

std::optional<std::string> to_local_iso(std::optional<double> unix_seconds) {
    if (!unix_seconds) return std::nullopt;

    double whole = std::floor(*unix_seconds);
    auto micros = static_cast<long>(std::llround((*unix_seconds - whole) * 1e6));
    if (micros >= 1000000) {
        whole += 1.0;
        micros -= 1000000;
    }
    return format_local(static_cast<std::time_t>(whole), micros);
}

int local_year(double unix_seconds) {
    std::tm tm_buf = local_tm(static_cast<std::time_t>(std::floor(unix_seconds)));
    return tm_buf.tm_year + 1900;
}

int64_t archive_unix_seconds(int64_t archive_ns) {
    return archive_ns / kNanosPerSecondInt + kArchiveEpochOffset;
}

std::optional<std::string> archive_to_local_iso(std::optional<int64_t> archive_ns) {
    if (!archive_ns || *archive_ns == 0) return std::nullopt;
    // Before 2001 the remainder is negative; whole seconds stay truncated
    // and the fraction is dropped.
    int64_t rem = *archive_ns % kNanosPerSecondInt;
    long micros = rem > 0 ? static_cast<long>(rem / 1000) : 0;
    return format_local(static_cast<std::time_t>(archive_unix_seconds(*archive_ns)), micros);
}

int archive_local_year(int64_t archive_ns) {
    std::tm tm_buf = local_tm(static_cast<std::time_t>(archive_unix_seconds(archive_ns)));
    return tm_buf.tm_year + 1900;
}

std::string month_day_key(int month, int day) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d-%02d", month, day);
    return buf;
}

MonthDay today() {
    std::tm tm_buf = local_tm(std::time(nullptr));
    return MonthDay{tm_buf.tm_mon + 1, tm_buf.tm_mday};
}

} // namespace onthisday
