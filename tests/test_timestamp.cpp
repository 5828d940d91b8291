#include <catch2/catch.hpp>
#include "test_fixtures.hpp"
#include "timestamp.hpp"
#include <cstdlib>

using namespace onthisday;

// ── Epoch conversion ─────────────────────────────────────────────

TEST_CASE("from_archive_epoch: absent for null and zero", "[timestamp]") {
    REQUIRE_FALSE(from_archive_epoch(std::nullopt).has_value());
    REQUIRE_FALSE(from_archive_epoch(0).has_value());
}

TEST_CASE("from_archive_epoch: nanoseconds since 2001 to unix seconds", "[timestamp]") {
    auto unix = from_archive_epoch(int64_t{1000000000});
    REQUIRE(unix.has_value());
    REQUIRE(*unix == 978307201.0);

    auto negative = from_archive_epoch(int64_t{-1000000000});
    REQUIRE(negative.has_value());
    REQUIRE(*negative == 978307199.0);
}

TEST_CASE("to_archive_epoch: inverse of from_archive_epoch", "[timestamp]") {
    REQUIRE_FALSE(to_archive_epoch(std::nullopt).has_value());
    REQUIRE_FALSE(to_archive_epoch(978307200.0).has_value());

    int64_t ns = 637500000000000000;
    auto back = to_archive_epoch(from_archive_epoch(ns));
    REQUIRE(back.has_value());
    // Double precision at this magnitude is well under a microsecond
    REQUIRE(std::llabs(*back - ns) < 1000);
}

// ── Local formatting ─────────────────────────────────────────────

TEST_CASE("to_local_iso: whole seconds in local time", "[timestamp]") {
    UtcTimezone tz;
    auto iso = to_local_iso(static_cast<double>(unix_time(2021, 3, 15, 9, 30, 0)));
    REQUIRE(iso.has_value());
    REQUIRE(*iso == "2021-03-15T09:30:00");
}

TEST_CASE("to_local_iso: microseconds appended when present", "[timestamp]") {
    UtcTimezone tz;
    auto iso = to_local_iso(static_cast<double>(unix_time(2021, 3, 15, 9, 30, 0)) + 0.25);
    REQUIRE(iso.has_value());
    REQUIRE(*iso == "2021-03-15T09:30:00.250000");
    REQUIRE_FALSE(to_local_iso(std::nullopt).has_value());
}

TEST_CASE("to_local_iso: follows the process timezone", "[timestamp]") {
    ScopedTimezone tz("EST5");
    auto iso = to_local_iso(static_cast<double>(unix_time(2021, 3, 15, 2, 0, 0)));
    REQUIRE(iso.has_value());
    REQUIRE(*iso == "2021-03-14T21:00:00");
}

TEST_CASE("local_year: civil year in local time", "[timestamp]") {
    UtcTimezone tz;
    REQUIRE(local_year(static_cast<double>(unix_time(2019, 12, 31, 23, 59, 59))) == 2019);
    REQUIRE(local_year(static_cast<double>(unix_time(2020, 1, 1, 0, 0, 0))) == 2020);
}

TEST_CASE("archive_unix_seconds: truncates like integer division", "[timestamp]") {
    REQUIRE(archive_unix_seconds(0) == kArchiveEpochOffset);
    REQUIRE(archive_unix_seconds(1999999999) == kArchiveEpochOffset + 1);
    REQUIRE(archive_unix_seconds(-1500000000) == kArchiveEpochOffset - 1);
}

TEST_CASE("archive_to_local_iso: last nanosecond of the year stays in it", "[timestamp]") {
    UtcTimezone tz;
    int64_t ns = archive_ns(2020, 12, 31, 23, 59, 59) + 999999999;
    auto iso = archive_to_local_iso(ns);
    REQUIRE(iso.has_value());
    REQUIRE(*iso == "2020-12-31T23:59:59.999999");
    REQUIRE(archive_local_year(ns) == 2020);
    REQUIRE(archive_local_year(ns + 1) == 2021);
}

TEST_CASE("archive_to_local_iso: absent for null and zero", "[timestamp]") {
    UtcTimezone tz;
    REQUIRE_FALSE(archive_to_local_iso(std::nullopt).has_value());
    REQUIRE_FALSE(archive_to_local_iso(int64_t{0}).has_value());
    REQUIRE(archive_to_local_iso(archive_ns(2021, 3, 15, 9, 30, 0) + 250000000).value_or("") ==
            "2021-03-15T09:30:00.250000");
}

TEST_CASE("month_day_key: zero padded", "[timestamp]") {
    REQUIRE(month_day_key(3, 5) == "03-05");
    REQUIRE(month_day_key(12, 25) == "12-25");
}

TEST_CASE("today: within calendar bounds", "[timestamp]") {
    auto d = today();
    REQUIRE(d.month >= 1);
    REQUIRE(d.month <= 12);
    REQUIRE(d.day >= 1);
    REQUIRE(d.day <= 31);
}
