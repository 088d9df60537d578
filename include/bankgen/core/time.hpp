#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bankgen {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

/// Current UTC calendar date. This is the execution-date stamp of a run.
[[nodiscard]] auto today_utc() -> Date;

/// Build a date from a proleptic Gregorian year/month/day triple.
[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> Date;

/// ISO-8601 `YYYY-MM-DD`.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// `YYYY-MM-DD HH:MM:SS.nnnnnnnnn`, UTC.
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Parse `YYYY-MM-DD`. Returns nullopt on anything else.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

}  // namespace bankgen

namespace std {

template <>
struct hash<bankgen::Date> {
    auto operator()(const bankgen::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<bankgen::Timestamp> {
    auto operator()(const bankgen::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
