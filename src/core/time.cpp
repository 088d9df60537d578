#include <bankgen/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>

namespace bankgen {

namespace {

auto parse_uint(std::string_view text, unsigned& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

}  // namespace

auto today_utc() -> Date {
    using namespace std::chrono;
    auto day = floor<days>(system_clock::now());
    return Date{static_cast<std::int32_t>(day.time_since_epoch().count())};
}

auto make_date(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    sys_days sd{year_month_day{std::chrono::year{year}, std::chrono::month{month},
                               std::chrono::day{day}}};
    return Date{static_cast<std::int32_t>(sd.time_since_epoch().count())};
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    hh_mm_ss<nanoseconds> hms{tp - day};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    unsigned year = 0;
    unsigned month = 0;
    unsigned day = 0;
    if (!parse_uint(text.substr(0, 4), year) || !parse_uint(text.substr(5, 2), month) ||
        !parse_uint(text.substr(8, 2), day)) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(year)},
                                    std::chrono::month{month}, std::chrono::day{day}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return make_date(static_cast<int>(year), month, day);
}

}  // namespace bankgen
