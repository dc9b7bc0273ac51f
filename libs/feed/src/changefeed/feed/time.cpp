#include <changefeed/config.hpp>
#include <changefeed/core/likely.h>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/time.hpp>

#include <quill/Fmt.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

using namespace std::chrono;

namespace
{
    // Reads exactly `width` decimal digits starting at `pos`
    bool read_digits(
        std::string_view const s, size_t const pos, size_t const width,
        unsigned &out)
    {
        if (pos + width > s.size()) {
            return false;
        }
        unsigned value = 0;
        for (size_t i = pos; i < pos + width; ++i) {
            char const c = s[i];
            if (c < '0' || c > '9') {
                return false;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        out = value;
        return true;
    }

    bool expect(std::string_view const s, size_t const pos, char const c)
    {
        return pos < s.size() && s[pos] == c;
    }
}

Timestamp floor_to_hour(Timestamp const t)
{
    return floor<hours>(t);
}

Timestamp ceil_to_hour(Timestamp const t)
{
    return floor<hours>(t) + hours{1};
}

std::optional<Timestamp> floor_to_hour(std::optional<Timestamp> const &t)
{
    if (!t.has_value()) {
        return std::nullopt;
    }
    return floor_to_hour(t.value());
}

std::optional<Timestamp> ceil_to_hour(std::optional<Timestamp> const &t)
{
    if (!t.has_value()) {
        return std::nullopt;
    }
    return ceil_to_hour(t.value());
}

Timestamp min_end(Timestamp const bound, std::optional<Timestamp> const &end)
{
    if (end.has_value() && end.value() < bound) {
        return end.value();
    }
    return bound;
}

Timestamp make_timestamp(
    int const year, unsigned const month, unsigned const day,
    unsigned const hour, unsigned const minute, unsigned const second)
{
    sys_days const date{std::chrono::year{year} / month / day};
    return Timestamp{date} + hours{hour} + minutes{minute} + seconds{second};
}

Result<Timestamp> parse_timestamp(std::string_view const s)
{
    unsigned year;
    unsigned month;
    unsigned day;
    unsigned hour;
    unsigned minute;
    unsigned second;
    if (!read_digits(s, 0, 4, year) || !expect(s, 4, '-') ||
        !read_digits(s, 5, 2, month) || !expect(s, 7, '-') ||
        !read_digits(s, 8, 2, day) ||
        !(expect(s, 10, 'T') || expect(s, 10, 't') || expect(s, 10, ' ')) ||
        !read_digits(s, 11, 2, hour) || !expect(s, 13, ':') ||
        !read_digits(s, 14, 2, minute) || !expect(s, 16, ':') ||
        !read_digits(s, 17, 2, second)) {
        return ChangeFeedError::malformed_timestamp;
    }

    year_month_day const ymd{
        std::chrono::year{static_cast<int>(year)},
        std::chrono::month{month},
        std::chrono::day{day}};
    if (CHANGEFEED_UNLIKELY(
            !ymd.ok() || hour > 23 || minute > 59 || second > 60)) {
        return ChangeFeedError::malformed_timestamp;
    }

    size_t pos = 19;
    microseconds fraction{0};
    if (expect(s, pos, '.')) {
        ++pos;
        int64_t scale = 100000;
        size_t digits = 0;
        while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
            // digits past microsecond resolution are truncated
            fraction += microseconds{(s[pos] - '0') * scale};
            scale /= 10;
            ++pos;
            ++digits;
        }
        if (digits == 0) {
            return ChangeFeedError::malformed_timestamp;
        }
    }

    minutes offset{0};
    if (expect(s, pos, 'Z') || expect(s, pos, 'z')) {
        ++pos;
    }
    else if (expect(s, pos, '+') || expect(s, pos, '-')) {
        bool const negative = s[pos] == '-';
        unsigned offset_hours;
        unsigned offset_minutes;
        if (!read_digits(s, pos + 1, 2, offset_hours) ||
            !expect(s, pos + 3, ':') ||
            !read_digits(s, pos + 4, 2, offset_minutes) || offset_hours > 23 ||
            offset_minutes > 59) {
            return ChangeFeedError::malformed_timestamp;
        }
        offset = hours{offset_hours} + minutes{offset_minutes};
        if (negative) {
            offset = -offset;
        }
        pos += 6;
    }
    if (pos != s.size()) {
        return ChangeFeedError::malformed_timestamp;
    }

    return Timestamp{sys_days{ymd}} + hours{hour} + minutes{minute} +
           seconds{second} + fraction - offset;
}

std::string format_timestamp(Timestamp const t)
{
    auto const day = floor<days>(t);
    year_month_day const ymd{day};
    hh_mm_ss<microseconds> const tod{t - day};
    auto const micros = tod.subseconds().count();
    if (micros == 0) {
        return fmtquill::format(
            "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}Z",
            static_cast<int>(ymd.year()),
            static_cast<unsigned>(ymd.month()),
            static_cast<unsigned>(ymd.day()),
            tod.hours().count(),
            tod.minutes().count(),
            tod.seconds().count());
    }
    return fmtquill::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:06}Z",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        tod.hours().count(),
        tod.minutes().count(),
        tod.seconds().count(),
        micros);
}

CHANGEFEED_NAMESPACE_END
