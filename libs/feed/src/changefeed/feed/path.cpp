#include <changefeed/config.hpp>
#include <changefeed/core/likely.h>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/constants.hpp>
#include <changefeed/feed/error.hpp>
#include <changefeed/feed/path.hpp>
#include <changefeed/feed/time.hpp>

#include <quill/Fmt.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

namespace
{
    // Pops the next '/'-terminated component off `rest`
    std::optional<std::string_view> next_component(std::string_view &rest)
    {
        auto const slash = rest.find('/');
        if (slash == std::string_view::npos) {
            return std::nullopt;
        }
        auto const component = rest.substr(0, slash);
        rest.remove_prefix(slash + 1);
        return component;
    }

    std::optional<unsigned> to_number(std::string_view const s, size_t width)
    {
        if (s.size() != width) {
            return std::nullopt;
        }
        unsigned value = 0;
        for (char const c : s) {
            if (c < '0' || c > '9') {
                return std::nullopt;
            }
            value = value * 10 + static_cast<unsigned>(c - '0');
        }
        return value;
    }

    Result<std::string_view> strip_root(std::string_view path)
    {
        if (CHANGEFEED_UNLIKELY(!path.starts_with(SEGMENT_PREFIX))) {
            return ChangeFeedError::malformed_path;
        }
        path.remove_prefix(SEGMENT_PREFIX.size());
        return path;
    }
}

Result<Timestamp> parse_year_path(std::string_view const path)
{
    BOOST_OUTCOME_TRY(auto rest, strip_root(path));
    auto const year_component = next_component(rest);
    if (!year_component.has_value()) {
        return ChangeFeedError::malformed_path;
    }
    auto const year = to_number(year_component.value(), 4);
    if (!year.has_value()) {
        return ChangeFeedError::malformed_path;
    }
    return make_timestamp(static_cast<int>(year.value()), 1, 1);
}

Result<Timestamp> parse_segment_path(std::string_view const path)
{
    BOOST_OUTCOME_TRY(auto rest, strip_root(path));
    auto const year_component = next_component(rest);
    auto const month_component = next_component(rest);
    auto const day_component = next_component(rest);
    auto const hour_component = next_component(rest);
    if (!year_component || !month_component || !day_component ||
        !hour_component) {
        return ChangeFeedError::malformed_path;
    }

    auto const year = to_number(*year_component, 4);
    auto const month = to_number(*month_component, 2);
    auto const day = to_number(*day_component, 2);
    std::optional<unsigned> hour;
    std::optional<unsigned> minute{0};
    if (hour_component->size() == 4) {
        hour = to_number(hour_component->substr(0, 2), 2);
        minute = to_number(hour_component->substr(2, 2), 2);
    }
    else {
        hour = to_number(*hour_component, 2);
    }
    if (!year || !month || !day || !hour || !minute) {
        return ChangeFeedError::malformed_path;
    }

    std::chrono::year_month_day const ymd{
        std::chrono::year{static_cast<int>(*year)},
        std::chrono::month{*month},
        std::chrono::day{*day}};
    if (CHANGEFEED_UNLIKELY(!ymd.ok() || *hour > 23 || *minute > 59)) {
        return ChangeFeedError::malformed_path;
    }
    // segments are hour buckets; minutes in an HHMM component are dropped
    return make_timestamp(static_cast<int>(*year), *month, *day, *hour);
}

std::string build_segment_path(
    int const year, std::optional<unsigned> const month,
    std::optional<unsigned> const day, std::optional<unsigned> const hour)
{
    std::string path{SEGMENT_PREFIX};
    path += fmtquill::format("{:04}/", year);
    if (month.has_value()) {
        path += fmtquill::format("{:02}/", month.value());
        if (day.has_value()) {
            path += fmtquill::format("{:02}/", day.value());
            if (hour.has_value()) {
                path += fmtquill::format("{:02}00/", hour.value());
            }
        }
    }
    return path;
}

CHANGEFEED_NAMESPACE_END
