#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

//! \brief UTC instant with microsecond resolution
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

Timestamp floor_to_hour(Timestamp);

//! \brief Start of the hour following the one containing `t`. An exact hour
//! boundary still moves forward by one hour.
Timestamp ceil_to_hour(Timestamp);

std::optional<Timestamp> floor_to_hour(std::optional<Timestamp> const &);
std::optional<Timestamp> ceil_to_hour(std::optional<Timestamp> const &);

//! \brief `end` if present and earlier than `bound`, else `bound`
Timestamp min_end(Timestamp bound, std::optional<Timestamp> const &end);

Timestamp make_timestamp(
    int year, unsigned month, unsigned day, unsigned hour = 0,
    unsigned minute = 0, unsigned second = 0);

//! \brief Parses `YYYY-MM-DDTHH:MM:SS[.fraction][Z|+HH:MM|-HH:MM]`
Result<Timestamp> parse_timestamp(std::string_view);

//! \brief Formats as `YYYY-MM-DDTHH:MM:SS[.ffffff]Z`, the fraction only
//! when non-zero
std::string format_timestamp(Timestamp);

CHANGEFEED_NAMESPACE_END
