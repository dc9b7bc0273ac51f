#pragma once

#include <changefeed/config.hpp>
#include <changefeed/core/result.hpp>
#include <changefeed/feed/time.hpp>

#include <optional>
#include <string>
#include <string_view>

CHANGEFEED_NAMESPACE_BEGIN

//! \brief `idx/segments/YYYY/` to midnight on January 1 of that year
Result<Timestamp> parse_year_path(std::string_view path);

//! \brief `idx/segments/YYYY/MM/DD/HHMM/...` (or `.../HH/...`) to the hour
//! of the segment. Anything after the hour component is ignored.
Result<Timestamp> parse_segment_path(std::string_view path);

//! \brief Builds `idx/segments/YYYY/[MM/[DD/[HH00/]]]`
std::string build_segment_path(
    int year, std::optional<unsigned> month = std::nullopt,
    std::optional<unsigned> day = std::nullopt,
    std::optional<unsigned> hour = std::nullopt);

CHANGEFEED_NAMESPACE_END
