#pragma once

#include <changefeed/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>

CHANGEFEED_NAMESPACE_BEGIN

enum class ChangeFeedError : uint8_t
{
    success = 0,
    not_enabled,
    malformed_path,
    exhausted_stream,
    malformed_timestamp,
    malformed_manifest,
    malformed_event,
    malformed_cursor,
    cursor_mismatch,
    not_initialized,
};

CHANGEFEED_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<CHANGEFEED_NAMESPACE::ChangeFeedError>
    : quick_status_code_from_enum_defaults<
          CHANGEFEED_NAMESPACE::ChangeFeedError>
{
    static constexpr auto const domain_name = "ChangeFeed Error";
    static constexpr auto const domain_uuid =
        "{3c1f0b6e-5a2d-4e8b-9f47-8d2a61c0e5b3}";

    static std::initializer_list<mapping> const &value_mappings();
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
