#include <changefeed/config.hpp>
#include <changefeed/feed/error.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/generic_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/generic_code.hpp>
#endif

#include <initializer_list>

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

std::initializer_list<
    quick_status_code_from_enum<CHANGEFEED_NAMESPACE::ChangeFeedError>::
        mapping> const &
quick_status_code_from_enum<
    CHANGEFEED_NAMESPACE::ChangeFeedError>::value_mappings()
{
    using CHANGEFEED_NAMESPACE::ChangeFeedError;

    static std::initializer_list<mapping> const v = {
        {ChangeFeedError::success, "success", {errc::success}},
        {ChangeFeedError::not_enabled,
         "change feed is not enabled on this container, or is still being "
         "enabled",
         {errc::no_such_file_or_directory}},
        {ChangeFeedError::malformed_path,
         "path does not match the change feed time partition layout",
         {errc::invalid_argument}},
        {ChangeFeedError::exhausted_stream,
         "change feed does not have any more events",
         {errc::operation_not_permitted}},
        {ChangeFeedError::malformed_timestamp,
         "timestamp is not a valid ISO-8601 date-time",
         {errc::invalid_argument}},
        {ChangeFeedError::malformed_manifest,
         "change feed manifest blob is malformed",
         {errc::illegal_byte_sequence}},
        {ChangeFeedError::malformed_event,
         "change feed chunk contains a malformed event",
         {errc::illegal_byte_sequence}},
        {ChangeFeedError::malformed_cursor,
         "change feed cursor is malformed",
         {errc::invalid_argument}},
        {ChangeFeedError::cursor_mismatch,
         "change feed cursor was issued for a different container",
         {errc::invalid_argument}},
        {ChangeFeedError::not_initialized,
         "change feed has not been initialized",
         {errc::operation_not_permitted}}};

    return v;
}

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
