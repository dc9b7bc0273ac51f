#pragma once

#include <changefeed/storage/config.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/config.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/status-code/quick_status_code_from_enum.hpp>
#else
    #include <boost/outcome/experimental/status-code/config.hpp>
    #include <boost/outcome/experimental/status-code/quick_status_code_from_enum.hpp>
#endif

#include <cstdint>
#include <initializer_list>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

enum class BlobStoreError : uint8_t
{
    success = 0,
    container_not_found,
    blob_not_found,
    invalid_blob_name,
};

CHANGEFEED_STORAGE_NAMESPACE_END

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_BEGIN

template <>
struct quick_status_code_from_enum<CHANGEFEED_STORAGE_NAMESPACE::BlobStoreError>
    : quick_status_code_from_enum_defaults<
          CHANGEFEED_STORAGE_NAMESPACE::BlobStoreError>
{
    static constexpr auto const domain_name = "BlobStore Error";
    static constexpr auto const domain_uuid =
        "{8e21d4a7-0b6c-4f3e-a915-27c4d0f8b6e1}";

    static std::initializer_list<mapping> const &value_mappings()
    {
        using CHANGEFEED_STORAGE_NAMESPACE::BlobStoreError;

        static std::initializer_list<mapping> const v = {
            {BlobStoreError::success, "success", {errc::success}},
            {BlobStoreError::container_not_found,
             "container does not exist",
             {errc::no_such_file_or_directory}},
            {BlobStoreError::blob_not_found,
             "blob does not exist",
             {errc::no_such_file_or_directory}},
            {BlobStoreError::invalid_blob_name,
             "blob name is empty or escapes the container",
             {errc::invalid_argument}},
        };
        return v;
    }
};

BOOST_OUTCOME_SYSTEM_ERROR2_NAMESPACE_END
