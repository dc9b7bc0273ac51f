#pragma once

#include <changefeed/core/result.hpp>
#include <changefeed/storage/config.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

struct BlobItem
{
    std::string name;
    uint64_t content_length{0};

    bool operator==(BlobItem const &) const = default;
};

//! \brief A flat container of named blobs whose names use '/' to describe a
//! hierarchy.
//!
//! Every call may block or, when running on a fiber, suspend. Failures are
//! returned unchanged to the caller; implementations do not retry.
class BlobStore
{
public:
    virtual ~BlobStore() = default;

    //! \brief Stable address of the container, used to identify it in cursors
    virtual std::string const &address() const = 0;

    virtual Result<bool> exists() = 0;

    //! \brief Immediate child prefixes of `prefix`, each ending in
    //! `delimiter`, in lexicographic order
    virtual Result<std::vector<std::string>>
    list_prefixes(std::string_view prefix, char delimiter) = 0;

    //! \brief Every blob whose name starts with `prefix`, in lexicographic
    //! order
    virtual Result<std::vector<BlobItem>> list_blobs(std::string_view prefix) = 0;

    virtual Result<std::string> download(std::string_view path) = 0;
};

CHANGEFEED_STORAGE_NAMESPACE_END
