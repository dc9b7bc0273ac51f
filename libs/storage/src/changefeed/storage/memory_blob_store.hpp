#pragma once

#include <changefeed/core/result.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/config.hpp>

#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

//! \brief Container held in memory. Safe to mutate while a reader on another
//! thread lists or downloads from it.
class MemoryBlobStore final : public BlobStore
{
    std::string address_;
    mutable std::mutex mutex_;
    bool exists_{true};
    std::map<std::string, std::string, std::less<>> blobs_;

public:
    explicit MemoryBlobStore(std::string address);

    void put(std::string name, std::string content);
    bool remove(std::string_view name);
    void set_exists(bool);

    std::string const &address() const override
    {
        return address_;
    }

    Result<bool> exists() override;
    Result<std::vector<std::string>>
    list_prefixes(std::string_view prefix, char delimiter) override;
    Result<std::vector<BlobItem>> list_blobs(std::string_view prefix) override;
    Result<std::string> download(std::string_view path) override;
};

CHANGEFEED_STORAGE_NAMESPACE_END
