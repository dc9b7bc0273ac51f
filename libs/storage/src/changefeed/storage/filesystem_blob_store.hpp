#pragma once

#include <changefeed/core/result.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/config.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

//! \brief Container backed by a directory tree. Blob names are the paths of
//! regular files relative to the root, using '/' as separator.
class FilesystemBlobStore final : public BlobStore
{
    std::filesystem::path root_;
    std::string address_;

    Result<std::filesystem::path> resolve(std::string_view name) const;

public:
    explicit FilesystemBlobStore(std::filesystem::path const &root);

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
