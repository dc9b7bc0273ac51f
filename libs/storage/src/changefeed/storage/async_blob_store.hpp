#pragma once

#include <changefeed/core/result.hpp>
#include <changefeed/fiber/io_pool.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/config.hpp>

#include <string>
#include <string_view>
#include <vector>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

//! \brief Runs every call of a blocking store on an IoPool worker. A caller
//! running on a fiber is suspended until the result is ready, leaving its
//! thread free to run other fibers; a plain thread blocks.
class AsyncBlobStore final : public BlobStore
{
    BlobStore &store_;
    fiber::IoPool &pool_;

public:
    AsyncBlobStore(BlobStore &store, fiber::IoPool &pool);

    std::string const &address() const override
    {
        return store_.address();
    }

    Result<bool> exists() override;
    Result<std::vector<std::string>>
    list_prefixes(std::string_view prefix, char delimiter) override;
    Result<std::vector<BlobItem>> list_blobs(std::string_view prefix) override;
    Result<std::string> download(std::string_view path) override;
};

CHANGEFEED_STORAGE_NAMESPACE_END
