#include <changefeed/core/result.hpp>
#include <changefeed/fiber/io_pool.hpp>
#include <changefeed/storage/async_blob_store.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/config.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <vector>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

AsyncBlobStore::AsyncBlobStore(BlobStore &store, fiber::IoPool &pool)
    : store_{store}
    , pool_{pool}
{
}

Result<bool> AsyncBlobStore::exists()
{
    return pool_.run<bool>([this] { return store_.exists(); });
}

Result<std::vector<std::string>> AsyncBlobStore::list_prefixes(
    std::string_view const prefix, char const delimiter)
{
    // the caller waits for completion, so borrowing `prefix` is safe
    return pool_.run<std::vector<std::string>>(
        [this, prefix, delimiter] {
            return store_.list_prefixes(prefix, delimiter);
        });
}

Result<std::vector<BlobItem>>
AsyncBlobStore::list_blobs(std::string_view const prefix)
{
    return pool_.run<std::vector<BlobItem>>(
        [this, prefix] { return store_.list_blobs(prefix); });
}

Result<std::string> AsyncBlobStore::download(std::string_view const path)
{
    return pool_.run<std::string>(
        [this, path] { return store_.download(path); });
}

CHANGEFEED_STORAGE_NAMESPACE_END
