#include <changefeed/core/result.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/blob_store_error.hpp>
#include <changefeed/storage/config.hpp>
#include <changefeed/storage/memory_blob_store.hpp>

#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

MemoryBlobStore::MemoryBlobStore(std::string address)
    : address_{std::move(address)}
{
}

void MemoryBlobStore::put(std::string name, std::string content)
{
    std::lock_guard const lock{mutex_};
    blobs_.insert_or_assign(std::move(name), std::move(content));
}

bool MemoryBlobStore::remove(std::string_view const name)
{
    std::lock_guard const lock{mutex_};
    auto const it = blobs_.find(name);
    if (it == blobs_.end()) {
        return false;
    }
    blobs_.erase(it);
    return true;
}

void MemoryBlobStore::set_exists(bool const exists)
{
    std::lock_guard const lock{mutex_};
    exists_ = exists;
}

Result<bool> MemoryBlobStore::exists()
{
    std::lock_guard const lock{mutex_};
    return exists_;
}

Result<std::vector<std::string>> MemoryBlobStore::list_prefixes(
    std::string_view const prefix, char const delimiter)
{
    std::lock_guard const lock{mutex_};
    if (!exists_) {
        return BlobStoreError::container_not_found;
    }
    std::set<std::string> prefixes;
    for (auto it = blobs_.lower_bound(prefix);
         it != blobs_.end() && it->first.starts_with(prefix);
         ++it) {
        auto const pos = it->first.find(delimiter, prefix.size());
        if (pos != std::string::npos) {
            prefixes.insert(it->first.substr(0, pos + 1));
        }
    }
    return std::vector<std::string>{prefixes.begin(), prefixes.end()};
}

Result<std::vector<BlobItem>>
MemoryBlobStore::list_blobs(std::string_view const prefix)
{
    std::lock_guard const lock{mutex_};
    if (!exists_) {
        return BlobStoreError::container_not_found;
    }
    std::vector<BlobItem> items;
    for (auto it = blobs_.lower_bound(prefix);
         it != blobs_.end() && it->first.starts_with(prefix);
         ++it) {
        items.push_back(BlobItem{
            .name = it->first, .content_length = it->second.size()});
    }
    return items;
}

Result<std::string> MemoryBlobStore::download(std::string_view const path)
{
    std::lock_guard const lock{mutex_};
    if (!exists_) {
        return BlobStoreError::container_not_found;
    }
    auto const it = blobs_.find(path);
    if (it == blobs_.end()) {
        return BlobStoreError::blob_not_found;
    }
    return it->second;
}

CHANGEFEED_STORAGE_NAMESPACE_END
