#include <changefeed/core/likely.h>
#include <changefeed/core/result.hpp>
#include <changefeed/storage/blob_store.hpp>
#include <changefeed/storage/blob_store_error.hpp>
#include <changefeed/storage/config.hpp>
#include <changefeed/storage/filesystem_blob_store.hpp>

#if __has_include(<boost/outcome/experimental/status-code/status-code/posix_code.hpp>)
    #include <boost/outcome/experimental/status-code/status-code/posix_code.hpp>
#else
    #include <boost/outcome/experimental/status-code/posix_code.hpp>
#endif

#include <quill/Quill.h> // NOLINT
#include <quill/detail/LogMacros.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

CHANGEFEED_STORAGE_NAMESPACE_BEGIN

namespace fs = std::filesystem;

namespace
{
    outcome::experimental::posix_code to_posix_code(std::error_code const &ec)
    {
        return outcome::experimental::posix_code{ec.value()};
    }
}

FilesystemBlobStore::FilesystemBlobStore(fs::path const &root)
    : root_{fs::absolute(root).lexically_normal()}
    , address_{"file://" + root_.generic_string()}
{
}

Result<fs::path> FilesystemBlobStore::resolve(std::string_view const name) const
{
    fs::path const relative{name};
    if (CHANGEFEED_UNLIKELY(name.empty() || relative.is_absolute())) {
        return BlobStoreError::invalid_blob_name;
    }
    for (auto const &component : relative) {
        if (component == "..") {
            return BlobStoreError::invalid_blob_name;
        }
    }
    return root_ / relative;
}

Result<bool> FilesystemBlobStore::exists()
{
    std::error_code ec;
    bool const is_dir = fs::is_directory(root_, ec);
    if (ec && ec != std::errc::no_such_file_or_directory &&
        ec != std::errc::not_a_directory) {
        return to_posix_code(ec);
    }
    return is_dir;
}

Result<std::vector<BlobItem>>
FilesystemBlobStore::list_blobs(std::string_view const prefix)
{
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return BlobStoreError::container_not_found;
    }

    // only the deepest directory named by the prefix needs walking
    fs::path start = root_;
    if (auto const slash = prefix.rfind('/'); slash != std::string_view::npos) {
        BOOST_OUTCOME_TRY(auto dir, resolve(prefix.substr(0, slash)));
        start = std::move(dir);
    }
    if (!fs::is_directory(start, ec)) {
        return std::vector<BlobItem>{};
    }

    std::vector<BlobItem> items;
    for (fs::recursive_directory_iterator it{start, ec}, end; it != end;
         it.increment(ec)) {
        if (ec) {
            break;
        }
        if (!it->is_regular_file(ec)) {
            continue;
        }
        auto name = fs::relative(it->path(), root_, ec).generic_string();
        if (ec) {
            break;
        }
        if (!name.starts_with(prefix)) {
            continue;
        }
        auto const size = it->file_size(ec);
        if (ec) {
            break;
        }
        items.push_back(BlobItem{.name = std::move(name), .content_length = size});
    }
    if (ec) {
        LOG_ERROR(
            "listing {} under {} failed: {}",
            prefix,
            root_.string(),
            ec.message());
        return to_posix_code(ec);
    }

    std::sort(items.begin(), items.end(), [](auto const &a, auto const &b) {
        return a.name < b.name;
    });
    return items;
}

Result<std::vector<std::string>> FilesystemBlobStore::list_prefixes(
    std::string_view const prefix, char const delimiter)
{
    BOOST_OUTCOME_TRY(auto const items, list_blobs(prefix));
    std::set<std::string> prefixes;
    for (auto const &item : items) {
        auto const pos = item.name.find(delimiter, prefix.size());
        if (pos != std::string::npos) {
            prefixes.insert(item.name.substr(0, pos + 1));
        }
    }
    return std::vector<std::string>{prefixes.begin(), prefixes.end()};
}

Result<std::string> FilesystemBlobStore::download(std::string_view const path)
{
    BOOST_OUTCOME_TRY(auto const file, resolve(path));
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        if (!fs::is_directory(root_, ec)) {
            return BlobStoreError::container_not_found;
        }
        return BlobStoreError::blob_not_found;
    }
    std::ifstream is{file, std::ios::binary};
    if (CHANGEFEED_UNLIKELY(!is)) {
        return outcome::experimental::posix_code{errno};
    }
    std::string content{
        std::istreambuf_iterator<char>{is}, std::istreambuf_iterator<char>{}};
    if (CHANGEFEED_UNLIKELY(is.bad())) {
        return outcome::experimental::errc::io_error;
    }
    LOG_DEBUG("downloaded {} ({} bytes)", path, content.size());
    return content;
}

CHANGEFEED_STORAGE_NAMESPACE_END
