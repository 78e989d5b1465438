#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace blob_sync {

/// Key paths that locate the items and the continuation token inside a
/// paged response body. Immutable once constructed and shared across fetches.
class PageCodec {
public:
    /// @param itemsPath         Dot-separated path to the item array.
    /// @param continuationPath  Dot-separated path to the continuation token.
    /// @param xmlItemName       Element name of a nested collection wrapper,
    ///                          e.g. "Blob" for {"Blobs": {"Blob": [...]}}.
    explicit PageCodec(std::string itemsPath = "items",
                       std::string continuationPath = "continuationToken",
                       std::optional<std::string> xmlItemName = std::nullopt);

    /// Locate the item array.
    /// @throws PagingError{NotPaged} if the path does not resolve to an array.
    /// @throws PagingError{AmbiguousPath} if more than one array matches.
    nlohmann::json extractItems(const nlohmann::json& payload) const;

    /// Locate the continuation token. A missing token means the server has
    /// stopped paging and yields std::nullopt.
    /// @throws PagingError{AmbiguousPath} if more than one string matches.
    std::optional<std::string> extractContinuationToken(const nlohmann::json& payload) const;

    const std::string& itemsPath() const { return mItemsPath; }
    const std::string& continuationPath() const { return mContinuationPath; }
    const std::optional<std::string>& xmlItemName() const { return mXmlItemName; }

private:
    std::string                mItemsPath;
    std::string                mContinuationPath;
    std::optional<std::string> mXmlItemName;

    std::vector<std::string>   mItemsKeys;
    std::vector<std::string>   mContinuationKeys;
};

/// Split "a.b.c" into {"a", "b", "c"}.
/// Throws std::invalid_argument on an empty path or an empty component.
std::vector<std::string> splitKeyPath(const std::string& path);

} // namespace blob_sync
