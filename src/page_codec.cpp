#include "page_codec.hpp"
#include "errors.hpp"

#include <stdexcept>

namespace blob_sync {

using json = nlohmann::json;

std::vector<std::string> splitKeyPath(const std::string& path) {
    if (path.empty()) {
        throw std::invalid_argument("Key path must not be empty");
    }

    std::vector<std::string> keys;
    std::size_t pos = 0;
    while (true) {
        auto dot = path.find('.', pos);
        auto key = path.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
        if (key.empty()) {
            throw std::invalid_argument("Key path has an empty component: " + path);
        }
        keys.push_back(std::move(key));
        if (dot == std::string::npos) break;
        pos = dot + 1;
    }
    return keys;
}

PageCodec::PageCodec(std::string itemsPath,
                     std::string continuationPath,
                     std::optional<std::string> xmlItemName)
    : mItemsPath(std::move(itemsPath))
    , mContinuationPath(std::move(continuationPath))
    , mXmlItemName(std::move(xmlItemName))
    , mItemsKeys(splitKeyPath(mItemsPath))
    , mContinuationKeys(splitKeyPath(mContinuationPath)) {}

// ---------------------------------------------------------------------------
// Items
// ---------------------------------------------------------------------------

json PageCodec::extractItems(const json& payload) const {
    if (!payload.is_object()) {
        throw PagingError(PagingError::Kind::NotPaged,
                          "Payload is not an object; expected '" + mItemsPath + "'");
    }

    // Objects are descended into. An array is captured but does not change
    // the current object, so later components are looked up beside it.
    const json* current = &payload;
    const json* match   = nullptr;

    for (const auto& key : mItemsKeys) {
        auto it = current->find(key);
        if (it == current->end()) {
            throw PagingError(PagingError::Kind::NotPaged,
                              "Paged response expected but '" + mItemsPath + "' not found");
        }
        if (it->is_array()) {
            if (match != nullptr) {
                throw PagingError(PagingError::Kind::AmbiguousPath,
                                  "More than one array matches '" + mItemsPath + "'");
            }
            match = &*it;
        } else if (it->is_object()) {
            current = &*it;
        }
    }

    if (match != nullptr) {
        return *match;
    }

    // Nested collection wrapper: {"Blobs": {"Blob": [...]}} or a single
    // {"Blobs": {"Blob": {...}}} element.
    if (mXmlItemName) {
        auto it = current->find(*mXmlItemName);
        if (it != current->end()) {
            if (it->is_array()) return *it;
            if (it->is_object()) return json::array({*it});
        }
        // An empty wrapper element means an empty page.
        if (current != &payload && current->empty()) {
            return json::array();
        }
    }

    throw PagingError(PagingError::Kind::NotPaged,
                      "Paged response expected but '" + mItemsPath +
                      "' is not an array");
}

// ---------------------------------------------------------------------------
// Continuation token
// ---------------------------------------------------------------------------

std::optional<std::string> PageCodec::extractContinuationToken(const json& payload) const {
    if (!payload.is_object()) {
        return std::nullopt;
    }

    const json* current = &payload;
    std::optional<std::string> token;

    for (const auto& key : mContinuationKeys) {
        auto it = current->find(key);
        if (it == current->end()) {
            return std::nullopt;
        }
        if (it->is_string()) {
            if (token) {
                throw PagingError(PagingError::Kind::AmbiguousPath,
                                  "More than one token matches '" + mContinuationPath + "'");
            }
            token = it->get<std::string>();
        } else if (it->is_object()) {
            current = &*it;
        }
    }
    return token;
}

} // namespace blob_sync
