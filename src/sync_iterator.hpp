#pragma once

#include "errors.hpp"
#include "page_fetcher.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

namespace blob_sync {

/// Blocking pull view over a PageFetcher.
///
/// Items of the current page are returned immediately. When the page is used
/// up, the calling thread waits for the next fetch to complete. Never call
/// next() from the thread that runs the request executor's completions: the
/// fetch it waits for could then never finish.
template <typename T = nlohmann::json>
class SyncIteratorAdapter {
public:
    enum class Status { Item, Exhausted, Failed };

    /// Explicit result of one pull, so that a failed fetch is not mistaken
    /// for the end of the result set.
    struct IterationStep {
        Status                     status = Status::Exhausted;
        std::optional<T>           item;
        std::optional<PagingError> error;
    };

    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = T;
        using difference_type   = std::ptrdiff_t;
        using pointer           = const T*;
        using reference         = const T&;

        Iterator() = default;

        explicit Iterator(SyncIteratorAdapter* owner)
            : mOwner(owner) {
            advance();
        }

        reference operator*() const { return *mCurrent; }
        pointer operator->() const { return &*mCurrent; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const Iterator& other) const {
            return mOwner == other.mOwner;
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        void advance() {
            mCurrent = mOwner->next();
            if (!mCurrent) {
                mOwner = nullptr;
            }
        }

        SyncIteratorAdapter* mOwner = nullptr;
        std::optional<T>     mCurrent;
    };

    explicit SyncIteratorAdapter(std::shared_ptr<PageFetcher<T>> fetcher)
        : mFetcher(std::move(fetcher)) {
        if (!mFetcher) {
            throw std::invalid_argument("SyncIteratorAdapter requires a fetcher");
        }
    }

    /// Pull one item, reporting exhaustion and failure distinctly.
    IterationStep tryNext() {
        while (true) {
            if (auto item = mFetcher->nextBufferedItem()) {
                return IterationStep{Status::Item, std::move(item), std::nullopt};
            }

            auto outcome = mFetcher->fetchNextPageAndWait();
            if (!outcome) {
                return IterationStep{Status::Exhausted, std::nullopt, std::nullopt};
            }
            if (!outcome->ok()) {
                return IterationStep{Status::Failed, std::nullopt, std::move(outcome->error)};
            }
            // A fresh page is installed with the cursor at 0; an empty page
            // simply loops into the next fetch.
        }
    }

    /// Next item, or std::nullopt once the result set is exhausted.
    /// @throws PagingError if fetching the next page failed.
    std::optional<T> next() {
        auto step = tryNext();
        if (step.status == Status::Failed) {
            throw *step.error;
        }
        return std::move(step.item);
    }

    /// Range-for support. Iteration stops at exhaustion; a fetch failure
    /// propagates out of operator++ as PagingError.
    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

private:
    std::shared_ptr<PageFetcher<T>> mFetcher;
};

} // namespace blob_sync
