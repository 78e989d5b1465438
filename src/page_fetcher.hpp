#pragma once

#include "dispatcher.hpp"
#include "errors.hpp"
#include "http_types.hpp"
#include "page_codec.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <functional>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blob_sync {

/// Result of one page fetch: the new page or the error that prevented it.
template <typename T>
struct PageOutcome {
    std::optional<std::vector<T>> page;
    std::optional<PagingError>    error;

    bool ok() const { return page.has_value(); }
};

/// Result of a single-item pull.
template <typename T>
struct ItemOutcome {
    std::optional<T>           item;
    std::optional<PagingError> error;

    bool ok() const { return item.has_value(); }
};

/// Returned by iteration callbacks to keep going or to stop early.
enum class IterationControl { Continue, Stop };

/// Half-open range [begin, end) into the accumulated item buffer.
struct PageWindow {
    std::size_t begin = 0;
    std::size_t end   = 0;

    std::size_t size() const { return end - begin; }
};

/// Lazily walks a server result set that is split into pages linked by
/// continuation tokens.
///
/// The fetcher keeps every item it has seen in an append-only buffer. The
/// most recent page is a suffix window of that buffer. Follow-up requests reuse
/// the original request's method and headers. The URL comes from the
/// continuation builder. Fetches are strictly sequential. Starting a second
/// fetch while one is outstanding completes with a Transport error and changes
/// nothing.
///
/// Instances are always owned by a std::shared_ptr (see create()) so that an
/// in-flight request keeps the fetcher alive until its completion has run.
template <typename T = nlohmann::json>
class PageFetcher : public std::enable_shared_from_this<PageFetcher<T>> {
public:
    using PageHandler  = std::function<void(PageOutcome<T>)>;
    using ItemHandler  = std::function<void(ItemOutcome<T>)>;
    using PageCallback = std::function<IterationControl(const std::vector<T>&)>;
    using ItemCallback = std::function<IterationControl(const T&)>;

    struct Stats {
        int requestsIssued = 0;
        int pagesFetched   = 0;   // includes the initial page
        int itemsFetched   = 0;
        int failedRequests = 0;
    };

    /// @param executor    Issues follow-up requests.
    /// @param urlBuilder  Rewrites the template URL to carry a token.
    /// @param codec       Key paths for items and continuation token.
    /// @param dispatcher  Delivery context for async completions; null means
    ///                    completions run on the executor's thread.
    static std::shared_ptr<PageFetcher> create(std::shared_ptr<RequestExecutor> executor,
                                               ContinuationUrlBuilder urlBuilder,
                                               PageCodec codec = PageCodec(),
                                               std::shared_ptr<Dispatcher> dispatcher = nullptr,
                                               bool verbose = false) {
        return std::shared_ptr<PageFetcher>(new PageFetcher(std::move(executor),
                                                            std::move(urlBuilder),
                                                            std::move(codec),
                                                            std::move(dispatcher),
                                                            verbose));
    }

    PageFetcher(const PageFetcher&) = delete;
    PageFetcher& operator=(const PageFetcher&) = delete;

    // ---------------------------------------------------------------------
    // Seeding
    // ---------------------------------------------------------------------

    /// Install the first page from the response to @p requestTemplate.
    /// @throws PagingError{NoData}        if @p body is empty or not an object.
    /// @throws PagingError{NotPaged}      if the items path is absent.
    /// @throws PagingError{AmbiguousPath} if a key path matches twice.
    /// @throws PagingError{Decode}        if the body or an item cannot be decoded.
    void initialize(const HttpRequest& requestTemplate, const std::string& body) {
        auto decoded = decodePage(body);

        std::lock_guard<std::mutex> lock(mMutex);
        mRequestTemplate = requestTemplate;
        mItems.clear();
        mWindow.reset();
        installPage(std::move(decoded));
        mStats.pagesFetched = 1;
        mStats.itemsFetched = static_cast<int>(mItems.size());

        if (mVerbose) {
            std::cerr << "[PageFetcher] Initialized with " << mItems.size()
                      << " items" << (isExhaustedLocked() ? " (single page)" : "")
                      << "\n";
        }
    }

    // ---------------------------------------------------------------------
    // State queries
    // ---------------------------------------------------------------------

    bool isInitialized() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mWindow.has_value();
    }

    /// True once the server stopped returning a continuation token.
    bool isExhausted() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return isExhaustedLocked();
    }

    /// Items of the most recently fetched page, or std::nullopt before
    /// initialize().
    std::optional<std::vector<T>> currentPage() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return currentPageLocked();
    }

    /// Every item fetched so far, in server order.
    std::vector<T> items() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mItems;
    }

    /// Number of items fetched so far; more may remain on the server.
    std::size_t underestimatedCount() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mItems.size();
    }

    std::optional<PageWindow> pageWindow() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mWindow;
    }

    std::optional<std::string> continuationToken() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mContinuationToken;
    }

    std::size_t itemCursor() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mItemCursor;
    }

    Stats getStats() const {
        std::lock_guard<std::mutex> lock(mMutex);
        return mStats;
    }

    const PageCodec& codec() const { return mCodec; }

    void setVerbose(bool v) { mVerbose = v; }

    // ---------------------------------------------------------------------
    // Asynchronous consumption
    // ---------------------------------------------------------------------

    /// Fetch the page after the current one. The handler runs on the
    /// dispatcher. If the fetcher is exhausted the handler is never invoked.
    void fetchNextPage(PageHandler handler) {
        auto self = this->shared_from_this();
        startFetch([self, handler = std::move(handler)](PageOutcome<T> outcome) mutable {
            self->deliver([handler = std::move(handler), outcome = std::move(outcome)]() mutable {
                handler(std::move(outcome));
            });
        });
    }

    /// Deliver exactly one item, fetching the next page when the current one
    /// is used up. Empty pages are skipped while a continuation token remains.
    /// If the fetcher is exhausted the handler is never invoked.
    void nextItem(ItemHandler handler) {
        if (auto item = nextBufferedItem()) {
            deliver([handler = std::move(handler), item = std::move(*item)]() mutable {
                handler(ItemOutcome<T>{std::move(item), std::nullopt});
            });
            return;
        }

        auto self = this->shared_from_this();
        startFetch([self, handler = std::move(handler)](PageOutcome<T> outcome) mutable {
            if (!outcome.ok()) {
                self->deliver([handler = std::move(handler), error = *outcome.error]() mutable {
                    handler(ItemOutcome<T>{std::nullopt, std::move(error)});
                });
                return;
            }
            if (outcome.page->empty()) {
                // Nothing to hand out; pull the following page if one exists.
                self->nextItem(std::move(handler));
                return;
            }
            // The cursor already sits past this item.
            self->deliver([handler = std::move(handler),
                           item = std::move(outcome.page->front())]() mutable {
                handler(ItemOutcome<T>{std::move(item), std::nullopt});
            });
        }, /*takeFirstItem=*/true);
    }

    // ---------------------------------------------------------------------
    // Blocking consumption
    //
    // These wait for each fetch to finish on the calling thread. They must
    // not be called from the thread that runs the executor's completions.
    // ---------------------------------------------------------------------

    /// Deliver the current page, then each following page, until @p callback
    /// returns Stop or the result set is exhausted.
    /// @throws PagingError the first fetch failure encountered.
    void forEachPage(const PageCallback& callback) {
        auto page = currentPage();
        if (!page) return;
        if (callback(*page) == IterationControl::Stop) return;

        while (true) {
            auto outcome = fetchNextPageAndWait();
            if (!outcome) return;
            if (!outcome->ok()) throw *outcome->error;
            if (callback(*outcome->page) == IterationControl::Stop) return;
        }
    }

    /// Deliver items one at a time, starting at the item cursor, until
    /// @p callback returns Stop or the result set is exhausted.
    /// @throws PagingError the first fetch failure encountered.
    void forEachItem(const ItemCallback& callback) {
        forEachPage([this, &callback](const std::vector<T>&) {
            while (auto item = nextBufferedItem()) {
                if (callback(*item) == IterationControl::Stop) {
                    return IterationControl::Stop;
                }
            }
            // The cursor goes back to 0 when the next page is installed.
            return IterationControl::Continue;
        });
    }

    /// Fetch the next page and wait for it.
    /// @return std::nullopt if the fetcher is exhausted or uninitialized,
    ///         otherwise the outcome of the fetch.
    std::optional<PageOutcome<T>> fetchNextPageAndWait() {
        if (!isInitialized() || isExhausted()) {
            return std::nullopt;
        }

        std::promise<PageOutcome<T>> done;
        auto result = done.get_future();
        bool started = startFetch([&done](PageOutcome<T> outcome) {
            done.set_value(std::move(outcome));
        });
        if (!started) {
            return std::nullopt;
        }
        return result.get();
    }

    /// Hand out the item under the cursor and advance it, or std::nullopt
    /// when the current page is used up.
    std::optional<T> nextBufferedItem() {
        std::lock_guard<std::mutex> lock(mMutex);
        if (!mWindow || mItemCursor >= mWindow->size()) {
            return std::nullopt;
        }
        return mItems[mWindow->begin + mItemCursor++];
    }

private:
    struct DecodedPage {
        std::vector<T>             items;
        std::optional<std::string> continuationToken;
    };

    PageFetcher(std::shared_ptr<RequestExecutor> executor,
                ContinuationUrlBuilder urlBuilder,
                PageCodec codec,
                std::shared_ptr<Dispatcher> dispatcher,
                bool verbose)
        : mExecutor(std::move(executor))
        , mUrlBuilder(std::move(urlBuilder))
        , mCodec(std::move(codec))
        , mDispatcher(std::move(dispatcher))
        , mVerbose(verbose) {}

    /// Decode a raw body into items and token without touching any state.
    DecodedPage decodePage(const std::string& body) const {
        if (body.empty()) {
            throw PagingError(PagingError::Kind::NoData,
                              "Response data expected but not found");
        }

        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            throw PagingError(PagingError::Kind::Decode,
                              std::string("Failed to parse response body: ") + e.what());
        }
        if (!payload.is_object()) {
            throw PagingError(PagingError::Kind::NoData,
                              "Response data is not a key-value payload");
        }

        const auto rawItems = mCodec.extractItems(payload);

        DecodedPage page;
        page.continuationToken = mCodec.extractContinuationToken(payload);
        page.items.reserve(rawItems.size());
        for (std::size_t i = 0; i < rawItems.size(); ++i) {
            try {
                page.items.push_back(rawItems[i].template get<T>());
            } catch (const nlohmann::json::exception& e) {
                throw PagingError(PagingError::Kind::Decode,
                                  "Item " + std::to_string(i) + ": " + e.what());
            }
        }
        return page;
    }

    /// Append a decoded page and make it the current window. Caller holds mMutex.
    void installPage(DecodedPage page) {
        const std::size_t begin = mItems.size();
        mItems.insert(mItems.end(),
                      std::make_move_iterator(page.items.begin()),
                      std::make_move_iterator(page.items.end()));
        mWindow = PageWindow{begin, mItems.size()};
        mContinuationToken = std::move(page.continuationToken);
        mItemCursor = 0;
    }

    bool isExhaustedLocked() const {
        return !mContinuationToken || mContinuationToken->empty();
    }

    std::optional<std::vector<T>> currentPageLocked() const {
        if (!mWindow) return std::nullopt;
        return std::vector<T>(mItems.begin() + mWindow->begin,
                              mItems.begin() + mWindow->end);
    }

    /// Issue the follow-up request. @p onDone runs on the executor's thread.
    /// With @p takeFirstItem the first item of a non-empty page is claimed
    /// for the caller while the page is installed.
    /// @return false (and @p onDone is dropped) if there is nothing to fetch.
    bool startFetch(std::function<void(PageOutcome<T>)> onDone, bool takeFirstItem = false) {
        HttpRequest request;
        RequestContext context;
        std::optional<PagingError> rejected;
        {
            std::lock_guard<std::mutex> lock(mMutex);
            if (!mWindow || isExhaustedLocked()) {
                if (mVerbose) {
                    std::cerr << "[PageFetcher] No continuation token; not fetching.\n";
                }
                return false;
            }

            auto url = mUrlBuilder ? mUrlBuilder(mRequestTemplate.url, *mContinuationToken)
                                   : std::nullopt;
            if (mFetchInFlight) {
                rejected = PagingError(PagingError::Kind::Transport,
                                       "A page fetch is already in progress");
            } else if (!url) {
                rejected = PagingError(PagingError::Kind::Transport,
                                       "Unable to build continuation URL from " +
                                       mRequestTemplate.url);
            } else {
                request     = mRequestTemplate;
                request.url = *url;
                if (mCodec.xmlItemName()) {
                    context["xmlItemName"] = *mCodec.xmlItemName();
                }
                mFetchInFlight = true;
                ++mStats.requestsIssued;

                if (mVerbose) {
                    std::cerr << "[PageFetcher] Fetching next page with: "
                              << *mContinuationToken << "\n";
                }
            }
        }

        if (rejected) {
            std::cerr << "[PageFetcher] " << rejected->what() << "\n";
            onDone(PageOutcome<T>{std::nullopt, std::move(rejected)});
            return true;
        }

        auto self = this->shared_from_this();
        mExecutor->execute(request, context,
            [self, onDone = std::move(onDone), takeFirstItem](TransportResult result) {
                onDone(self->completeFetch(std::move(result), takeFirstItem));
            });
        return true;
    }

    /// Apply a transport result to the fetcher state. Failures leave the
    /// buffer, window, token and cursor exactly as they were.
    PageOutcome<T> completeFetch(TransportResult result, bool takeFirstItem) {
        std::optional<PagingError> error;
        std::optional<DecodedPage> decoded;

        if (!result.ok()) {
            error = PagingError(PagingError::Kind::Transport, result.error);
        } else if (result.response->httpStatus < 200 || result.response->httpStatus >= 300) {
            error = PagingError(PagingError::Kind::Transport,
                                "HTTP " + std::to_string(result.response->httpStatus));
        } else {
            try {
                decoded = decodePage(result.response->body);
            } catch (const PagingError& e) {
                error = e;
            }
        }

        std::lock_guard<std::mutex> lock(mMutex);
        mFetchInFlight = false;

        if (error) {
            ++mStats.failedRequests;
            std::cerr << "[PageFetcher] Page fetch failed: " << error->what() << "\n";
            return PageOutcome<T>{std::nullopt, std::move(error)};
        }

        const std::size_t count = decoded->items.size();
        installPage(std::move(*decoded));
        if (takeFirstItem && count > 0) {
            mItemCursor = 1;
        }
        ++mStats.pagesFetched;
        mStats.itemsFetched += static_cast<int>(count);

        if (mVerbose) {
            std::cerr << "[PageFetcher] Got " << count << " items (total so far: "
                      << mItems.size() << ")"
                      << (isExhaustedLocked() ? "; no more pages" : "") << "\n";
        }
        return PageOutcome<T>{currentPageLocked(), std::nullopt};
    }

    void deliver(std::function<void()> fn) {
        if (mDispatcher) {
            mDispatcher->post(std::move(fn));
        } else {
            fn();
        }
    }

    std::shared_ptr<RequestExecutor> mExecutor;
    ContinuationUrlBuilder           mUrlBuilder;
    const PageCodec                  mCodec;
    std::shared_ptr<Dispatcher>      mDispatcher;
    bool                             mVerbose;

    mutable std::mutex               mMutex;
    HttpRequest                      mRequestTemplate;
    std::vector<T>                   mItems;
    std::optional<PageWindow>        mWindow;
    std::optional<std::string>       mContinuationToken;
    std::size_t                      mItemCursor    = 0;
    bool                             mFetchInFlight = false;
    Stats                            mStats{};
};

} // namespace blob_sync
