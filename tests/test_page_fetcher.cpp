/// @file test_page_fetcher.cpp
/// Unit tests for page_fetcher.hpp: buffer/window bookkeeping, follow-up
/// requests, the four consumption modes and failure isolation.

#include "dispatcher.hpp"
#include "errors.hpp"
#include "page_fetcher.hpp"
#include "test_support.hpp"
#include "util.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace blob_sync;
using namespace blob_sync::test_support;
using json = nlohmann::json;

namespace {

struct BlobItem {
    std::string   name;
    std::uint64_t size = 0;
};

void from_json(const json& j, BlobItem& b) {
    b.name = j.at("name").get<std::string>();
    b.size = j.value("size", std::uint64_t{0});
}

HttpRequest listRequest() {
    HttpRequest req;
    req.method = "GET";
    req.url    = "http://localhost:10000/photos?comp=list";
    req.headers["x-ms-version"] = "2019-02-02";
    req.headers["Accept"]       = "application/json";
    return req;
}

class PageFetcherTest : public ::testing::Test {
protected:
    std::shared_ptr<ScriptedExecutor> executor = std::make_shared<ScriptedExecutor>();

    std::shared_ptr<PageFetcher<json>> makeFetcher(PageCodec codec = PageCodec()) {
        return PageFetcher<json>::create(executor,
                                         queryParameterUrlBuilder("marker"),
                                         std::move(codec));
    }

    std::shared_ptr<PageFetcher<json>> seeded(const json& items,
                                              const std::optional<std::string>& token) {
        auto fetcher = makeFetcher();
        fetcher->initialize(listRequest(), makePage(items, token).dump());
        return fetcher;
    }
};

} // namespace

// ============================================================================
// initialize
// ============================================================================

TEST_F(PageFetcherTest, UninitializedFetcherHasNoPage) {
    auto fetcher = makeFetcher();
    EXPECT_FALSE(fetcher->isInitialized());
    EXPECT_FALSE(fetcher->currentPage().has_value());
    EXPECT_FALSE(fetcher->pageWindow().has_value());
    EXPECT_TRUE(fetcher->isExhausted());
}

TEST_F(PageFetcherTest, InitializeInstallsFirstPage) {
    auto fetcher = seeded(json::array({"a", "b", "c"}), std::string("t1"));

    ASSERT_TRUE(fetcher->isInitialized());
    EXPECT_EQ(fetcher->underestimatedCount(), 3u);
    auto window = fetcher->pageWindow();
    ASSERT_TRUE(window.has_value());
    EXPECT_EQ(window->begin, 0u);
    EXPECT_EQ(window->end, 3u);

    auto page = fetcher->currentPage();
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->size(), 3u);
    EXPECT_EQ((*page)[0], "a");
    EXPECT_EQ((*page)[2], "c");

    EXPECT_EQ(fetcher->continuationToken().value(), "t1");
    EXPECT_FALSE(fetcher->isExhausted());
    EXPECT_EQ(fetcher->itemCursor(), 0u);
    EXPECT_EQ(executor->requestCount(), 0u);
}

TEST_F(PageFetcherTest, InitializeWithoutTokenIsExhausted) {
    auto fetcher = seeded(json::array({1}), std::nullopt);
    EXPECT_TRUE(fetcher->isExhausted());
}

TEST_F(PageFetcherTest, EmptyTokenIsExhausted) {
    auto fetcher = seeded(json::array({1}), std::string(""));
    EXPECT_TRUE(fetcher->isExhausted());
}

TEST_F(PageFetcherTest, InitializeErrors) {
    auto fetcher = makeFetcher();

    try {
        fetcher->initialize(listRequest(), "");
        FAIL() << "expected NoData";
    } catch (const PagingError& e) {
        EXPECT_EQ(e.kind(), PagingError::Kind::NoData);
    }

    try {
        fetcher->initialize(listRequest(), R"({"value": []})");
        FAIL() << "expected NotPaged";
    } catch (const PagingError& e) {
        EXPECT_EQ(e.kind(), PagingError::Kind::NotPaged);
    }

    try {
        fetcher->initialize(listRequest(), "{not json");
        FAIL() << "expected Decode";
    } catch (const PagingError& e) {
        EXPECT_EQ(e.kind(), PagingError::Kind::Decode);
    }

    try {
        fetcher->initialize(listRequest(), "[1, 2]");
        FAIL() << "expected NoData";
    } catch (const PagingError& e) {
        EXPECT_EQ(e.kind(), PagingError::Kind::NoData);
    }

    EXPECT_FALSE(fetcher->isInitialized());
}

TEST_F(PageFetcherTest, TypedItemsDecode) {
    auto fetcher = PageFetcher<BlobItem>::create(executor, queryParameterUrlBuilder("marker"));
    fetcher->initialize(listRequest(),
                        makePage(json::array({{{"name", "a.jpg"}, {"size", 10}},
                                              {{"name", "b.jpg"}}}),
                                 std::nullopt).dump());

    auto page = fetcher->currentPage();
    ASSERT_TRUE(page.has_value());
    ASSERT_EQ(page->size(), 2u);
    EXPECT_EQ((*page)[0].name, "a.jpg");
    EXPECT_EQ((*page)[0].size, 10u);
    EXPECT_EQ((*page)[1].size, 0u);
}

TEST_F(PageFetcherTest, UndecodableItemIsDecodeError) {
    auto fetcher = PageFetcher<BlobItem>::create(executor, queryParameterUrlBuilder("marker"));
    try {
        fetcher->initialize(listRequest(),
                            makePage(json::array({{{"size", 1}}}), std::nullopt).dump());
        FAIL() << "expected Decode";
    } catch (const PagingError& e) {
        EXPECT_EQ(e.kind(), PagingError::Kind::Decode);
    }
}

// ============================================================================
// fetchNextPage
// ============================================================================

TEST_F(PageFetcherTest, FetchNextPageAppendsAndAdvancesWindow) {
    auto fetcher = seeded(json::array({"a", "b"}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({"c", "d", "e"}), std::string("t2")));

    std::optional<PageOutcome<json>> received;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { received = std::move(outcome); });

    ASSERT_TRUE(received.has_value());
    ASSERT_TRUE(received->ok());
    ASSERT_EQ(received->page->size(), 3u);
    EXPECT_EQ((*received->page)[0], "c");

    auto all = fetcher->items();
    ASSERT_EQ(all.size(), 5u);
    EXPECT_EQ(all[0], "a");
    EXPECT_EQ(all[1], "b");
    EXPECT_EQ(all[4], "e");

    auto window = fetcher->pageWindow();
    EXPECT_EQ(window->begin, 2u);
    EXPECT_EQ(window->end, 5u);
    EXPECT_EQ(fetcher->continuationToken().value(), "t2");
    EXPECT_EQ(fetcher->itemCursor(), 0u);
}

TEST_F(PageFetcherTest, FollowUpRequestReusesTemplate) {
    auto fetcher = seeded(json::array({1}), std::string("next token/1"));
    executor->enqueuePage(makePage(json::array({2}), std::nullopt));

    fetcher->fetchNextPage([](PageOutcome<json>) {});

    auto requests = executor->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].method, "GET");
    EXPECT_EQ(requests[0].url,
              "http://localhost:10000/photos?comp=list&marker=next%20token%2F1");
    EXPECT_EQ(requests[0].headers.at("x-ms-version"), "2019-02-02");
    EXPECT_EQ(requests[0].headers.at("Accept"), "application/json");
}

TEST_F(PageFetcherTest, BufferNeverShrinksAcrossPages) {
    auto fetcher = seeded(json::array({0, 1}), std::string("p1"));
    executor->enqueuePage(makePage(json::array({2}), std::string("p2")));
    executor->enqueuePage(makePage(json::array(), std::string("p3")));
    executor->enqueuePage(makePage(json::array({3, 4, 5}), std::nullopt));

    std::size_t previous = fetcher->underestimatedCount();
    for (int i = 0; i < 3; ++i) {
        fetcher->fetchNextPage([](PageOutcome<json> outcome) { ASSERT_TRUE(outcome.ok()); });
        EXPECT_GE(fetcher->underestimatedCount(), previous);
        previous = fetcher->underestimatedCount();
    }

    auto all = fetcher->items();
    ASSERT_EQ(all.size(), 6u);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(all[i], i) << "item " << i << " moved";
    }
    EXPECT_TRUE(fetcher->isExhausted());
}

TEST_F(PageFetcherTest, ExhaustedFetcherNeverCallsCompletion) {
    auto fetcher = seeded(json::array({1}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({2}), std::nullopt));

    int calls = 0;
    fetcher->fetchNextPage([&](PageOutcome<json>) { ++calls; });
    ASSERT_EQ(calls, 1);
    ASSERT_TRUE(fetcher->isExhausted());

    fetcher->fetchNextPage([&](PageOutcome<json>) { ++calls; });
    fetcher->fetchNextPage([&](PageOutcome<json>) { ++calls; });
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor->requestCount(), 1u);
}

TEST_F(PageFetcherTest, TransportFailureLeavesStateIntact) {
    auto fetcher = seeded(json::array({"a", "b"}), std::string("t1"));
    executor->enqueueError("connection reset");
    executor->enqueuePage(makePage(json::array({"c"}), std::nullopt));

    std::optional<PageOutcome<json>> received;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { received = std::move(outcome); });

    ASSERT_TRUE(received.has_value());
    ASSERT_FALSE(received->ok());
    EXPECT_EQ(received->error->kind(), PagingError::Kind::Transport);
    EXPECT_EQ(fetcher->underestimatedCount(), 2u);
    EXPECT_EQ(fetcher->pageWindow()->begin, 0u);
    EXPECT_EQ(fetcher->continuationToken().value(), "t1");
    EXPECT_EQ(fetcher->getStats().failedRequests, 1);

    // Retrying picks up where it left off.
    received.reset();
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { received = std::move(outcome); });
    ASSERT_TRUE(received->ok());
    EXPECT_EQ(fetcher->underestimatedCount(), 3u);

    auto requests = executor->requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].url, requests[1].url);
}

TEST_F(PageFetcherTest, HttpErrorStatusIsTransportError) {
    auto fetcher = seeded(json::array({1}), std::string("t1"));
    executor->enqueueRaw(R"({"error": "throttled"})", 503);

    std::optional<PageOutcome<json>> received;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { received = std::move(outcome); });

    ASSERT_FALSE(received->ok());
    EXPECT_EQ(received->error->kind(), PagingError::Kind::Transport);
    EXPECT_EQ(fetcher->underestimatedCount(), 1u);
}

TEST_F(PageFetcherTest, MalformedFollowUpPageLeavesStateIntact) {
    auto fetcher = seeded(json::array({1}), std::string("t1"));
    executor->enqueuePage(json{{"unexpected", true}});

    std::optional<PageOutcome<json>> received;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { received = std::move(outcome); });

    ASSERT_FALSE(received->ok());
    EXPECT_EQ(received->error->kind(), PagingError::Kind::NotPaged);
    EXPECT_EQ(fetcher->continuationToken().value(), "t1");
    EXPECT_EQ(fetcher->currentPage()->size(), 1u);
}

TEST_F(PageFetcherTest, EmptyFollowUpBodyIsNoData) {
    auto fetcher = seeded(json::array({1}), std::string("t1"));
    executor->enqueueRaw("");

    std::optional<PageOutcome<json>> received;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { received = std::move(outcome); });

    ASSERT_FALSE(received->ok());
    EXPECT_EQ(received->error->kind(), PagingError::Kind::NoData);
}

TEST_F(PageFetcherTest, SecondFetchWhileOutstandingIsRejected) {
    executor = std::make_shared<ScriptedExecutor>(ScriptedExecutor::Mode::Manual);
    auto fetcher = seeded(json::array({1}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({2}), std::nullopt));

    std::optional<PageOutcome<json>> first;
    std::optional<PageOutcome<json>> second;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { first = std::move(outcome); });
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { second = std::move(outcome); });

    ASSERT_TRUE(second.has_value());
    ASSERT_FALSE(second->ok());
    EXPECT_EQ(second->error->kind(), PagingError::Kind::Transport);
    EXPECT_FALSE(first.has_value());
    EXPECT_EQ(executor->requestCount(), 1u);

    ASSERT_TRUE(executor->completePending());
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->ok());
    EXPECT_EQ(fetcher->underestimatedCount(), 2u);
}

TEST_F(PageFetcherTest, UrlBuilderFailureIsReported) {
    auto fetcher = PageFetcher<json>::create(
        executor,
        [](const std::string&, const std::string&) -> std::optional<std::string> {
            return std::nullopt;
        });
    fetcher->initialize(listRequest(), makePage(json::array({1}), std::string("t1")).dump());

    std::optional<PageOutcome<json>> received;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) { received = std::move(outcome); });

    ASSERT_TRUE(received.has_value());
    EXPECT_FALSE(received->ok());
    EXPECT_EQ(executor->requestCount(), 0u);
}

TEST_F(PageFetcherTest, XmlItemNameTravelsInRequestContext) {
    auto fetcher = makeFetcher(PageCodec("Blobs", "NextMarker", "Blob"));
    fetcher->initialize(listRequest(),
                        json{{"Blobs", {{"Blob", json::array({1})}}}, {"NextMarker", "m"}}.dump());
    executor->enqueuePage(json{{"Blobs", {{"Blob", json::array({2})}}}});

    fetcher->fetchNextPage([](PageOutcome<json>) {});

    auto contexts = executor->contexts();
    ASSERT_EQ(contexts.size(), 1u);
    EXPECT_EQ(contexts[0].at("xmlItemName"), "Blob");
    EXPECT_EQ(fetcher->underestimatedCount(), 2u);
}

TEST_F(PageFetcherTest, CompletionsGoThroughDispatcher) {
    boost::asio::io_context ioc;
    auto fetcher = PageFetcher<json>::create(executor,
                                             queryParameterUrlBuilder("marker"),
                                             PageCodec(),
                                             std::make_shared<AsioDispatcher>(ioc));
    fetcher->initialize(listRequest(), makePage(json::array({1}), std::string("t1")).dump());
    executor->enqueuePage(makePage(json::array({2}), std::nullopt));

    bool delivered = false;
    fetcher->fetchNextPage([&](PageOutcome<json> outcome) {
        EXPECT_TRUE(outcome.ok());
        delivered = true;
    });

    // State is already updated, but the user callback waits for the context.
    EXPECT_FALSE(delivered);
    EXPECT_EQ(fetcher->underestimatedCount(), 2u);

    ioc.run();
    EXPECT_TRUE(delivered);
}

TEST_F(PageFetcherTest, StatsCountPagesAndItems) {
    auto fetcher = seeded(json::array({1, 2}), std::string("t1"));
    executor->enqueueError("boom");
    executor->enqueuePage(makePage(json::array({3}), std::nullopt));

    fetcher->fetchNextPage([](PageOutcome<json>) {});
    fetcher->fetchNextPage([](PageOutcome<json>) {});

    auto stats = fetcher->getStats();
    EXPECT_EQ(stats.requestsIssued, 2);
    EXPECT_EQ(stats.pagesFetched, 2);
    EXPECT_EQ(stats.itemsFetched, 3);
    EXPECT_EQ(stats.failedRequests, 1);
}

// ============================================================================
// forEachPage
// ============================================================================

TEST_F(PageFetcherTest, ForEachPageVisitsEveryPage) {
    auto fetcher = seeded(json::array({1, 2}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({3}), std::string("t2")));
    executor->enqueuePage(makePage(json::array({4, 5}), std::nullopt));

    std::vector<std::size_t> sizes;
    fetcher->forEachPage([&](const std::vector<json>& page) {
        sizes.push_back(page.size());
        return IterationControl::Continue;
    });

    ASSERT_EQ(sizes.size(), 3u);
    EXPECT_EQ(sizes[0], 2u);
    EXPECT_EQ(sizes[1], 1u);
    EXPECT_EQ(sizes[2], 2u);
    EXPECT_EQ(executor->requestCount(), 2u);
}

TEST_F(PageFetcherTest, ForEachPageStopsWhenAsked) {
    auto fetcher = seeded(json::array({1}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({2}), std::string("t2")));
    executor->enqueuePage(makePage(json::array({3}), std::nullopt));

    int pages = 0;
    fetcher->forEachPage([&](const std::vector<json>&) {
        return ++pages == 2 ? IterationControl::Stop : IterationControl::Continue;
    });

    EXPECT_EQ(pages, 2);
    EXPECT_EQ(executor->requestCount(), 1u);
    EXPECT_FALSE(fetcher->isExhausted());
}

TEST_F(PageFetcherTest, ForEachPagePropagatesFetchError) {
    auto fetcher = seeded(json::array({1}), std::string("t1"));
    executor->enqueueError("network down");

    int pages = 0;
    try {
        fetcher->forEachPage([&](const std::vector<json>&) {
            ++pages;
            return IterationControl::Continue;
        });
        FAIL() << "expected PagingError";
    } catch (const PagingError& e) {
        EXPECT_EQ(e.kind(), PagingError::Kind::Transport);
    }
    EXPECT_EQ(pages, 1);
}

TEST_F(PageFetcherTest, ForEachPageOnUninitializedFetcherDoesNothing) {
    auto fetcher = makeFetcher();
    int pages = 0;
    fetcher->forEachPage([&](const std::vector<json>&) {
        ++pages;
        return IterationControl::Continue;
    });
    EXPECT_EQ(pages, 0);
}

// ============================================================================
// forEachItem
// ============================================================================

TEST_F(PageFetcherTest, ForEachItemVisitsItemsInOrder) {
    auto fetcher = seeded(json::array({0, 1}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({2, 3}), std::string("t2")));
    executor->enqueuePage(makePage(json::array({4}), std::nullopt));

    std::vector<int> seen;
    fetcher->forEachItem([&](const json& item) {
        seen.push_back(item.get<int>());
        return IterationControl::Continue;
    });

    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(PageFetcherTest, ForEachItemStopsAfterKItemsWithoutExtraFetches) {
    auto fetcher = seeded(json::array({0, 1}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({2, 3}), std::string("t2")));
    executor->enqueuePage(makePage(json::array({4, 5}), std::nullopt));

    std::vector<int> seen;
    fetcher->forEachItem([&](const json& item) {
        seen.push_back(item.get<int>());
        return seen.size() == 3 ? IterationControl::Stop : IterationControl::Continue;
    });

    EXPECT_EQ(seen, (std::vector<int>{0, 1, 2}));
    EXPECT_EQ(executor->requestCount(), 1u);
}

TEST_F(PageFetcherTest, ForEachItemSkipsEmptyPages) {
    auto fetcher = seeded(json::array({0}), std::string("t1"));
    executor->enqueuePage(makePage(json::array(), std::string("t2")));
    executor->enqueuePage(makePage(json::array({1}), std::nullopt));

    std::vector<int> seen;
    fetcher->forEachItem([&](const json& item) {
        seen.push_back(item.get<int>());
        return IterationControl::Continue;
    });

    EXPECT_EQ(seen, (std::vector<int>{0, 1}));
}

// ============================================================================
// nextItem
// ============================================================================

TEST_F(PageFetcherTest, NextItemWalksPageThenFetchesOnce) {
    auto fetcher = seeded(json::array({"a", "b", "c"}), std::string("t1"));
    executor->enqueuePage(makePage(json::array({"d", "e"}), std::nullopt));

    std::vector<std::string> seen;
    auto collect = [&](ItemOutcome<json> outcome) {
        ASSERT_TRUE(outcome.ok());
        seen.push_back(outcome.item->get<std::string>());
    };

    for (int i = 0; i < 3; ++i) {
        fetcher->nextItem(collect);
    }
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(executor->requestCount(), 0u);

    fetcher->nextItem(collect);
    EXPECT_EQ(executor->requestCount(), 1u);
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[3], "d");
    EXPECT_EQ(fetcher->itemCursor(), 1u);

    fetcher->nextItem(collect);
    EXPECT_EQ(seen.back(), "e");
    EXPECT_EQ(executor->requestCount(), 1u);
}

TEST_F(PageFetcherTest, NextItemClaimsFirstItemWhenPageArrives) {
    boost::asio::io_context ioc;
    executor = std::make_shared<ScriptedExecutor>(ScriptedExecutor::Mode::Manual);
    auto fetcher = PageFetcher<json>::create(executor, queryParameterUrlBuilder("marker"),
                                             PageCodec(), std::make_shared<AsioDispatcher>(ioc));
    fetcher->initialize(listRequest(), makePage(json::array(), std::string("t1")).dump());
    executor->enqueuePage(makePage(json::array({"d", "e"}), std::nullopt));

    std::optional<std::string> delivered;
    fetcher->nextItem([&](ItemOutcome<json> outcome) {
        ASSERT_TRUE(outcome.ok());
        delivered = outcome.item->get<std::string>();
    });
    ASSERT_TRUE(executor->completePending());

    // Delivery is still queued, but "d" is already taken.
    EXPECT_EQ(fetcher->itemCursor(), 1u);
    auto next = fetcher->nextBufferedItem();
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(*next, "e");

    ioc.run();
    EXPECT_EQ(delivered, std::optional<std::string>("d"));
}

TEST_F(PageFetcherTest, NextItemNeverSharesItemWithConcurrentReader) {
    for (int round = 0; round < 20; ++round) {
        executor = std::make_shared<ScriptedExecutor>(ScriptedExecutor::Mode::Thread);
        auto fetcher = seeded(json::array(), std::string("t1"));
        json page = json::array();
        for (int i = 0; i < 200; ++i) page.push_back(i);
        executor->enqueuePage(makePage(page, std::nullopt));

        std::atomic<bool> delivered{false};
        int first = -1;
        fetcher->nextItem([&](ItemOutcome<json> outcome) {
            ASSERT_TRUE(outcome.ok());
            first = outcome.item->get<int>();
            delivered = true;
        });

        // Drains the page while nextItem installs it.
        std::vector<int> polled;
        std::thread reader([&]() {
            while (true) {
                if (auto item = fetcher->nextBufferedItem()) {
                    polled.push_back(item->get<int>());
                } else if (delivered) {
                    break;
                } else {
                    std::this_thread::yield();
                }
            }
        });
        reader.join();

        EXPECT_EQ(first, 0);
        ASSERT_EQ(polled.size(), 199u) << "round " << round;
        for (std::size_t i = 0; i < polled.size(); ++i) {
            EXPECT_EQ(polled[i], static_cast<int>(i) + 1);
        }
    }
}

TEST_F(PageFetcherTest, NextItemOnExhaustedFetcherNeverCompletes) {
    auto fetcher = seeded(json::array({"only"}), std::nullopt);

    int calls = 0;
    fetcher->nextItem([&](ItemOutcome<json>) { ++calls; });
    fetcher->nextItem([&](ItemOutcome<json>) { ++calls; });

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(executor->requestCount(), 0u);
}

TEST_F(PageFetcherTest, NextItemSkipsEmptyPageWhileTokenRemains) {
    auto fetcher = seeded(json::array({"a"}), std::string("t1"));
    executor->enqueuePage(makePage(json::array(), std::string("t2")));
    executor->enqueuePage(makePage(json::array({"b"}), std::nullopt));

    std::vector<std::string> seen;
    auto collect = [&](ItemOutcome<json> outcome) {
        ASSERT_TRUE(outcome.ok());
        seen.push_back(outcome.item->get<std::string>());
    };
    fetcher->nextItem(collect);
    fetcher->nextItem(collect);

    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(executor->requestCount(), 2u);
}

TEST_F(PageFetcherTest, NextItemTreatsFinalEmptyPageAsExhaustion) {
    auto fetcher = seeded(json::array({"a"}), std::string("t1"));
    executor->enqueuePage(makePage(json::array(), std::nullopt));

    int calls = 0;
    fetcher->nextItem([&](ItemOutcome<json>) { ++calls; });
    fetcher->nextItem([&](ItemOutcome<json>) { ++calls; });

    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(fetcher->isExhausted());
}

TEST_F(PageFetcherTest, NextItemReportsFetchFailure) {
    auto fetcher = seeded(json::array({"a"}), std::string("t1"));
    executor->enqueueError("timeout");

    fetcher->nextItem([](ItemOutcome<json>) {});

    std::optional<ItemOutcome<json>> received;
    fetcher->nextItem([&](ItemOutcome<json> outcome) { received = std::move(outcome); });

    ASSERT_TRUE(received.has_value());
    ASSERT_FALSE(received->ok());
    EXPECT_EQ(received->error->kind(), PagingError::Kind::Transport);
    EXPECT_EQ(fetcher->itemCursor(), 1u);
}

TEST_F(PageFetcherTest, ForEachItemResumesFromItemCursor) {
    auto fetcher = seeded(json::array({0, 1, 2}), std::nullopt);

    fetcher->nextItem([](ItemOutcome<json>) {});

    std::vector<int> seen;
    fetcher->forEachItem([&](const json& item) {
        seen.push_back(item.get<int>());
        return IterationControl::Continue;
    });
    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}
