#pragma once

#include "http_client.hpp"
#include "http_types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <cstddef>
#include <memory>

namespace blob_sync {

/// RequestExecutor that runs HttpClient on a worker pool and retries
/// transient failures (HTTP 429 / 5xx and network errors) with
/// exponential backoff. Handlers run on a pool thread.
///
/// A handler may own the last reference to the executor (a fetcher that
/// captured itself, for instance). The executor can therefore be destroyed
/// on one of its own pool threads; queued requests still complete.
class AsyncHttpExecutor : public RequestExecutor {
public:
    struct Stats {
        int totalRequests = 0;
        int totalRetries  = 0;
    };

    explicit AsyncHttpExecutor(HttpClientOptions options = HttpClientOptions(),
                               int maxAttempts = 6,
                               std::size_t threads = 2,
                               bool verbose = false);

    /// Waits for queued requests to finish. On a pool thread the wait is
    /// handed to a detached thread instead.
    ~AsyncHttpExecutor() override;

    void execute(const HttpRequest& request,
                 const RequestContext& context,
                 Handler handler) override;

    Stats getStats() const;

    static bool isRetryableStatus(unsigned int status);

private:
    /// Settings and counters shared with queued work, which may outlive
    /// the executor object.
    struct State {
        HttpClientOptions options;
        int               maxAttempts = 1;
        bool              verbose     = false;
        std::atomic<int>  totalRequests{0};
        std::atomic<int>  totalRetries{0};
    };

    /// Blocking request with retry; never throws.
    static TransportResult executeWithRetry(State& state, const HttpRequest& request);

    std::shared_ptr<State>                    mState;
    std::shared_ptr<boost::asio::thread_pool> mPool;
};

} // namespace blob_sync
