#include "async_http_executor.hpp"
#include "util.hpp"

#include <boost/asio/post.hpp>

#include <iostream>
#include <stdexcept>
#include <thread>

namespace blob_sync {

AsyncHttpExecutor::AsyncHttpExecutor(HttpClientOptions options,
                                     int maxAttempts,
                                     std::size_t threads,
                                     bool verbose)
    : mState(std::make_shared<State>())
    , mPool(std::make_shared<boost::asio::thread_pool>(threads == 0 ? 1 : threads))
{
    mState->options     = std::move(options);
    mState->maxAttempts = maxAttempts < 1 ? 1 : maxAttempts;
    mState->verbose     = verbose;
}

AsyncHttpExecutor::~AsyncHttpExecutor() {
    if (!mPool->get_executor().running_in_this_thread()) {
        mPool->join();
        return;
    }

    // The last reference was dropped by a handler on one of our own threads.
    // That thread cannot join its pool, so the pool is joined and released
    // elsewhere once the current handler has returned.
    if (mState->verbose) {
        std::cerr << "[AsyncHttpExecutor] Released on a pool thread; "
                  << "deferring shutdown.\n";
    }
    std::thread([pool = std::move(mPool)]() { pool->join(); }).detach();
}

void AsyncHttpExecutor::execute(const HttpRequest& request,
                                const RequestContext& context,
                                Handler handler) {
    if (mState->verbose && !context.empty()) {
        for (const auto& entry : context) {
            std::cerr << "[AsyncHttpExecutor] context " << entry.first
                      << "=" << entry.second << "\n";
        }
    }

    boost::asio::post(*mPool, [state = mState, request, handler = std::move(handler)]() {
        handler(executeWithRetry(*state, request));
    });
}

AsyncHttpExecutor::Stats AsyncHttpExecutor::getStats() const {
    Stats stats;
    stats.totalRequests = mState->totalRequests.load();
    stats.totalRetries  = mState->totalRetries.load();
    return stats;
}

bool AsyncHttpExecutor::isRetryableStatus(unsigned int status) {
    return status == 429 || status >= 500;
}

// ---------------------------------------------------------------------------
// Private: retry wrapper
// ---------------------------------------------------------------------------

TransportResult AsyncHttpExecutor::executeWithRetry(State& state, const HttpRequest& request) {
    HttpClient client(state.options);
    client.setVerbose(state.verbose);

    for (int attempt = 0; attempt < state.maxAttempts; ++attempt) {
        const bool lastAttempt = (attempt == state.maxAttempts - 1);
        ++state.totalRequests;

        try {
            auto resp = client.execute(request);

            if (!isRetryableStatus(resp.httpStatus) || lastAttempt) {
                return TransportResult::success(std::move(resp));
            }

            ++state.totalRetries;
            auto backoff = computeBackoffMs(attempt);
            if (state.verbose) {
                std::cerr << "[Retry] HTTP " << resp.httpStatus
                          << " attempt " << (attempt + 1) << "/"
                          << state.maxAttempts << ", backoff "
                          << backoff.count() << " ms\n";
            }
            std::this_thread::sleep_for(backoff);

        } catch (const std::invalid_argument& e) {
            // Malformed URL or method; retrying cannot help.
            return TransportResult::failure(e.what());

        } catch (const std::exception& e) {
            if (lastAttempt) {
                std::cerr << "[Retry] Max retries exceeded.  Last error: "
                          << e.what() << "\n";
                return TransportResult::failure(
                    std::string("Max retries exceeded.  Last error: ") + e.what());
            }

            // Network / timeout: retryable.
            ++state.totalRetries;
            if (state.verbose) {
                std::cerr << "[Retry] Network error: " << e.what()
                          << " attempt " << (attempt + 1) << "/"
                          << state.maxAttempts << "\n";
            }
            std::this_thread::sleep_for(computeBackoffMs(attempt));
        }
    }

    return TransportResult::failure("Max retries exceeded (unreachable)");
}

} // namespace blob_sync
