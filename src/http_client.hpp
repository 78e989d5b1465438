#pragma once

#include "http_types.hpp"

#include <string>

namespace blob_sync {

struct HttpClientOptions {
    int         timeoutMs = 5000;
    std::string userAgent = "blob_sync/1.0";
};

/// Low-level blocking HTTP client built on Boost.Beast.
/// Sends one request and returns the status and raw body.
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options = HttpClientOptions());

    /// Perform @p request.
    /// @throws std::runtime_error on network / timeout / TLS errors.
    /// @throws std::invalid_argument on a malformed URL.
    HttpResponse execute(const HttpRequest& request);

    void setVerbose(bool v) { mVerbose = v; }

private:
    HttpClientOptions mOptions;
    bool              mVerbose = false;
};

} // namespace blob_sync
