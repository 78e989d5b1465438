#pragma once

#include "http_types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace blob_sync {

/// Decomposed URL components.
struct UrlParts {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::string port;     // "80", "443", "10000", etc.
    std::string target;   // path + query (e.g. "/container?comp=list")
};

/// Parse an HTTP(S) URL into its components.
/// Throws std::invalid_argument on malformed input.
UrlParts parseUrl(const std::string& url);

/// Compute exponential-backoff delay with random jitter.
/// attempt is 0-based.  Clamped to [baseMs .. maxMs] before jitter.
std::chrono::milliseconds computeBackoffMs(int attempt,
                                           int64_t baseMs = 200,
                                           int64_t maxMs  = 5000);

/// RFC 3986 percent-encoding of everything outside the unreserved set.
std::string percentEncode(const std::string& value);

/// Set @p name=@p value in the query string of @p url, replacing any existing
/// occurrences of @p name.  Fragments are preserved.
std::string withQueryParameter(const std::string& url,
                               const std::string& name,
                               const std::string& value);

/// Continuation builder that carries the token in query parameter @p name.
ContinuationUrlBuilder queryParameterUrlBuilder(const std::string& name = "continuationToken");

} // namespace blob_sync
