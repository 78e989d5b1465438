#include "util.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <stdexcept>

namespace blob_sync {

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target[0] == '?') {
            parts.target.insert(0, "/");
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs, int64_t maxMs) {
    // Exponential: base * 2^attempt, clamped to maxMs.
    int64_t backoff = baseMs * (int64_t{1} << std::min(attempt, 30));
    backoff = std::min(backoff, maxMs);

    // Jitter: uniform random in [0, 100] ms.
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int64_t> jitter(0, 100);
    backoff += jitter(rng);

    return std::chrono::milliseconds(backoff);
}

std::string percentEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string withQueryParameter(const std::string& url,
                               const std::string& name,
                               const std::string& value) {
    if (name.empty()) {
        throw std::invalid_argument("Query parameter name must not be empty");
    }

    // Split off the fragment; it stays at the very end.
    std::string fragment;
    std::string base = url;
    auto hash = base.find('#');
    if (hash != std::string::npos) {
        fragment = base.substr(hash);
        base.erase(hash);
    }

    std::string path  = base;
    std::string query;
    auto qmark = base.find('?');
    if (qmark != std::string::npos) {
        path  = base.substr(0, qmark);
        query = base.substr(qmark + 1);
    }

    // Keep every pair except the ones named `name`.
    std::string kept;
    std::size_t pos = 0;
    while (pos <= query.size() && !query.empty()) {
        auto amp = query.find('&', pos);
        auto end = (amp == std::string::npos) ? query.size() : amp;
        std::string pair = query.substr(pos, end - pos);
        std::string key  = pair.substr(0, pair.find('='));
        if (!pair.empty() && key != name) {
            if (!kept.empty()) kept += '&';
            kept += pair;
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }

    if (!kept.empty()) kept += '&';
    kept += name + "=" + percentEncode(value);

    return path + "?" + kept + fragment;
}

ContinuationUrlBuilder queryParameterUrlBuilder(const std::string& name) {
    return [name](const std::string& requestUrl,
                  const std::string& token) -> std::optional<std::string> {
        try {
            return withQueryParameter(requestUrl, name, token);
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    };
}

} // namespace blob_sync
