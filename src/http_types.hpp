#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace blob_sync {

using HttpHeaders = std::map<std::string, std::string>;

/// Method, URL and headers of one request. The first request of a paged
/// query doubles as the template for every follow-up fetch.
struct HttpRequest {
    std::string method = "GET";
    std::string url;
    HttpHeaders headers;
};

/// Free-form hints passed alongside a request (e.g. "xmlItemName").
using RequestContext = std::map<std::string, std::string>;

struct HttpResponse {
    unsigned int httpStatus = 0;
    std::string  body;
};

/// Either a response or a transport error message, never both.
struct TransportResult {
    std::optional<HttpResponse> response;
    std::string                 error;

    bool ok() const { return response.has_value(); }

    static TransportResult success(HttpResponse r) {
        TransportResult t;
        t.response = std::move(r);
        return t;
    }
    static TransportResult failure(std::string message) {
        TransportResult t;
        t.error = std::move(message);
        return t;
    }
};

/// Asynchronous request collaborator. Implementations may invoke the handler
/// on any thread, exactly once per call.
class RequestExecutor {
public:
    using Handler = std::function<void(TransportResult)>;

    virtual ~RequestExecutor() = default;

    virtual void execute(const HttpRequest& request,
                         const RequestContext& context,
                         Handler handler) = 0;
};

/// Produces the URL of the next page from the original request URL and a
/// continuation token. Returning std::nullopt aborts the fetch.
using ContinuationUrlBuilder =
    std::function<std::optional<std::string>(const std::string& requestUrl,
                                             const std::string& token)>;

} // namespace blob_sync
