#include "http_client.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef BLOB_SYNC_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace blob_sync {

namespace {

http::request<http::string_body> buildRequest(const HttpRequest& request,
                                              const UrlParts& parts,
                                              const std::string& userAgent) {
    auto verb = http::string_to_verb(request.method);
    if (verb == http::verb::unknown) {
        throw std::invalid_argument("Unsupported HTTP method: " + request.method);
    }

    http::request<http::string_body> req{verb, parts.target, 11};
    req.set(http::field::host, parts.host);
    req.set(http::field::user_agent, userAgent);
    for (const auto& header : request.headers) {
        req.set(header.first, header.second);
    }
    req.prepare_payload();
    return req;
}

template <typename Stream>
HttpResponse readResponse(Stream& stream, int timeoutMs) {
    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(std::chrono::milliseconds(timeoutMs));
    http::read(stream, buffer, res);

    HttpResponse response;
    response.httpStatus = res.result_int();
    response.body       = std::move(res.body());
    return response;
}

} // namespace

HttpClient::HttpClient(HttpClientOptions options)
    : mOptions(std::move(options)) {}

HttpResponse HttpClient::execute(const HttpRequest& request) {
    const auto parts = parseUrl(request.url);

    if (mVerbose) {
        std::cerr << "[HttpClient] " << request.method << " " << parts.host
                  << ":" << parts.port << parts.target << "\n";
    }

    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    auto req = buildRequest(request, parts, mOptions.userAgent);

    if (parts.scheme == "https") {
#ifdef BLOB_SYNC_HAS_SSL
        namespace ssl = net::ssl;

        ssl::context ctx(ssl::context::tlsv12_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

        // SNI hostname.
        if (!SSL_set_tlsext_host_name(stream.native_handle(), parts.host.c_str())) {
            throw std::runtime_error("Failed to set SNI hostname");
        }

        auto const results = resolver.resolve(parts.host, parts.port);
        beast::get_lowest_layer(stream).expires_after(
            std::chrono::milliseconds(mOptions.timeoutMs));
        beast::get_lowest_layer(stream).connect(results);
        stream.handshake(ssl::stream_base::client);

        http::write(stream, req);
        auto response = readResponse(stream, mOptions.timeoutMs);

        if (mVerbose) {
            std::cerr << "[HttpClient] HTTPS " << response.httpStatus << "\n";
        }

        beast::error_code ec;
        stream.shutdown(ec);
        return response;
#else
        throw std::runtime_error(
            "HTTPS endpoint requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
#endif
    }

    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(parts.host, parts.port);
    stream.expires_after(std::chrono::milliseconds(mOptions.timeoutMs));
    stream.connect(results);

    http::write(stream, req);
    auto response = readResponse(stream, mOptions.timeoutMs);

    if (mVerbose) {
        std::cerr << "[HttpClient] HTTP " << response.httpStatus << "\n";
    }

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return response;
}

} // namespace blob_sync
