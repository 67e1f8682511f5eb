#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <string>
#include <utility>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>

#include "logging/Log.h"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr int kMaxRedirects = 5;
constexpr const char* kUserAgent = "ledger-ingest/1.0";

struct Request {
    http::verb method;
    std::string host;
    std::string port;
    std::string target;
    std::string body;
};

std::string describe(const Request& request) {
    std::ostringstream oss;
    oss << "HTTPS " << http::to_string(request.method) << " https://" << request.host;
    if (request.port != "443") {
        oss << ':' << request.port;
    }
    oss << request.target;
    return oss.str();
}

TransportError makeError(const Request& request, const std::string& stage, const boost::system::error_code& ec,
                         const std::string& message) {
    return TransportError(describe(request) + " failed: " + message, ec, stage);
}

// Updates host/port/target of request from a Location header.
void applyRedirect(Request& request, const std::string& location) {
    if (location.empty()) {
        throw makeError(request, "redirect", {}, "Redirect response missing Location header");
    }

    if (location.rfind("https://", 0) == 0) {
        const Endpoint parsed = parseBaseUrl(location);
        request.host = parsed.host;
        request.port = parsed.port;
        request.target = parsed.basePath.empty() ? std::string{"/"} : parsed.basePath;
    } else if (location.rfind("http://", 0) == 0) {
        throw makeError(request, "redirect", {}, "Insecure redirect to HTTP is not supported");
    } else {
        request.target = location.front() == '/' ? location : "/" + location;
    }
}

http::response<http::string_body> performRequest(const Request& request, int timeoutSec) {
    if (timeoutSec <= 0) {
        throw makeError(request, "connect", {}, "timeout must be positive");
    }

    net::io_context ioc;
    ssl::context sslContext(ssl::context::tls_client);
    // TODO: Enable certificate verification once a CA bundle path is configurable.
    sslContext.set_verify_mode(ssl::verify_none);

    ssl::stream<beast::tcp_stream> stream(ioc, sslContext);

    if (!SSL_set_tlsext_host_name(stream.native_handle(), request.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << "Failed to set SNI hostname to '" << request.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw makeError(request, "sni", {}, oss.str());
    }

    auto resolver = net::ip::tcp::resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(request.host, request.port, ec);
    if (ec) {
        throw makeError(request, "resolve", ec, "DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw makeError(request, "connect", ec, "Connection error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw makeError(request, "handshake", ec, "TLS handshake error: " + ec.message());
    }

    http::request<http::string_body> req{request.method, request.target, 11};
    req.set(http::field::host, request.host);
    req.set(http::field::user_agent, kUserAgent);
    req.set(http::field::accept, "application/json");
    req.set(http::field::connection, "close");
    if (request.method == http::verb::post) {
        req.set(http::field::content_type, "application/json");
        req.body() = request.body;
        req.prepare_payload();
    }

    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    http::write(stream, req, ec);
    if (ec) {
        throw makeError(request, "write", ec, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    // Backfill pages of 1000 updates regularly exceed Beast's 8 MiB default.
    parser.body_limit(256U * 1024U * 1024U);
    lowestLayer.expires_after(std::chrono::seconds(timeoutSec));
    http::read(stream, buffer, parser, ec);
    if (ec) {
        throw makeError(request, "read", ec, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof) {
        ec = {};
    }
    if (ec == ssl::error::stream_truncated) {
        // Allow truncated TLS shutdown which may occur with some servers.
        ec = {};
    }
    if (ec) {
        LOG_DEBUG(logging::LogCategory::NET, "%s: TLS shutdown error ignored: %s", describe(request).c_str(),
                  ec.message().c_str());
    }

    return parser.release();
}

JsonResponse execute(Request request, int timeoutSec) {
    if (request.host.empty()) {
        throw std::runtime_error("HTTPS request requires a non-empty host");
    }
    if (request.target.empty() || request.target.front() != '/') {
        request.target.insert(request.target.begin(), '/');
    }

    for (int redirectCount = 0; redirectCount <= kMaxRedirects; ++redirectCount) {
        auto response = performRequest(request, timeoutSec);
        const auto status = static_cast<unsigned>(response.result_int());
        if (status == 301U || status == 302U || status == 307U || status == 308U) {
            const auto locationHeader = response.base()[http::field::location];
            applyRedirect(request, std::string(locationHeader));
            continue;
        }

        JsonResponse result{};
        result.status = status;
        result.body = std::move(response.body());
        result.final_host = request.host;
        result.final_target = request.target;
        return result;
    }

    throw makeError(request, "redirect", {}, "Too many redirects");
}

}  // namespace

Endpoint parseBaseUrl(const std::string& url) {
    const std::string scheme = "https://";
    if (url.rfind(scheme, 0) != 0) {
        throw std::runtime_error("Unsupported URL (https required): " + url);
    }

    const std::string withoutScheme = url.substr(scheme.size());
    const auto slashPos = withoutScheme.find('/');
    std::string hostPart = slashPos == std::string::npos ? withoutScheme : withoutScheme.substr(0, slashPos);
    if (hostPart.empty()) {
        throw std::runtime_error("URL missing host: " + url);
    }

    Endpoint endpoint;
    const auto colonPos = hostPart.find(':');
    if (colonPos != std::string::npos) {
        endpoint.port = hostPart.substr(colonPos + 1);
        hostPart = hostPart.substr(0, colonPos);
        if (endpoint.port.empty() || hostPart.empty()) {
            throw std::runtime_error("Malformed host in URL: " + url);
        }
    }
    endpoint.host = hostPart;

    if (slashPos != std::string::npos) {
        endpoint.basePath = withoutScheme.substr(slashPos);
        while (!endpoint.basePath.empty() && endpoint.basePath.back() == '/') {
            endpoint.basePath.pop_back();
        }
    }
    return endpoint;
}

JsonResponse https_post_json(const Endpoint& endpoint, const std::string& path, const std::string& body,
                             int timeout_sec) {
    return execute(Request{http::verb::post, endpoint.host, endpoint.port, endpoint.basePath + path, body},
                   timeout_sec);
}

}  // namespace infra::http
