#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <boost/system/error_code.hpp>

namespace infra::http {

struct Endpoint {
    std::string host;
    std::string port = "443";
    std::string basePath;  // "/api/scan", never a trailing slash
};

// Splits https://host[:port][/base/path] into an Endpoint. Throws std::runtime_error for
// anything that is not an https URL with a host.
Endpoint parseBaseUrl(const std::string& url);

struct JsonResponse {
    unsigned status = 0U;
    std::string body;
    std::string final_host;
    std::string final_target;
};

// Raised for failures below the HTTP layer. stage is one of
// "resolve", "connect", "handshake", "write", "read", "shutdown", "sni", "redirect".
class TransportError : public std::runtime_error {
public:
    TransportError(const std::string& message, boost::system::error_code code, std::string stage)
        : std::runtime_error(message), code_(code), stage_(std::move(stage)) {}

    const boost::system::error_code& code() const noexcept { return code_; }
    const std::string& stage() const noexcept { return stage_; }

private:
    boost::system::error_code code_;
    std::string stage_;
};

// POSTs a JSON document to endpoint.basePath + path. Any HTTP status is returned to the
// caller; only transport failures throw (TransportError).
JsonResponse https_post_json(const Endpoint& endpoint, const std::string& path, const std::string& body,
                             int timeout_sec = 30);

}  // namespace infra::http
