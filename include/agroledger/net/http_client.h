#pragma once

#include <agroledger/core/types.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace agroledger::net {

struct Header {
    std::string name;
    std::string value;
};

enum class HttpMethod { Get, Post, Patch, Delete };

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string url;
    std::vector<Header> headers;
    std::string body;
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
};

struct HttpResponse {
    long status{0};
    std::string body;
    std::vector<Header> headers;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Blocking HTTP transport
 *
 * Transport failures (DNS, connect, TLS, timeout) are errors. Any HTTP status,
 * including 4xx and 5xx, is returned as a response for the caller to interpret.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

/// libcurl easy-API implementation
std::unique_ptr<IHttpClient> makeCurlHttpClient();

/// Percent-encode a query component
std::string urlEncode(const std::string& value);

const char* methodName(HttpMethod method);

} // namespace agroledger::net
