#pragma once

/*
 * civdl transport layer
 *
 * A single HTTP call primitive. Two shapes are offered:
 * - perform(): buffered body, used for JSON catalog calls
 * - stream():  headers delivered once, then the body is pushed to a sink as it arrives
 *
 * Status codes are reported, never interpreted, here; mapping them to the error
 * taxonomy is the job of api::RateLimitedClient. Transport-level failures
 * (DNS, connect, TLS, timeouts, broken streams) surface as ErrorCode::NetworkError.
 */

#include <civdl/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace civdl::net {

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::vector<Header> headers;
    QueryParams params;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status{0};
    std::vector<Header> headers;
    std::string body;       // empty for streamed responses
    std::string effectiveUrl;
    int throttleRetries{0}; // number of 429 retries it took to obtain this response

    // First header with this name (case-insensitive).
    [[nodiscard]] std::optional<std::string> header(std::string_view name) const;

    // Parsed Content-Length, if present and numeric.
    [[nodiscard]] std::optional<std::uint64_t> contentLength() const;
};

// Called once with status and headers before the first body byte.
// Returning an error aborts the transfer; that error is returned from stream().
using ResponseHandler = std::function<Expected<void>(const HttpResponse&)>;

// Receives body data in arrival order. Returning an error aborts the transfer.
using BodySink = std::function<Expected<void>(std::span<const std::byte>)>;

struct TransportOptions {
    std::string userAgent{"civdl/1.0"};
    std::optional<std::string> proxy;
    bool verifyTls{true};
    bool followRedirects{true};
    std::chrono::milliseconds connectTimeout{30000};
};

class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    virtual Expected<HttpResponse> perform(const HttpRequest& request) = 0;

    virtual Expected<HttpResponse> stream(const HttpRequest& request,
                                          const ResponseHandler& onResponse,
                                          const BodySink& sink) = 0;
};

std::unique_ptr<IHttpTransport> makeCurlHttpTransport(const TransportOptions& options = {});

} // namespace civdl::net
