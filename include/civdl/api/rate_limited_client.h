#pragma once

#include <civdl/core/types.h>
#include <civdl/net/http_transport.h>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace civdl::api {

// Polled while the client sleeps for pacing or throttling; true aborts the
// wait and the call returns ErrorCode::Cancelled.
using ShouldCancel = std::function<bool()>;

struct ClientConfig {
    std::string baseUrl{"https://civitai.com/api/v1"};
    std::optional<std::string> apiKey;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds minRequestInterval{1000};
    std::chrono::milliseconds throttleDelay{5000};
    int maxThrottleRetries{5};
    std::string userAgent{"civdl/1.0"};
    std::optional<std::string> proxy;
    bool verifyTls{true};
};

/**
 * RateLimitedClient
 *
 * Every outgoing call goes through here. Calls are spaced at least
 * minInterval() apart across all threads sharing the client. A 429 doubles
 * the interval (it never decays), waits throttleDelay and retries, up to
 * maxThrottleRetries times.
 *
 * Status mapping: 404 -> ResourceNotFound, 401 -> AuthenticationFailed,
 * 429 after retries -> RateLimited, other >= 400 -> ApiError (httpStatus set).
 *
 * Thread-safe. The internal mutex only guards the pacing state; it is never
 * held while sleeping or during I/O.
 */
class RateLimitedClient {
public:
    explicit RateLimitedClient(ClientConfig config,
                               std::unique_ptr<net::IHttpTransport> transport = nullptr);
    ~RateLimitedClient();

    RateLimitedClient(const RateLimitedClient&) = delete;
    RateLimitedClient& operator=(const RateLimitedClient&) = delete;

    // Buffered call. Transport failures are reported as ApiError.
    Expected<net::HttpResponse> request(const std::string& method, const std::string& url,
                                        const std::vector<Header>& headers = {},
                                        const QueryParams& params = {},
                                        const ShouldCancel& shouldCancel = {});

    // Streamed call. Pacing, 429 handling and status mapping happen before the
    // first body byte reaches onResponse/sink. Transport failures pass through
    // as NetworkError so transfers can retry them.
    Expected<net::HttpResponse> stream(const net::HttpRequest& request,
                                       const net::ResponseHandler& onResponse,
                                       const net::BodySink& sink,
                                       const ShouldCancel& shouldCancel = {});

    [[nodiscard]] std::chrono::milliseconds minInterval() const;
    [[nodiscard]] const ClientConfig& config() const noexcept { return config_; }

private:
    // Blocks until this caller's slot comes up. false when shouldCancel fired.
    bool pace(const ShouldCancel& shouldCancel);
    void recordCompletion();
    bool onThrottled(const std::string& url, int attempt, const ShouldCancel& shouldCancel);

    ClientConfig config_;
    std::unique_ptr<net::IHttpTransport> transport_;

    mutable std::mutex mutex_;
    std::chrono::steady_clock::time_point lastRequest_{};
    std::chrono::milliseconds minInterval_;
};

// Maps an HTTP status >= 400 to the client's error taxonomy.
Error errorForStatus(int status, std::string message);

} // namespace civdl::api
