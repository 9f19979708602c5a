/*
 * rate_limited_client.cpp
 *
 * Fixed-interval pacing with multiplicative backoff on HTTP 429.
 * - Slots are reserved under the lock and slept for outside it, so concurrent
 *   callers queue up one interval apart.
 * - The interval only grows; a throttled client stays slow for its lifetime.
 */

#include <civdl/api/rate_limited_client.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>
#include <utility>

namespace civdl::api {

namespace {

using clock_t = std::chrono::steady_clock;

constexpr int kTooManyRequests = 429;
constexpr auto kSleepSlice = std::chrono::milliseconds(50);

// Sleeps in slices so a cancel request is seen within one slice.
bool sleepUnlessCancelled(clock_t::duration delay, const ShouldCancel& shouldCancel) {
    if (!shouldCancel) {
        std::this_thread::sleep_for(delay);
        return true;
    }
    const auto deadline = clock_t::now() + delay;
    while (clock_t::now() < deadline) {
        if (shouldCancel())
            return false;
        std::this_thread::sleep_for(
            std::min<clock_t::duration>(deadline - clock_t::now(), kSleepSlice));
    }
    return !shouldCancel();
}

Error cancelledWhileWaiting(const std::string& url) {
    return Error{ErrorCode::Cancelled, "Cancelled while rate limited: " + url};
}

// Server-provided explanation from a JSON error body, if any.
std::string serverMessage(const std::string& body) {
    if (body.empty())
        return {};
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (!j.is_object())
        return {};
    for (const char* key : {"message", "error"}) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string())
            return it->get<std::string>();
    }
    return {};
}

std::string describeStatus(int status, const std::string& url, const std::string& body) {
    std::string msg = "HTTP " + std::to_string(status) + " for " + url;
    auto detail = serverMessage(body);
    if (!detail.empty()) {
        msg += ": ";
        msg += detail;
    }
    return msg;
}

} // namespace

Error errorForStatus(int status, std::string message) {
    switch (status) {
        case 404:
            return Error{ErrorCode::ResourceNotFound, std::move(message), status};
        case 401:
            return Error{ErrorCode::AuthenticationFailed, std::move(message), status};
        case kTooManyRequests:
            return Error{ErrorCode::RateLimited, std::move(message), status};
        default:
            return Error{ErrorCode::ApiError, std::move(message), status};
    }
}

RateLimitedClient::RateLimitedClient(ClientConfig config,
                                     std::unique_ptr<net::IHttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)),
      minInterval_(config_.minRequestInterval) {
    if (!transport_) {
        net::TransportOptions opts;
        opts.userAgent = config_.userAgent;
        opts.proxy = config_.proxy;
        opts.verifyTls = config_.verifyTls;
        transport_ = net::makeCurlHttpTransport(opts);
    }
}

RateLimitedClient::~RateLimitedClient() = default;

std::chrono::milliseconds RateLimitedClient::minInterval() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return minInterval_;
}

bool RateLimitedClient::pace(const ShouldCancel& shouldCancel) {
    clock_t::duration wait{0};
    {
        std::lock_guard<std::mutex> lk(mutex_);
        const auto now = clock_t::now();
        if (lastRequest_ != clock_t::time_point{}) {
            const auto slot = lastRequest_ + minInterval_;
            if (slot > now)
                wait = slot - now;
        }
        lastRequest_ = now + wait;
    }
    if (wait > clock_t::duration::zero())
        return sleepUnlessCancelled(wait, shouldCancel);
    return !(shouldCancel && shouldCancel());
}

void RateLimitedClient::recordCompletion() {
    std::lock_guard<std::mutex> lk(mutex_);
    lastRequest_ = std::max(lastRequest_, clock_t::now());
}

bool RateLimitedClient::onThrottled(const std::string& url, int attempt,
                                    const ShouldCancel& shouldCancel) {
    std::chrono::milliseconds interval;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        minInterval_ *= 2;
        interval = minInterval_;
    }
    spdlog::warn("Rate limited on {} (attempt {}/{}); interval now {} ms, waiting {} ms", url,
                 attempt + 1, config_.maxThrottleRetries, interval.count(),
                 config_.throttleDelay.count());
    return sleepUnlessCancelled(config_.throttleDelay, shouldCancel);
}

Expected<net::HttpResponse> RateLimitedClient::request(const std::string& method,
                                                       const std::string& url,
                                                       const std::vector<Header>& headers,
                                                       const QueryParams& params,
                                                       const ShouldCancel& shouldCancel) {
    net::HttpRequest req;
    req.method = method;
    req.url = url;
    req.headers = headers;
    req.params = params;
    req.timeout = config_.timeout;

    for (int attempt = 0;; ++attempt) {
        if (!pace(shouldCancel))
            return cancelledWhileWaiting(url);
        auto res = transport_->perform(req);
        recordCompletion();
        if (!res.ok()) {
            return Error{ErrorCode::ApiError, "Request failed: " + res.error().message};
        }

        auto response = std::move(res).value();
        if (response.status == kTooManyRequests) {
            if (attempt >= config_.maxThrottleRetries) {
                spdlog::error("Giving up on {} after {} throttle retries", url, attempt);
                return errorForStatus(kTooManyRequests,
                                      "Rate limit exceeded for " + url + " after " +
                                          std::to_string(attempt) + " retries");
            }
            if (!onThrottled(url, attempt, shouldCancel))
                return cancelledWhileWaiting(url);
            continue;
        }
        if (response.status >= 400) {
            return errorForStatus(response.status,
                                  describeStatus(response.status, url, response.body));
        }
        response.throttleRetries = attempt;
        return response;
    }
}

Expected<net::HttpResponse> RateLimitedClient::stream(const net::HttpRequest& request,
                                                      const net::ResponseHandler& onResponse,
                                                      const net::BodySink& sink,
                                                      const ShouldCancel& shouldCancel) {
    for (int attempt = 0;; ++attempt) {
        bool throttled = false;
        auto head = [&](const net::HttpResponse& r) -> Expected<void> {
            if (r.status == kTooManyRequests) {
                throttled = true;
                return errorForStatus(kTooManyRequests, "HTTP 429 for " + request.url);
            }
            if (r.status >= 400) {
                return errorForStatus(r.status, describeStatus(r.status, request.url, r.body));
            }
            if (!onResponse)
                return Expected<void>{};
            net::HttpResponse annotated = r;
            annotated.throttleRetries = attempt;
            return onResponse(annotated);
        };

        if (!pace(shouldCancel))
            return cancelledWhileWaiting(request.url);
        auto res = transport_->stream(request, head, sink);
        recordCompletion();
        if (res.ok()) {
            auto response = std::move(res).value();
            response.throttleRetries = attempt;
            return response;
        }
        if (!throttled)
            return res.error();

        if (attempt >= config_.maxThrottleRetries) {
            spdlog::error("Giving up on {} after {} throttle retries", request.url, attempt);
            return errorForStatus(kTooManyRequests, "Rate limit exceeded for " + request.url +
                                                        " after " + std::to_string(attempt) +
                                                        " retries");
        }
        if (!onThrottled(request.url, attempt, shouldCancel))
            return cancelledWhileWaiting(request.url);
    }
}

} // namespace civdl::api
