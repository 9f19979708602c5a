#include <gtest/gtest.h>

#include <civdl/api/rate_limited_client.h>

#include "../../common/fake_http_transport.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace civdl;
using namespace civdl::api;
using namespace std::chrono_literals;
using civdl::test::FakeHttpTransport;

namespace {

constexpr const char* kUrl = "https://api.test/api/v1/models";

struct ClientHarness {
    FakeHttpTransport* fake{nullptr};
    std::unique_ptr<RateLimitedClient> client;
};

ClientHarness makeClient(std::chrono::milliseconds interval, int maxRetries = 5,
                         std::chrono::milliseconds throttleDelay = 10ms) {
    ClientConfig cfg;
    cfg.minRequestInterval = interval;
    cfg.throttleDelay = throttleDelay;
    cfg.maxThrottleRetries = maxRetries;
    auto fake = std::make_unique<FakeHttpTransport>();
    ClientHarness h;
    h.fake = fake.get();
    h.client = std::make_unique<RateLimitedClient>(cfg, std::move(fake));
    return h;
}

std::chrono::milliseconds gap(const test::RecordedRequest& a, const test::RecordedRequest& b) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(b.at - a.at);
}

} // namespace

TEST(RateLimitedClientTest, SpacesSequentialRequests) {
    auto h = makeClient(100ms);
    for (int i = 0; i < 3; ++i)
        h.fake->enqueueJson(kUrl, "{}");

    for (int i = 0; i < 3; ++i) {
        auto r = h.client->request("GET", kUrl);
        ASSERT_TRUE(r.ok()) << r.error().message;
    }

    auto reqs = h.fake->requests();
    ASSERT_EQ(reqs.size(), 3u);
    EXPECT_GE(gap(reqs[0], reqs[1]), 95ms);
    EXPECT_GE(gap(reqs[1], reqs[2]), 95ms);
}

TEST(RateLimitedClientTest, SpacesConcurrentRequests) {
    auto h = makeClient(50ms);
    constexpr int kThreads = 4;
    constexpr int kPerThread = 2;
    for (int i = 0; i < kThreads * kPerThread; ++i)
        h.fake->enqueueJson(kUrl, "{}");

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < kPerThread; ++i) {
                auto r = h.client->request("GET", kUrl);
                EXPECT_TRUE(r.ok());
            }
        });
    }
    for (auto& t : threads)
        t.join();

    auto reqs = h.fake->requests();
    ASSERT_EQ(reqs.size(), static_cast<size_t>(kThreads * kPerThread));
    std::sort(reqs.begin(), reqs.end(),
              [](const auto& a, const auto& b) { return a.at < b.at; });
    for (size_t i = 1; i < reqs.size(); ++i)
        EXPECT_GE(gap(reqs[i - 1], reqs[i]), 45ms) << "between request " << i - 1 << " and " << i;
}

TEST(RateLimitedClientTest, ThrottleDoublesIntervalAndRetries) {
    auto h = makeClient(20ms);
    h.fake->enqueueStatus(kUrl, 429);
    h.fake->enqueueJson(kUrl, R"({"items":[]})");

    auto r = h.client->request("GET", kUrl);
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().status, 200);
    EXPECT_EQ(r.value().throttleRetries, 1);
    EXPECT_EQ(h.client->minInterval(), 40ms);
    EXPECT_EQ(h.fake->requests().size(), 2u);
}

TEST(RateLimitedClientTest, IntervalNeverDecays) {
    auto h = makeClient(10ms);
    h.fake->enqueueStatus(kUrl, 429);
    h.fake->enqueueJson(kUrl, "{}");
    h.fake->enqueueStatus(kUrl, 429);
    h.fake->enqueueJson(kUrl, "{}");
    h.fake->enqueueJson(kUrl, "{}");

    ASSERT_TRUE(h.client->request("GET", kUrl).ok());
    EXPECT_EQ(h.client->minInterval(), 20ms);
    ASSERT_TRUE(h.client->request("GET", kUrl).ok());
    EXPECT_EQ(h.client->minInterval(), 40ms);
    ASSERT_TRUE(h.client->request("GET", kUrl).ok());
    EXPECT_EQ(h.client->minInterval(), 40ms);
}

TEST(RateLimitedClientTest, GivesUpAfterMaxThrottleRetries) {
    auto h = makeClient(5ms, /*maxRetries=*/2, 1ms);
    for (int i = 0; i < 3; ++i)
        h.fake->enqueueStatus(kUrl, 429);

    auto r = h.client->request("GET", kUrl);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::RateLimited);
    EXPECT_EQ(r.error().httpStatus, 429);
    EXPECT_EQ(h.fake->requests().size(), 3u);
    EXPECT_EQ(h.client->minInterval(), 20ms);
}

TEST(RateLimitedClientTest, MapsStatusCodes) {
    auto h = makeClient(0ms);
    h.fake->enqueueJson(kUrl, R"({"message":"no such model"})", 404);
    h.fake->enqueueStatus(kUrl, 401);
    h.fake->enqueueJson(kUrl, R"({"error":"boom"})", 503);
    h.fake->enqueueStatus(kUrl, 400);

    auto notFound = h.client->request("GET", kUrl);
    ASSERT_FALSE(notFound.ok());
    EXPECT_EQ(notFound.error().code, ErrorCode::ResourceNotFound);
    EXPECT_NE(notFound.error().message.find("no such model"), std::string::npos);

    auto auth = h.client->request("GET", kUrl);
    ASSERT_FALSE(auth.ok());
    EXPECT_EQ(auth.error().code, ErrorCode::AuthenticationFailed);

    auto server = h.client->request("GET", kUrl);
    ASSERT_FALSE(server.ok());
    EXPECT_EQ(server.error().code, ErrorCode::ApiError);
    EXPECT_EQ(server.error().httpStatus, 503);
    EXPECT_NE(server.error().message.find("boom"), std::string::npos);

    auto bad = h.client->request("GET", kUrl);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.error().code, ErrorCode::ApiError);
    EXPECT_EQ(bad.error().httpStatus, 400);
}

TEST(RateLimitedClientTest, TransportFailureIsApiErrorForBufferedCalls) {
    auto h = makeClient(0ms);
    h.fake->enqueueNetworkError(kUrl);

    auto r = h.client->request("GET", kUrl);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ApiError);
    EXPECT_EQ(r.error().message.rfind("Request failed", 0), 0u);
}

TEST(RateLimitedClientTest, StreamPassesNetworkErrorsThrough) {
    auto h = makeClient(0ms);
    h.fake->enqueueNetworkError(kUrl);

    net::HttpRequest req;
    req.url = kUrl;
    auto r = h.client->stream(
        req, [](const net::HttpResponse&) { return Expected<void>{}; },
        [](std::span<const std::byte>) { return Expected<void>{}; });
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::NetworkError);
}

TEST(RateLimitedClientTest, StreamRetriesThrottleBeforeDeliveringBody) {
    auto h = makeClient(5ms);
    const std::string url = "https://files.test/model.bin";
    h.fake->enqueueStatus(url, 429);
    h.fake->addResource(url, "0123456789");

    net::HttpRequest req;
    req.url = url;
    int heads = 0;
    int seenRetries = -1;
    std::string body;
    auto r = h.client->stream(
        req,
        [&](const net::HttpResponse& resp) {
            ++heads;
            seenRetries = resp.throttleRetries;
            return Expected<void>{};
        },
        [&](std::span<const std::byte> data) {
            body.append(reinterpret_cast<const char*>(data.data()), data.size());
            return Expected<void>{};
        });

    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(heads, 1);
    EXPECT_EQ(seenRetries, 1);
    EXPECT_EQ(body, "0123456789");
    EXPECT_EQ(h.client->minInterval(), 10ms);
}

TEST(RateLimitedClientTest, StreamMapsErrorStatusWithoutCallingHandlers) {
    auto h = makeClient(0ms);
    net::HttpRequest req;
    req.url = "https://files.test/missing.bin";
    bool called = false;
    auto r = h.client->stream(
        req,
        [&](const net::HttpResponse&) {
            called = true;
            return Expected<void>{};
        },
        [&](std::span<const std::byte>) {
            called = true;
            return Expected<void>{};
        });
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::ResourceNotFound);
    EXPECT_FALSE(called);
}

TEST(RateLimitedClientTest, StreamThrottleWaitStopsWhenCancelled) {
    auto h = makeClient(0ms, 5, 2000ms);
    const std::string url = "https://files.test/model.bin";
    for (int i = 0; i < 3; ++i)
        h.fake->enqueueStatus(url, 429);
    h.fake->addResource(url, "0123456789");

    net::HttpRequest req;
    req.url = url;
    const auto start = std::chrono::steady_clock::now();
    auto r = h.client->stream(
        req, [](const net::HttpResponse&) { return Expected<void>{}; },
        [](std::span<const std::byte>) { return Expected<void>{}; },
        [&] { return std::chrono::steady_clock::now() - start > 50ms; });

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(h.fake->requestsFor(url).size(), 1u);
}

TEST(RateLimitedClientTest, PacingWaitStopsWhenCancelled) {
    auto h = makeClient(2000ms);
    h.fake->enqueueJson(kUrl, "{}");
    h.fake->enqueueJson(kUrl, "{}");
    ASSERT_TRUE(h.client->request("GET", kUrl).ok());

    std::atomic<bool> stop{false};
    std::thread canceller([&] {
        std::this_thread::sleep_for(50ms);
        stop = true;
    });
    const auto start = std::chrono::steady_clock::now();
    auto r = h.client->request("GET", kUrl, {}, {}, [&] { return stop.load(); });
    canceller.join();

    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.error().code, ErrorCode::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_EQ(h.fake->requests().size(), 1u);
}
