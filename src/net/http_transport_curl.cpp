/*
 * http_transport_curl.cpp
 *
 * Notes
 * - libcurl easy API, one easy handle per call (handles are not shared across workers).
 * - Honors timeout, TLS verify, proxy, headers, redirects and user agent.
 * - Streamed calls use a low-speed guard instead of a whole-transfer timeout so that
 *   large bodies are not cut off while data keeps flowing.
 * - Response headers are collected per response; a new status line (redirect hop)
 *   resets them so callers only see the final response.
 */

#include <civdl/core/string_utils.h>
#include <civdl/net/http_transport.h>
#include <civdl/net/url.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <memory>
#include <mutex>

namespace civdl::net {

std::optional<std::string> HttpResponse::header(std::string_view name) const {
    for (const auto& h : headers) {
        if (iequals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> HttpResponse::contentLength() const {
    auto raw = header("content-length");
    if (!raw)
        return std::nullopt;
    std::uint64_t value{0};
    const char* first = raw->data();
    const char* last = raw->data() + raw->size();
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last)
        return std::nullopt;
    return value;
}

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    std::string message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return Error{ErrorCode::InvalidArgument, std::move(message)};
        default:
            // Timeouts, DNS, connect, TLS, partial bodies and receive errors are all
            // transport failures; retry policy belongs to the caller.
            return Error{ErrorCode::NetworkError, std::move(message)};
    }
}

struct TransferContext {
    CURL* curl{nullptr};
    HttpResponse response;
    const ResponseHandler* onResponse{nullptr};
    const BodySink* sink{nullptr};
    bool buffered{false};
    bool delivered{false};
    std::optional<Error> abortError;
};

Expected<void> deliverHead(TransferContext& ctx) {
    if (ctx.delivered)
        return Expected<void>{};
    ctx.delivered = true;

    long status = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &status);
    ctx.response.status = static_cast<int>(status);

    char* effective = nullptr;
    if (curl_easy_getinfo(ctx.curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK &&
        effective != nullptr) {
        ctx.response.effectiveUrl = effective;
    }

    if (ctx.onResponse && *ctx.onResponse)
        return (*ctx.onResponse)(ctx.response);
    return Expected<void>{};
}

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<TransferContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    if (istartsWith(line, "HTTP/")) {
        // New response in a redirect chain
        ctx->response.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    ctx->response.headers.push_back(
        Header{trim(line.substr(0, colon)), trim(line.substr(colon + 1))});
    return total;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<TransferContext*>(userdata);
    if (!ctx->delivered) {
        auto head = deliverHead(*ctx);
        if (!head.ok()) {
            ctx->abortError = head.error();
            return 0; // CURLE_WRITE_ERROR
        }
    }
    if (total == 0)
        return 0;

    if (ctx->buffered) {
        ctx->response.body.append(ptr, total);
        return total;
    }

    if (ctx->sink && *ctx->sink) {
        std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
        auto r = (*ctx->sink)(bytes);
        if (!r.ok()) {
            ctx->abortError = r.error();
            return 0;
        }
    }
    return total;
}

CurlList buildHeaderList(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return CurlList(list, curl_slist_free_all);
}

class CurlHttpTransport final : public IHttpTransport {
public:
    explicit CurlHttpTransport(TransportOptions options) : options_(std::move(options)) {
        ensureCurlGlobalInit();
    }

    Expected<HttpResponse> perform(const HttpRequest& request) override {
        return execute(request, /*buffered=*/true, nullptr, nullptr);
    }

    Expected<HttpResponse> stream(const HttpRequest& request, const ResponseHandler& onResponse,
                                  const BodySink& sink) override {
        return execute(request, /*buffered=*/false, &onResponse, &sink);
    }

private:
    Expected<HttpResponse> execute(const HttpRequest& request, bool buffered,
                                   const ResponseHandler* onResponse, const BodySink* sink) {
        CurlHandle curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const std::string url = appendQuery(request.url, request.params);
        CurlList headerList = buildHeaderList(request.headers);

        TransferContext ctx;
        ctx.curl = curl.get();
        ctx.buffered = buffered;
        ctx.onResponse = onResponse;
        ctx.sink = sink;

        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        if (request.method == "HEAD") {
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
        } else if (request.method == "GET") {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headerList.get());
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_USERAGENT, options_.userAgent.c_str());

        // Timeouts
        const long timeoutMs = static_cast<long>(request.timeout.count());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long long>(
                             options_.connectTimeout.count(), request.timeout.count())));
        if (buffered) {
            curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeoutMs);
        } else {
            // Abort when fewer than 1 byte/s arrives for the whole timeout window
            curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, std::max(1L, timeoutMs / 1000));
        }

        // Redirects
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, options_.followRedirects ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);

        // TLS
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, options_.verifyTls ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, options_.verifyTls ? 2L : 0L);

        // Proxy
        if (options_.proxy && !options_.proxy->empty()) {
            curl_easy_setopt(h, CURLOPT_PROXY, options_.proxy->c_str());
        }

        // Robustness
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, 1L);

        CURLcode rc = curl_easy_perform(h);

        if (ctx.abortError) {
            return *ctx.abortError;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, request.method + " " + request.url);
        }

        // Bodiless responses (HEAD, 204, empty error bodies) never hit write_cb
        if (!ctx.delivered) {
            auto head = deliverHead(ctx);
            if (!head.ok())
                return head.error();
        }

        spdlog::trace("{} {} -> {}", request.method, request.url, ctx.response.status);
        return std::move(ctx.response);
    }

    TransportOptions options_;
};

} // namespace

std::unique_ptr<IHttpTransport> makeCurlHttpTransport(const TransportOptions& options) {
    return std::make_unique<CurlHttpTransport>(options);
}

} // namespace civdl::net
