#include <civdl/api/catalog_client.h>
#include <civdl/api/paginated_fetcher.h>
#include <civdl/net/url.h>

#include <spdlog/spdlog.h>

#include <utility>

namespace civdl::api {

namespace {
constexpr const char* kDownloadPath = "/api/download/models/";
}

CatalogClient::CatalogClient(std::shared_ptr<RateLimitedClient> client)
    : client_(std::move(client)) {}

std::vector<Header> CatalogClient::authHeaders() const {
    std::vector<Header> headers{{"Accept", "application/json"}};
    const auto& key = client_->config().apiKey;
    if (key && !key->empty())
        headers.push_back({"Authorization", "Bearer " + *key});
    return headers;
}

Expected<nlohmann::json> CatalogClient::getJson(const std::string& endpoint,
                                                const QueryParams& params) {
    const std::string url = client_->config().baseUrl + endpoint;
    auto res = client_->request("GET", url, authHeaders(), params);
    if (!res.ok()) {
        spdlog::debug("GET {} failed: {}", endpoint, res.error().message);
        return res.error();
    }

    auto j = nlohmann::json::parse(res.value().body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return Error{ErrorCode::InvalidResponse, "Invalid JSON response from " + url,
                     res.value().status};
    }
    return j;
}

Expected<nlohmann::json> CatalogClient::getModels(const QueryParams& params) {
    return getJson("/models", params);
}

Expected<nlohmann::json> CatalogClient::getModel(std::int64_t modelId) {
    return getJson("/models/" + std::to_string(modelId));
}

Expected<nlohmann::json> CatalogClient::getModelVersion(std::int64_t versionId) {
    return getJson("/model-versions/" + std::to_string(versionId));
}

Expected<nlohmann::json> CatalogClient::getImages(const QueryParams& params) {
    return getJson("/images", params);
}

Expected<std::vector<nlohmann::json>> CatalogClient::getAllImages(const QueryParams& base) {
    PaginatedFetcher fetcher(*this, "/images", base);
    return fetcher.fetchAll();
}

std::string CatalogClient::downloadUrl(std::int64_t versionId) const {
    // Downloads live beside the versioned API on the same host.
    std::string url = net::urlOrigin(client_->config().baseUrl) + kDownloadPath +
                      std::to_string(versionId);
    const auto& key = client_->config().apiKey;
    if (key && !key->empty())
        url = net::appendQuery(url, QueryParams{{"token", *key}});
    return url;
}

} // namespace civdl::api
