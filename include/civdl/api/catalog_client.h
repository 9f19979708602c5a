#pragma once

#include <civdl/api/rate_limited_client.h>
#include <civdl/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace civdl::api {

/**
 * CatalogClient
 *
 * JSON facade over the catalog REST endpoints. All calls share the pacing
 * state of the underlying RateLimitedClient. When an API key is configured
 * it is sent as "Authorization: Bearer <key>" on API calls and as the
 * "token" query parameter on download URLs.
 */
class CatalogClient {
public:
    explicit CatalogClient(std::shared_ptr<RateLimitedClient> client);

    // GET {baseUrl}{endpoint}; endpoint starts with '/'.
    Expected<nlohmann::json> getJson(const std::string& endpoint, const QueryParams& params = {});

    Expected<nlohmann::json> getModels(const QueryParams& params = {});
    Expected<nlohmann::json> getModel(std::int64_t modelId);
    Expected<nlohmann::json> getModelVersion(std::int64_t versionId);
    Expected<nlohmann::json> getImages(const QueryParams& params = {});

    // Every image matching base, following cursors to the end.
    Expected<std::vector<nlohmann::json>> getAllImages(const QueryParams& base = {});

    [[nodiscard]] std::string downloadUrl(std::int64_t versionId) const;

    [[nodiscard]] RateLimitedClient& client() noexcept { return *client_; }
    [[nodiscard]] std::shared_ptr<RateLimitedClient> sharedClient() const { return client_; }

private:
    std::vector<Header> authHeaders() const;

    std::shared_ptr<RateLimitedClient> client_;
};

} // namespace civdl::api
