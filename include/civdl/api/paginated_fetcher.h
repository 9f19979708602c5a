#pragma once

#include <civdl/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace civdl::api {

class CatalogClient;

/**
 * PaginatedFetcher
 *
 * Walks a cursor-paginated endpoint. Each page is {"items": [...],
 * "metadata": {"nextCursor": ...}}; a missing or null nextCursor ends the
 * walk. Numeric cursors are stringified before being sent back.
 *
 * Finite and single-use: once exhausted (or after an error) next() keeps
 * returning std::nullopt. A cursor seen twice or more than maxPages pages
 * ends the walk with a warning.
 *
 * Not thread-safe.
 */
class PaginatedFetcher {
public:
    static constexpr std::size_t kDefaultMaxPages = 10000;

    PaginatedFetcher(CatalogClient& client, std::string endpoint, QueryParams base = {},
                     std::size_t maxPages = kDefaultMaxPages);

    // Next item, fetching the next page on demand.
    Expected<std::optional<nlohmann::json>> next();

    // Drains the remaining items.
    Expected<std::vector<nlohmann::json>> fetchAll();

    [[nodiscard]] std::size_t pagesFetched() const noexcept { return pages_; }
    [[nodiscard]] bool exhausted() const noexcept { return done_ && buffer_.empty(); }

private:
    Expected<void> fetchPage();

    CatalogClient& client_;
    std::string endpoint_;
    QueryParams params_;
    std::size_t maxPages_;

    std::deque<nlohmann::json> buffer_;
    std::unordered_set<std::string> seenCursors_;
    std::size_t pages_{0};
    bool done_{false};
};

} // namespace civdl::api
