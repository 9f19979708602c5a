#include <civdl/api/catalog_client.h>
#include <civdl/api/paginated_fetcher.h>

#include <spdlog/spdlog.h>

#include <cstdint>
#include <utility>

namespace civdl::api {

namespace {

// Cursor value as sent back to the server; nullopt when the walk is over.
std::optional<std::string> cursorOf(const nlohmann::json& page) {
    auto meta = page.find("metadata");
    if (meta == page.end() || !meta->is_object())
        return std::nullopt;
    auto cur = meta->find("nextCursor");
    if (cur == meta->end() || cur->is_null())
        return std::nullopt;
    if (cur->is_string())
        return cur->get<std::string>();
    if (cur->is_number_integer())
        return std::to_string(cur->get<std::int64_t>());
    return cur->dump();
}

} // namespace

PaginatedFetcher::PaginatedFetcher(CatalogClient& client, std::string endpoint, QueryParams base,
                                   std::size_t maxPages)
    : client_(client), endpoint_(std::move(endpoint)), params_(std::move(base)),
      maxPages_(maxPages) {}

Expected<void> PaginatedFetcher::fetchPage() {
    if (pages_ >= maxPages_) {
        spdlog::warn("Pagination of {} stopped after {} pages", endpoint_, pages_);
        done_ = true;
        return Expected<void>{};
    }

    auto page = client_.getJson(endpoint_, params_);
    if (!page.ok()) {
        done_ = true;
        return page.error();
    }
    ++pages_;

    const auto& body = page.value();
    auto items = body.find("items");
    if (items != body.end()) {
        if (!items->is_array()) {
            done_ = true;
            return Error{ErrorCode::InvalidResponse, "'items' is not an array in " + endpoint_};
        }
        for (const auto& item : *items)
            buffer_.push_back(item);
    }

    auto cursor = cursorOf(body);
    if (!cursor) {
        done_ = true;
        return Expected<void>{};
    }
    if (!seenCursors_.insert(*cursor).second) {
        spdlog::warn("Pagination of {} returned cursor '{}' twice; stopping", endpoint_, *cursor);
        done_ = true;
        return Expected<void>{};
    }
    params_.set("cursor", *cursor);
    spdlog::debug("{} page {} -> next cursor {}", endpoint_, pages_, *cursor);
    return Expected<void>{};
}

Expected<std::optional<nlohmann::json>> PaginatedFetcher::next() {
    while (buffer_.empty() && !done_) {
        auto r = fetchPage();
        if (!r.ok())
            return r.error();
    }
    if (buffer_.empty())
        return std::optional<nlohmann::json>{};

    std::optional<nlohmann::json> item{std::move(buffer_.front())};
    buffer_.pop_front();
    return item;
}

Expected<std::vector<nlohmann::json>> PaginatedFetcher::fetchAll() {
    std::vector<nlohmann::json> all;
    for (;;) {
        auto item = next();
        if (!item.ok())
            return item.error();
        if (!item.value())
            break;
        all.push_back(std::move(*item.value()));
    }
    return all;
}

} // namespace civdl::api
