#include <civdl/core/string_utils.h>
#include <civdl/downloader/download_task.h>
#include <civdl/net/url.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>

namespace civdl::downloader {

namespace {

constexpr std::string_view kInvalidChars = "\\/*?:\"<>|";

// 32-bit FNV-1a; stable across platforms and runs.
std::uint32_t fnv1a(std::string_view s) {
    std::uint32_t h = 2166136261u;
    for (unsigned char c : s) {
        h ^= c;
        h *= 16777619u;
    }
    return h;
}

bool allDigits(std::string_view s) {
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

// Value of one "name=value" parameter; quoted values are unwrapped.
std::string_view paramValue(std::string_view v) {
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front())))
        v.remove_prefix(1);
    if (!v.empty() && v.front() == '"') {
        v.remove_prefix(1);
        auto close = v.find('"');
        return v.substr(0, close);
    }
    auto end = v.find_first_of("; \t");
    return v.substr(0, end);
}

} // namespace

std::string sanitizeFilename(std::string_view name) {
    std::string out{name};
    for (auto& c : out) {
        if (kInvalidChars.find(c) != std::string_view::npos)
            c = '_';
    }
    return trim(out);
}

std::optional<std::string> parseContentDisposition(std::string_view header) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    // Split on ';' outside quotes.
    size_t pos = 0;
    while (pos < header.size()) {
        size_t end = pos;
        bool quoted = false;
        while (end < header.size() && (quoted || header[end] != ';')) {
            if (header[end] == '"')
                quoted = !quoted;
            ++end;
        }
        std::string part = trim(header.substr(pos, end - pos));
        pos = end + 1;

        auto eq = part.find('=');
        if (eq == std::string::npos)
            continue;
        std::string key = toLower(trim(std::string_view(part).substr(0, eq)));
        std::string_view value = paramValue(std::string_view(part).substr(eq + 1));

        if (key == "filename*") {
            // charset'lang'percent-encoded
            auto firstQuote = value.find('\'');
            auto secondQuote = firstQuote == std::string_view::npos
                                   ? std::string_view::npos
                                   : value.find('\'', firstQuote + 1);
            std::string_view encoded =
                secondQuote == std::string_view::npos ? value : value.substr(secondQuote + 1);
            extended = net::percentDecode(encoded);
        } else if (key == "filename") {
            plain = std::string{value};
        }
    }

    const auto& chosen = extended ? extended : plain;
    if (!chosen)
        return std::nullopt;
    auto name = sanitizeFilename(*chosen);
    if (name.empty())
        return std::nullopt;
    return name;
}

std::string filenameFromUrl(std::string_view url) {
    std::string path = net::percentDecode(net::urlPath(url));
    std::string base;
    if (!path.empty() && path.back() != '/') {
        auto slash = path.find_last_of('/');
        base = slash == std::string::npos ? path : path.substr(slash + 1);
    }
    base = sanitizeFilename(base);

    if (base.empty() || base.find('.') == std::string::npos) {
        if (auto q = net::queryValue(url, "filename"); q && !sanitizeFilename(*q).empty()) {
            auto name = sanitizeFilename(*q);
            if (name.find('.') == std::string::npos) {
                auto ext = std::filesystem::path(path).extension().string();
                name += ext.size() > 1 ? ext : std::string(".download");
            }
            return name;
        }
        if (auto id = net::queryValue(url, "id"); id && allDigits(*id)) {
            return "download_" + *id;
        }
        char hex[9];
        std::snprintf(hex, sizeof(hex), "%08x", static_cast<unsigned>(fnv1a(url)));
        return std::string("download_") + hex;
    }
    return base;
}

} // namespace civdl::downloader
