#include <civdl/net/url.h>

#include <cctype>

namespace civdl::net {

namespace {

bool isUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::string_view stripFragment(std::string_view url) {
    auto hash = url.find('#');
    return hash == std::string_view::npos ? url : url.substr(0, hash);
}

} // namespace

std::string percentEncode(std::string_view s) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (isUnreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::string percentDecode(std::string_view s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            const int hi = hexValue(s[i + 1]);
            const int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        if (c == '+' && plusAsSpace) {
            out.push_back(' ');
            continue;
        }
        out.push_back(c);
    }
    return out;
}

std::string appendQuery(std::string_view url, const QueryParams& params) {
    std::string out{url};
    if (params.empty())
        return out;
    char sep = out.find('?') == std::string::npos ? '?' : '&';
    for (const auto& [key, value] : params) {
        out.push_back(sep);
        out.append(percentEncode(key));
        out.push_back('=');
        out.append(percentEncode(value));
        sep = '&';
    }
    return out;
}

std::string urlPath(std::string_view url) {
    url = stripFragment(url);
    auto query = url.find('?');
    if (query != std::string_view::npos)
        url = url.substr(0, query);

    auto scheme = url.find("://");
    if (scheme != std::string_view::npos) {
        auto pathStart = url.find('/', scheme + 3);
        if (pathStart == std::string_view::npos)
            return {};
        return std::string{url.substr(pathStart)};
    }
    return std::string{url};
}

std::string urlOrigin(std::string_view url) {
    auto scheme = url.find("://");
    if (scheme == std::string_view::npos)
        return {};
    auto end = url.find_first_of("/?#", scheme + 3);
    return std::string{url.substr(0, end)};
}

std::optional<std::string> queryValue(std::string_view url, std::string_view key) {
    url = stripFragment(url);
    auto q = url.find('?');
    if (q == std::string_view::npos)
        return std::nullopt;
    std::string_view query = url.substr(q + 1);
    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        auto eq = pair.find('=');
        std::string_view k = pair.substr(0, eq);
        if (percentDecode(k, true) == key) {
            if (eq == std::string_view::npos)
                return std::string{};
            return percentDecode(pair.substr(eq + 1), true);
        }
        if (amp == std::string_view::npos)
            break;
        query.remove_prefix(amp + 1);
    }
    return std::nullopt;
}

} // namespace civdl::net
