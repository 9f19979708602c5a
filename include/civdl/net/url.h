#pragma once

#include <civdl/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace civdl::net {

// RFC 3986 percent-encoding of everything outside the unreserved set.
std::string percentEncode(std::string_view s);

// Decodes %XX escapes; malformed escapes are copied through verbatim.
// When plusAsSpace is set, '+' decodes to ' ' (form/query encoding).
std::string percentDecode(std::string_view s, bool plusAsSpace = false);

// Appends params to url, using '?' or '&' depending on whether url already has a query.
std::string appendQuery(std::string_view url, const QueryParams& params);

// Path component of an absolute or relative URL, without query and fragment.
std::string urlPath(std::string_view url);

// "scheme://authority" of an absolute URL; empty when url has no scheme.
std::string urlOrigin(std::string_view url);

// First value of a query parameter, percent-decoded.
std::optional<std::string> queryValue(std::string_view url, std::string_view key);

} // namespace civdl::net
