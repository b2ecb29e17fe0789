#pragma once

#include <restcall/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace restcall {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Case-insensitive ASCII prefix test.
bool StartsWithIgnoreCase(std::string_view value, std::string_view prefix);

// ---------------------------------------------------------------------------
// UrlParts — the five RFC 3986 components of a URI reference.
// An absent authority/query/fragment is distinct from an empty one.
// ---------------------------------------------------------------------------
struct UrlParts {
    std::string scheme;
    std::optional<std::string> authority;
    std::string path;
    std::optional<std::string> query;
    std::optional<std::string> fragment;

    [[nodiscard]] std::string ToString() const;
};

// Split a URI reference into its components (RFC 3986 appendix B).
// Fails on whitespace or control characters and on a non-numeric port.
Result<UrlParts, Error> ParseUrlReference(std::string_view reference);

// Parse an absolute http(s)-style URL: scheme and non-empty host required.
Result<UrlParts, Error> ParseAbsoluteUrl(std::string_view url);

// Resolve `reference` against the absolute `base` URL (RFC 3986 section 5.2).
Result<std::string, Error> ResolveUrl(std::string_view base,
                                      std::string_view reference);

// RFC 3986 section 5.2.4.
std::string RemoveDotSegments(std::string_view path);

// ---------------------------------------------------------------------------
// UrlBuilder — assembles an absolute URL from resolved pieces. Query values
// are expected to be encoded already and are appended in insertion order.
// ---------------------------------------------------------------------------
class UrlBuilder {
public:
    UrlBuilder& WithScheme(std::string scheme);
    UrlBuilder& WithHost(std::string host);
    UrlBuilder& WithPath(std::string path);
    UrlBuilder& WithQueryParameter(std::string name, std::string encoded_value);

    [[nodiscard]] std::string ToString() const;

private:
    std::string scheme_;
    std::string host_;
    std::string path_;
    std::vector<std::pair<std::string, std::string>> query_;
};

} // namespace restcall
