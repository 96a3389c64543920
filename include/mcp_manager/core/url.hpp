#pragma once

#include <mcp_manager/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_manager {

// ---------------------------------------------------------------------------
// HttpUrl: an absolute http:// or https:// URL split for the HTTP client.
// ---------------------------------------------------------------------------
struct HttpUrl {
    std::string scheme;   // "http" or "https"
    std::string host;
    int port = 0;         // explicit or scheme default
    std::string target;   // path plus query, always starts with '/'

    /// "scheme://host:port", the form the HTTP client is constructed from.
    [[nodiscard]] std::string Origin() const;
    [[nodiscard]] std::string ToString() const;
};

/// True if the text starts with "http://" or "https://".
bool IsAbsoluteHttpUrl(std::string_view text);

/// Parse an absolute http(s) URL. Fragments are dropped.
Result<HttpUrl, std::string> ParseHttpUrl(std::string_view text);

/// Resolve a possibly relative reference against an absolute base URL.
/// Absolute references are returned unchanged; "/path" replaces the base
/// path; anything else is taken relative to the base path's directory.
Result<std::string, std::string> ResolveUrlReference(std::string_view base,
                                                     std::string_view reference);

} // namespace mcp_manager
