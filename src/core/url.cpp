#include <mcp_manager/core/url.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_manager {

namespace {

bool StartsWithNoCase(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size()) return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(),
                      [](char a, char b) {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

bool IsDefaultPort(const HttpUrl& url) {
    return (url.scheme == "http" && url.port == 80) ||
           (url.scheme == "https" && url.port == 443);
}

// IPv6 literals go back into brackets.
std::string FormatHost(const std::string& host) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]";
    }
    return host;
}

} // anonymous namespace

std::string HttpUrl::Origin() const {
    return scheme + "://" + FormatHost(host) + ":" + std::to_string(port);
}

std::string HttpUrl::ToString() const {
    std::string out = scheme + "://" + FormatHost(host);
    if (!IsDefaultPort(*this)) {
        out += ":" + std::to_string(port);
    }
    return out + target;
}

bool IsAbsoluteHttpUrl(std::string_view text) {
    return StartsWithNoCase(text, "http://") || StartsWithNoCase(text, "https://");
}

Result<HttpUrl, std::string> ParseHttpUrl(std::string_view text) {
    using R = Result<HttpUrl, std::string>;

    HttpUrl url;
    std::string_view rest;
    if (StartsWithNoCase(text, "http://")) {
        url.scheme = "http";
        url.port = 80;
        rest = text.substr(7);
    } else if (StartsWithNoCase(text, "https://")) {
        url.scheme = "https";
        url.port = 443;
        rest = text.substr(8);
    } else {
        return R::Err("URL must start with http:// or https://: " + std::string(text));
    }

    auto fragment = rest.find('#');
    if (fragment != std::string_view::npos) {
        rest = rest.substr(0, fragment);
    }

    auto authority_end = rest.find_first_of("/?");
    auto authority = rest.substr(0, authority_end);
    if (authority_end == std::string_view::npos) {
        url.target = "/";
    } else if (rest[authority_end] == '?') {
        url.target = "/" + std::string(rest.substr(authority_end));
    } else {
        url.target = std::string(rest.substr(authority_end));
    }

    auto at = authority.rfind('@');
    if (at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return R::Err("Unterminated IPv6 host in URL: " + std::string(text));
        }
        host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                return R::Err("Malformed host in URL: " + std::string(text));
            }
            port = authority.substr(close + 2);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (host.empty()) {
        return R::Err("URL has no host: " + std::string(text));
    }
    url.host = std::string(host);

    if (!port.empty()) {
        if (port.size() > 5 ||
            !std::all_of(port.begin(), port.end(),
                         [](char c) { return c >= '0' && c <= '9'; })) {
            return R::Err("Invalid port in URL: " + std::string(text));
        }
        url.port = std::stoi(std::string(port));
        if (url.port <= 0 || url.port > 65535) {
            return R::Err("Port out of range in URL: " + std::string(text));
        }
    }

    return R::Ok(std::move(url));
}

Result<std::string, std::string> ResolveUrlReference(std::string_view base,
                                                     std::string_view reference) {
    using R = Result<std::string, std::string>;

    if (IsAbsoluteHttpUrl(reference)) {
        return R::Ok(std::string(reference));
    }

    auto parsed = ParseHttpUrl(base);
    if (parsed.IsErr()) {
        return R::Err(parsed.Error());
    }
    auto url = std::move(parsed).Value();

    if (reference.empty()) {
        return R::Err("Empty URL reference");
    }

    if (reference.front() == '/') {
        url.target = std::string(reference);
    } else {
        auto path = url.target.substr(0, url.target.find('?'));
        auto last_slash = path.rfind('/');
        url.target = path.substr(0, last_slash + 1) + std::string(reference);
    }
    return R::Ok(url.ToString());
}

} // namespace mcp_manager
