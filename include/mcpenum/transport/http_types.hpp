#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>

namespace mcpenum {

// ─────────────────────────────────────────────────────────────────────────────
// Case-Insensitive Header Lookup
// ─────────────────────────────────────────────────────────────────────────────
// HTTP header names are case-insensitive per RFC 7230. Servers disagree on
// the casing of Mcp-Session-Id and Content-Type, so always look up via these.

using HeaderMap = std::unordered_map<std::string, std::string>;

inline HeaderMap::const_iterator find_header(
    const HeaderMap& headers,
    std::string_view name
) {
    return std::ranges::find_if(headers,
        [&name](const auto& pair) {
            const auto& key = pair.first;
            return key.size() == name.size() &&
                   std::ranges::equal(key, name,
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) ==
                                  std::tolower(static_cast<unsigned char>(b));
                       });
        });
}

inline std::optional<std::string> get_header(
    const HeaderMap& headers,
    std::string_view name
) {
    const auto it = find_header(headers, name);
    const bool found = (it != headers.end());
    if (found) {
        return it->second;
    }
    return std::nullopt;
}

enum class HttpMethod {
    Get,
    Post
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:  return "GET";
        case HttpMethod::Post: return "POST";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;     // hostname, IPv6 literals keep their brackets
    std::uint16_t port;   // explicit port or the scheme default
    std::string path;     // always starts with '/'
    std::string query;    // includes the leading '?', may be empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// scheme://host:port, the base handed to IHttpClient::set_base_url
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    [[nodiscard]] std::string path_with_query() const {
        const bool has_query = (query.empty() == false);
        if (has_query) {
            return path + query;
        }
        return path;
    }

    /// Path of a sibling endpoint below this URL's path ("/mcp" + "/tools")
    [[nodiscard]] std::string child_path(std::string_view suffix) const {
        std::string base = path;
        while ((base.empty() == false) && (base.back() == '/')) {
            base.pop_back();
        }
        return base + std::string(suffix);
    }
};

// Parsed with ada-url (WHATWG URL standard). Only http and https are
// accepted; anything else yields nullopt.
std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace mcpenum
