#include "mcpenum/transport/http_types.hpp"

#include <ada.h>

#include <charconv>

namespace mcpenum {

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url>(url);
    const bool parse_failed = (parsed.has_value() == false);
    if (parse_failed) {
        return std::nullopt;
    }

    const auto& ada_url = parsed.value();

    // ada reports the protocol with its trailing colon ("https:")
    std::string scheme = std::string(ada_url.get_protocol());
    const bool has_colon = (scheme.empty() == false) && (scheme.back() == ':');
    if (has_colon) {
        scheme.pop_back();
    }

    const bool is_http = (scheme == "http");
    const bool is_https = (scheme == "https");
    if ((is_http || is_https) == false) {
        return std::nullopt;
    }

    std::string host = std::string(ada_url.get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    std::uint16_t port = is_https ? 443 : 80;
    const std::string port_str = std::string(ada_url.get_port());
    const bool has_explicit_port = (port_str.empty() == false);
    if (has_explicit_port) {
        const auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        const bool valid_port = (ec == std::errc{}) && (ptr == port_str.data() + port_str.size());
        if (valid_port == false) {
            return std::nullopt;
        }
    }

    std::string path = std::string(ada_url.get_pathname());
    if (path.empty()) {
        path = "/";
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);
    result.port = port;
    result.path = std::move(path);
    result.query = std::string(ada_url.get_search());
    return result;
}

}  // namespace mcpenum
