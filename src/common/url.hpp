#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace beacon {

struct url_parts {
    std::string origin;   // scheme://host[:port]
    std::string path;     // always starts with '/'
};

// Splits "https://hub.example.com:8443/base" into origin and path.
// Returns nullopt if the scheme is not http or https, or the host is empty.
std::optional<url_parts> split_url(const std::string& url);

// Percent-decodes %XX sequences; malformed sequences are kept verbatim.
std::string url_decode(std::string_view s);

// Splits a request target into its path and decoded query parameters.
// "+" in a query value decodes to a space. A repeated key keeps the first value.
struct request_target {
    std::string path;
    std::map<std::string, std::string> query;

    std::optional<std::string> param(const std::string& key) const;
};

request_target parse_target(std::string_view target);

} // namespace beacon
