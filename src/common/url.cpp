#include "common/url.hpp"

namespace beacon {

std::optional<url_parts> split_url(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return std::nullopt;
    auto scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https") return std::nullopt;

    auto path_start = url.find('/', scheme_end + 3);
    url_parts parts;
    if (path_start == std::string::npos) {
        parts.origin = url;
        parts.path = "/";
    } else {
        parts.origin = url.substr(0, path_start);
        parts.path = url.substr(path_start);
    }
    if (parts.origin.size() <= scheme_end + 3) return std::nullopt;
    return parts;
}

std::string url_decode(std::string_view s) {
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex(s[i + 1]);
            int lo = hex(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

static std::string decode_query_component(std::string_view s) {
    std::string plus_decoded(s);
    for (auto& c : plus_decoded) {
        if (c == '+') c = ' ';
    }
    return url_decode(plus_decoded);
}

std::optional<std::string> request_target::param(const std::string& key) const {
    auto it = query.find(key);
    if (it == query.end()) return std::nullopt;
    return it->second;
}

request_target parse_target(std::string_view target) {
    request_target out;
    auto q = target.find('?');
    out.path = url_decode(target.substr(0, q));
    if (q == std::string_view::npos) return out;

    auto rest = target.substr(q + 1);
    while (!rest.empty()) {
        auto amp = rest.find('&');
        auto pair = rest.substr(0, amp);
        rest = amp == std::string_view::npos ? std::string_view{} : rest.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = decode_query_component(pair.substr(0, eq));
        auto value = eq == std::string_view::npos ? std::string() : decode_query_component(pair.substr(eq + 1));
        out.query.emplace(std::move(key), std::move(value));
    }
    return out;
}

} // namespace beacon
