#include "hub/key_source.hpp"
#include "common/url.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace beacon {

public_key_map parse_key_document(const std::string& body) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("key endpoint: response is not a JSON object");
    }
    auto keys = doc.find("keys");
    if (keys == doc.end() || !keys->is_array()) {
        throw std::runtime_error("key endpoint: missing 'keys' array");
    }

    public_key_map out;
    for (const auto& entry : *keys) {
        if (!entry.is_object()) continue;
        auto id = entry.find("source_id");
        auto key = entry.find("public_key");
        if (id == entry.end() || key == entry.end() || !id->is_string() || !key->is_string()) {
            continue;
        }
        out[id->get<std::string>()] = key->get<std::string>();
    }
    return out;
}

http_key_source::http_key_source(const std::string& endpoint, std::string api_key,
                                 std::chrono::seconds timeout)
    : m_endpoint(endpoint), m_api_key(std::move(api_key))
{
    auto parts = split_url(endpoint);
    if (!parts) throw std::runtime_error("key endpoint: invalid url '" + endpoint + "'");
    m_path = parts->path;

    m_client = std::make_unique<httplib::Client>(parts->origin);
    m_client->set_connection_timeout(timeout);
    m_client->set_read_timeout(timeout);
}

http_key_source::~http_key_source() = default;

public_key_map http_key_source::fetch() {
    httplib::Headers headers;
    if (!m_api_key.empty()) {
        headers.emplace("apikey", m_api_key);
        headers.emplace("Authorization", "Bearer " + m_api_key);
    }

    auto res = m_client->Get(m_path, headers);
    if (!res) {
        throw std::runtime_error("key endpoint: request failed: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw std::runtime_error("key endpoint: HTTP " + std::to_string(res->status));
    }
    return parse_key_document(res->body);
}

} // namespace beacon
