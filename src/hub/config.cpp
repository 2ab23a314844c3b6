#include "hub/config.hpp"
#include <yaml-cpp/yaml.h>
#include <charconv>
#include <stdexcept>

namespace beacon {

std::map<std::string, std::string> parse_public_keys(const std::string& s) {
    std::map<std::string, std::string> keys;
    for (const auto& entry : split_list(s, ',')) {
        auto colon = entry.find(':');
        if (colon == std::string::npos) {
            throw std::runtime_error("config: public key entry '" + entry + "' must be source_id:public_key");
        }
        std::string source(trim(std::string_view(entry).substr(0, colon)));
        std::string key(trim(std::string_view(entry).substr(colon + 1)));
        if (source.empty() || key.empty()) {
            throw std::runtime_error("config: public key entry '" + entry + "' has an empty field");
        }
        keys[source] = key;
    }
    return keys;
}

void load_hub_config_file(hub_config& cfg, const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);

    if (auto n = root["bind_address"]) cfg.bind_address = n.as<std::string>();
    if (auto n = root["port"])         cfg.port = n.as<uint16_t>();

    // Keys
    if (auto n = root["public_keys"]) {
        if (!n.IsMap()) throw std::runtime_error("config: 'public_keys' must be a map of source_id: key");
        for (const auto& kv : n) {
            cfg.public_keys[kv.first.as<std::string>()] = kv.second.as<std::string>();
        }
    }
    if (auto n = root["key_endpoint"])            cfg.key_endpoint = n.as<std::string>();
    if (auto n = root["key_endpoint_api_key"])    cfg.key_endpoint_api_key = n.as<std::string>();
    if (auto n = root["key_refresh_seconds"])     cfg.key_refresh_seconds = n.as<uint32_t>();
    if (auto n = root["key_fetch_attempts"])      cfg.key_fetch_attempts = n.as<uint32_t>();
    if (auto n = root["key_fetch_base_delay_ms"]) cfg.key_fetch_base_delay_ms = n.as<uint32_t>();
    if (auto n = root["key_fetch_max_delay_ms"])  cfg.key_fetch_max_delay_ms = n.as<uint32_t>();

    // Auth
    if (auto n = root["subscriber_token"]) cfg.subscriber_token = n.as<std::string>();
    if (auto n = root["unsafe_no_auth"])   cfg.unsafe_no_auth = n.as<bool>();

    // Rate limits
    if (auto n = root["source_rate"])            cfg.source_rate = n.as<double>();
    if (auto n = root["source_burst"])           cfg.source_burst = n.as<double>();
    if (auto n = root["global_rate"])            cfg.global_rate = n.as<double>();
    if (auto n = root["global_burst"])           cfg.global_burst = n.as<double>();
    if (auto n = root["bucket_idle_seconds"])    cfg.bucket_idle_seconds = n.as<uint32_t>();
    if (auto n = root["bucket_cleanup_seconds"]) cfg.bucket_cleanup_seconds = n.as<uint32_t>();

    if (auto n = root["subscriber_buffer_size"]) cfg.subscriber_buffer_size = n.as<std::size_t>();
    if (auto n = root["max_body_bytes"])         cfg.max_body_bytes = n.as<std::size_t>();
    if (auto n = root["request_timeout_ms"])     cfg.request_timeout_ms = n.as<uint32_t>();
    if (auto n = root["shutdown_grace_seconds"]) cfg.shutdown_grace_seconds = n.as<uint32_t>();

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();
    if (auto n = root["worker_threads"])         cfg.worker_threads = n.as<unsigned int>();
}

void apply_hub_env(hub_config& cfg, const env_lookup& env) {
    if (auto v = env("PORT")) {
        unsigned port = 0;
        auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), port);
        if (ec != std::errc{} || ptr != v->data() + v->size() || port == 0 || port > 65535) {
            throw std::runtime_error("config: PORT must be 1-65535, got '" + *v + "'");
        }
        cfg.port = static_cast<uint16_t>(port);
    }
    if (auto v = env("BEACON_PUBLIC_KEYS"))           cfg.public_keys = parse_public_keys(*v);
    if (auto v = env("BEACON_KEY_ENDPOINT"))          cfg.key_endpoint = *v;
    if (auto v = env("BEACON_KEY_ENDPOINT_API_KEY"))  cfg.key_endpoint_api_key = *v;
    if (auto v = env("BEACON_SUBSCRIBER_TOKEN"))      cfg.subscriber_token = *v;
    if (auto v = env("BEACON_UNSAFE_NO_AUTH"))        cfg.unsafe_no_auth = parse_bool(*v);
    if (auto v = env("BEACON_LOG_LEVEL"))             cfg.log_level = *v;
}

void validate_hub_config(const hub_config& cfg) {
    if (!cfg.unsafe_no_auth) {
        if (cfg.public_keys.empty() && cfg.key_endpoint.empty()) {
            throw std::runtime_error("config: no monitor keys configured "
                                     "(BEACON_PUBLIC_KEYS or BEACON_KEY_ENDPOINT)");
        }
        if (cfg.subscriber_token.empty()) {
            throw std::runtime_error("config: BEACON_SUBSCRIBER_TOKEN is required");
        }
    }
    if (cfg.source_rate <= 0 || cfg.source_burst < 1) {
        throw std::runtime_error("config: source rate limit must be positive with burst >= 1");
    }
    if (cfg.global_rate <= 0 || cfg.global_burst < 1) {
        throw std::runtime_error("config: global rate limit must be positive with burst >= 1");
    }
    if (cfg.subscriber_buffer_size == 0) throw std::runtime_error("config: 'subscriber_buffer_size' must be positive");
    if (cfg.max_body_bytes == 0)         throw std::runtime_error("config: 'max_body_bytes' must be positive");
    if (cfg.key_fetch_attempts == 0)     throw std::runtime_error("config: 'key_fetch_attempts' must be positive");
    if (cfg.request_timeout_ms == 0)     throw std::runtime_error("config: 'request_timeout_ms' must be positive");
}

} // namespace beacon
