#pragma once

#include "common/env.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

namespace beacon {

struct hub_config {
    // Listener
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8080;

    // Registered monitors: source_id -> base64 Ed25519 public key
    std::map<std::string, std::string> public_keys;

    // Authoritative key store (GET, {"keys":[{"source_id","public_key"}]}).
    // When set it replaces public_keys and is refreshed periodically.
    std::string key_endpoint;
    std::string key_endpoint_api_key;
    uint32_t key_refresh_seconds = 30;
    uint32_t key_fetch_attempts = 5;
    uint32_t key_fetch_base_delay_ms = 100;
    uint32_t key_fetch_max_delay_ms = 10000;

    // Shared credential for GET /ws?token=...
    std::string subscriber_token;

    // Local development only: disables signature and token checks
    bool unsafe_no_auth = false;

    // Token buckets (requests per second / burst)
    double source_rate = 100.0;
    double source_burst = 100.0;
    double global_rate = 1000.0;
    double global_burst = 1000.0;
    uint32_t bucket_idle_seconds = 60;
    uint32_t bucket_cleanup_seconds = 30;

    // Broadcast ring depth: how far a subscriber may trail before it lags
    std::size_t subscriber_buffer_size = 100;

    // Ingestion
    std::size_t max_body_bytes = 1024 * 1024;
    uint32_t request_timeout_ms = 5000;
    uint32_t shutdown_grace_seconds = 10;

    // Operational
    int stats_interval_seconds = 30;
    std::string log_level = "info";
    unsigned int worker_threads = 0;
};

// Overlay values from a YAML file. Throws on error.
void load_hub_config_file(hub_config& cfg, const std::string& path);

// Overlay PORT and BEACON_* environment variables. Throws on malformed values.
void apply_hub_env(hub_config& cfg, const env_lookup& env);

// Throws std::runtime_error("config: ...") when the hub cannot run safely.
void validate_hub_config(const hub_config& cfg);

// "src1:key1,src2:key2". Throws std::runtime_error on a malformed entry.
std::map<std::string, std::string> parse_public_keys(const std::string& s);

} // namespace beacon
