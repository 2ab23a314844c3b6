#include "monitor/config.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace beacon {

monitor_config default_monitor_config(const env_lookup& env) {
    monitor_config cfg;
    cfg.source_id = local_hostname();
    cfg.key_dir = home_directory(env) + "/.beacon";
    cfg.watch_root = home_directory(env) + "/.claude/projects";
    return cfg;
}

std::optional<std::vector<std::string>> parse_allowlist(const std::string& csv) {
    std::vector<std::string> out;
    for (auto item : split_list(csv)) {
        std::transform(item.begin(), item.end(), item.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (item.front() != '.') item.insert(item.begin(), '.');
        if (item.size() > 1) out.push_back(std::move(item));
    }
    if (out.empty()) return std::nullopt;
    return out;
}

static std::size_t parse_positive(const std::string& name, const std::string& value) {
    std::size_t n = 0;
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), n);
    if (ec != std::errc{} || ptr != value.data() + value.size() || n == 0) {
        throw std::runtime_error("config: " + name + " must be a positive integer, got '" + value + "'");
    }
    return n;
}

void load_monitor_config_file(monitor_config& cfg, const std::string& path) {
    YAML::Node root = YAML::LoadFile(path);

    if (auto n = root["hub_url"])        cfg.hub_url = n.as<std::string>();
    if (auto n = root["source_id"])      cfg.source_id = n.as<std::string>();
    if (auto n = root["key_dir"])        cfg.key_dir = n.as<std::string>();
    if (auto n = root["watch_root"])     cfg.watch_root = n.as<std::string>();
    if (auto n = root["file_extension"]) cfg.file_extension = n.as<std::string>();

    if (auto n = root["basename_allowlist"]) {
        if (n.IsSequence()) {
            std::string joined;
            for (const auto& item : n) joined += item.as<std::string>() + ",";
            cfg.basename_allowlist = parse_allowlist(joined);
        } else {
            cfg.basename_allowlist = parse_allowlist(n.as<std::string>());
        }
    }

    // Delivery
    if (auto n = root["buffer_capacity"])          cfg.buffer_capacity = n.as<std::size_t>();
    if (auto n = root["max_batch_size"])           cfg.max_batch_size = n.as<std::size_t>();
    if (auto n = root["flush_interval_ms"])        cfg.flush_interval_ms = n.as<uint32_t>();
    if (auto n = root["initial_retry_delay_ms"])   cfg.initial_retry_delay_ms = n.as<uint32_t>();
    if (auto n = root["max_retry_delay_ms"])       cfg.max_retry_delay_ms = n.as<uint32_t>();
    if (auto n = root["max_retry_attempts"])       cfg.max_retry_attempts = n.as<uint32_t>();
    if (auto n = root["request_timeout_seconds"])  cfg.request_timeout_seconds = n.as<uint32_t>();
    if (auto n = root["shutdown_timeout_seconds"]) cfg.shutdown_timeout_seconds = n.as<uint32_t>();

    if (auto n = root["channel_capacity"])     cfg.channel_capacity = n.as<std::size_t>();
    if (auto n = root["max_tracked_sessions"]) cfg.max_tracked_sessions = n.as<std::size_t>();
    if (auto n = root["max_watches"])          cfg.max_watches = n.as<std::size_t>();

    // Operational
    if (auto n = root["stats_interval_seconds"]) cfg.stats_interval_seconds = n.as<int>();
    if (auto n = root["log_level"])              cfg.log_level = n.as<std::string>();
    if (auto n = root["worker_threads"])         cfg.worker_threads = n.as<unsigned int>();
}

void apply_monitor_env(monitor_config& cfg, const env_lookup& env) {
    if (auto v = env("BEACON_HUB_URL"))   cfg.hub_url = *v;
    if (auto v = env("BEACON_SOURCE_ID")) cfg.source_id = *v;
    if (auto v = env("BEACON_KEY_PATH"))  cfg.key_dir = expand_home(*v, env);
    if (auto v = env("BEACON_WATCH_DIR")) cfg.watch_root = expand_home(*v, env);
    if (auto v = env("BEACON_BUFFER_SIZE")) {
        cfg.buffer_capacity = parse_positive("BEACON_BUFFER_SIZE", *v);
    }
    if (auto v = env("BEACON_BASENAME_ALLOWLIST")) cfg.basename_allowlist = parse_allowlist(*v);
    if (auto v = env("BEACON_LOG_LEVEL"))          cfg.log_level = *v;
}

void validate_monitor_config(const monitor_config& cfg, bool require_hub_url) {
    if (require_hub_url) {
        if (cfg.hub_url.empty()) {
            throw std::runtime_error("config: hub url is required (BEACON_HUB_URL or 'hub_url')");
        }
        if (cfg.hub_url.rfind("http://", 0) != 0 && cfg.hub_url.rfind("https://", 0) != 0) {
            throw std::runtime_error("config: hub url must start with http:// or https://");
        }
    }
    if (cfg.source_id.empty())        throw std::runtime_error("config: 'source_id' must not be empty");
    if (cfg.key_dir.empty())          throw std::runtime_error("config: 'key_dir' must not be empty");
    if (cfg.buffer_capacity == 0)     throw std::runtime_error("config: 'buffer_capacity' must be positive");
    if (cfg.max_batch_size == 0)      throw std::runtime_error("config: 'max_batch_size' must be positive");
    if (cfg.flush_interval_ms == 0)   throw std::runtime_error("config: 'flush_interval_ms' must be positive");
    if (cfg.channel_capacity == 0)    throw std::runtime_error("config: 'channel_capacity' must be positive");
    if (cfg.max_retry_attempts == 0)  throw std::runtime_error("config: 'max_retry_attempts' must be positive");
    if (cfg.initial_retry_delay_ms == 0 || cfg.initial_retry_delay_ms > cfg.max_retry_delay_ms) {
        throw std::runtime_error("config: retry delays must satisfy 0 < initial <= max");
    }
}

} // namespace beacon
