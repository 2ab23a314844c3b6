#pragma once

#include "common/env.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace beacon {

struct monitor_config {
    // Hub ingestion endpoint, e.g. https://hub.example.com (POST <hub_url>/events)
    std::string hub_url;
    std::string source_id;

    // Holds key.priv / key.pub
    std::string key_dir;

    // Session log tree
    std::string watch_root;
    std::string file_extension = ".jsonl";

    // Normalized extensions (".rs"). Unset = every basename is allowed.
    std::optional<std::vector<std::string>> basename_allowlist;

    // Delivery buffer
    std::size_t buffer_capacity = 1000;
    std::size_t max_batch_size = 1000;
    uint32_t flush_interval_ms = 1000;
    uint32_t initial_retry_delay_ms = 1000;
    uint32_t max_retry_delay_ms = 60000;
    uint32_t max_retry_attempts = 10;
    uint32_t request_timeout_seconds = 30;
    uint32_t shutdown_timeout_seconds = 5;

    // Watcher -> sender channel
    std::size_t channel_capacity = 1000;

    // Parser session tracking
    std::size_t max_tracked_sessions = 1000;

    // inotify watch budget (0 = derive from /proc/sys/fs/inotify/max_user_watches)
    std::size_t max_watches = 0;

    // Operational
    int stats_interval_seconds = 30;
    std::string log_level = "info";
    unsigned int worker_threads = 2;
};

// Defaults that depend on the host: hostname, ~/.beacon, ~/.claude/projects.
monitor_config default_monitor_config(const env_lookup& env);

// Overlay values from a YAML file. Throws on error.
void load_monitor_config_file(monitor_config& cfg, const std::string& path);

// Overlay BEACON_* environment variables. Throws on malformed values.
void apply_monitor_env(monitor_config& cfg, const env_lookup& env);

// Throws std::runtime_error("config: ...") on an unusable configuration.
void validate_monitor_config(const monitor_config& cfg, bool require_hub_url);

// "rs, .ts,  ,md" -> {".rs", ".ts", ".md"}. Returns nullopt if nothing remains.
std::optional<std::vector<std::string>> parse_allowlist(const std::string& csv);

} // namespace beacon
