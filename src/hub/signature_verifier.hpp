#pragma once

#include "common/ed25519.hpp"
#include "hub/key_source.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace beacon {

enum class verify_status {
    valid,
    unknown_source,
    invalid_signature,
    // Signature header is not base64 of the right length
    invalid_encoding
};

const char* to_string(verify_status s);

struct key_cache {
    std::unordered_map<std::string, ed25519_public_key> keys;
    // When the fetch that produced these keys completed
    std::chrono::system_clock::time_point loaded_at;
};

// Looks up monitor keys in an immutable snapshot and verifies signatures.
// Readers take the snapshot with an atomic load and never block; refresh()
// builds a new snapshot and publishes it with an atomic store. A batch is
// checked against whatever snapshot is current when it arrives.
class signature_verifier {
public:
    signature_verifier(std::shared_ptr<key_source> source,
                       std::shared_ptr<spdlog::logger> log);

    // Startup fetch with exponential backoff (base_delay doubling, plus up to
    // 100ms jitter, capped at max_delay). Throws std::runtime_error once
    // max_attempts have failed.
    void load_initial(uint32_t max_attempts,
                      std::chrono::milliseconds base_delay,
                      std::chrono::milliseconds max_delay);

    // Re-fetch keys. On failure the previous snapshot stays in place and
    // false is returned.
    bool refresh();

    verify_status verify(std::string_view source_id,
                         std::string_view signature_b64,
                         std::string_view body) const;

    std::shared_ptr<const key_cache> snapshot() const;
    std::size_t key_count() const;
    bool refreshable() const { return m_source->refreshable(); }

private:
    // Decodes keys; invalid entries are skipped with a warning.
    std::shared_ptr<const key_cache> build(const public_key_map& raw) const;

    std::shared_ptr<key_source> m_source;
    std::shared_ptr<spdlog::logger> m_log;

    // Serializes refreshes
    std::mutex m_refresh_mutex;

    // Current snapshot, accessed with std::atomic_load / std::atomic_store
    std::shared_ptr<const key_cache> m_cache;
};

} // namespace beacon
