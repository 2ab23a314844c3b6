#include "hub/signature_verifier.hpp"
#include "common/base64.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <thread>

namespace beacon {

const char* to_string(verify_status s) {
    switch (s) {
        case verify_status::valid:             return "valid";
        case verify_status::unknown_source:    return "unknown_source";
        case verify_status::invalid_signature: return "invalid_signature";
        case verify_status::invalid_encoding:  return "invalid_encoding";
    }
    return "unknown";
}

signature_verifier::signature_verifier(std::shared_ptr<key_source> source,
                                       std::shared_ptr<spdlog::logger> log)
    : m_source(std::move(source)), m_log(std::move(log)),
      m_cache(std::make_shared<const key_cache>())
{}

std::shared_ptr<const key_cache> signature_verifier::build(const public_key_map& raw) const {
    auto cache = std::make_shared<key_cache>();
    cache->loaded_at = std::chrono::system_clock::now();

    for (const auto& [source_id, encoded] : raw) {
        auto decoded = base64_decode(encoded);
        if (!decoded || decoded->size() != ed25519_public_key_size) {
            m_log->warn("verifier: skipping key for source '{}': not a base64 32-byte Ed25519 key",
                        source_id);
            continue;
        }
        ed25519_public_key key{};
        std::copy(decoded->begin(), decoded->end(), key.begin());
        cache->keys.emplace(source_id, key);
    }
    return cache;
}

void signature_verifier::load_initial(uint32_t max_attempts,
                                      std::chrono::milliseconds base_delay,
                                      std::chrono::milliseconds max_delay) {
    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> jitter_ms(0, 100);
    auto delay = base_delay;

    for (uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        try {
            auto cache = build(m_source->fetch());
            std::lock_guard<std::mutex> lock(m_refresh_mutex);
            std::atomic_store(&m_cache, std::move(cache));
            m_log->info("verifier: loaded {} keys from {}", key_count(), m_source->describe());
            return;
        } catch (const std::exception& e) {
            m_log->warn("verifier: key fetch attempt {}/{} from {} failed: {}",
                        attempt, max_attempts, m_source->describe(), e.what());
            if (attempt == max_attempts) {
                throw std::runtime_error("verifier: could not load any keys after " +
                                         std::to_string(max_attempts) + " attempts: " + e.what());
            }
        }
        auto wait = std::min(delay + std::chrono::milliseconds(jitter_ms(rng)), max_delay);
        std::this_thread::sleep_for(wait);
        delay = std::min(delay * 2, max_delay);
    }
    throw std::runtime_error("verifier: key loading needs at least one attempt");
}

bool signature_verifier::refresh() {
    std::lock_guard<std::mutex> lock(m_refresh_mutex);
    try {
        auto cache = build(m_source->fetch());
        auto previous = std::atomic_load(&m_cache);
        if (previous->keys.size() != cache->keys.size()) {
            m_log->info("verifier: key count changed {} -> {}", previous->keys.size(), cache->keys.size());
        }
        std::atomic_store(&m_cache, std::move(cache));
        return true;
    } catch (const std::exception& e) {
        auto cache = std::atomic_load(&m_cache);
        auto age = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now() - cache->loaded_at);
        m_log->warn("verifier: key refresh from {} failed, keeping {} cached keys loaded {}s ago: {}",
                    m_source->describe(), cache->keys.size(), age.count(), e.what());
        return false;
    }
}

verify_status signature_verifier::verify(std::string_view source_id,
                                         std::string_view signature_b64,
                                         std::string_view body) const {
    auto cache = std::atomic_load(&m_cache);
    auto it = cache->keys.find(std::string(source_id));
    if (it == cache->keys.end()) return verify_status::unknown_source;

    auto sig = base64_decode(signature_b64);
    if (!sig || sig->size() != ed25519_signature_size) return verify_status::invalid_encoding;

    return ed25519_verify(it->second, body, *sig)
        ? verify_status::valid
        : verify_status::invalid_signature;
}

std::shared_ptr<const key_cache> signature_verifier::snapshot() const {
    return std::atomic_load(&m_cache);
}

std::size_t signature_verifier::key_count() const {
    return std::atomic_load(&m_cache)->keys.size();
}

} // namespace beacon
