#pragma once

#include "common/ed25519.hpp"
#include "common/env.hpp"
#include <filesystem>
#include <string>
#include <string_view>

namespace beacon {

// Monitor identity. The key directory holds:
//   key.priv  raw 32-byte Ed25519 seed, mode 0600
//   key.pub   base64 public key, mode 0644
class signer {
public:
    static constexpr const char* private_key_file = "key.priv";
    static constexpr const char* public_key_file = "key.pub";
    static constexpr const char* private_key_env = "BEACON_PRIVATE_KEY";

    explicit signer(ed25519_keypair key) : m_key(std::move(key)) {}

    // Generate and persist a new keypair. Refuses to overwrite an existing
    // key unless force is set. Throws std::runtime_error on failure.
    static signer initialize(const std::filesystem::path& dir, bool force);

    // BEACON_PRIVATE_KEY (base64 seed) wins over the key file.
    static signer load(const std::filesystem::path& dir, const env_lookup& env);

    static bool exists(const std::filesystem::path& dir);

    // Base64 signature over the exact bytes given.
    std::string sign(std::string_view body) const;

    std::string public_key_base64() const;
    std::string private_key_base64() const;
    std::string fingerprint() const;

    const ed25519_keypair& key() const { return m_key; }

private:
    ed25519_keypair m_key;
};

} // namespace beacon
