#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

typedef struct evp_pkey_st EVP_PKEY;

namespace beacon {

inline constexpr std::size_t ed25519_seed_size = 32;
inline constexpr std::size_t ed25519_public_key_size = 32;
inline constexpr std::size_t ed25519_signature_size = 64;

using ed25519_seed = std::array<unsigned char, ed25519_seed_size>;
using ed25519_public_key = std::array<unsigned char, ed25519_public_key_size>;

// Ed25519 signing key backed by OpenSSL EVP. Copies share the underlying EVP_PKEY.
class ed25519_keypair {
public:
    // Fresh key from the OpenSSL CSPRNG. Throws std::runtime_error on failure.
    static ed25519_keypair generate();

    // Rebuild from a 32-byte seed. Throws std::runtime_error on a bad seed.
    static ed25519_keypair from_seed(std::span<const unsigned char> seed);

    std::vector<unsigned char> sign(std::string_view message) const;

    ed25519_seed seed() const;
    const ed25519_public_key& public_key() const { return m_public; }

private:
    explicit ed25519_keypair(std::shared_ptr<EVP_PKEY> key);

    std::shared_ptr<EVP_PKEY> m_key;
    ed25519_public_key m_public{};
};

// Strict verification. Any malformed input yields false.
bool ed25519_verify(std::span<const unsigned char> public_key,
                    std::string_view message,
                    std::span<const unsigned char> signature);

// Hex of the first 8 bytes of SHA-256(public_key), for log lines.
std::string key_fingerprint(std::span<const unsigned char> public_key);

// Compares SHA-256 digests with CRYPTO_memcmp so neither content nor length leaks.
bool constant_time_equals(std::string_view a, std::string_view b);

} // namespace beacon
