#include "common/ed25519.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <spdlog/fmt/fmt.h>
#include <stdexcept>

namespace beacon {

namespace {

struct pkey_ctx_deleter {
    void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); }
};
struct md_ctx_deleter {
    void operator()(EVP_MD_CTX* p) const { EVP_MD_CTX_free(p); }
};

using pkey_ctx_ptr = std::unique_ptr<EVP_PKEY_CTX, pkey_ctx_deleter>;
using md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, md_ctx_deleter>;

std::shared_ptr<EVP_PKEY> wrap(EVP_PKEY* key) {
    return std::shared_ptr<EVP_PKEY>(key, EVP_PKEY_free);
}

} // namespace

ed25519_keypair::ed25519_keypair(std::shared_ptr<EVP_PKEY> key)
    : m_key(std::move(key))
{
    std::size_t len = m_public.size();
    if (EVP_PKEY_get_raw_public_key(m_key.get(), m_public.data(), &len) != 1 ||
        len != m_public.size()) {
        throw std::runtime_error("ed25519: failed to extract public key");
    }
}

ed25519_keypair ed25519_keypair::generate() {
    pkey_ctx_ptr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        throw std::runtime_error("ed25519: keygen init failed");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || !raw) {
        throw std::runtime_error("ed25519: key generation failed");
    }
    return ed25519_keypair(wrap(raw));
}

ed25519_keypair ed25519_keypair::from_seed(std::span<const unsigned char> seed) {
    if (seed.size() != ed25519_seed_size) {
        throw std::runtime_error(fmt::format(
            "ed25519: seed must be {} bytes, got {}", ed25519_seed_size, seed.size()));
    }
    EVP_PKEY* raw = EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                 seed.data(), seed.size());
    if (!raw) throw std::runtime_error("ed25519: invalid private key seed");
    return ed25519_keypair(wrap(raw));
}

ed25519_seed ed25519_keypair::seed() const {
    ed25519_seed out{};
    std::size_t len = out.size();
    if (EVP_PKEY_get_raw_private_key(m_key.get(), out.data(), &len) != 1 ||
        len != out.size()) {
        throw std::runtime_error("ed25519: failed to extract private key");
    }
    return out;
}

std::vector<unsigned char> ed25519_keypair::sign(std::string_view message) const {
    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, m_key.get()) != 1) {
        throw std::runtime_error("ed25519: sign init failed");
    }
    std::vector<unsigned char> sig(ed25519_signature_size);
    std::size_t sig_len = sig.size();
    if (EVP_DigestSign(ctx.get(), sig.data(), &sig_len,
                       reinterpret_cast<const unsigned char*>(message.data()),
                       message.size()) != 1) {
        throw std::runtime_error("ed25519: signing failed");
    }
    sig.resize(sig_len);
    return sig;
}

bool ed25519_verify(std::span<const unsigned char> public_key,
                    std::string_view message,
                    std::span<const unsigned char> signature) {
    if (public_key.size() != ed25519_public_key_size ||
        signature.size() != ed25519_signature_size) {
        return false;
    }
    auto key = wrap(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                                public_key.data(), public_key.size()));
    if (!key) return false;

    md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            reinterpret_cast<const unsigned char*>(message.data()),
                            message.size()) == 1;
}

std::string key_fingerprint(std::span<const unsigned char> public_key) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(public_key.data(), public_key.size(), digest);
    std::string out;
    out.reserve(16);
    for (int i = 0; i < 8; ++i) out += fmt::format("{:02x}", digest[i]);
    return out;
}

bool constant_time_equals(std::string_view a, std::string_view b) {
    unsigned char da[SHA256_DIGEST_LENGTH];
    unsigned char db[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(a.data()), a.size(), da);
    SHA256(reinterpret_cast<const unsigned char*>(b.data()), b.size(), db);
    return CRYPTO_memcmp(da, db, SHA256_DIGEST_LENGTH) == 0;
}

} // namespace beacon
