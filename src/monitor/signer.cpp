#include "monitor/signer.hpp"
#include "common/base64.hpp"
#include <openssl/crypto.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace beacon {

namespace fs = std::filesystem;

namespace {

// Creates (or truncates) path with the given mode and writes data. The mode is
// applied at open time and again with fchmod so a pre-existing file is fixed up too.
void write_with_mode(const fs::path& path, const void* data, std::size_t len, mode_t mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
    if (fd < 0) {
        throw std::runtime_error("signer: cannot open " + path.string() + ": " + std::strerror(errno));
    }
    if (::fchmod(fd, mode) != 0) {
        int err = errno;
        ::close(fd);
        throw std::runtime_error("signer: cannot chmod " + path.string() + ": " + std::strerror(err));
    }
    const char* p = static_cast<const char*>(data);
    std::size_t left = len;
    while (left > 0) {
        ssize_t n = ::write(fd, p, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw std::runtime_error("signer: cannot write " + path.string() + ": " + std::strerror(err));
        }
        p += n;
        left -= static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) {
        throw std::runtime_error("signer: cannot close " + path.string() + ": " + std::strerror(errno));
    }
}

} // namespace

bool signer::exists(const fs::path& dir) {
    return fs::exists(dir / private_key_file);
}

signer signer::initialize(const fs::path& dir, bool force) {
    if (exists(dir) && !force) {
        throw std::runtime_error("signer: key already exists in " + dir.string() +
                                 " (use --force to overwrite)");
    }

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw std::runtime_error("signer: cannot create " + dir.string() + ": " + ec.message());
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);

    auto key = ed25519_keypair::generate();
    auto seed = key.seed();
    write_with_mode(dir / private_key_file, seed.data(), seed.size(), 0600);
    OPENSSL_cleanse(seed.data(), seed.size());

    auto pub = base64_encode(key.public_key()) + "\n";
    write_with_mode(dir / public_key_file, pub.data(), pub.size(), 0644);

    return signer(std::move(key));
}

signer signer::load(const fs::path& dir, const env_lookup& env) {
    if (auto encoded = env(private_key_env)) {
        auto seed = base64_decode(trim(*encoded));
        if (!seed) {
            throw std::runtime_error(std::string("signer: ") + private_key_env + " is not valid base64");
        }
        if (seed->size() != ed25519_seed_size) {
            throw std::runtime_error(std::string("signer: ") + private_key_env +
                                     " must decode to 32 bytes, got " + std::to_string(seed->size()));
        }
        auto key = ed25519_keypair::from_seed(*seed);
        OPENSSL_cleanse(seed->data(), seed->size());
        return signer(std::move(key));
    }

    auto path = dir / private_key_file;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("signer: no key at " + path.string() +
                                 " (run 'beacon_monitor init' or set " + private_key_env + ")");
    }
    std::vector<unsigned char> seed((std::istreambuf_iterator<char>(in)),
                                    std::istreambuf_iterator<char>());
    if (seed.size() != ed25519_seed_size) {
        throw std::runtime_error("signer: " + path.string() + " must hold exactly 32 bytes, got " +
                                 std::to_string(seed.size()));
    }
    auto key = ed25519_keypair::from_seed(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    return signer(std::move(key));
}

std::string signer::sign(std::string_view body) const {
    return base64_encode(m_key.sign(body));
}

std::string signer::public_key_base64() const {
    return base64_encode(m_key.public_key());
}

std::string signer::private_key_base64() const {
    auto seed = m_key.seed();
    auto out = base64_encode(seed);
    OPENSSL_cleanse(seed.data(), seed.size());
    return out;
}

std::string signer::fingerprint() const {
    return key_fingerprint(m_key.public_key());
}

} // namespace beacon
