#include "common/base64.hpp"
#include <openssl/evp.h>

namespace beacon {

std::string base64_encode(std::span<const unsigned char> data) {
    if (data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                            data.data(), static_cast<int>(data.size()));
    out.resize(static_cast<std::size_t>(n));
    return out;
}

std::string base64_encode(std::string_view data) {
    return base64_encode(std::span<const unsigned char>(
        reinterpret_cast<const unsigned char*>(data.data()), data.size()));
}

static bool is_alphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::optional<std::vector<unsigned char>> base64_decode(std::string_view text) {
    if (text.empty()) return std::vector<unsigned char>{};
    if (text.size() % 4 != 0) return std::nullopt;

    std::size_t padding = 0;
    if (text.back() == '=') ++padding;
    if (text.size() >= 2 && text[text.size() - 2] == '=') ++padding;

    for (std::size_t i = 0; i < text.size() - padding; ++i) {
        if (!is_alphabet(text[i])) return std::nullopt;
    }

    std::vector<unsigned char> out(3 * text.size() / 4);
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(text.data()),
                            static_cast<int>(text.size()));
    if (n < 0 || static_cast<std::size_t>(n) < padding) return std::nullopt;
    out.resize(static_cast<std::size_t>(n) - padding);
    return out;
}

} // namespace beacon
