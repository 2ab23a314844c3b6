#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace beacon {

// Standard alphabet with padding.
std::string base64_encode(std::span<const unsigned char> data);
std::string base64_encode(std::string_view data);

// Strict decode: rejects whitespace, non-alphabet characters and bad padding.
std::optional<std::vector<unsigned char>> base64_decode(std::string_view text);

} // namespace beacon
