#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon {

// Environment lookup, injectable so configuration can be tested without setenv.
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment. Empty values are treated as unset.
std::optional<std::string> process_env(const std::string& name);

// $HOME, falling back to the passwd entry of the current user.
std::string home_directory(const env_lookup& env);

// Expands a leading "~/" using home_directory().
std::string expand_home(const std::string& path, const env_lookup& env);

// Splits on sep, trims ASCII whitespace and drops empty items.
std::vector<std::string> split_list(std::string_view s, char sep = ',');

std::string_view trim(std::string_view s);

// "1", "true", "yes", "on" (case-insensitive) are true.
bool parse_bool(std::string_view s);

std::string local_hostname();

} // namespace beacon
