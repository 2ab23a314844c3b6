#pragma once

#include "common/event.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beacon {

inline constexpr const char* redaction_marker = "[redacted]";
inline constexpr const char* summary_placeholder = "Session ended";

// Rewrites an event so only metadata leaves the monitor:
//  - Bash keeps only its human description, never the command
//  - Grep, Glob, WebSearch and WebFetch lose their context entirely
//  - any other context is reduced to a basename, or the redaction marker
//    when an allowlist is set and the extension is not on it
//  - project names are reduced to basenames
//  - summary text and error categories are replaced or sanitized
class privacy_filter {
public:
    privacy_filter() = default;
    explicit privacy_filter(std::optional<std::vector<std::string>> allowlist);

    event apply(event e) const;

    // True when no allowlist is set, or the basename's extension is on it.
    bool is_extension_allowed(std::string_view basename) const;

    static bool is_sensitive_tool(std::string_view tool);

private:
    std::optional<std::string> filter_context(const tool_payload& t) const;

    std::optional<std::vector<std::string>> m_allowlist;
};

// Final path component of a '/' or '\\' separated path; empty for "" or "/".
std::string basename_of(std::string_view path);

// Lowercase [a-z0-9_], at most 64 chars; "unknown" if nothing survives.
std::string sanitize_category(std::string_view category);

} // namespace beacon
