#include "monitor/privacy_filter.hpp"
#include <algorithm>
#include <cctype>
#include <type_traits>

namespace beacon {

namespace {

constexpr std::string_view sensitive_tools[] = {"Bash", "Grep", "Glob", "WebSearch", "WebFetch"};
constexpr std::size_t max_category_length = 64;

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::optional<std::string> project_basename(const std::optional<std::string>& project) {
    if (!project) return std::nullopt;
    auto b = basename_of(*project);
    if (b.empty()) return std::nullopt;
    return b;
}

} // namespace

std::string basename_of(std::string_view path) {
    while (!path.empty() && (path.back() == '/' || path.back() == '\\')) {
        path.remove_suffix(1);
    }
    auto pos = path.find_last_of("/\\");
    if (pos != std::string_view::npos) path.remove_prefix(pos + 1);
    return std::string(path);
}

std::string sanitize_category(std::string_view category) {
    std::string out;
    for (char c : category) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_') {
            out.push_back(static_cast<char>(std::tolower(uc)));
        } else if (c == '-' || c == ' ' || c == '.') {
            out.push_back('_');
        }
        if (out.size() == max_category_length) break;
    }
    if (out.empty()) return "unknown";
    return out;
}

privacy_filter::privacy_filter(std::optional<std::vector<std::string>> allowlist)
    : m_allowlist(std::move(allowlist))
{
    if (m_allowlist) {
        for (auto& ext : *m_allowlist) ext = lowercase(ext);
    }
}

bool privacy_filter::is_sensitive_tool(std::string_view tool) {
    return std::find(std::begin(sensitive_tools), std::end(sensitive_tools), tool)
        != std::end(sensitive_tools);
}

bool privacy_filter::is_extension_allowed(std::string_view basename) const {
    if (!m_allowlist) return true;
    auto dot = basename.rfind('.');
    // No extension, or a dotfile without one, is not on any allowlist
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == basename.size()) {
        return false;
    }
    auto ext = lowercase(basename.substr(dot));
    return std::find(m_allowlist->begin(), m_allowlist->end(), ext) != m_allowlist->end();
}

std::optional<std::string> privacy_filter::filter_context(const tool_payload& t) const {
    if (t.tool == "Bash") return t.description;
    if (is_sensitive_tool(t.tool)) return std::nullopt;
    if (!t.context) return std::nullopt;

    auto base = basename_of(*t.context);
    if (base.empty()) return std::nullopt;
    if (!is_extension_allowed(base)) return std::string(redaction_marker);
    return base;
}

event privacy_filter::apply(event e) const {
    std::visit([this](auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, session_payload>) {
            p.project = basename_of(p.project);
        } else if constexpr (std::is_same_v<T, activity_payload>) {
            p.project = project_basename(p.project);
        } else if constexpr (std::is_same_v<T, tool_payload>) {
            p.context = filter_context(p);
            p.description.reset();
            p.project = project_basename(p.project);
        } else if constexpr (std::is_same_v<T, agent_payload>) {
            p.state = sanitize_category(p.state);
        } else if constexpr (std::is_same_v<T, summary_payload>) {
            p.summary = summary_placeholder;
        } else if constexpr (std::is_same_v<T, error_payload>) {
            p.category = sanitize_category(p.category);
        }
    }, e.payload);
    return e;
}

} // namespace beacon
