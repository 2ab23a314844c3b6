#pragma once

#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace beacon {

// Alternatives of event_payload are declared in this order; type() relies on it.
enum class event_type {
    session,
    activity,
    tool,
    agent,
    summary,
    error
};

enum class session_action { started, ended };
enum class tool_status { started, completed };

const char* to_string(event_type t);
const char* to_string(session_action a);
const char* to_string(tool_status s);

std::optional<event_type> parse_event_type(std::string_view s);
std::optional<session_action> parse_session_action(std::string_view s);
std::optional<tool_status> parse_tool_status(std::string_view s);

struct session_payload {
    std::string session_id;
    session_action action = session_action::started;
    std::string project;

    bool operator==(const session_payload&) const = default;
};

struct activity_payload {
    std::string session_id;
    std::optional<std::string> project;

    bool operator==(const activity_payload&) const = default;
};

struct tool_payload {
    std::string session_id;
    std::string tool;
    tool_status status = tool_status::started;
    std::optional<std::string> context;
    std::optional<std::string> project;
    // Human description of a shell invocation. Monitor-local, never serialized.
    std::optional<std::string> description;

    bool operator==(const tool_payload&) const = default;
};

struct agent_payload {
    std::string session_id;
    std::string state;

    bool operator==(const agent_payload&) const = default;
};

struct summary_payload {
    std::string session_id;
    std::string summary;

    bool operator==(const summary_payload&) const = default;
};

struct error_payload {
    std::string session_id;
    std::string category;

    bool operator==(const error_payload&) const = default;
};

using event_payload = std::variant<
    session_payload,
    activity_payload,
    tool_payload,
    agent_payload,
    summary_payload,
    error_payload>;

struct event {
    std::string id;
    std::string source;
    std::chrono::system_clock::time_point timestamp;
    event_payload payload;

    event_type type() const { return static_cast<event_type>(payload.index()); }
    const std::string& session_id() const;

    bool operator==(const event&) const = default;
};

// Wire envelope: {id, source, timestamp, type, payload}. from_json throws
// nlohmann::json::exception or std::invalid_argument on a malformed shape.
void to_json(nlohmann::json& j, const event& e);
void from_json(const nlohmann::json& j, event& e);

// "evt_" followed by 20 characters from [a-z0-9], drawn from the OpenSSL CSPRNG.
std::string generate_event_id();

// Project carried by session, activity and tool payloads.
std::optional<std::string> project_of(const event& e);

} // namespace beacon
