#include "monitor/log_parser.hpp"
#include <gtest/gtest.h>
#include <spdlog/sinks/null_sink.h>

namespace {

auto make_log() {
    return std::make_shared<spdlog::logger>("test", std::make_shared<spdlog::sinks::null_sink_mt>());
}

const std::filesystem::path log_file = "/home/dev/.claude/projects/-home-dev-my%20app/3f2a.jsonl";

beacon::log_parser make_parser(std::size_t max_sessions = 1000) {
    return beacon::log_parser("laptop-1", max_sessions, make_log());
}

} // namespace

TEST(log_parser, user_line_emits_session_start_then_activity) {
    auto parser = make_parser();
    auto r = parser.parse_line(log_file,
        R"({"type":"user","sessionId":"s1","cwd":"/home/dev/beacon","timestamp":"2025-01-15T10:30:00Z"})");

    ASSERT_EQ(r.events.size(), 2u);
    EXPECT_FALSE(r.session_finished);

    const auto& start = std::get<beacon::session_payload>(r.events[0].payload);
    EXPECT_EQ(start.session_id, "s1");
    EXPECT_EQ(start.action, beacon::session_action::started);
    EXPECT_EQ(start.project, "beacon");

    const auto& act = std::get<beacon::activity_payload>(r.events[1].payload);
    EXPECT_EQ(act.project, std::optional<std::string>("beacon"));
    EXPECT_EQ(r.events[1].source, "laptop-1");
    EXPECT_EQ(r.events[1].id.substr(0, 4), "evt_");
    EXPECT_NE(r.events[0].id, r.events[1].id);
}

TEST(log_parser, session_start_emitted_once) {
    auto parser = make_parser();
    parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})");
    auto r = parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})");

    ASSERT_EQ(r.events.size(), 1u);
    EXPECT_EQ(r.events[0].type(), beacon::event_type::activity);
    EXPECT_EQ(parser.tracked_sessions(), 1u);
}

TEST(log_parser, assistant_tool_use_blocks_become_tool_events) {
    auto parser = make_parser();
    parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})");

    auto r = parser.parse_line(log_file, R"({
        "type":"assistant","sessionId":"s1",
        "message":{"content":[
            {"type":"text","text":"Let me look."},
            {"type":"tool_use","name":"Read","input":{"file_path":"/home/dev/beacon/src/main.cpp"}},
            {"type":"tool_use","name":"Bash","input":{"command":"rm -rf build","description":"Clean build dir"}},
            {"type":"tool_use","name":"Grep","input":{"pattern":"password\\s*="}}
        ]}})");

    ASSERT_EQ(r.events.size(), 3u);

    const auto& read = std::get<beacon::tool_payload>(r.events[0].payload);
    EXPECT_EQ(read.tool, "Read");
    EXPECT_EQ(read.status, beacon::tool_status::started);
    EXPECT_EQ(read.context, std::optional<std::string>("/home/dev/beacon/src/main.cpp"));

    const auto& bash = std::get<beacon::tool_payload>(r.events[1].payload);
    EXPECT_EQ(bash.context, std::optional<std::string>("rm -rf build"));
    EXPECT_EQ(bash.description, std::optional<std::string>("Clean build dir"));

    const auto& grep = std::get<beacon::tool_payload>(r.events[2].payload);
    EXPECT_EQ(grep.context, std::optional<std::string>("password\\s*="));
}

TEST(log_parser, task_tool_also_spawns_agent) {
    auto parser = make_parser();
    parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})");

    auto r = parser.parse_line(log_file, R"({"type":"assistant","sessionId":"s1",
        "message":{"content":[{"type":"tool_use","name":"Task","input":{"prompt":"explore"}}]}})");

    ASSERT_EQ(r.events.size(), 2u);
    EXPECT_EQ(r.events[0].type(), beacon::event_type::tool);
    const auto& agent = std::get<beacon::agent_payload>(r.events[1].payload);
    EXPECT_EQ(agent.state, "spawned");
}

TEST(log_parser, post_tool_use_progress_completes_tool) {
    auto parser = make_parser();
    parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})");

    auto r = parser.parse_line(log_file,
        R"({"type":"progress","sessionId":"s1","progress":{"type":"PostToolUse","tool_name":"Edit"}})");
    ASSERT_EQ(r.events.size(), 1u);
    const auto& t = std::get<beacon::tool_payload>(r.events[0].payload);
    EXPECT_EQ(t.tool, "Edit");
    EXPECT_EQ(t.status, beacon::tool_status::completed);

    auto other = parser.parse_line(log_file,
        R"({"type":"progress","sessionId":"s1","progress":{"type":"PreToolUse","tool_name":"Edit"}})");
    EXPECT_TRUE(other.events.empty());
}

TEST(log_parser, summary_ends_session_and_retires_file) {
    auto parser = make_parser();
    parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})");

    auto r = parser.parse_line(log_file,
        R"({"type":"summary","sessionId":"s1","summary":"Refactored the secret auth module"})");

    EXPECT_TRUE(r.session_finished);
    ASSERT_EQ(r.events.size(), 2u);
    EXPECT_EQ(r.events[0].type(), beacon::event_type::summary);
    const auto& end = std::get<beacon::session_payload>(r.events[1].payload);
    EXPECT_EQ(end.action, beacon::session_action::ended);
    EXPECT_EQ(parser.tracked_sessions(), 0u);
}

TEST(log_parser, system_error_line_becomes_error_event) {
    auto parser = make_parser();
    parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})");

    auto r = parser.parse_line(log_file,
        R"({"type":"system","sessionId":"s1","level":"error","subtype":"api_error"})");
    ASSERT_EQ(r.events.size(), 1u);
    EXPECT_EQ(std::get<beacon::error_payload>(r.events[0].payload).category, "api_error");

    auto info = parser.parse_line(log_file,
        R"({"type":"system","sessionId":"s1","level":"info","subtype":"compact"})");
    EXPECT_TRUE(info.events.empty());
}

TEST(log_parser, falls_back_to_file_name_and_directory) {
    auto parser = make_parser();
    auto r = parser.parse_line(log_file, R"({"type":"user"})");

    ASSERT_EQ(r.events.size(), 2u);
    EXPECT_EQ(r.events[1].session_id(), "3f2a");
    EXPECT_EQ(beacon::project_of(r.events[1]), std::optional<std::string>("-home-dev-my app"));
}

TEST(log_parser, uses_line_timestamp) {
    auto parser = make_parser();
    auto r = parser.parse_line(log_file,
        R"({"type":"user","sessionId":"s1","timestamp":"2025-01-15T10:30:00.250Z"})");
    ASSERT_FALSE(r.events.empty());
    EXPECT_EQ(r.events[0].timestamp,
              std::chrono::system_clock::time_point(std::chrono::milliseconds(1736937000250)));
}

TEST(log_parser, malformed_lines_are_skipped) {
    auto parser = make_parser();

    EXPECT_TRUE(parser.parse_line(log_file, "{not json").events.empty());
    EXPECT_TRUE(parser.parse_line(log_file, "[1,2,3]").events.empty());
    EXPECT_TRUE(parser.parse_line(log_file, R"({"sessionId":"s1"})").events.empty());
    EXPECT_TRUE(parser.parse_line(log_file, "   ").events.empty());
    EXPECT_EQ(parser.skipped_lines(), 3u);

    // Still works afterwards
    EXPECT_EQ(parser.parse_line(log_file, R"({"type":"user","sessionId":"s1"})").events.size(), 2u);
}

TEST(log_parser, unknown_line_types_are_ignored) {
    auto parser = make_parser();
    auto r = parser.parse_line(log_file, R"({"type":"file-history-snapshot","sessionId":"s1"})");
    EXPECT_TRUE(r.events.empty());
    EXPECT_EQ(parser.tracked_sessions(), 0u);
}

TEST(log_parser, session_tracking_is_bounded) {
    auto parser = make_parser(2);
    parser.parse_line(log_file, R"({"type":"user","sessionId":"a"})");
    parser.parse_line(log_file, R"({"type":"user","sessionId":"b"})");
    parser.parse_line(log_file, R"({"type":"user","sessionId":"a"})");
    parser.parse_line(log_file, R"({"type":"user","sessionId":"c"})");
    EXPECT_EQ(parser.tracked_sessions(), 2u);

    // "b" was least recently used and got evicted, so it starts again
    auto r = parser.parse_line(log_file, R"({"type":"user","sessionId":"b"})");
    ASSERT_EQ(r.events.size(), 2u);
    EXPECT_EQ(r.events[0].type(), beacon::event_type::session);

    // "c" survived the eviction of "a" caused by re-adding "b"
    auto again = parser.parse_line(log_file, R"({"type":"user","sessionId":"c"})");
    EXPECT_EQ(again.events.size(), 1u);
}

TEST(log_parser, url_decode_handles_escapes) {
    EXPECT_EQ(beacon::url_decode("my%20app"), "my app");
    EXPECT_EQ(beacon::url_decode("100%"), "100%");
    EXPECT_EQ(beacon::url_decode("%zz"), "%zz");
    EXPECT_EQ(beacon::url_decode("%41"), "A");
}
