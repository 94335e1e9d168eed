#include <catch2/catch_test_macros.hpp>
#include "warden/audit.hpp"
#include "test_support.hpp"
#include <fstream>
#include <string>
#include <thread>
#include <vector>

using namespace warden;
using namespace std::chrono_literals;

namespace
{
    std::vector<std::string> read_lines(const std::filesystem::path &path)
    {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line))
        {
            if (!line.empty())
                lines.push_back(line);
        }
        return lines;
    }

    AuditEntry sample_entry(const std::string &subject)
    {
        AuditEntry e;
        e.kind = AuditEventKind::ToolCall;
        e.actor = {"alice", "cli", "cli:alice"};
        e.subject = subject;
        e.parameters = {{"path", "/tmp/x"}};
        return e;
    }
} // namespace

TEST_CASE("Audit redaction replaces secret-bearing keys", "[audit]")
{
    nlohmann::json params = {
        {"api_key", "sk-live-123"},
        {"Password", "hunter2"},
        {"nested", {{"AUTH_TOKEN", "abc"}, {"visible", "ok"}}},
        {"list", nlohmann::json::array({nlohmann::json{{"client_secret", "zzz"}}})},
        {"command", "ls"}};

    auto redacted = redact_parameters(params);
    REQUIRE(redacted["api_key"] == kRedactionMarker);
    REQUIRE(redacted["Password"] == kRedactionMarker);
    REQUIRE(redacted["nested"]["AUTH_TOKEN"] == kRedactionMarker);
    REQUIRE(redacted["nested"]["visible"] == "ok");
    REQUIRE(redacted["list"][0]["client_secret"] == kRedactionMarker);
    REQUIRE(redacted["command"] == "ls");
}

TEST_CASE("Audit redaction truncates oversized strings", "[audit]")
{
    std::string big(800, 'x');
    auto redacted = redact_parameters({{"content", big}});
    auto value = redacted["content"].get<std::string>();
    REQUIRE(value.size() == kMaxParameterStringLength + std::string("...[truncated]").size());
    REQUIRE(value.ends_with("...[truncated]"));
}

TEST_CASE("Audit file never contains a redacted secret", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    AuditLogger logger({dir.path()}, clock);

    logger.log_tool_call("web_fetch", {{"url", "https://example.com"}, {"api_key", "sk-very-secret-value"}},
                         {"alice", "telegram", "telegram:1"});

    auto contents = testing::read_text(logger.current_file());
    REQUIRE(contents.find("sk-very-secret-value") == std::string::npos);
    REQUIRE(contents.find(kRedactionMarker) != std::string::npos);
}

TEST_CASE("Audit writes one JSON line per entry into the day file", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    AuditLogger logger({dir.path() / "audit"}, clock);

    logger.record(sample_entry("read_file"));
    logger.record(sample_entry("write_file"));

    REQUIRE(logger.current_file() == dir.path() / "audit" / "audit-2026-03-14.jsonl");
    auto lines = read_lines(logger.current_file());
    REQUIRE(lines.size() == 2);

    auto first = nlohmann::json::parse(lines[0]);
    REQUIRE(first["event"] == "tool_call");
    REQUIRE(first["subject"] == "read_file");
    REQUIRE(first["actor"]["user_id"] == "alice");
    REQUIRE(first["timestamp"] == "2026-03-14T12:00:00.000Z");
    REQUIRE(first.contains("chain_hash"));
    REQUIRE(logger.healthy());
}

TEST_CASE("Audit concurrent writers keep lines whole and the chain intact", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    AuditLogger logger({dir.path() / "audit"}, clock);

    std::vector<std::thread> writers;
    for (int t = 0; t < 8; ++t)
    {
        writers.emplace_back([&logger, t]
                             {
            for (int i = 0; i < 50; ++i)
                logger.record(sample_entry("tool_" + std::to_string(t) + "_" + std::to_string(i))); });
    }
    for (auto &w : writers)
        w.join();

    auto lines = read_lines(logger.current_file());
    REQUIRE(lines.size() == 400);
    for (const auto &line : lines)
        REQUIRE_FALSE(nlohmann::json::parse(line, nullptr, false).is_discarded());

    auto chain = logger.verify_chain("2026-03-14");
    REQUIRE(chain.has_value());
    REQUIRE(chain->intact);
    REQUIRE(chain->lines == 400);
}

TEST_CASE("Audit rolls over to a new file at the UTC day boundary", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    AuditLogger logger({dir.path()}, clock);

    logger.record(sample_entry("before"));
    clock->advance(12h);
    logger.record(sample_entry("after"));

    REQUIRE(read_lines(logger.file_for_date("2026-03-14")).size() == 1);
    REQUIRE(read_lines(logger.file_for_date("2026-03-15")).size() == 1);
}

TEST_CASE("Audit chain verifies and detects tampering", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    auto path = dir.path() / "audit-2026-03-14.jsonl";

    {
        AuditLogger logger({dir.path()}, clock);
        for (int i = 0; i < 4; ++i)
            logger.record(sample_entry("tool_" + std::to_string(i)));

        auto ok = logger.verify_chain("2026-03-14");
        REQUIRE(ok.has_value());
        REQUIRE(ok->intact);
        REQUIRE(ok->lines == 4);
    }

    // A second logger continues the chain of the existing file
    {
        AuditLogger logger({dir.path()}, clock);
        logger.record(sample_entry("tool_4"));
        auto ok = logger.verify_chain("2026-03-14");
        REQUIRE(ok->intact);
        REQUIRE(ok->lines == 5);
    }

    auto lines = read_lines(path);
    auto tampered = nlohmann::json::parse(lines[2]);
    tampered["subject"] = "something_else";
    lines[2] = tampered.dump();
    {
        std::ofstream out(path, std::ios::trunc);
        for (const auto &l : lines)
            out << l << '\n';
    }

    AuditLogger logger({dir.path()}, clock);
    auto broken = logger.verify_chain("2026-03-14");
    REQUIRE(broken.has_value());
    REQUIRE_FALSE(broken->intact);
    REQUIRE(broken->first_broken_line == 3u);

    auto missing = logger.verify_chain("1999-01-01");
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::NotFound);
}

TEST_CASE("Audit degrades to memory when storage fails and recovers on flush", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    auto blocked = dir.path() / "audit";
    testing::write_text(blocked, "not a directory");

    AuditLogger logger({blocked}, clock);
    logger.record(sample_entry("one"));
    logger.record(sample_entry("two"));

    REQUIRE_FALSE(logger.healthy());
    REQUIRE(logger.buffered() == 2);
    REQUIRE_FALSE(logger.flush());

    std::filesystem::remove(blocked);
    REQUIRE(logger.flush());
    REQUIRE(logger.healthy());
    REQUIRE(logger.buffered() == 0);

    auto lines = read_lines(logger.current_file());
    REQUIRE(lines.size() == 2);
    REQUIRE(nlohmann::json::parse(lines[0])["subject"] == "one");
    REQUIRE(nlohmann::json::parse(lines[1])["subject"] == "two");
    REQUIRE(logger.verify_chain("2026-03-14")->intact);
}

TEST_CASE("Audit entries buffered before midnight land in the flush day's file", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    auto blocked = dir.path() / "audit";
    testing::write_text(blocked, "not a directory");

    AuditLogger logger({blocked}, clock);
    logger.record(sample_entry("late"));
    REQUIRE(logger.buffered() == 1);

    clock->advance(13h);
    std::filesystem::remove(blocked);
    REQUIRE(logger.flush());

    REQUIRE_FALSE(std::filesystem::exists(logger.file_for_date("2026-03-14")));
    auto lines = read_lines(logger.file_for_date("2026-03-15"));
    REQUIRE(lines.size() == 1);
    auto entry = nlohmann::json::parse(lines[0]);
    REQUIRE(entry["subject"] == "late");
    REQUIRE(entry["timestamp"] == "2026-03-14T12:00:00.000Z");
}

TEST_CASE("Audit buffer drops the oldest entries when full", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    auto blocked = dir.path() / "audit";
    testing::write_text(blocked, "x");

    AuditLogger logger({blocked, true, 3}, clock);
    for (int i = 0; i < 5; ++i)
        logger.record(sample_entry("e" + std::to_string(i)));

    REQUIRE(logger.buffered() == 3);
    REQUIRE(logger.dropped() == 2);

    std::filesystem::remove(blocked);
    REQUIRE(logger.flush());
    auto lines = read_lines(logger.current_file());
    REQUIRE(lines.size() == 3);
    REQUIRE(nlohmann::json::parse(lines[0])["subject"] == "e2");
}

TEST_CASE("Audit disabled writes nothing", "[audit]")
{
    testing::TempDir dir;
    AuditLogger logger({dir.path() / "audit", false}, std::make_shared<testing::FakeClock>());
    logger.record(sample_entry("ignored"));
    REQUIRE_FALSE(std::filesystem::exists(dir.path() / "audit"));
}

TEST_CASE("Audit recent events returns the newest entries in order", "[audit]")
{
    testing::TempDir dir;
    auto clock = std::make_shared<testing::FakeClock>();
    AuditLogger logger({dir.path()}, clock);

    logger.log_access_denied({"mallory", "discord", ""}, "not on allow list");
    logger.log_security_event("input_blocked", {{"tool", "exec"}}, "warning");
    logger.log_tool_result("exec", {"alice", "cli", ""}, false, "exit 1", "boom");
    logger.log_integrity_alert("/w/SOUL.md", "aaaa", "DELETED");

    auto events = logger.recent_events(2);
    REQUIRE(events.size() == 2);
    REQUIRE(events[0]["event"] == "tool_call");
    REQUIRE(events[0]["phase"] == "result");
    REQUIRE(events[0]["outcome"]["success"] == false);
    REQUIRE(events[0]["parameters"]["result_preview"] == "boom");
    REQUIRE(events[1]["subject"] == "integrity_violation");
    REQUIRE(events[1]["severity"] == "error");
    REQUIRE(events[1]["parameters"]["actual_hash"] == "DELETED");

    REQUIRE(logger.recent_events(100).size() == 4);
}

TEST_CASE("Audit event kind names round trip", "[audit]")
{
    for (auto kind : {AuditEventKind::ToolCall, AuditEventKind::AccessDenied,
                      AuditEventKind::RateLimited, AuditEventKind::SecurityEvent})
    {
        REQUIRE(audit_event_kind_from_string(to_string(kind)) == kind);
    }
    REQUIRE_FALSE(audit_event_kind_from_string("bogus").has_value());
}
