#include <catch2/catch_test_macros.hpp>
#include "warden/integrity.hpp"
#include "warden/crypto.hpp"
#include "test_support.hpp"
#include <vector>

using namespace warden;

namespace
{
    struct Workspace
    {
        testing::TempDir dir;
        std::filesystem::path soul = dir / "SOUL.md";
        std::filesystem::path agents = dir / "AGENTS.md";
        std::filesystem::path user = dir / "USER.md"; // absent at baseline time

        Workspace()
        {
            testing::write_text(soul, "be kind\n");
            testing::write_text(agents, "agents\n");
        }

        IntegrityMonitor::Config config() const
        {
            IntegrityMonitor::Config cfg;
            cfg.files = {soul, agents, user};
            cfg.baseline_path = dir / "security" / "integrity_hashes.json";
            return cfg;
        }
    };
} // namespace

TEST_CASE("Integrity initialize hashes existing files and persists", "[integrity]")
{
    Workspace ws;
    IntegrityMonitor monitor(ws.config());

    auto hashes = monitor.initialize();
    REQUIRE(hashes.has_value());
    REQUIRE(hashes->size() == 2);
    REQUIRE(hashes->at(ws.soul.string()) == crypto::SHA256::hex_digest("be kind\n"));
    REQUIRE(std::filesystem::exists(ws.config().baseline_path));

    // A fresh monitor loads the persisted baseline
    IntegrityMonitor reloaded(ws.config());
    auto st = reloaded.status();
    REQUIRE(st.tracked_files == 2);
    REQUIRE(st.monitored_files == 2);
    REQUIRE(reloaded.verify().empty());
}

TEST_CASE("Integrity detects a single modification and accepts an update", "[integrity]")
{
    Workspace ws;
    IntegrityMonitor monitor(ws.config());
    REQUIRE(monitor.initialize().has_value());
    auto original = crypto::SHA256::hex_digest("be kind\n");

    std::vector<IntegrityViolation> seen;
    monitor.on_violation([&](const IntegrityViolation &v)
                         { seen.push_back(v); });

    testing::write_text(ws.soul, "be unkind\n");
    auto violations = monitor.verify();
    REQUIRE(violations.size() == 1);
    REQUIRE(violations[0].file == ws.soul.string());
    REQUIRE(violations[0].expected_hash == original);
    REQUIRE(violations[0].actual_hash == crypto::SHA256::hex_digest("be unkind\n"));
    REQUIRE(seen.size() == 1);

    // Callback fires again on every verify that still sees the violation
    REQUIRE(monitor.verify().size() == 1);
    REQUIRE(seen.size() == 2);

    auto updated = monitor.update_hash(ws.soul);
    REQUIRE(updated.has_value());
    REQUIRE(monitor.verify().empty());
    REQUIRE(seen.size() == 2);
}

TEST_CASE("Integrity reports deleted files without touching content", "[integrity]")
{
    Workspace ws;
    IntegrityMonitor monitor(ws.config());
    REQUIRE(monitor.initialize().has_value());

    std::filesystem::remove(ws.agents);
    auto violations = monitor.verify();
    REQUIRE(violations.size() == 1);
    REQUIRE(violations[0].deleted());
    REQUIRE_FALSE(std::filesystem::exists(ws.agents));
}

TEST_CASE("Integrity reports a tracked file that can no longer be hashed", "[integrity]")
{
    Workspace ws;
    auto clock = std::make_shared<testing::FakeClock>();
    auto audit = std::make_shared<AuditLogger>(AuditLogger::Config{ws.dir / "audit"}, clock);
    IntegrityMonitor monitor(ws.config(), audit, clock);
    REQUIRE(monitor.initialize().has_value());

    std::vector<IntegrityViolation> seen;
    monitor.on_violation([&](const IntegrityViolation &v)
                         { seen.push_back(v); });

    // Swapped for something that exists but is not a regular file
    std::filesystem::remove(ws.soul);
    std::filesystem::create_directory(ws.soul);

    auto violations = monitor.verify();
    REQUIRE(violations.size() == 1);
    REQUIRE(violations[0].unreadable());
    REQUIRE_FALSE(violations[0].deleted());
    REQUIRE(violations[0].file == ws.soul.string());
    REQUIRE_FALSE(violations[0].actual_hash.has_value());
    REQUIRE_FALSE(violations[0].detail.empty());
    REQUIRE(std::string(violations[0].describe()) == "unreadable");
    REQUIRE(seen.size() == 1);

    auto events = audit->recent_events(10);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0]["subject"] == "integrity_violation");
    REQUIRE(events[0]["parameters"]["actual_hash"] == "UNREADABLE");
}

TEST_CASE("Integrity skips configured files absent from the baseline", "[integrity]")
{
    Workspace ws;
    IntegrityMonitor monitor(ws.config());
    REQUIRE(monitor.initialize().has_value());

    // USER.md appears after the baseline was taken
    testing::write_text(ws.user, "new\n");
    REQUIRE(monitor.verify().empty());
}

TEST_CASE("Integrity update_hash leaves other entries alone", "[integrity]")
{
    Workspace ws;
    IntegrityMonitor monitor(ws.config());
    REQUIRE(monitor.initialize().has_value());

    testing::write_text(ws.soul, "changed\n");
    testing::write_text(ws.agents, "changed too\n");
    REQUIRE(monitor.update_hash(ws.soul).has_value());

    auto violations = monitor.verify();
    REQUIRE(violations.size() == 1);
    REQUIRE(violations[0].file == ws.agents.string());

    REQUIRE_FALSE(monitor.update_hash(ws.dir / "missing.md").has_value());
}

TEST_CASE("Integrity violations are written to the audit log", "[integrity]")
{
    Workspace ws;
    auto clock = std::make_shared<testing::FakeClock>();
    auto audit = std::make_shared<AuditLogger>(AuditLogger::Config{ws.dir / "audit"}, clock);
    IntegrityMonitor monitor(ws.config(), audit, clock);
    REQUIRE(monitor.initialize().has_value());

    std::filesystem::remove(ws.soul);
    REQUIRE(monitor.verify().size() == 1);

    auto events = audit->recent_events(10);
    REQUIRE(events.size() == 1);
    REQUIRE(events[0]["event"] == "security_event");
    REQUIRE(events[0]["subject"] == "integrity_violation");
    REQUIRE(events[0]["parameters"]["actual_hash"] == "DELETED");
}

TEST_CASE("Integrity treats a corrupt baseline as empty", "[integrity]")
{
    Workspace ws;
    testing::write_text(ws.config().baseline_path, "{ not json");

    IntegrityMonitor monitor(ws.config());
    REQUIRE_FALSE(monitor.has_baseline());
    REQUIRE(monitor.verify().empty());

    REQUIRE(monitor.initialize().has_value());
    REQUIRE(monitor.has_baseline());
}

TEST_CASE("Integrity disabled reports nothing", "[integrity]")
{
    Workspace ws;
    auto cfg = ws.config();
    IntegrityMonitor seed(cfg);
    REQUIRE(seed.initialize().has_value());

    cfg.enabled = false;
    IntegrityMonitor monitor(cfg);
    testing::write_text(ws.soul, "tampered\n");
    REQUIRE(monitor.verify().empty());
    REQUIRE_FALSE(monitor.status().enabled);
}
