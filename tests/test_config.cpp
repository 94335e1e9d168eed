#include <catch2/catch_test_macros.hpp>
#include "warden/config.hpp"
#include "test_support.hpp"
#include <cstdlib>
#include <optional>

using namespace warden;

namespace
{
    /** Sets or clears one environment variable for a scope. */
    class ScopedEnv
    {
    public:
        ScopedEnv(const char *name, const char *value) : name_(name)
        {
            if (const char *old = std::getenv(name))
                previous_ = old;
            if (value)
                ::setenv(name, value, 1);
            else
                ::unsetenv(name);
        }

        ~ScopedEnv()
        {
            if (previous_)
                ::setenv(name_, previous_->c_str(), 1);
            else
                ::unsetenv(name_);
        }

        ScopedEnv(const ScopedEnv &) = delete;
        ScopedEnv &operator=(const ScopedEnv &) = delete;

    private:
        const char *name_;
        std::optional<std::string> previous_;
    };

    struct CleanEnv
    {
        ScopedEnv state{"WARDEN_STATE_DIR", "/tmp/warden-config-test"};
        ScopedEnv level{"WARDEN_LOG_LEVEL", nullptr};
        ScopedEnv strict{"WARDEN_STRICT_MODE", nullptr};
        ScopedEnv rate{"WARDEN_RATE_LIMIT_ENABLED", nullptr};
    };
} // namespace

TEST_CASE("Config empty document yields defaults", "[config]")
{
    CleanEnv env;
    auto cfg = ConfigLoader::from_string("");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->state_dir == "/tmp/warden-config-test");
    REQUIRE(cfg->workspace == "/tmp/warden-config-test/workspace");
    REQUIRE(cfg->rate_limit.enabled);
    REQUIRE(cfg->rate_limit.max_requests == 30);
    REQUIRE(cfg->rate_limit.burst_limit == 5);
    REQUIRE_FALSE(cfg->security.strict_mode);
    REQUIRE(cfg->daemon.heartbeat_interval_seconds == 60);
    REQUIRE(cfg->daemon.drain_timeout_seconds == 30);
    REQUIRE(cfg->logging.level == "info");
}

TEST_CASE("Config parses every section", "[config]")
{
    CleanEnv env;
    auto cfg = ConfigLoader::from_string(R"(
state_dir = "/srv/warden"

[rate_limit]
enabled = false
max_requests = 100
window_seconds = 120
burst_limit = 10
burst_window_seconds = 2

[security]
strict_mode = true
audit_enabled = false

[integrity]
check_on_startup = false
abort_on_violation = true
files = ["SOUL.md", "/etc/warden/extra.md"]

[daemon]
heartbeat_interval_seconds = 15
drain_timeout_seconds = 5
stale_after_missed = 4
log_max_bytes = 2048
log_max_files = 7

[logging]
level = "debug"
)");
    REQUIRE(cfg.has_value());
    // The environment wins over the file
    REQUIRE(cfg->state_dir == "/tmp/warden-config-test");
    REQUIRE_FALSE(cfg->rate_limit.enabled);
    REQUIRE(cfg->rate_limit.max_requests == 100);
    REQUIRE(cfg->rate_limit.window_seconds == 120);
    REQUIRE(cfg->rate_limit.burst_window_seconds == 2);
    REQUIRE(cfg->security.strict_mode);
    REQUIRE_FALSE(cfg->security.audit_enabled);
    REQUIRE(cfg->integrity.abort_on_violation);
    REQUIRE(cfg->daemon.stale_after_missed == 4);
    REQUIRE(cfg->daemon.log_max_files == 7);
    REQUIRE(cfg->logging.level == "debug");

    auto files = cfg->integrity_files();
    REQUIRE(files.size() == 2);
    REQUIRE(files[0] == cfg->workspace / "SOUL.md");
    REQUIRE(files[1] == "/etc/warden/extra.md");

    auto limiter = cfg->rate_limiter_config();
    REQUIRE(limiter.window == std::chrono::seconds(120));
    REQUIRE_FALSE(cfg->audit_config().enabled);
}

TEST_CASE("Config state_dir from file relocates the workspace", "[config]")
{
    ScopedEnv state{"WARDEN_STATE_DIR", nullptr};
    auto cfg = ConfigLoader::from_string("state_dir = \"/srv/warden\"\n");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->state_dir == "/srv/warden");
    REQUIRE(cfg->workspace == "/srv/warden/workspace");
    REQUIRE(cfg->audit_dir() == "/srv/warden/audit");
    REQUIRE(cfg->baseline_path() == "/srv/warden/security/integrity_hashes.json");
    REQUIRE(cfg->log_file() == "/srv/warden/logs/daemon.log");

    auto pinned = ConfigLoader::from_string("state_dir = \"/srv/warden\"\nworkspace = \"/home/agent/ws\"\n");
    REQUIRE(pinned.has_value());
    REQUIRE(pinned->workspace == "/home/agent/ws");
}

TEST_CASE("Config default integrity files include the config itself", "[config]")
{
    CleanEnv env;
    testing::TempDir dir;
    testing::write_text(dir / "config.toml", "[logging]\nlevel = \"warn\"\n");

    auto cfg = ConfigLoader::load(dir / "config.toml");
    REQUIRE(cfg.has_value());
    REQUIRE(cfg->source == dir / "config.toml");

    auto files = cfg->integrity_files();
    REQUIRE(files.size() == kDefaultIntegrityFiles.size() + 1);
    REQUIRE(files.front() == cfg->workspace / "SOUL.md");
    REQUIRE(files.back() == dir / "config.toml");
}

TEST_CASE("Config rejects invalid documents", "[config]")
{
    CleanEnv env;

    auto broken = ConfigLoader::from_string("[rate_limit\nmax_requests = 3");
    REQUIRE_FALSE(broken.has_value());
    REQUIRE(broken.error().code == ErrorCode::ConfigError);

    auto negative = ConfigLoader::from_string("[rate_limit]\nmax_requests = -1\n");
    REQUIRE_FALSE(negative.has_value());
    REQUIRE(std::string(negative.error().what()).find("rate_limit.max_requests") != std::string::npos);

    auto zero = ConfigLoader::from_string("[daemon]\ndrain_timeout_seconds = 0\n");
    REQUIRE_FALSE(zero.has_value());

    auto files = ConfigLoader::from_string("[integrity]\nfiles = [1, 2]\n");
    REQUIRE_FALSE(files.has_value());
}

TEST_CASE("Config missing file", "[config]")
{
    CleanEnv env;
    testing::TempDir dir;

    auto strict = ConfigLoader::load(dir / "absent.toml");
    REQUIRE_FALSE(strict.has_value());
    REQUIRE(strict.error().code == ErrorCode::ConfigError);

    auto lenient = ConfigLoader::load_or_default(dir / "absent.toml");
    REQUIRE(lenient.has_value());
    REQUIRE(lenient->source.empty());
    REQUIRE(lenient->state_dir == "/tmp/warden-config-test");
}

TEST_CASE("Config environment overrides", "[config]")
{
    CleanEnv env;

    SECTION("booleans and level")
    {
        ScopedEnv strict{"WARDEN_STRICT_MODE", "yes"};
        ScopedEnv rate{"WARDEN_RATE_LIMIT_ENABLED", "OFF"};
        ScopedEnv level{"WARDEN_LOG_LEVEL", "trace"};
        auto cfg = ConfigLoader::from_string("[security]\nstrict_mode = false\n");
        REQUIRE(cfg.has_value());
        REQUIRE(cfg->security.strict_mode);
        REQUIRE_FALSE(cfg->rate_limit.enabled);
        REQUIRE(cfg->logging.level == "trace");
    }

    SECTION("invalid boolean")
    {
        ScopedEnv strict{"WARDEN_STRICT_MODE", "maybe"};
        auto cfg = ConfigLoader::from_string("");
        REQUIRE_FALSE(cfg.has_value());
        REQUIRE(std::string(cfg.error().what()).find("WARDEN_STRICT_MODE") != std::string::npos);
    }
}

TEST_CASE("Config serializes for printing", "[config]")
{
    CleanEnv env;
    auto cfg = ConfigLoader::from_string("[rate_limit]\nmax_requests = 12\n");
    REQUIRE(cfg.has_value());

    auto j = ConfigLoader::to_json(*cfg);
    REQUIRE(j["rate_limit"]["max_requests"] == 12);
    REQUIRE(j["state_dir"] == "/tmp/warden-config-test");
    REQUIRE(j["integrity"]["files"].size() == kDefaultIntegrityFiles.size());
    REQUIRE(j["logging"]["level"] == "info");
}

TEST_CASE("Home expansion", "[config]")
{
    ScopedEnv home{"HOME", "/home/agent"};
    REQUIRE(expand_home("~") == "/home/agent");
    REQUIRE(expand_home("~/x/y") == "/home/agent/x/y");
    REQUIRE(expand_home("/abs") == "/abs");
    REQUIRE(expand_home("~other") == "~other");
}
