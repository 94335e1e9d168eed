#pragma once

#include "audit.hpp"
#include "integrity.hpp"
#include "rate_limiter.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace warden
{

    struct RateLimitSettings
    {
        bool enabled{true};
        std::size_t max_requests{30};
        std::int64_t window_seconds{60};
        std::size_t burst_limit{5};
        std::int64_t burst_window_seconds{5};
    };

    struct SecuritySettings
    {
        bool strict_mode{false};
        bool audit_enabled{true};
    };

    struct IntegritySettings
    {
        bool enabled{true};
        bool check_on_startup{true};
        bool abort_on_violation{false};
        std::vector<std::string> files; // empty selects the workspace defaults
    };

    struct DaemonSettings
    {
        std::int64_t heartbeat_interval_seconds{60};
        std::int64_t drain_timeout_seconds{30};
        unsigned stale_after_missed{2};
        std::size_t log_max_bytes{10 * 1024 * 1024};
        std::size_t log_max_files{3};
    };

    struct LoggingSettings
    {
        std::string level{"info"};
    };

    struct WardenConfig
    {
        std::filesystem::path state_dir;
        std::filesystem::path workspace;
        std::filesystem::path source; // file the config was read from, if any
        RateLimitSettings rate_limit{};
        SecuritySettings security{};
        IntegritySettings integrity{};
        DaemonSettings daemon{};
        LoggingSettings logging{};

        std::filesystem::path audit_dir() const { return state_dir / "audit"; }
        std::filesystem::path baseline_path() const { return state_dir / "security" / "integrity_hashes.json"; }
        std::filesystem::path log_file() const { return state_dir / "logs" / "daemon.log"; }

        /** Files under integrity watch, absolute. */
        std::vector<std::filesystem::path> integrity_files() const;

        RateLimiter::Config rate_limiter_config() const;
        AuditLogger::Config audit_config() const;
        IntegrityMonitor::Config integrity_config() const;
    };

    /** Workspace files watched when [integrity] files is not set. */
    inline const std::vector<std::string> kDefaultIntegrityFiles = {"SOUL.md", "AGENTS.md", "IDENTITY.md", "USER.md"};

    /** $WARDEN_STATE_DIR, else ~/.warden */
    std::filesystem::path default_state_dir();

    /** Expand a leading "~" against $HOME. */
    std::filesystem::path expand_home(const std::string &path);

    /**
     * ConfigLoader loads the TOML config and applies WARDEN_* environment
     * overrides on top. Missing keys keep their defaults.
     */
    class ConfigLoader
    {
    public:
        /** Load config from a TOML file path. Environment overrides take precedence. */
        static Result<WardenConfig> load(const std::filesystem::path &path);

        /** Like load(), but a missing file yields defaults. */
        static Result<WardenConfig> load_or_default(const std::filesystem::path &path);

        /** Parse config from TOML string content. */
        static Result<WardenConfig> from_string(const std::string &toml_content);

        /** Serialize config to JSON for inspection. */
        static nlohmann::json to_json(const WardenConfig &cfg);

        static WardenConfig defaults();

    private:
        static Result<void> apply_env_overrides(WardenConfig &cfg);
    };

} // namespace warden
