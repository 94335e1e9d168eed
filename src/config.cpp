#include "warden/config.hpp"
#include "warden/fs_util.hpp"
#include <toml++/toml.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <format>

namespace warden
{
    namespace
    {
        template <typename T>
        Result<T> positive(const toml::node_view<const toml::node> &node, const char *key, T current)
        {
            auto v = node.value<std::int64_t>();
            if (!v)
                return current;
            if (*v <= 0)
                return std::unexpected(WardenError::config(std::format("{} must be positive, got {}", key, *v)));
            return static_cast<T>(*v);
        }

        Result<void> parse_toml(const toml::table &tbl, WardenConfig &cfg)
        {
            if (auto dir = tbl["state_dir"].value<std::string>())
                cfg.state_dir = expand_home(*dir);
            if (auto ws = tbl["workspace"].value<std::string>())
                cfg.workspace = expand_home(*ws);

            if (auto rl = tbl["rate_limit"].as_table())
            {
                const auto &t = *rl;
                if (auto enabled = t["enabled"].value<bool>())
                    cfg.rate_limit.enabled = *enabled;

                auto max_requests = positive(t["max_requests"], "rate_limit.max_requests", cfg.rate_limit.max_requests);
                auto window = positive(t["window_seconds"], "rate_limit.window_seconds", cfg.rate_limit.window_seconds);
                auto burst = positive(t["burst_limit"], "rate_limit.burst_limit", cfg.rate_limit.burst_limit);
                auto burst_window = positive(t["burst_window_seconds"], "rate_limit.burst_window_seconds", cfg.rate_limit.burst_window_seconds);
                if (!max_requests)
                    return std::unexpected(max_requests.error());
                if (!window)
                    return std::unexpected(window.error());
                if (!burst)
                    return std::unexpected(burst.error());
                if (!burst_window)
                    return std::unexpected(burst_window.error());
                cfg.rate_limit.max_requests = *max_requests;
                cfg.rate_limit.window_seconds = *window;
                cfg.rate_limit.burst_limit = *burst;
                cfg.rate_limit.burst_window_seconds = *burst_window;
            }

            if (auto sec = tbl["security"].as_table())
            {
                if (auto strict = (*sec)["strict_mode"].value<bool>())
                    cfg.security.strict_mode = *strict;
                if (auto audit = (*sec)["audit_enabled"].value<bool>())
                    cfg.security.audit_enabled = *audit;
            }

            if (auto integ = tbl["integrity"].as_table())
            {
                const auto &t = *integ;
                if (auto enabled = t["enabled"].value<bool>())
                    cfg.integrity.enabled = *enabled;
                if (auto check = t["check_on_startup"].value<bool>())
                    cfg.integrity.check_on_startup = *check;
                if (auto abort_boot = t["abort_on_violation"].value<bool>())
                    cfg.integrity.abort_on_violation = *abort_boot;
                if (auto files = t["files"].as_array())
                {
                    cfg.integrity.files.clear();
                    for (const auto &f : *files)
                    {
                        auto s = f.value<std::string>();
                        if (!s)
                            return std::unexpected(WardenError::config("integrity.files must contain strings"));
                        cfg.integrity.files.push_back(*s);
                    }
                }
            }

            if (auto daemon = tbl["daemon"].as_table())
            {
                const auto &t = *daemon;
                auto heartbeat = positive(t["heartbeat_interval_seconds"], "daemon.heartbeat_interval_seconds", cfg.daemon.heartbeat_interval_seconds);
                auto drain = positive(t["drain_timeout_seconds"], "daemon.drain_timeout_seconds", cfg.daemon.drain_timeout_seconds);
                auto missed = positive(t["stale_after_missed"], "daemon.stale_after_missed", cfg.daemon.stale_after_missed);
                auto max_bytes = positive(t["log_max_bytes"], "daemon.log_max_bytes", cfg.daemon.log_max_bytes);
                auto max_files = positive(t["log_max_files"], "daemon.log_max_files", cfg.daemon.log_max_files);
                if (!heartbeat)
                    return std::unexpected(heartbeat.error());
                if (!drain)
                    return std::unexpected(drain.error());
                if (!missed)
                    return std::unexpected(missed.error());
                if (!max_bytes)
                    return std::unexpected(max_bytes.error());
                if (!max_files)
                    return std::unexpected(max_files.error());
                cfg.daemon.heartbeat_interval_seconds = *heartbeat;
                cfg.daemon.drain_timeout_seconds = *drain;
                cfg.daemon.stale_after_missed = *missed;
                cfg.daemon.log_max_bytes = *max_bytes;
                cfg.daemon.log_max_files = *max_files;
            }

            if (auto logging = tbl["logging"].as_table())
            {
                if (auto level = (*logging)["level"].value<std::string>())
                    cfg.logging.level = *level;
            }
            return {};
        }

        std::optional<bool> parse_flag(const char *value)
        {
            std::string v(value);
            std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            if (v == "1" || v == "true" || v == "yes" || v == "on")
                return true;
            if (v == "0" || v == "false" || v == "no" || v == "off")
                return false;
            return std::nullopt;
        }
    } // namespace

    std::filesystem::path expand_home(const std::string &path)
    {
        if (path == "~" || path.rfind("~/", 0) == 0)
        {
            const char *home = std::getenv("HOME");
            std::filesystem::path base = home ? home : "";
            return path.size() <= 2 ? base : base / path.substr(2);
        }
        return path;
    }

    std::filesystem::path default_state_dir()
    {
        if (const char *dir = std::getenv("WARDEN_STATE_DIR"); dir && *dir)
            return expand_home(dir);
        return expand_home("~/.warden");
    }

    std::vector<std::filesystem::path> WardenConfig::integrity_files() const
    {
        std::vector<std::filesystem::path> out;
        if (integrity.files.empty())
        {
            for (const auto &name : kDefaultIntegrityFiles)
                out.push_back(workspace / name);
            if (!source.empty())
                out.push_back(source);
            return out;
        }
        for (const auto &f : integrity.files)
        {
            auto p = expand_home(f);
            out.push_back(p.is_absolute() ? p : workspace / p);
        }
        return out;
    }

    RateLimiter::Config WardenConfig::rate_limiter_config() const
    {
        RateLimiter::Config c;
        c.enabled = rate_limit.enabled;
        c.max_requests = rate_limit.max_requests;
        c.window = std::chrono::seconds(rate_limit.window_seconds);
        c.burst_limit = rate_limit.burst_limit;
        c.burst_window = std::chrono::seconds(rate_limit.burst_window_seconds);
        return c;
    }

    AuditLogger::Config WardenConfig::audit_config() const
    {
        AuditLogger::Config c;
        c.directory = audit_dir();
        c.enabled = security.audit_enabled;
        return c;
    }

    IntegrityMonitor::Config WardenConfig::integrity_config() const
    {
        IntegrityMonitor::Config c;
        c.enabled = integrity.enabled;
        c.files = integrity_files();
        c.baseline_path = baseline_path();
        return c;
    }

    WardenConfig ConfigLoader::defaults()
    {
        WardenConfig cfg{};
        cfg.state_dir = default_state_dir();
        cfg.workspace = cfg.state_dir / "workspace";
        return cfg;
    }

    Result<WardenConfig> ConfigLoader::load(const std::filesystem::path &path)
    {
        auto contents = fs::read_file(path);
        if (!contents)
        {
            return std::unexpected(WardenError::config("Unable to open config file: " + path.string()));
        }
        auto cfg = from_string(*contents);
        if (cfg)
            cfg->source = path;
        return cfg;
    }

    Result<WardenConfig> ConfigLoader::load_or_default(const std::filesystem::path &path)
    {
        std::error_code ec;
        if (std::filesystem::exists(path, ec))
            return load(path);

        WardenConfig cfg = defaults();
        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        cfg.workspace = cfg.state_dir / "workspace";
        return cfg;
    }

    Result<WardenConfig> ConfigLoader::from_string(const std::string &toml_content)
    {
        WardenConfig cfg = defaults();
        bool workspace_set = false;

        try
        {
            auto tbl = toml::parse(toml_content);
            workspace_set = tbl.contains("workspace");
            if (auto parsed = parse_toml(tbl, cfg); !parsed)
                return std::unexpected(parsed.error());
        }
        catch (const toml::parse_error &e)
        {
            return std::unexpected(WardenError::config(std::string("Failed to parse TOML: ") + e.what()));
        }

        if (auto env = apply_env_overrides(cfg); !env)
            return std::unexpected(env.error());
        // Workspace follows a relocated state_dir unless set explicitly
        if (!workspace_set)
            cfg.workspace = cfg.state_dir / "workspace";
        return cfg;
    }

    Result<void> ConfigLoader::apply_env_overrides(WardenConfig &cfg)
    {
        if (const char *dir = std::getenv("WARDEN_STATE_DIR"); dir && *dir)
            cfg.state_dir = expand_home(dir);
        if (const char *level = std::getenv("WARDEN_LOG_LEVEL"); level && *level)
            cfg.logging.level = level;
        if (const char *strict = std::getenv("WARDEN_STRICT_MODE"))
        {
            auto flag = parse_flag(strict);
            if (!flag)
                return std::unexpected(WardenError::config(std::format("WARDEN_STRICT_MODE: invalid boolean '{}'", strict)));
            cfg.security.strict_mode = *flag;
        }
        if (const char *rl = std::getenv("WARDEN_RATE_LIMIT_ENABLED"))
        {
            auto flag = parse_flag(rl);
            if (!flag)
                return std::unexpected(WardenError::config(std::format("WARDEN_RATE_LIMIT_ENABLED: invalid boolean '{}'", rl)));
            cfg.rate_limit.enabled = *flag;
        }
        return {};
    }

    nlohmann::json ConfigLoader::to_json(const WardenConfig &cfg)
    {
        nlohmann::json j;
        j["state_dir"] = cfg.state_dir.string();
        j["workspace"] = cfg.workspace.string();
        j["source"] = cfg.source.string();
        j["rate_limit"] = {
            {"enabled", cfg.rate_limit.enabled},
            {"max_requests", cfg.rate_limit.max_requests},
            {"window_seconds", cfg.rate_limit.window_seconds},
            {"burst_limit", cfg.rate_limit.burst_limit},
            {"burst_window_seconds", cfg.rate_limit.burst_window_seconds}};
        j["security"] = {{"strict_mode", cfg.security.strict_mode}, {"audit_enabled", cfg.security.audit_enabled}};

        nlohmann::json files = nlohmann::json::array();
        for (const auto &f : cfg.integrity_files())
            files.push_back(f.string());
        j["integrity"] = {
            {"enabled", cfg.integrity.enabled},
            {"check_on_startup", cfg.integrity.check_on_startup},
            {"abort_on_violation", cfg.integrity.abort_on_violation},
            {"files", files}};
        j["daemon"] = {
            {"heartbeat_interval_seconds", cfg.daemon.heartbeat_interval_seconds},
            {"drain_timeout_seconds", cfg.daemon.drain_timeout_seconds},
            {"stale_after_missed", cfg.daemon.stale_after_missed},
            {"log_max_bytes", cfg.daemon.log_max_bytes},
            {"log_max_files", cfg.daemon.log_max_files}};
        j["logging"] = {{"level", cfg.logging.level}};
        return j;
    }

} // namespace warden
