#include "warden/service_manager.hpp"
#include "warden/fs_util.hpp"
#include <spdlog/spdlog.h>
#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>
#include <sys/utsname.h>
#include <sys/wait.h>
#include <unistd.h>

namespace warden
{

    namespace
    {
        std::string env_or(const char *name, const std::string &fallback)
        {
            const char *value = std::getenv(name);
            return (value && *value) ? std::string(value) : fallback;
        }

        bool on_path(const std::string &tool, const std::string &path_env)
        {
            std::size_t start = 0;
            while (start <= path_env.size())
            {
                auto end = path_env.find(':', start);
                if (end == std::string::npos)
                    end = path_env.size();
                auto dir = path_env.substr(start, end - start);
                if (!dir.empty())
                {
                    auto candidate = std::filesystem::path(dir) / tool;
                    if (::access(candidate.c_str(), X_OK) == 0)
                        return true;
                }
                start = end + 1;
            }
            return false;
        }

        std::string xml_escape(const std::string &in)
        {
            std::string out;
            out.reserve(in.size());
            for (char c : in)
            {
                switch (c)
                {
                case '&': out += "&amp;"; break;
                case '<': out += "&lt;"; break;
                case '>': out += "&gt;"; break;
                case '"': out += "&quot;"; break;
                default: out += c;
                }
            }
            return out;
        }

        Result<std::string> require_success(const Result<CommandResult> &result, const std::string &what)
        {
            if (!result)
                return std::unexpected(WardenError::service(std::format("{}: {}", what, result.error().what())));
            if (result->exit_code != 0)
            {
                return std::unexpected(WardenError::service(
                    std::format("{} (exit {}): {}", what, result->exit_code, result->output)));
            }
            return result->output;
        }

        Result<void> remove_unit(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (ec)
                return std::unexpected(WardenError::service("Failed to remove service file: " + ec.message()));
            return {};
        }
    } // namespace

    Result<CommandResult> PosixCommandRunner::run(const std::vector<std::string> &argv)
    {
        if (argv.empty())
            return std::unexpected(WardenError::invalid_input("Empty command line"));

        int fds[2];
        if (::pipe(fds) != 0)
            return std::unexpected(WardenError::io(std::format("pipe failed: {}", std::strerror(errno))));

        pid_t pid = ::fork();
        if (pid < 0)
        {
            ::close(fds[0]);
            ::close(fds[1]);
            return std::unexpected(WardenError::io(std::format("fork failed: {}", std::strerror(errno))));
        }

        if (pid == 0)
        {
            ::dup2(fds[1], STDOUT_FILENO);
            ::dup2(fds[1], STDERR_FILENO);
            ::close(fds[0]);
            ::close(fds[1]);

            std::vector<char *> args;
            args.reserve(argv.size() + 1);
            for (const auto &a : argv)
                args.push_back(const_cast<char *>(a.c_str()));
            args.push_back(nullptr);
            ::execvp(args[0], args.data());
            _exit(127);
        }

        ::close(fds[1]);
        CommandResult result;
        std::array<char, 4096> buf{};
        ssize_t n = 0;
        while ((n = ::read(fds[0], buf.data(), buf.size())) != 0)
        {
            if (n < 0)
            {
                if (errno == EINTR)
                    continue;
                break;
            }
            result.output.append(buf.data(), static_cast<std::size_t>(n));
        }
        ::close(fds[0]);

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                return std::unexpected(WardenError::io(std::format("waitpid failed: {}", std::strerror(errno))));
        }
        result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
        return result;
    }

    std::map<std::string, std::string> passthrough_environment()
    {
        std::map<std::string, std::string> env;
        for (const auto &name : kPassthroughEnvVars)
        {
            const char *value = std::getenv(name.c_str());
            if (value && *value)
                env[name] = value;
        }
        return env;
    }

    ServiceContext make_service_context(std::filesystem::path executable,
                                        std::filesystem::path state_dir,
                                        std::filesystem::path config_path)
    {
        ServiceContext ctx;
        ctx.executable = std::move(executable);
        ctx.state_dir = std::move(state_dir);
        ctx.config_path = std::move(config_path);
        ctx.home = env_or("HOME", "/");
        ctx.path_env = env_or("PATH", ctx.path_env);
        ctx.user = env_or("USER", "");
        ctx.environment = passthrough_environment();
        return ctx;
    }

    bool ServiceManager::is_installed() const
    {
        auto path = unit_path();
        std::error_code ec;
        return !path.empty() && std::filesystem::exists(path, ec);
    }

    // systemd

    SystemdUserService::SystemdUserService(ServiceContext ctx, std::shared_ptr<CommandRunner> runner)
        : ctx_(std::move(ctx)), runner_(std::move(runner))
    {
    }

    std::filesystem::path SystemdUserService::unit_path() const
    {
        return ctx_.home / ".config" / "systemd" / "user" / (std::string(kServiceName) + ".service");
    }

    std::string SystemdUserService::render_unit() const
    {
        std::string extra;
        for (const auto &[key, value] : ctx_.environment)
            extra += std::format("Environment=\"{}={}\"\n", key, value);

        return std::format(
            "[Unit]\n"
            "Description=Warden agent supervisor\n"
            "After=network.target\n"
            "\n"
            "[Service]\n"
            "Type=simple\n"
            "ExecStart={} run --config {}\n"
            "WorkingDirectory={}\n"
            "Restart=on-failure\n"
            "RestartSec=10\n"
            "KillSignal=SIGTERM\n"
            "TimeoutStopSec=45\n"
            "\n"
            "Environment=\"PATH={}\"\n"
            "Environment=\"HOME={}\"\n"
            "Environment=\"WARDEN_STATE_DIR={}\"\n"
            "{}"
            "\n"
            "[Install]\n"
            "WantedBy=default.target\n",
            ctx_.executable.string(), ctx_.config_path.string(), ctx_.state_dir.string(),
            ctx_.path_env, ctx_.home.string(), ctx_.state_dir.string(), extra);
    }

    Result<std::string> SystemdUserService::install()
    {
        std::error_code ec;
        std::filesystem::create_directories(ctx_.state_dir / "logs", ec);
        if (ec)
            return std::unexpected(WardenError::io("Failed to create state directory: " + ec.message()));

        if (auto written = fs::atomic_write_file(unit_path(), render_unit()); !written)
            return std::unexpected(written.error());

        if (auto reload = require_success(runner_->run({"systemctl", "--user", "daemon-reload"}), "systemctl daemon-reload"); !reload)
            spdlog::warn("{}", reload.error().what());

        auto enabled = require_success(runner_->run({"systemctl", "--user", "enable", kServiceName}), "Failed to enable service");
        if (!enabled)
            return std::unexpected(enabled.error());

        // Linger keeps the user manager, and the daemon, alive after logout
        if (!ctx_.user.empty())
        {
            auto linger = require_success(runner_->run({"loginctl", "enable-linger", ctx_.user}), "loginctl enable-linger");
            if (!linger)
                spdlog::warn("{}", linger.error().what());
        }

        spdlog::info("Installed systemd user unit {}", unit_path().string());
        return std::format("Installed service at {}", unit_path().string());
    }

    Result<std::string> SystemdUserService::uninstall()
    {
        if (!is_installed())
            return std::unexpected(WardenError::not_found("Service is not installed."));

        for (const char *action : {"stop", "disable"})
        {
            auto r = require_success(runner_->run({"systemctl", "--user", action, kServiceName}),
                                     std::format("systemctl {}", action));
            if (!r)
                spdlog::warn("{}", r.error().what());
        }

        if (auto removed = remove_unit(unit_path()); !removed)
            return std::unexpected(removed.error());

        if (auto reload = require_success(runner_->run({"systemctl", "--user", "daemon-reload"}), "systemctl daemon-reload"); !reload)
            spdlog::warn("{}", reload.error().what());
        return std::string("Service uninstalled");
    }

    Result<std::string> SystemdUserService::start()
    {
        if (!is_installed())
            return std::unexpected(WardenError::not_found("Service is not installed. Run `warden daemon install` first."));
        auto r = require_success(runner_->run({"systemctl", "--user", "start", kServiceName}), "Failed to start service");
        if (!r)
            return std::unexpected(r.error());
        return std::string("Daemon start command sent");
    }

    Result<std::string> SystemdUserService::stop()
    {
        auto r = require_success(runner_->run({"systemctl", "--user", "stop", kServiceName}), "Failed to stop service");
        if (!r)
            return std::unexpected(r.error());
        return std::string("Daemon stopped");
    }

    // launchd

    LaunchdService::LaunchdService(ServiceContext ctx, std::shared_ptr<CommandRunner> runner)
        : ctx_(std::move(ctx)), runner_(std::move(runner))
    {
    }

    std::filesystem::path LaunchdService::unit_path() const
    {
        return ctx_.home / "Library" / "LaunchAgents" / (std::string(kLabel) + ".plist");
    }

    std::string LaunchdService::render_unit() const
    {
        std::string extra;
        for (const auto &[key, value] : ctx_.environment)
        {
            extra += std::format("        <key>{}</key>\n        <string>{}</string>\n", key, xml_escape(value));
        }

        const auto out_log = (ctx_.state_dir / "logs" / "launchd.log").string();
        return std::format(
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
            "<!DOCTYPE plist PUBLIC \"-//Apple//DTD PLIST 1.0//EN\" \"http://www.apple.com/DTDs/PropertyList-1.0.dtd\">\n"
            "<plist version=\"1.0\">\n"
            "<dict>\n"
            "    <key>Label</key>\n"
            "    <string>{}</string>\n"
            "    <key>ProgramArguments</key>\n"
            "    <array>\n"
            "        <string>{}</string>\n"
            "        <string>run</string>\n"
            "        <string>--config</string>\n"
            "        <string>{}</string>\n"
            "    </array>\n"
            "    <key>RunAtLoad</key>\n"
            "    <true/>\n"
            "    <key>KeepAlive</key>\n"
            "    <true/>\n"
            "    <key>ThrottleInterval</key>\n"
            "    <integer>10</integer>\n"
            "    <key>ExitTimeOut</key>\n"
            "    <integer>45</integer>\n"
            "    <key>WorkingDirectory</key>\n"
            "    <string>{}</string>\n"
            "    <key>StandardOutPath</key>\n"
            "    <string>{}</string>\n"
            "    <key>StandardErrorPath</key>\n"
            "    <string>{}</string>\n"
            "    <key>EnvironmentVariables</key>\n"
            "    <dict>\n"
            "        <key>PATH</key>\n"
            "        <string>{}</string>\n"
            "        <key>HOME</key>\n"
            "        <string>{}</string>\n"
            "        <key>WARDEN_STATE_DIR</key>\n"
            "        <string>{}</string>\n"
            "{}"
            "    </dict>\n"
            "</dict>\n"
            "</plist>\n",
            kLabel, xml_escape(ctx_.executable.string()), xml_escape(ctx_.config_path.string()),
            xml_escape(ctx_.state_dir.string()), xml_escape(out_log), xml_escape(out_log),
            xml_escape(ctx_.path_env), xml_escape(ctx_.home.string()), xml_escape(ctx_.state_dir.string()), extra);
    }

    Result<std::string> LaunchdService::install()
    {
        std::error_code ec;
        std::filesystem::create_directories(ctx_.state_dir / "logs", ec);
        if (ec)
            return std::unexpected(WardenError::io("Failed to create state directory: " + ec.message()));

        if (auto written = fs::atomic_write_file(unit_path(), render_unit()); !written)
            return std::unexpected(written.error());

        auto loaded = require_success(runner_->run({"launchctl", "load", unit_path().string()}), "Failed to load service");
        if (!loaded)
            return std::unexpected(loaded.error());

        spdlog::info("Installed launchd agent {}", unit_path().string());
        return std::format("Installed service at {}", unit_path().string());
    }

    Result<std::string> LaunchdService::uninstall()
    {
        if (!is_installed())
            return std::unexpected(WardenError::not_found("Service is not installed."));

        auto unloaded = require_success(runner_->run({"launchctl", "unload", unit_path().string()}), "launchctl unload");
        if (!unloaded)
            spdlog::warn("{}", unloaded.error().what());

        if (auto removed = remove_unit(unit_path()); !removed)
            return std::unexpected(removed.error());
        return std::string("Service uninstalled");
    }

    Result<std::string> LaunchdService::start()
    {
        if (!is_installed())
            return std::unexpected(WardenError::not_found("Service is not installed. Run `warden daemon install` first."));
        auto r = require_success(runner_->run({"launchctl", "start", kLabel}), "Failed to start service");
        if (!r)
            return std::unexpected(r.error());
        return std::string("Daemon start command sent");
    }

    Result<std::string> LaunchdService::stop()
    {
        auto r = require_success(runner_->run({"launchctl", "stop", kLabel}), "Failed to stop service");
        if (!r)
            return std::unexpected(r.error());
        return std::string("Daemon stopped");
    }

    // unsupported

    namespace
    {
        WardenError unsupported()
        {
            return WardenError::service("Daemon management is not supported on this platform. "
                                        "Run `warden run` in the foreground instead.");
        }
    } // namespace

    Result<std::string> UnsupportedService::install() { return std::unexpected(unsupported()); }
    Result<std::string> UnsupportedService::uninstall() { return std::unexpected(unsupported()); }
    Result<std::string> UnsupportedService::start() { return std::unexpected(unsupported()); }
    Result<std::string> UnsupportedService::stop() { return std::unexpected(unsupported()); }

    std::unique_ptr<ServiceManager> make_service_manager(ServiceContext ctx, std::shared_ptr<CommandRunner> runner)
    {
        struct utsname info{};
        std::string system = ::uname(&info) == 0 ? info.sysname : "";

        if (system == "Darwin")
            return std::make_unique<LaunchdService>(std::move(ctx), std::move(runner));
        if (system == "Linux" && on_path("systemctl", ctx.path_env))
            return std::make_unique<SystemdUserService>(std::move(ctx), std::move(runner));

        spdlog::debug("No supported service manager on '{}'", system);
        return std::make_unique<UnsupportedService>();
    }

} // namespace warden
