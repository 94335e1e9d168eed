#pragma once

#include "types.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace warden
{

    /** Provider API keys copied into generated service definitions when set. */
    inline const std::vector<std::string> kPassthroughEnvVars = {
        "OPENROUTER_API_KEY",
        "OPENAI_API_KEY",
        "ANTHROPIC_API_KEY",
        "GROQ_API_KEY",
        "BRAVE_API_KEY",
    };

    struct CommandResult
    {
        int exit_code{0};
        std::string output; // combined stdout and stderr
    };

    /** Runs external tools (systemctl, launchctl, loginctl). */
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;
        virtual Result<CommandResult> run(const std::vector<std::string> &argv) = 0;
    };

    class PosixCommandRunner : public CommandRunner
    {
    public:
        Result<CommandResult> run(const std::vector<std::string> &argv) override;
    };

    /** Everything a service definition needs to know about this installation. */
    struct ServiceContext
    {
        std::filesystem::path executable;
        std::filesystem::path home;
        std::filesystem::path state_dir;
        std::filesystem::path config_path;
        std::string path_env{"/usr/local/bin:/usr/bin:/bin"};
        std::string user;
        std::map<std::string, std::string> environment; // allow-listed secrets only
    };

    /** Values of the allow-listed variables that are set and non-empty. */
    std::map<std::string, std::string> passthrough_environment();

    /** Build a context from the current process environment. */
    ServiceContext make_service_context(std::filesystem::path executable,
                                        std::filesystem::path state_dir,
                                        std::filesystem::path config_path);

    /**
     * Registration of the daemon with the platform service manager.
     * Operations return a human readable message on success.
     */
    class ServiceManager
    {
    public:
        virtual ~ServiceManager() = default;

        virtual std::string platform() const = 0;
        virtual bool supported() const { return true; }
        virtual std::filesystem::path unit_path() const = 0;

        /** Contents of the generated unit / property list. */
        virtual std::string render_unit() const = 0;

        virtual Result<std::string> install() = 0;
        virtual Result<std::string> uninstall() = 0;
        virtual Result<std::string> start() = 0;
        virtual Result<std::string> stop() = 0;

        bool is_installed() const;
    };

    /** systemd user unit at ~/.config/systemd/user/warden.service */
    class SystemdUserService : public ServiceManager
    {
    public:
        SystemdUserService(ServiceContext ctx, std::shared_ptr<CommandRunner> runner);

        std::string platform() const override { return "linux"; }
        std::filesystem::path unit_path() const override;
        std::string render_unit() const override;

        Result<std::string> install() override;
        Result<std::string> uninstall() override;
        Result<std::string> start() override;
        Result<std::string> stop() override;

        static constexpr const char *kServiceName = "warden";

    private:
        ServiceContext ctx_;
        std::shared_ptr<CommandRunner> runner_;
    };

    /** launchd agent at ~/Library/LaunchAgents/dev.warden.daemon.plist */
    class LaunchdService : public ServiceManager
    {
    public:
        LaunchdService(ServiceContext ctx, std::shared_ptr<CommandRunner> runner);

        std::string platform() const override { return "macos"; }
        std::filesystem::path unit_path() const override;
        std::string render_unit() const override;

        Result<std::string> install() override;
        Result<std::string> uninstall() override;
        Result<std::string> start() override;
        Result<std::string> stop() override;

        static constexpr const char *kLabel = "dev.warden.daemon";

    private:
        ServiceContext ctx_;
        std::shared_ptr<CommandRunner> runner_;
    };

    /** Every operation fails; used where no service manager is available. */
    class UnsupportedService : public ServiceManager
    {
    public:
        std::string platform() const override { return "unsupported"; }
        bool supported() const override { return false; }
        std::filesystem::path unit_path() const override { return {}; }
        std::string render_unit() const override { return {}; }

        Result<std::string> install() override;
        Result<std::string> uninstall() override;
        Result<std::string> start() override;
        Result<std::string> stop() override;
    };

    /** Pick the service manager for the running host. */
    std::unique_ptr<ServiceManager> make_service_manager(ServiceContext ctx,
                                                         std::shared_ptr<CommandRunner> runner =
                                                             std::make_shared<PosixCommandRunner>());

} // namespace warden
