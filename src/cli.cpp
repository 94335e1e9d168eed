#include "warden/cli.hpp"
#include "warden/audit.hpp"
#include "warden/config.hpp"
#include "warden/crypto.hpp"
#include "warden/health.hpp"
#include "warden/integrity.hpp"
#include "warden/log_sink.hpp"
#include "warden/process.hpp"
#include "warden/rate_limiter.hpp"
#include "warden/sanitizer.hpp"
#include "warden/service_manager.hpp"
#include "warden/status.hpp"
#include "warden/supervisor.hpp"
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <deque>
#include <fstream>
#include <iostream>
#include <thread>
#include <unistd.h>

namespace warden::cli
{
	namespace
	{
		std::filesystem::path self_executable(const char *argv0)
		{
			std::error_code ec;
			auto exe = std::filesystem::read_symlink("/proc/self/exe", ec);
			if (!ec)
				return exe;
			return std::filesystem::absolute(argv0, ec);
		}

		std::string short_hash(const std::string &hash)
		{
			return hash.substr(0, 16) + "...";
		}

		const char *on_off(bool v)
		{
			return v ? "enabled" : "disabled";
		}

		std::string platform_label(const std::string &platform)
		{
			if (platform == "macos")
				return "macOS (launchd)";
			if (platform == "linux")
				return "Linux (systemd)";
			return "Unsupported";
		}

		int print_tail(const std::filesystem::path &path, std::size_t lines)
		{
			std::ifstream in(path);
			if (!in.is_open())
			{
				std::cerr << "Error reading log file: " << path.string() << std::endl;
				return 1;
			}
			std::deque<std::string> tail;
			std::string line;
			while (std::getline(in, line))
			{
				tail.push_back(line);
				if (tail.size() > lines)
					tail.pop_front();
			}
			for (const auto &l : tail)
				std::cout << l << '\n';
			std::cout.flush();
			return 0;
		}

		// Poll the file for appended data until interrupted; handles rotation by reopening
		int follow_log(const std::filesystem::path &path)
		{
			DaemonSupervisor::install_signal_handlers();
			std::ifstream in(path);
			in.seekg(0, std::ios::end);
			std::error_code size_ec;
			std::uintmax_t last_size = std::filesystem::file_size(path, size_ec);
			std::string line;
			while (!DaemonSupervisor::stop_requested())
			{
				while (std::getline(in, line))
					std::cout << line << std::endl;
				in.clear();

				std::error_code ec;
				auto size = std::filesystem::file_size(path, ec);
				if (!ec && size < last_size)
				{
					in.close();
					in.open(path);
				}
				if (!ec)
					last_size = size;
				std::this_thread::sleep_for(std::chrono::milliseconds(500));
			}
			return 0;
		}

		struct Runtime
		{
			std::shared_ptr<AuditLogger> audit;
			std::shared_ptr<RateLimiter> limiter;
			std::shared_ptr<InputSanitizer> sanitizer;
			std::shared_ptr<IntegrityMonitor> integrity;
			std::shared_ptr<StatusStore> status;
		};

		Runtime build_runtime(const WardenConfig &cfg)
		{
			Runtime rt;
			rt.audit = std::make_shared<AuditLogger>(cfg.audit_config());
			rt.limiter = std::make_shared<RateLimiter>(cfg.rate_limiter_config(), rt.audit);
			rt.sanitizer = std::make_shared<InputSanitizer>(cfg.security.strict_mode);
			rt.integrity = std::make_shared<IntegrityMonitor>(cfg.integrity_config(), rt.audit);
			rt.status = std::make_shared<StatusStore>(cfg.state_dir);
			return rt;
		}

		int cmd_run(const WardenConfig &cfg)
		{
			LoggingOptions opts;
			opts.level = cfg.logging.level;
			opts.log_file = cfg.log_file();
			opts.max_bytes = cfg.daemon.log_max_bytes;
			opts.max_files = cfg.daemon.log_max_files;
			configure_logging(opts);

			auto rt = build_runtime(cfg);
			DaemonSupervisor::Config sc;
			sc.heartbeat_interval = std::chrono::seconds(cfg.daemon.heartbeat_interval_seconds);
			sc.drain_timeout = std::chrono::seconds(cfg.daemon.drain_timeout_seconds);
			sc.check_on_startup = cfg.integrity.check_on_startup;
			sc.abort_on_violation = cfg.integrity.abort_on_violation;

			DaemonSupervisor supervisor(sc, {rt.audit, rt.limiter, rt.sanitizer, rt.integrity, rt.status});
			DaemonSupervisor::install_signal_handlers();

			if (auto started = supervisor.start(); !started)
			{
				spdlog::error("{}", started.error().what());
				std::cerr << started.error().what() << std::endl;
				return 1;
			}
			return supervisor.run_until_signal();
		}

		// Exit code of a finished stop: a drain timeout leaves the pid marker behind
		int report_shutdown(const StatusStore &store, int pid)
		{
			if (store.files_left_behind())
			{
				std::cerr << "✗ Daemon (PID " << pid << ") exited without draining; "
						  << "pid and status files were left in place" << std::endl;
				return 1;
			}
			std::cout << "✓ Daemon stopped (PID " << pid << ")" << std::endl;
			return 0;
		}

		// Wait for the process to exit, then judge the stop by what it left on disk
		int await_shutdown(const WardenConfig &cfg, const StatusStore &store, int pid)
		{
			auto probe = posix_process_probe();
			const auto deadline = std::chrono::steady_clock::now() +
								  std::chrono::seconds(cfg.daemon.drain_timeout_seconds + 5);
			while (std::chrono::steady_clock::now() < deadline)
			{
				if (!probe->is_alive(pid))
					return report_shutdown(store, pid);
				std::this_thread::sleep_for(std::chrono::milliseconds(250));
			}
			std::cerr << "Daemon (PID " << pid << ") did not stop within the drain timeout" << std::endl;
			return 1;
		}

		// Signal a foreground daemon directly
		int stop_by_signal(const WardenConfig &cfg, StatusStore &store)
		{
			auto pid = store.running_pid();
			if (!pid)
			{
				std::cout << "Daemon is not running" << std::endl;
				return 0;
			}
			if (auto sent = posix_process_probe()->terminate(*pid); !sent)
			{
				std::cerr << sent.error().what() << std::endl;
				return 1;
			}
			return await_shutdown(cfg, store, *pid);
		}

		int report(const Result<std::string> &r)
		{
			if (!r)
			{
				std::cerr << "✗ " << r.error().what() << std::endl;
				return 1;
			}
			std::cout << "✓ " << *r << std::endl;
			return 0;
		}
	} // namespace

	int run(int argc, char *argv[])
	{
		CLI::App app{"Warden: security and supervision for an always-on agent"};
		app.set_version_flag("--version", std::string(WARDEN_VERSION));

		std::string config_path = (default_state_dir() / "config.toml").string();
		app.add_option("--config", config_path, "Path to config TOML");

		auto run_cmd = app.add_subcommand("run", "Run the supervisor in the foreground (service entry point)");

		auto daemon_cmd = app.add_subcommand("daemon", "Manage the warden service");
		daemon_cmd->require_subcommand(1);
		auto d_install = daemon_cmd->add_subcommand("install", "Generate and install the system service");
		auto d_uninstall = daemon_cmd->add_subcommand("uninstall", "Remove the system service");
		auto d_start = daemon_cmd->add_subcommand("start", "Start the daemon");
		auto d_stop = daemon_cmd->add_subcommand("stop", "Stop the daemon gracefully");
		auto d_restart = daemon_cmd->add_subcommand("restart", "Restart the daemon");
		auto d_status = daemon_cmd->add_subcommand("status", "Show daemon status");
		std::size_t log_lines{50};
		bool log_follow{false};
		auto d_logs = daemon_cmd->add_subcommand("logs", "Tail the daemon log file");
		d_logs->add_option("-n,--lines", log_lines, "Number of lines to show");
		d_logs->add_flag("-f,--follow", log_follow, "Follow log output");

		auto doctor_cmd = app.add_subcommand("doctor", "Run health checks on the installation");

		auto sec_cmd = app.add_subcommand("security", "Security management commands");
		sec_cmd->require_subcommand(1);
		auto s_status = sec_cmd->add_subcommand("status", "Show security status and configuration");
		auto s_init = sec_cmd->add_subcommand("init-integrity", "Initialize file integrity baseline");
		auto s_verify = sec_cmd->add_subcommand("verify-integrity", "Verify file integrity against baseline");
		bool reset_confirm{false};
		auto s_reset = sec_cmd->add_subcommand("reset-integrity", "Reset integrity baseline to current file states");
		s_reset->add_flag("-y,--yes", reset_confirm, "Confirm reset");
		std::size_t audit_limit{50};
		auto s_audit = sec_cmd->add_subcommand("audit", "Show recent audit log events");
		s_audit->add_option("-n,--limit", audit_limit, "Number of events to show");
		std::string chain_date;
		auto s_chain = sec_cmd->add_subcommand("verify-audit", "Check the hash chain of one day's audit file");
		s_chain->add_option("--date", chain_date, "UTC date YYYY-MM-DD (default today)");

		auto cfg_cmd = app.add_subcommand("config-print", "Load and print config as JSON");

		CLI11_PARSE(app, argc, argv);

		auto cfg = ConfigLoader::load_or_default(config_path);

		if (*doctor_cmd)
		{
			configure_logging({.level = "warn"});
			WardenConfig effective = cfg ? *cfg : ConfigLoader::defaults();
			auto checker = run_health_check(effective, config_path);
			std::cout << checker.format_output(::isatty(STDOUT_FILENO) != 0) << std::endl;
			return checker.exit_code();
		}

		if (!cfg)
		{
			std::cerr << cfg.error().what() << std::endl;
			return 1;
		}
		configure_logging({.level = cfg->logging.level});

		if (*cfg_cmd)
		{
			std::cout << ConfigLoader::to_json(*cfg).dump(2) << std::endl;
			return 0;
		}

		if (*run_cmd)
			return cmd_run(*cfg);

		if (*daemon_cmd)
		{
			StatusStore store(cfg->state_dir);
			auto manager = make_service_manager(
				make_service_context(self_executable(argv[0]), cfg->state_dir, config_path));

			if (*d_install)
			{
				if (!manager->supported())
				{
					std::cerr << "Daemon management is not supported on this platform.\n"
							  << "Run `warden run` in the foreground instead." << std::endl;
					return 1;
				}
				int rc = report(manager->install());
				if (rc == 0)
					std::cout << "\nStart the daemon with: warden daemon start" << std::endl;
				return rc;
			}

			if (*d_uninstall)
			{
				if (store.running_pid())
				{
					std::cout << "Stopping daemon first..." << std::endl;
					if (auto stopped = manager->stop(); !stopped)
						spdlog::warn("{}", stopped.error().what());
				}
				return report(manager->uninstall());
			}

			if (*d_start)
			{
				if (auto pid = store.running_pid())
				{
					std::cerr << "Daemon already running (PID " << *pid << ")" << std::endl;
					return 1;
				}
				int rc = report(manager->start());
				if (rc != 0)
					return rc;
				std::this_thread::sleep_for(std::chrono::seconds(1));
				if (auto pid = store.running_pid())
					std::cout << "Daemon started (PID " << *pid << ")" << std::endl;
				return 0;
			}

			if (*d_stop)
			{
				if (!manager->is_installed())
					return stop_by_signal(*cfg, store);

				auto pid = store.running_pid();
				if (auto stopped = manager->stop(); !stopped)
					return report(stopped);
				if (!pid)
				{
					std::cout << "✓ Daemon stopped" << std::endl;
					return 0;
				}
				return await_shutdown(*cfg, store, *pid);
			}

			if (*d_restart)
			{
				if (!manager->is_installed())
				{
					std::cerr << "Service is not installed. Run `warden daemon install` first." << std::endl;
					return 1;
				}
				if (auto stopped = manager->stop(); !stopped)
					spdlog::warn("{}", stopped.error().what());
				return report(manager->start());
			}

			if (*d_status)
			{
				std::cout << "Warden Daemon Status\n\n";
				std::cout << "Platform: " << platform_label(manager->platform()) << "\n";
				if (manager->is_installed())
					std::cout << "Installed: ✓ " << manager->unit_path().string() << "\n";
				else
					std::cout << "Installed: no\n";

				if (auto pid = store.running_pid())
				{
					std::cout << "Running: ✓ (PID " << *pid << ")\n";
					auto uptime = store.uptime();
					std::cout << "Uptime: " << (uptime ? format_uptime(*uptime) : "unknown") << "\n";
					if (auto age = store.heartbeat_age())
					{
						std::cout << "Last heartbeat: " << age->count() << "s ago";
						if (store.is_stale(std::chrono::seconds(cfg->daemon.heartbeat_interval_seconds),
										   cfg->daemon.stale_after_missed))
							std::cout << " (stale)";
						std::cout << "\n";
					}
					if (auto st = store.read_status())
					{
						if (!st->active_channels.empty())
						{
							std::string joined;
							for (const auto &c : st->active_channels)
								joined += (joined.empty() ? "" : ", ") + c;
							std::cout << "Channels: " << joined << "\n";
						}
						std::cout << "Active sessions: " << st->active_sessions << "\n";
					}
				}
				else
				{
					std::cout << "Running: no\n";
				}
				std::cout << "Logs: " << cfg->log_file().string() << std::endl;
				return 0;
			}

			if (*d_logs)
			{
				auto path = cfg->log_file();
				std::error_code ec;
				if (!std::filesystem::exists(path, ec))
				{
					std::cerr << "Log file does not exist: " << path.string() << "\n"
							  << "Start the daemon first with: warden daemon start" << std::endl;
					return 1;
				}
				int rc = print_tail(path, log_lines);
				if (rc != 0 || !log_follow)
					return rc;
				return follow_log(path);
			}
		}

		if (*sec_cmd)
		{
			auto audit = std::make_shared<AuditLogger>(cfg->audit_config());
			IntegrityMonitor monitor(cfg->integrity_config(), audit);

			if (*s_status)
			{
				std::cout << "Warden Security Status\n\nConfiguration:\n";
				std::cout << "  Strict mode: " << on_off(cfg->security.strict_mode) << "\n";
				std::cout << "  Rate limiting: " << on_off(cfg->rate_limit.enabled) << " ("
						  << cfg->rate_limit.max_requests << "/" << cfg->rate_limit.window_seconds << "s, burst "
						  << cfg->rate_limit.burst_limit << "/" << cfg->rate_limit.burst_window_seconds << "s)\n";
				std::cout << "  Audit logging: " << on_off(cfg->security.audit_enabled) << "\n";
				std::cout << "  Integrity checks: " << on_off(cfg->integrity.check_on_startup) << "\n";

				auto st = monitor.status();
				std::cout << "\nFile Integrity:\n";
				std::cout << "  Monitored files: " << st.monitored_files << "\n";
				std::cout << "  Tracked files: " << st.tracked_files << "\n";
				if (st.tracked_files > 0)
				{
					auto violations = monitor.verify();
					if (violations.empty())
						std::cout << "  Status: OK\n";
					else
						std::cout << "  Status: " << violations.size() << " violation(s)\n";
				}
				else
				{
					std::cout << "  Status: Not initialized\n";
				}
				std::cout.flush();
				return 0;
			}

			if (*s_init || *s_reset)
			{
				if (*s_reset && !reset_confirm)
				{
					std::cout << "This will reset the integrity baseline to current file states.\n"
							  << "Run with --yes to confirm." << std::endl;
					return 1;
				}
				auto hashes = monitor.initialize();
				if (!hashes)
				{
					std::cerr << hashes.error().what() << std::endl;
					return 1;
				}
				if (*s_reset)
					audit->log_security_event("integrity_reset", {{"files", hashes->size()}}, "warning");
				std::cout << "✓ " << (*s_reset ? "Reset integrity baseline for " : "Initialized ")
						  << hashes->size() << " file(s)" << std::endl;
				for (const auto &[path, hash] : *hashes)
					std::cout << "  • " << std::filesystem::path(path).filename().string() << ": " << short_hash(hash) << "\n";
				std::cout.flush();
				return 0;
			}

			if (*s_verify)
			{
				auto violations = monitor.verify();
				if (violations.empty())
				{
					std::cout << "✓ All files pass integrity check" << std::endl;
					return 0;
				}
				std::cout << "⚠ " << violations.size() << " violation(s) detected:\n";
				for (const auto &v : violations)
					std::cout << "  • " << v.file << ": " << v.describe() << "\n";
				std::cout.flush();
				return 1;
			}

			if (*s_audit)
			{
				auto events = audit->recent_events(audit_limit);
				if (events.empty())
				{
					std::cout << "No audit events found." << std::endl;
					return 0;
				}
				std::cout << "Recent Audit Events (last " << events.size() << ")\n";
				for (const auto &e : events)
				{
					auto ts = e.value("timestamp", std::string{}).substr(0, 19);
					auto actor = e.contains("actor") ? e["actor"].value("user_id", std::string{}) : std::string{};
					auto subject = e.value("subject", std::string{});
					bool ok = e.contains("outcome") ? e["outcome"].value("success", true) : true;
					std::cout << ts << "  " << e.value("event", std::string("unknown")) << "  "
							  << (subject.empty() ? (actor.empty() ? "-" : actor) : subject) << "  "
							  << (ok ? "OK" : "FAIL") << "\n";
				}
				std::cout.flush();
				return 0;
			}

			if (*s_chain)
			{
				auto date = chain_date.empty() ? format_date(system_clock()->now()) : chain_date;
				auto result = audit->verify_chain(date);
				if (!result)
				{
					std::cerr << result.error().what() << std::endl;
					return 1;
				}
				if (result->intact)
				{
					std::cout << "✓ Audit chain intact (" << result->lines << " lines)" << std::endl;
					return 0;
				}
				std::cout << "✗ Audit chain broken at line " << result->first_broken_line.value_or(0)
						  << ": " << result->detail << std::endl;
				return 1;
			}
		}

		std::cout << app.help() << std::endl;
		return 0;
	}

} // namespace warden::cli
