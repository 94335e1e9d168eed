#pragma once

#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warden
{
    enum class AuditEventKind
    {
        ToolCall,
        AccessDenied,
        RateLimited,
        SecurityEvent
    };

    std::string to_string(AuditEventKind kind);
    std::optional<AuditEventKind> audit_event_kind_from_string(std::string_view s);

    struct AuditActor
    {
        std::string user_id;
        std::string channel;
        std::string session_key;
    };

    struct AuditOutcome
    {
        bool success{true};
        std::string detail;
    };

    struct AuditEntry
    {
        TimePoint timestamp{};
        AuditEventKind kind{AuditEventKind::SecurityEvent};
        AuditActor actor;
        std::string subject;
        nlohmann::json parameters = nlohmann::json::object();
        AuditOutcome outcome;
        std::string severity{"info"};
        std::string phase; // "invoke" / "result" for tool calls

        /** Serialized form; parameters are emitted as given (redaction happens in the logger). */
        nlohmann::json to_json() const;
    };

    inline constexpr const char *kRedactionMarker = "[REDACTED]";
    inline constexpr std::size_t kMaxParameterStringLength = 500;

    /** Case-insensitive match against the secret-bearing key denylist. */
    bool is_sensitive_key(std::string_view key);

    /**
     * Replace denylisted keys with kRedactionMarker, recursively through nested
     * objects and arrays, and truncate oversized string values.
     */
    nlohmann::json redact_parameters(const nlohmann::json &params);

    /**
     * AuditChain links lines with hashes for tamper detection. Each link is
     * SHA-256 over the previous link followed by the line's serialized JSON.
     */
    class AuditChain
    {
    public:
        AuditChain();

        /** Append a serialized entry, returning its chain hash */
        std::string append(const std::string &serialized);

        /** Restart the chain from a known head (empty for a fresh file) */
        void reset(std::string head);

        /** Last hash in the chain */
        std::optional<std::string> head() const;

        static std::string link(const std::string &previous, const std::string &serialized);

    private:
        std::string head_;
    };

    struct ChainVerification
    {
        bool intact{true};
        std::size_t lines{0};
        std::optional<std::size_t> first_broken_line; // 1-based
        std::string detail;
    };

    /**
     * Append-only JSON Lines audit log, one file per UTC day:
     * <directory>/audit-YYYY-MM-DD.jsonl
     * Lines always go to the file of the day they are written on, so a file
     * is never appended to once its day has passed.
     *
     * record() never throws. When the directory or file cannot be written the
     * logger keeps entries in a bounded in-memory buffer and reports itself
     * unhealthy until flush() manages to persist them.
     */
    class AuditLogger
    {
    public:
        struct Config
        {
            std::filesystem::path directory{"audit"};
            bool enabled{true};
            std::size_t buffer_capacity{1024};
        };

        explicit AuditLogger(Config cfg, std::shared_ptr<Clock> clock = system_clock());
        ~AuditLogger();

        AuditLogger(const AuditLogger &) = delete;
        AuditLogger &operator=(const AuditLogger &) = delete;

        void record(const AuditEntry &entry);

        void log_tool_call(const std::string &tool,
                           const nlohmann::json &params,
                           const AuditActor &actor);

        void log_tool_result(const std::string &tool,
                             const AuditActor &actor,
                             bool success,
                             const std::string &detail,
                             const std::string &result_preview = {});

        void log_access_denied(const AuditActor &actor, const std::string &reason);

        void log_rate_limited(const AuditActor &actor,
                              const std::string &limit_type,
                              const std::string &detail);

        void log_security_event(const std::string &event_type,
                                const nlohmann::json &details,
                                const std::string &severity = "warning",
                                const AuditActor &actor = {});

        void log_integrity_alert(const std::string &file,
                                 const std::string &expected_hash,
                                 const std::string &actual_hash);

        /** Retry buffered entries. Returns true when nothing remains buffered. */
        bool flush();

        /** False while entries are held in memory because storage failed. */
        bool healthy() const;

        std::size_t buffered() const;

        /** Entries discarded because the buffer was full. */
        std::size_t dropped() const;

        std::filesystem::path file_for_date(const std::string &date) const;
        std::filesystem::path current_file() const;

        /** Last `limit` entries of today's file, oldest first. */
        std::vector<nlohmann::json> recent_events(std::size_t limit = 100) const;

        /** Recompute the chain for one day's file. */
        Result<ChainVerification> verify_chain(const std::string &date) const;

        const Config &config() const { return cfg_; }

    private:
        bool write_locked(const nlohmann::json &body);
        bool open_locked(const std::string &date);
        bool flush_locked();
        void buffer_locked(nlohmann::json body);
        void mark_degraded_locked(const std::string &why);

        Config cfg_;
        std::shared_ptr<Clock> clock_;

        mutable std::mutex mutex_;
        std::ofstream stream_;
        std::string open_date_;
        AuditChain chain_;
        std::deque<nlohmann::json> buffer_;
        bool degraded_{false};
        std::size_t dropped_{0};
    };

} // namespace warden
