#include "warden/audit.hpp"
#include "warden/crypto.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace warden
{

    namespace
    {
        constexpr std::array<std::string_view, 9> kSensitiveKeys{
            "password", "passwd", "token", "secret", "api_key",
            "apikey", "credential", "private_key", "authorization"};

        std::string dump_line(const nlohmann::json &j)
        {
            return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }

        std::string lowercase(std::string_view s)
        {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return out;
        }

        std::optional<std::string> last_chain_hash(const std::filesystem::path &path)
        {
            std::ifstream in(path);
            if (!in.is_open())
                return std::nullopt;

            std::string line;
            std::string last;
            while (std::getline(in, line))
            {
                if (!line.empty())
                    last = line;
            }
            if (last.empty())
                return std::nullopt;

            auto parsed = nlohmann::json::parse(last, nullptr, false);
            if (parsed.is_discarded() || !parsed.contains("chain_hash") || !parsed["chain_hash"].is_string())
                return std::nullopt;
            return parsed["chain_hash"].get<std::string>();
        }
    } // namespace

    std::string to_string(AuditEventKind kind)
    {
        switch (kind)
        {
        case AuditEventKind::ToolCall:
            return "tool_call";
        case AuditEventKind::AccessDenied:
            return "access_denied";
        case AuditEventKind::RateLimited:
            return "rate_limited";
        case AuditEventKind::SecurityEvent:
            return "security_event";
        }
        return "security_event";
    }

    std::optional<AuditEventKind> audit_event_kind_from_string(std::string_view s)
    {
        if (s == "tool_call")
            return AuditEventKind::ToolCall;
        if (s == "access_denied")
            return AuditEventKind::AccessDenied;
        if (s == "rate_limited")
            return AuditEventKind::RateLimited;
        if (s == "security_event")
            return AuditEventKind::SecurityEvent;
        return std::nullopt;
    }

    nlohmann::json AuditEntry::to_json() const
    {
        nlohmann::json j{{"timestamp", format_iso8601(timestamp)},
                         {"event", to_string(kind)},
                         {"actor", {{"user_id", actor.user_id},
                                    {"channel", actor.channel},
                                    {"session_key", actor.session_key}}},
                         {"subject", subject},
                         {"parameters", parameters},
                         {"outcome", {{"success", outcome.success}, {"detail", outcome.detail}}},
                         {"severity", severity}};
        if (!phase.empty())
            j["phase"] = phase;
        return j;
    }

    bool is_sensitive_key(std::string_view key)
    {
        auto lowered = lowercase(key);
        return std::any_of(kSensitiveKeys.begin(), kSensitiveKeys.end(),
                           [&](std::string_view s)
                           { return lowered.find(s) != std::string::npos; });
    }

    nlohmann::json redact_parameters(const nlohmann::json &params)
    {
        if (params.is_object())
        {
            nlohmann::json out = nlohmann::json::object();
            for (auto it = params.begin(); it != params.end(); ++it)
            {
                if (is_sensitive_key(it.key()))
                    out[it.key()] = kRedactionMarker;
                else
                    out[it.key()] = redact_parameters(it.value());
            }
            return out;
        }
        if (params.is_array())
        {
            nlohmann::json out = nlohmann::json::array();
            for (const auto &item : params)
                out.push_back(redact_parameters(item));
            return out;
        }
        if (params.is_string())
        {
            const auto &s = params.get_ref<const std::string &>();
            if (s.size() > kMaxParameterStringLength)
                return s.substr(0, kMaxParameterStringLength) + "...[truncated]";
        }
        return params;
    }

    // ============================================================================
    // AuditChain
    // ============================================================================

    AuditChain::AuditChain() = default;

    std::string AuditChain::link(const std::string &previous, const std::string &serialized)
    {
        return crypto::SHA256::hex_digest(previous + serialized);
    }

    std::string AuditChain::append(const std::string &serialized)
    {
        head_ = link(head_, serialized);
        return head_;
    }

    void AuditChain::reset(std::string head)
    {
        head_ = std::move(head);
    }

    std::optional<std::string> AuditChain::head() const
    {
        if (head_.empty())
            return std::nullopt;
        return head_;
    }

    // ============================================================================
    // AuditLogger
    // ============================================================================

    AuditLogger::AuditLogger(Config cfg, std::shared_ptr<Clock> clock)
        : cfg_(std::move(cfg)), clock_(std::move(clock))
    {
    }

    AuditLogger::~AuditLogger()
    {
        std::lock_guard lock(mutex_);
        if (!buffer_.empty())
        {
            flush_locked();
            if (!buffer_.empty())
                spdlog::error("Audit logger closing with {} unwritten entries", buffer_.size());
        }
    }

    void AuditLogger::record(const AuditEntry &entry)
    {
        if (!cfg_.enabled)
            return;

        nlohmann::json body;
        try
        {
            AuditEntry copy = entry;
            if (copy.timestamp == TimePoint{})
                copy.timestamp = clock_->now();
            copy.parameters = redact_parameters(entry.parameters);
            body = copy.to_json();
        }
        catch (const std::exception &e)
        {
            spdlog::error("Failed to serialize audit entry for {}: {}", entry.subject, e.what());
            return;
        }

        std::lock_guard lock(mutex_);
        if (degraded_ && !flush_locked())
        {
            buffer_locked(std::move(body));
            return;
        }
        if (!write_locked(body))
            buffer_locked(std::move(body));
    }

    bool AuditLogger::open_locked(const std::string &date)
    {
        if (stream_.is_open() && open_date_ == date)
            return true;

        if (stream_.is_open())
            stream_.close();
        open_date_.clear();

        std::error_code ec;
        std::filesystem::create_directories(cfg_.directory, ec);
        if (ec)
        {
            mark_degraded_locked(std::format("cannot create {}: {}", cfg_.directory.string(), ec.message()));
            return false;
        }

        auto path = file_for_date(date);
        chain_.reset(last_chain_hash(path).value_or(""));

        stream_.open(path, std::ios::out | std::ios::app);
        if (!stream_.is_open())
        {
            mark_degraded_locked("cannot open " + path.string());
            return false;
        }
        open_date_ = date;
        spdlog::debug("Audit log now writing to {}", path.string());
        return true;
    }

    bool AuditLogger::write_locked(const nlohmann::json &body)
    {
        if (!open_locked(format_date(clock_->now())))
            return false;

        auto serialized = dump_line(body);
        auto hash = AuditChain::link(chain_.head().value_or(""), serialized);

        nlohmann::json line = body;
        line["chain_hash"] = hash;

        stream_ << dump_line(line) << '\n';
        stream_.flush();
        if (!stream_)
        {
            stream_.close();
            open_date_.clear();
            mark_degraded_locked("write failed");
            return false;
        }
        chain_.reset(hash);
        return true;
    }

    bool AuditLogger::flush_locked()
    {
        while (!buffer_.empty())
        {
            if (!write_locked(buffer_.front()))
                return false;
            buffer_.pop_front();
        }
        if (degraded_)
        {
            degraded_ = false;
            spdlog::info("Audit log storage recovered");
        }
        if (stream_.is_open())
            stream_.flush();
        return true;
    }

    void AuditLogger::buffer_locked(nlohmann::json body)
    {
        if (cfg_.buffer_capacity == 0)
        {
            ++dropped_;
            return;
        }
        if (buffer_.size() >= cfg_.buffer_capacity)
        {
            buffer_.pop_front();
            ++dropped_;
        }
        buffer_.push_back(std::move(body));
    }

    void AuditLogger::mark_degraded_locked(const std::string &why)
    {
        if (!degraded_)
        {
            spdlog::warn("Audit log storage unavailable ({}); buffering entries in memory", why);
        }
        degraded_ = true;
    }

    bool AuditLogger::flush()
    {
        std::lock_guard lock(mutex_);
        return flush_locked();
    }

    bool AuditLogger::healthy() const
    {
        std::lock_guard lock(mutex_);
        return !degraded_;
    }

    std::size_t AuditLogger::buffered() const
    {
        std::lock_guard lock(mutex_);
        return buffer_.size();
    }

    std::size_t AuditLogger::dropped() const
    {
        std::lock_guard lock(mutex_);
        return dropped_;
    }

    std::filesystem::path AuditLogger::file_for_date(const std::string &date) const
    {
        return cfg_.directory / ("audit-" + date + ".jsonl");
    }

    std::filesystem::path AuditLogger::current_file() const
    {
        return file_for_date(format_date(clock_->now()));
    }

    void AuditLogger::log_tool_call(const std::string &tool,
                                    const nlohmann::json &params,
                                    const AuditActor &actor)
    {
        AuditEntry entry;
        entry.timestamp = clock_->now();
        entry.kind = AuditEventKind::ToolCall;
        entry.actor = actor;
        entry.subject = tool;
        entry.parameters = params.is_null() ? nlohmann::json::object() : params;
        entry.phase = "invoke";
        record(entry);
    }

    void AuditLogger::log_tool_result(const std::string &tool,
                                      const AuditActor &actor,
                                      bool success,
                                      const std::string &detail,
                                      const std::string &result_preview)
    {
        AuditEntry entry;
        entry.timestamp = clock_->now();
        entry.kind = AuditEventKind::ToolCall;
        entry.actor = actor;
        entry.subject = tool;
        entry.outcome = {success, detail};
        entry.severity = success ? "info" : "warning";
        entry.phase = "result";
        if (!result_preview.empty())
            entry.parameters["result_preview"] = result_preview.substr(0, 200);
        record(entry);
    }

    void AuditLogger::log_access_denied(const AuditActor &actor, const std::string &reason)
    {
        AuditEntry entry;
        entry.timestamp = clock_->now();
        entry.kind = AuditEventKind::AccessDenied;
        entry.actor = actor;
        entry.subject = actor.channel;
        entry.outcome = {false, reason};
        entry.severity = "warning";
        record(entry);
        spdlog::warn("AUDIT: Access denied for {} on {}: {}", actor.user_id, actor.channel, reason);
    }

    void AuditLogger::log_rate_limited(const AuditActor &actor,
                                       const std::string &limit_type,
                                       const std::string &detail)
    {
        AuditEntry entry;
        entry.timestamp = clock_->now();
        entry.kind = AuditEventKind::RateLimited;
        entry.actor = actor;
        entry.subject = "rate_limit";
        entry.parameters["limit_type"] = limit_type;
        entry.outcome = {false, detail};
        entry.severity = "warning";
        record(entry);
    }

    void AuditLogger::log_security_event(const std::string &event_type,
                                         const nlohmann::json &details,
                                         const std::string &severity,
                                         const AuditActor &actor)
    {
        AuditEntry entry;
        entry.timestamp = clock_->now();
        entry.kind = AuditEventKind::SecurityEvent;
        entry.actor = actor;
        entry.subject = event_type;
        entry.parameters = details.is_object() ? details : nlohmann::json{{"details", details}};
        entry.outcome = {severity == "info", event_type};
        entry.severity = severity;
        record(entry);

        auto message = std::format("AUDIT: Security event [{}]: {}", event_type, dump_line(redact_parameters(details)));
        if (severity == "critical")
            spdlog::critical(message);
        else if (severity == "error")
            spdlog::error(message);
        else if (severity == "info")
            spdlog::info(message);
        else
            spdlog::warn(message);
    }

    void AuditLogger::log_integrity_alert(const std::string &file,
                                          const std::string &expected_hash,
                                          const std::string &actual_hash)
    {
        log_security_event("integrity_violation",
                           {{"file", file},
                            {"expected_hash", expected_hash},
                            {"actual_hash", actual_hash}},
                           "error");
    }

    std::vector<nlohmann::json> AuditLogger::recent_events(std::size_t limit) const
    {
        std::vector<nlohmann::json> events;
        std::ifstream in(current_file());
        if (!in.is_open())
            return events;

        std::string line;
        while (std::getline(in, line))
        {
            if (line.empty())
                continue;
            auto parsed = nlohmann::json::parse(line, nullptr, false);
            if (parsed.is_discarded())
            {
                spdlog::warn("Skipping unparseable audit line in {}", current_file().string());
                continue;
            }
            events.push_back(std::move(parsed));
        }

        if (events.size() > limit)
            events.erase(events.begin(), events.end() - static_cast<std::ptrdiff_t>(limit));
        return events;
    }

    Result<ChainVerification> AuditLogger::verify_chain(const std::string &date) const
    {
        auto path = file_for_date(date);
        std::ifstream in(path);
        if (!in.is_open())
        {
            return std::unexpected(WardenError::not_found("No audit log for " + date));
        }

        ChainVerification result;
        std::string previous;
        std::string line;
        while (std::getline(in, line))
        {
            if (line.empty())
                continue;
            ++result.lines;

            auto parsed = nlohmann::json::parse(line, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("chain_hash") ||
                !parsed["chain_hash"].is_string())
            {
                result.intact = false;
                result.first_broken_line = result.lines;
                result.detail = "line is not a chained audit entry";
                return result;
            }

            auto recorded = parsed["chain_hash"].get<std::string>();
            parsed.erase("chain_hash");
            auto expected = AuditChain::link(previous, dump_line(parsed));
            if (recorded != expected)
            {
                result.intact = false;
                result.first_broken_line = result.lines;
                result.detail = std::format("chain hash mismatch (expected {}, recorded {})",
                                            expected.substr(0, 16), recorded.substr(0, 16));
                return result;
            }
            previous = recorded;
        }
        return result;
    }

} // namespace warden
