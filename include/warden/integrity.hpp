#pragma once

#include "audit.hpp"
#include "clock.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden
{

    struct FileHash
    {
        std::string path;
        std::string hash; // hex SHA-256
        std::uintmax_t size{0};
        std::string modified;
        std::string recorded_at;

        nlohmann::json to_json() const;
        static Result<FileHash> from_json(const nlohmann::json &j);
    };

    struct IntegrityViolation
    {
        enum class Kind
        {
            Modified,
            Deleted,
            Unreadable
        };

        std::string file;
        std::string expected_hash;
        std::optional<std::string> actual_hash; // set only for Modified
        Kind kind{Kind::Modified};
        std::string detail;

        bool deleted() const { return kind == Kind::Deleted; }
        bool unreadable() const { return kind == Kind::Unreadable; }

        /** "modified", "deleted" or "unreadable". */
        const char *describe() const;
    };

    struct IntegrityStatus
    {
        bool enabled{true};
        std::size_t monitored_files{0};
        std::size_t tracked_files{0};
        std::vector<FileHash> files;
    };

    /**
     * SHA-256 baseline for a fixed set of configuration files.
     *
     * The baseline is only replaced by initialize() or a single update_hash();
     * verify() reports differences and never touches file content.
     */
    class IntegrityMonitor
    {
    public:
        struct Config
        {
            bool enabled{true};
            std::vector<std::filesystem::path> files;
            std::filesystem::path baseline_path{"security/integrity_hashes.json"};
        };

        using ViolationCallback = std::function<void(const IntegrityViolation &)>;

        explicit IntegrityMonitor(Config cfg,
                                  std::shared_ptr<AuditLogger> audit = nullptr,
                                  std::shared_ptr<Clock> clock = system_clock());

        /** Hash every configured file that exists and persist, replacing the old baseline. */
        Result<std::map<std::string, std::string>> initialize();

        /**
         * Compare the configured files against the baseline. A tracked file
         * that exists but cannot be hashed is reported as Unreadable.
         */
        std::vector<IntegrityViolation> verify();

        /** Re-hash one file after an authorized edit. Other entries are untouched. */
        Result<std::string> update_hash(const std::filesystem::path &path);

        /** Registered callback fires once per violation on every verify(). */
        void on_violation(ViolationCallback callback);

        IntegrityStatus status() const;

        bool has_baseline() const;

        /** Configured files that currently exist. */
        std::vector<std::filesystem::path> monitored_files() const;

        const Config &config() const { return cfg_; }

    private:
        Result<FileHash> hash_entry(const std::filesystem::path &path) const;
        void load_baseline();
        Result<void> save_baseline_locked() const;

        Config cfg_;
        std::shared_ptr<AuditLogger> audit_;
        std::shared_ptr<Clock> clock_;
        ViolationCallback callback_;

        mutable std::mutex mutex_;
        std::map<std::string, FileHash> baseline_;
    };

} // namespace warden
