#include "warden/integrity.hpp"
#include "warden/crypto.hpp"
#include "warden/fs_util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <format>

namespace warden
{

    namespace
    {
        std::string short_hash(const std::string &hash)
        {
            return hash.substr(0, 16) + "...";
        }

        std::string modified_time(const std::filesystem::path &path)
        {
            std::error_code ec;
            auto ftime = std::filesystem::last_write_time(path, ec);
            if (ec)
                return {};
            auto sys = std::chrono::file_clock::to_sys(ftime);
            return format_iso8601(std::chrono::time_point_cast<std::chrono::system_clock::duration>(sys));
        }
    } // namespace

    const char *IntegrityViolation::describe() const
    {
        switch (kind)
        {
        case Kind::Deleted:
            return "deleted";
        case Kind::Unreadable:
            return "unreadable";
        case Kind::Modified:
            break;
        }
        return "modified";
    }

    nlohmann::json FileHash::to_json() const
    {
        return nlohmann::json{{"path", path},
                              {"hash", hash},
                              {"size", size},
                              {"modified", modified},
                              {"recorded_at", recorded_at}};
    }

    Result<FileHash> FileHash::from_json(const nlohmann::json &j)
    {
        if (!j.is_object() || !j.contains("path") || !j.contains("hash") ||
            !j["path"].is_string() || !j["hash"].is_string())
        {
            return std::unexpected(WardenError::validation("Baseline entry missing path or hash"));
        }
        FileHash fh;
        fh.path = j["path"].get<std::string>();
        fh.hash = j["hash"].get<std::string>();
        fh.size = j.value("size", std::uintmax_t{0});
        fh.modified = j.value("modified", std::string{});
        fh.recorded_at = j.value("recorded_at", std::string{});
        return fh;
    }

    IntegrityMonitor::IntegrityMonitor(Config cfg,
                                       std::shared_ptr<AuditLogger> audit,
                                       std::shared_ptr<Clock> clock)
        : cfg_(std::move(cfg)), audit_(std::move(audit)), clock_(std::move(clock))
    {
        load_baseline();
    }

    void IntegrityMonitor::load_baseline()
    {
        auto contents = fs::read_file(cfg_.baseline_path);
        if (!contents)
        {
            if (contents.error().code != ErrorCode::NotFound)
                spdlog::warn("Failed to load integrity hashes: {}", contents.error().what());
            return;
        }

        auto data = nlohmann::json::parse(*contents, nullptr, false);
        if (data.is_discarded() || !data.is_object())
        {
            spdlog::warn("Integrity baseline {} is not valid JSON; treating as empty", cfg_.baseline_path.string());
            return;
        }

        for (auto it = data.begin(); it != data.end(); ++it)
        {
            auto entry = FileHash::from_json(it.value());
            if (!entry)
            {
                spdlog::warn("Skipping baseline entry {}: {}", it.key(), entry.error().what());
                continue;
            }
            baseline_[it.key()] = std::move(*entry);
        }
        spdlog::debug("Loaded {} integrity baseline entries", baseline_.size());
    }

    Result<void> IntegrityMonitor::save_baseline_locked() const
    {
        nlohmann::json data = nlohmann::json::object();
        for (const auto &[path, entry] : baseline_)
            data[path] = entry.to_json();
        return fs::atomic_write_file(cfg_.baseline_path, data.dump(2) + "\n");
    }

    Result<FileHash> IntegrityMonitor::hash_entry(const std::filesystem::path &path) const
    {
        auto digest = crypto::SHA256::hash_file(path);
        if (!digest)
            return std::unexpected(digest.error());

        FileHash fh;
        fh.path = path.string();
        fh.hash = crypto::SHA256::to_hex(*digest);
        std::error_code ec;
        fh.size = std::filesystem::file_size(path, ec);
        if (ec)
            fh.size = 0;
        fh.modified = modified_time(path);
        fh.recorded_at = format_iso8601(clock_->now());
        return fh;
    }

    std::vector<std::filesystem::path> IntegrityMonitor::monitored_files() const
    {
        std::vector<std::filesystem::path> out;
        for (const auto &path : cfg_.files)
        {
            std::error_code ec;
            if (std::filesystem::is_regular_file(path, ec))
                out.push_back(path);
        }
        return out;
    }

    Result<std::map<std::string, std::string>> IntegrityMonitor::initialize()
    {
        std::map<std::string, FileHash> fresh;
        std::map<std::string, std::string> hashes;
        for (const auto &path : monitored_files())
        {
            auto entry = hash_entry(path);
            if (!entry)
            {
                spdlog::error("Failed to hash {}: {}", path.string(), entry.error().what());
                continue;
            }
            spdlog::info("Initialized integrity hash for {}: {}", path.filename().string(), short_hash(entry->hash));
            hashes[entry->path] = entry->hash;
            fresh[entry->path] = std::move(*entry);
        }

        std::lock_guard lock(mutex_);
        baseline_ = std::move(fresh);
        if (auto saved = save_baseline_locked(); !saved)
            return std::unexpected(saved.error());
        return hashes;
    }

    std::vector<IntegrityViolation> IntegrityMonitor::verify()
    {
        std::vector<IntegrityViolation> violations;
        if (!cfg_.enabled)
            return violations;

        std::map<std::string, FileHash> snapshot;
        {
            std::lock_guard lock(mutex_);
            snapshot = baseline_;
        }

        for (const auto &path : cfg_.files)
        {
            auto it = snapshot.find(path.string());
            if (it == snapshot.end())
            {
                spdlog::debug("File not tracked: {}", path.filename().string());
                continue;
            }

            auto digest = crypto::SHA256::hash_file(path);
            if (!digest && digest.error().code != ErrorCode::NotFound)
            {
                violations.push_back({it->first, it->second.hash, std::nullopt,
                                      IntegrityViolation::Kind::Unreadable, digest.error().what()});
                spdlog::error("INTEGRITY: Monitored file unreadable: {} ({})",
                              path.filename().string(), digest.error().what());
            }
            else if (!digest)
            {
                violations.push_back({it->first, it->second.hash, std::nullopt,
                                      IntegrityViolation::Kind::Deleted, {}});
                spdlog::error("INTEGRITY: Monitored file deleted: {}", path.filename().string());
            }
            else if (auto actual = crypto::SHA256::to_hex(*digest); actual != it->second.hash)
            {
                violations.push_back({it->first, it->second.hash, actual,
                                      IntegrityViolation::Kind::Modified, {}});
                spdlog::error("INTEGRITY: File modified: {} (expected {}, got {})",
                              path.filename().string(), short_hash(it->second.hash), short_hash(actual));
            }
        }

        for (const auto &v : violations)
        {
            if (audit_)
                audit_->log_integrity_alert(v.file, v.expected_hash,
                                            v.actual_hash.value_or(v.unreadable() ? "UNREADABLE" : "DELETED"));
            if (callback_)
                callback_(v);
        }
        return violations;
    }

    Result<std::string> IntegrityMonitor::update_hash(const std::filesystem::path &path)
    {
        auto entry = hash_entry(path);
        if (!entry)
            return std::unexpected(entry.error());

        auto hash = entry->hash;
        std::lock_guard lock(mutex_);
        baseline_[entry->path] = std::move(*entry);
        if (auto saved = save_baseline_locked(); !saved)
            return std::unexpected(saved.error());
        spdlog::info("Updated integrity hash for {}: {}", path.filename().string(), short_hash(hash));
        return hash;
    }

    void IntegrityMonitor::on_violation(ViolationCallback callback)
    {
        callback_ = std::move(callback);
    }

    IntegrityStatus IntegrityMonitor::status() const
    {
        IntegrityStatus st;
        st.enabled = cfg_.enabled;
        st.monitored_files = monitored_files().size();
        std::lock_guard lock(mutex_);
        st.tracked_files = baseline_.size();
        for (const auto &[path, entry] : baseline_)
            st.files.push_back(entry);
        return st;
    }

    bool IntegrityMonitor::has_baseline() const
    {
        std::lock_guard lock(mutex_);
        return !baseline_.empty();
    }

} // namespace warden
