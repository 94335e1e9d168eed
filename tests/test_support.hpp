#pragma once

#include "warden/clock.hpp"
#include "warden/process.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <set>
#include <string>

namespace warden::testing
{

    class FakeClock : public Clock
    {
    public:
        // 2026-03-14T12:00:00Z
        explicit FakeClock(TimePoint start = TimePoint(std::chrono::seconds(1773489600))) : now_(start) {}

        TimePoint now() const override
        {
            std::lock_guard lock(mutex_);
            return now_;
        }

        void advance(std::chrono::system_clock::duration d)
        {
            std::lock_guard lock(mutex_);
            now_ += d;
        }

        void set(TimePoint tp)
        {
            std::lock_guard lock(mutex_);
            now_ = tp;
        }

    private:
        mutable std::mutex mutex_;
        TimePoint now_;
    };

    /** Process table where only the listed pids exist. */
    class FakeProcessProbe : public ProcessProbe
    {
    public:
        explicit FakeProcessProbe(int self = 4242) : self_(self) { alive_.insert(self); }

        int current_pid() const override { return self_; }

        bool is_alive(int pid) const override
        {
            std::lock_guard lock(mutex_);
            return alive_.count(pid) > 0;
        }

        Result<void> terminate(int pid) const override
        {
            std::lock_guard lock(mutex_);
            if (alive_.erase(pid) == 0)
                return std::unexpected(WardenError::not_running("no such process"));
            return {};
        }

        void spawn(int pid)
        {
            std::lock_guard lock(mutex_);
            alive_.insert(pid);
        }

        void kill(int pid)
        {
            std::lock_guard lock(mutex_);
            alive_.erase(pid);
        }

    private:
        int self_;
        mutable std::mutex mutex_;
        mutable std::set<int> alive_;
    };

    /** Unique directory under the system temp dir, removed on destruction. */
    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() /
                    ("warden-test-" + std::to_string(rd()) + "-" + std::to_string(counter_++));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                         std::filesystem::perm_options::add, ec);
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }
        std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

    private:
        static inline std::atomic<int> counter_{0};
        std::filesystem::path path_;
    };

    inline void write_text(const std::filesystem::path &path, const std::string &text)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }

    inline std::string read_text(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

} // namespace warden::testing
