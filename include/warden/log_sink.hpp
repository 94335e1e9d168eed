#pragma once

#include <spdlog/details/file_helper.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/base_sink.h>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace warden
{

    inline constexpr std::size_t kDefaultLogMaxBytes = 10 * 1024 * 1024;
    inline constexpr std::size_t kDefaultLogMaxFiles = 3;

    /**
     * spdlog sink for the daemon's operational log. When a write would push
     * the file past max_bytes it is renamed to <path>.1, older rotations shift
     * up by one and anything beyond <path>.<max_files> is discarded.
     */
    class RotatingLogSink final : public spdlog::sinks::base_sink<std::mutex>
    {
    public:
        RotatingLogSink(std::filesystem::path path,
                        std::size_t max_bytes = kDefaultLogMaxBytes,
                        std::size_t max_files = kDefaultLogMaxFiles);

        const std::filesystem::path &path() const { return path_; }

    protected:
        void sink_it_(const spdlog::details::log_msg &msg) override;
        void flush_() override;

    private:
        void rotate_();

        std::filesystem::path path_;
        std::size_t max_bytes_;
        std::size_t max_files_;
        std::size_t current_size_{0};
        spdlog::details::file_helper file_helper_;
    };

    struct LoggingOptions
    {
        std::string level{"info"};
        std::optional<std::filesystem::path> log_file;
        std::size_t max_bytes{kDefaultLogMaxBytes};
        std::size_t max_files{kDefaultLogMaxFiles};
    };

    /**
     * Install the process-wide default logger: colored stderr, plus the
     * rotating daemon log when a file is given. Unknown levels fall back to info.
     */
    std::shared_ptr<spdlog::logger> configure_logging(const LoggingOptions &options);

} // namespace warden
