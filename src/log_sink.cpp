#include "warden/log_sink.hpp"
#include "warden/fs_util.hpp"
#include <spdlog/common.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace warden
{

    RotatingLogSink::RotatingLogSink(std::filesystem::path path, std::size_t max_bytes, std::size_t max_files)
        : path_(std::move(path)), max_bytes_(max_bytes), max_files_(max_files == 0 ? 1 : max_files)
    {
        if (max_bytes_ == 0)
            throw spdlog::spdlog_ex("RotatingLogSink: max_bytes must be greater than zero");

        // file_helper creates missing parent directories
        file_helper_.open(path_.string(), false);
        current_size_ = file_helper_.size();
        if (current_size_ >= max_bytes_)
        {
            rotate_();
            current_size_ = 0;
        }
    }

    void RotatingLogSink::sink_it_(const spdlog::details::log_msg &msg)
    {
        spdlog::memory_buf_t formatted;
        base_sink<std::mutex>::formatter_->format(msg, formatted);

        auto new_size = current_size_ + formatted.size();
        if (new_size > max_bytes_ && current_size_ > 0)
        {
            file_helper_.flush();
            rotate_();
            new_size = formatted.size();
        }
        file_helper_.write(formatted);
        current_size_ = new_size;
    }

    void RotatingLogSink::flush_()
    {
        file_helper_.flush();
    }

    void RotatingLogSink::rotate_()
    {
        file_helper_.close();
        auto rotated = fs::rotate_numbered(path_, max_files_);
        // Reopen even on failure so logging continues into the current file
        file_helper_.reopen(rotated.has_value());
        if (!rotated)
            throw spdlog::spdlog_ex("RotatingLogSink: " + std::string(rotated.error().what()));
    }

    std::shared_ptr<spdlog::logger> configure_logging(const LoggingOptions &options)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        if (options.log_file)
        {
            sinks.push_back(std::make_shared<RotatingLogSink>(*options.log_file, options.max_bytes, options.max_files));
        }

        auto logger = std::make_shared<spdlog::logger>("warden", sinks.begin(), sinks.end());
        auto level = spdlog::level::from_str(options.level);
        if (level == spdlog::level::off && options.level != "off")
            level = spdlog::level::info;
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        spdlog::set_default_logger(logger);
        return logger;
    }

} // namespace warden
