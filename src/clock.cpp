#include "warden/clock.hpp"
#include <cstdio>
#include <ctime>
#include <format>

namespace warden
{

    std::shared_ptr<Clock> system_clock()
    {
        static auto instance = std::make_shared<SystemClock>();
        return instance;
    }

    std::string format_iso8601(TimePoint tp)
    {
        auto t = std::chrono::system_clock::to_time_t(tp);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
        if (ms.count() < 0)
            ms += std::chrono::milliseconds(1000);

        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday,
                           tm_buf.tm_hour,
                           tm_buf.tm_min,
                           tm_buf.tm_sec,
                           static_cast<int>(ms.count()));
    }

    std::string format_date(TimePoint tp)
    {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm_buf;
        gmtime_r(&t, &tm_buf);
        return std::format("{:04d}-{:02d}-{:02d}",
                           tm_buf.tm_year + 1900,
                           tm_buf.tm_mon + 1,
                           tm_buf.tm_mday);
    }

    std::optional<TimePoint> parse_iso8601(const std::string &text)
    {
        std::tm tm_buf{};
        int millis = 0;
        int consumed = 0;
        if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                        &tm_buf.tm_year, &tm_buf.tm_mon, &tm_buf.tm_mday,
                        &tm_buf.tm_hour, &tm_buf.tm_min, &tm_buf.tm_sec, &consumed) != 6)
        {
            return std::nullopt;
        }
        auto rest = text.substr(static_cast<std::size_t>(consumed));
        if (!rest.empty() && rest.front() == '.')
        {
            if (std::sscanf(rest.c_str(), ".%3d", &millis) != 1)
                return std::nullopt;
        }

        tm_buf.tm_year -= 1900;
        tm_buf.tm_mon -= 1;
        auto t = timegm(&tm_buf);
        if (t == static_cast<std::time_t>(-1))
            return std::nullopt;
        return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
    }

} // namespace warden
