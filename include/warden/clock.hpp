#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace warden
{
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * Time source injected into every component that reads the wall clock,
     * so tests can move time forward without sleeping.
     */
    class Clock
    {
    public:
        virtual ~Clock() = default;
        virtual TimePoint now() const = 0;
    };

    class SystemClock : public Clock
    {
    public:
        TimePoint now() const override { return std::chrono::system_clock::now(); }
    };

    /** Process-wide system clock instance. */
    std::shared_ptr<Clock> system_clock();

    /** UTC timestamp with millisecond precision, e.g. 2026-01-31T09:15:02.120Z */
    std::string format_iso8601(TimePoint tp);

    /** UTC calendar date, e.g. 2026-01-31 */
    std::string format_date(TimePoint tp);

    /** Parse the output of format_iso8601 (fraction and trailing Z optional). */
    std::optional<TimePoint> parse_iso8601(const std::string &text);

} // namespace warden
