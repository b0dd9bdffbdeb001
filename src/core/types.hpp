#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <compare>
#include <ctime>
#include <sstream>
#include <iomanip>

namespace kioku {

/**
 * SubjectId - identifier of a curriculum subject in the external catalogue.
 */
using SubjectId = int64_t;

/**
 * Timestamp - a point in time, stored as milliseconds since the Unix epoch.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(tp.time_since_epoch().count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * Format as ISO 8601 string (UTC, millisecond precision).
     */
    [[nodiscard]] std::string to_iso_string() const {
        auto time_t = static_cast<std::time_t>(millis_ / 1000);
        std::tm tm{};
        gmtime_r(&time_t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

} // namespace kioku
