#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <ctime>

namespace wallet::domain {

/**
 * @brief Момент времени (UTC) с точностью до миллисекунд
 *
 * В БД хранится как BIGINT миллисекунд от эпохи, в JSON - ISO 8601.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    Timestamp() : value(std::chrono::system_clock::now()) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(tp) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::milliseconds(millis)));
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()).count();
    }

    int64_t toUnixSeconds() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            value.time_since_epoch()).count();
    }

    /**
     * @brief ISO 8601: "2025-12-16T10:30:00.125Z"
     */
    std::string toString() const {
        int64_t millis = toUnixMillis();
        std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        int64_t rest = millis % 1000;
        if (rest < 0) {
            rest += 1000;
            --seconds;
        }

        std::tm tm{};
        gmtime_r(&seconds, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << rest << 'Z';
        return ss.str();
    }

    Timestamp plus(std::chrono::milliseconds delta) const {
        return Timestamp(value + delta);
    }

    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace wallet::domain
