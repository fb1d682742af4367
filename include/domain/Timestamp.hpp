#pragma once

#include <string>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chronicle::domain {

/**
 * @brief Временная метка (UTC, точность до миллисекунд)
 *
 * В PostgreSQL передаётся как epoch-миллисекунды, в JSON как ISO 8601.
 */
struct Timestamp {
    std::chrono::system_clock::time_point value;

    // Всегда усечено до миллисекунд (точность хранения в БД)
    Timestamp() : value(truncate(std::chrono::system_clock::now())) {}

    explicit Timestamp(std::chrono::system_clock::time_point tp) : value(truncate(tp)) {}

    static Timestamp now() {
        return Timestamp(std::chrono::system_clock::now());
    }

    /**
     * @brief Создать Timestamp из ISO 8601 строки
     * @param isoString Строка формата "2025-12-16T10:30:00.250Z" (миллисекунды опциональны)
     */
    static Timestamp fromString(const std::string& isoString) {
        std::tm tm = {};
        std::istringstream ss(isoString);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");

        if (ss.fail()) {
            return Timestamp::now();
        }

        int64_t millis = 0;
        if (ss.peek() == '.') {
            ss.get();
            std::string fraction;
            while (std::isdigit(ss.peek())) {
                fraction.push_back(static_cast<char>(ss.get()));
            }
            fraction = (fraction + "000").substr(0, 3);
            millis = std::stoll(fraction);
        }

        // timegm: строка всегда в UTC
        auto seconds = static_cast<int64_t>(timegm(&tm));
        return fromUnixMillis(seconds * 1000 + millis);
    }

    /**
     * @brief Преобразовать в ISO 8601 строку с миллисекундами
     */
    std::string toString() const {
        auto millis = toUnixMillis();
        std::time_t seconds = static_cast<std::time_t>(millis / 1000);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);

        std::ostringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(3) << std::setfill('0') << (millis % 1000) << 'Z';
        return ss.str();
    }

    int64_t toUnixMillis() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            value.time_since_epoch()
        ).count();
    }

    static Timestamp fromUnixMillis(int64_t millis) {
        return Timestamp(std::chrono::system_clock::time_point(
            std::chrono::milliseconds(millis)
        ));
    }

    Timestamp addSeconds(int64_t seconds) const {
        return Timestamp(value + std::chrono::seconds(seconds));
    }

    Timestamp addMillis(int64_t millis) const {
        return Timestamp(value + std::chrono::milliseconds(millis));
    }

    /**
     * @brief Разница в секундах (this - other)
     */
    int64_t secondsSince(const Timestamp& other) const {
        return std::chrono::duration_cast<std::chrono::seconds>(value - other.value).count();
    }

    static std::chrono::system_clock::time_point truncate(std::chrono::system_clock::time_point tp) {
        return std::chrono::time_point_cast<std::chrono::milliseconds>(tp);
    }

    // Операторы сравнения
    bool operator==(const Timestamp& other) const { return value == other.value; }
    bool operator!=(const Timestamp& other) const { return value != other.value; }
    bool operator<(const Timestamp& other) const { return value < other.value; }
    bool operator>(const Timestamp& other) const { return value > other.value; }
    bool operator<=(const Timestamp& other) const { return value <= other.value; }
    bool operator>=(const Timestamp& other) const { return value >= other.value; }
};

} // namespace chronicle::domain
