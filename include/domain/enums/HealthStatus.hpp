#pragma once

#include <cstdint>
#include <string>
#include <stdexcept>

namespace chronicle::domain {

/**
 * @brief Состояние проекции по числу активных (неразрешённых) сбоев
 */
enum class HealthStatus {
    HEALTHY,    ///< 0 активных сбоев
    DEGRADED,   ///< 1-9
    CRITICAL,   ///< 10-49
    OFFLINE     ///< 50 и более
};

inline std::string toString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:  return "healthy";
        case HealthStatus::DEGRADED: return "degraded";
        case HealthStatus::CRITICAL: return "critical";
        case HealthStatus::OFFLINE:  return "offline";
    }
    return "unknown";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline HealthStatus healthStatusFromString(const std::string& str) {
    if (str == "healthy")  return HealthStatus::HEALTHY;
    if (str == "degraded") return HealthStatus::DEGRADED;
    if (str == "critical") return HealthStatus::CRITICAL;
    if (str == "offline")  return HealthStatus::OFFLINE;
    throw std::invalid_argument("Unknown HealthStatus: " + str);
}

/**
 * @brief Вывести статус из числа активных сбоев
 */
inline HealthStatus healthStatusFor(int64_t activeFailures) {
    if (activeFailures <= 0) return HealthStatus::HEALTHY;
    if (activeFailures < 10) return HealthStatus::DEGRADED;
    if (activeFailures < 50) return HealthStatus::CRITICAL;
    return HealthStatus::OFFLINE;
}

} // namespace chronicle::domain
