#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/HealthStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::domain {

/**
 * @brief Агрегированные метрики проекции
 *
 * Пересчитываются при каждом успехе или сбое.
 */
struct ProjectionHealthMetric {
    std::string projectionName;
    HealthStatus healthStatus = HealthStatus::HEALTHY;
    int64_t totalEventsProcessed = 0;
    int64_t totalFailures = 0;
    int64_t activeFailures = 0;
    std::optional<Timestamp> lastSuccessAt;
    std::optional<Timestamp> lastFailureAt;
};

} // namespace chronicle::domain
