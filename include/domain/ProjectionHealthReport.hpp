#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/HealthStatus.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::domain {

/**
 * @brief Состояние одной проекции с отставанием от журнала
 */
struct ProjectionHealthReport {
    std::string projectionName;
    HealthStatus healthStatus = HealthStatus::HEALTHY;
    int64_t totalEventsProcessed = 0;
    int64_t totalFailures = 0;
    int64_t activeFailures = 0;
    std::optional<Timestamp> lastSuccessAt;
    std::optional<Timestamp> lastFailureAt;

    std::optional<int64_t> lastEventSequence;   ///< из checkpoint
    std::optional<int64_t> lagEvents;           ///< пусто, если журнал недоступен
    std::optional<double> lagSeconds;
};

/**
 * @brief Сводка по всем проекциям
 *
 * overallStatus: critical если есть critical/offline проекция,
 * degraded если есть degraded, иначе healthy.
 */
struct SystemHealthReport {
    HealthStatus overallStatus = HealthStatus::HEALTHY;
    std::vector<ProjectionHealthReport> projections;
    int totalProjections = 0;
    int healthyCount = 0;
    int degradedCount = 0;
    int criticalCount = 0;
    int offlineCount = 0;
    int64_t totalActiveFailures = 0;
    int64_t totalEventsProcessed = 0;
    Timestamp checkedAt;
};

} // namespace chronicle::domain
