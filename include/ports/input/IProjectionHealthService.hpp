#pragma once

#include "domain/ProjectionCheckpoint.hpp"
#include "domain/ProjectionFailure.hpp"
#include "domain/ProjectionHealthReport.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chronicle::ports::input {

/**
 * @brief Запросы состояния проекций (только чтение)
 */
class IProjectionHealthService {
public:
    virtual ~IProjectionHealthService() = default;

    /**
     * @brief Здоровье одной проекции
     * @return nullopt если проекция не зарегистрирована и метрик по ней нет
     */
    virtual std::optional<domain::ProjectionHealthReport> getProjectionHealth(
        const std::string& projectionName) = 0;

    virtual std::vector<domain::ProjectionHealthReport> getAllProjectionsHealth() = 0;

    virtual domain::SystemHealthReport getSystemHealth() = 0;

    virtual std::optional<domain::ProjectionCheckpoint> getCheckpoint(const std::string& projectionName) = 0;

    virtual std::vector<domain::ProjectionFailure> getFailures(
        const std::string& projectionName,
        bool includeResolved) = 0;
};

} // namespace chronicle::ports::input
