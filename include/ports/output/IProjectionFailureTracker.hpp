#pragma once

#include "domain/DomainEvent.hpp"
#include "domain/ProjectionCheckpoint.hpp"
#include "domain/ProjectionFailure.hpp"
#include "domain/ProjectionHealthMetric.hpp"
#include "domain/enums/ResolutionMethod.hpp"
#include <optional>
#include <string>
#include <vector>

namespace chronicle::ports::output {

/**
 * @brief Учёт сбоев проекций, checkpoint-ов и метрик здоровья
 *
 * Реализуется PostgresProjectionFailureTracker и InMemoryProjectionFailureTracker.
 * Ошибки хранилища пробрасываются исключениями (std::exception).
 */
class IProjectionFailureTracker {
public:
    virtual ~IProjectionFailureTracker() = default;

    /**
     * @brief Зафиксировать сбой (upsert по паре eventId + projectionName)
     *
     * Новая или ранее разрешённая пара: retryCount = 0.
     * Активная пара: retryCount + 1.
     * nextRetryAt пуст, когда retryCount >= maxRetries.
     *
     * @return ID записи сбоя
     */
    virtual std::string recordFailure(
        const domain::DomainEvent& event,
        const std::string& projectionName,
        const std::string& errorMessage,
        const std::string& errorTrace) = 0;

    /**
     * @brief Продвинуть checkpoint и закрыть сбой по этому событию
     */
    virtual void recordSuccess(
        const domain::DomainEvent& event,
        const std::string& projectionName,
        domain::ResolutionMethod method = domain::ResolutionMethod::AUTO_RETRY) = 0;

    /**
     * @brief Активные сбои с nextRetryAt <= now, по возрастанию nextRetryAt
     */
    virtual std::vector<domain::ProjectionFailure> getFailuresDueForRetry() = 0;

    virtual std::optional<domain::ProjectionCheckpoint> getCheckpoint(const std::string& projectionName) = 0;

    /**
     * @param projectionName пусто - метрики всех проекций
     */
    virtual std::vector<domain::ProjectionHealthMetric> getHealthMetrics(
        const std::optional<std::string>& projectionName) = 0;

    /**
     * @brief История сбоев, новые первыми (с разрешёнными - не более 100)
     */
    virtual std::vector<domain::ProjectionFailure> getFailures(
        const std::string& projectionName,
        bool includeResolved) = 0;

    virtual std::optional<domain::ProjectionFailure> findFailure(const std::string& failureId) = 0;

    /**
     * @return false если сбой не найден или уже разрешён
     */
    virtual bool resolveFailure(const std::string& failureId, domain::ResolutionMethod method) = 0;

    /**
     * @brief Удалить checkpoint, закрыть активные сбои (MANUAL_RESET), пересчитать здоровье
     * @return Количество закрытых сбоев
     */
    virtual int64_t resetProjection(const std::string& projectionName) = 0;
};

} // namespace chronicle::ports::output
