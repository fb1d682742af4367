#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/ResolutionMethod.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::domain {

/**
 * @brief Сбой обработки события проекцией
 *
 * Одна запись на пару (eventId, projectionName), обновляется при повторах.
 * Активна, пока resolvedAt пуст.
 */
struct ProjectionFailure {
    std::string id;
    std::string eventId;
    std::string eventType;
    std::string projectionName;
    std::string errorMessage;
    std::string errorTrace;
    int retryCount = 0;
    int maxRetries = 5;
    Timestamp failedAt;
    std::optional<Timestamp> nextRetryAt;
    std::optional<Timestamp> resolvedAt;
    std::optional<ResolutionMethod> resolutionMethod;

    bool isActive() const { return !resolvedAt.has_value(); }

    bool isDueForRetry(const Timestamp& now) const {
        return isActive() && nextRetryAt.has_value() &&
               *nextRetryAt <= now && retryCount < maxRetries;
    }
};

} // namespace chronicle::domain
