#pragma once

#include "domain/Timestamp.hpp"
#include "domain/enums/ResolutionMethod.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::domain {

/**
 * @brief Запрос на повторную прогонку событий через проекцию
 *
 * Диапазон включительный. По умолчанию: от checkpoint + 1 до последнего sequence.
 */
struct ReplayRequest {
    std::string projectionName;
    std::optional<int64_t> fromSequence;
    std::optional<int64_t> toSequence;
    bool skipFailed = false;   ///< пропускать события с активной ошибкой этой проекции
};

struct ReplayResult {
    std::string projectionName;
    int64_t fromSequence = 0;
    int64_t toSequence = 0;
    int64_t eventsReplayed = 0;
    int64_t eventsSkipped = 0;
    int64_t eventsFailed = 0;
    Timestamp startedAt;
    Timestamp completedAt;
    int64_t durationMs = 0;
};

struct ResetResult {
    std::string projectionName;
    int64_t failuresResolved = 0;
    Timestamp resetAt;
};

/**
 * @brief Стратегия ручного разрешения ошибки проекции
 */
enum class ResolveStrategy {
    RETRY,
    SKIP,
    MANUAL_FIX
};

inline std::string toString(ResolveStrategy strategy) {
    switch (strategy) {
        case ResolveStrategy::RETRY:      return "retry";
        case ResolveStrategy::SKIP:       return "skip";
        case ResolveStrategy::MANUAL_FIX: return "manual_fix";
    }
    return "unknown";
}

inline std::optional<ResolveStrategy> resolveStrategyFromString(const std::string& str) {
    if (str == "retry")      return ResolveStrategy::RETRY;
    if (str == "skip")       return ResolveStrategy::SKIP;
    if (str == "manual_fix") return ResolveStrategy::MANUAL_FIX;
    return std::nullopt;
}

struct ResolveResult {
    std::string failureId;
    ResolveStrategy strategy = ResolveStrategy::RETRY;
    bool resolved = false;                       ///< false: retry снова упал, ошибка записана
    std::optional<ResolutionMethod> resolutionMethod;
    std::string message;
};

/**
 * @brief Ошибка операции администрирования
 */
struct AdminError {
    enum class Code {
        PROJECTION_NOT_FOUND,
        FAILURE_NOT_FOUND,
        EVENT_NOT_FOUND,
        ALREADY_RESOLVED,
        INVALID_STRATEGY,
        INVALID_RANGE,
        STORE_UNAVAILABLE
    };

    Code code;
    std::string message;
};

} // namespace chronicle::domain
