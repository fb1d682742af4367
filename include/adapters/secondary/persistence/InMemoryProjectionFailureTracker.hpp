#pragma once

#include "domain/RetrySchedule.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IProjectionFailureTracker.hpp"
#include "settings/IFailureTrackerSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace chronicle::adapters::secondary {

/**
 * @brief In-memory трекер сбоев проекций
 *
 * Та же семантика, что у PostgresProjectionFailureTracker:
 * upsert сбоя по (eventId, projectionName), монотонный checkpoint,
 * пересчёт здоровья по числу активных сбоев.
 */
class InMemoryProjectionFailureTracker : public ports::output::IProjectionFailureTracker {
public:
    InMemoryProjectionFailureTracker(
        std::shared_ptr<settings::IFailureTrackerSettings> settings,
        std::shared_ptr<ports::output::IClock> clock)
        : schedule_(settings->getBackoffSeconds(), settings->getMaxRetries())
        , clock_(std::move(clock))
    {}

    std::string recordFailure(
        const domain::DomainEvent& event,
        const std::string& projectionName,
        const std::string& errorMessage,
        const std::string& errorTrace) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();
        bool opened = false;

        auto key = std::make_pair(event.eventId, projectionName);
        auto idIt = byEventAndProjection_.find(key);

        if (idIt == byEventAndProjection_.end()) {
            domain::ProjectionFailure failure;
            failure.id = utils::UuidGenerator::generate();
            failure.eventId = event.eventId;
            failure.projectionName = projectionName;
            failure.retryCount = 0;
            idIt = byEventAndProjection_.emplace(key, failure.id).first;
            failures_[failure.id] = failure;
            opened = true;
        }

        auto& failure = failures_[idIt->second];
        if (!opened) {
            if (failure.isActive()) {
                ++failure.retryCount;
            } else {
                // Повторный сбой после разрешения - новый цикл повторов
                failure.retryCount = 0;
                failure.resolvedAt.reset();
                failure.resolutionMethod.reset();
                opened = true;
            }
        }

        failure.eventType = event.eventType;
        failure.errorMessage = errorMessage;
        failure.errorTrace = errorTrace;
        failure.maxRetries = schedule_.maxRetries();
        failure.failedAt = now;

        auto delay = schedule_.nextDelay(failure.retryCount);
        if (delay) {
            failure.nextRetryAt = now.addSeconds(delay->count());
        } else {
            failure.nextRetryAt.reset();
        }

        auto& metric = metricFor(projectionName);
        if (opened) {
            ++metric.totalFailures;
        }
        metric.lastFailureAt = now;
        recomputeHealth(metric);

        return failure.id;
    }

    void recordSuccess(
        const domain::DomainEvent& event,
        const std::string& projectionName,
        domain::ResolutionMethod method) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        auto cpIt = checkpoints_.find(projectionName);
        if (cpIt == checkpoints_.end()) {
            domain::ProjectionCheckpoint checkpoint;
            checkpoint.projectionName = projectionName;
            checkpoint.lastEventId = event.eventId;
            checkpoint.lastEventType = event.eventType;
            checkpoint.lastEventSequence = event.sequence;
            checkpoint.eventsProcessed = 1;
            checkpoint.checkpointAt = now;
            checkpoints_[projectionName] = checkpoint;
        } else {
            auto& checkpoint = cpIt->second;
            if (event.sequence >= checkpoint.lastEventSequence) {
                checkpoint.lastEventId = event.eventId;
                checkpoint.lastEventType = event.eventType;
                checkpoint.lastEventSequence = event.sequence;
            }
            ++checkpoint.eventsProcessed;
            checkpoint.checkpointAt = now;
        }

        auto idIt = byEventAndProjection_.find({event.eventId, projectionName});
        if (idIt != byEventAndProjection_.end()) {
            auto& failure = failures_[idIt->second];
            if (failure.isActive()) {
                failure.resolvedAt = now;
                failure.resolutionMethod = method;
                failure.nextRetryAt.reset();
            }
        }

        auto& metric = metricFor(projectionName);
        ++metric.totalEventsProcessed;
        metric.lastSuccessAt = now;
        recomputeHealth(metric);
    }

    std::vector<domain::ProjectionFailure> getFailuresDueForRetry() override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        std::vector<domain::ProjectionFailure> due;
        for (const auto& [id, failure] : failures_) {
            if (failure.isDueForRetry(now)) {
                due.push_back(failure);
            }
        }

        std::sort(due.begin(), due.end(),
            [](const domain::ProjectionFailure& a, const domain::ProjectionFailure& b) {
                return *a.nextRetryAt < *b.nextRetryAt;
            });
        return due;
    }

    std::optional<domain::ProjectionCheckpoint> getCheckpoint(const std::string& projectionName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = checkpoints_.find(projectionName);
        if (it == checkpoints_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::ProjectionHealthMetric> getHealthMetrics(
        const std::optional<std::string>& projectionName) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::ProjectionHealthMetric> result;
        for (const auto& [name, metric] : metrics_) {
            if (!projectionName || *projectionName == name) {
                result.push_back(metric);
            }
        }
        return result;
    }

    std::vector<domain::ProjectionFailure> getFailures(
        const std::string& projectionName,
        bool includeResolved) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::ProjectionFailure> result;
        for (const auto& [id, failure] : failures_) {
            if (failure.projectionName == projectionName && (includeResolved || failure.isActive())) {
                result.push_back(failure);
            }
        }

        std::sort(result.begin(), result.end(),
            [](const domain::ProjectionFailure& a, const domain::ProjectionFailure& b) {
                return a.failedAt > b.failedAt;
            });

        if (includeResolved && result.size() > RESOLVED_HISTORY_LIMIT) {
            result.resize(RESOLVED_HISTORY_LIMIT);
        }
        return result;
    }

    std::optional<domain::ProjectionFailure> findFailure(const std::string& failureId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = failures_.find(failureId);
        if (it == failures_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool resolveFailure(const std::string& failureId, domain::ResolutionMethod method) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = failures_.find(failureId);
        if (it == failures_.end() || !it->second.isActive()) {
            return false;
        }

        it->second.resolvedAt = clock_->now();
        it->second.resolutionMethod = method;
        it->second.nextRetryAt.reset();

        recomputeHealth(metricFor(it->second.projectionName));
        return true;
    }

    int64_t resetProjection(const std::string& projectionName) override {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto now = clock_->now();

        checkpoints_.erase(projectionName);

        int64_t resolved = 0;
        for (auto& [id, failure] : failures_) {
            if (failure.projectionName == projectionName && failure.isActive()) {
                failure.resolvedAt = now;
                failure.resolutionMethod = domain::ResolutionMethod::MANUAL_RESET;
                failure.nextRetryAt.reset();
                ++resolved;
            }
        }

        auto& metric = metricFor(projectionName);
        metric.totalEventsProcessed = 0;
        recomputeHealth(metric);

        std::cout << "[InMemoryFailureTracker] Projection " << projectionName << " reset" << std::endl;
        return resolved;
    }

private:
    static constexpr size_t RESOLVED_HISTORY_LIMIT = 100;

    domain::RetrySchedule schedule_;
    std::shared_ptr<ports::output::IClock> clock_;

    std::mutex mutex_;
    std::map<std::string, domain::ProjectionFailure> failures_;
    std::map<std::pair<std::string, std::string>, std::string> byEventAndProjection_;
    std::map<std::string, domain::ProjectionCheckpoint> checkpoints_;
    std::map<std::string, domain::ProjectionHealthMetric> metrics_;

    domain::ProjectionHealthMetric& metricFor(const std::string& projectionName) {
        auto& metric = metrics_[projectionName];
        metric.projectionName = projectionName;
        return metric;
    }

    void recomputeHealth(domain::ProjectionHealthMetric& metric) {
        int64_t active = 0;
        for (const auto& [id, failure] : failures_) {
            if (failure.projectionName == metric.projectionName && failure.isActive()) {
                ++active;
            }
        }
        metric.activeFailures = active;
        metric.healthStatus = domain::healthStatusFor(active);
    }
};

} // namespace chronicle::adapters::secondary
