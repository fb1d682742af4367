#pragma once

#include "application/ProjectionRegistry.hpp"
#include "ports/input/IProjectionHealthService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/IProjectionFailureTracker.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <memory>
#include <set>

namespace chronicle::application {

/**
 * @brief Здоровье проекций и отставание read-моделей от журнала
 *
 * Отставание:
 * - в событиях: latestSequence - checkpoint.lastEventSequence
 * - в секундах: occurredAt последнего события журнала минус occurredAt
 *   события checkpoint-а (без checkpoint-а - первого события журнала)
 *
 * Если журнал недоступен, отставание не заполняется, остальное отдаётся.
 */
class ProjectionHealthService : public ports::input::IProjectionHealthService {
public:
    ProjectionHealthService(
        std::shared_ptr<ProjectionRegistry> registry,
        std::shared_ptr<ports::output::IProjectionFailureTracker> tracker,
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<ports::output::IClock> clock)
        : registry_(std::move(registry))
        , tracker_(std::move(tracker))
        , eventStore_(std::move(eventStore))
        , clock_(std::move(clock))
    {}

    std::optional<domain::ProjectionHealthReport> getProjectionHealth(const std::string& projectionName) override {
        auto metrics = tracker_->getHealthMetrics(projectionName);
        if (metrics.empty() && !registry_->find(projectionName)) {
            return std::nullopt;
        }

        domain::ProjectionHealthMetric metric;
        metric.projectionName = projectionName;
        if (!metrics.empty()) {
            metric = metrics.front();
        }

        auto latest = eventStore_->latestSequence();
        return buildReport(metric, latest);
    }

    std::vector<domain::ProjectionHealthReport> getAllProjectionsHealth() override {
        std::map<std::string, domain::ProjectionHealthMetric> byName;

        for (const auto& name : registry_->names()) {
            domain::ProjectionHealthMetric metric;
            metric.projectionName = name;
            byName[name] = metric;
        }
        for (const auto& metric : tracker_->getHealthMetrics(std::nullopt)) {
            byName[metric.projectionName] = metric;
        }

        auto latest = eventStore_->latestSequence();

        std::vector<domain::ProjectionHealthReport> reports;
        for (const auto& [name, metric] : byName) {
            reports.push_back(buildReport(metric, latest));
        }
        return reports;
    }

    domain::SystemHealthReport getSystemHealth() override {
        domain::SystemHealthReport system;
        system.projections = getAllProjectionsHealth();
        system.totalProjections = static_cast<int>(system.projections.size());
        system.checkedAt = clock_->now();

        for (const auto& report : system.projections) {
            switch (report.healthStatus) {
                case domain::HealthStatus::HEALTHY:  ++system.healthyCount; break;
                case domain::HealthStatus::DEGRADED: ++system.degradedCount; break;
                case domain::HealthStatus::CRITICAL: ++system.criticalCount; break;
                case domain::HealthStatus::OFFLINE:  ++system.offlineCount; break;
            }
            system.totalActiveFailures += report.activeFailures;
            system.totalEventsProcessed += report.totalEventsProcessed;
        }

        if (system.criticalCount > 0 || system.offlineCount > 0) {
            system.overallStatus = domain::HealthStatus::CRITICAL;
        } else if (system.degradedCount > 0) {
            system.overallStatus = domain::HealthStatus::DEGRADED;
        } else {
            system.overallStatus = domain::HealthStatus::HEALTHY;
        }

        return system;
    }

    std::optional<domain::ProjectionCheckpoint> getCheckpoint(const std::string& projectionName) override {
        return tracker_->getCheckpoint(projectionName);
    }

    std::vector<domain::ProjectionFailure> getFailures(const std::string& projectionName, bool includeResolved) override {
        return tracker_->getFailures(projectionName, includeResolved);
    }

private:
    std::shared_ptr<ProjectionRegistry> registry_;
    std::shared_ptr<ports::output::IProjectionFailureTracker> tracker_;
    std::shared_ptr<ports::output::IEventStore> eventStore_;
    std::shared_ptr<ports::output::IClock> clock_;

    domain::ProjectionHealthReport buildReport(
        const domain::ProjectionHealthMetric& metric,
        const domain::Result<int64_t, domain::StoreUnavailable>& latest)
    {
        domain::ProjectionHealthReport report;
        report.projectionName = metric.projectionName;
        report.healthStatus = metric.healthStatus;
        report.totalEventsProcessed = metric.totalEventsProcessed;
        report.totalFailures = metric.totalFailures;
        report.activeFailures = metric.activeFailures;
        report.lastSuccessAt = metric.lastSuccessAt;
        report.lastFailureAt = metric.lastFailureAt;

        auto checkpoint = tracker_->getCheckpoint(metric.projectionName);
        int64_t processedSequence = 0;
        if (checkpoint) {
            processedSequence = checkpoint->lastEventSequence;
            report.lastEventSequence = processedSequence;
        }

        if (!latest) {
            std::cerr << "[ProjectionHealthService] Lag unknown for " << metric.projectionName
                      << ": " << latest.error().message() << std::endl;
            return report;
        }

        const int64_t latestSequence = latest.value();
        report.lagEvents = std::max<int64_t>(0, latestSequence - processedSequence);

        if (*report.lagEvents == 0) {
            report.lagSeconds = 0.0;
            return report;
        }

        auto newest = eventAt(latestSequence);
        auto reference = eventAt(processedSequence > 0 ? processedSequence : 1);
        if (newest && reference) {
            auto millis = newest->occurredAt.toUnixMillis() - reference->occurredAt.toUnixMillis();
            report.lagSeconds = std::max<int64_t>(0, millis) / 1000.0;
        }

        return report;
    }

    /**
     * @brief Событие с данным sequence (или ближайшее следующее при пропусках)
     */
    std::optional<domain::DomainEvent> eventAt(int64_t sequence) {
        auto batch = eventStore_->loadAll(sequence - 1, 1);
        if (!batch || batch.value().empty()) {
            return std::nullopt;
        }
        return batch.value().front();
    }
};

} // namespace chronicle::application
