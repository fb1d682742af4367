#pragma once

#include "application/FailureTrace.hpp"
#include "application/ProjectionRegistry.hpp"
#include "ports/input/IProjectionAdminService.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/IProjectionFailureTracker.hpp"
#include "settings/IRetryWorkerSettings.hpp"
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace chronicle::application {

/**
 * @brief Операции оператора: replay, reset, ручное разрешение сбоев
 *
 * Каждое событие, прогнанное через проекцию, проходит через трекер
 * (recordSuccess / recordFailure), так что checkpoint и здоровье
 * остаются согласованными с read-моделью.
 */
class ProjectionAdminService : public ports::input::IProjectionAdminService {
public:
    ProjectionAdminService(
        std::shared_ptr<ProjectionRegistry> registry,
        std::shared_ptr<ports::output::IProjectionFailureTracker> tracker,
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<settings::IRetryWorkerSettings> settings,
        std::shared_ptr<ports::output::IClock> clock)
        : registry_(std::move(registry))
        , tracker_(std::move(tracker))
        , eventStore_(std::move(eventStore))
        , clock_(std::move(clock))
        , batchSize_(settings->getReplayBatchSize() > 0 ? settings->getReplayBatchSize() : 100)
    {}

    // ============================================
    // REPLAY
    // ============================================

    domain::Result<domain::ReplayResult, domain::AdminError> replay(const domain::ReplayRequest& request) override {
        using R = domain::Result<domain::ReplayResult, domain::AdminError>;
        using Code = domain::AdminError::Code;

        auto projection = registry_->find(request.projectionName);
        if (!projection) {
            return R::fail({Code::PROJECTION_NOT_FOUND, "Projection not found: " + request.projectionName});
        }

        if ((request.fromSequence && *request.fromSequence < 1) ||
            (request.fromSequence && request.toSequence && *request.toSequence < *request.fromSequence)) {
            return R::fail({Code::INVALID_RANGE, "Invalid replay range"});
        }

        domain::ReplayResult result;
        result.projectionName = request.projectionName;
        result.startedAt = clock_->now();

        try {
            auto latest = eventStore_->latestSequence();
            if (!latest) {
                return R::fail({Code::STORE_UNAVAILABLE, latest.error().message()});
            }

            if (request.fromSequence) {
                result.fromSequence = *request.fromSequence;
            } else {
                auto checkpoint = tracker_->getCheckpoint(request.projectionName);
                result.fromSequence = checkpoint ? checkpoint->lastEventSequence + 1 : 1;
            }
            result.toSequence = request.toSequence ? *request.toSequence : latest.value();

            std::set<std::string> failedEventIds;
            if (request.skipFailed) {
                for (const auto& failure : tracker_->getFailures(request.projectionName, false)) {
                    failedEventIds.insert(failure.eventId);
                }
            }

            std::cout << "[ProjectionAdminService] Replaying " << request.projectionName
                      << " from " << result.fromSequence << " to " << result.toSequence << std::endl;

            int64_t cursor = result.fromSequence - 1;
            bool done = cursor >= result.toSequence;

            while (!done) {
                auto batch = eventStore_->loadAll(cursor, batchSize_);
                if (!batch) {
                    return R::fail({Code::STORE_UNAVAILABLE, batch.error().message()});
                }
                if (batch.value().empty()) {
                    break;
                }

                for (const auto& event : batch.value()) {
                    if (event.sequence > result.toSequence) {
                        done = true;
                        break;
                    }
                    cursor = event.sequence;

                    if (!projection->canHandle(event)) {
                        continue;
                    }
                    if (failedEventIds.count(event.eventId) > 0) {
                        ++result.eventsSkipped;
                        continue;
                    }

                    if (handleAndRecord(*projection, event, "replay", domain::ResolutionMethod::AUTO_RETRY)) {
                        ++result.eventsReplayed;
                    } else {
                        ++result.eventsFailed;
                    }
                }

                if (cursor >= result.toSequence) {
                    done = true;
                }
            }
        } catch (const std::exception& e) {
            std::cerr << "[ProjectionAdminService] Replay of " << request.projectionName
                      << " aborted: " << e.what() << std::endl;
            return R::fail({Code::STORE_UNAVAILABLE, e.what()});
        }

        result.completedAt = clock_->now();
        result.durationMs = result.completedAt.toUnixMillis() - result.startedAt.toUnixMillis();

        std::cout << "[ProjectionAdminService] Replay of " << request.projectionName << " done: "
                  << result.eventsReplayed << " replayed, " << result.eventsSkipped << " skipped, "
                  << result.eventsFailed << " failed" << std::endl;
        return R::ok(result);
    }

    // ============================================
    // RESET
    // ============================================

    domain::Result<domain::ResetResult, domain::AdminError> reset(const std::string& projectionName) override {
        using R = domain::Result<domain::ResetResult, domain::AdminError>;
        using Code = domain::AdminError::Code;

        auto projection = registry_->find(projectionName);
        if (!projection) {
            return R::fail({Code::PROJECTION_NOT_FOUND, "Projection not found: " + projectionName});
        }

        domain::ResetResult result;
        result.projectionName = projectionName;

        try {
            projection->reset();
            result.failuresResolved = tracker_->resetProjection(projectionName);
        } catch (const std::exception& e) {
            std::cerr << "[ProjectionAdminService] Reset of " << projectionName
                      << " failed: " << e.what() << std::endl;
            return R::fail({Code::STORE_UNAVAILABLE, e.what()});
        }

        result.resetAt = clock_->now();
        std::cout << "[ProjectionAdminService] Projection " << projectionName << " reset, "
                  << result.failuresResolved << " failures resolved" << std::endl;
        return R::ok(result);
    }

    // ============================================
    // RESOLVE
    // ============================================

    domain::Result<domain::ResolveResult, domain::AdminError> resolve(
        const std::string& failureId,
        const std::string& strategy) override
    {
        using R = domain::Result<domain::ResolveResult, domain::AdminError>;
        using Code = domain::AdminError::Code;

        try {
            auto failure = tracker_->findFailure(failureId);
            if (!failure) {
                return R::fail({Code::FAILURE_NOT_FOUND, "Failure not found: " + failureId});
            }
            if (!failure->isActive()) {
                return R::fail({Code::ALREADY_RESOLVED, "Failure already resolved: " + failureId});
            }

            auto parsed = domain::resolveStrategyFromString(strategy);
            if (!parsed) {
                return R::fail({Code::INVALID_STRATEGY,
                                "Unknown strategy '" + strategy + "', expected retry, skip or manual_fix"});
            }

            domain::ResolveResult result;
            result.failureId = failureId;
            result.strategy = *parsed;

            switch (*parsed) {
                case domain::ResolveStrategy::SKIP:
                    return R::ok(markResolved(result, domain::ResolutionMethod::MANUAL_SKIP));
                case domain::ResolveStrategy::MANUAL_FIX:
                    return R::ok(markResolved(result, domain::ResolutionMethod::MANUAL_FIX));
                case domain::ResolveStrategy::RETRY:
                    break;
            }

            auto projection = registry_->find(failure->projectionName);
            if (!projection) {
                return R::fail({Code::PROJECTION_NOT_FOUND, "Projection not found: " + failure->projectionName});
            }

            auto loaded = eventStore_->loadEvent(failure->eventId);
            if (!loaded) {
                return R::fail({Code::STORE_UNAVAILABLE, loaded.error().message()});
            }
            if (!loaded.value()) {
                return R::fail({Code::EVENT_NOT_FOUND, "Event not found: " + failure->eventId});
            }

            if (handleAndRecord(*projection, *loaded.value(), "manual-retry", domain::ResolutionMethod::MANUAL_RETRY)) {
                result.resolved = true;
                result.resolutionMethod = domain::ResolutionMethod::MANUAL_RETRY;
                result.message = "Retry succeeded";
            } else {
                result.resolved = false;
                result.message = "Retry failed, failure recorded";
            }
            return R::ok(result);

        } catch (const std::exception& e) {
            std::cerr << "[ProjectionAdminService] Resolve of " << failureId
                      << " failed: " << e.what() << std::endl;
            return R::fail({Code::STORE_UNAVAILABLE, e.what()});
        }
    }

private:
    std::shared_ptr<ProjectionRegistry> registry_;
    std::shared_ptr<ports::output::IProjectionFailureTracker> tracker_;
    std::shared_ptr<ports::output::IEventStore> eventStore_;
    std::shared_ptr<ports::output::IClock> clock_;
    int batchSize_;

    domain::ResolveResult markResolved(domain::ResolveResult result, domain::ResolutionMethod method) {
        result.resolved = tracker_->resolveFailure(result.failureId, method);
        result.resolutionMethod = method;
        result.message = "Resolved with " + domain::toString(method);
        std::cout << "[ProjectionAdminService] Failure " << result.failureId
                  << " resolved: " << domain::toString(method) << std::endl;
        return result;
    }

    /**
     * @brief Прогнать событие через проекцию и записать результат в трекер
     * @return true при успехе handle()
     * @throws std::exception если трекер недоступен
     */
    bool handleAndRecord(ports::output::IProjection& projection,
                         const domain::DomainEvent& event,
                         const std::string& origin,
                         domain::ResolutionMethod method) {
        const auto name = projection.name();
        std::optional<std::string> error;
        try {
            projection.handle(event);
        } catch (const std::exception& e) {
            error = e.what();
        } catch (...) {
            error = "unknown exception";
        }

        if (error) {
            std::cerr << "[ProjectionAdminService] " << name << " failed on " << event.eventId
                      << " (" << origin << "): " << *error << std::endl;
            tracker_->recordFailure(event, name, *error, failureTrace(event, name, origin));
            return false;
        }
        tracker_->recordSuccess(event, name, method);
        return true;
    }
};

} // namespace chronicle::application
