#pragma once

#include "domain/RetrySchedule.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IProjectionFailureTracker.hpp"
#include "settings/DbSettings.hpp"
#include "settings/IFailureTrackerSettings.hpp"
#include "utils/UuidGenerator.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace chronicle::adapters::secondary
{

    /**
     * @brief Трекер сбоев проекций в PostgreSQL
     *
     * Таблицы: projection_failures, projection_checkpoints, projection_health_metrics.
     * Каждая операция - одна транзакция. Ошибки libpqxx не перехватываются:
     * вызывающий код (publisher, воркер, админка) решает, что с ними делать.
     */
    class PostgresProjectionFailureTracker : public chronicle::ports::output::IProjectionFailureTracker
    {
    public:
        PostgresProjectionFailureTracker(
            std::shared_ptr<chronicle::settings::DbSettings> settings,
            std::shared_ptr<chronicle::settings::IFailureTrackerSettings> trackerSettings,
            std::shared_ptr<chronicle::ports::output::IClock> clock)
            : settings_(std::move(settings)),
              schedule_(trackerSettings->getBackoffSeconds(), trackerSettings->getMaxRetries()),
              clock_(std::move(clock))
        {
            pqxx::connection c(settings_->getConnectionString());
            std::cout << "[PostgresFailureTracker] Connected to " << settings_->getName() << std::endl;
        }

        std::string recordFailure(
            const domain::DomainEvent &event,
            const std::string &projectionName,
            const std::string &errorMessage,
            const std::string &errorTrace) override
        {
            const auto now = clock_->now().toUnixMillis();

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            std::string failureId;
            int retryCount = 0;
            bool opened = false;

            auto inserted = t.exec_params(
                "INSERT INTO projection_failures (id, event_id, event_type, projection_name, "
                "error_message, error_trace, retry_count, max_retries, failed_at) "
                "VALUES ($1, $2, $3, $4, $5, $6, 0, $7, to_timestamp($8::bigint / 1000.0)) "
                "ON CONFLICT (event_id, projection_name) DO NOTHING RETURNING id",
                utils::UuidGenerator::generate(), event.eventId, event.eventType, projectionName,
                errorMessage, errorTrace, schedule_.maxRetries(), now);

            if (!inserted.empty())
            {
                failureId = inserted[0][0].as<std::string>();
                opened = true;
            }
            else
            {
                auto existing = t.exec_params(
                    "SELECT id, retry_count, resolved_at IS NULL FROM projection_failures "
                    "WHERE event_id = $1 AND projection_name = $2 FOR UPDATE",
                    event.eventId, projectionName);

                failureId = existing[0][0].as<std::string>();
                const bool active = existing[0][2].as<bool>();
                // Повторный сбой после разрешения открывает новый цикл повторов
                retryCount = active ? existing[0][1].as<int>() + 1 : 0;
                opened = !active;
            }

            std::optional<int64_t> nextRetryAt;
            if (auto delay = schedule_.nextDelay(retryCount))
                nextRetryAt = now + delay->count() * 1000;

            t.exec_params(
                "UPDATE projection_failures SET event_type = $2, error_message = $3, error_trace = $4, "
                "retry_count = $5, max_retries = $6, failed_at = to_timestamp($7::bigint / 1000.0), "
                "next_retry_at = to_timestamp($8::bigint / 1000.0), "
                "resolved_at = NULL, resolution_method = NULL "
                "WHERE id = $1",
                failureId, event.eventType, errorMessage, errorTrace,
                retryCount, schedule_.maxRetries(), now, nextRetryAt);

            t.exec_params(
                "INSERT INTO projection_health_metrics (projection_name, total_failures, last_failure_at) "
                "VALUES ($1, $2, to_timestamp($3::bigint / 1000.0)) "
                "ON CONFLICT (projection_name) DO UPDATE SET "
                "total_failures = projection_health_metrics.total_failures + EXCLUDED.total_failures, "
                "last_failure_at = EXCLUDED.last_failure_at",
                projectionName, opened ? 1 : 0, now);

            recomputeHealth(t, projectionName);
            t.commit();

            std::cout << "[PostgresFailureTracker] Failure " << failureId << " recorded: "
                      << projectionName << " / " << event.eventId
                      << " (retry " << retryCount << "/" << schedule_.maxRetries() << ")" << std::endl;
            return failureId;
        }

        void recordSuccess(
            const domain::DomainEvent &event,
            const std::string &projectionName,
            domain::ResolutionMethod method) override
        {
            const auto now = clock_->now().toUnixMillis();

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            // last_event_sequence не убывает, events_processed растёт всегда
            t.exec_params(
                "INSERT INTO projection_checkpoints (projection_name, last_event_id, last_event_type, "
                "last_event_sequence, events_processed, checkpoint_at) "
                "VALUES ($1, $2, $3, $4, 1, to_timestamp($5::bigint / 1000.0)) "
                "ON CONFLICT (projection_name) DO UPDATE SET "
                "last_event_id = CASE WHEN EXCLUDED.last_event_sequence >= projection_checkpoints.last_event_sequence "
                "  THEN EXCLUDED.last_event_id ELSE projection_checkpoints.last_event_id END, "
                "last_event_type = CASE WHEN EXCLUDED.last_event_sequence >= projection_checkpoints.last_event_sequence "
                "  THEN EXCLUDED.last_event_type ELSE projection_checkpoints.last_event_type END, "
                "last_event_sequence = GREATEST(projection_checkpoints.last_event_sequence, EXCLUDED.last_event_sequence), "
                "events_processed = projection_checkpoints.events_processed + 1, "
                "checkpoint_at = EXCLUDED.checkpoint_at",
                projectionName, event.eventId, event.eventType, event.sequence, now);

            t.exec_params(
                "UPDATE projection_failures SET resolved_at = to_timestamp($3::bigint / 1000.0), "
                "resolution_method = $4, next_retry_at = NULL "
                "WHERE event_id = $1 AND projection_name = $2 AND resolved_at IS NULL",
                event.eventId, projectionName, now, domain::toString(method));

            t.exec_params(
                "INSERT INTO projection_health_metrics (projection_name, total_events_processed, last_success_at) "
                "VALUES ($1, 1, to_timestamp($2::bigint / 1000.0)) "
                "ON CONFLICT (projection_name) DO UPDATE SET "
                "total_events_processed = projection_health_metrics.total_events_processed + 1, "
                "last_success_at = EXCLUDED.last_success_at",
                projectionName, now);

            recomputeHealth(t, projectionName);
            t.commit();
        }

        std::vector<domain::ProjectionFailure> getFailuresDueForRetry() override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                SELECT_FAILURES +
                    " WHERE resolved_at IS NULL AND next_retry_at IS NOT NULL "
                    "AND next_retry_at <= to_timestamp($1::bigint / 1000.0) "
                    "AND retry_count < max_retries ORDER BY next_retry_at",
                clock_->now().toUnixMillis());
            return toFailures(r);
        }

        std::optional<domain::ProjectionCheckpoint> getCheckpoint(const std::string &projectionName) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "SELECT projection_name, last_event_id, last_event_type, last_event_sequence, events_processed, "
                "(EXTRACT(EPOCH FROM checkpoint_at) * 1000)::BIGINT "
                "FROM projection_checkpoints WHERE projection_name = $1",
                projectionName);
            if (r.empty())
                return std::nullopt;

            domain::ProjectionCheckpoint checkpoint;
            checkpoint.projectionName = r[0][0].as<std::string>();
            checkpoint.lastEventId = r[0][1].as<std::string>();
            checkpoint.lastEventType = r[0][2].as<std::string>();
            checkpoint.lastEventSequence = r[0][3].as<int64_t>();
            checkpoint.eventsProcessed = r[0][4].as<int64_t>();
            checkpoint.checkpointAt = domain::Timestamp::fromUnixMillis(r[0][5].as<int64_t>());
            return checkpoint;
        }

        std::vector<domain::ProjectionHealthMetric> getHealthMetrics(
            const std::optional<std::string> &projectionName) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            const std::string query =
                "SELECT projection_name, health_status, total_events_processed, total_failures, active_failures, "
                "(EXTRACT(EPOCH FROM last_success_at) * 1000)::BIGINT, "
                "(EXTRACT(EPOCH FROM last_failure_at) * 1000)::BIGINT "
                "FROM projection_health_metrics";

            auto r = projectionName
                         ? t.exec_params(query + " WHERE projection_name = $1", *projectionName)
                         : t.exec(query + " ORDER BY projection_name");

            std::vector<domain::ProjectionHealthMetric> metrics;
            for (const auto &row : r)
            {
                domain::ProjectionHealthMetric metric;
                metric.projectionName = row[0].as<std::string>();
                metric.healthStatus = domain::healthStatusFromString(row[1].as<std::string>());
                metric.totalEventsProcessed = row[2].as<int64_t>();
                metric.totalFailures = row[3].as<int64_t>();
                metric.activeFailures = row[4].as<int64_t>();
                metric.lastSuccessAt = optionalTimestamp(row[5]);
                metric.lastFailureAt = optionalTimestamp(row[6]);
                metrics.push_back(metric);
            }
            return metrics;
        }

        std::vector<domain::ProjectionFailure> getFailures(
            const std::string &projectionName,
            bool includeResolved) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = includeResolved
                         ? t.exec_params(SELECT_FAILURES +
                                             " WHERE projection_name = $1 ORDER BY failed_at DESC LIMIT 100",
                                         projectionName)
                         : t.exec_params(SELECT_FAILURES +
                                             " WHERE projection_name = $1 AND resolved_at IS NULL ORDER BY failed_at DESC",
                                         projectionName);
            return toFailures(r);
        }

        std::optional<domain::ProjectionFailure> findFailure(const std::string &failureId) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(SELECT_FAILURES + " WHERE id = $1", failureId);
            if (r.empty())
                return std::nullopt;
            return toFailure(r[0]);
        }

        bool resolveFailure(const std::string &failureId, domain::ResolutionMethod method) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            auto r = t.exec_params(
                "UPDATE projection_failures SET resolved_at = to_timestamp($2::bigint / 1000.0), "
                "resolution_method = $3, next_retry_at = NULL "
                "WHERE id = $1 AND resolved_at IS NULL RETURNING projection_name",
                failureId, clock_->now().toUnixMillis(), domain::toString(method));
            if (r.empty())
                return false;

            recomputeHealth(t, r[0][0].as<std::string>());
            t.commit();
            std::cout << "[PostgresFailureTracker] Failure " << failureId
                      << " resolved: " << domain::toString(method) << std::endl;
            return true;
        }

        int64_t resetProjection(const std::string &projectionName) override
        {
            const auto now = clock_->now().toUnixMillis();

            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            t.exec_params("DELETE FROM projection_checkpoints WHERE projection_name = $1", projectionName);

            auto resolved = t.exec_params(
                "UPDATE projection_failures SET resolved_at = to_timestamp($2::bigint / 1000.0), "
                "resolution_method = $3, next_retry_at = NULL "
                "WHERE projection_name = $1 AND resolved_at IS NULL",
                projectionName, now, domain::toString(domain::ResolutionMethod::MANUAL_RESET));

            t.exec_params(
                "INSERT INTO projection_health_metrics (projection_name) VALUES ($1) "
                "ON CONFLICT (projection_name) DO UPDATE SET total_events_processed = 0",
                projectionName);

            recomputeHealth(t, projectionName);
            t.commit();

            std::cout << "[PostgresFailureTracker] Projection " << projectionName << " reset" << std::endl;
            return static_cast<int64_t>(resolved.affected_rows());
        }

    private:
        std::shared_ptr<chronicle::settings::DbSettings> settings_;
        domain::RetrySchedule schedule_;
        std::shared_ptr<chronicle::ports::output::IClock> clock_;

        inline static const std::string SELECT_FAILURES =
            "SELECT id, event_id, event_type, projection_name, error_message, COALESCE(error_trace, ''), "
            "retry_count, max_retries, "
            "(EXTRACT(EPOCH FROM failed_at) * 1000)::BIGINT, "
            "(EXTRACT(EPOCH FROM next_retry_at) * 1000)::BIGINT, "
            "(EXTRACT(EPOCH FROM resolved_at) * 1000)::BIGINT, "
            "resolution_method "
            "FROM projection_failures";

        void recomputeHealth(pqxx::work &t, const std::string &projectionName)
        {
            auto r = t.exec_params(
                "SELECT COUNT(*) FROM projection_failures WHERE projection_name = $1 AND resolved_at IS NULL",
                projectionName);
            const auto active = r[0][0].as<int64_t>();

            t.exec_params(
                "UPDATE projection_health_metrics SET active_failures = $2, health_status = $3 "
                "WHERE projection_name = $1",
                projectionName, active, domain::toString(domain::healthStatusFor(active)));
        }

        static std::optional<domain::Timestamp> optionalTimestamp(const pqxx::field &field)
        {
            if (field.is_null())
                return std::nullopt;
            return domain::Timestamp::fromUnixMillis(field.as<int64_t>());
        }

        static std::vector<domain::ProjectionFailure> toFailures(const pqxx::result &r)
        {
            std::vector<domain::ProjectionFailure> failures;
            failures.reserve(r.size());
            for (const auto &row : r)
            {
                failures.push_back(toFailure(row));
            }
            return failures;
        }

        static domain::ProjectionFailure toFailure(const pqxx::row &row)
        {
            domain::ProjectionFailure failure;
            failure.id = row[0].as<std::string>();
            failure.eventId = row[1].as<std::string>();
            failure.eventType = row[2].as<std::string>();
            failure.projectionName = row[3].as<std::string>();
            failure.errorMessage = row[4].as<std::string>();
            failure.errorTrace = row[5].as<std::string>();
            failure.retryCount = row[6].as<int>();
            failure.maxRetries = row[7].as<int>();
            failure.failedAt = domain::Timestamp::fromUnixMillis(row[8].as<int64_t>());
            failure.nextRetryAt = optionalTimestamp(row[9]);
            failure.resolvedAt = optionalTimestamp(row[10]);
            if (!row[11].is_null())
                failure.resolutionMethod = domain::resolutionMethodFromString(row[11].as<std::string>());
            return failure;
        }
    };

} // namespace chronicle::adapters::secondary
