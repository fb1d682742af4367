#pragma once

#include "application/EventUpcasterRegistry.hpp"
#include "ports/output/IEventStore.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace chronicle::adapters::secondary
{

    /**
     * @brief Журнал событий в PostgreSQL (таблица events)
     *
     * append() в одной транзакции:
     * 1. блокирует строки агрегата (FOR UPDATE во вложенном SELECT)
     * 2. MAX(event_version) по заблокированному набору
     * 3. при расхождении с expectedVersion - ConcurrencyError, ничего не пишется
     * 4. INSERT событий, sequence назначает BIGSERIAL
     *
     * Для нового агрегата блокировать нечего: гонку двух создателей ловит
     * UNIQUE (aggregate_id, event_version), она тоже отдаётся как ConcurrencyError.
     *
     * schema_version хранится внутри payload.
     */
    class PostgresEventStore : public chronicle::ports::output::IEventStore
    {
    public:
        PostgresEventStore(
            std::shared_ptr<chronicle::settings::DbSettings> settings,
            std::shared_ptr<chronicle::application::EventUpcasterRegistry> upcasters)
            : settings_(std::move(settings)), upcasters_(std::move(upcasters))
        {
            pqxx::connection c(settings_->getConnectionString());
            std::cout << "[PostgresEventStore] Connected to " << settings_->getName() << std::endl;
        }

        domain::Result<std::vector<domain::DomainEvent>, domain::AppendError> append(
            const std::string &aggregateId,
            const std::vector<domain::DomainEvent> &events,
            int64_t expectedVersion) override
        {
            using R = domain::Result<std::vector<domain::DomainEvent>, domain::AppendError>;

            if (events.empty())
                return R::ok({});

            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);

                auto locked = t.exec_params(
                    "SELECT COALESCE(MAX(event_version), 0) AS current_version FROM ("
                    "  SELECT event_version FROM events WHERE aggregate_id = $1 FOR UPDATE"
                    ") AS locked_events",
                    aggregateId);

                auto currentVersion = locked[0]["current_version"].as<int64_t>();
                if (currentVersion != expectedVersion)
                {
                    std::cout << "[PostgresEventStore] Version conflict on " << aggregateId
                              << ": expected " << expectedVersion << ", actual " << currentVersion << std::endl;
                    return R::fail(domain::ConcurrencyError{aggregateId, expectedVersion, currentVersion});
                }

                std::vector<domain::DomainEvent> stored;
                int64_t version = expectedVersion;

                for (const auto &event : events)
                {
                    domain::DomainEvent copy = event;
                    copy.aggregateId = aggregateId;
                    copy.version = ++version;

                    auto payload = copy.payload;
                    payload["schema_version"] = copy.schemaVersion;

                    auto r = t.exec_params(
                        "INSERT INTO events (event_id, aggregate_id, aggregate_type, event_type, "
                        "event_version, payload, occurred_at) "
                        "VALUES ($1, $2, $3, $4, $5, $6::jsonb, to_timestamp($7::bigint / 1000.0)) "
                        "RETURNING sequence",
                        copy.eventId, aggregateId, copy.aggregateType, copy.eventType,
                        copy.version, payload.dump(), copy.occurredAt.toUnixMillis());

                    copy.sequence = r[0]["sequence"].as<int64_t>();
                    stored.push_back(std::move(copy));
                }

                t.commit();
                return R::ok(std::move(stored));
            }
            catch (const pqxx::unique_violation &)
            {
                // Параллельный создатель успел раньше: версия уже занята
                std::cout << "[PostgresEventStore] Unique violation on " << aggregateId << std::endl;
                auto actual = countEvents(aggregateId);
                return R::fail(domain::ConcurrencyError{
                    aggregateId, expectedVersion, actual ? actual.value() : expectedVersion + 1});
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEventStore] Append failed: " << e.what() << std::endl;
                return R::fail(domain::StoreUnavailable{e.what()});
            }
        }

        domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable> load(
            const std::string &aggregateId,
            int64_t fromVersion) override
        {
            using R = domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable>;
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec_params(
                    SELECT_EVENTS + " WHERE aggregate_id = $1 AND event_version > $2 ORDER BY event_version",
                    aggregateId, fromVersion);
                return R::ok(toEvents(r));
            }
            catch (const domain::UpcastError &)
            {
                throw;
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEventStore] Load failed: " << e.what() << std::endl;
                return R::fail({e.what()});
            }
        }

        domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable> loadAll(
            int64_t fromSequence,
            int limit) override
        {
            using R = domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable>;
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec_params(
                    SELECT_EVENTS + " WHERE sequence > $1 ORDER BY sequence LIMIT $2",
                    fromSequence, limit);
                return R::ok(toEvents(r));
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEventStore] LoadAll failed: " << e.what() << std::endl;
                return R::fail({e.what()});
            }
        }

        domain::Result<std::optional<domain::DomainEvent>, domain::StoreUnavailable> loadEvent(
            const std::string &eventId) override
        {
            using R = domain::Result<std::optional<domain::DomainEvent>, domain::StoreUnavailable>;
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec_params(SELECT_EVENTS + " WHERE event_id = $1", eventId);
                if (r.empty())
                    return R::ok(std::nullopt);
                return R::ok(toEvent(r[0]));
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEventStore] LoadEvent failed: " << e.what() << std::endl;
                return R::fail({e.what()});
            }
        }

        domain::Result<int64_t, domain::StoreUnavailable> latestSequence() override
        {
            using R = domain::Result<int64_t, domain::StoreUnavailable>;
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec("SELECT COALESCE(MAX(sequence), 0) FROM events");
                return R::ok(r[0][0].as<int64_t>());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEventStore] LatestSequence failed: " << e.what() << std::endl;
                return R::fail({e.what()});
            }
        }

        domain::Result<int64_t, domain::StoreUnavailable> countEvents(const std::string &aggregateId) override
        {
            using R = domain::Result<int64_t, domain::StoreUnavailable>;
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec_params(
                    "SELECT COALESCE(MAX(event_version), 0) FROM events WHERE aggregate_id = $1",
                    aggregateId);
                return R::ok(r[0][0].as<int64_t>());
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresEventStore] CountEvents failed: " << e.what() << std::endl;
                return R::fail({e.what()});
            }
        }

    private:
        std::shared_ptr<chronicle::settings::DbSettings> settings_;
        std::shared_ptr<chronicle::application::EventUpcasterRegistry> upcasters_;

        inline static const std::string SELECT_EVENTS =
            "SELECT sequence, event_id, aggregate_id, aggregate_type, event_type, event_version, "
            "payload::text AS payload, "
            "(EXTRACT(EPOCH FROM occurred_at) * 1000)::BIGINT AS occurred_at_ms "
            "FROM events";

        std::vector<domain::DomainEvent> toEvents(const pqxx::result &r)
        {
            std::vector<domain::DomainEvent> events;
            events.reserve(r.size());
            for (const auto &row : r)
            {
                events.push_back(toEvent(row));
            }
            return events;
        }

        domain::DomainEvent toEvent(const pqxx::row &row)
        {
            domain::DomainEvent event;
            event.sequence = row["sequence"].as<int64_t>();
            event.eventId = row["event_id"].as<std::string>();
            event.aggregateId = row["aggregate_id"].as<std::string>();
            event.aggregateType = row["aggregate_type"].as<std::string>();
            event.eventType = row["event_type"].as<std::string>();
            event.version = row["event_version"].as<int64_t>();
            event.occurredAt = domain::Timestamp::fromUnixMillis(row["occurred_at_ms"].as<int64_t>());

            event.payload = nlohmann::json::parse(row["payload"].as<std::string>());
            event.schemaVersion = event.payload.value("schema_version", 1);
            event.payload.erase("schema_version");

            return upcasters_->upcast(std::move(event));
        }
    };

} // namespace chronicle::adapters::secondary
