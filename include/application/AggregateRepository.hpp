#pragma once

#include "domain/Aggregate.hpp"
#include "domain/Result.hpp"
#include "domain/Snapshot.hpp"
#include "domain/errors/StoreErrors.hpp"
#include "domain/errors/UpcastError.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/ISnapshotStore.hpp"
#include "settings/IRepositorySettings.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace chronicle::application {

/**
 * @brief Загрузка и сохранение агрегатов одного типа
 *
 * get():  снапшот + события после его версии.
 * save(): append с ожидаемой версией version - pending.size();
 *         ConcurrencyError повторяется до maxRetries раз с задержкой
 *         baseDelay * 2^attempt (50, 100, 200 мс по умолчанию).
 *         После успеха: pending очищается, события уходят в publisher,
 *         при пересечении порога пишется снапшот (сбой снапшота только логируется).
 *
 * @tparam T наследник domain::Aggregate с конструктором T(std::string id)
 */
template <typename T>
class AggregateRepository {
    static_assert(std::is_base_of<domain::Aggregate, T>::value,
                  "AggregateRepository requires a domain::Aggregate");

public:
    AggregateRepository(
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<ports::output::ISnapshotStore> snapshotStore,
        std::shared_ptr<ports::output::IEventPublisher> publisher,
        std::shared_ptr<settings::IRepositorySettings> settings,
        std::shared_ptr<ports::output::IClock> clock)
        : eventStore_(std::move(eventStore))
        , snapshotStore_(std::move(snapshotStore))
        , publisher_(std::move(publisher))
        , settings_(std::move(settings))
        , clock_(std::move(clock))
    {}

    virtual ~AggregateRepository() = default;

    /**
     * @brief Восстановить агрегат
     * @return AggregateNotFound если нет ни снапшота, ни событий
     */
    domain::Result<T, domain::LoadError> get(const std::string& id) {
        using R = domain::Result<T, domain::LoadError>;

        auto snapshot = snapshotStore_->load(id);
        if (!snapshot) {
            return R::fail(snapshot.error());
        }

        T aggregate(id);
        const bool fromSnapshot = snapshot.value().has_value();

        if (fromSnapshot) {
            const auto& snap = *snapshot.value();
            try {
                aggregate.restoreState(snap.state);
            } catch (const std::exception& e) {
                std::cerr << "[AggregateRepository] Corrupted snapshot " << id
                          << " v" << snap.version << ": " << e.what() << std::endl;
                return R::fail(domain::SnapshotCorruption{id, snap.version, e.what()});
            }
            if (aggregate.version() != snap.version) {
                return R::fail(domain::SnapshotCorruption{
                    id, snap.version,
                    "state version " + std::to_string(aggregate.version()) + " does not match snapshot version"});
            }
        }

        auto events = loadEvents(id, aggregate.version());
        if (!events) {
            return R::fail(events.error());
        }

        if (!fromSnapshot && events.value().empty()) {
            return R::fail(domain::AggregateNotFound{id});
        }

        for (const auto& event : events.value()) {
            try {
                aggregate.applyEvent(event);
            } catch (const std::exception& e) {
                std::cerr << "[AggregateRepository] Cannot apply event " << event.eventId
                          << " to " << id << ": " << e.what() << std::endl;
                return R::fail(domain::CorruptedEvent{id, event.eventId, e.what()});
            }
        }

        return R::ok(std::move(aggregate));
    }

    /**
     * @brief Сохранить новые события агрегата
     * @return Сохранённые события (с sequence) или ConcurrencyError / StoreUnavailable
     */
    domain::Result<std::vector<domain::DomainEvent>, domain::AppendError> save(T& aggregate) {
        using R = domain::Result<std::vector<domain::DomainEvent>, domain::AppendError>;

        const auto& pending = aggregate.pendingEvents();
        if (pending.empty()) {
            return R::ok({});
        }

        const int64_t expectedVersion = aggregate.version() - static_cast<int64_t>(pending.size());
        const int maxRetries = settings_->getMaxRetries();
        std::vector<domain::DomainEvent> stored;

        for (int attempt = 0; ; ++attempt) {
            auto result = eventStore_->append(aggregate.id(), pending, expectedVersion);
            if (result) {
                stored = std::move(result.value());
                break;
            }

            const auto& error = result.error();
            if (!domain::isRetryable(error)) {
                std::cerr << "[AggregateRepository] Save failed for " << aggregate.id()
                          << ": " << domain::describe(error) << std::endl;
                return R::fail(error);
            }

            if (attempt >= maxRetries) {
                std::cerr << "[AggregateRepository] Giving up on " << aggregate.id()
                          << " after " << (attempt + 1) << " attempts: "
                          << domain::describe(error) << std::endl;
                return R::fail(error);
            }

            auto delay = std::chrono::milliseconds(static_cast<int64_t>(settings_->getBaseDelayMs()) << attempt);
            std::cout << "[AggregateRepository] " << domain::describe(error)
                      << ", retry " << (attempt + 1) << "/" << maxRetries
                      << " in " << delay.count() << "ms" << std::endl;
            clock_->sleepFor(delay);
        }

        aggregate.markEventsCommitted();

        publisher_->publishAll(stored);

        if (crossesSnapshotThreshold(expectedVersion, aggregate.version())) {
            writeSnapshot(aggregate);
        }

        return R::ok(std::move(stored));
    }

    /**
     * @brief Есть ли у агрегата снапшот или хотя бы одно событие
     */
    domain::Result<bool, domain::StoreUnavailable> exists(const std::string& id) {
        using R = domain::Result<bool, domain::StoreUnavailable>;

        auto snapshot = snapshotStore_->load(id);
        if (!snapshot) {
            return R::fail(snapshot.error());
        }
        if (snapshot.value()) {
            return R::ok(true);
        }

        auto count = eventStore_->countEvents(id);
        if (!count) {
            return R::fail(count.error());
        }
        return R::ok(count.value() > 0);
    }

private:
    std::shared_ptr<ports::output::IEventStore> eventStore_;
    std::shared_ptr<ports::output::ISnapshotStore> snapshotStore_;
    std::shared_ptr<ports::output::IEventPublisher> publisher_;
    std::shared_ptr<settings::IRepositorySettings> settings_;
    std::shared_ptr<ports::output::IClock> clock_;

    // Событие, которое нельзя поднять до текущей схемы, - CorruptedEvent
    domain::Result<std::vector<domain::DomainEvent>, domain::LoadError> loadEvents(
        const std::string& id, int64_t fromVersion) {
        using R = domain::Result<std::vector<domain::DomainEvent>, domain::LoadError>;
        try {
            auto events = eventStore_->load(id, fromVersion);
            if (!events) {
                return R::fail(events.error());
            }
            return R::ok(std::move(events.value()));
        } catch (const domain::UpcastError& e) {
            std::cerr << "[AggregateRepository] " << e.what() << std::endl;
            return R::fail(domain::CorruptedEvent{id, e.eventId(), e.what()});
        }
    }

    bool crossesSnapshotThreshold(int64_t oldVersion, int64_t newVersion) const {
        const int threshold = settings_->getSnapshotThreshold();
        if (threshold <= 0) {
            return false;
        }
        return oldVersion / threshold < newVersion / threshold;
    }

    void writeSnapshot(const T& aggregate) {
        domain::Snapshot snapshot;
        snapshot.aggregateId = aggregate.id();
        snapshot.aggregateType = aggregate.aggregateType();
        snapshot.version = aggregate.version();
        snapshot.state = aggregate.serializeState();
        snapshot.createdAt = clock_->now();

        auto result = snapshotStore_->save(snapshot);
        if (!result) {
            std::cerr << "[AggregateRepository] Snapshot of " << aggregate.id()
                      << " v" << snapshot.version << " not saved: "
                      << result.error().message() << std::endl;
            return;
        }
        std::cout << "[AggregateRepository] Snapshot saved: " << aggregate.id()
                  << " v" << snapshot.version << std::endl;
    }
};

} // namespace chronicle::application
