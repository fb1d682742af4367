#pragma once

#include "domain/DomainEvent.hpp"
#include "domain/Result.hpp"
#include "domain/errors/StoreErrors.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chronicle::ports::output {

/**
 * @brief Журнал событий (append-only)
 *
 * Реализуется PostgresEventStore и InMemoryEventStore.
 */
class IEventStore {
public:
    virtual ~IEventStore() = default;

    /**
     * @brief Атомарно дописать события агрегата
     *
     * Если текущая версия агрегата != expectedVersion, ничего не пишется
     * и возвращается ConcurrencyError с обеими версиями.
     * Пустой список - no-op.
     *
     * @return Сохранённые события с назначенными version и sequence
     */
    virtual domain::Result<std::vector<domain::DomainEvent>, domain::AppendError> append(
        const std::string& aggregateId,
        const std::vector<domain::DomainEvent>& events,
        int64_t expectedVersion) = 0;

    /**
     * @brief События агрегата с version > fromVersion, по возрастанию version
     * @throws domain::UpcastError если событие нельзя поднять до текущей схемы
     */
    virtual domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable> load(
        const std::string& aggregateId,
        int64_t fromVersion) = 0;

    /**
     * @brief События всех агрегатов с sequence > fromSequence, не более limit
     */
    virtual domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable> loadAll(
        int64_t fromSequence,
        int limit) = 0;

    virtual domain::Result<std::optional<domain::DomainEvent>, domain::StoreUnavailable> loadEvent(
        const std::string& eventId) = 0;

    /**
     * @brief Последний выданный sequence (0 для пустого журнала)
     */
    virtual domain::Result<int64_t, domain::StoreUnavailable> latestSequence() = 0;

    virtual domain::Result<int64_t, domain::StoreUnavailable> countEvents(
        const std::string& aggregateId) = 0;
};

} // namespace chronicle::ports::output
