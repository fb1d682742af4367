#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace chronicle::domain {

/**
 * @brief Запись журнала событий
 *
 * Неизменяемая после append. version назначает агрегат (с 1),
 * sequence назначает хранилище (глобальный порядок, 0 = ещё не сохранено).
 * schemaVersion хранится внутри payload и используется для upcasting.
 */
struct DomainEvent {
    std::string eventId;
    std::string aggregateId;
    std::string aggregateType;
    std::string eventType;
    int64_t version = 0;
    int64_t sequence = 0;
    int schemaVersion = 1;
    nlohmann::json payload = nlohmann::json::object();
    Timestamp occurredAt;
};

} // namespace chronicle::domain
