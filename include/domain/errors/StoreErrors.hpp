#pragma once

#include <cstdint>
#include <string>
#include <variant>

namespace chronicle::domain {

/**
 * @brief Конфликт версий при append (оптимистичная блокировка)
 *
 * Повторяемая ошибка: вызывающий код должен перечитать агрегат и повторить команду.
 */
struct ConcurrencyError {
    std::string aggregateId;
    int64_t expectedVersion = 0;
    int64_t actualVersion = 0;

    std::string message() const {
        return "Concurrency conflict for aggregate " + aggregateId +
               ": expected version " + std::to_string(expectedVersion) +
               ", got " + std::to_string(actualVersion);
    }
};

/**
 * @brief Хранилище недоступно (соединение, ошибка SQL). Фатально для запроса.
 */
struct StoreUnavailable {
    std::string reason;

    std::string message() const {
        return "Store unavailable: " + reason;
    }
};

struct AggregateNotFound {
    std::string aggregateId;

    std::string message() const {
        return "Aggregate not found: " + aggregateId;
    }
};

/**
 * @brief Снапшот не удалось восстановить. Требует вмешательства оператора.
 */
struct SnapshotCorruption {
    std::string aggregateId;
    int64_t version = 0;
    std::string reason;

    std::string message() const {
        return "Corrupted snapshot for aggregate " + aggregateId +
               " at version " + std::to_string(version) + ": " + reason;
    }
};

/**
 * @brief Сохранённое событие не удалось применить (payload не соответствует схеме)
 */
struct CorruptedEvent {
    std::string aggregateId;
    std::string eventId;
    std::string reason;

    std::string message() const {
        return "Corrupted event " + eventId + " of aggregate " + aggregateId + ": " + reason;
    }
};

using AppendError = std::variant<ConcurrencyError, StoreUnavailable>;
using LoadError = std::variant<AggregateNotFound, StoreUnavailable, SnapshotCorruption, CorruptedEvent>;

/**
 * @brief Текст ошибки для любого из вариантов
 */
template <typename... Ts>
std::string describe(const std::variant<Ts...>& error) {
    return std::visit([](const auto& e) { return e.message(); }, error);
}

inline bool isRetryable(const AppendError& error) {
    return std::holds_alternative<ConcurrencyError>(error);
}

} // namespace chronicle::domain
