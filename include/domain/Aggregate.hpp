#pragma once

#include "domain/DomainEvent.hpp"
#include "utils/UuidGenerator.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace chronicle::domain {

/**
 * @brief Базовый класс агрегата (граница консистентности)
 *
 * Состояние выводится только из собственного упорядоченного потока событий.
 * version == число применённых событий.
 *
 * Наследник реализует:
 * - when() - мутация состояния по событию
 * - serializeFields()/restoreFields() - полный слепок для снапшота
 */
class Aggregate {
public:
    explicit Aggregate(std::string id) : id_(std::move(id)) {}
    virtual ~Aggregate() = default;

    const std::string& id() const { return id_; }
    int64_t version() const { return version_; }

    /**
     * @brief События, ещё не записанные в журнал
     */
    const std::vector<DomainEvent>& pendingEvents() const { return pendingEvents_; }

    /**
     * @brief Вызывается репозиторием после успешного append
     */
    void markEventsCommitted() { pendingEvents_.clear(); }

    virtual std::string aggregateType() const = 0;

    /**
     * @brief Применить сохранённое событие (replay)
     */
    void applyEvent(const DomainEvent& event) {
        when(event);
        ++version_;
    }

    /**
     * @brief Полный слепок состояния, включая id и version
     */
    nlohmann::json serializeState() const {
        auto state = serializeFields();
        state["id"] = id_;
        state["version"] = version_;
        return state;
    }

    /**
     * @brief Восстановить состояние из слепка
     * @throws nlohmann::json::exception, std::invalid_argument при повреждённом слепке
     */
    void restoreState(const nlohmann::json& state) {
        restoreFields(state);
        version_ = state.at("version").get<int64_t>();
        pendingEvents_.clear();
    }

protected:
    /**
     * @brief Зарегистрировать новое событие: применить и поставить в очередь на запись
     */
    void raise(const std::string& eventType, nlohmann::json payload, int schemaVersion) {
        DomainEvent event;
        event.eventId = utils::UuidGenerator::generate();
        event.aggregateId = id_;
        event.aggregateType = aggregateType();
        event.eventType = eventType;
        event.version = version_ + 1;
        event.schemaVersion = schemaVersion;
        event.payload = std::move(payload);
        event.occurredAt = Timestamp::now();

        when(event);
        ++version_;
        pendingEvents_.push_back(std::move(event));
    }

    virtual void when(const DomainEvent& event) = 0;
    virtual nlohmann::json serializeFields() const = 0;
    virtual void restoreFields(const nlohmann::json& state) = 0;

private:
    std::string id_;
    int64_t version_ = 0;
    std::vector<DomainEvent> pendingEvents_;
};

} // namespace chronicle::domain
