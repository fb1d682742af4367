#pragma once

#include "domain/DomainEvent.hpp"
#include <string>

namespace chronicle::ports::output {

/**
 * @brief Read-модель, строящаяся из событий
 *
 * handle() обязан быть идемпотентным (upsert): одно событие может прийти
 * повторно при retry или replay.
 */
class IProjection {
public:
    virtual ~IProjection() = default;

    virtual std::string name() const = 0;

    virtual bool canHandle(const domain::DomainEvent& event) const = 0;

    /**
     * @throws std::exception при любой ошибке обработки
     */
    virtual void handle(const domain::DomainEvent& event) = 0;

    /**
     * @brief Очистить read-модель (перед полным replay)
     */
    virtual void reset() = 0;
};

} // namespace chronicle::ports::output
