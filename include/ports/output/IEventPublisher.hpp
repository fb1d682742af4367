#pragma once

#include "domain/DomainEvent.hpp"
#include <vector>

namespace chronicle::ports::output {

/**
 * @brief Рассылка сохранённых событий в проекции
 *
 * Вызывается репозиторием только после успешного append.
 * Не бросает: сбои проекций фиксируются трекером.
 */
class IEventPublisher {
public:
    virtual ~IEventPublisher() = default;

    virtual void publish(const domain::DomainEvent& event) = 0;

    virtual void publishAll(const std::vector<domain::DomainEvent>& events) = 0;
};

} // namespace chronicle::ports::output
