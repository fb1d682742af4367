#pragma once

#include <stdexcept>
#include <string>

namespace chronicle::domain {

/**
 * @brief Событие не удалось поднять до текущей схемы
 *
 * Цепочка upcaster'ов слишком длинная или upcaster бросил исключение.
 */
class UpcastError : public std::runtime_error {
public:
    UpcastError(const std::string& eventId, const std::string& eventType, const std::string& reason)
        : std::runtime_error("Cannot upcast " + eventType + " event " + eventId + ": " + reason)
        , eventId_(eventId)
    {}

    const std::string& eventId() const { return eventId_; }

private:
    std::string eventId_;
};

} // namespace chronicle::domain
