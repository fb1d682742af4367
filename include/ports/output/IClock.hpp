#pragma once

#include "domain/Timestamp.hpp"
#include <chrono>

namespace chronicle::ports::output {

/**
 * @brief Источник времени и задержек
 *
 * Реализуется SystemClock. В тестах подменяется, чтобы не спать на backoff.
 */
class IClock {
public:
    virtual ~IClock() = default;

    virtual domain::Timestamp now() const = 0;

    virtual void sleepFor(std::chrono::milliseconds duration) = 0;
};

} // namespace chronicle::ports::output
