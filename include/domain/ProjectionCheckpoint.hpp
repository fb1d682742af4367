#pragma once

#include "domain/Timestamp.hpp"
#include <cstdint>
#include <string>

namespace chronicle::domain {

/**
 * @brief Последнее успешно обработанное проекцией событие
 *
 * lastEventSequence не убывает.
 */
struct ProjectionCheckpoint {
    std::string projectionName;
    std::string lastEventId;
    std::string lastEventType;
    int64_t lastEventSequence = 0;
    int64_t eventsProcessed = 0;
    Timestamp checkpointAt;
};

} // namespace chronicle::domain
