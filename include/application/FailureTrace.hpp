#pragma once

#include "domain/DomainEvent.hpp"
#include <string>

namespace chronicle::application {

/**
 * @brief Контекст сбоя для поля error_trace
 * @param origin кто запускал проекцию: publisher, retry-worker, replay, manual-retry
 */
inline std::string failureTrace(const domain::DomainEvent& event,
                                const std::string& projectionName,
                                const std::string& origin) {
    return "origin=" + origin +
           " projection=" + projectionName +
           " event_id=" + event.eventId +
           " event_type=" + event.eventType +
           " aggregate_id=" + event.aggregateId +
           " version=" + std::to_string(event.version) +
           " sequence=" + std::to_string(event.sequence);
}

} // namespace chronicle::application
