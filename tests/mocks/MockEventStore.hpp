#pragma once

#include "ports/output/IEventStore.hpp"
#include <gmock/gmock.h>

namespace chronicle::tests {

class MockEventStore : public ports::output::IEventStore {
public:
    using AppendResult = domain::Result<std::vector<domain::DomainEvent>, domain::AppendError>;
    using EventsResult = domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable>;
    using EventResult = domain::Result<std::optional<domain::DomainEvent>, domain::StoreUnavailable>;
    using CountResult = domain::Result<int64_t, domain::StoreUnavailable>;

    MOCK_METHOD(AppendResult, append,
                (const std::string& aggregateId, const std::vector<domain::DomainEvent>& events, int64_t expectedVersion),
                (override));
    MOCK_METHOD(EventsResult, load, (const std::string& aggregateId, int64_t fromVersion), (override));
    MOCK_METHOD(EventsResult, loadAll, (int64_t fromSequence, int limit), (override));
    MOCK_METHOD(EventResult, loadEvent, (const std::string& eventId), (override));
    MOCK_METHOD(CountResult, latestSequence, (), (override));
    MOCK_METHOD(CountResult, countEvents, (const std::string& aggregateId), (override));
};

} // namespace chronicle::tests
