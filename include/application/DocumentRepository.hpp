#pragma once

#include "application/AggregateRepository.hpp"
#include "domain/Document.hpp"

namespace chronicle::application {

/**
 * @brief Репозиторий агрегата Document
 */
class DocumentRepository : public AggregateRepository<domain::Document> {
public:
    DocumentRepository(
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<ports::output::ISnapshotStore> snapshotStore,
        std::shared_ptr<ports::output::IEventPublisher> publisher,
        std::shared_ptr<settings::IRepositorySettings> settings,
        std::shared_ptr<ports::output::IClock> clock)
        : AggregateRepository<domain::Document>(
              std::move(eventStore), std::move(snapshotStore), std::move(publisher),
              std::move(settings), std::move(clock))
    {}
};

} // namespace chronicle::application
