#pragma once

#include "domain/Result.hpp"
#include "domain/Snapshot.hpp"
#include "domain/errors/StoreErrors.hpp"
#include <optional>
#include <string>

namespace chronicle::ports::output {

/**
 * @brief Хранилище снапшотов агрегатов
 *
 * Старые снапшоты не удаляются, load() возвращает самый поздний.
 */
class ISnapshotStore {
public:
    virtual ~ISnapshotStore() = default;

    /**
     * @brief Идемпотентный upsert по (aggregateId, version)
     */
    virtual domain::Result<domain::Done, domain::StoreUnavailable> save(const domain::Snapshot& snapshot) = 0;

    virtual domain::Result<std::optional<domain::Snapshot>, domain::StoreUnavailable> load(
        const std::string& aggregateId) = 0;
};

} // namespace chronicle::ports::output
