#pragma once

#include "ports/output/ISnapshotStore.hpp"
#include <atomic>
#include <map>
#include <mutex>

namespace chronicle::adapters::secondary {

/**
 * @brief In-memory хранилище снапшотов (все версии сохраняются)
 */
class InMemorySnapshotStore : public ports::output::ISnapshotStore {
public:
    domain::Result<domain::Done, domain::StoreUnavailable> save(const domain::Snapshot& snapshot) override {
        using R = domain::Result<domain::Done, domain::StoreUnavailable>;

        if (!available_.load()) {
            return R::fail({"in-memory snapshot store switched off"});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        snapshots_[snapshot.aggregateId][snapshot.version] = snapshot;
        return R::ok({});
    }

    domain::Result<std::optional<domain::Snapshot>, domain::StoreUnavailable> load(
        const std::string& aggregateId) override
    {
        using R = domain::Result<std::optional<domain::Snapshot>, domain::StoreUnavailable>;

        if (!available_.load()) {
            return R::fail({"in-memory snapshot store switched off"});
        }

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = snapshots_.find(aggregateId);
        if (it == snapshots_.end() || it->second.empty()) {
            return R::ok(std::nullopt);
        }
        return R::ok(it->second.rbegin()->second);
    }

    /**
     * @brief Количество снапшотов агрегата (все версии)
     */
    size_t count(const std::string& aggregateId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = snapshots_.find(aggregateId);
        return it == snapshots_.end() ? 0 : it->second.size();
    }

    void setAvailable(bool available) {
        available_.store(available);
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::map<int64_t, domain::Snapshot>> snapshots_;
    std::atomic<bool> available_{true};
};

} // namespace chronicle::adapters::secondary
