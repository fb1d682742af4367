#pragma once

#include "application/EventUpcasterRegistry.hpp"
#include "ports/output/IEventStore.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace chronicle::adapters::secondary {

/**
 * @brief In-memory журнал событий
 *
 * append() атомарен под unique_lock, чтения под shared_lock.
 * Версия агрегата = число его событий.
 * События хранятся в записанной схеме, upcasting выполняется при чтении.
 */
class InMemoryEventStore : public ports::output::IEventStore {
public:
    explicit InMemoryEventStore(std::shared_ptr<application::EventUpcasterRegistry> upcasters)
        : upcasters_(std::move(upcasters))
    {}

    domain::Result<std::vector<domain::DomainEvent>, domain::AppendError> append(
        const std::string& aggregateId,
        const std::vector<domain::DomainEvent>& events,
        int64_t expectedVersion) override
    {
        using R = domain::Result<std::vector<domain::DomainEvent>, domain::AppendError>;

        if (!available_.load()) {
            return R::fail(domain::StoreUnavailable{"in-memory store switched off"});
        }
        if (events.empty()) {
            return R::ok({});
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto existing = streams_.find(aggregateId);
        const auto currentVersion = existing == streams_.end() ? int64_t{0}
                                                               : static_cast<int64_t>(existing->second.size());
        if (currentVersion != expectedVersion) {
            return R::fail(domain::ConcurrencyError{aggregateId, expectedVersion, currentVersion});
        }

        auto& stream = streams_[aggregateId];
        std::vector<domain::DomainEvent> stored;
        stored.reserve(events.size());

        int64_t version = expectedVersion;
        for (const auto& event : events) {
            domain::DomainEvent copy = event;
            copy.aggregateId = aggregateId;
            copy.version = ++version;
            copy.sequence = static_cast<int64_t>(log_.size()) + 1;

            stream.push_back(log_.size());
            byEventId_[copy.eventId] = log_.size();
            log_.push_back(copy);
            stored.push_back(std::move(copy));
        }

        return R::ok(std::move(stored));
    }

    domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable> load(
        const std::string& aggregateId,
        int64_t fromVersion) override
    {
        using R = domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable>;

        if (!available_.load()) {
            return R::fail({"in-memory store switched off"});
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);

        std::vector<domain::DomainEvent> result;
        auto it = streams_.find(aggregateId);
        if (it == streams_.end()) {
            return R::ok(result);
        }

        for (auto index : it->second) {
            if (log_[index].version > fromVersion) {
                result.push_back(upcasters_->upcast(log_[index]));
            }
        }
        return R::ok(result);
    }

    domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable> loadAll(
        int64_t fromSequence,
        int limit) override
    {
        using R = domain::Result<std::vector<domain::DomainEvent>, domain::StoreUnavailable>;

        if (!available_.load()) {
            return R::fail({"in-memory store switched off"});
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);

        std::vector<domain::DomainEvent> result;
        // sequence == индекс + 1
        auto start = static_cast<size_t>(std::max<int64_t>(fromSequence, 0));
        for (size_t i = start; i < log_.size() && static_cast<int>(result.size()) < limit; ++i) {
            result.push_back(upcasters_->upcast(log_[i]));
        }
        return R::ok(result);
    }

    domain::Result<std::optional<domain::DomainEvent>, domain::StoreUnavailable> loadEvent(
        const std::string& eventId) override
    {
        using R = domain::Result<std::optional<domain::DomainEvent>, domain::StoreUnavailable>;

        if (!available_.load()) {
            return R::fail({"in-memory store switched off"});
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = byEventId_.find(eventId);
        if (it == byEventId_.end()) {
            return R::ok(std::nullopt);
        }
        return R::ok(upcasters_->upcast(log_[it->second]));
    }

    domain::Result<int64_t, domain::StoreUnavailable> latestSequence() override {
        using R = domain::Result<int64_t, domain::StoreUnavailable>;

        if (!available_.load()) {
            return R::fail({"in-memory store switched off"});
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        return R::ok(static_cast<int64_t>(log_.size()));
    }

    domain::Result<int64_t, domain::StoreUnavailable> countEvents(const std::string& aggregateId) override {
        using R = domain::Result<int64_t, domain::StoreUnavailable>;

        if (!available_.load()) {
            return R::fail({"in-memory store switched off"});
        }

        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = streams_.find(aggregateId);
        return R::ok(it == streams_.end() ? 0 : static_cast<int64_t>(it->second.size()));
    }

    size_t streamCount() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return streams_.size();
    }

    /**
     * @brief Имитация недоступности хранилища
     */
    void setAvailable(bool available) {
        available_.store(available);
    }

private:
    std::shared_ptr<application::EventUpcasterRegistry> upcasters_;

    mutable std::shared_mutex mutex_;
    std::vector<domain::DomainEvent> log_;                       ///< глобальный порядок
    std::map<std::string, std::vector<size_t>> streams_;        ///< aggregateId -> индексы в log_
    std::unordered_map<std::string, size_t> byEventId_;
    std::atomic<bool> available_{true};
};

} // namespace chronicle::adapters::secondary
