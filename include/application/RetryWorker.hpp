#pragma once

#include "application/FailureTrace.hpp"
#include "application/ProjectionRegistry.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/IProjectionFailureTracker.hpp"
#include "settings/IRetryWorkerSettings.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace chronicle::application {

/**
 * @brief Итог одного цикла повторов
 */
struct RetryCycleStats {
    int due = 0;
    int succeeded = 0;
    int failed = 0;
};

/**
 * @brief Фоновые повторы сбоев проекций
 *
 * Каждые intervalSeconds:
 * - берёт у трекера сбои, у которых подошёл nextRetryAt
 * - достаёт событие из журнала по eventId
 * - повторно вызывает проекцию и отдаёт результат в recordSuccess/recordFailure
 *
 * Событие, которого нет в журнале, и незарегистрированная проекция
 * записываются как новый сбой (backoff, затем автоповторы прекращаются).
 *
 * stop() кооперативный: текущий повтор доводится до конца,
 * спящий поток будится сразу.
 *
 * @example
 * ```cpp
 * RetryWorker worker(registry, tracker, eventStore, settings);
 * worker.start();
 * // ...
 * worker.stop();
 * ```
 *
 * Thread-safe: да
 */
class RetryWorker {
public:
    RetryWorker(
        std::shared_ptr<ProjectionRegistry> registry,
        std::shared_ptr<ports::output::IProjectionFailureTracker> tracker,
        std::shared_ptr<ports::output::IEventStore> eventStore,
        std::shared_ptr<settings::IRetryWorkerSettings> settings)
        : registry_(std::move(registry))
        , tracker_(std::move(tracker))
        , eventStore_(std::move(eventStore))
        , interval_(std::chrono::seconds(settings->getIntervalSeconds()))
        , running_(false)
        , cycleCount_(0)
    {}

    ~RetryWorker() {
        stop();
    }

    // Non-copyable, non-movable
    RetryWorker(const RetryWorker&) = delete;
    RetryWorker& operator=(const RetryWorker&) = delete;

    /**
     * @brief Запустить фоновый цикл
     * @param interval Интервал между циклами (по умолчанию из настроек)
     */
    void start() {
        start(interval_);
    }

    void start(std::chrono::milliseconds interval) {
        if (running_.exchange(true)) {
            return;  // Уже запущен
        }

        interval_ = interval;
        std::cout << "[RetryWorker] Started (interval " << interval.count() << "ms)" << std::endl;

        workerThread_ = std::thread([this]() {
            runLoop();
        });
    }

    /**
     * @brief Остановить цикл и дождаться потока
     */
    void stop() {
        if (!running_.exchange(false)) {
            return;  // Уже остановлен
        }

        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
        }
        wakeUp_.notify_all();

        if (workerThread_.joinable()) {
            workerThread_.join();
        }
        std::cout << "[RetryWorker] Stopped after " << cycleCount_.load() << " cycles" << std::endl;
    }

    bool isRunning() const {
        return running_.load();
    }

    uint64_t cycleCount() const {
        return cycleCount_.load();
    }

    /**
     * @brief Один цикл повторов в текущем потоке (для тестов и ручного запуска)
     */
    RetryCycleStats runOnce() {
        return runCycle(false);
    }

private:
    std::shared_ptr<ProjectionRegistry> registry_;
    std::shared_ptr<ports::output::IProjectionFailureTracker> tracker_;
    std::shared_ptr<ports::output::IEventStore> eventStore_;

    std::chrono::milliseconds interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> cycleCount_;
    std::thread workerThread_;

    std::mutex wakeMutex_;
    std::condition_variable wakeUp_;

    void runLoop() {
        while (running_.load()) {
            runCycle(true);

            std::unique_lock<std::mutex> lock(wakeMutex_);
            wakeUp_.wait_for(lock, interval_, [this]() { return !running_.load(); });
        }
    }

    RetryCycleStats runCycle(bool inBackground) {
        RetryCycleStats stats;

        std::vector<domain::ProjectionFailure> due;
        try {
            due = tracker_->getFailuresDueForRetry();
        } catch (const std::exception& e) {
            std::cerr << "[RetryWorker] Cannot fetch due failures: " << e.what() << std::endl;
            ++cycleCount_;
            return stats;
        }

        stats.due = static_cast<int>(due.size());
        if (!due.empty()) {
            std::cout << "[RetryWorker] " << due.size() << " failures due for retry" << std::endl;
        }

        for (const auto& failure : due) {
            if (inBackground && !running_.load()) {
                break;
            }
            try {
                if (retry(failure)) {
                    ++stats.succeeded;
                } else {
                    ++stats.failed;
                }
            } catch (const std::exception& e) {
                // Трекер недоступен: сбой останется due и будет взят в следующем цикле
                std::cerr << "[RetryWorker] Cannot record retry result for " << failure.id
                          << ": " << e.what() << std::endl;
                ++stats.failed;
            } catch (...) {
                std::cerr << "[RetryWorker] CRITICAL: unknown exception while retrying "
                          << failure.id << std::endl;
                ++stats.failed;
            }
        }

        ++cycleCount_;
        return stats;
    }

    bool retry(const domain::ProjectionFailure& failure) {
        auto loaded = eventStore_->loadEvent(failure.eventId);
        if (!loaded) {
            std::cerr << "[RetryWorker] Event store unavailable, skipping " << failure.id
                      << ": " << loaded.error().message() << std::endl;
            return false;
        }

        if (!loaded.value()) {
            domain::DomainEvent missing;
            missing.eventId = failure.eventId;
            missing.eventType = failure.eventType;
            std::cerr << "[RetryWorker] Event " << failure.eventId << " not found in store" << std::endl;
            tracker_->recordFailure(missing, failure.projectionName,
                                    "Event " + failure.eventId + " not found in event store",
                                    failureTrace(missing, failure.projectionName, "retry-worker"));
            return false;
        }

        const auto& event = *loaded.value();

        auto projection = registry_->find(failure.projectionName);
        if (!projection) {
            std::cerr << "[RetryWorker] WARNING: projection " << failure.projectionName
                      << " is not registered" << std::endl;
            tracker_->recordFailure(event, failure.projectionName,
                                    "Projection " + failure.projectionName + " is not registered",
                                    failureTrace(event, failure.projectionName, "retry-worker"));
            return false;
        }

        std::optional<std::string> error;
        try {
            projection->handle(event);
        } catch (const std::exception& e) {
            error = e.what();
        } catch (...) {
            error = "unknown exception";
            std::cerr << "[RetryWorker] CRITICAL: " << failure.projectionName
                      << " threw a non-standard exception on " << event.eventId << std::endl;
        }

        if (error) {
            std::cerr << "[RetryWorker] Retry " << (failure.retryCount + 1) << " of "
                      << failure.projectionName << " on " << event.eventId
                      << " failed: " << *error << std::endl;
            tracker_->recordFailure(event, failure.projectionName, *error,
                                    failureTrace(event, failure.projectionName, "retry-worker"));
            return false;
        }

        tracker_->recordSuccess(event, failure.projectionName, domain::ResolutionMethod::AUTO_RETRY);
        std::cout << "[RetryWorker] " << failure.projectionName << " recovered on "
                  << event.eventId << std::endl;
        return true;
    }
};

} // namespace chronicle::application
