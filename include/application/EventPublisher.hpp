#pragma once

#include "application/FailureTrace.hpp"
#include "application/ProjectionRegistry.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IProjectionFailureTracker.hpp"
#include "settings/IPublisherSettings.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace chronicle::application {

/**
 * @brief Рассылка сохранённых событий по проекциям
 *
 * Для каждой проекции с canHandle(event):
 * - handle() с inline-повторами (по умолчанию 3, backoff 1s, 2s, 4s)
 * - успех: tracker->recordSuccess()
 * - окончательный сбой: tracker->recordFailure() + CRITICAL в лог
 *
 * Сбой одной проекции не мешает остальным и следующим событиям.
 * publish() не бросает.
 *
 * @example
 * ```cpp
 * auto publisher = std::make_shared<EventPublisher>(registry, tracker, settings, clock);
 * publisher->publishAll(storedEvents);
 * ```
 */
class EventPublisher : public ports::output::IEventPublisher {
public:
    EventPublisher(
        std::shared_ptr<ProjectionRegistry> registry,
        std::shared_ptr<ports::output::IProjectionFailureTracker> tracker,
        std::shared_ptr<settings::IPublisherSettings> settings,
        std::shared_ptr<ports::output::IClock> clock)
        : registry_(std::move(registry))
        , tracker_(std::move(tracker))
        , clock_(std::move(clock))
        , maxRetries_(settings->getMaxRetries())
        , backoffMs_(settings->getBackoffMs())
    {
        if (backoffMs_.empty()) {
            backoffMs_.push_back(1000);
        }
        std::cout << "[EventPublisher] Created (inline retries=" << maxRetries_ << ")" << std::endl;
    }

    void publish(const domain::DomainEvent& event) override {
        for (const auto& projection : registry_->all()) {
            if (!applies(*projection, event)) {
                continue;
            }
            dispatch(*projection, event);
        }
    }

    void publishAll(const std::vector<domain::DomainEvent>& events) override {
        for (const auto& event : events) {
            publish(event);
        }
    }

private:
    std::shared_ptr<ProjectionRegistry> registry_;
    std::shared_ptr<ports::output::IProjectionFailureTracker> tracker_;
    std::shared_ptr<ports::output::IClock> clock_;
    int maxRetries_;
    std::vector<int> backoffMs_;

    bool applies(const ports::output::IProjection& projection, const domain::DomainEvent& event) {
        try {
            return projection.canHandle(event);
        } catch (const std::exception& e) {
            std::cerr << "[EventPublisher] canHandle failed for " << projection.name()
                      << ": " << e.what() << std::endl;
            return false;
        } catch (...) {
            std::cerr << "[EventPublisher] canHandle failed for " << projection.name()
                      << ": unknown exception" << std::endl;
            return false;
        }
    }

    std::chrono::milliseconds backoffFor(int attempt) const {
        auto index = std::min(static_cast<size_t>(attempt), backoffMs_.size() - 1);
        return std::chrono::milliseconds(backoffMs_[index]);
    }

    void dispatch(ports::output::IProjection& projection, const domain::DomainEvent& event) {
        const auto name = projection.name();
        std::string lastError;

        for (int attempt = 0; attempt <= maxRetries_; ++attempt) {
            try {
                projection.handle(event);
                onSuccess(name, event);
                return;
            } catch (const std::exception& e) {
                lastError = e.what();
            } catch (...) {
                lastError = "unknown exception";
            }

            if (attempt < maxRetries_) {
                auto delay = backoffFor(attempt);
                std::cerr << "[EventPublisher] " << name << " failed on " << event.eventType
                          << " (" << event.eventId << "), attempt " << (attempt + 1)
                          << ", retrying in " << delay.count() << "ms: " << lastError << std::endl;
                clock_->sleepFor(delay);
            }
        }

        onFinalFailure(name, event, lastError);
    }

    void onSuccess(const std::string& name, const domain::DomainEvent& event) {
        try {
            tracker_->recordSuccess(event, name);
        } catch (const std::exception& e) {
            std::cerr << "[EventPublisher] CRITICAL: could not record success of " << name
                      << " for event " << event.eventId << ": " << e.what() << std::endl;
        }
    }

    void onFinalFailure(const std::string& name, const domain::DomainEvent& event, const std::string& error) {
        std::cerr << "[EventPublisher] CRITICAL: projection " << name << " failed on "
                  << event.eventType << " (" << event.eventId << ") after "
                  << (maxRetries_ + 1) << " attempts: " << error << std::endl;

        auto trace = failureTrace(event, name, "publisher") +
                     " attempts=" + std::to_string(maxRetries_ + 1);
        try {
            auto failureId = tracker_->recordFailure(event, name, error, trace);
            std::cerr << "[EventPublisher] Failure recorded: " << failureId << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[EventPublisher] CRITICAL: could not record failure of " << name
                      << " for event " << event.eventId << ": " << e.what() << std::endl;
        }
    }
};

} // namespace chronicle::application
