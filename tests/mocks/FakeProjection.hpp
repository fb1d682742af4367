#pragma once

#include "ports/output/IProjection.hpp"
#include <atomic>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace chronicle::tests {

/**
 * @brief Проекция для тестов: падает заданное число раз, затем обрабатывает
 *
 * failuresLeft < 0 - падает всегда. throwNonStandard() - бросает int
 * вместо std::exception.
 */
class FakeProjection : public ports::output::IProjection {
public:
    explicit FakeProjection(std::string name, std::set<std::string> handledTypes = {})
        : name_(std::move(name)), handledTypes_(std::move(handledTypes)) {}

    std::string name() const override { return name_; }

    bool canHandle(const domain::DomainEvent& event) const override {
        return handledTypes_.empty() || handledTypes_.count(event.eventType) > 0;
    }

    void handle(const domain::DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++attempts_;
        if (failuresLeft_ != 0) {
            if (failuresLeft_ > 0) {
                --failuresLeft_;
            }
            if (nonStandard_) {
                throw 42;
            }
            throw std::runtime_error(name_ + " cannot handle " + event.eventId);
        }
        handled_.push_back(event.eventId);
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        handled_.clear();
        ++resets_;
    }

    void failTimes(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failuresLeft_ = count;
    }

    void failAlways() { failTimes(-1); }

    void throwNonStandard() {
        std::lock_guard<std::mutex> lock(mutex_);
        nonStandard_ = true;
        failuresLeft_ = -1;
    }
    void recover() { failTimes(0); }

    std::vector<std::string> handled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handled_;
    }

    int attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    int resets() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return resets_;
    }

private:
    std::string name_;
    std::set<std::string> handledTypes_;

    mutable std::mutex mutex_;
    int failuresLeft_ = 0;
    bool nonStandard_ = false;
    int attempts_ = 0;
    int resets_ = 0;
    std::vector<std::string> handled_;
};

} // namespace chronicle::tests
