#pragma once

#include "ports/output/IProjection.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace chronicle::application {

/**
 * @brief Зарегистрированные проекции
 *
 * Общий для EventPublisher, RetryWorker и ProjectionAdminService.
 * Порядок рассылки совпадает с порядком регистрации.
 */
class ProjectionRegistry {
public:
    /**
     * @brief Зарегистрировать проекцию (проекция с тем же именем заменяется)
     */
    void registerProjection(std::shared_ptr<ports::output::IProjection> projection) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto name = projection->name();

        auto it = std::find_if(projections_.begin(), projections_.end(),
            [&name](const auto& p) { return p->name() == name; });

        if (it != projections_.end()) {
            std::cerr << "[ProjectionRegistry] Replacing projection: " << name << std::endl;
            *it = std::move(projection);
            return;
        }

        projections_.push_back(std::move(projection));
        std::cout << "[ProjectionRegistry] Registered projection: " << name << std::endl;
    }

    std::shared_ptr<ports::output::IProjection> find(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& p : projections_) {
            if (p->name() == name) {
                return p;
            }
        }
        return nullptr;
    }

    std::vector<std::shared_ptr<ports::output::IProjection>> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return projections_;
    }

    std::vector<std::string> names() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& p : projections_) {
            result.push_back(p->name());
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return projections_.size();
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ports::output::IProjection>> projections_;
};

} // namespace chronicle::application
