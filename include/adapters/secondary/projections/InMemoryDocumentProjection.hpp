#pragma once

#include "domain/Document.hpp"
#include "domain/DocumentView.hpp"
#include "ports/output/IProjection.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>

namespace chronicle::adapters::secondary {

/**
 * @brief Read-модель document_views в памяти
 *
 * Событие с version <= version строки уже применено и пропускается,
 * поэтому повторная доставка не меняет результат. Событие через версию
 * (предыдущее ещё не применено) отклоняется исключением и повторяется
 * после того, как пропуск будет заполнен.
 */
class InMemoryDocumentProjection : public ports::output::IProjection {
public:
    static constexpr const char* NAME = "document_views";

    std::string name() const override { return NAME; }

    bool canHandle(const domain::DomainEvent& event) const override {
        return event.aggregateType == domain::Document::AGGREGATE_TYPE;
    }

    void handle(const domain::DomainEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = views_.find(event.aggregateId);
        const bool uploaded = event.eventType == domain::events::DocumentUploaded::TYPE;

        if (it == views_.end()) {
            if (!uploaded) {
                throw std::runtime_error("Document view not found: " + event.aggregateId);
            }
            domain::DocumentView view;
            domain::applyDocumentEvent(view, event);
            views_.emplace(event.aggregateId, view);
            return;
        }

        if (event.version <= it->second.version) {
            return;
        }
        if (event.version > it->second.version + 1) {
            throw std::runtime_error("Document view " + event.aggregateId + " is at version " +
                                     std::to_string(it->second.version) + ", cannot apply version " +
                                     std::to_string(event.version));
        }
        domain::applyDocumentEvent(it->second, event);
    }

    void reset() override {
        std::lock_guard<std::mutex> lock(mutex_);
        views_.clear();
    }

    std::optional<domain::DocumentView> find(const std::string& documentId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = views_.find(documentId);
        if (it == views_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::DocumentView> all() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::DocumentView> result;
        for (const auto& [id, view] : views_) {
            result.push_back(view);
        }
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return views_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, domain::DocumentView> views_;
};

} // namespace chronicle::adapters::secondary
