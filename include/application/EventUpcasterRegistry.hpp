#pragma once

#include "domain/DomainEvent.hpp"
#include "domain/errors/UpcastError.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>
#include <map>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>

namespace chronicle::application {

/**
 * @brief Реестр upcaster-ов схем payload событий
 *
 * Upcaster поднимает payload события eventType с версии fromVersion на fromVersion + 1.
 * При загрузке из журнала цепочка применяется, пока есть подходящий upcaster
 * (не более MAX_CHAIN_LENGTH шагов).
 *
 * @example
 * ```cpp
 * registry.registerUpcaster("AnalysisStarted", 1, [](nlohmann::json p) {
 *     p["ai_model"] = "claude";
 *     return p;
 * });
 * auto event = registry.upcast(storedEvent);  // schemaVersion == 2
 * ```
 *
 * Thread-safe: да
 */
class EventUpcasterRegistry {
public:
    using Upcaster = std::function<nlohmann::json(nlohmann::json)>;

    static constexpr int MAX_CHAIN_LENGTH = 10;

    void registerUpcaster(const std::string& eventType, int fromVersion, Upcaster upcaster) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        upcasters_[{eventType, fromVersion}] = std::move(upcaster);
        std::cout << "[EventUpcasterRegistry] Registered " << eventType
                  << " v" << fromVersion << " -> v" << (fromVersion + 1) << std::endl;
    }

    bool hasUpcaster(const std::string& eventType, int fromVersion) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return upcasters_.count({eventType, fromVersion}) > 0;
    }

    /**
     * @brief Поднять событие до последней известной версии схемы
     * @throws domain::UpcastError если цепочка длиннее MAX_CHAIN_LENGTH
     *         или upcaster бросил исключение
     */
    domain::DomainEvent upcast(domain::DomainEvent event) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        for (int step = 0; ; ++step) {
            auto it = upcasters_.find({event.eventType, event.schemaVersion});
            if (it == upcasters_.end()) {
                return event;
            }
            if (step >= MAX_CHAIN_LENGTH) {
                throw domain::UpcastError(event.eventId, event.eventType,
                                          "chain exceeds " + std::to_string(MAX_CHAIN_LENGTH) + " steps");
            }
            try {
                event.payload = it->second(std::move(event.payload));
            } catch (const std::exception& e) {
                throw domain::UpcastError(event.eventId, event.eventType,
                                          "v" + std::to_string(event.schemaVersion) + ": " + e.what());
            }
            ++event.schemaVersion;
        }
    }

private:
    mutable std::shared_mutex mutex_;
    std::map<std::pair<std::string, int>, Upcaster> upcasters_;
};

/**
 * @brief Upcaster-ы событий Document
 *
 * - DocumentUploaded v1 -> v2: file_size_bytes = 0, uploaded_by = "system"
 * - AnalysisStarted v1 -> v2: ai_model = "claude"
 * - DocumentConverted v1 -> v2: conversion_warnings = []
 */
inline void registerDocumentUpcasters(EventUpcasterRegistry& registry) {
    registry.registerUpcaster("DocumentUploaded", 1, [](nlohmann::json payload) {
        if (!payload.contains("file_size_bytes")) {
            payload["file_size_bytes"] = 0;
        }
        if (!payload.contains("uploaded_by")) {
            payload["uploaded_by"] = "system";
        }
        return payload;
    });

    registry.registerUpcaster("AnalysisStarted", 1, [](nlohmann::json payload) {
        if (!payload.contains("ai_model")) {
            payload["ai_model"] = "claude";
        }
        return payload;
    });

    registry.registerUpcaster("DocumentConverted", 1, [](nlohmann::json payload) {
        if (!payload.contains("conversion_warnings")) {
            payload["conversion_warnings"] = nlohmann::json::array();
        }
        return payload;
    });
}

} // namespace chronicle::application
