#pragma once

#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace chronicle::domain {

/**
 * @brief Полный слепок состояния агрегата на версии version
 */
struct Snapshot {
    std::string aggregateId;
    std::string aggregateType;
    int64_t version = 0;
    nlohmann::json state = nlohmann::json::object();
    Timestamp createdAt;
};

} // namespace chronicle::domain
