#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace chronicle::domain {

/**
 * @brief Результат проверки документа на соответствие политике
 */
struct Finding {
    std::string requirementId;
    std::string severity;
    std::string description;
    std::optional<std::string> recommendation;

    bool operator==(const Finding& other) const {
        return requirementId == other.requirementId &&
               severity == other.severity &&
               description == other.description &&
               recommendation == other.recommendation;
    }
};

inline void to_json(nlohmann::json& j, const Finding& f) {
    j = nlohmann::json{
        {"requirement_id", f.requirementId},
        {"severity", f.severity},
        {"description", f.description},
        {"recommendation", f.recommendation ? nlohmann::json(*f.recommendation) : nlohmann::json(nullptr)}
    };
}

inline void from_json(const nlohmann::json& j, Finding& f) {
    f.requirementId = j.at("requirement_id").get<std::string>();
    f.severity = j.value("severity", "info");
    f.description = j.value("description", "");
    if (j.contains("recommendation") && !j["recommendation"].is_null()) {
        f.recommendation = j["recommendation"].get<std::string>();
    } else {
        f.recommendation.reset();
    }
}

} // namespace chronicle::domain
