#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace chronicle::domain {

/**
 * @brief Раздел сконвертированного документа
 */
struct Section {
    std::string title;
    int level = 1;
    std::string content;

    bool operator==(const Section& other) const {
        return title == other.title && level == other.level && content == other.content;
    }
};

inline void to_json(nlohmann::json& j, const Section& s) {
    j = nlohmann::json{{"title", s.title}, {"level", s.level}, {"content", s.content}};
}

inline void from_json(const nlohmann::json& j, Section& s) {
    s.title = j.at("title").get<std::string>();
    s.level = j.value("level", 1);
    s.content = j.value("content", "");
}

} // namespace chronicle::domain
