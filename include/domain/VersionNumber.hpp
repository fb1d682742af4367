#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace chronicle::domain {

/**
 * @brief Семантическая версия документа (major.minor.patch)
 */
struct VersionNumber {
    int major = 1;
    int minor = 0;
    int patch = 0;

    VersionNumber incrementPatch() const {
        return VersionNumber{major, minor, patch + 1};
    }

    std::string toString() const {
        return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    }

    bool operator==(const VersionNumber& other) const {
        return major == other.major && minor == other.minor && patch == other.patch;
    }
    bool operator!=(const VersionNumber& other) const { return !(*this == other); }
};

inline void to_json(nlohmann::json& j, const VersionNumber& v) {
    j = nlohmann::json{{"major", v.major}, {"minor", v.minor}, {"patch", v.patch}};
}

inline void from_json(const nlohmann::json& j, VersionNumber& v) {
    v.major = j.at("major").get<int>();
    v.minor = j.at("minor").get<int>();
    v.patch = j.at("patch").get<int>();
}

} // namespace chronicle::domain
