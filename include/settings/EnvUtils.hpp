#pragma once

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

namespace chronicle::settings {

inline std::string getEnvOrDefault(const char* name, const char* defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string(defaultValue);
}

/**
 * @brief "1000,2000,4000" -> {1000, 2000, 4000}
 * @throws std::invalid_argument если элемент не число
 */
inline std::vector<int> parseIntList(const std::string& csv) {
    std::vector<int> result;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) {
            result.push_back(std::stoi(item));
        }
    }
    return result;
}

} // namespace chronicle::settings
