#pragma once

#include <string>
#include <stdexcept>

namespace chronicle::domain {

/**
 * @brief Жизненный цикл документа
 */
enum class DocumentStatus {
    DRAFT,
    UPLOADED,
    CONVERTED,
    ANALYZING,
    ANALYZED,
    EXPORTED,
    FAILED
};

inline std::string toString(DocumentStatus status) {
    switch (status) {
        case DocumentStatus::DRAFT:     return "DRAFT";
        case DocumentStatus::UPLOADED:  return "UPLOADED";
        case DocumentStatus::CONVERTED: return "CONVERTED";
        case DocumentStatus::ANALYZING: return "ANALYZING";
        case DocumentStatus::ANALYZED:  return "ANALYZED";
        case DocumentStatus::EXPORTED:  return "EXPORTED";
        case DocumentStatus::FAILED:    return "FAILED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline DocumentStatus documentStatusFromString(const std::string& str) {
    if (str == "DRAFT")     return DocumentStatus::DRAFT;
    if (str == "UPLOADED")  return DocumentStatus::UPLOADED;
    if (str == "CONVERTED") return DocumentStatus::CONVERTED;
    if (str == "ANALYZING") return DocumentStatus::ANALYZING;
    if (str == "ANALYZED")  return DocumentStatus::ANALYZED;
    if (str == "EXPORTED")  return DocumentStatus::EXPORTED;
    if (str == "FAILED")    return DocumentStatus::FAILED;
    throw std::invalid_argument("Unknown DocumentStatus: " + str);
}

/**
 * @brief Можно ли запустить анализ из данного статуса
 */
inline bool canStartAnalysis(DocumentStatus status) {
    return status == DocumentStatus::CONVERTED ||
           status == DocumentStatus::ANALYZED ||
           status == DocumentStatus::EXPORTED ||
           status == DocumentStatus::FAILED;
}

} // namespace chronicle::domain
