#pragma once

#include "domain/Finding.hpp"
#include "domain/Section.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * События агрегата Document
 *
 * Каждое событие - версионированная схема payload:
 * - TYPE: имя события в журнале
 * - SCHEMA_VERSION: текущая версия схемы (старые версии поднимает EventUpcasterRegistry)
 * - toJson()/fromJson(): payload без служебных полей
 */
namespace chronicle::domain::events {

struct DocumentUploaded {
    static constexpr const char* TYPE = "DocumentUploaded";
    static constexpr int SCHEMA_VERSION = 2;

    std::string filename;
    std::string originalFormat;
    int64_t fileSizeBytes = 0;     ///< с v2
    std::string uploadedBy;        ///< с v2
    std::string ownerKerberosId;

    nlohmann::json toJson() const;
    static DocumentUploaded fromJson(const nlohmann::json& j);
};

struct DocumentConverted {
    static constexpr const char* TYPE = "DocumentConverted";
    static constexpr int SCHEMA_VERSION = 2;

    std::string markdownContent;
    std::vector<Section> sections;
    std::map<std::string, std::string> metadata;
    std::vector<std::string> conversionWarnings;   ///< с v2

    nlohmann::json toJson() const;
    static DocumentConverted fromJson(const nlohmann::json& j);
};

struct AnalysisStarted {
    static constexpr const char* TYPE = "AnalysisStarted";
    static constexpr int SCHEMA_VERSION = 2;

    std::string policyRepositoryId;
    std::string aiModel;           ///< с v2
    std::string initiatedBy;

    nlohmann::json toJson() const;
    static AnalysisStarted fromJson(const nlohmann::json& j);
};

struct AnalysisCompleted {
    static constexpr const char* TYPE = "AnalysisCompleted";
    static constexpr int SCHEMA_VERSION = 1;

    int findingsCount = 0;
    double complianceScore = 0.0;
    std::vector<Finding> findings;
    int64_t processingTimeMs = 0;

    nlohmann::json toJson() const;
    static AnalysisCompleted fromJson(const nlohmann::json& j);
};

struct AnalysisFailed {
    static constexpr const char* TYPE = "AnalysisFailed";
    static constexpr int SCHEMA_VERSION = 1;

    std::string errorMessage;
    std::string errorCode;
    bool retryable = true;

    nlohmann::json toJson() const;
    static AnalysisFailed fromJson(const nlohmann::json& j);
};

struct AnalysisReset {
    static constexpr const char* TYPE = "AnalysisReset";
    static constexpr int SCHEMA_VERSION = 1;

    std::string resetBy;
    std::string previousStatus;

    nlohmann::json toJson() const;
    static AnalysisReset fromJson(const nlohmann::json& j);
};

struct DocumentExported {
    static constexpr const char* TYPE = "DocumentExported";
    static constexpr int SCHEMA_VERSION = 1;

    std::string exportFormat;
    std::string exportedBy;
    std::string versionNumber;

    nlohmann::json toJson() const;
    static DocumentExported fromJson(const nlohmann::json& j);
};

struct DocumentSharedWithGroup {
    static constexpr const char* TYPE = "DocumentSharedWithGroup";
    static constexpr int SCHEMA_VERSION = 1;

    std::string group;
    std::string sharedBy;

    nlohmann::json toJson() const;
    static DocumentSharedWithGroup fromJson(const nlohmann::json& j);
};

struct DocumentMadePrivate {
    static constexpr const char* TYPE = "DocumentMadePrivate";
    static constexpr int SCHEMA_VERSION = 1;

    std::string changedBy;

    nlohmann::json toJson() const;
    static DocumentMadePrivate fromJson(const nlohmann::json& j);
};

} // namespace chronicle::domain::events
