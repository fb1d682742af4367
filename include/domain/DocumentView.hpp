#pragma once

#include "domain/DomainEvent.hpp"
#include "domain/Timestamp.hpp"
#include "domain/enums/DocumentStatus.hpp"
#include "domain/events/DocumentEvents.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace chronicle::domain {

/**
 * @brief Строка read-модели document_views
 */
struct DocumentView {
    std::string id;
    std::string title;
    std::string originalFormat;
    DocumentStatus status = DocumentStatus::UPLOADED;
    std::optional<std::string> policyRepositoryId;
    std::optional<std::string> complianceStatus;
    std::optional<double> complianceScore;
    int64_t version = 0;          ///< версия агрегата последнего применённого события
    Timestamp updatedAt;
};

/**
 * @brief compliant >= 0.9, partial >= 0.7, иначе non_compliant
 */
inline std::string complianceStatusFor(double score) {
    if (score >= 0.9) return "compliant";
    if (score >= 0.7) return "partial";
    return "non_compliant";
}

/**
 * @brief Статус документа после события (nullopt - событие не меняет статус)
 */
inline std::optional<DocumentStatus> documentStatusAfter(const std::string& eventType) {
    if (eventType == events::DocumentUploaded::TYPE)  return DocumentStatus::UPLOADED;
    if (eventType == events::DocumentConverted::TYPE) return DocumentStatus::CONVERTED;
    if (eventType == events::AnalysisStarted::TYPE)   return DocumentStatus::ANALYZING;
    if (eventType == events::AnalysisCompleted::TYPE) return DocumentStatus::ANALYZED;
    if (eventType == events::AnalysisFailed::TYPE)    return DocumentStatus::FAILED;
    if (eventType == events::AnalysisReset::TYPE)     return DocumentStatus::CONVERTED;
    if (eventType == events::DocumentExported::TYPE)  return DocumentStatus::EXPORTED;
    return std::nullopt;
}

/**
 * @brief Применить событие документа к строке read-модели
 *
 * DocumentUploaded заполняет строку целиком, события статуса меняют
 * статус и связанные поля. Прочие события документа (доступ, видимость)
 * только сдвигают version, чтобы версии строки шли без пропусков.
 * version и updatedAt берутся из события.
 *
 * @throws nlohmann::json::exception при несовместимом payload
 */
inline void applyDocumentEvent(DocumentView& view, const DomainEvent& event) {
    auto status = documentStatusAfter(event.eventType);

    if (event.eventType == events::DocumentUploaded::TYPE) {
        auto uploaded = events::DocumentUploaded::fromJson(event.payload);
        view = DocumentView{};
        view.id = event.aggregateId;
        view.title = uploaded.filename;
        view.originalFormat = uploaded.originalFormat;
    } else if (event.eventType == events::AnalysisStarted::TYPE) {
        view.policyRepositoryId = events::AnalysisStarted::fromJson(event.payload).policyRepositoryId;
    } else if (event.eventType == events::AnalysisCompleted::TYPE) {
        auto score = events::AnalysisCompleted::fromJson(event.payload).complianceScore;
        view.complianceScore = score;
        view.complianceStatus = complianceStatusFor(score);
    }

    if (status) {
        view.status = *status;
    }
    view.version = event.version;
    view.updatedAt = event.occurredAt;
}

} // namespace chronicle::domain
