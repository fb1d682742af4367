#include "domain/events/DocumentEvents.hpp"

namespace chronicle::domain::events {

nlohmann::json DocumentUploaded::toJson() const {
    nlohmann::json j;
    j["filename"] = filename;
    j["original_format"] = originalFormat;
    j["file_size_bytes"] = fileSizeBytes;
    j["uploaded_by"] = uploadedBy;
    j["owner_kerberos_id"] = ownerKerberosId;
    return j;
}

DocumentUploaded DocumentUploaded::fromJson(const nlohmann::json& j) {
    DocumentUploaded e;
    e.filename = j.at("filename").get<std::string>();
    e.originalFormat = j.at("original_format").get<std::string>();
    e.fileSizeBytes = j.at("file_size_bytes").get<int64_t>();
    e.uploadedBy = j.at("uploaded_by").get<std::string>();
    e.ownerKerberosId = j.value("owner_kerberos_id", e.uploadedBy);
    return e;
}

nlohmann::json DocumentConverted::toJson() const {
    nlohmann::json j;
    j["markdown_content"] = markdownContent;
    j["sections"] = sections;
    j["metadata"] = metadata;
    j["conversion_warnings"] = conversionWarnings;
    return j;
}

DocumentConverted DocumentConverted::fromJson(const nlohmann::json& j) {
    DocumentConverted e;
    e.markdownContent = j.at("markdown_content").get<std::string>();
    e.sections = j.at("sections").get<std::vector<Section>>();
    e.metadata = j.value("metadata", std::map<std::string, std::string>{});
    e.conversionWarnings = j.at("conversion_warnings").get<std::vector<std::string>>();
    return e;
}

nlohmann::json AnalysisStarted::toJson() const {
    nlohmann::json j;
    j["policy_repository_id"] = policyRepositoryId;
    j["ai_model"] = aiModel;
    j["initiated_by"] = initiatedBy;
    return j;
}

AnalysisStarted AnalysisStarted::fromJson(const nlohmann::json& j) {
    AnalysisStarted e;
    e.policyRepositoryId = j.at("policy_repository_id").get<std::string>();
    e.aiModel = j.at("ai_model").get<std::string>();
    e.initiatedBy = j.value("initiated_by", "");
    return e;
}

nlohmann::json AnalysisCompleted::toJson() const {
    nlohmann::json j;
    j["findings_count"] = findingsCount;
    j["compliance_score"] = complianceScore;
    j["findings"] = findings;
    j["processing_time_ms"] = processingTimeMs;
    return j;
}

AnalysisCompleted AnalysisCompleted::fromJson(const nlohmann::json& j) {
    AnalysisCompleted e;
    e.findingsCount = j.value("findings_count", 0);
    e.complianceScore = j.at("compliance_score").get<double>();
    e.findings = j.value("findings", std::vector<Finding>{});
    e.processingTimeMs = j.value("processing_time_ms", int64_t{0});
    return e;
}

nlohmann::json AnalysisFailed::toJson() const {
    nlohmann::json j;
    j["error_message"] = errorMessage;
    j["error_code"] = errorCode;
    j["retryable"] = retryable;
    return j;
}

AnalysisFailed AnalysisFailed::fromJson(const nlohmann::json& j) {
    AnalysisFailed e;
    e.errorMessage = j.value("error_message", "");
    e.errorCode = j.value("error_code", "");
    e.retryable = j.value("retryable", false);
    return e;
}

nlohmann::json AnalysisReset::toJson() const {
    nlohmann::json j;
    j["reset_by"] = resetBy;
    j["previous_status"] = previousStatus;
    return j;
}

AnalysisReset AnalysisReset::fromJson(const nlohmann::json& j) {
    AnalysisReset e;
    e.resetBy = j.value("reset_by", "system");
    e.previousStatus = j.value("previous_status", "");
    return e;
}

nlohmann::json DocumentExported::toJson() const {
    nlohmann::json j;
    j["export_format"] = exportFormat;
    j["exported_by"] = exportedBy;
    j["version_number"] = versionNumber;
    return j;
}

DocumentExported DocumentExported::fromJson(const nlohmann::json& j) {
    DocumentExported e;
    e.exportFormat = j.at("export_format").get<std::string>();
    e.exportedBy = j.value("exported_by", "");
    e.versionNumber = j.value("version_number", "");
    return e;
}

nlohmann::json DocumentSharedWithGroup::toJson() const {
    nlohmann::json j;
    j["group"] = group;
    j["shared_by"] = sharedBy;
    return j;
}

DocumentSharedWithGroup DocumentSharedWithGroup::fromJson(const nlohmann::json& j) {
    DocumentSharedWithGroup e;
    e.group = j.at("group").get<std::string>();
    e.sharedBy = j.value("shared_by", "");
    return e;
}

nlohmann::json DocumentMadePrivate::toJson() const {
    nlohmann::json j;
    j["changed_by"] = changedBy;
    return j;
}

DocumentMadePrivate DocumentMadePrivate::fromJson(const nlohmann::json& j) {
    DocumentMadePrivate e;
    e.changedBy = j.value("changed_by", "");
    return e;
}

} // namespace chronicle::domain::events
