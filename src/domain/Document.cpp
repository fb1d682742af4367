#include "domain/Document.hpp"
#include "domain/errors/InvalidDocumentState.hpp"
#include "domain/events/DocumentEvents.hpp"
#include <algorithm>
#include <stdexcept>

namespace chronicle::domain {

using namespace chronicle::domain::events;

Document::Document(std::string id) : Aggregate(std::move(id)) {}

// ============================================
// Команды
// ============================================

Document Document::upload(const std::string& id,
                          const std::string& filename,
                          int64_t fileSizeBytes,
                          const std::string& originalFormat,
                          const std::string& uploadedBy) {
    Document document(id);

    DocumentUploaded event;
    event.filename = filename;
    event.originalFormat = originalFormat;
    event.fileSizeBytes = fileSizeBytes;
    event.uploadedBy = uploadedBy;
    event.ownerKerberosId = uploadedBy;
    document.raise(DocumentUploaded::TYPE, event.toJson(), DocumentUploaded::SCHEMA_VERSION);

    return document;
}

void Document::convert(const std::string& markdownContent,
                       const std::vector<Section>& sections,
                       const std::map<std::string, std::string>& metadata,
                       const std::vector<std::string>& conversionWarnings) {
    requireStatus("convert", {DocumentStatus::UPLOADED}, "UPLOADED");

    DocumentConverted event;
    event.markdownContent = markdownContent;
    event.sections = sections;
    event.metadata = metadata;
    event.conversionWarnings = conversionWarnings;
    raise(DocumentConverted::TYPE, event.toJson(), DocumentConverted::SCHEMA_VERSION);
}

void Document::startAnalysis(const std::string& policyRepositoryId,
                             const std::string& aiModel,
                             const std::string& initiatedBy) {
    if (status_ == DocumentStatus::ANALYZING) {
        throw InvalidDocumentState(id(), "start analysis of", toString(status_),
                                   "analysis not in progress");
    }
    if (!canStartAnalysis(status_)) {
        throw InvalidDocumentState(id(), "start analysis of", toString(status_),
                                   "CONVERTED, ANALYZED, EXPORTED or FAILED");
    }

    AnalysisStarted event;
    event.policyRepositoryId = policyRepositoryId;
    event.aiModel = aiModel;
    event.initiatedBy = initiatedBy;
    raise(AnalysisStarted::TYPE, event.toJson(), AnalysisStarted::SCHEMA_VERSION);
}

void Document::completeAnalysis(int findingsCount,
                                double complianceScore,
                                const std::vector<Finding>& findings,
                                int64_t processingTimeMs) {
    requireStatus("complete analysis of", {DocumentStatus::ANALYZING}, "ANALYZING");

    AnalysisCompleted event;
    event.findingsCount = findingsCount;
    event.complianceScore = complianceScore;
    event.findings = findings;
    event.processingTimeMs = processingTimeMs;
    raise(AnalysisCompleted::TYPE, event.toJson(), AnalysisCompleted::SCHEMA_VERSION);
}

void Document::failAnalysis(const std::string& reason, const std::string& errorCode, bool retryable) {
    requireStatus("fail analysis of", {DocumentStatus::ANALYZING}, "ANALYZING");

    AnalysisFailed event;
    event.errorMessage = reason;
    event.errorCode = errorCode;
    event.retryable = retryable;
    raise(AnalysisFailed::TYPE, event.toJson(), AnalysisFailed::SCHEMA_VERSION);
}

void Document::resetForRetry(const std::string& resetBy) {
    requireStatus("reset", {DocumentStatus::ANALYZING, DocumentStatus::FAILED}, "ANALYZING or FAILED");

    AnalysisReset event;
    event.resetBy = resetBy;
    event.previousStatus = toString(status_);
    raise(AnalysisReset::TYPE, event.toJson(), AnalysisReset::SCHEMA_VERSION);
}

void Document::exportDocument(const std::string& exportFormat, const std::string& exportedBy) {
    requireStatus("export", {DocumentStatus::ANALYZED, DocumentStatus::EXPORTED}, "ANALYZED or EXPORTED");

    DocumentExported event;
    event.exportFormat = exportFormat;
    event.exportedBy = exportedBy;
    event.versionNumber = currentVersion_.toString();
    raise(DocumentExported::TYPE, event.toJson(), DocumentExported::SCHEMA_VERSION);
}

void Document::shareWithGroup(const std::string& group, const std::string& sharedBy) {
    if (sharedWithGroups_.count(group) > 0) {
        return;
    }

    DocumentSharedWithGroup event;
    event.group = group;
    event.sharedBy = sharedBy;
    raise(DocumentSharedWithGroup::TYPE, event.toJson(), DocumentSharedWithGroup::SCHEMA_VERSION);
}

void Document::makePrivate(const std::string& changedBy) {
    if (visibility_ == VISIBILITY_PRIVATE && sharedWithGroups_.empty()) {
        return;
    }

    DocumentMadePrivate event;
    event.changedBy = changedBy;
    raise(DocumentMadePrivate::TYPE, event.toJson(), DocumentMadePrivate::SCHEMA_VERSION);
}

bool Document::canView(const std::string& userKerberosId, const std::set<std::string>& userGroups) const {
    if (ownerKerberosId_ == userKerberosId) {
        return true;
    }
    if (visibility_ != VISIBILITY_GROUP) {
        return false;
    }
    return std::any_of(userGroups.begin(), userGroups.end(),
        [this](const std::string& group) { return sharedWithGroups_.count(group) > 0; });
}

void Document::requireStatus(const std::string& operation,
                             std::initializer_list<DocumentStatus> allowed,
                             const std::string& required) const {
    if (std::find(allowed.begin(), allowed.end(), status_) == allowed.end()) {
        throw InvalidDocumentState(id(), operation, toString(status_), required);
    }
}

// ============================================
// Применение событий
// ============================================

void Document::when(const DomainEvent& event) {
    const auto& type = event.eventType;

    if (type == DocumentUploaded::TYPE) {
        auto e = DocumentUploaded::fromJson(event.payload);
        filename_ = e.filename;
        originalFormat_ = e.originalFormat;
        ownerKerberosId_ = e.ownerKerberosId;
        status_ = DocumentStatus::UPLOADED;
    } else if (type == DocumentConverted::TYPE) {
        auto e = DocumentConverted::fromJson(event.payload);
        markdownContent_ = e.markdownContent;
        sections_ = e.sections;
        metadata_ = e.metadata;
        status_ = DocumentStatus::CONVERTED;
    } else if (type == AnalysisStarted::TYPE) {
        auto e = AnalysisStarted::fromJson(event.payload);
        policyRepositoryId_ = e.policyRepositoryId;
        status_ = DocumentStatus::ANALYZING;
    } else if (type == AnalysisCompleted::TYPE) {
        auto e = AnalysisCompleted::fromJson(event.payload);
        complianceScore_ = e.complianceScore;
        findings_ = e.findings;
        status_ = DocumentStatus::ANALYZED;
    } else if (type == AnalysisFailed::TYPE) {
        status_ = DocumentStatus::FAILED;
    } else if (type == AnalysisReset::TYPE) {
        status_ = DocumentStatus::CONVERTED;
    } else if (type == DocumentExported::TYPE) {
        currentVersion_ = currentVersion_.incrementPatch();
        status_ = DocumentStatus::EXPORTED;
    } else if (type == DocumentSharedWithGroup::TYPE) {
        auto e = DocumentSharedWithGroup::fromJson(event.payload);
        sharedWithGroups_.insert(e.group);
        visibility_ = VISIBILITY_GROUP;
    } else if (type == DocumentMadePrivate::TYPE) {
        sharedWithGroups_.clear();
        visibility_ = VISIBILITY_PRIVATE;
    } else {
        throw std::invalid_argument("Unknown Document event type: " + type);
    }
}

// ============================================
// Снапшот
// ============================================

nlohmann::json Document::serializeFields() const {
    nlohmann::json state;
    state["schema_version"] = SNAPSHOT_SCHEMA_VERSION;
    state["filename"] = filename_;
    state["original_format"] = originalFormat_;
    state["markdown_content"] = markdownContent_;
    state["sections"] = sections_;
    state["metadata"] = metadata_;
    state["current_version"] = currentVersion_;
    state["status"] = toString(status_);
    state["policy_repository_id"] = policyRepositoryId_ ? nlohmann::json(*policyRepositoryId_) : nlohmann::json(nullptr);
    state["compliance_score"] = complianceScore_ ? nlohmann::json(*complianceScore_) : nlohmann::json(nullptr);
    state["findings"] = findings_;
    state["owner_kerberos_id"] = ownerKerberosId_;
    state["visibility"] = visibility_;
    state["shared_with_groups"] = std::vector<std::string>(sharedWithGroups_.begin(), sharedWithGroups_.end());
    return state;
}

void Document::restoreFields(const nlohmann::json& state) {
    if (!state.is_object()) {
        throw std::invalid_argument("Document snapshot state is not an object");
    }

    int schemaVersion = state.value("schema_version", 1);
    if (schemaVersion < 1 || schemaVersion > SNAPSHOT_SCHEMA_VERSION) {
        throw std::invalid_argument("Unsupported Document snapshot schema_version " +
                                    std::to_string(schemaVersion));
    }

    filename_ = state.at("filename").get<std::string>();
    originalFormat_ = state.at("original_format").get<std::string>();
    markdownContent_ = state.value("markdown_content", "");
    sections_ = state.value("sections", std::vector<Section>{});
    currentVersion_ = state.at("current_version").get<VersionNumber>();
    status_ = documentStatusFromString(state.at("status").get<std::string>());

    policyRepositoryId_.reset();
    if (state.contains("policy_repository_id") && !state["policy_repository_id"].is_null()) {
        policyRepositoryId_ = state["policy_repository_id"].get<std::string>();
    }

    complianceScore_.reset();
    if (state.contains("compliance_score") && !state["compliance_score"].is_null()) {
        complianceScore_ = state["compliance_score"].get<double>();
    }

    findings_ = state.value("findings", std::vector<Finding>{});

    if (schemaVersion == 1) {
        // v1: поля доступа и metadata ещё не существовали
        metadata_ = state.value("metadata", std::map<std::string, std::string>{});
        ownerKerberosId_ = state.value("owner_kerberos_id", "system");
        visibility_ = state.value("visibility", VISIBILITY_PRIVATE);
        sharedWithGroups_ = state.value("shared_with_groups", std::set<std::string>{});
    } else {
        metadata_ = state.at("metadata").get<std::map<std::string, std::string>>();
        ownerKerberosId_ = state.at("owner_kerberos_id").get<std::string>();
        visibility_ = state.at("visibility").get<std::string>();
        sharedWithGroups_ = state.at("shared_with_groups").get<std::set<std::string>>();
    }

    if (visibility_ != VISIBILITY_PRIVATE && visibility_ != VISIBILITY_GROUP) {
        throw std::invalid_argument("Unknown Document visibility: " + visibility_);
    }
}

} // namespace chronicle::domain
