#pragma once

#include "domain/Aggregate.hpp"
#include "domain/Finding.hpp"
#include "domain/Section.hpp"
#include "domain/VersionNumber.hpp"
#include "domain/enums/DocumentStatus.hpp"
#include <initializer_list>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace chronicle::domain {

/**
 * @brief Агрегат документа (эталонный агрегат движка)
 *
 * Жизненный цикл:
 * DRAFT -> UPLOADED -> CONVERTED -> ANALYZING -> ANALYZED -> EXPORTED
 *                                       |
 *                                       +-> FAILED -> (reset) -> CONVERTED
 *
 * Снапшот: schema_version 2. Снапшоты v1 (без metadata, owner, visibility,
 * shared_with_groups) поднимаются со значениями по умолчанию.
 *
 * @example
 * ```cpp
 * auto doc = Document::upload(id, "policy.pdf", 1024, "pdf", "alice");
 * doc.convert("# Policy", sections, {{"pages", "3"}});
 * repository->save(doc);
 * ```
 */
class Document : public Aggregate {
public:
    static constexpr const char* AGGREGATE_TYPE = "Document";
    static constexpr int SNAPSHOT_SCHEMA_VERSION = 2;

    static constexpr const char* VISIBILITY_PRIVATE = "private";
    static constexpr const char* VISIBILITY_GROUP = "group";

    explicit Document(std::string id);

    std::string aggregateType() const override { return AGGREGATE_TYPE; }

    // ============================================
    // Команды
    // ============================================

    static Document upload(const std::string& id,
                           const std::string& filename,
                           int64_t fileSizeBytes,
                           const std::string& originalFormat,
                           const std::string& uploadedBy);

    /**
     * @throws InvalidDocumentState если статус не UPLOADED
     */
    void convert(const std::string& markdownContent,
                 const std::vector<Section>& sections,
                 const std::map<std::string, std::string>& metadata,
                 const std::vector<std::string>& conversionWarnings = {});

    /**
     * @throws InvalidDocumentState если анализ уже идёт или документ не сконвертирован
     */
    void startAnalysis(const std::string& policyRepositoryId,
                       const std::string& aiModel,
                       const std::string& initiatedBy);

    void completeAnalysis(int findingsCount,
                          double complianceScore,
                          const std::vector<Finding>& findings,
                          int64_t processingTimeMs);

    void failAnalysis(const std::string& reason,
                      const std::string& errorCode = "",
                      bool retryable = true);

    /**
     * @brief Вернуть документ в CONVERTED после зависшего или упавшего анализа
     */
    void resetForRetry(const std::string& resetBy = "system");

    /**
     * @brief Экспорт. Увеличивает patch-версию документа.
     */
    void exportDocument(const std::string& exportFormat, const std::string& exportedBy);

    /**
     * @brief Открыть доступ группе (no-op если уже открыт)
     */
    void shareWithGroup(const std::string& group, const std::string& sharedBy);

    /**
     * @brief Закрыть доступ всем группам (no-op если уже приватный)
     */
    void makePrivate(const std::string& changedBy);

    bool canView(const std::string& userKerberosId, const std::set<std::string>& userGroups) const;

    // ============================================
    // Состояние
    // ============================================

    const std::string& filename() const { return filename_; }
    const std::string& originalFormat() const { return originalFormat_; }
    const std::string& markdownContent() const { return markdownContent_; }
    const std::vector<Section>& sections() const { return sections_; }
    const std::map<std::string, std::string>& metadata() const { return metadata_; }
    const VersionNumber& currentVersion() const { return currentVersion_; }
    DocumentStatus status() const { return status_; }
    const std::optional<std::string>& policyRepositoryId() const { return policyRepositoryId_; }
    const std::optional<double>& complianceScore() const { return complianceScore_; }
    const std::vector<Finding>& findings() const { return findings_; }
    const std::string& ownerKerberosId() const { return ownerKerberosId_; }
    const std::string& visibility() const { return visibility_; }
    const std::set<std::string>& sharedWithGroups() const { return sharedWithGroups_; }

protected:
    void when(const DomainEvent& event) override;
    nlohmann::json serializeFields() const override;
    void restoreFields(const nlohmann::json& state) override;

private:
    void requireStatus(const std::string& operation,
                       std::initializer_list<DocumentStatus> allowed,
                       const std::string& required) const;

    std::string filename_;
    std::string originalFormat_;
    std::string markdownContent_;
    std::vector<Section> sections_;
    std::map<std::string, std::string> metadata_;
    VersionNumber currentVersion_;
    DocumentStatus status_ = DocumentStatus::DRAFT;
    std::optional<std::string> policyRepositoryId_;
    std::optional<double> complianceScore_;
    std::vector<Finding> findings_;
    std::string ownerKerberosId_;
    std::string visibility_ = VISIBILITY_PRIVATE;
    std::set<std::string> sharedWithGroups_;
};

} // namespace chronicle::domain
