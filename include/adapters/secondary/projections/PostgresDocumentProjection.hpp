#pragma once

#include "domain/Document.hpp"
#include "domain/DocumentView.hpp"
#include "ports/output/IProjection.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <stdexcept>

namespace chronicle::adapters::secondary
{

    /**
     * @brief Read-модель document_views в PostgreSQL
     *
     * DocumentUploaded: INSERT ... ON CONFLICT (id) DO NOTHING.
     * Остальные события: строка читается FOR UPDATE, событие применяется,
     * если его version равна version строки + 1. Меньшая версия - дубликат.
     * Нет строки или пропущена версия - исключение, сбой уходит в трекер
     * и будет повторён.
     */
    class PostgresDocumentProjection : public chronicle::ports::output::IProjection
    {
    public:
        static constexpr const char *NAME = "document_views";

        explicit PostgresDocumentProjection(std::shared_ptr<chronicle::settings::DbSettings> s) : settings_(std::move(s))
        {
            pqxx::connection c(settings_->getConnectionString());
            std::cout << "[DocumentProjection] Connected to " << settings_->getName() << std::endl;
        }

        std::string name() const override { return NAME; }

        bool canHandle(const domain::DomainEvent &event) const override
        {
            return event.aggregateType == domain::Document::AGGREGATE_TYPE;
        }

        void handle(const domain::DomainEvent &event) override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);

            domain::DocumentView view;

            if (event.eventType == domain::events::DocumentUploaded::TYPE)
            {
                domain::applyDocumentEvent(view, event);
                t.exec_params(
                    "INSERT INTO document_views (id, title, original_format, status, version, updated_at) "
                    "VALUES ($1, $2, $3, $4, $5, to_timestamp($6::bigint / 1000.0)) "
                    "ON CONFLICT (id) DO NOTHING",
                    view.id, view.title, view.originalFormat, domain::toString(view.status),
                    view.version, view.updatedAt.toUnixMillis());
                t.commit();
                return;
            }

            auto r = t.exec_params(
                "SELECT id, title, COALESCE(original_format, ''), status, policy_repository_id, "
                "compliance_status, compliance_score, version "
                "FROM document_views WHERE id = $1 FOR UPDATE",
                event.aggregateId);
            if (r.empty())
                throw std::runtime_error("Document view not found: " + event.aggregateId);

            view.id = r[0][0].as<std::string>();
            view.title = r[0][1].as<std::string>();
            view.originalFormat = r[0][2].as<std::string>();
            view.status = domain::documentStatusFromString(r[0][3].as<std::string>());
            if (!r[0][4].is_null())
                view.policyRepositoryId = r[0][4].as<std::string>();
            if (!r[0][5].is_null())
                view.complianceStatus = r[0][5].as<std::string>();
            if (!r[0][6].is_null())
                view.complianceScore = r[0][6].as<double>();
            view.version = r[0][7].as<int64_t>();

            if (event.version <= view.version)
                return;
            if (event.version > view.version + 1)
                throw std::runtime_error("Document view " + event.aggregateId + " is at version " +
                                         std::to_string(view.version) + ", cannot apply version " +
                                         std::to_string(event.version));

            domain::applyDocumentEvent(view, event);

            t.exec_params(
                "UPDATE document_views SET status = $2, policy_repository_id = $3, "
                "compliance_status = $4, compliance_score = $5, version = $6, "
                "updated_at = to_timestamp($7::bigint / 1000.0) "
                "WHERE id = $1",
                view.id, domain::toString(view.status), view.policyRepositoryId,
                view.complianceStatus, view.complianceScore, view.version, view.updatedAt.toUnixMillis());
            t.commit();
        }

        void reset() override
        {
            pqxx::connection c(settings_->getConnectionString());
            pqxx::work t(c);
            t.exec("DELETE FROM document_views");
            t.commit();
            std::cout << "[DocumentProjection] document_views cleared" << std::endl;
        }

    private:
        std::shared_ptr<chronicle::settings::DbSettings> settings_;
    };

} // namespace chronicle::adapters::secondary
