#pragma once

#include "ports/output/ISnapshotStore.hpp"
#include "settings/DbSettings.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>

namespace chronicle::adapters::secondary
{

    /**
     * @brief Снапшоты агрегатов в PostgreSQL (таблица snapshots)
     *
     * Старые версии не удаляются, load() берёт максимальную.
     */
    class PostgresSnapshotStore : public chronicle::ports::output::ISnapshotStore
    {
    public:
        explicit PostgresSnapshotStore(std::shared_ptr<chronicle::settings::DbSettings> s) : settings_(std::move(s))
        {
            pqxx::connection c(settings_->getConnectionString());
            std::cout << "[PostgresSnapshotStore] Connected to " << settings_->getName() << std::endl;
        }

        domain::Result<domain::Done, domain::StoreUnavailable> save(const domain::Snapshot &snapshot) override
        {
            using R = domain::Result<domain::Done, domain::StoreUnavailable>;
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                t.exec_params(
                    "INSERT INTO snapshots (aggregate_id, aggregate_type, version, state, created_at) "
                    "VALUES ($1, $2, $3, $4::jsonb, to_timestamp($5::bigint / 1000.0)) "
                    "ON CONFLICT (aggregate_id, version) DO UPDATE SET "
                    "state = EXCLUDED.state, created_at = EXCLUDED.created_at",
                    snapshot.aggregateId, snapshot.aggregateType, snapshot.version,
                    snapshot.state.dump(), snapshot.createdAt.toUnixMillis());
                t.commit();
                std::cout << "[PostgresSnapshotStore] Saved snapshot " << snapshot.aggregateId
                          << " v" << snapshot.version << std::endl;
                return R::ok({});
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresSnapshotStore] Save failed: " << e.what() << std::endl;
                return R::fail({e.what()});
            }
        }

        domain::Result<std::optional<domain::Snapshot>, domain::StoreUnavailable> load(
            const std::string &aggregateId) override
        {
            using R = domain::Result<std::optional<domain::Snapshot>, domain::StoreUnavailable>;
            try
            {
                pqxx::connection c(settings_->getConnectionString());
                pqxx::work t(c);
                auto r = t.exec_params(
                    "SELECT aggregate_id, aggregate_type, version, state::text, "
                    "(EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT "
                    "FROM snapshots WHERE aggregate_id = $1 ORDER BY version DESC LIMIT 1",
                    aggregateId);
                if (r.empty())
                    return R::ok(std::nullopt);

                domain::Snapshot snapshot;
                snapshot.aggregateId = r[0][0].as<std::string>();
                snapshot.aggregateType = r[0][1].as<std::string>();
                snapshot.version = r[0][2].as<int64_t>();
                snapshot.createdAt = domain::Timestamp::fromUnixMillis(r[0][4].as<int64_t>());

                // Битый JSON не ошибка хранилища: репозиторий сочтёт такой снапшот повреждённым
                snapshot.state = nlohmann::json::parse(r[0][3].as<std::string>(), nullptr, false);
                return R::ok(snapshot);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[PostgresSnapshotStore] Load failed: " << e.what() << std::endl;
                return R::fail({e.what()});
            }
        }

    private:
        std::shared_ptr<chronicle::settings::DbSettings> settings_;
    };

} // namespace chronicle::adapters::secondary
