#pragma once

#include "application/DocumentRepository.hpp"
#include "application/EventUpcasterRegistry.hpp"
#include "application/ProjectionRegistry.hpp"
#include "application/RetryWorker.hpp"
#include "ports/input/IProjectionAdminService.hpp"
#include "ports/input/IProjectionHealthService.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventStore.hpp"
#include "ports/output/IProjectionFailureTracker.hpp"
#include "ports/output/ISnapshotStore.hpp"
#include "settings/AppSettings.hpp"
#include <atomic>
#include <memory>

namespace chronicle
{

    /**
     * @brief Собранный движок: все сервисы, которыми пользуется внешний слой
     *
     * Создаётся в ChronicleApp::configureInjection() и передаётся по ссылке.
     */
    struct Engine
    {
        std::shared_ptr<application::EventUpcasterRegistry> upcasters;
        std::shared_ptr<ports::output::IEventStore> eventStore;
        std::shared_ptr<ports::output::ISnapshotStore> snapshotStore;
        std::shared_ptr<application::ProjectionRegistry> projections;
        std::shared_ptr<ports::output::IProjectionFailureTracker> failureTracker;
        std::shared_ptr<ports::output::IEventPublisher> publisher;
        std::shared_ptr<application::DocumentRepository> documents;
        std::shared_ptr<application::RetryWorker> retryWorker;
        std::shared_ptr<ports::input::IProjectionHealthService> health;
        std::shared_ptr<ports::input::IProjectionAdminService> admin;
    };

    /**
     * @class ChronicleApp
     * @brief Сервис Chronicle: event store, проекции, фоновые повторы
     *
     * run() выполняет шаги по порядку:
     * 1. loadEnvironment() - чтение настроек из окружения
     * 2. configureInjection() - Boost.DI, регистрация проекций
     * 3. start() - запуск RetryWorker и ожидание stop()
     *
     * Хранилище выбирается CHRONICLE_STORAGE: PostgreSQL или in-memory адаптеры.
     */
    class ChronicleApp
    {
    public:
        ChronicleApp();
        ~ChronicleApp();

        ChronicleApp(const ChronicleApp &) = delete;
        ChronicleApp &operator=(const ChronicleApp &) = delete;

        void run(int argc, char *argv[]);

        /**
         * @brief Запросить остановку (безопасно вызывать из обработчика сигнала)
         */
        void stop();

        bool isRunning() const { return running_.load(); }

        Engine &engine() { return engine_; }

    protected:
        void loadEnvironment(int argc, char *argv[]);
        void configureInjection();
        void start();

    private:
        settings::AppSettings appSettings_;
        Engine engine_;
        std::atomic<bool> running_{false};
        std::atomic<bool> stopRequested_{false};

        void printStartupBanner();
        void shutdown();
    };

} // namespace chronicle
