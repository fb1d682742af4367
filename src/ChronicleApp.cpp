#include "ChronicleApp.hpp"

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/FailureTrackerSettings.hpp"
#include "settings/PublisherSettings.hpp"
#include "settings/RepositorySettings.hpp"
#include "settings/RetryWorkerSettings.hpp"

// Application
#include "application/EventPublisher.hpp"
#include "application/ProjectionAdminService.hpp"
#include "application/ProjectionHealthService.hpp"

// Secondary Adapters
#include "adapters/secondary/persistence/InMemoryEventStore.hpp"
#include "adapters/secondary/persistence/InMemoryProjectionFailureTracker.hpp"
#include "adapters/secondary/persistence/InMemorySnapshotStore.hpp"
#include "adapters/secondary/persistence/PostgresEventStore.hpp"
#include "adapters/secondary/persistence/PostgresProjectionFailureTracker.hpp"
#include "adapters/secondary/persistence/PostgresSnapshotStore.hpp"
#include "adapters/secondary/projections/InMemoryDocumentProjection.hpp"
#include "adapters/secondary/projections/PostgresDocumentProjection.hpp"
#include "adapters/secondary/system/SystemClock.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <thread>

namespace di = boost::di;

namespace chronicle
{

    namespace
    {
        constexpr auto STOP_POLL_INTERVAL = std::chrono::milliseconds(200);

        /**
         * @brief Биндинги, общие для обоих хранилищ: настройки, часы, сервисы
         */
        auto coreModule(std::shared_ptr<application::EventUpcasterRegistry> upcasters)
        {
            return di::make_injector(
                di::bind<settings::IRepositorySettings>().to<settings::RepositorySettings>().in(di::singleton),
                di::bind<settings::IPublisherSettings>().to<settings::PublisherSettings>().in(di::singleton),
                di::bind<settings::IFailureTrackerSettings>().to<settings::FailureTrackerSettings>().in(di::singleton),
                di::bind<settings::IRetryWorkerSettings>().to<settings::RetryWorkerSettings>().in(di::singleton),

                di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),

                // Реестр upcaster-ов заполнен до сборки, один экземпляр для всех адаптеров
                di::bind<application::EventUpcasterRegistry>().to(upcasters),
                di::bind<application::ProjectionRegistry>().in(di::singleton),

                di::bind<ports::output::IEventPublisher>().to<application::EventPublisher>().in(di::singleton),
                di::bind<application::DocumentRepository>().in(di::singleton),
                di::bind<application::RetryWorker>().in(di::singleton),
                di::bind<ports::input::IProjectionHealthService>().to<application::ProjectionHealthService>().in(di::singleton),
                di::bind<ports::input::IProjectionAdminService>().to<application::ProjectionAdminService>().in(di::singleton));
        }

        template <typename TInjector>
        Engine assembleEngine(TInjector &injector)
        {
            Engine engine;
            engine.upcasters = injector.template create<std::shared_ptr<application::EventUpcasterRegistry>>();
            engine.eventStore = injector.template create<std::shared_ptr<ports::output::IEventStore>>();
            engine.snapshotStore = injector.template create<std::shared_ptr<ports::output::ISnapshotStore>>();
            engine.projections = injector.template create<std::shared_ptr<application::ProjectionRegistry>>();
            engine.failureTracker = injector.template create<std::shared_ptr<ports::output::IProjectionFailureTracker>>();
            engine.publisher = injector.template create<std::shared_ptr<ports::output::IEventPublisher>>();
            engine.documents = injector.template create<std::shared_ptr<application::DocumentRepository>>();
            engine.retryWorker = injector.template create<std::shared_ptr<application::RetryWorker>>();
            engine.health = injector.template create<std::shared_ptr<ports::input::IProjectionHealthService>>();
            engine.admin = injector.template create<std::shared_ptr<ports::input::IProjectionAdminService>>();
            return engine;
        }
    }

    // ============================================================================
    // ChronicleApp Implementation
    // ============================================================================

    ChronicleApp::ChronicleApp()
    {
        std::cout << "[ChronicleApp] Initializing..." << std::endl;
    }

    ChronicleApp::~ChronicleApp()
    {
        shutdown();
        std::cout << "[ChronicleApp] Shutting down..." << std::endl;
    }

    void ChronicleApp::run(int argc, char *argv[])
    {
        loadEnvironment(argc, argv);
        configureInjection();
        start();
        shutdown();
    }

    void ChronicleApp::stop()
    {
        stopRequested_.store(true);
    }

    void ChronicleApp::loadEnvironment(int argc, char *argv[])
    {
        appSettings_ = settings::AppSettings();

        for (int i = 1; i < argc; ++i)
        {
            if (std::string(argv[i]) == "--in-memory")
            {
                appSettings_.setStorage(settings::AppSettings::STORAGE_MEMORY);
            }
        }

        std::cout << "[ChronicleApp] Environment loaded, storage: " << appSettings_.getStorage() << std::endl;
    }

    void ChronicleApp::configureInjection()
    {
        printStartupBanner();

        std::cout << "[ChronicleApp] Configuring DI..." << std::endl;

        auto upcasters = std::make_shared<application::EventUpcasterRegistry>();
        application::registerDocumentUpcasters(*upcasters);

        if (appSettings_.useInMemoryStorage())
        {
            auto injector = di::make_injector(
                coreModule(upcasters),
                di::bind<ports::output::IEventStore>().to<adapters::secondary::InMemoryEventStore>().in(di::singleton),
                di::bind<ports::output::ISnapshotStore>().to<adapters::secondary::InMemorySnapshotStore>().in(di::singleton),
                di::bind<ports::output::IProjectionFailureTracker>()
                    .to<adapters::secondary::InMemoryProjectionFailureTracker>()
                    .in(di::singleton));

            engine_ = assembleEngine(injector);
            engine_.projections->registerProjection(
                injector.create<std::shared_ptr<adapters::secondary::InMemoryDocumentProjection>>());
        }
        else
        {
            auto injector = di::make_injector(
                coreModule(upcasters),
                di::bind<settings::DbSettings>().in(di::singleton),
                di::bind<ports::output::IEventStore>().to<adapters::secondary::PostgresEventStore>().in(di::singleton),
                di::bind<ports::output::ISnapshotStore>().to<adapters::secondary::PostgresSnapshotStore>().in(di::singleton),
                di::bind<ports::output::IProjectionFailureTracker>()
                    .to<adapters::secondary::PostgresProjectionFailureTracker>()
                    .in(di::singleton));

            engine_ = assembleEngine(injector);
            engine_.projections->registerProjection(
                injector.create<std::shared_ptr<adapters::secondary::PostgresDocumentProjection>>());
        }

        std::cout << "[ChronicleApp] Ready, projections: " << engine_.projections->size() << std::endl;
    }

    void ChronicleApp::start()
    {
        running_.store(true);
        engine_.retryWorker->start();

        std::cout << "[ChronicleApp] Running" << std::endl;

        while (!stopRequested_.load())
        {
            std::this_thread::sleep_for(STOP_POLL_INTERVAL);
        }
    }

    void ChronicleApp::shutdown()
    {
        if (!running_.exchange(false))
        {
            return;
        }
        if (engine_.retryWorker)
        {
            engine_.retryWorker->stop();
        }
        std::cout << "[ChronicleApp] Retry worker stopped" << std::endl;
    }

    void ChronicleApp::printStartupBanner()
    {
        std::cout << "----------------------------------------" << std::endl;
        std::cout << "  Snapshot threshold: " << settings::RepositorySettings().getSnapshotThreshold() << std::endl;
        std::cout << "  Retry interval:     " << settings::RetryWorkerSettings().getIntervalSeconds() << "s" << std::endl;
        std::cout << "----------------------------------------" << std::endl;
    }

} // namespace chronicle
