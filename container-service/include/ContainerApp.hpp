// include/ContainerApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/AuthClientSettings.hpp"
#include "settings/ContainerSettings.hpp"
#include "settings/DbSettings.hpp"
#include "settings/MetricsSettings.hpp"
#include "settings/RegistrationSettings.hpp"

// Ports
#include "ports/input/IBulkOperationService.hpp"
#include "ports/input/IContainerService.hpp"
#include "ports/input/IMetricsService.hpp"
#include "ports/input/IRegistrationService.hpp"
#include "ports/input/ITemplateService.hpp"
#include "ports/input/ITokenRegistry.hpp"
#include "ports/output/IAuthClient.hpp"
#include "ports/output/IChallengeRepository.hpp"
#include "ports/output/IClock.hpp"
#include "ports/output/IContainerRepository.hpp"
#include "ports/output/ITemplateRepository.hpp"
#include "ports/output/ITokenRepository.hpp"

// Application
#include "application/BulkOperationCoordinator.hpp"
#include "application/ContainerService.hpp"
#include "application/EntityLockManager.hpp"
#include "application/MetricsService.hpp"
#include "application/RegistrationService.hpp"
#include "application/TemplateService.hpp"
#include "application/TokenRegistry.hpp"

// Secondary Adapters
#include "adapters/secondary/CachedAuthClient.hpp"
#include "adapters/secondary/SystemClock.hpp"
#include "adapters/secondary/persistence/InMemoryChallengeRepository.hpp"
#include "adapters/secondary/persistence/InMemoryContainerRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTemplateRepository.hpp"
#include "adapters/secondary/persistence/InMemoryTokenRepository.hpp"
#include "adapters/secondary/persistence/PostgresChallengeRepository.hpp"
#include "adapters/secondary/persistence/PostgresContainerRepository.hpp"
#include "adapters/secondary/persistence/PostgresTemplateRepository.hpp"
#include "adapters/secondary/persistence/PostgresTokenRepository.hpp"

// Primary Adapters
#include "adapters/primary/BearerAuthMiddleware.hpp"
#include "adapters/primary/ChainHandler.hpp"
#include "adapters/primary/ContainerHandler.hpp"
#include "adapters/primary/ContainerRouter.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/MetricsDecoratorHandler.hpp"
#include "adapters/primary/MetricsHandler.hpp"
#include "adapters/primary/RegistrationHandler.hpp"
#include "adapters/primary/TemplateHandler.hpp"
#include "adapters/primary/TokenHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace containers
{

    /**
     * @brief Container Service Application
     *
     * Реестр токенов и контейнеров, шаблоны, регистрация устройств.
     * Хранилище выбирается через CONTAINER_STORAGE (postgres | memory).
     */
    class ContainerApp : public BoostBeastApplication
    {
    public:
        ContainerApp() { std::cout << "[ContainerApp] Initializing..." << std::endl; }
        ~ContainerApp() override { std::cout << "[ContainerApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[ContainerApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[ContainerApp] Configuring DI..." << std::endl;

            // Шаг 1: Репозитории выбираются по настройке хранилища и биндятся как instance
            auto containerSettings = std::make_shared<settings::ContainerSettings>();
            auto dbSettings = std::make_shared<settings::DbSettings>();

            std::shared_ptr<ports::output::IContainerRepository> containerRepo;
            std::shared_ptr<ports::output::ITokenRepository> tokenRepo;
            std::shared_ptr<ports::output::ITemplateRepository> templateRepo;
            std::shared_ptr<ports::output::IChallengeRepository> challengeRepo;

            if (containerSettings->useInMemoryStorage())
            {
                std::cout << "[ContainerApp] Storage: in-memory" << std::endl;
                containerRepo = std::make_shared<adapters::secondary::InMemoryContainerRepository>();
                tokenRepo = std::make_shared<adapters::secondary::InMemoryTokenRepository>();
                templateRepo = std::make_shared<adapters::secondary::InMemoryTemplateRepository>();
                challengeRepo = std::make_shared<adapters::secondary::InMemoryChallengeRepository>();
            }
            else
            {
                std::cout << "[ContainerApp] Storage: PostgreSQL " << dbSettings->getHost() << std::endl;
                containerRepo = std::make_shared<adapters::secondary::PostgresContainerRepository>(dbSettings);
                tokenRepo = std::make_shared<adapters::secondary::PostgresTokenRepository>(dbSettings);
                templateRepo = std::make_shared<adapters::secondary::PostgresTemplateRepository>(dbSettings);
                challengeRepo = std::make_shared<adapters::secondary::PostgresChallengeRepository>(dbSettings);
            }

            // Шаг 2: Основной injector
            auto injector = di::make_injector(
                di::bind<settings::ContainerSettings>().to(containerSettings),
                di::bind<settings::DbSettings>().to(dbSettings),
                di::bind<settings::AuthClientSettings>().in(di::singleton),
                di::bind<settings::RegistrationSettings>().to(std::make_shared<settings::RegistrationSettings>()),
                di::bind<settings::IMetricsSettings>().to<settings::MetricsSettings>().in(di::singleton),

                di::bind<ports::output::IContainerRepository>().to(containerRepo),
                di::bind<ports::output::ITokenRepository>().to(tokenRepo),
                di::bind<ports::output::ITemplateRepository>().to(templateRepo),
                di::bind<ports::output::IChallengeRepository>().to(challengeRepo),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::IAuthClient>().to<adapters::secondary::CachedAuthClient>().in(di::singleton),
                di::bind<ports::output::IClock>().to<adapters::secondary::SystemClock>().in(di::singleton),

                di::bind<application::EntityLockManager>().in(di::singleton),
                di::bind<ports::input::IMetricsService>().to<application::MetricsService>().in(di::singleton),
                di::bind<ports::input::ITokenRegistry>().to<application::TokenRegistry>().in(di::singleton),
                di::bind<ports::input::ITemplateService>().to<application::TemplateService>().in(di::singleton),
                di::bind<ports::input::IContainerService>().to<application::ContainerService>().in(di::singleton),
                di::bind<ports::input::IBulkOperationService>().to<application::BulkOperationCoordinator>().in(di::singleton),
                di::bind<ports::input::IRegistrationService>().to<application::RegistrationService>().in(di::singleton));

            // Шаг 3: HTTP Handlers
            std::cout << "[ContainerApp] Registering HTTP Handlers..." << std::endl;

            auto metrics = injector.create<std::shared_ptr<ports::input::IMetricsService>>();
            auto auth = injector.create<std::shared_ptr<adapters::primary::BearerAuthMiddleware>>();

            auto metered = [&metrics](std::shared_ptr<IHttpHandler> handler) {
                return std::make_shared<adapters::primary::MetricsDecoratorHandler>(std::move(handler), metrics);
            };

            handlers_[getHandlerKey("GET", "/health")] =
                metered(injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;

            handlers_[getHandlerKey("GET", "/metrics")] =
                metered(injector.create<std::shared_ptr<adapters::primary::MetricsHandler>>());
            std::cout << "  ✓ MetricsHandler: GET /metrics" << std::endl;

            // /container/...: контейнеры, шаблоны и регистрация за одним роутером
            auto containerChain = std::make_shared<serverlib::ChainHandler>(
                auth, injector.create<std::shared_ptr<adapters::primary::ContainerHandler>>());
            auto templateChain = std::make_shared<serverlib::ChainHandler>(
                auth, injector.create<std::shared_ptr<adapters::primary::TemplateHandler>>());
            auto registrationChain = std::make_shared<serverlib::ChainHandler>(
                auth, injector.create<std::shared_ptr<adapters::primary::RegistrationHandler>>());
            auto finalizeHandler = injector.create<std::shared_ptr<adapters::primary::RegistrationFinalizeHandler>>();

            auto containerRouter = metered(std::make_shared<adapters::primary::ContainerRouter>(
                containerChain, templateChain, registrationChain, finalizeHandler));

            for (const char *method : {"GET", "POST", "DELETE"})
            {
                handlers_[getHandlerKey(method, "/container")] = containerRouter;
                handlers_[getHandlerKey(method, "/container/*")] = containerRouter;
                handlers_[getHandlerKey(method, "/container/*/*")] = containerRouter;
                handlers_[getHandlerKey(method, "/container/*/*/*")] = containerRouter;
            }
            std::cout << "  ✓ ContainerRouter: GET|POST|DELETE /container/**" << std::endl;

            auto tokenHandler = metered(std::make_shared<serverlib::ChainHandler>(
                auth, injector.create<std::shared_ptr<adapters::primary::TokenHandler>>()));
            handlers_[getHandlerKey("GET", "/token")] = tokenHandler;
            handlers_[getHandlerKey("POST", "/token/*")] = tokenHandler;
            handlers_[getHandlerKey("DELETE", "/token/*")] = tokenHandler;
            std::cout << "  ✓ TokenHandler: GET /token, POST /token/*, DELETE /token/*" << std::endl;

            std::cout << "[ContainerApp] Ready" << std::endl;
        }
    };

} // namespace containers
