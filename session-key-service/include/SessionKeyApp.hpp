#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Ports
#include "ports/input/ISessionKeyService.hpp"
#include "ports/output/ISessionKeyRepository.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IClock.hpp"

// Application
#include "application/SessionKeyService.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/SessionKeySettings.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresSessionKeyRepository.hpp"
#include "adapters/secondary/RabbitMQEventPublisher.hpp"
#include "adapters/secondary/SystemClock.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/GrantSessionKeyHandler.hpp"
#include "adapters/primary/ListSessionKeysHandler.hpp"
#include "adapters/primary/GetSessionKeyHandler.hpp"
#include "adapters/primary/RevokeSessionKeyHandler.hpp"
#include "adapters/primary/UpdateLimitsHandler.hpp"
#include "adapters/primary/ExtendExpiryHandler.hpp"
#include "adapters/primary/EmergencyRevokeAllHandler.hpp"
#include "adapters/primary/GetUsageHandler.hpp"
#include "adapters/primary/CheckValidityHandler.hpp"
#include "adapters/primary/AuthorizeHandler.hpp"

#include <memory>
#include <iostream>

namespace di = boost::di;

namespace sessionkeys {

/**
 * @brief Session Key Service Application
 *
 * Точка входа микросервиса сессионных ключей.
 * Настраивает Boost.DI контейнер и регистрирует HTTP handlers.
 */
class SessionKeyApp : public BoostBeastApplication {
public:
    SessionKeyApp() {
        std::cout << "[SessionKeyApp] Initializing..." << std::endl;
    }

    ~SessionKeyApp() override = default;

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[SessionKeyApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[SessionKeyApp] Configuring Boost.DI injection..." << std::endl;

        auto injector = di::make_injector(

            // ================================================================
            // Layer 1: Settings
            // ================================================================
            di::bind<settings::DbSettings>()
                .to(std::make_shared<settings::DbSettings>()),

            di::bind<settings::RabbitMQSettings>()
                .to(std::make_shared<settings::RabbitMQSettings>()),

            di::bind<settings::SessionKeySettings>()
                .to(std::make_shared<settings::SessionKeySettings>()),

            // ================================================================
            // Layer 2: Secondary Adapters (Output Ports implementations)
            // ================================================================
            di::bind<ports::output::ISessionKeyRepository>()
                .to<adapters::secondary::PostgresSessionKeyRepository>()
                .in(di::singleton),

            di::bind<ports::output::IEventPublisher>()
                .to<adapters::secondary::RabbitMQEventPublisher>()
                .in(di::singleton),

            di::bind<ports::output::IClock>()
                .to<adapters::secondary::SystemClock>()
                .in(di::singleton),

            // ================================================================
            // Layer 3: Application Services (Input Ports implementations)
            // ================================================================
            di::bind<ports::input::ISessionKeyService>()
                .to<application::SessionKeyService>()
                .in(di::singleton)
        );

        std::cout << "[SessionKeyApp] DI Injector configured:" << std::endl;
        std::cout << "  ✓ Secondary Adapters (3 bindings)" << std::endl;
        std::cout << "  ✓ Application Services (1 binding)" << std::endl;

        // ====================================================================
        // Layer 4: Primary Adapters (HTTP Handlers)
        // ====================================================================

        std::cout << "[SessionKeyApp] Registering HTTP Handlers via DI..." << std::endl;

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();
            registerEndpoint("GET", "/health", handler);
            std::cout << "  ✓ HealthHandler: GET /health" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::GrantSessionKeyHandler>>();
            registerEndpoint("POST", "/api/v1/session-keys", handler);
            std::cout << "  ✓ GrantSessionKeyHandler: POST /api/v1/session-keys" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ListSessionKeysHandler>>();
            registerEndpoint("GET", "/api/v1/session-keys", handler);
            std::cout << "  ✓ ListSessionKeysHandler: GET /api/v1/session-keys" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::GetSessionKeyHandler>>();
            registerEndpoint("GET", "/api/v1/session-keys/*", handler);
            std::cout << "  ✓ GetSessionKeyHandler: GET /api/v1/session-keys/*" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::RevokeSessionKeyHandler>>();
            registerEndpoint("DELETE", "/api/v1/session-keys/*", handler);
            std::cout << "  ✓ RevokeSessionKeyHandler: DELETE /api/v1/session-keys/*" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::UpdateLimitsHandler>>();
            registerEndpoint("POST", "/api/v1/session-keys/limits", handler);
            std::cout << "  ✓ UpdateLimitsHandler: POST /api/v1/session-keys/limits" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::ExtendExpiryHandler>>();
            registerEndpoint("POST", "/api/v1/session-keys/extend", handler);
            std::cout << "  ✓ ExtendExpiryHandler: POST /api/v1/session-keys/extend" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::EmergencyRevokeAllHandler>>();
            registerEndpoint("POST", "/api/v1/session-keys/revoke-all", handler);
            std::cout << "  ✓ EmergencyRevokeAllHandler: POST /api/v1/session-keys/revoke-all" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::GetUsageHandler>>();
            registerEndpoint("POST", "/api/v1/session-keys/usage", handler);
            std::cout << "  ✓ GetUsageHandler: POST /api/v1/session-keys/usage" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::CheckValidityHandler>>();
            registerEndpoint("POST", "/api/v1/session-keys/check", handler);
            std::cout << "  ✓ CheckValidityHandler: POST /api/v1/session-keys/check" << std::endl;
        }

        {
            auto handler = injector.create<std::shared_ptr<adapters::primary::AuthorizeHandler>>();
            registerEndpoint("POST", "/api/v1/session-keys/authorize", handler);
            std::cout << "  ✓ AuthorizeHandler: POST /api/v1/session-keys/authorize" << std::endl;
        }

        std::cout << "[SessionKeyApp] Configuration complete! 11 handlers registered." << std::endl;
    }
};

} // namespace sessionkeys
