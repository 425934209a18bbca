// include/PaygateApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <HttpClient.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"
#include "settings/OracleSettings.hpp"
#include "settings/PaymentSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/SettlementRpcSettings.hpp"
#include "settings/WalletSettings.hpp"

// Ports
#include "ports/input/IOracleToolService.hpp"
#include "ports/input/IPaymentOrchestrator.hpp"
#include "ports/input/ISettlementService.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IOracleTransport.hpp"
#include "ports/output/ISettlementRepository.hpp"
#include "ports/output/ISettlementRpcClient.hpp"

// Application
#include "application/IdempotencyLedger.hpp"
#include "application/LedgerJanitor.hpp"
#include "application/OracleToolService.hpp"
#include "application/PaymentAuthorizer.hpp"
#include "application/PaymentOrchestrator.hpp"
#include "application/SettlementService.hpp"
#include "application/SettlementVerifier.hpp"
#include "application/events/AsyncEventPublisher.hpp"

// Secondary Adapters
#include "adapters/secondary/HttpOracleTransport.hpp"
#include "adapters/secondary/InMemorySettlementRepository.hpp"
#include "adapters/secondary/PostgresSettlementRepository.hpp"
#include "adapters/secondary/SolanaRpcClient.hpp"
#include "adapters/secondary/events/RabbitMQEventPublisher.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/SettlementHandler.hpp"
#include "adapters/primary/ToolHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace paygate
{

    /**
     * @brief Paygate Service Application
     *
     * Вызовы платных оракулов по x402: 402 → подпись → повтор с X-PAYMENT.
     * Публикует: call.succeeded, oracle.report (в paygate.events)
     * HTTP: POST /api/v1/tools/* и обслуживание леджера /api/v1/settlements
     */
    class PaygateApp : public BoostBeastApplication
    {
    public:
        PaygateApp() { std::cout << "[PaygateApp] Initializing..." << std::endl; }

        ~PaygateApp() override
        {
            if (janitor_) {
                janitor_->stop();
            }
            if (eventPublisher_) {
                eventPublisher_->shutdown();
            }
            if (rabbitMQPublisher_) {
                rabbitMQPublisher_->stop();
            }
            std::cout << "[PaygateApp] Shutting down..." << std::endl;
        }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[PaygateApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[PaygateApp] Configuring DI..." << std::endl;

            // Шаг 1: ключ плательщика. Без ключа сервис не стартует.
            auto wallet = settings::WalletSettings();
            auto credential = std::make_shared<domain::PaymentCredential>(
                domain::PaymentCredential::fromBase58(wallet.getSecretKey()));
            std::cout << "[PaygateApp] Payer address: " << credential->address() << std::endl;

            // Шаг 2: хранилище леджера
            auto ledgerSettings = std::make_shared<settings::LedgerSettings>();
            std::shared_ptr<ports::output::ISettlementRepository> repository;
            if (ledgerSettings->getStorage() == "postgres") {
                repository = std::make_shared<adapters::secondary::PostgresSettlementRepository>(
                    std::make_shared<settings::DbSettings>());
            } else {
                repository = std::make_shared<adapters::secondary::InMemorySettlementRepository>();
            }
            std::cout << "[PaygateApp] Ledger storage: " << ledgerSettings->getStorage() << std::endl;

            // Шаг 3: события. RabbitMQ за асинхронной очередью
            auto rabbitSettings = std::make_shared<settings::RabbitMQSettings>();
            rabbitMQPublisher_ = std::make_shared<adapters::secondary::RabbitMQEventPublisher>(rabbitSettings);
            eventPublisher_ = std::make_shared<application::events::AsyncEventPublisher>(
                rabbitMQPublisher_, rabbitSettings->getQueueCapacity());

            // Шаг 4: основной injector
            auto injector = di::make_injector(
                di::bind<settings::IOracleSettings>().to<settings::OracleSettings>().in(di::singleton),
                di::bind<settings::IPaymentSettings>().to<settings::PaymentSettings>().in(di::singleton),
                di::bind<settings::ISettlementRpcSettings>().to<settings::SettlementRpcSettings>().in(di::singleton),
                di::bind<settings::ILedgerSettings>().to(ledgerSettings),

                di::bind<IHttpClient>().to<HttpClient>().in(di::singleton),
                di::bind<ports::output::IOracleTransport>().to<adapters::secondary::HttpOracleTransport>().in(di::singleton),
                di::bind<ports::output::ISettlementRpcClient>().to<adapters::secondary::SolanaRpcClient>().in(di::singleton),
                di::bind<ports::output::ISettlementRepository>().to(repository),
                di::bind<ports::output::IEventPublisher>().to(eventPublisher_),
                di::bind<domain::PaymentCredential>().to(credential),

                di::bind<application::PaymentAuthorizer>().in(di::singleton),
                di::bind<application::SettlementVerifier>().in(di::singleton),
                di::bind<application::IdempotencyLedger>().in(di::singleton),

                di::bind<ports::input::IPaymentOrchestrator>().to<application::PaymentOrchestrator>().in(di::singleton),
                di::bind<ports::input::IOracleToolService>().to<application::OracleToolService>().in(di::singleton),
                di::bind<ports::input::ISettlementService>().to<application::SettlementService>().in(di::singleton));

            // Шаг 5: HTTP Handlers
            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto toolHandler = injector.create<std::shared_ptr<adapters::primary::ToolHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/tools")] = toolHandler;
            handlers_[getHandlerKey("POST", "/api/v1/tools/*")] = toolHandler;

            auto settlementHandler = injector.create<std::shared_ptr<adapters::primary::SettlementHandler>>();
            handlers_[getHandlerKey("GET", "/api/v1/settlements")] = settlementHandler;
            handlers_[getHandlerKey("GET", "/api/v1/settlements/*")] = settlementHandler;
            handlers_[getHandlerKey("POST", "/api/v1/settlements/*/reconcile")] = settlementHandler;

            // Шаг 6: фоновая сверка pending-записей и вытеснение старых
            janitor_ = std::make_shared<application::LedgerJanitor>(
                injector.create<std::shared_ptr<ports::input::ISettlementService>>());
            janitor_->start(ledgerSettings->getJanitorInterval());

            // Шаг 7: RabbitMQ запускаем после регистрации всех handlers
            std::cout << "[PaygateApp] Starting RabbitMQ..." << std::endl;
            rabbitMQPublisher_->start();

            std::cout << "[PaygateApp] Ready, " << handlers_.size() << " routes registered" << std::endl;
        }

    private:
        std::shared_ptr<adapters::secondary::RabbitMQEventPublisher> rabbitMQPublisher_;
        std::shared_ptr<application::events::AsyncEventPublisher> eventPublisher_;
        std::shared_ptr<application::LedgerJanitor> janitor_;
    };

} // namespace paygate
