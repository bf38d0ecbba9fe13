// include/WalletApp.hpp
#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Ports
#include "ports/input/ITransactionService.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/input/IConsistencyService.hpp"
#include "ports/output/ILedgerRepository.hpp"
#include "ports/output/IRateProvider.hpp"

// Settings
#include "settings/DbSettings.hpp"
#include "settings/LedgerSettings.hpp"

// Application
#include "application/CurrencyService.hpp"
#include "application/TransactionService.hpp"
#include "application/WalletService.hpp"
#include "application/ConsistencyService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryLedgerRepository.hpp"
#include "adapters/secondary/PostgresLedgerRepository.hpp"
#include "adapters/secondary/StaticRateTable.hpp"

// Primary Adapters
#include "adapters/primary/HealthHandler.hpp"
#include "adapters/primary/CurrenciesHandler.hpp"
#include "adapters/primary/CreateWalletHandler.hpp"
#include "adapters/primary/CreateTransactionHandler.hpp"
#include "adapters/primary/WalletQueryHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace wallet {

/**
 * @brief Wallet Service Application
 *
 * HTTP:
 *   POST /api/v1/wallets, POST /api/v1/transactions
 *   GET  /api/v1/wallets/{id}/balance|transactions|consistency
 *   GET  /api/v1/currencies, GET /health
 *
 * Хранилище выбирается через WALLET_STORAGE (postgres | memory).
 */
class WalletApp : public BoostBeastApplication {
public:
    WalletApp() { std::cout << "[WalletApp] Initializing..." << std::endl; }
    ~WalletApp() override { std::cout << "[WalletApp] Shutting down..." << std::endl; }

protected:
    void loadEnvironment(int argc, char* argv[]) override {
        BoostBeastApplication::loadEnvironment(argc, argv);
        std::cout << "[WalletApp] Environment loaded" << std::endl;
    }

    void configureInjection() override {
        std::cout << "[WalletApp] Configuring DI..." << std::endl;

        // Шаг 1: настройки и хранилище
        auto settingsInjector = di::make_injector(
            di::bind<settings::DbSettings>().in(di::singleton),
            di::bind<settings::LedgerSettings>().in(di::singleton)
        );
        auto ledgerSettings = settingsInjector.create<std::shared_ptr<settings::LedgerSettings>>();

        std::shared_ptr<ports::output::ILedgerRepository> ledger;
        if (ledgerSettings->useInMemoryStorage()) {
            std::cout << "[WalletApp] Using in-memory storage" << std::endl;
            ledger = std::make_shared<adapters::secondary::InMemoryLedgerRepository>();
        } else {
            ledger = settingsInjector.create<std::shared_ptr<adapters::secondary::PostgresLedgerRepository>>();
        }

        // Шаг 2: сервисы с параметрами из настроек
        auto rates = std::make_shared<adapters::secondary::StaticRateTable>();
        auto currencyService = std::make_shared<application::CurrencyService>(
            rates, ledgerSettings->getReferenceCurrency());

        application::RetryPolicy retryPolicy;
        retryPolicy.maxAttempts = ledgerSettings->getMaxAttempts();
        retryPolicy.baseDelay = std::chrono::milliseconds{ledgerSettings->getBaseDelayMs()};
        auto transactionService = std::make_shared<application::TransactionService>(
            ledger, currencyService, retryPolicy);

        // Шаг 3: основной injector с instance binding
        auto injector = di::make_injector(
            di::bind<ports::output::ILedgerRepository>().to(ledger),
            di::bind<ports::output::IRateProvider>().to(rates),
            di::bind<application::CurrencyService>().to(currencyService),
            di::bind<ports::input::ITransactionService>().to(transactionService),
            di::bind<ports::input::IWalletService>().to<application::WalletService>().in(di::singleton),
            di::bind<ports::input::IConsistencyService>().to<application::ConsistencyService>().in(di::singleton)
        );

        registerEndpoint("GET", "/health", injector.create<std::shared_ptr<adapters::primary::HealthHandler>>());
        registerEndpoint("GET", "/api/v1/currencies", injector.create<std::shared_ptr<adapters::primary::CurrenciesHandler>>());

        registerEndpoint("POST", "/api/v1/wallets", injector.create<std::shared_ptr<adapters::primary::CreateWalletHandler>>());
        registerEndpoint("GET", "/api/v1/wallets/*", injector.create<std::shared_ptr<adapters::primary::WalletQueryHandler>>());

        registerEndpoint("POST", "/api/v1/transactions", injector.create<std::shared_ptr<adapters::primary::CreateTransactionHandler>>());

        std::cout << "[WalletApp] Ready, reference currency " << currencyService->referenceCurrency() << std::endl;
    }
};

} // namespace wallet
