// include/WalletApp.hpp
#pragma once

#include <boost/di.hpp>

// Settings
#include "settings/DbSettings.hpp"
#include "settings/RabbitMQSettings.hpp"
#include "settings/LedgerSettings.hpp"

// Ports
#include "ports/input/ITransferService.hpp"
#include "ports/input/IWalletService.hpp"
#include "ports/input/IBudgetCardService.hpp"
#include "ports/input/IEscrowService.hpp"
#include "ports/input/ILoanService.hpp"
#include "ports/input/ISubscriptionScheduler.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IListingCatalog.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "ports/output/IEventConsumer.hpp"

// Application
#include "application/TransferEngine.hpp"
#include "application/WalletService.hpp"
#include "application/BudgetCardService.hpp"
#include "application/EscrowService.hpp"
#include "application/LoanService.hpp"
#include "application/SubscriptionScheduler.hpp"
#include "application/LedgerAuditor.hpp"
#include "application/WalletCommandHandler.hpp"

// Secondary Adapters
#include "adapters/secondary/PostgresLedgerStore.hpp"
#include "adapters/secondary/PostgresListingCatalog.hpp"
#include "adapters/secondary/InMemoryLedgerStore.hpp"
#include "adapters/secondary/InMemoryListingCatalog.hpp"
#include "adapters/secondary/events/RabbitMQAdapter.hpp"

// Primary Adapters
#include "adapters/primary/SchedulerTicker.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

namespace di = boost::di;

namespace wallet {

/**
 * @brief Wallet Service Application (Event-Driven)
 *
 * Слушает: wallet.*, budget.*, escrow.*, loan.*, subscription.* (очередь wallet.commands)
 * Публикует: <команда>.succeeded / .rejected, ledger.transfer.applied,
 *            escrow.*, loan.*, subscription.* (в wallet.events)
 * Фон: SchedulerTicker (syncAll + executeDue)
 *
 * Порядок запуска: loadEnvironment() → configureInjection() → start()
 */
class WalletApp {
public:
    WalletApp() : stopRequested_(false) { std::cout << "[WalletApp] Initializing..." << std::endl; }
    ~WalletApp() { std::cout << "[WalletApp] Shutting down..." << std::endl; }

    WalletApp(const WalletApp&) = delete;
    WalletApp& operator=(const WalletApp&) = delete;

    void run(int argc, char* argv[]) {
        loadEnvironment(argc, argv);
        configureInjection();
        start();
    }

    /**
     * @brief Попросить сервис остановиться (из потока наблюдения за сигналами)
     *
     * Запрос, пришедший до окончания start(), не теряется.
     */
    void stop() {
        stopRequested_ = true;
    }

protected:
    void loadEnvironment(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--audit") {
                auditOnStart_ = true;
            }
        }
        ledgerSettings_ = std::make_shared<settings::LedgerSettings>();
        std::cout << "[WalletApp] Environment loaded, store=" << ledgerSettings_->getStoreType() << std::endl;
    }

    void configureInjection() {
        std::cout << "[WalletApp] Configuring DI..." << std::endl;

        // Шаг 1: RabbitMQAdapter через DI (один экземпляр для Publisher и Consumer)
        auto rabbitInjector = di::make_injector(
            di::bind<settings::RabbitMQSettings>().in(di::singleton)
        );
        rabbitMQAdapter_ = rabbitInjector.create<std::shared_ptr<adapters::secondary::RabbitMQAdapter>>();

        // Шаг 2: хранилище по WALLET_STORE
        std::shared_ptr<ports::output::ILedgerStore> store;
        std::shared_ptr<ports::output::IListingCatalog> catalog;
        if (ledgerSettings_->getStoreType() == "memory") {
            store = std::make_shared<adapters::secondary::InMemoryLedgerStore>();
            catalog = std::make_shared<adapters::secondary::InMemoryListingCatalog>();
        } else {
            auto dbSettings = std::make_shared<settings::DbSettings>();
            store = std::make_shared<adapters::secondary::PostgresLedgerStore>(dbSettings);
            catalog = std::make_shared<adapters::secondary::PostgresListingCatalog>(dbSettings);
        }

        // Шаг 3: основной injector с instance binding
        auto injector = di::make_injector(
            di::bind<settings::LedgerSettings>().to(ledgerSettings_),
            di::bind<ports::output::ILedgerStore>().to(store),
            di::bind<ports::output::IListingCatalog>().to(catalog),

            // RabbitMQ - один экземпляр для обоих интерфейсов
            di::bind<ports::output::IEventPublisher>().to(rabbitMQAdapter_),
            di::bind<ports::output::IEventConsumer>().to(rabbitMQAdapter_),

            di::bind<ports::input::ITransferService>().to<application::TransferEngine>().in(di::singleton),
            di::bind<ports::input::IWalletService>().to<application::WalletService>().in(di::singleton),
            di::bind<ports::input::IBudgetCardService>().to<application::BudgetCardService>().in(di::singleton),
            di::bind<ports::input::IEscrowService>().to<application::EscrowService>().in(di::singleton),
            di::bind<ports::input::ILoanService>().to<application::LoanService>().in(di::singleton),
            di::bind<ports::input::ISubscriptionScheduler>().to<application::SubscriptionScheduler>().in(di::singleton)
        );

        // Шаг 4: обработчик команд (subscribe() в конструкторе) и планировщик
        commandHandler_ = injector.create<std::shared_ptr<application::WalletCommandHandler>>();
        ticker_ = injector.create<std::shared_ptr<adapters::primary::SchedulerTicker>>();
        auditor_ = injector.create<std::shared_ptr<application::LedgerAuditor>>();

        std::cout << "[WalletApp] DI configured" << std::endl;
    }

    void start() {
        if (auditOnStart_) {
            auto report = auditor_->check();
            if (!report.balanced()) {
                std::cerr << "[WalletApp] Ledger audit found " << report.mismatches.size()
                          << " mismatches" << std::endl;
            }
        }

        // RabbitMQ запускаем ПОСЛЕ регистрации всех handlers
        std::cout << "[WalletApp] Starting RabbitMQ consumer..." << std::endl;
        rabbitMQAdapter_->start();

        if (ledgerSettings_->isSchedulerEnabled()) {
            ticker_->start();
        } else {
            std::cout << "[WalletApp] Scheduler disabled (SCHEDULER_ENABLED=false)" << std::endl;
        }

        std::cout << "[WalletApp] Ready (commands via RabbitMQ)" << std::endl;
        while (!stopRequested_) {
            std::this_thread::sleep_for(std::chrono::milliseconds{200});
        }

        ticker_->stop();
        rabbitMQAdapter_->stop();
    }

private:
    std::atomic<bool> stopRequested_;
    bool auditOnStart_ = false;
    std::shared_ptr<settings::LedgerSettings> ledgerSettings_;
    std::shared_ptr<adapters::secondary::RabbitMQAdapter> rabbitMQAdapter_;
    std::shared_ptr<application::WalletCommandHandler> commandHandler_;
    std::shared_ptr<adapters::primary::SchedulerTicker> ticker_;
    std::shared_ptr<application::LedgerAuditor> auditor_;
};

} // namespace wallet
