#include "WalletApp.hpp"
#include <csignal>
#include <cstring>
#include <functional>
#include <iostream>
#include <pthread.h>
#include <thread>
#include <unistd.h>

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--audit] [--help]\n"
              << "  --audit   check stored balances against applied transfers before serving\n"
              << "Configuration is read from the environment (WALLET_*, RABBITMQ_*, SCHEDULER_*)."
              << std::endl;
}

/**
 * @brief Заблокировать SIGINT и SIGTERM во всех потоках процесса
 *
 * Вызывается до создания любых потоков: маска наследуется,
 * и сигнал забирает только watchSignals() через sigwait.
 */
sigset_t blockShutdownSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

void watchSignals(sigset_t signals, wallet::WalletApp& app) {
    int received = 0;
    if (sigwait(&signals, &received) != 0) {
        std::cerr << "[main] sigwait failed, signals will not stop the service" << std::endl;
        return;
    }
    std::cout << "[main] " << strsignal(received) << ", draining..." << std::endl;
    app.stop();
}

int serve(wallet::WalletApp& app, int argc, char* argv[]) {
    try {
        std::cout << "[main] Wallet ledger service starting (pid " << getpid() << ")" << std::endl;
        app.run(argc, argv);
        std::cout << "[main] Wallet ledger service stopped" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[main] Fatal error: " << e.what() << std::endl;
        return 1;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        }
    }

    sigset_t signals = blockShutdownSignals();

    wallet::WalletApp app;
    std::thread signalWatcher(watchSignals, signals, std::ref(app));

    int code = serve(app, argc, argv);

    // Будим наблюдателя, если сервис завершился не по сигналу
    pthread_kill(signalWatcher.native_handle(), SIGTERM);
    signalWatcher.join();
    return code;
}
