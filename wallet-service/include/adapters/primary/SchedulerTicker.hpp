#pragma once

#include "ports/input/ISubscriptionScheduler.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Date.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

namespace wallet::adapters::primary {

/**
 * @brief Фоновый поток планировщика подписок
 *
 * Каждый тик: syncAll(today), затем executeDue(today).
 * Обе операции идемпотентны, поэтому тик можно запускать и вручную
 * (команда subscription.sync) параллельно с таймером.
 */
class SchedulerTicker {
public:
    using Clock = std::function<domain::Date()>;

    SchedulerTicker(
        std::shared_ptr<ports::input::ISubscriptionScheduler> scheduler,
        std::shared_ptr<settings::LedgerSettings> settings)
        : scheduler_(std::move(scheduler))
        , interval_(settings->getSchedulerInterval())
        , running_(false)
        , tickCount_(0)
        , clock_([] { return domain::Date::today(); })
    {}

    ~SchedulerTicker() {
        stop();
    }

    SchedulerTicker(const SchedulerTicker&) = delete;
    SchedulerTicker& operator=(const SchedulerTicker&) = delete;

    void setInterval(std::chrono::milliseconds interval) {
        interval_ = interval;
    }

    // Для тестов: подменить "сегодня"
    void setClock(Clock clock) {
        std::lock_guard<std::mutex> lock(mutex_);
        clock_ = std::move(clock);
    }

    void start() {
        if (running_.exchange(true)) return;

        std::cout << "[SchedulerTicker] Started, interval " << interval_.load().count() << " ms" << std::endl;
        thread_ = std::thread([this]() {
            while (running_) {
                doTick();
                std::unique_lock<std::mutex> lock(mutex_);
                wakeup_.wait_for(lock, interval_.load(), [this] { return !running_; });
            }
        });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_.exchange(false) && !thread_.joinable()) {
                return;
            }
        }
        wakeup_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
            std::cout << "[SchedulerTicker] Stopped after " << tickCount_ << " ticks" << std::endl;
        }
    }

    bool isRunning() const { return running_; }

    uint64_t tickCount() const { return tickCount_; }

    /**
     * @brief Выполнить один тик вручную (для тестов)
     */
    void manualTick() {
        doTick();
    }

private:
    std::shared_ptr<ports::input::ISubscriptionScheduler> scheduler_;
    std::atomic<std::chrono::milliseconds> interval_;
    std::atomic<bool> running_;
    std::atomic<uint64_t> tickCount_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable wakeup_;
    Clock clock_;

    void doTick() {
        Clock clock;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            clock = clock_;
        }

        try {
            auto today = clock();
            scheduler_->syncAll(today);
            scheduler_->executeDue(today);
        } catch (const std::exception& e) {
            // Хранилище недоступно: пропускаем тик, следующий повторит
            std::cerr << "[SchedulerTicker] Tick failed: " << e.what() << std::endl;
        }

        ++tickCount_;
    }
};

} // namespace wallet::adapters::primary
