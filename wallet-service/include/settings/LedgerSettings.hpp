// include/settings/LedgerSettings.hpp
#pragma once

#include <string>
#include <cstdint>
#include <cstdlib>
#include <chrono>
#include <stdexcept>

namespace wallet::settings {

/**
 * @brief Настройки журнала, блокировок и планировщика подписок
 *
 * Переменные окружения:
 * - LEDGER_LOCK_TIMEOUT_MS: ожидание блокировки строки (2000)
 * - LEDGER_LOCK_RETRIES: сколько раз повторить операцию после LOCK_TIMEOUT (3)
 * - LEDGER_RETRY_BACKOFF_MS: пауза перед повтором, растёт линейно (25)
 * - TOPUP_MIN_CENTS / TOPUP_MAX_CENTS: границы пополнения (500 / 1000000)
 * - SCHEDULER_HORIZON_DAYS: горизонт планирования подписок (31)
 * - SCHEDULER_INTERVAL_MS: период фонового планировщика (60000)
 * - SCHEDULER_ENABLED: запускать ли фоновый планировщик (true)
 * - WALLET_STORE: postgres | memory (postgres)
 *
 * @example K8s ConfigMap:
 * ```yaml
 * data:
 *   LEDGER_LOCK_TIMEOUT_MS: "1500"
 *   LEDGER_LOCK_RETRIES: "2"
 *   SCHEDULER_HORIZON_DAYS: "31"
 * ```
 */
class LedgerSettings {
public:
    /**
     * @brief Читает настройки из ENV
     * @throws std::invalid_argument при нечисловом или отрицательном значении
     */
    LedgerSettings() {
        lockTimeoutMs_ = parseNonNegative("LEDGER_LOCK_TIMEOUT_MS", "2000");
        lockRetries_ = static_cast<int>(parseNonNegative("LEDGER_LOCK_RETRIES", "3"));
        retryBackoffMs_ = parseNonNegative("LEDGER_RETRY_BACKOFF_MS", "25");
        topUpMinCents_ = parseNonNegative("TOPUP_MIN_CENTS", "500");
        topUpMaxCents_ = parseNonNegative("TOPUP_MAX_CENTS", "1000000");
        horizonDays_ = static_cast<int>(parseNonNegative("SCHEDULER_HORIZON_DAYS", "31"));
        schedulerIntervalMs_ = parseNonNegative("SCHEDULER_INTERVAL_MS", "60000");
        schedulerEnabled_ = getEnvOrDefault("SCHEDULER_ENABLED", "true") == "true";
        storeType_ = getEnvOrDefault("WALLET_STORE", "postgres");

        if (topUpMinCents_ > topUpMaxCents_) {
            throw std::invalid_argument("TOPUP_MIN_CENTS must not exceed TOPUP_MAX_CENTS");
        }
        if (storeType_ != "postgres" && storeType_ != "memory") {
            throw std::invalid_argument("WALLET_STORE must be 'postgres' or 'memory', got: " + storeType_);
        }
    }

    std::chrono::milliseconds getLockTimeout() const { return std::chrono::milliseconds{lockTimeoutMs_}; }
    int getLockRetries() const { return lockRetries_; }
    std::chrono::milliseconds getRetryBackoff() const { return std::chrono::milliseconds{retryBackoffMs_}; }
    int64_t getTopUpMinCents() const { return topUpMinCents_; }
    int64_t getTopUpMaxCents() const { return topUpMaxCents_; }
    int getHorizonDays() const { return horizonDays_; }
    std::chrono::milliseconds getSchedulerInterval() const { return std::chrono::milliseconds{schedulerIntervalMs_}; }
    bool isSchedulerEnabled() const { return schedulerEnabled_; }
    std::string getStoreType() const { return storeType_; }

    // Для тестов
    void setLockTimeout(std::chrono::milliseconds timeout) { lockTimeoutMs_ = timeout.count(); }
    void setLockRetries(int retries) { lockRetries_ = retries; }
    void setRetryBackoff(std::chrono::milliseconds backoff) { retryBackoffMs_ = backoff.count(); }

private:
    int64_t lockTimeoutMs_;
    int lockRetries_;
    int64_t retryBackoffMs_;
    int64_t topUpMinCents_;
    int64_t topUpMaxCents_;
    int horizonDays_;
    int64_t schedulerIntervalMs_;
    bool schedulerEnabled_;
    std::string storeType_;

    static std::string getEnvOrDefault(const char* name, const char* defaultValue) {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string(defaultValue);
    }

    static int64_t parseNonNegative(const char* name, const char* defaultValue) {
        std::string raw = getEnvOrDefault(name, defaultValue);
        std::size_t consumed = 0;
        int64_t value = 0;
        try {
            value = std::stoll(raw, &consumed);
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + " is not a number: " + raw);
        }
        if (consumed != raw.size() || value < 0) {
            throw std::invalid_argument(std::string(name) + " must be a non-negative integer: " + raw);
        }
        return value;
    }
};

} // namespace wallet::settings
