#pragma once

#include <atomic>
#include <cstdint>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <string>

namespace wallet::utils {

/**
 * @brief Генератор строковых ID вида "<prefix>-<16 hex>"
 *
 * Используется для orderId, loanId, subscriptionId, obligationId
 * и operationId пользовательских операций.
 */
class IdGenerator {
public:
    static std::string next(const std::string& prefix) {
        static std::mt19937_64 rng(std::random_device{}());
        static std::mutex mutex;
        static std::atomic<uint64_t> counter{0};

        uint64_t random = 0;
        {
            std::lock_guard<std::mutex> lock(mutex);
            random = rng();
        }
        // Счётчик в младших битах: два ID одного процесса не совпадают
        uint64_t id = (random & 0xFFFFFFFFFFF00000ULL) | (++counter & 0xFFFFFULL);

        std::stringstream ss;
        ss << prefix << "-" << std::hex << std::setfill('0') << std::setw(16) << id;
        return ss.str();
    }
};

} // namespace wallet::utils
