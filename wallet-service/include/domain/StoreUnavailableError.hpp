#pragma once

#include <stdexcept>
#include <string>

namespace wallet::domain {

/**
 * @brief Хранилище недоступно (нет соединения, сбой commit)
 *
 * Единственное условие, фатальное для запроса. Ядро его не повторяет.
 */
class StoreUnavailableError : public std::runtime_error {
public:
    explicit StoreUnavailableError(const std::string& what)
        : std::runtime_error("Ledger store unavailable: " + what) {}
};

} // namespace wallet::domain
