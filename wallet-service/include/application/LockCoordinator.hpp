#pragma once

#include "domain/Account.hpp"
#include <algorithm>
#include <vector>

namespace wallet::application {

/**
 * @brief Порядок захвата блокировок счетов
 *
 * Все операции берут блокировки строк в одном порядке: по возрастанию
 * account_id. Две операции с пересекающимися наборами счетов захватывают
 * общие счета в одной и той же последовательности, поэтому цикл ожидания
 * (deadlock) образоваться не может.
 *
 * Чистая функция, без состояния.
 */
class LockCoordinator {
public:
    /**
     * @brief Упорядочить набор счетов для захвата блокировок
     * @param accounts счета операции в любом порядке, возможны повторы
     * @return уникальные ID по возрастанию
     */
    static std::vector<domain::AccountId> order(std::vector<domain::AccountId> accounts) {
        std::sort(accounts.begin(), accounts.end());
        accounts.erase(std::unique(accounts.begin(), accounts.end()), accounts.end());
        return accounts;
    }
};

} // namespace wallet::application
