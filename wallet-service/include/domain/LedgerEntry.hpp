#pragma once

#include "Account.hpp"
#include "enums/EntryReason.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>

namespace wallet::domain {

/**
 * @brief Неизменяемая запись об одном изменении баланса
 *
 * Все записи одной операции несут общий operationId.
 * Журнал только дописывается - по нему можно восстановить любой баланс.
 */
struct LedgerEntry {
    int64_t entryId = 0;
    AccountId accountId = 0;
    int64_t delta = 0;              ///< Знаковая сумма в центах
    std::string operationId;
    EntryReason reason = EntryReason::TRANSFER;
    std::string description;
    Timestamp createdAt;
};

} // namespace wallet::domain
