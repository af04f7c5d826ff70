#pragma once

#include "enums/AccountKind.hpp"
#include "enums/AccountStatus.hpp"
#include "Timestamp.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace wallet::domain {

using AccountId = int64_t;

/**
 * @brief Счёт, несущий баланс: кошелёк, бюджетная карта, escrow или займ
 *
 * Баланс хранится в центах (int64_t). Меняется только через TransferEngine
 * под блокировкой строки; version растёт на каждое изменение.
 *
 * Инвариант: balance >= 0 для всех видов счетов.
 * Для LOAN баланс - непогашенный остаток займа (memo), он не входит
 * в сумму денег системы.
 */
struct Account {
    AccountId id = 0;                       ///< Числовой ID, задаёт порядок блокировок
    std::string ownerId;                    ///< Владелец (из слоя аутентификации)
    AccountKind kind = AccountKind::WALLET;
    AccountStatus status = AccountStatus::ACTIVE;
    int64_t balance = 0;                    ///< Баланс в центах
    int64_t version = 0;                    ///< Монотонный счётчик изменений
    std::string currency = "USD";
    std::string category;                   ///< Категория бюджетной карты ("food", "subscriptions")
    std::optional<int64_t> monthlyLimit;    ///< Месячный лимит трат бюджетной карты (центы)
    Timestamp createdAt;

    Account() = default;

    Account(AccountId id_, const std::string& owner, AccountKind k, int64_t initialBalance = 0)
        : id(id_)
        , ownerId(owner)
        , kind(k)
        , balance(initialBalance)
        , createdAt(Timestamp::now())
    {}

    bool isActive() const { return status == AccountStatus::ACTIVE; }

    /**
     * @brief Входит ли баланс счёта в сумму денег системы
     */
    bool holdsFunds() const { return kind != AccountKind::LOAN; }
};

} // namespace wallet::domain
