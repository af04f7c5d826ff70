#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Вид счёта, несущего баланс
 *
 * - WALLET: основной кошелёк пользователя
 * - BUDGET_CARD: бюджетная под-карта, пополняется из кошелька
 * - ESCROW: удержание средств по заказу маркетплейса
 * - LOAN: memo-счёт займа, баланс = непогашенный остаток
 */
enum class AccountKind {
    WALLET,
    BUDGET_CARD,
    ESCROW,
    LOAN
};

inline std::string toString(AccountKind kind) {
    switch (kind) {
        case AccountKind::WALLET: return "WALLET";
        case AccountKind::BUDGET_CARD: return "BUDGET_CARD";
        case AccountKind::ESCROW: return "ESCROW";
        case AccountKind::LOAN: return "LOAN";
        default: return "UNKNOWN";
    }
}

inline AccountKind parseAccountKind(const std::string& str) {
    if (str == "WALLET") return AccountKind::WALLET;
    if (str == "BUDGET_CARD") return AccountKind::BUDGET_CARD;
    if (str == "ESCROW") return AccountKind::ESCROW;
    if (str == "LOAN") return AccountKind::LOAN;
    throw std::invalid_argument("Unknown account kind: " + str);
}

} // namespace wallet::domain
