#pragma once

#include "Account.hpp"
#include "Timestamp.hpp"
#include "enums/EscrowStatus.hpp"
#include "OperationResult.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace wallet::domain {

/**
 * @brief Заказ маркетплейса, деньги по которому удерживаются на escrow-счёте
 *
 * Физически не удаляется: RELEASED/REFUNDED остаются для аудита.
 */
struct EscrowOrder {
    std::string orderId;
    std::string listingId;
    AccountId buyerAccountId = 0;
    AccountId sellerAccountId = 0;
    AccountId escrowAccountId = 0;
    int64_t amount = 0;
    EscrowStatus status = EscrowStatus::PENDING;
    Timestamp createdAt;
    std::optional<Timestamp> resolvedAt;
};

/**
 * @brief Результат операций escrow
 */
struct EscrowResult : OperationOutcome {
    std::optional<EscrowOrder> order;

    static EscrowResult from(const OperationOutcome& outcome) {
        EscrowResult r;
        static_cast<OperationOutcome&>(r) = outcome;
        return r;
    }
};

} // namespace wallet::domain
