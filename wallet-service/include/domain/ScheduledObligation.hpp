#pragma once

#include "Account.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include "enums/ObligationStatus.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace wallet::domain {

/**
 * @brief Будущее списание по подписке
 *
 * Ключ идемпотентности - пара (subscriptionId, dueDate): второе обязательство
 * на ту же дату не создаётся никогда.
 * materialized становится true, когда по обязательству появились записи журнала.
 */
struct ScheduledObligation {
    std::string obligationId;
    std::string subscriptionId;
    AccountId accountId = 0;
    int64_t amount = 0;
    Date dueDate;
    bool materialized = false;
    ObligationStatus status = ObligationStatus::SCHEDULED;
    std::string failureReason;
    Timestamp createdAt;
    std::optional<Timestamp> settledAt;

    /**
     * @brief operationId списания - детерминирован, повтор не спишет дважды
     */
    std::string chargeOperationId() const {
        return "subscription:" + subscriptionId + ":" + dueDate.toString();
    }
};

} // namespace wallet::domain
