#pragma once

#include "Account.hpp"
#include "Date.hpp"
#include "Timestamp.hpp"
#include "enums/BillingCycle.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace wallet::domain {

/**
 * @brief Подписка на внешний сервис, оплачиваемая со счёта
 */
struct Subscription {
    std::string subscriptionId;
    std::string ownerId;
    AccountId accountId = 0;                ///< Счёт списания (обычно бюджетная карта)
    std::string serviceName;
    std::string category;
    int64_t amount = 0;                     ///< Центы за цикл
    BillingCycle billingCycle = BillingCycle::MONTHLY;
    std::optional<Date> nextBillingDate;
    std::optional<Date> lastPaymentDate;
    bool active = true;
    bool autoRenew = true;
    Timestamp createdAt;
    std::optional<Timestamp> cancelledAt;

    bool isRenewing() const { return active && autoRenew; }

    /**
     * @brief Следующая дата списания после from
     */
    Date nextCycleDate(const Date& from) const {
        switch (billingCycle) {
            case BillingCycle::WEEKLY: return from.addDays(7);
            case BillingCycle::QUARTERLY: return from.addMonths(3);
            case BillingCycle::YEARLY: return from.addYears(1);
            case BillingCycle::MONTHLY:
            default: return from.addMonths(1);
        }
    }
};

} // namespace wallet::domain
