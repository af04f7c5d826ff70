#pragma once

#include <string>

namespace wallet::domain {

enum class BillingCycle {
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    YEARLY
};

inline std::string toString(BillingCycle cycle) {
    switch (cycle) {
        case BillingCycle::WEEKLY: return "weekly";
        case BillingCycle::MONTHLY: return "monthly";
        case BillingCycle::QUARTERLY: return "quarterly";
        case BillingCycle::YEARLY: return "yearly";
        default: return "monthly";
    }
}

// Неизвестный цикл считается месячным
inline BillingCycle parseBillingCycle(const std::string& str) {
    if (str == "weekly") return BillingCycle::WEEKLY;
    if (str == "quarterly") return BillingCycle::QUARTERLY;
    if (str == "yearly") return BillingCycle::YEARLY;
    return BillingCycle::MONTHLY;
}

} // namespace wallet::domain
