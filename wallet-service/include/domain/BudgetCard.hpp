#pragma once

#include "Account.hpp"
#include "enums/ErrorCode.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace wallet::domain {

/**
 * @brief Решение canSpend
 *
 * reason различает "exceeds allocated balance" и "exceeds monthly limit",
 * shortfall - на сколько запрос превышает сработавшее ограничение.
 */
struct SpendDecision {
    bool allowed = false;
    ErrorCode code = ErrorCode::NONE;
    std::string reason;
    int64_t shortfall = 0;
    int64_t balance = 0;
    std::optional<int64_t> monthlyRemaining;
};

struct BudgetCardSummary {
    AccountId cardId = 0;
    std::string category;
    int64_t allocated = 0;
    int64_t spent = 0;
    int64_t remaining = 0;
    std::optional<int64_t> monthlyLimit;
    int64_t spentThisMonth = 0;
    bool frozen = false;
};

struct BudgetSummary {
    int64_t totalAllocated = 0;
    int64_t totalSpent = 0;
    int64_t totalRemaining = 0;
    std::vector<BudgetCardSummary> cards;
};

} // namespace wallet::domain
