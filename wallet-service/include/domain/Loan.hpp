#pragma once

#include "Account.hpp"
#include "OperationResult.hpp"
#include "Timestamp.hpp"
#include "enums/LoanStatus.hpp"
#include <string>
#include <cstdint>
#include <optional>

namespace wallet::domain {

/**
 * @brief Займ между двумя кошельками
 *
 * Непогашенный остаток хранится балансом memo-счёта loanAccountId (kind LOAN),
 * поэтому погашения сериализуются той же блокировкой строки, что и деньги.
 */
struct Loan {
    std::string loanId;
    AccountId loanAccountId = 0;
    AccountId lenderAccountId = 0;
    AccountId borrowerAccountId = 0;
    int64_t principal = 0;
    LoanStatus status = LoanStatus::ACTIVE;
    Timestamp createdAt;
    std::optional<Timestamp> repaidAt;
};

struct LoanResult : OperationOutcome {
    std::optional<Loan> loan;
    int64_t outstanding = 0;

    static LoanResult from(const OperationOutcome& outcome) {
        LoanResult r;
        static_cast<OperationOutcome&>(r) = outcome;
        return r;
    }
};

} // namespace wallet::domain
