#pragma once

#include "domain/Account.hpp"
#include "domain/Loan.hpp"
#include <optional>
#include <string>

namespace wallet::ports::input {

class ILoanService {
public:
    virtual ~ILoanService() = default;

    /**
     * @brief Выдать займ: кошелёк кредитора → кошелёк заёмщика
     */
    virtual domain::LoanResult disburse(const std::string& lenderOwnerId, domain::AccountId lenderWalletId,
                                        domain::AccountId borrowerWalletId, int64_t principalCents) = 0;

    /**
     * @brief Погасить займ частично или полностью
     */
    virtual domain::LoanResult repay(const std::string& borrowerOwnerId, const std::string& loanId,
                                     int64_t amountCents, const std::string& operationId) = 0;

    virtual std::optional<domain::Loan> getLoan(const std::string& loanId) = 0;
};

} // namespace wallet::ports::input
