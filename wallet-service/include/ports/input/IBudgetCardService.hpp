#pragma once

#include "domain/Account.hpp"
#include "domain/BudgetCard.hpp"
#include "domain/OperationResult.hpp"
#include <optional>
#include <string>

namespace wallet::ports::input {

/**
 * @brief Бюджетные карты: выделение средств из кошелька и траты
 */
class IBudgetCardService {
public:
    virtual ~IBudgetCardService() = default;

    virtual domain::AccountResult createCard(const std::string& ownerId, const std::string& category,
                                             std::optional<int64_t> monthlyLimit) = 0;

    /**
     * @brief Перевести средства кошелёк → карта
     */
    virtual domain::TransferResult allocate(const std::string& ownerId, domain::AccountId walletId,
                                            domain::AccountId cardId, int64_t amountCents,
                                            const std::string& operationId) = 0;

    /**
     * @brief Можно ли потратить amount с карты (без блокировок)
     */
    virtual domain::SpendDecision canSpend(domain::AccountId cardId, int64_t amountCents) = 0;

    /**
     * @brief Списать трату с карты, повторно проверив ограничения под блокировкой
     */
    virtual domain::TransferResult spend(const std::string& ownerId, domain::AccountId cardId,
                                         int64_t amountCents, const std::string& description,
                                         const std::string& operationId) = 0;

    virtual domain::AccountResult setMonthlyLimit(const std::string& ownerId, domain::AccountId cardId,
                                                  std::optional<int64_t> monthlyLimit) = 0;

    virtual domain::BudgetSummary summary(const std::string& ownerId) = 0;
};

} // namespace wallet::ports::input
