#pragma once

#include "domain/Account.hpp"
#include "domain/LedgerEntry.hpp"
#include "domain/OperationResult.hpp"
#include <optional>
#include <string>
#include <vector>

namespace wallet::ports::input {

/**
 * @brief Операции с кошельками пользователя
 */
class IWalletService {
public:
    virtual ~IWalletService() = default;

    virtual domain::AccountResult openWallet(const std::string& ownerId,
                                             const std::string& currency = "USD") = 0;

    /**
     * @brief Пополнение кошелька от платёжного провайдера
     * @param operationId ID платежа у провайдера (ключ идемпотентности)
     */
    virtual domain::TransferResult topUp(const std::string& ownerId, domain::AccountId walletId,
                                         int64_t amountCents, const std::string& operationId) = 0;

    /**
     * @brief Перевод между кошельками (P2P)
     */
    virtual domain::TransferResult transfer(const std::string& ownerId, domain::AccountId fromId,
                                            domain::AccountId toId, int64_t amountCents,
                                            const std::string& operationId) = 0;

    virtual domain::AccountResult freeze(const std::string& ownerId, domain::AccountId accountId) = 0;
    virtual domain::AccountResult unfreeze(const std::string& ownerId, domain::AccountId accountId) = 0;

    virtual std::optional<domain::Account> getAccount(domain::AccountId accountId) = 0;
    virtual std::vector<domain::Account> getAccounts(const std::string& ownerId) = 0;
    virtual std::vector<domain::LedgerEntry> history(domain::AccountId accountId) = 0;
};

} // namespace wallet::ports::input
