#pragma once

#include "domain/Account.hpp"
#include "domain/Caller.hpp"
#include "domain/EscrowOrder.hpp"
#include <optional>
#include <string>

namespace wallet::ports::input {

/**
 * @brief Escrow-заказы маркетплейса
 */
class IEscrowService {
public:
    virtual ~IEscrowService() = default;

    /**
     * @brief Создать заказ и удержать деньги покупателя
     * @param amountCents 0 = цена объявления
     */
    virtual domain::EscrowResult createOrder(const domain::Caller& buyer, domain::AccountId buyerWalletId,
                                             const std::string& listingId, int64_t amountCents) = 0;

    /**
     * @brief Повторить удержание для заказа в PENDING
     */
    virtual domain::EscrowResult hold(const std::string& orderId) = 0;

    virtual domain::EscrowResult release(const domain::Caller& caller, const std::string& orderId) = 0;
    virtual domain::EscrowResult refund(const domain::Caller& caller, const std::string& orderId) = 0;

    virtual std::optional<domain::EscrowOrder> getOrder(const std::string& orderId) = 0;
};

} // namespace wallet::ports::input
