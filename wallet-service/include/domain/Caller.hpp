#pragma once

#include <string>

namespace wallet::domain {

/**
 * @brief Кто инициирует операцию
 *
 * ownerId приходит из слоя аутентификации уже проверенным.
 * FULFILLMENT - системное событие исполнения заказа (доставка подтверждена,
 * спор решён), ему разрешены release/refund по любому заказу.
 */
struct Caller {
    enum class Role {
        USER,
        FULFILLMENT
    };

    std::string ownerId;
    Role role = Role::USER;

    static Caller user(const std::string& owner) {
        return Caller{owner, Role::USER};
    }

    static Caller fulfillment(const std::string& service = "fulfillment") {
        return Caller{service, Role::FULFILLMENT};
    }

    bool isFulfillment() const { return role == Role::FULFILLMENT; }
};

} // namespace wallet::domain
