#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Состояние escrow-заказа
 *
 * PENDING → HELD → RELEASED | REFUNDED.
 * RELEASED и REFUNDED терминальные.
 */
enum class EscrowStatus {
    PENDING,
    HELD,
    RELEASED,
    REFUNDED
};

inline bool isTerminal(EscrowStatus status) {
    return status == EscrowStatus::RELEASED || status == EscrowStatus::REFUNDED;
}

inline std::string toString(EscrowStatus status) {
    switch (status) {
        case EscrowStatus::PENDING: return "PENDING";
        case EscrowStatus::HELD: return "HELD";
        case EscrowStatus::RELEASED: return "RELEASED";
        case EscrowStatus::REFUNDED: return "REFUNDED";
        default: return "UNKNOWN";
    }
}

inline EscrowStatus parseEscrowStatus(const std::string& str) {
    if (str == "PENDING") return EscrowStatus::PENDING;
    if (str == "HELD") return EscrowStatus::HELD;
    if (str == "RELEASED") return EscrowStatus::RELEASED;
    if (str == "REFUNDED") return EscrowStatus::REFUNDED;
    throw std::invalid_argument("Unknown escrow status: " + str);
}

} // namespace wallet::domain
