#pragma once

#include <string>
#include <stdexcept>

namespace wallet::domain {

/**
 * @brief Причина изменения баланса (поле reason в ledger_entries)
 */
enum class EntryReason {
    TRANSFER,
    TOPUP,
    BUDGET_ALLOCATE,
    BUDGET_SPEND,
    ESCROW_HOLD,
    ESCROW_RELEASE,
    ESCROW_REFUND,
    LOAN_DISBURSE,
    LOAN_REPAY,
    SUBSCRIPTION_CHARGE
};

/**
 * @brief Как операция влияет на сумму денег внутри системы
 *
 * INTERNAL - деньги только перемещаются, сумма дельт равна нулю.
 * INFLOW - приход извне (платёжный провайдер).
 * OUTFLOW - расход наружу (покупка, списание подписки).
 */
enum class FlowDirection {
    INTERNAL,
    INFLOW,
    OUTFLOW
};

inline FlowDirection flowOf(EntryReason reason) {
    switch (reason) {
        case EntryReason::TOPUP: return FlowDirection::INFLOW;
        case EntryReason::BUDGET_SPEND:
        case EntryReason::SUBSCRIPTION_CHARGE: return FlowDirection::OUTFLOW;
        default: return FlowDirection::INTERNAL;
    }
}

inline std::string toString(EntryReason reason) {
    switch (reason) {
        case EntryReason::TRANSFER: return "transfer";
        case EntryReason::TOPUP: return "topup";
        case EntryReason::BUDGET_ALLOCATE: return "budget_allocate";
        case EntryReason::BUDGET_SPEND: return "budget_spend";
        case EntryReason::ESCROW_HOLD: return "escrow_hold";
        case EntryReason::ESCROW_RELEASE: return "escrow_release";
        case EntryReason::ESCROW_REFUND: return "escrow_refund";
        case EntryReason::LOAN_DISBURSE: return "loan_disburse";
        case EntryReason::LOAN_REPAY: return "loan_repay";
        case EntryReason::SUBSCRIPTION_CHARGE: return "subscription_charge";
        default: return "unknown";
    }
}

inline EntryReason parseEntryReason(const std::string& str) {
    if (str == "transfer") return EntryReason::TRANSFER;
    if (str == "topup") return EntryReason::TOPUP;
    if (str == "budget_allocate") return EntryReason::BUDGET_ALLOCATE;
    if (str == "budget_spend") return EntryReason::BUDGET_SPEND;
    if (str == "escrow_hold") return EntryReason::ESCROW_HOLD;
    if (str == "escrow_release") return EntryReason::ESCROW_RELEASE;
    if (str == "escrow_refund") return EntryReason::ESCROW_REFUND;
    if (str == "loan_disburse") return EntryReason::LOAN_DISBURSE;
    if (str == "loan_repay") return EntryReason::LOAN_REPAY;
    if (str == "subscription_charge") return EntryReason::SUBSCRIPTION_CHARGE;
    throw std::invalid_argument("Unknown entry reason: " + str);
}

} // namespace wallet::domain
