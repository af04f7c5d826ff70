#pragma once

#include "enums/ErrorCode.hpp"
#include "Account.hpp"
#include "LedgerEntry.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace wallet::domain {

/**
 * @brief Общая часть результата бизнес-операции
 *
 * available/required заполняются, когда отказ связан с суммой:
 * пользователю возвращается разница, а не просто "failed".
 */
struct OperationOutcome {
    ErrorCode code = ErrorCode::NONE;
    std::string message;
    int64_t available = 0;      ///< Сколько было доступно (центы)
    int64_t required = 0;       ///< Сколько требовалось (центы)

    /**
     * @brief DUPLICATE_OPERATION считается успехом: операция уже применена
     */
    bool isSuccess() const {
        return code == ErrorCode::NONE || code == ErrorCode::DUPLICATE_OPERATION;
    }

    int64_t shortfall() const {
        return required > available ? required - available : 0;
    }

    static OperationOutcome ok(const std::string& msg = "") {
        OperationOutcome o;
        o.message = msg;
        return o;
    }

    static OperationOutcome failure(ErrorCode c, const std::string& msg,
                                    int64_t avail = 0, int64_t req = 0) {
        OperationOutcome o;
        o.code = c;
        o.message = msg;
        o.available = avail;
        o.required = req;
        return o;
    }
};

/**
 * @brief Результат TransferEngine::applyTransfer
 */
struct TransferResult : OperationOutcome {
    std::string operationId;
    std::vector<LedgerEntry> entries;

    bool alreadyApplied() const { return code == ErrorCode::DUPLICATE_OPERATION; }

    static TransferResult from(const OperationOutcome& outcome, const std::string& opId) {
        TransferResult r;
        static_cast<OperationOutcome&>(r) = outcome;
        r.operationId = opId;
        return r;
    }
};

/**
 * @brief Результат операций со счетами (открытие, заморозка)
 */
struct AccountResult : OperationOutcome {
    std::optional<Account> account;

    static AccountResult from(const OperationOutcome& outcome) {
        AccountResult r;
        static_cast<OperationOutcome&>(r) = outcome;
        return r;
    }
};

} // namespace wallet::domain
