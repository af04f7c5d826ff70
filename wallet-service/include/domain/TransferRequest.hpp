#pragma once

#include "Account.hpp"
#include "enums/EntryReason.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace wallet::domain {

/**
 * @brief Одно изменение баланса в составе операции
 */
struct TransferMove {
    AccountId accountId = 0;
    int64_t delta = 0;      ///< Центы, отрицательное значение - списание
};

/**
 * @brief Запрос к TransferEngine
 *
 * operationId - ключ идемпотентности: повтор с тем же ID не применяется дважды.
 *
 * @example
 * ```
 * TransferRequest req;
 * req.operationId = "p2p-7f3a";
 * req.reason = EntryReason::TRANSFER;
 * req.moves = {{1, -6000}, {2, +6000}};
 * ```
 */
struct TransferRequest {
    std::string operationId;
    EntryReason reason = EntryReason::TRANSFER;
    std::vector<TransferMove> moves;
    std::string description;
};

} // namespace wallet::domain
