#pragma once

#include "domain/TransferRequest.hpp"
#include "domain/OperationResult.hpp"
#include "ports/output/ILedgerStore.hpp"
#include <functional>

namespace wallet::ports::input {

/**
 * @brief Проверка/запись внутри транзакции перевода
 *
 * Вызывается после того, как все счета заблокированы и operationId
 * зарегистрирован, но до проверки балансов. Через сессию можно читать и
 * писать строки заказов, займов, обязательств: они закоммитятся вместе
 * с переводом. Неуспешный результат откатывает всё.
 */
using TransferGuard = std::function<domain::OperationOutcome(ports::output::ILedgerSession&)>;

/**
 * @brief Атомарное применение многосторонних переводов
 */
class ITransferService {
public:
    virtual ~ITransferService() = default;

    /**
     * @brief Применить перевод целиком или не применить вовсе
     *
     * @param request набор (accountId, delta) под одним operationId
     * @param guard необязательная проверка под блокировками
     * @return TransferResult; DUPLICATE_OPERATION = уже применён, записи прежние
     * @throws domain::StoreUnavailableError если хранилище недоступно
     */
    virtual domain::TransferResult applyTransfer(
        const domain::TransferRequest& request,
        const TransferGuard& guard = nullptr) = 0;

    /**
     * @brief То же, но LOCK_TIMEOUT повторяется с паузой
     */
    virtual domain::TransferResult applyWithRetry(
        const domain::TransferRequest& request,
        const TransferGuard& guard = nullptr) = 0;
};

} // namespace wallet::ports::input
