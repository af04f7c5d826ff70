#pragma once

#include "ports/output/ILedgerStore.hpp"
#include "domain/OperationResult.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace wallet::application {

/**
 * @brief Счёт, прошедший проверку владельца и вида
 */
struct OwnedAccount {
    domain::OperationOutcome outcome;
    std::optional<domain::Account> account;
};

/**
 * @brief Прочитать счёт и проверить, что он принадлежит ownerId и имеет вид kind
 *
 * Чтение без блокировки: годится для авторизации и быстрых предпроверок,
 * окончательная проверка балансов - в TransferEngine под блокировкой.
 */
inline OwnedAccount loadOwned(ports::output::ILedgerStore& store, domain::AccountId id,
                              const std::string& ownerId, std::optional<domain::AccountKind> kind) {
    OwnedAccount result;
    auto account = store.findAccount(id);
    if (!account) {
        result.outcome = domain::OperationOutcome::failure(
            domain::ErrorCode::ACCOUNT_NOT_FOUND, "Account not found: " + std::to_string(id));
        return result;
    }
    if (account->ownerId != ownerId) {
        result.outcome = domain::OperationOutcome::failure(
            domain::ErrorCode::UNAUTHORIZED,
            "Account " + std::to_string(id) + " does not belong to " + ownerId);
        return result;
    }
    if (kind && account->kind != *kind) {
        result.outcome = domain::OperationOutcome::failure(
            domain::ErrorCode::INVALID_REQUEST,
            "Account " + std::to_string(id) + " is " + domain::toString(account->kind) +
            ", expected " + domain::toString(*kind));
        return result;
    }
    result.account = account;
    return result;
}

/**
 * @brief Изменить атрибуты счёта (статус, лимит) под блокировкой строки
 *
 * mutate получает свежую копию счёта и возвращает отказ либо ok;
 * при ok счёт записывается с version + 1. Баланс здесь менять нельзя.
 */
inline domain::AccountResult updateUnderLock(
    ports::output::ILedgerStore& store, domain::AccountId id, std::chrono::milliseconds timeout,
    const std::function<domain::OperationOutcome(domain::Account&)>& mutate)
{
    auto session = store.begin();
    auto status = session->lockAccount(id, timeout);
    if (status == ports::output::LockStatus::NOT_FOUND) {
        return domain::AccountResult::from(domain::OperationOutcome::failure(
            domain::ErrorCode::ACCOUNT_NOT_FOUND, "Account not found: " + std::to_string(id)));
    }
    if (status == ports::output::LockStatus::TIMEOUT) {
        return domain::AccountResult::from(domain::OperationOutcome::failure(
            domain::ErrorCode::LOCK_TIMEOUT, "Timed out waiting for lock on account " + std::to_string(id)));
    }

    auto account = session->readAccount(id);
    if (!account) {
        return domain::AccountResult::from(domain::OperationOutcome::failure(
            domain::ErrorCode::ACCOUNT_NOT_FOUND, "Account not found: " + std::to_string(id)));
    }

    int64_t balance = account->balance;
    auto verdict = mutate(*account);
    if (!verdict.isSuccess()) {
        return domain::AccountResult::from(verdict);
    }
    account->balance = balance;
    account->version += 1;
    session->writeAccount(*account);
    session->commit();

    auto result = domain::AccountResult::from(verdict);
    result.account = account;
    return result;
}

} // namespace wallet::application
