#pragma once

#include "ports/input/IWalletService.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/AccountAccess.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Money.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>
#include <memory>

namespace wallet::application {

/**
 * @brief Кошельки: открытие, пополнение, P2P-переводы, заморозка
 *
 * Пополнение ограничено TOPUP_MIN_CENTS..TOPUP_MAX_CENTS ($5..$10 000 по умолчанию).
 * Все изменения балансов идут через ITransferService.
 */
class WalletService : public ports::input::IWalletService {
public:
    WalletService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::ITransferService> transfers,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , transfers_(std::move(transfers))
      , settings_(std::move(settings))
    {
        std::cout << "[WalletService] Created" << std::endl;
    }

    domain::AccountResult openWallet(const std::string& ownerId, const std::string& currency = "USD") override {
        if (ownerId.empty()) {
            return domain::AccountResult::from(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Missing owner id"));
        }

        domain::Account account(0, ownerId, domain::AccountKind::WALLET);
        account.currency = currency;

        auto session = store_->begin();
        account.id = session->createAccount(account);
        session->commit();

        std::cout << "[WalletService] Opened wallet " << account.id << " for " << ownerId << std::endl;

        auto result = domain::AccountResult::from(domain::OperationOutcome::ok("Wallet opened"));
        result.account = account;
        return result;
    }

    domain::TransferResult topUp(const std::string& ownerId, domain::AccountId walletId,
                                 int64_t amountCents, const std::string& operationId) override {
        if (amountCents < settings_->getTopUpMinCents()) {
            return reject(operationId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST,
                "Minimum top-up is " + domain::Money::format(settings_->getTopUpMinCents()),
                amountCents, settings_->getTopUpMinCents()));
        }
        if (amountCents > settings_->getTopUpMaxCents()) {
            return reject(operationId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST,
                "Maximum top-up is " + domain::Money::format(settings_->getTopUpMaxCents()) +
                ", over by " + domain::Money::format(amountCents - settings_->getTopUpMaxCents())));
        }

        auto owned = loadOwned(*store_, walletId, ownerId, domain::AccountKind::WALLET);
        if (!owned.outcome.isSuccess()) {
            return reject(operationId, owned.outcome);
        }

        domain::TransferRequest request;
        request.operationId = operationId.empty() ? utils::IdGenerator::next("topup") : operationId;
        request.reason = domain::EntryReason::TOPUP;
        request.moves = {{walletId, amountCents}};
        request.description = "Top-up " + domain::Money::format(amountCents);
        return transfers_->applyWithRetry(request);
    }

    domain::TransferResult transfer(const std::string& ownerId, domain::AccountId fromId,
                                    domain::AccountId toId, int64_t amountCents,
                                    const std::string& operationId) override {
        if (amountCents <= 0) {
            return reject(operationId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Transfer amount must be positive"));
        }
        if (fromId == toId) {
            return reject(operationId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Cannot transfer to the same wallet"));
        }

        auto owned = loadOwned(*store_, fromId, ownerId, domain::AccountKind::WALLET);
        if (!owned.outcome.isSuccess()) {
            return reject(operationId, owned.outcome);
        }
        auto recipient = store_->findAccount(toId);
        if (!recipient) {
            return reject(operationId, domain::OperationOutcome::failure(
                domain::ErrorCode::ACCOUNT_NOT_FOUND, "Account not found: " + std::to_string(toId)));
        }
        if (recipient->kind != domain::AccountKind::WALLET) {
            return reject(operationId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Recipient is not a wallet"));
        }

        domain::TransferRequest request;
        request.operationId = operationId.empty() ? utils::IdGenerator::next("p2p") : operationId;
        request.reason = domain::EntryReason::TRANSFER;
        request.moves = {{fromId, -amountCents}, {toId, amountCents}};
        request.description = "Transfer to wallet " + std::to_string(toId);
        return transfers_->applyWithRetry(request);
    }

    domain::AccountResult freeze(const std::string& ownerId, domain::AccountId accountId) override {
        return setStatus(ownerId, accountId, domain::AccountStatus::FROZEN);
    }

    domain::AccountResult unfreeze(const std::string& ownerId, domain::AccountId accountId) override {
        return setStatus(ownerId, accountId, domain::AccountStatus::ACTIVE);
    }

    std::optional<domain::Account> getAccount(domain::AccountId accountId) override {
        return store_->findAccount(accountId);
    }

    std::vector<domain::Account> getAccounts(const std::string& ownerId) override {
        return store_->findAccountsByOwner(ownerId);
    }

    std::vector<domain::LedgerEntry> history(domain::AccountId accountId) override {
        return store_->entriesForAccount(accountId);
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::ITransferService> transfers_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    domain::AccountResult setStatus(const std::string& ownerId, domain::AccountId accountId,
                                    domain::AccountStatus target) {
        auto result = updateUnderLock(*store_, accountId, settings_->getLockTimeout(),
            [&](domain::Account& account) {
                if (account.ownerId != ownerId) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::UNAUTHORIZED,
                        "Account " + std::to_string(accountId) + " does not belong to " + ownerId);
                }
                if (account.kind != domain::AccountKind::WALLET &&
                    account.kind != domain::AccountKind::BUDGET_CARD) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_REQUEST,
                        "Only wallets and budget cards can be frozen");
                }
                if (account.status == domain::AccountStatus::CLOSED) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                        "Account " + std::to_string(accountId) + " is closed");
                }
                account.status = target;
                return domain::OperationOutcome::ok("Account is " + domain::toString(target));
            });

        std::cout << "[WalletService] Status of " << accountId << " -> " << domain::toString(target)
                  << ": " << domain::toString(result.code) << std::endl;
        return result;
    }

    static domain::TransferResult reject(const std::string& operationId, const domain::OperationOutcome& outcome) {
        std::cout << "[WalletService] Rejected " << operationId << ": " << outcome.message << std::endl;
        return domain::TransferResult::from(outcome, operationId);
    }
};

} // namespace wallet::application
