#pragma once

#include "ports/input/ILoanService.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/AccountAccess.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Money.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace wallet::application {

/**
 * @brief Займы между кошельками
 *
 * Непогашенный остаток - баланс memo-счёта вида LOAN. Выдача и погашение
 * двигают его в одном переводе с деньгами:
 * - выдача:    кредитор −P, заёмщик +P, займ +P
 * - погашение: заёмщик −A, кредитор +A, займ −A
 *
 * Погашение больше остатка отклоняется (INVALID_REQUEST с разницей),
 * при нулевом остатке займ переходит в REPAID.
 */
class LoanService : public ports::input::ILoanService {
public:
    LoanService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::ITransferService> transfers,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , transfers_(std::move(transfers))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
    {
        std::cout << "[LoanService] Created" << std::endl;
    }

    domain::LoanResult disburse(const std::string& lenderOwnerId, domain::AccountId lenderWalletId,
                                domain::AccountId borrowerWalletId, int64_t principalCents) override {
        if (principalCents <= 0) {
            return reject(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Loan principal must be positive"));
        }
        if (lenderWalletId == borrowerWalletId) {
            return reject(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Lender and borrower must differ"));
        }
        auto lender = loadOwned(*store_, lenderWalletId, lenderOwnerId, domain::AccountKind::WALLET);
        if (!lender.outcome.isSuccess()) {
            return reject(lender.outcome);
        }
        auto borrower = store_->findAccount(borrowerWalletId);
        if (!borrower) {
            return reject(domain::OperationOutcome::failure(domain::ErrorCode::ACCOUNT_NOT_FOUND,
                "Account not found: " + std::to_string(borrowerWalletId)));
        }
        if (borrower->kind != domain::AccountKind::WALLET) {
            return reject(domain::OperationOutcome::failure(domain::ErrorCode::INVALID_REQUEST,
                "Borrower account is not a wallet"));
        }

        domain::Loan loan;
        loan.loanId = utils::IdGenerator::next("loan");
        loan.lenderAccountId = lenderWalletId;
        loan.borrowerAccountId = borrowerWalletId;
        loan.principal = principalCents;
        loan.status = domain::LoanStatus::ACTIVE;
        loan.createdAt = domain::Timestamp::now();

        {
            auto session = store_->begin();
            domain::Account memo(0, borrower->ownerId, domain::AccountKind::LOAN);
            memo.currency = borrower->currency;
            loan.loanAccountId = session->createAccount(memo);
            session->commit();
        }

        domain::TransferRequest request;
        request.operationId = "loan-disburse:" + loan.loanId;
        request.reason = domain::EntryReason::LOAN_DISBURSE;
        request.moves = {
            {lenderWalletId, -principalCents},
            {borrowerWalletId, principalCents},
            {loan.loanAccountId, principalCents}
        };
        request.description = "Loan " + loan.loanId;

        auto result = transfers_->applyWithRetry(request,
            [loan](ports::output::ILedgerSession& session) {
                session.saveLoan(loan);
                return domain::OperationOutcome::ok();
            });

        if (!result.isSuccess()) {
            closeMemoAccount(loan.loanAccountId);
            return reject(result);
        }

        std::cout << "[LoanService] Disbursed " << loan.loanId << " "
                  << domain::Money::format(principalCents) << " " << lenderWalletId
                  << " -> " << borrowerWalletId << std::endl;
        publish("loan.disbursed", loan, principalCents);

        auto loanResult = domain::LoanResult::from(result);
        loanResult.loan = loan;
        loanResult.outstanding = principalCents;
        return loanResult;
    }

    domain::LoanResult repay(const std::string& borrowerOwnerId, const std::string& loanId,
                             int64_t amountCents, const std::string& operationId) override {
        if (amountCents <= 0) {
            return reject(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Repayment amount must be positive"));
        }
        auto loan = store_->findLoan(loanId);
        if (!loan) {
            return reject(domain::OperationOutcome::failure(
                domain::ErrorCode::NOT_FOUND, "Loan not found: " + loanId));
        }
        auto borrower = loadOwned(*store_, loan->borrowerAccountId, borrowerOwnerId, domain::AccountKind::WALLET);
        if (!borrower.outcome.isSuccess()) {
            return reject(borrower.outcome);
        }

        domain::TransferRequest request;
        request.operationId = operationId.empty() ? utils::IdGenerator::next("repay") : operationId;
        request.reason = domain::EntryReason::LOAN_REPAY;
        request.moves = {
            {loan->borrowerAccountId, -amountCents},
            {loan->lenderAccountId, amountCents},
            {loan->loanAccountId, -amountCents}
        };
        request.description = "Repayment of " + loanId;

        auto result = transfers_->applyWithRetry(request,
            [loanId, amountCents](ports::output::ILedgerSession& session) {
                auto current = session.findLoan(loanId);
                if (!current) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::NOT_FOUND,
                                                             "Loan not found: " + loanId);
                }
                if (current->status != domain::LoanStatus::ACTIVE) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                        "Loan " + loanId + " is " + domain::toString(current->status));
                }
                auto memo = session.readAccount(current->loanAccountId);
                int64_t outstanding = memo ? memo->balance : 0;
                if (amountCents > outstanding) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_REQUEST,
                        "Repayment exceeds outstanding balance by " +
                        domain::Money::format(amountCents - outstanding),
                        outstanding, amountCents);
                }
                if (amountCents == outstanding) {
                    current->status = domain::LoanStatus::REPAID;
                    current->repaidAt = domain::Timestamp::now();
                    session.saveLoan(*current);
                }
                return domain::OperationOutcome::ok();
            });

        auto loanResult = domain::LoanResult::from(result);
        loanResult.loan = store_->findLoan(loanId);
        if (loanResult.loan) {
            auto memo = store_->findAccount(loanResult.loan->loanAccountId);
            loanResult.outstanding = memo ? memo->balance : 0;
        }

        if (!result.isSuccess()) {
            std::cout << "[LoanService] Repayment of " << loanId << " rejected: " << result.message << std::endl;
            return loanResult;
        }

        std::cout << "[LoanService] Repaid " << domain::Money::format(amountCents) << " of " << loanId
                  << ", outstanding " << domain::Money::format(loanResult.outstanding) << std::endl;
        if (result.code == domain::ErrorCode::NONE && loanResult.loan) {
            publish("loan.repaid", *loanResult.loan, amountCents);
        }
        return loanResult;
    }

    std::optional<domain::Loan> getLoan(const std::string& loanId) override {
        return store_->findLoan(loanId);
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::ITransferService> transfers_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    // Выдача не прошла: memo-счёт остаётся с нулём, закрываем его
    void closeMemoAccount(domain::AccountId id) {
        auto closed = updateUnderLock(*store_, id, settings_->getLockTimeout(),
            [](domain::Account& account) {
                account.status = domain::AccountStatus::CLOSED;
                return domain::OperationOutcome::ok();
            });
        if (!closed.isSuccess()) {
            std::cerr << "[LoanService] Failed to close loan account " << id << ": " << closed.message << std::endl;
        }
    }

    void publish(const std::string& routingKey, const domain::Loan& loan, int64_t amount) {
        try {
            nlohmann::json event;
            event["loan_id"] = loan.loanId;
            event["lender_account_id"] = loan.lenderAccountId;
            event["borrower_account_id"] = loan.borrowerAccountId;
            event["amount"] = domain::Money(amount).toString();
            event["status"] = domain::toString(loan.status);
            event["timestamp"] = domain::Timestamp::now().toString();
            eventPublisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[LoanService] Failed to publish event: " << e.what() << std::endl;
        }
    }

    static domain::LoanResult reject(const domain::OperationOutcome& outcome) {
        std::cout << "[LoanService] Rejected: " << outcome.message << std::endl;
        return domain::LoanResult::from(outcome);
    }
};

} // namespace wallet::application
