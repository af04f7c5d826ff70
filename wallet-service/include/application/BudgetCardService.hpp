#pragma once

#include "ports/input/IBudgetCardService.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "application/AccountAccess.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Date.hpp"
#include "domain/Money.hpp"
#include "utils/IdGenerator.hpp"
#include <iostream>
#include <memory>

namespace wallet::application {

/**
 * @brief Бюджетные карты и проверка трат
 *
 * Потрачено за месяц не хранится отдельно: это сумма записей BUDGET_SPEND
 * и SUBSCRIPTION_CHARGE по карте с первого числа текущего месяца (UTC).
 * Подписка, оплачиваемая с карты, расходует тот же месячный лимит.
 *
 * Порядок проверок canSpend: сначала месячный лимит, затем баланс карты.
 * Сообщение называет сработавшее ограничение:
 * - "exceeds monthly limit"
 * - "exceeds allocated balance"
 *
 * spend повторяет те же проверки внутри транзакции TransferEngine,
 * под блокировкой карты, поэтому параллельные траты не обойдут лимит.
 */
class BudgetCardService : public ports::input::IBudgetCardService {
public:
    BudgetCardService(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::ITransferService> transfers,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , transfers_(std::move(transfers))
      , settings_(std::move(settings))
    {
        std::cout << "[BudgetCardService] Created" << std::endl;
    }

    domain::AccountResult createCard(const std::string& ownerId, const std::string& category,
                                     std::optional<int64_t> monthlyLimit) override {
        if (ownerId.empty()) {
            return domain::AccountResult::from(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Missing owner id"));
        }
        if (monthlyLimit && *monthlyLimit <= 0) {
            return domain::AccountResult::from(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Monthly limit must be positive"));
        }

        domain::Account card(0, ownerId, domain::AccountKind::BUDGET_CARD);
        card.category = category;
        card.monthlyLimit = monthlyLimit;

        auto session = store_->begin();
        card.id = session->createAccount(card);
        session->commit();

        std::cout << "[BudgetCardService] Created card " << card.id << " (" << category
                  << ") for " << ownerId << std::endl;

        auto result = domain::AccountResult::from(domain::OperationOutcome::ok("Budget card created"));
        result.account = card;
        return result;
    }

    domain::TransferResult allocate(const std::string& ownerId, domain::AccountId walletId,
                                    domain::AccountId cardId, int64_t amountCents,
                                    const std::string& operationId) override {
        if (amountCents <= 0) {
            return reject(operationId, domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Allocation amount must be positive"));
        }
        auto wallet = loadOwned(*store_, walletId, ownerId, domain::AccountKind::WALLET);
        if (!wallet.outcome.isSuccess()) {
            return reject(operationId, wallet.outcome);
        }
        auto card = loadOwned(*store_, cardId, ownerId, domain::AccountKind::BUDGET_CARD);
        if (!card.outcome.isSuccess()) {
            return reject(operationId, card.outcome);
        }

        domain::TransferRequest request;
        request.operationId = operationId.empty() ? utils::IdGenerator::next("allocate") : operationId;
        request.reason = domain::EntryReason::BUDGET_ALLOCATE;
        request.moves = {{walletId, -amountCents}, {cardId, amountCents}};
        request.description = "Allocate to " + card.account->category;
        return transfers_->applyWithRetry(request);
    }

    domain::SpendDecision canSpend(domain::AccountId cardId, int64_t amountCents) override {
        auto card = store_->findAccount(cardId);
        if (!card) {
            return deny(domain::ErrorCode::ACCOUNT_NOT_FOUND, "Card not found: " + std::to_string(cardId));
        }
        int64_t spent = spentSince(*store_, cardId, monthStart());
        return evaluate(*card, amountCents, spent);
    }

    domain::TransferResult spend(const std::string& ownerId, domain::AccountId cardId,
                                 int64_t amountCents, const std::string& description,
                                 const std::string& operationId) override {
        auto card = loadOwned(*store_, cardId, ownerId, domain::AccountKind::BUDGET_CARD);
        if (!card.outcome.isSuccess()) {
            return reject(operationId, card.outcome);
        }

        domain::TransferRequest request;
        request.operationId = operationId.empty() ? utils::IdGenerator::next("spend") : operationId;
        request.reason = domain::EntryReason::BUDGET_SPEND;
        request.moves = {{cardId, -amountCents}};
        request.description = description;

        auto since = monthStart();
        auto result = transfers_->applyWithRetry(request,
            [cardId, amountCents, since](ports::output::ILedgerSession& session) {
                auto fresh = session.readAccount(cardId);
                if (!fresh) {
                    return domain::OperationOutcome::failure(
                        domain::ErrorCode::ACCOUNT_NOT_FOUND, "Card not found: " + std::to_string(cardId));
                }
                int64_t spent = spentSince(session, cardId, since);
                auto decision = evaluate(*fresh, amountCents, spent);
                if (!decision.allowed) {
                    int64_t available = decision.code == domain::ErrorCode::MONTHLY_LIMIT_EXCEEDED
                        ? decision.monthlyRemaining.value_or(0) : decision.balance;
                    return domain::OperationOutcome::failure(decision.code, decision.reason,
                                                             available, amountCents);
                }
                return domain::OperationOutcome::ok();
            });

        std::cout << "[BudgetCardService] Spend " << domain::Money::format(amountCents)
                  << " on card " << cardId << ": " << domain::toString(result.code) << std::endl;
        return result;
    }

    domain::AccountResult setMonthlyLimit(const std::string& ownerId, domain::AccountId cardId,
                                          std::optional<int64_t> monthlyLimit) override {
        if (monthlyLimit && *monthlyLimit <= 0) {
            return domain::AccountResult::from(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Monthly limit must be positive"));
        }
        return updateUnderLock(*store_, cardId, settings_->getLockTimeout(),
            [&](domain::Account& card) {
                if (card.ownerId != ownerId) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::UNAUTHORIZED,
                        "Card " + std::to_string(cardId) + " does not belong to " + ownerId);
                }
                if (card.kind != domain::AccountKind::BUDGET_CARD) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_REQUEST,
                        "Account " + std::to_string(cardId) + " is not a budget card");
                }
                card.monthlyLimit = monthlyLimit;
                return domain::OperationOutcome::ok("Monthly limit updated");
            });
    }

    domain::BudgetSummary summary(const std::string& ownerId) override {
        domain::BudgetSummary summary;
        auto epoch = domain::Timestamp::fromUnixMillis(0);
        auto since = monthStart();

        for (const auto& account : store_->findAccountsByOwner(ownerId)) {
            if (account.kind != domain::AccountKind::BUDGET_CARD) {
                continue;
            }
            domain::BudgetCardSummary card;
            card.cardId = account.id;
            card.category = account.category;
            card.allocated = store_->sumEntries(account.id, domain::EntryReason::BUDGET_ALLOCATE, epoch);
            card.spent = spentSince(*store_, account.id, epoch);
            card.remaining = account.balance;
            card.monthlyLimit = account.monthlyLimit;
            card.spentThisMonth = spentSince(*store_, account.id, since);
            card.frozen = account.status == domain::AccountStatus::FROZEN;

            summary.totalAllocated += card.allocated;
            summary.totalSpent += card.spent;
            summary.totalRemaining += card.remaining;
            summary.cards.push_back(card);
        }
        return summary;
    }

    /**
     * @brief Списано с карты с момента since: траты и оплаты подписок
     *
     * Reader - ILedgerStore или ILedgerSession (чтение под блокировкой карты).
     */
    template <typename Reader>
    static int64_t spentSince(Reader& reader, domain::AccountId cardId, const domain::Timestamp& since) {
        return -(reader.sumEntries(cardId, domain::EntryReason::BUDGET_SPEND, since) +
                 reader.sumEntries(cardId, domain::EntryReason::SUBSCRIPTION_CHARGE, since));
    }

    static domain::Timestamp monthStart() {
        return domain::Date::today().firstOfMonth().startOfDay();
    }

    /**
     * @brief Решение по трате с учётом уже потраченного за месяц
     */
    static domain::SpendDecision evaluate(const domain::Account& card, int64_t amountCents, int64_t spentThisMonth) {
        if (card.kind != domain::AccountKind::BUDGET_CARD) {
            return deny(domain::ErrorCode::INVALID_REQUEST, "Account " + std::to_string(card.id) + " is not a budget card");
        }
        if (amountCents <= 0) {
            return deny(domain::ErrorCode::INVALID_REQUEST, "Spend amount must be positive");
        }
        if (!card.isActive()) {
            return deny(domain::ErrorCode::ACCOUNT_FROZEN, "Card " + std::to_string(card.id) + " is " +
                        domain::toString(card.status));
        }

        domain::SpendDecision decision;
        decision.balance = card.balance;

        if (card.monthlyLimit) {
            int64_t remaining = *card.monthlyLimit - spentThisMonth;
            if (remaining < 0) {
                remaining = 0;
            }
            decision.monthlyRemaining = remaining;
            if (amountCents > remaining) {
                decision.code = domain::ErrorCode::MONTHLY_LIMIT_EXCEEDED;
                decision.shortfall = amountCents - remaining;
                decision.reason = "Amount exceeds monthly limit by " +
                    domain::Money::format(decision.shortfall, card.currency) + " (" +
                    domain::Money::format(remaining, card.currency) + " of " +
                    domain::Money::format(*card.monthlyLimit, card.currency) + " left this month)";
                return decision;
            }
        }

        if (amountCents > card.balance) {
            decision.code = domain::ErrorCode::INSUFFICIENT_FUNDS;
            decision.shortfall = amountCents - card.balance;
            decision.reason = "Amount exceeds allocated balance by " +
                domain::Money::format(decision.shortfall, card.currency);
            return decision;
        }

        decision.allowed = true;
        decision.reason = "OK";
        return decision;
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::ITransferService> transfers_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    static domain::SpendDecision deny(domain::ErrorCode code, const std::string& reason) {
        domain::SpendDecision decision;
        decision.code = code;
        decision.reason = reason;
        return decision;
    }

    static domain::TransferResult reject(const std::string& operationId, const domain::OperationOutcome& outcome) {
        std::cout << "[BudgetCardService] Rejected " << operationId << ": " << outcome.message << std::endl;
        return domain::TransferResult::from(outcome, operationId);
    }
};

} // namespace wallet::application
