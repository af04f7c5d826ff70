#pragma once

#include "ports/input/ISubscriptionScheduler.hpp"
#include "ports/input/ITransferService.hpp"
#include "ports/output/ILedgerStore.hpp"
#include "ports/output/IEventPublisher.hpp"
#include "application/AccountAccess.hpp"
#include "application/BudgetCardService.hpp"
#include "settings/LedgerSettings.hpp"
#include "domain/Money.hpp"
#include "utils/IdGenerator.hpp"
#include <nlohmann/json.hpp>
#include <functional>
#include <iostream>
#include <memory>

namespace wallet::application {

/**
 * @brief Планировщик списаний по подпискам
 *
 * Цепочка одной подписки:
 *   ensureNextPayment → обязательство на nextBillingDate (если дата в горизонте)
 *   executeDue        → списание через TransferEngine; в той же транзакции
 *                       обязательство SETTLED и nextBillingDate += цикл
 *   processCompletion → снова ensureNextPayment
 *
 * Идемпотентность:
 * - обязательство уникально по (subscriptionId, dueDate)
 * - operationId списания = subscription:<id>:<dueDate>, повтор не спишет дважды
 * - дата сдвигается, только если она ещё не сдвинута
 * - ensureNextPayment, наткнувшись на SETTLED обязательство на nextBillingDate,
 *   сам дописывает сдвиг даты: цепочка не встаёт после сбоя между шагами
 *
 * Пауза (autoRenew = false у активной подписки): новые обязательства не
 * создаются, наступившие не списываются. resume() пропускает циклы,
 * пропущенные на паузе (их обязательство FAILED с причиной), и ставит
 * ближайший цикл не раньше today.
 *
 * Нехватка средств при списании: обязательство FAILED с причиной,
 * событие subscription.charge_failed. Автоматического повтора нет,
 * retryObligation возвращает его в SCHEDULED.
 *
 * Переходы статусов обязательства и дат подписки выполняются под
 * блокировкой счёта списания.
 */
class SubscriptionScheduler : public ports::input::ISubscriptionScheduler {
public:
    SubscriptionScheduler(
        std::shared_ptr<ports::output::ILedgerStore> store,
        std::shared_ptr<ports::input::ITransferService> transfers,
        std::shared_ptr<ports::output::IEventPublisher> eventPublisher,
        std::shared_ptr<settings::LedgerSettings> settings
    ) : store_(std::move(store))
      , transfers_(std::move(transfers))
      , eventPublisher_(std::move(eventPublisher))
      , settings_(std::move(settings))
    {
        std::cout << "[SubscriptionScheduler] Created, horizon " << settings_->getHorizonDays()
                  << " days" << std::endl;
    }

    ports::input::SubscriptionResult subscribe(const ports::input::SubscriptionRequest& request) override {
        using ports::input::SubscriptionResult;

        if (request.amount <= 0) {
            return SubscriptionResult::from(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Subscription amount must be positive"));
        }
        if (request.serviceName.empty()) {
            return SubscriptionResult::from(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Missing service name"));
        }
        auto account = loadOwned(*store_, request.accountId, request.ownerId, std::nullopt);
        if (!account.outcome.isSuccess()) {
            return SubscriptionResult::from(account.outcome);
        }
        if (!account.account->holdsFunds() || account.account->kind == domain::AccountKind::ESCROW) {
            return SubscriptionResult::from(domain::OperationOutcome::failure(
                domain::ErrorCode::INVALID_REQUEST, "Subscriptions are paid from a wallet or budget card"));
        }

        domain::Subscription subscription;
        subscription.subscriptionId = utils::IdGenerator::next("sub");
        subscription.ownerId = request.ownerId;
        subscription.accountId = request.accountId;
        subscription.serviceName = request.serviceName;
        subscription.category = request.category.empty() ? "subscription" : request.category;
        subscription.amount = request.amount;
        subscription.billingCycle = request.billingCycle;
        subscription.nextBillingDate = request.firstBillingDate;
        subscription.autoRenew = request.autoRenew;
        subscription.createdAt = domain::Timestamp::now();

        {
            auto session = store_->begin();
            session->saveSubscription(subscription);
            session->commit();
        }

        std::cout << "[SubscriptionScheduler] Subscribed " << subscription.subscriptionId << " "
                  << subscription.serviceName << " " << domain::Money::format(subscription.amount)
                  << " " << domain::toString(subscription.billingCycle) << std::endl;

        ensureNextPayment(subscription.subscriptionId, domain::Date::today());

        auto result = SubscriptionResult::from(domain::OperationOutcome::ok("Subscribed"));
        result.subscription = store_->findSubscription(subscription.subscriptionId);
        return result;
    }

    ports::input::SubscriptionResult cancel(const std::string& ownerId, const std::string& subscriptionId) override {
        auto result = changeRenewal(ownerId, subscriptionId, [&](ports::output::ILedgerSession& session) {
            auto current = session.findSubscription(subscriptionId);
            if (!current->active) {
                return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                    "Subscription " + subscriptionId + " is already cancelled");
            }
            current->active = false;
            current->autoRenew = false;
            current->cancelledAt = domain::Timestamp::now();
            session.saveSubscription(*current);
            return domain::OperationOutcome::ok("Cancelled");
        });
        std::cout << "[SubscriptionScheduler] Cancel " << subscriptionId << ": "
                  << domain::toString(result.code) << std::endl;
        return result;
    }

    ports::input::SubscriptionResult pause(const std::string& ownerId, const std::string& subscriptionId) override {
        auto result = changeRenewal(ownerId, subscriptionId, [&](ports::output::ILedgerSession& session) {
            auto current = session.findSubscription(subscriptionId);
            if (!current->isRenewing()) {
                return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                    "Subscription " + subscriptionId + (current->active ? " is already paused" : " is cancelled"));
            }
            current->autoRenew = false;
            session.saveSubscription(*current);
            return domain::OperationOutcome::ok("Paused");
        });
        std::cout << "[SubscriptionScheduler] Pause " << subscriptionId << ": "
                  << domain::toString(result.code) << std::endl;
        return result;
    }

    ports::input::SubscriptionResult resume(const std::string& ownerId, const std::string& subscriptionId,
                                            const domain::Date& today) override {
        auto result = changeRenewal(ownerId, subscriptionId, [&](ports::output::ILedgerSession& session) {
            auto current = session.findSubscription(subscriptionId);
            if (!current->active || current->autoRenew) {
                return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                    "Subscription " + subscriptionId + (current->active ? " is not paused" : " is cancelled"));
            }
            current->autoRenew = true;
            if (current->nextBillingDate && *current->nextBillingDate < today) {
                skipPausedCycle(session, *current, *current->nextBillingDate);
                auto next = *current->nextBillingDate;
                while (next < today) {
                    next = current->nextCycleDate(next);
                }
                current->nextBillingDate = next;
            }
            session.saveSubscription(*current);
            return domain::OperationOutcome::ok("Resumed");
        });
        std::cout << "[SubscriptionScheduler] Resume " << subscriptionId << ": "
                  << domain::toString(result.code) << std::endl;
        if (!result.isSuccess()) {
            return result;
        }
        auto next = ensureNextPayment(subscriptionId, today);
        result.message = "Resumed, next payment " + ports::input::toString(next.status);
        result.subscription = store_->findSubscription(subscriptionId);
        return result;
    }

    ports::input::EnsureResult ensureNextPayment(const std::string& subscriptionId,
                                                 const domain::Date& today) override {
        using ports::input::EnsureResult;
        using ports::input::EnsureStatus;

        EnsureResult result;
        auto subscription = store_->findSubscription(subscriptionId);
        if (!subscription) {
            result.reason = "Subscription not found";
            return result;
        }
        if (!subscription->isRenewing()) {
            result.reason = "Subscription is not active or does not auto-renew";
            return result;
        }
        if (!subscription->nextBillingDate) {
            result.reason = "No next billing date";
            return result;
        }
        auto due = *subscription->nextBillingDate;
        auto horizon = today.addDays(settings_->getHorizonDays());
        if (due > horizon) {
            result.reason = "Next billing date " + due.toString() + " is beyond horizon " + horizon.toString();
            return result;
        }

        domain::ScheduledObligation obligation;
        obligation.obligationId = utils::IdGenerator::next("obl");
        obligation.subscriptionId = subscriptionId;
        obligation.accountId = subscription->accountId;
        obligation.amount = subscription->amount;
        obligation.dueDate = due;
        obligation.createdAt = domain::Timestamp::now();

        auto session = store_->begin();
        if (!session->insertObligation(obligation)) {
            auto existing = session->findObligation(subscriptionId, due);
            session.reset();
            // Оплачено, но дата подписки не сдвинута: завершаем цикл и планируем следующий
            if (existing && existing->status == domain::ObligationStatus::SETTLED &&
                recordPayment(subscription->accountId, subscriptionId, due).isSuccess()) {
                std::cout << "[SubscriptionScheduler] Completed stalled cycle " << subscriptionId
                          << " on " << due.toString() << std::endl;
                return ensureNextPayment(subscriptionId, today);
            }
            result.status = EnsureStatus::EXISTING;
            result.obligation = existing;
            result.reason = "Already scheduled";
            return result;
        }
        session->commit();

        std::cout << "[SubscriptionScheduler] Scheduled " << subscriptionId << " on " << due.toString()
                  << " " << domain::Money::format(obligation.amount) << std::endl;
        publishObligation("subscription.obligation_created", obligation, *subscription);

        result.status = EnsureStatus::CREATED;
        result.obligation = obligation;
        result.reason = "Scheduled";
        return result;
    }

    ports::input::SyncReport syncAll(const domain::Date& today) override {
        ports::input::SyncReport report;
        for (const auto& subscription : store_->activeSubscriptions()) {
            if (!subscription.isRenewing()) {
                continue;
            }
            report.totalActive++;
            auto ensured = ensureNextPayment(subscription.subscriptionId, today);
            switch (ensured.status) {
                case ports::input::EnsureStatus::CREATED:
                    report.created++;
                    report.synced++;
                    break;
                case ports::input::EnsureStatus::EXISTING:
                    report.synced++;
                    break;
                case ports::input::EnsureStatus::SKIPPED:
                    report.skipped++;
                    break;
            }
        }
        std::cout << "[SubscriptionScheduler] Sync: synced=" << report.synced
                  << " created=" << report.created << " skipped=" << report.skipped
                  << " total_active=" << report.totalActive << std::endl;
        return report;
    }

    ports::input::ChargeReport executeDue(const domain::Date& today) override {
        ports::input::ChargeReport report;
        for (const auto& obligation : store_->obligationsDueBy(today)) {
            charge(obligation, today, report);
        }
        if (report.settled + report.failed + report.deferred + report.paused > 0) {
            std::cout << "[SubscriptionScheduler] Charges: settled=" << report.settled
                      << " failed=" << report.failed << " deferred=" << report.deferred
                      << " paused=" << report.paused << std::endl;
        }
        return report;
    }

    ports::input::SubscriptionResult processCompletion(const std::string& subscriptionId,
                                                       const domain::Date& dueDate,
                                                       const domain::Date& today) override {
        using ports::input::SubscriptionResult;

        auto subscription = store_->findSubscription(subscriptionId);
        if (!subscription) {
            return SubscriptionResult::from(notFound(subscriptionId));
        }

        auto outcome = recordPayment(subscription->accountId, subscriptionId, dueDate);
        if (!outcome.isSuccess()) {
            return SubscriptionResult::from(outcome);
        }

        auto next = ensureNextPayment(subscriptionId, today);
        auto result = SubscriptionResult::from(domain::OperationOutcome::ok(
            "Next payment " + ports::input::toString(next.status)));
        result.subscription = store_->findSubscription(subscriptionId);
        return result;
    }

    domain::OperationOutcome retryObligation(const std::string& subscriptionId,
                                             const domain::Date& dueDate) override {
        auto subscription = store_->findSubscription(subscriptionId);
        if (!subscription) {
            return notFound(subscriptionId);
        }
        return underAccountLock(subscription->accountId, [&](ports::output::ILedgerSession& session) {
            auto obligation = session.findObligation(subscriptionId, dueDate);
            if (!obligation) {
                return domain::OperationOutcome::failure(domain::ErrorCode::NOT_FOUND,
                    "No obligation for " + subscriptionId + " on " + dueDate.toString());
            }
            if (obligation->status != domain::ObligationStatus::FAILED) {
                return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                    "Obligation is " + domain::toString(obligation->status) + ", expected FAILED");
            }
            obligation->status = domain::ObligationStatus::SCHEDULED;
            obligation->failureReason.clear();
            session.updateObligation(*obligation);
            return domain::OperationOutcome::ok("Rescheduled");
        });
    }

    std::vector<domain::ScheduledObligation> obligations(const std::string& subscriptionId) override {
        return store_->obligationsForSubscription(subscriptionId);
    }

private:
    std::shared_ptr<ports::output::ILedgerStore> store_;
    std::shared_ptr<ports::input::ITransferService> transfers_;
    std::shared_ptr<ports::output::IEventPublisher> eventPublisher_;
    std::shared_ptr<settings::LedgerSettings> settings_;

    void charge(const domain::ScheduledObligation& obligation, const domain::Date& today,
                ports::input::ChargeReport& report) {
        auto subscription = store_->findSubscription(obligation.subscriptionId);
        std::string serviceName = subscription ? subscription->serviceName : obligation.subscriptionId;

        domain::TransferRequest request;
        request.operationId = obligation.chargeOperationId();
        request.reason = domain::EntryReason::SUBSCRIPTION_CHARGE;
        request.moves = {{obligation.accountId, -obligation.amount}};
        request.description = serviceName + " subscription " + obligation.dueDate.toString();

        const std::string subscriptionId = obligation.subscriptionId;
        const domain::Date dueDate = obligation.dueDate;
        const domain::AccountId accountId = obligation.accountId;
        const int64_t amount = obligation.amount;
        const auto since = BudgetCardService::monthStart();
        auto result = transfers_->applyWithRetry(request,
            [subscriptionId, dueDate, accountId, amount, since](ports::output::ILedgerSession& session) {
                auto current = session.findObligation(subscriptionId, dueDate);
                if (!current || current->status != domain::ObligationStatus::SCHEDULED) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                        "Obligation is no longer scheduled");
                }
                auto sub = session.findSubscription(subscriptionId);
                if (!sub || !sub->active) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                        "Subscription cancelled");
                }
                if (!sub->autoRenew) {
                    return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                        "Subscription paused");
                }
                auto account = session.readAccount(accountId);
                if (account && account->kind == domain::AccountKind::BUDGET_CARD) {
                    auto decision = BudgetCardService::evaluate(
                        *account, amount, BudgetCardService::spentSince(session, accountId, since));
                    if (decision.code == domain::ErrorCode::MONTHLY_LIMIT_EXCEEDED) {
                        return domain::OperationOutcome::failure(decision.code, decision.reason,
                                                                 decision.monthlyRemaining.value_or(0), amount);
                    }
                }
                current->status = domain::ObligationStatus::SETTLED;
                current->materialized = true;
                current->settledAt = domain::Timestamp::now();
                session.updateObligation(*current);
                advanceAnchor(*sub, dueDate);
                session.saveSubscription(*sub);
                return domain::OperationOutcome::ok();
            });

        if (result.isSuccess()) {
            report.settled++;
            if (result.code == domain::ErrorCode::NONE && subscription) {
                publishCharge("subscription.charged", obligation, *subscription, result);
            }
            auto completed = processCompletion(subscriptionId, dueDate, today);
            if (!completed.isSuccess()) {
                std::cerr << "[SubscriptionScheduler] Next cycle for " << subscriptionId
                          << " not scheduled yet: " << completed.message << std::endl;
            }
            return;
        }

        if (result.code == domain::ErrorCode::LOCK_TIMEOUT) {
            report.deferred++;
            return;
        }

        auto latest = store_->findSubscription(subscriptionId);
        if (latest && latest->active && !latest->autoRenew) {
            report.paused++;
            return;
        }

        if (markFailed(obligation, result.message)) {
            report.failed++;
            std::cout << "[SubscriptionScheduler] Charge failed " << subscriptionId << " on "
                      << dueDate.toString() << ": " << result.message << std::endl;
            if (subscription) {
                publishCharge("subscription.charge_failed", obligation, *subscription, result);
            }
        }
    }

    /**
     * @brief Обязательство на dueDate оплачено: сдвинуть даты подписки под блокировкой счёта
     */
    domain::OperationOutcome recordPayment(domain::AccountId accountId, const std::string& subscriptionId,
                                           const domain::Date& dueDate) {
        return underAccountLock(accountId, [&](ports::output::ILedgerSession& session) {
            auto obligation = session.findObligation(subscriptionId, dueDate);
            if (!obligation || obligation->status != domain::ObligationStatus::SETTLED) {
                return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                    "No settled payment for " + subscriptionId + " on " + dueDate.toString());
            }
            auto current = session.findSubscription(subscriptionId);
            advanceAnchor(*current, dueDate);
            session.saveSubscription(*current);
            return domain::OperationOutcome::ok("Payment recorded");
        });
    }

    /**
     * @brief Сдвинуть lastPaymentDate / nextBillingDate за оплаченный dueDate; повтор ничего не меняет
     */
    static void advanceAnchor(domain::Subscription& subscription, const domain::Date& dueDate) {
        if (!subscription.lastPaymentDate || *subscription.lastPaymentDate < dueDate) {
            subscription.lastPaymentDate = dueDate;
        }
        if (subscription.nextBillingDate && *subscription.nextBillingDate <= dueDate) {
            subscription.nextBillingDate = subscription.nextCycleDate(dueDate);
        }
    }

    static void skipPausedCycle(ports::output::ILedgerSession& session, const domain::Subscription& subscription,
                                const domain::Date& dueDate) {
        auto pending = session.findObligation(subscription.subscriptionId, dueDate);
        if (pending && pending->status == domain::ObligationStatus::SCHEDULED) {
            pending->status = domain::ObligationStatus::FAILED;
            pending->failureReason = "Skipped while paused";
            session.updateObligation(*pending);
        }
    }

    /**
     * @brief Проверить владельца и выполнить action под блокировкой счёта списания
     */
    ports::input::SubscriptionResult changeRenewal(
        const std::string& ownerId, const std::string& subscriptionId,
        const std::function<domain::OperationOutcome(ports::output::ILedgerSession&)>& action)
    {
        using ports::input::SubscriptionResult;

        auto subscription = store_->findSubscription(subscriptionId);
        if (!subscription) {
            return SubscriptionResult::from(notFound(subscriptionId));
        }
        if (subscription->ownerId != ownerId) {
            return SubscriptionResult::from(domain::OperationOutcome::failure(domain::ErrorCode::UNAUTHORIZED,
                "Subscription " + subscriptionId + " does not belong to " + ownerId));
        }
        auto result = SubscriptionResult::from(underAccountLock(subscription->accountId, action));
        result.subscription = store_->findSubscription(subscriptionId);
        return result;
    }

    bool markFailed(const domain::ScheduledObligation& obligation, const std::string& reason) {
        auto outcome = underAccountLock(obligation.accountId, [&](ports::output::ILedgerSession& session) {
            auto current = session.findObligation(obligation.subscriptionId, obligation.dueDate);
            if (!current || current->status != domain::ObligationStatus::SCHEDULED) {
                return domain::OperationOutcome::failure(domain::ErrorCode::INVALID_STATE_TRANSITION,
                    "Obligation is no longer scheduled");
            }
            current->status = domain::ObligationStatus::FAILED;
            current->failureReason = reason;
            session.updateObligation(*current);
            return domain::OperationOutcome::ok();
        });
        return outcome.isSuccess();
    }

    /**
     * @brief Выполнить action в транзакции под блокировкой счёта
     *
     * Счёт списания - общий замок для переходов обязательств и дат подписки:
     * те же блокировки берёт TransferEngine при списании.
     */
    domain::OperationOutcome underAccountLock(
        domain::AccountId accountId,
        const std::function<domain::OperationOutcome(ports::output::ILedgerSession&)>& action)
    {
        auto session = store_->begin();
        auto status = session->lockAccount(accountId, settings_->getLockTimeout());
        if (status == ports::output::LockStatus::NOT_FOUND) {
            return domain::OperationOutcome::failure(domain::ErrorCode::ACCOUNT_NOT_FOUND,
                "Account not found: " + std::to_string(accountId));
        }
        if (status == ports::output::LockStatus::TIMEOUT) {
            return domain::OperationOutcome::failure(domain::ErrorCode::LOCK_TIMEOUT,
                "Timed out waiting for lock on account " + std::to_string(accountId));
        }
        auto outcome = action(*session);
        if (outcome.isSuccess()) {
            session->commit();
        }
        return outcome;
    }

    void publishObligation(const std::string& routingKey, const domain::ScheduledObligation& obligation,
                           const domain::Subscription& subscription) {
        try {
            nlohmann::json event;
            event["subscription_id"] = obligation.subscriptionId;
            event["service_name"] = subscription.serviceName;
            event["account_id"] = obligation.accountId;
            event["amount"] = domain::Money(obligation.amount).toString();
            event["due_date"] = obligation.dueDate.toString();
            event["timestamp"] = domain::Timestamp::now().toString();
            eventPublisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[SubscriptionScheduler] Failed to publish event: " << e.what() << std::endl;
        }
    }

    void publishCharge(const std::string& routingKey, const domain::ScheduledObligation& obligation,
                       const domain::Subscription& subscription, const domain::TransferResult& result) {
        try {
            nlohmann::json event;
            event["subscription_id"] = obligation.subscriptionId;
            event["service_name"] = subscription.serviceName;
            event["account_id"] = obligation.accountId;
            event["amount"] = domain::Money(obligation.amount).toString();
            event["due_date"] = obligation.dueDate.toString();
            event["operation_id"] = result.operationId;
            if (!result.isSuccess()) {
                event["code"] = domain::toString(result.code);
                event["reason"] = result.message;
                event["shortfall"] = domain::Money(result.shortfall()).toString();
            }
            event["timestamp"] = domain::Timestamp::now().toString();
            eventPublisher_->publish(routingKey, event.dump());
        } catch (const std::exception& e) {
            std::cerr << "[SubscriptionScheduler] Failed to publish event: " << e.what() << std::endl;
        }
    }

    static domain::OperationOutcome notFound(const std::string& subscriptionId) {
        return domain::OperationOutcome::failure(domain::ErrorCode::NOT_FOUND,
                                                 "Subscription not found: " + subscriptionId);
    }
};

} // namespace wallet::application
