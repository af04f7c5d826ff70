/**
 * @file SubscriptionSchedulerTest.cpp
 * @brief Unit tests for SubscriptionScheduler
 *
 * Даты первого списания лежат в 2030 году, чтобы subscribe (он смотрит
 * на сегодняшний день) не создавал обязательство сам: цепочку двигают
 * тесты, передавая "сегодня" явно.
 */

#include "../fixtures/LedgerFixture.hpp"
#include "application/SubscriptionScheduler.hpp"
#include "application/LedgerAuditor.hpp"
#include "domain/StoreUnavailableError.hpp"
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

using namespace wallet;
using namespace wallet::tests;
using domain::Date;
using domain::ErrorCode;
using domain::ObligationStatus;
using ports::input::EnsureStatus;

/**
 * @brief Publisher, отключающий хранилище на первом событии с заданным ключом
 *
 * Сбой приходится ровно между коммитом списания и следующими шагами цепочки.
 */
class StoreOutageOnEvent : public ports::output::IEventPublisher {
public:
    StoreOutageOnEvent(std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store, std::string routingKey)
        : store_(std::move(store)), routingKey_(std::move(routingKey)) {}

    void publish(const std::string& routingKey, const std::string&) override {
        if (armed_ && routingKey == routingKey_) {
            armed_ = false;
            store_->setAvailable(false);
        }
    }

private:
    std::shared_ptr<adapters::secondary::InMemoryLedgerStore> store_;
    std::string routingKey_;
    bool armed_ = true;
};

class SubscriptionSchedulerTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        scheduler_ = std::make_shared<application::SubscriptionScheduler>(store_, engine_, publisher_, settings_);
        card_ = openAccount("alice", domain::AccountKind::BUDGET_CARD, 10000);
        publisher_->clearMessages();
    }

    std::string subscribe(int64_t amount, const Date& first,
                          domain::BillingCycle cycle = domain::BillingCycle::MONTHLY,
                          bool autoRenew = true) {
        ports::input::SubscriptionRequest request;
        request.ownerId = "alice";
        request.accountId = card_;
        request.serviceName = "Streamly";
        request.amount = amount;
        request.billingCycle = cycle;
        request.firstBillingDate = first;
        request.autoRenew = autoRenew;
        auto result = scheduler_->subscribe(request);
        EXPECT_EQ(result.code, ErrorCode::NONE) << result.message;
        return result.subscription ? result.subscription->subscriptionId : "";
    }

    std::optional<domain::ScheduledObligation> obligation(const std::string& subId, const Date& due) {
        for (const auto& o : scheduler_->obligations(subId)) {
            if (o.dueDate == due) {
                return o;
            }
        }
        return std::nullopt;
    }

    std::shared_ptr<application::SubscriptionScheduler> scheduler_;
    domain::AccountId card_ = 0;
};

// ============================================================================
// SUBSCRIBE / CANCEL
// ============================================================================

TEST_F(SubscriptionSchedulerTest, Subscribe_StoresSubscription) {
    auto id = subscribe(1500, Date(2030, 1, 15));

    auto sub = store_->findSubscription(id);
    ASSERT_TRUE(sub.has_value());
    EXPECT_TRUE(sub->isRenewing());
    EXPECT_EQ(sub->serviceName, "Streamly");
    EXPECT_EQ(sub->category, "subscription");
    ASSERT_TRUE(sub->nextBillingDate.has_value());
    EXPECT_EQ(*sub->nextBillingDate, Date(2030, 1, 15));
    EXPECT_TRUE(scheduler_->obligations(id).empty());
}

TEST_F(SubscriptionSchedulerTest, Subscribe_Rejections) {
    ports::input::SubscriptionRequest request;
    request.ownerId = "alice";
    request.accountId = card_;
    request.serviceName = "Streamly";
    request.firstBillingDate = Date(2030, 1, 15);

    request.amount = 0;
    EXPECT_EQ(scheduler_->subscribe(request).code, ErrorCode::INVALID_REQUEST);

    request.amount = 100;
    request.serviceName.clear();
    EXPECT_EQ(scheduler_->subscribe(request).code, ErrorCode::INVALID_REQUEST);

    request.serviceName = "Streamly";
    request.ownerId = "bob";
    EXPECT_EQ(scheduler_->subscribe(request).code, ErrorCode::UNAUTHORIZED);

    request.ownerId = "alice";
    request.accountId = openAccount("alice", domain::AccountKind::LOAN);
    EXPECT_EQ(scheduler_->subscribe(request).code, ErrorCode::INVALID_REQUEST);
}

TEST_F(SubscriptionSchedulerTest, Cancel_StopsRenewal) {
    auto id = subscribe(1500, Date(2030, 1, 15));

    auto result = scheduler_->cancel("alice", id);

    ASSERT_EQ(result.code, ErrorCode::NONE) << result.message;
    EXPECT_FALSE(result.subscription->active);
    EXPECT_FALSE(result.subscription->autoRenew);
    EXPECT_TRUE(result.subscription->cancelledAt.has_value());

    EXPECT_EQ(scheduler_->ensureNextPayment(id, Date(2030, 1, 1)).status, EnsureStatus::SKIPPED);
    EXPECT_EQ(scheduler_->cancel("alice", id).code, ErrorCode::INVALID_STATE_TRANSITION);
}

TEST_F(SubscriptionSchedulerTest, Cancel_Rejections) {
    auto id = subscribe(1500, Date(2030, 1, 15));

    EXPECT_EQ(scheduler_->cancel("bob", id).code, ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(scheduler_->cancel("alice", "sub-404").code, ErrorCode::NOT_FOUND);
}

// ============================================================================
// ENSURE NEXT PAYMENT
// ============================================================================

TEST_F(SubscriptionSchedulerTest, EnsureNextPayment_CreatesOnceWithinHorizon) {
    auto id = subscribe(1500, Date(2030, 1, 15));

    auto first = scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    auto second = scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    EXPECT_EQ(first.status, EnsureStatus::CREATED);
    ASSERT_TRUE(first.obligation.has_value());
    EXPECT_EQ(first.obligation->dueDate, Date(2030, 1, 15));
    EXPECT_EQ(first.obligation->amount, 1500);
    EXPECT_EQ(first.obligation->status, ObligationStatus::SCHEDULED);
    EXPECT_FALSE(first.obligation->materialized);

    EXPECT_EQ(second.status, EnsureStatus::EXISTING);
    EXPECT_EQ(scheduler_->obligations(id).size(), 1u);
    EXPECT_EQ(publisher_->messagesFor("subscription.obligation_created").size(), 1u);
}

TEST_F(SubscriptionSchedulerTest, EnsureNextPayment_BeyondHorizon_Skipped) {
    auto id = subscribe(1500, Date(2030, 1, 15));

    auto result = scheduler_->ensureNextPayment(id, Date(2029, 12, 1));

    EXPECT_EQ(result.status, EnsureStatus::SKIPPED);
    EXPECT_NE(result.reason.find("beyond horizon"), std::string::npos);
    EXPECT_TRUE(scheduler_->obligations(id).empty());
}

TEST_F(SubscriptionSchedulerTest, EnsureNextPayment_NotRenewingOrUnknown_Skipped) {
    auto id = subscribe(1500, Date(2030, 1, 15), domain::BillingCycle::MONTHLY, false);

    EXPECT_EQ(scheduler_->ensureNextPayment(id, Date(2030, 1, 1)).status, EnsureStatus::SKIPPED);
    EXPECT_EQ(scheduler_->ensureNextPayment("sub-404", Date(2030, 1, 1)).status, EnsureStatus::SKIPPED);
}

TEST_F(SubscriptionSchedulerTest, EnsureNextPayment_ConcurrentCallers_SingleObligation) {
    auto id = subscribe(1500, Date(2030, 1, 15));

    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (scheduler_->ensureNextPayment(id, Date(2030, 1, 1)).status == EnsureStatus::CREATED) {
                ++created;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(scheduler_->obligations(id).size(), 1u);
}

// ============================================================================
// SYNC ALL
// ============================================================================

TEST_F(SubscriptionSchedulerTest, SyncAll_CountsPerSubscription) {
    subscribe(1500, Date(2030, 1, 15));                                     // в горизонте
    subscribe(900, Date(2030, 6, 1));                                       // за горизонтом
    subscribe(500, Date(2030, 1, 10), domain::BillingCycle::MONTHLY, false); // не продлевается

    auto first = scheduler_->syncAll(Date(2030, 1, 1));
    EXPECT_EQ(first.totalActive, 2);
    EXPECT_EQ(first.created, 1);
    EXPECT_EQ(first.synced, 1);
    EXPECT_EQ(first.skipped, 1);

    auto second = scheduler_->syncAll(Date(2030, 1, 1));
    EXPECT_EQ(second.created, 0);
    EXPECT_EQ(second.synced, 1);
}

// ============================================================================
// EXECUTE DUE / COMPLETION
// ============================================================================

TEST_F(SubscriptionSchedulerTest, ExecuteDue_ChargesAndSchedulesNextCycle) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    auto report = scheduler_->executeDue(Date(2030, 1, 15));

    EXPECT_EQ(report.settled, 1);
    EXPECT_EQ(report.failed, 0);
    EXPECT_EQ(balanceOf(card_), 8500);

    auto paid = obligation(id, Date(2030, 1, 15));
    ASSERT_TRUE(paid.has_value());
    EXPECT_EQ(paid->status, ObligationStatus::SETTLED);
    EXPECT_TRUE(paid->materialized);
    EXPECT_TRUE(paid->settledAt.has_value());

    auto sub = store_->findSubscription(id);
    EXPECT_EQ(*sub->nextBillingDate, Date(2030, 2, 15));
    EXPECT_EQ(*sub->lastPaymentDate, Date(2030, 1, 15));

    auto next = obligation(id, Date(2030, 2, 15));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->status, ObligationStatus::SCHEDULED);

    auto charged = publisher_->messagesFor("subscription.charged");
    ASSERT_EQ(charged.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(charged[0].message)["due_date"], "2030-01-15");
}

TEST_F(SubscriptionSchedulerTest, ExecuteDue_Repeated_ChargesOnce) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    scheduler_->executeDue(Date(2030, 1, 15));
    auto again = scheduler_->executeDue(Date(2030, 1, 15));

    EXPECT_EQ(again.settled, 0);
    EXPECT_EQ(balanceOf(card_), 8500);
    EXPECT_EQ(store_->entriesForOperation("subscription:" + id + ":2030-01-15").size(), 1u);
}

TEST_F(SubscriptionSchedulerTest, ExecuteDue_NotYetDue_Untouched) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    auto report = scheduler_->executeDue(Date(2030, 1, 14));

    EXPECT_EQ(report.settled, 0);
    EXPECT_EQ(balanceOf(card_), 10000);
}

TEST_F(SubscriptionSchedulerTest, ExecuteDue_MissedCycles_CaughtUpOnePerPass) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    int settled = 0;
    for (int pass = 0; pass < 4; ++pass) {
        settled += scheduler_->executeDue(Date(2030, 3, 20)).settled;
    }

    EXPECT_EQ(settled, 3);
    EXPECT_EQ(balanceOf(card_), 10000 - 3 * 1500);
    EXPECT_EQ(*store_->findSubscription(id)->nextBillingDate, Date(2030, 4, 15));
}

TEST_F(SubscriptionSchedulerTest, ExecuteDue_WeeklyAndMonthEnd) {
    auto weekly = subscribe(100, Date(2030, 1, 1), domain::BillingCycle::WEEKLY);
    auto monthEnd = subscribe(100, Date(2030, 1, 31));
    scheduler_->syncAll(Date(2030, 1, 1));

    scheduler_->executeDue(Date(2030, 1, 31));

    EXPECT_EQ(*store_->findSubscription(weekly)->nextBillingDate, Date(2030, 1, 8));
    EXPECT_EQ(*store_->findSubscription(monthEnd)->nextBillingDate, Date(2030, 2, 28));
}

TEST_F(SubscriptionSchedulerTest, ExecuteDue_InsufficientFunds_MarksFailed) {
    auto id = subscribe(15000, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    auto report = scheduler_->executeDue(Date(2030, 1, 15));

    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(report.settled, 0);
    EXPECT_EQ(balanceOf(card_), 10000);

    auto failed = obligation(id, Date(2030, 1, 15));
    EXPECT_EQ(failed->status, ObligationStatus::FAILED);
    EXPECT_FALSE(failed->materialized);
    EXPECT_NE(failed->failureReason.find("short by $50.00"), std::string::npos);

    EXPECT_EQ(*store_->findSubscription(id)->nextBillingDate, Date(2030, 1, 15));

    auto events = publisher_->messagesFor("subscription.charge_failed");
    ASSERT_EQ(events.size(), 1u);
    auto json = nlohmann::json::parse(events[0].message);
    EXPECT_EQ(json["code"], "INSUFFICIENT_FUNDS");
    EXPECT_EQ(json["shortfall"], "50.00");

    // без retryObligation повторного списания нет
    EXPECT_EQ(scheduler_->executeDue(Date(2030, 1, 16)).failed, 0);
}

TEST_F(SubscriptionSchedulerTest, RetryObligation_AfterTopUp_Settles) {
    auto id = subscribe(15000, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    scheduler_->executeDue(Date(2030, 1, 15));

    fund(card_, 5000);
    auto retry = scheduler_->retryObligation(id, Date(2030, 1, 15));
    ASSERT_EQ(retry.code, ErrorCode::NONE) << retry.message;
    EXPECT_EQ(obligation(id, Date(2030, 1, 15))->status, ObligationStatus::SCHEDULED);

    auto report = scheduler_->executeDue(Date(2030, 1, 16));

    EXPECT_EQ(report.settled, 1);
    EXPECT_EQ(balanceOf(card_), 0);
    EXPECT_EQ(*store_->findSubscription(id)->nextBillingDate, Date(2030, 2, 15));
}

TEST_F(SubscriptionSchedulerTest, RetryObligation_Rejections) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    EXPECT_EQ(scheduler_->retryObligation(id, Date(2030, 1, 15)).code, ErrorCode::INVALID_STATE_TRANSITION);
    EXPECT_EQ(scheduler_->retryObligation(id, Date(2030, 2, 15)).code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(scheduler_->retryObligation("sub-404", Date(2030, 1, 15)).code, ErrorCode::NOT_FOUND);
}

TEST_F(SubscriptionSchedulerTest, ExecuteDue_CancelledSubscription_NotCharged) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    scheduler_->cancel("alice", id);

    auto report = scheduler_->executeDue(Date(2030, 1, 15));

    EXPECT_EQ(report.settled, 0);
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(balanceOf(card_), 10000);
    EXPECT_EQ(obligation(id, Date(2030, 1, 15))->status, ObligationStatus::FAILED);
}

TEST_F(SubscriptionSchedulerTest, ProcessCompletion_RequiresSettledPayment) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    auto result = scheduler_->processCompletion(id, Date(2030, 1, 15), Date(2030, 1, 15));

    EXPECT_EQ(result.code, ErrorCode::INVALID_STATE_TRANSITION);
    EXPECT_EQ(*store_->findSubscription(id)->nextBillingDate, Date(2030, 1, 15));
    EXPECT_EQ(scheduler_->processCompletion("sub-404", Date(2030, 1, 15), Date(2030, 1, 15)).code,
              ErrorCode::NOT_FOUND);
}

TEST_F(SubscriptionSchedulerTest, ProcessCompletion_Repeated_AdvancesOnce) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    scheduler_->executeDue(Date(2030, 1, 15));

    auto again = scheduler_->processCompletion(id, Date(2030, 1, 15), Date(2030, 1, 15));

    EXPECT_EQ(again.code, ErrorCode::NONE);
    EXPECT_EQ(*again.subscription->nextBillingDate, Date(2030, 2, 15));
    EXPECT_EQ(scheduler_->obligations(id).size(), 2u);
}

TEST_F(SubscriptionSchedulerTest, Charges_KeepLedgerBalanced) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    scheduler_->executeDue(Date(2030, 1, 15));

    auto report = application::LedgerAuditor(store_).check();

    EXPECT_TRUE(report.balanced());
    EXPECT_EQ(report.totalOutflow, 1500);
    EXPECT_EQ(report.fundsInSystem, 8500);
}

// ============================================================================
// RECOVERY
// ============================================================================

TEST_F(SubscriptionSchedulerTest, StoreOutageAfterCharge_ChainKeepsBilling) {
    auto outage = std::make_shared<StoreOutageOnEvent>(store_, "subscription.charged");
    auto scheduler = std::make_shared<application::SubscriptionScheduler>(store_, engine_, outage, settings_);
    scheduler_ = scheduler;
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler->ensureNextPayment(id, Date(2030, 1, 1));

    EXPECT_THROW(scheduler->executeDue(Date(2030, 1, 15)), domain::StoreUnavailableError);
    store_->setAvailable(true);

    // Дата сдвинута в той же транзакции, что и списание
    EXPECT_EQ(*store_->findSubscription(id)->nextBillingDate, Date(2030, 2, 15));

    for (int month = 2; month <= 4; ++month) {
        scheduler->syncAll(Date(2030, month, 1));
        EXPECT_EQ(scheduler->executeDue(Date(2030, month, 15)).settled, 1) << "month " << month;
    }

    EXPECT_EQ(scheduler->obligations(id).size(), 5u);
    EXPECT_EQ(balanceOf(card_), 10000 - 4 * 1500);
    EXPECT_EQ(*store_->findSubscription(id)->nextBillingDate, Date(2030, 5, 15));
}

TEST_F(SubscriptionSchedulerTest, Sync_SettledButNotAdvanced_CompletesCycle) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    {
        // Обязательство оплачено, а дата подписки осталась прежней
        auto session = store_->begin();
        auto settled = session->findObligation(id, Date(2030, 1, 15));
        settled->status = ObligationStatus::SETTLED;
        session->updateObligation(*settled);
        session->commit();
    }

    auto report = scheduler_->syncAll(Date(2030, 1, 20));

    EXPECT_EQ(report.created, 1);
    auto sub = store_->findSubscription(id);
    EXPECT_EQ(*sub->nextBillingDate, Date(2030, 2, 15));
    EXPECT_EQ(*sub->lastPaymentDate, Date(2030, 1, 15));
    ASSERT_TRUE(obligation(id, Date(2030, 2, 15)).has_value());
    EXPECT_EQ(obligation(id, Date(2030, 2, 15))->status, ObligationStatus::SCHEDULED);
}

// ============================================================================
// PAUSE / RESUME
// ============================================================================

TEST_F(SubscriptionSchedulerTest, Pause_HoldsDueChargeAndStopsScheduling) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    auto paused = scheduler_->pause("alice", id);

    ASSERT_EQ(paused.code, ErrorCode::NONE) << paused.message;
    EXPECT_TRUE(paused.subscription->active);
    EXPECT_FALSE(paused.subscription->autoRenew);

    auto report = scheduler_->executeDue(Date(2030, 1, 15));
    EXPECT_EQ(report.settled, 0);
    EXPECT_EQ(report.failed, 0);
    EXPECT_EQ(report.paused, 1);
    EXPECT_EQ(balanceOf(card_), 10000);
    EXPECT_EQ(obligation(id, Date(2030, 1, 15))->status, ObligationStatus::SCHEDULED);
    EXPECT_EQ(scheduler_->syncAll(Date(2030, 1, 15)).totalActive, 0);
}

TEST_F(SubscriptionSchedulerTest, Resume_BeforeDueDate_ChargesOnSchedule) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    scheduler_->pause("alice", id);

    auto resumed = scheduler_->resume("alice", id, Date(2030, 1, 10));

    ASSERT_EQ(resumed.code, ErrorCode::NONE) << resumed.message;
    EXPECT_TRUE(resumed.subscription->autoRenew);
    EXPECT_EQ(*resumed.subscription->nextBillingDate, Date(2030, 1, 15));
    EXPECT_EQ(scheduler_->executeDue(Date(2030, 1, 15)).settled, 1);
    EXPECT_EQ(balanceOf(card_), 8500);
}

TEST_F(SubscriptionSchedulerTest, Resume_AfterMissedCycles_SkipsPausedPeriod) {
    auto id = subscribe(1500, Date(2030, 1, 15));
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));
    scheduler_->pause("alice", id);

    auto resumed = scheduler_->resume("alice", id, Date(2030, 3, 20));

    ASSERT_EQ(resumed.code, ErrorCode::NONE) << resumed.message;
    EXPECT_EQ(*resumed.subscription->nextBillingDate, Date(2030, 4, 15));

    auto skipped = obligation(id, Date(2030, 1, 15));
    EXPECT_EQ(skipped->status, ObligationStatus::FAILED);
    EXPECT_EQ(skipped->failureReason, "Skipped while paused");
    ASSERT_TRUE(obligation(id, Date(2030, 4, 15)).has_value());

    EXPECT_EQ(scheduler_->executeDue(Date(2030, 3, 20)).settled, 0);
    EXPECT_EQ(scheduler_->executeDue(Date(2030, 4, 15)).settled, 1);
    EXPECT_EQ(balanceOf(card_), 8500);
}

TEST_F(SubscriptionSchedulerTest, PauseResume_Rejections) {
    auto id = subscribe(1500, Date(2030, 1, 15));

    EXPECT_EQ(scheduler_->resume("alice", id, Date(2030, 1, 1)).code, ErrorCode::INVALID_STATE_TRANSITION);
    EXPECT_EQ(scheduler_->pause("bob", id).code, ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(scheduler_->pause("alice", "sub-404").code, ErrorCode::NOT_FOUND);

    ASSERT_EQ(scheduler_->pause("alice", id).code, ErrorCode::NONE);
    EXPECT_EQ(scheduler_->pause("alice", id).code, ErrorCode::INVALID_STATE_TRANSITION);

    scheduler_->cancel("alice", id);
    EXPECT_EQ(scheduler_->resume("alice", id, Date(2030, 1, 1)).code, ErrorCode::INVALID_STATE_TRANSITION);
}

// ============================================================================
// BUDGET CARD LIMIT
// ============================================================================

TEST_F(SubscriptionSchedulerTest, ChargeOnLimitedCard_CountsTowardMonthlyLimit) {
    domain::AccountId limited = 0;
    {
        domain::Account card(0, "alice", domain::AccountKind::BUDGET_CARD);
        card.category = "media";
        card.monthlyLimit = 2000;
        auto session = store_->begin();
        limited = session->createAccount(card);
        session->commit();
    }
    fund(limited, 10000);

    domain::TransferRequest groceries;
    groceries.operationId = "spend-groceries";
    groceries.reason = domain::EntryReason::BUDGET_SPEND;
    groceries.moves = {{limited, -1000}};
    ASSERT_EQ(engine_->applyTransfer(groceries).code, ErrorCode::NONE);

    ports::input::SubscriptionRequest request;
    request.ownerId = "alice";
    request.accountId = limited;
    request.serviceName = "Streamly";
    request.amount = 1500;
    request.billingCycle = domain::BillingCycle::MONTHLY;
    request.firstBillingDate = Date(2030, 1, 15);
    request.autoRenew = true;
    auto id = scheduler_->subscribe(request).subscription->subscriptionId;
    scheduler_->ensureNextPayment(id, Date(2030, 1, 1));

    auto report = scheduler_->executeDue(Date(2030, 1, 15));

    EXPECT_EQ(report.settled, 0);
    EXPECT_EQ(report.failed, 1);
    EXPECT_EQ(balanceOf(limited), 9000);
    auto failed = obligation(id, Date(2030, 1, 15));
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ(failed->status, ObligationStatus::FAILED);
    EXPECT_NE(failed->failureReason.find("exceeds monthly limit"), std::string::npos);
}
