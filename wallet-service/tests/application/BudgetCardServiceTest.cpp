/**
 * @file BudgetCardServiceTest.cpp
 * @brief Unit tests for BudgetCardService
 */

#include "../fixtures/LedgerFixture.hpp"
#include "application/BudgetCardService.hpp"
#include "application/WalletService.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace wallet;
using namespace wallet::tests;
using domain::ErrorCode;

class BudgetCardServiceTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        wallets_ = std::make_shared<application::WalletService>(store_, engine_, settings_);
        service_ = std::make_shared<application::BudgetCardService>(store_, engine_, settings_);
        wallet_ = openAccount("alice", domain::AccountKind::WALLET, 100000);
    }

    // Карта с выделенными средствами
    domain::AccountId card(int64_t allocated, std::optional<int64_t> limit = std::nullopt,
                           const std::string& category = "food") {
        auto created = service_->createCard("alice", category, limit);
        EXPECT_TRUE(created.isSuccess()) << created.message;
        auto id = created.account->id;
        if (allocated > 0) {
            auto result = service_->allocate("alice", wallet_, id, allocated,
                                             "alloc-" + std::to_string(id));
            EXPECT_EQ(result.code, ErrorCode::NONE) << result.message;
        }
        return id;
    }

    std::shared_ptr<application::WalletService> wallets_;
    std::shared_ptr<application::BudgetCardService> service_;
    domain::AccountId wallet_ = 0;
};

// ============================================================================
// CREATE / ALLOCATE
// ============================================================================

TEST_F(BudgetCardServiceTest, CreateCard_StoresCategoryAndLimit) {
    auto result = service_->createCard("alice", "entertainment", 5000);

    ASSERT_TRUE(result.isSuccess());
    auto stored = store_->findAccount(result.account->id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->kind, domain::AccountKind::BUDGET_CARD);
    EXPECT_EQ(stored->category, "entertainment");
    ASSERT_TRUE(stored->monthlyLimit.has_value());
    EXPECT_EQ(*stored->monthlyLimit, 5000);
}

TEST_F(BudgetCardServiceTest, CreateCard_NonPositiveLimit_Rejected) {
    EXPECT_EQ(service_->createCard("alice", "food", 0).code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(service_->createCard("", "food", std::nullopt).code, ErrorCode::INVALID_REQUEST);
}

TEST_F(BudgetCardServiceTest, Allocate_MovesFundsFromWallet) {
    auto id = card(30000);

    EXPECT_EQ(balanceOf(wallet_), 70000);
    EXPECT_EQ(balanceOf(id), 30000);
}

TEST_F(BudgetCardServiceTest, Allocate_Rejections) {
    auto id = card(0);
    auto foreign = openAccount("bob", domain::AccountKind::WALLET, 1000);

    EXPECT_EQ(service_->allocate("alice", wallet_, id, 0, "a-0").code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(service_->allocate("alice", foreign, id, 100, "a-1").code, ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(service_->allocate("alice", wallet_, wallet_, 100, "a-2").code, ErrorCode::INVALID_REQUEST);

    auto tooMuch = service_->allocate("alice", wallet_, id, 200000, "a-3");
    EXPECT_EQ(tooMuch.code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(tooMuch.available, 100000);
    EXPECT_EQ(tooMuch.required, 200000);
}

// ============================================================================
// CAN SPEND
// ============================================================================

TEST_F(BudgetCardServiceTest, CanSpend_WithinBalance) {
    auto id = card(5000);

    auto decision = service_->canSpend(id, 5000);

    EXPECT_TRUE(decision.allowed);
    EXPECT_EQ(decision.code, ErrorCode::NONE);
}

TEST_F(BudgetCardServiceTest, CanSpend_ExceedsBalance_NamesBalance) {
    auto id = card(5000);

    auto decision = service_->canSpend(id, 6000);

    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(decision.shortfall, 1000);
    EXPECT_NE(decision.reason.find("exceeds allocated balance"), std::string::npos);
}

TEST_F(BudgetCardServiceTest, CanSpend_LimitReached_NamesMonthlyLimit) {
    // лимит $100, уже потрачено $100, баланс ещё есть
    auto id = card(20000, 10000);
    ASSERT_EQ(service_->spend("alice", id, 10000, "groceries", "spend-1").code, ErrorCode::NONE);

    auto decision = service_->canSpend(id, 9000);

    EXPECT_FALSE(decision.allowed);
    EXPECT_EQ(decision.code, ErrorCode::MONTHLY_LIMIT_EXCEEDED);
    EXPECT_EQ(decision.shortfall, 9000);
    ASSERT_TRUE(decision.monthlyRemaining.has_value());
    EXPECT_EQ(*decision.monthlyRemaining, 0);
    EXPECT_NE(decision.reason.find("exceeds monthly limit"), std::string::npos);
}

TEST_F(BudgetCardServiceTest, CanSpend_BothExceeded_LimitReportedFirst) {
    auto id = card(3000, 2000);

    auto decision = service_->canSpend(id, 5000);

    EXPECT_EQ(decision.code, ErrorCode::MONTHLY_LIMIT_EXCEEDED);
}

TEST_F(BudgetCardServiceTest, CanSpend_FrozenOrMissingOrWrongKind) {
    auto id = card(5000);
    ASSERT_TRUE(wallets_->freeze("alice", id).isSuccess());

    EXPECT_EQ(service_->canSpend(id, 100).code, ErrorCode::ACCOUNT_FROZEN);
    EXPECT_EQ(service_->canSpend(9999, 100).code, ErrorCode::ACCOUNT_NOT_FOUND);
    EXPECT_EQ(service_->canSpend(wallet_, 100).code, ErrorCode::INVALID_REQUEST);
}

TEST_F(BudgetCardServiceTest, Evaluate_NonPositiveAmount) {
    domain::Account account(1, "alice", domain::AccountKind::BUDGET_CARD, 1000);
    EXPECT_EQ(application::BudgetCardService::evaluate(account, 0, 0).code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(application::BudgetCardService::evaluate(account, -5, 0).code, ErrorCode::INVALID_REQUEST);
}

// ============================================================================
// SPEND
// ============================================================================

TEST_F(BudgetCardServiceTest, Spend_DebitsCardAndLeavesSystem) {
    auto id = card(5000);

    auto result = service_->spend("alice", id, 1250, "lunch", "spend-1");

    ASSERT_EQ(result.code, ErrorCode::NONE) << result.message;
    EXPECT_EQ(balanceOf(id), 3750);
    ASSERT_EQ(result.entries.size(), 1u);
    EXPECT_EQ(result.entries[0].reason, domain::EntryReason::BUDGET_SPEND);
    EXPECT_EQ(result.entries[0].description, "lunch");
}

TEST_F(BudgetCardServiceTest, Spend_OverLimit_RejectedWithRemaining) {
    auto id = card(20000, 10000);
    service_->spend("alice", id, 7000, "a", "spend-1");

    auto result = service_->spend("alice", id, 4000, "b", "spend-2");

    EXPECT_EQ(result.code, ErrorCode::MONTHLY_LIMIT_EXCEEDED);
    EXPECT_EQ(result.available, 3000);
    EXPECT_EQ(result.required, 4000);
    EXPECT_EQ(balanceOf(id), 13000);
}

TEST_F(BudgetCardServiceTest, Spend_ForeignCard_Unauthorized) {
    auto id = card(5000);
    EXPECT_EQ(service_->spend("bob", id, 100, "x", "spend-1").code, ErrorCode::UNAUTHORIZED);
}

TEST_F(BudgetCardServiceTest, Spend_Duplicate_AppliedOnce) {
    auto id = card(5000, 10000);

    service_->spend("alice", id, 1000, "x", "spend-1");
    auto again = service_->spend("alice", id, 1000, "x", "spend-1");

    EXPECT_EQ(again.code, ErrorCode::DUPLICATE_OPERATION);
    EXPECT_EQ(balanceOf(id), 4000);
}

TEST_F(BudgetCardServiceTest, ConcurrentSpends_RespectMonthlyLimit) {
    auto id = card(50000, 1000);

    std::atomic<bool> go{false};
    std::atomic<int> succeeded{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 10; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = service_->spend("alice", id, 300, "coffee", "spend-" + std::to_string(i));
            if (result.code == ErrorCode::NONE) {
                ++succeeded;
            }
        });
    }
    go = true;
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 3);
    EXPECT_EQ(balanceOf(id), 50000 - 900);
}

// ============================================================================
// LIMIT / SUMMARY
// ============================================================================

TEST_F(BudgetCardServiceTest, SetMonthlyLimit_ChangesAndClears) {
    auto id = card(5000, 1000);

    auto raised = service_->setMonthlyLimit("alice", id, 4000);
    ASSERT_TRUE(raised.isSuccess());
    EXPECT_TRUE(service_->canSpend(id, 3000).allowed);

    auto cleared = service_->setMonthlyLimit("alice", id, std::nullopt);
    ASSERT_TRUE(cleared.isSuccess());
    EXPECT_FALSE(store_->findAccount(id)->monthlyLimit.has_value());
    EXPECT_TRUE(service_->canSpend(id, 5000).allowed);
}

TEST_F(BudgetCardServiceTest, SetMonthlyLimit_Rejections) {
    auto id = card(0);

    EXPECT_EQ(service_->setMonthlyLimit("alice", id, -1).code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(service_->setMonthlyLimit("bob", id, 100).code, ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(service_->setMonthlyLimit("alice", wallet_, 100).code, ErrorCode::INVALID_REQUEST);
}

TEST_F(BudgetCardServiceTest, Summary_TotalsAcrossCards) {
    auto food = card(10000, std::nullopt, "food");
    auto fun = card(5000, 3000, "fun");
    service_->spend("alice", food, 2500, "market", "spend-1");
    service_->spend("alice", fun, 1000, "cinema", "spend-2");

    auto summary = service_->summary("alice");

    ASSERT_EQ(summary.cards.size(), 2u);
    EXPECT_EQ(summary.totalAllocated, 15000);
    EXPECT_EQ(summary.totalSpent, 3500);
    EXPECT_EQ(summary.totalRemaining, 11500);

    for (const auto& c : summary.cards) {
        if (c.category == "fun") {
            EXPECT_EQ(c.spentThisMonth, 1000);
            ASSERT_TRUE(c.monthlyLimit.has_value());
            EXPECT_EQ(*c.monthlyLimit, 3000);
        }
    }
}

TEST_F(BudgetCardServiceTest, SubscriptionCharges_CountTowardMonthlyLimit) {
    auto id = card(20000, 5000, "media");

    domain::TransferRequest charge;
    charge.operationId = "subscription:sub-1:2030-01-15";
    charge.reason = domain::EntryReason::SUBSCRIPTION_CHARGE;
    charge.moves = {{id, -3000}};
    ASSERT_EQ(engine_->applyTransfer(charge).code, ErrorCode::NONE);

    auto decision = service_->canSpend(id, 2500);
    EXPECT_EQ(decision.code, ErrorCode::MONTHLY_LIMIT_EXCEEDED);
    ASSERT_TRUE(decision.monthlyRemaining.has_value());
    EXPECT_EQ(*decision.monthlyRemaining, 2000);

    auto spent = service_->spend("alice", id, 2500, "concert", "spend-1");
    EXPECT_EQ(spent.code, ErrorCode::MONTHLY_LIMIT_EXCEEDED);
    EXPECT_EQ(balanceOf(id), 17000);

    auto summary = service_->summary("alice");
    ASSERT_EQ(summary.cards.size(), 1u);
    EXPECT_EQ(summary.cards[0].spentThisMonth, 3000);
    EXPECT_EQ(summary.cards[0].spent, 3000);
}
