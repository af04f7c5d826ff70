/**
 * @file LoanServiceTest.cpp
 * @brief Unit tests for LoanService
 */

#include "../fixtures/LedgerFixture.hpp"
#include "application/LoanService.hpp"
#include "application/LedgerAuditor.hpp"

using namespace wallet;
using namespace wallet::tests;
using domain::ErrorCode;
using domain::LoanStatus;

class LoanServiceTest : public LedgerFixture {
protected:
    void SetUp() override {
        LedgerFixture::SetUp();
        service_ = std::make_shared<application::LoanService>(store_, engine_, publisher_, settings_);
        lender_ = openAccount("lender", domain::AccountKind::WALLET, 100000);
        borrower_ = openAccount("borrower", domain::AccountKind::WALLET, 5000);
        publisher_->clearMessages();
    }

    std::shared_ptr<application::LoanService> service_;
    domain::AccountId lender_ = 0;
    domain::AccountId borrower_ = 0;
};

TEST_F(LoanServiceTest, Disburse_MovesPrincipalAndOpensMemo) {
    auto result = service_->disburse("lender", lender_, borrower_, 30000);

    ASSERT_EQ(result.code, ErrorCode::NONE) << result.message;
    ASSERT_TRUE(result.loan.has_value());
    EXPECT_EQ(result.outstanding, 30000);
    EXPECT_EQ(result.loan->status, LoanStatus::ACTIVE);

    EXPECT_EQ(balanceOf(lender_), 70000);
    EXPECT_EQ(balanceOf(borrower_), 35000);
    EXPECT_EQ(balanceOf(result.loan->loanAccountId), 30000);

    auto memo = store_->findAccount(result.loan->loanAccountId);
    EXPECT_EQ(memo->kind, domain::AccountKind::LOAN);
    EXPECT_EQ(memo->ownerId, "borrower");

    EXPECT_TRUE(service_->getLoan(result.loan->loanId).has_value());
    EXPECT_EQ(publisher_->messagesFor("loan.disbursed").size(), 1u);
}

TEST_F(LoanServiceTest, Disburse_LenderShort_ClosesMemo) {
    auto result = service_->disburse("lender", lender_, borrower_, 200000);

    EXPECT_EQ(result.code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(result.shortfall(), 100000);
    EXPECT_EQ(balanceOf(borrower_), 5000);

    for (const auto& account : store_->findAccountsByOwner("borrower")) {
        if (account.kind == domain::AccountKind::LOAN) {
            EXPECT_EQ(account.status, domain::AccountStatus::CLOSED);
            EXPECT_EQ(account.balance, 0);
        }
    }
}

TEST_F(LoanServiceTest, Disburse_Rejections) {
    auto card = openAccount("borrower", domain::AccountKind::BUDGET_CARD);

    EXPECT_EQ(service_->disburse("lender", lender_, borrower_, 0).code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(service_->disburse("lender", lender_, lender_, 100).code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(service_->disburse("borrower", lender_, borrower_, 100).code, ErrorCode::UNAUTHORIZED);
    EXPECT_EQ(service_->disburse("lender", lender_, 9999, 100).code, ErrorCode::ACCOUNT_NOT_FOUND);
    EXPECT_EQ(service_->disburse("lender", lender_, card, 100).code, ErrorCode::INVALID_REQUEST);
}

TEST_F(LoanServiceTest, Repay_PartialThenFull) {
    auto loan = service_->disburse("lender", lender_, borrower_, 30000).loan->loanId;

    auto partial = service_->repay("borrower", loan, 10000, "repay-1");
    ASSERT_EQ(partial.code, ErrorCode::NONE) << partial.message;
    EXPECT_EQ(partial.outstanding, 20000);
    EXPECT_EQ(partial.loan->status, LoanStatus::ACTIVE);

    auto full = service_->repay("borrower", loan, 20000, "repay-2");
    ASSERT_EQ(full.code, ErrorCode::NONE) << full.message;
    EXPECT_EQ(full.outstanding, 0);
    EXPECT_EQ(full.loan->status, LoanStatus::REPAID);
    EXPECT_TRUE(full.loan->repaidAt.has_value());

    EXPECT_EQ(balanceOf(lender_), 100000);
    EXPECT_EQ(balanceOf(borrower_), 5000);
    EXPECT_EQ(publisher_->messagesFor("loan.repaid").size(), 2u);
}

TEST_F(LoanServiceTest, Repay_MoreThanOutstanding_Rejected) {
    auto loan = service_->disburse("lender", lender_, borrower_, 3000).loan->loanId;

    auto result = service_->repay("borrower", loan, 4000, "repay-1");

    EXPECT_EQ(result.code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(result.available, 3000);
    EXPECT_EQ(result.required, 4000);
    EXPECT_NE(result.message.find("by $10.00"), std::string::npos);
    EXPECT_EQ(result.outstanding, 3000);
}

TEST_F(LoanServiceTest, Repay_AfterRepaid_InvalidTransition) {
    auto loan = service_->disburse("lender", lender_, borrower_, 3000).loan->loanId;
    service_->repay("borrower", loan, 3000, "repay-1");

    EXPECT_EQ(service_->repay("borrower", loan, 100, "repay-2").code, ErrorCode::INVALID_STATE_TRANSITION);
}

TEST_F(LoanServiceTest, Repay_Duplicate_AppliedOnce) {
    auto loan = service_->disburse("lender", lender_, borrower_, 30000).loan->loanId;

    service_->repay("borrower", loan, 1000, "repay-1");
    auto again = service_->repay("borrower", loan, 1000, "repay-1");

    EXPECT_EQ(again.code, ErrorCode::DUPLICATE_OPERATION);
    EXPECT_EQ(again.outstanding, 29000);
}

TEST_F(LoanServiceTest, Repay_Rejections) {
    auto loan = service_->disburse("lender", lender_, borrower_, 30000).loan->loanId;

    EXPECT_EQ(service_->repay("borrower", loan, 0, "r-0").code, ErrorCode::INVALID_REQUEST);
    EXPECT_EQ(service_->repay("borrower", "loan-404", 100, "r-1").code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(service_->repay("lender", loan, 100, "r-2").code, ErrorCode::UNAUTHORIZED);
}

TEST_F(LoanServiceTest, Repay_BorrowerShort_ReportsShortfall) {
    auto loan = service_->disburse("lender", lender_, borrower_, 30000).loan->loanId;
    auto sink = openAccount("sink");
    ASSERT_EQ(engine_->applyTransfer(transferRequest("spend-all", borrower_, sink, 35000)).code, ErrorCode::NONE);

    auto result = service_->repay("borrower", loan, 10000, "repay-1");

    EXPECT_EQ(result.code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(result.outstanding, 30000);
}

TEST_F(LoanServiceTest, MemoAccounts_DoNotBreakConservation) {
    auto loan = service_->disburse("lender", lender_, borrower_, 30000).loan->loanId;
    service_->repay("borrower", loan, 12000, "repay-1");

    auto report = application::LedgerAuditor(store_).check();

    EXPECT_TRUE(report.balanced());
    EXPECT_EQ(report.loansOutstanding, 18000);
    EXPECT_EQ(report.fundsInSystem, 105000);
}
