#include "account_query_facade.hpp"
#include "account_service.hpp"
#include "in_memory_ledger_store.hpp"
#include "interest_accrual_engine.hpp"
#include "ledger_error.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace ledger;
using ledger::test::errorKindOf;
using ledger::test::FaultInjectingStore;
using ledger::test::money;

class AccountQueryFacadeTest : public ::testing::Test {
 protected:
  void SetUp() override {
    seedDemoAccounts(store_);
  }

  InMemoryLedgerStore store_;
  AccountService service_{store_};
  AccountQueryFacade facade_{store_};
};

TEST_F(AccountQueryFacadeTest, ReturnsTenMostRecent) {
  for (int i = 1; i <= 15; ++i) {
    service_.deposit("ACC003", Money::fromCents(i));
  }

  AccountInfo info = facade_.getAccountInfo("ACC003");
  EXPECT_EQ(info.account.balance, Money::fromCents(120));
  ASSERT_EQ(info.recent_transactions.size(), AccountQueryFacade::kRecentTransactionLimit);
  EXPECT_EQ(info.recent_transactions.front().amount, Money::fromCents(15));
  EXPECT_EQ(info.recent_transactions.back().amount, Money::fromCents(6));
}

TEST_F(AccountQueryFacadeTest, SumsAccumulatedInterest) {
  InterestAccrualEngine engine(store_, service_);
  engine.accrueDaily("2026-10-17");
  engine.accrueDaily("2026-10-18");

  // 1000.00 -> +0.50 -> 1000.50 -> +0.50
  AccountInfo info = facade_.getAccountInfo("ACC001");
  EXPECT_EQ(info.accumulated_interest, money("1.00"));
  EXPECT_EQ(info.account.balance, money("1001.00"));

  auto history = facade_.getInterestHistory("ACC001");
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].calculation_date, "2026-10-17");
}

TEST_F(AccountQueryFacadeTest, ReadsHaveNoSideEffects) {
  service_.deposit("ACC002", money("5.00"));

  AccountInfo first = facade_.getAccountInfo("ACC002");
  AccountInfo second = facade_.getAccountInfo("ACC002");

  EXPECT_EQ(first.account.balance, second.account.balance);
  ASSERT_EQ(first.recent_transactions.size(), second.recent_transactions.size());
  EXPECT_EQ(first.recent_transactions[0].transaction_id,
            second.recent_transactions[0].transaction_id);
  EXPECT_EQ(store_.getTransactions("ACC002").size(), 1u);
}

TEST_F(AccountQueryFacadeTest, UnknownAccount) {
  EXPECT_EQ(errorKindOf([&] { facade_.getAccountInfo("ACC404"); }), ErrorKind::AccountNotFound);
  EXPECT_EQ(errorKindOf([&] { facade_.getInterestHistory("ACC404"); }),
            ErrorKind::AccountNotFound);
  EXPECT_EQ(errorKindOf([&] { facade_.reconcile("ACC404"); }), ErrorKind::AccountNotFound);
}

TEST_F(AccountQueryFacadeTest, ReconcileAfterMixedActivity) {
  service_.deposit("ACC001", money("250.50"));
  service_.withdraw("ACC001", money("50.25"));
  store_.postPair(
      PostingRequest::fixed("ACC001", TransactionType::TRANSFER_OUT, money("100.00"), "", "T-1"),
      PostingRequest::fixed("ACC002", TransactionType::TRANSFER_IN, money("100.00"), "", "T-1"));

  ReconciliationReport report = facade_.reconcile("ACC001");
  EXPECT_TRUE(report.balanced);
  EXPECT_EQ(report.opening_balance, money("1000.00"));
  EXPECT_EQ(report.ledger_sum, money("100.25"));
  EXPECT_EQ(report.balance, money("1100.25"));
  EXPECT_EQ(report.transaction_count, 3u);

  EXPECT_TRUE(facade_.reconcile("ACC002").balanced);
  EXPECT_TRUE(facade_.reconcile("ACC003").balanced);
}

TEST_F(AccountQueryFacadeTest, StorageFailurePropagates) {
  FaultInjectingStore faulty(store_);
  faulty.failReads(ErrorKind::StorageTimeout);
  AccountQueryFacade facade(faulty);

  EXPECT_EQ(errorKindOf([&] { facade.getAccountInfo("ACC001"); }), ErrorKind::StorageTimeout);
}
