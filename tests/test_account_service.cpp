#include "account_service.hpp"
#include "in_memory_ledger_store.hpp"
#include "ledger_error.hpp"
#include "observability/metrics.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace ledger;
using ledger::test::countOfType;
using ledger::test::errorKindOf;
using ledger::test::money;

class AccountServiceTest : public ::testing::Test {
 protected:
  void SetUp() override {
    seedDemoAccounts(store_);
  }

  InMemoryLedgerStore store_;
  AccountService service_{store_};
};

TEST_F(AccountServiceTest, DepositCreditsBalanceAndAppendsOneRow) {
  Money balance = service_.deposit("ACC001", money("250.50"));

  EXPECT_EQ(balance, money("1250.50"));
  EXPECT_EQ(store_.getAccount("ACC001").balance, money("1250.50"));

  auto log = store_.getTransactions("ACC001");
  ASSERT_EQ(log.size(), 1u);
  EXPECT_EQ(log[0].type, TransactionType::DEPOSIT);
  EXPECT_EQ(log[0].amount, money("250.50"));
}

TEST_F(AccountServiceTest, WithdrawBeyondBalanceFailsWithoutEffect) {
  store_.createAccount("ACC100", "Low Balance", money("100.00"));

  EXPECT_EQ(errorKindOf([&] { service_.withdraw("ACC100", money("150.00")); }),
            ErrorKind::InsufficientFunds);
  EXPECT_EQ(store_.getAccount("ACC100").balance, money("100.00"));
  EXPECT_TRUE(store_.getTransactions("ACC100").empty());
}

TEST_F(AccountServiceTest, WithdrawDebitsBalance) {
  EXPECT_EQ(service_.withdraw("ACC002", money("120.25")), money("379.75"));
  EXPECT_EQ(service_.withdraw("ACC002", money("379.75")), Money());

  auto log = store_.getTransactions("ACC002");
  EXPECT_EQ(countOfType(log, TransactionType::WITHDRAWAL), 2u);
  EXPECT_EQ(errorKindOf([&] { service_.withdraw("ACC002", money("0.01")); }),
            ErrorKind::InsufficientFunds);
}

TEST_F(AccountServiceTest, ZeroAndNegativeAmountsAreInvalid) {
  EXPECT_EQ(errorKindOf([&] { service_.deposit("ACC001", money("0")); }),
            ErrorKind::InvalidAmount);
  EXPECT_EQ(errorKindOf([&] { service_.deposit("ACC001", money("-5.00")); }),
            ErrorKind::InvalidAmount);
  EXPECT_EQ(errorKindOf([&] { service_.withdraw("ACC001", money("0.00")); }),
            ErrorKind::InvalidAmount);

  EXPECT_EQ(store_.getAccount("ACC001").balance, money("1000.00"));
  EXPECT_TRUE(store_.getTransactions("ACC001").empty());
}

TEST_F(AccountServiceTest, ValidationRunsBeforeLookup) {
  // An invalid amount is reported even for an unknown account.
  EXPECT_EQ(errorKindOf([&] { service_.deposit("NOPE", money("0")); }),
            ErrorKind::InvalidAmount);
  EXPECT_EQ(errorKindOf([&] { service_.deposit("NOPE", money("1.00")); }),
            ErrorKind::AccountNotFound);
  EXPECT_EQ(errorKindOf([&] { service_.withdraw("NOPE", money("1.00")); }),
            ErrorKind::AccountNotFound);
}

TEST_F(AccountServiceTest, CountsOutcomes) {
  auto& metrics = observability::getGlobalMetrics();
  const observability::Labels deposited = {{"operation", "deposit"}, {"outcome", "committed"}};
  const observability::Labels overdrawn = {{"operation", "withdrawal"},
                                           {"outcome", "INSUFFICIENT_FUNDS"}};
  double deposits = metrics.counterValue("ledger_operations_total", deposited);
  double failed = metrics.counterValue("ledger_operations_total", overdrawn);

  service_.deposit("ACC003", money("10.00"));
  EXPECT_THROW(service_.withdraw("ACC003", money("20.00")), LedgerError);

  EXPECT_EQ(metrics.counterValue("ledger_operations_total", deposited), deposits + 1);
  EXPECT_EQ(metrics.counterValue("ledger_operations_total", overdrawn), failed + 1);
}

TEST_F(AccountServiceTest, CountsInterestOutcomes) {
  auto& metrics = observability::getGlobalMetrics();
  const observability::Labels credited = {{"operation", "interest"}, {"outcome", "committed"}};
  const observability::Labels duplicate = {{"operation", "interest"},
                                           {"outcome", "CONSTRAINT_VIOLATION"}};
  double committed = metrics.counterValue("ledger_operations_total", credited);
  double rejected = metrics.counterValue("ledger_operations_total", duplicate);

  service_.creditInterest("ACC001", InterestRate::fromPerMillion(500), "2026-10-19");
  EXPECT_THROW(service_.creditInterest("ACC001", InterestRate::fromPerMillion(500), "2026-10-19"),
               LedgerError);

  EXPECT_EQ(metrics.counterValue("ledger_operations_total", credited), committed + 1);
  EXPECT_EQ(metrics.counterValue("ledger_operations_total", duplicate), rejected + 1);
}

TEST_F(AccountServiceTest, CreditInterestRecordsHistory) {
  store_.createAccount("ACC200", "Saver", money("10000.00"));

  PostingResult result =
      service_.creditInterest("ACC200", InterestRate::fromPerMillion(500), "2026-10-18");

  EXPECT_EQ(result.transaction.amount, money("5.00"));
  EXPECT_EQ(result.transaction.type, TransactionType::DEPOSIT);
  ASSERT_TRUE(result.interest_record.has_value());
  EXPECT_EQ(result.interest_record->calculated_interest, money("5.00"));
  EXPECT_EQ(result.interest_record->interest_rate, InterestRate::fromPerMillion(500));
  EXPECT_EQ(store_.getAccount("ACC200").balance, money("10005.00"));

  // Zero-balance accounts earn nothing and get no row.
  EXPECT_EQ(errorKindOf([&] {
              service_.creditInterest("ACC003", InterestRate::fromPerMillion(500), "2026-10-18");
            }),
            ErrorKind::InvalidAmount);
  EXPECT_TRUE(store_.getTransactions("ACC003").empty());
}

TEST_F(AccountServiceTest, GetAccountInfo) {
  service_.deposit("ACC002", money("20.00"));

  AccountInfo info = service_.getAccountInfo("ACC002");
  EXPECT_EQ(info.account.account_id, "ACC002");
  EXPECT_EQ(info.account.balance, money("520.00"));
  ASSERT_EQ(info.recent_transactions.size(), 1u);
  EXPECT_EQ(info.accumulated_interest, Money());

  EXPECT_EQ(errorKindOf([&] { service_.getAccountInfo("NOPE"); }), ErrorKind::AccountNotFound);
}
