#include "account_query_facade.hpp"
#include "account_service.hpp"
#include "concurrent/account_lock_table.hpp"
#include "in_memory_ledger_store.hpp"
#include "ledger_error.hpp"
#include "test_support.hpp"
#include "transfer_coordinator.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>
#include <vector>

using namespace ledger;
using ledger::test::errorKindOf;
using ledger::test::money;

namespace {

constexpr int kThreads = 8;
constexpr int kOperationsPerThread = 50;

}  // namespace

class ConcurrencyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    seedDemoAccounts(store_);
  }

  InMemoryLedgerStore store_;
  concurrent::AccountLockTable locks_;
  AccountService service_{store_};
  TransferCoordinator coordinator_{store_, locks_};
  AccountQueryFacade facade_{store_};
};

TEST_F(ConcurrencyTest, ConcurrentDepositsAreAllApplied) {
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this] {
      for (int i = 0; i < kOperationsPerThread; ++i) {
        service_.deposit("ACC003", money("1.25"));
      }
    });
  }
  for (auto& thread : threads) thread.join();

  Money expected = Money::fromCents(125 * kThreads * kOperationsPerThread);
  EXPECT_EQ(store_.getAccount("ACC003").balance, expected);
  EXPECT_EQ(store_.getTransactions("ACC003").size(),
            static_cast<size_t>(kThreads * kOperationsPerThread));
  EXPECT_TRUE(facade_.reconcile("ACC003").balanced);
}

TEST_F(ConcurrencyTest, ConcurrentWithdrawalsNeverOverdraw) {
  // 500.00 covers exactly 100 withdrawals of 5.00.
  std::atomic<int> succeeded{0};
  std::atomic<int> rejected{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 20; ++i) {
        auto kind = errorKindOf([&] { service_.withdraw("ACC002", money("5.00")); });
        if (!kind) {
          ++succeeded;
        } else if (*kind == ErrorKind::InsufficientFunds) {
          ++rejected;
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(succeeded.load(), 100);
  EXPECT_EQ(rejected.load(), kThreads * 20 - 100);
  EXPECT_EQ(store_.getAccount("ACC002").balance, Money());
  EXPECT_TRUE(facade_.reconcile("ACC002").balanced);
}

TEST_F(ConcurrencyTest, OpposingTransfersDoNotDeadlock) {
  Money total_before = store_.getAccount("ACC001").balance + store_.getAccount("ACC002").balance;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    bool forward = t % 2 == 0;
    threads.emplace_back([this, forward] {
      for (int i = 0; i < kOperationsPerThread; ++i) {
        const char* from = forward ? "ACC001" : "ACC002";
        const char* to = forward ? "ACC002" : "ACC001";
        // Insufficient funds is an acceptable outcome; anything else is not.
        auto kind = errorKindOf([&] { coordinator_.transfer(from, to, money("3.00")); });
        if (kind) {
          EXPECT_EQ(*kind, ErrorKind::InsufficientFunds);
        }
      }
    });
  }
  for (auto& thread : threads) thread.join();

  Money total_after = store_.getAccount("ACC001").balance + store_.getAccount("ACC002").balance;
  EXPECT_EQ(total_after, total_before);
  EXPECT_FALSE(store_.getAccount("ACC001").balance.isNegative());
  EXPECT_FALSE(store_.getAccount("ACC002").balance.isNegative());
  EXPECT_TRUE(facade_.reconcile("ACC001").balanced);
  EXPECT_TRUE(facade_.reconcile("ACC002").balanced);
}

TEST_F(ConcurrencyTest, ReadersSeeConsistentBalances) {
  std::atomic<bool> done{false};
  std::thread writer([&] {
    for (int i = 0; i < 200; ++i) {
      coordinator_.transfer(i % 2 ? "ACC001" : "ACC002", i % 2 ? "ACC002" : "ACC001",
                            money("1.00"));
    }
    done = true;
  });

  while (!done) {
    AccountInfo info = facade_.getAccountInfo("ACC001");
    EXPECT_FALSE(info.account.balance.isNegative());
    EXPECT_LE(info.recent_transactions.size(), AccountQueryFacade::kRecentTransactionLimit);
  }
  writer.join();

  EXPECT_EQ(store_.getAccount("ACC001").balance, money("1000.00"));
}

TEST(AccountLockTableTest, PairOrderIsIndependentOfArguments) {
  concurrent::AccountLockTable locks(std::chrono::milliseconds(2000));
  std::atomic<int> completed{0};

  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 200; ++i) {
        auto guard = t % 2 ? locks.lockPair("A", "B") : locks.lockPair("B", "A");
        ++completed;
      }
    });
  }
  for (auto& thread : threads) thread.join();

  EXPECT_EQ(completed.load(), 800);
  EXPECT_EQ(locks.size(), 2u);
}

TEST(AccountLockTableTest, WaitIsBounded) {
  concurrent::AccountLockTable locks(std::chrono::milliseconds(20));
  auto held = locks.lock("ACC001");

  std::optional<ErrorKind> kind;
  std::thread waiter([&] { kind = errorKindOf([&] { locks.lock("ACC001"); }); });
  waiter.join();

  EXPECT_EQ(kind, ErrorKind::StorageTimeout);

  held.unlock();
  EXPECT_NO_THROW(locks.lock("ACC001"));
}

TEST(AccountLockTableTest, PairGuardReleasesBoth) {
  concurrent::AccountLockTable locks(std::chrono::milliseconds(20));
  {
    auto guard = locks.lockPair("ACC002", "ACC001");
  }

  std::thread other([&] {
    EXPECT_NO_THROW(locks.lock("ACC001"));
    EXPECT_NO_THROW(locks.lock("ACC002"));
  });
  other.join();
}
