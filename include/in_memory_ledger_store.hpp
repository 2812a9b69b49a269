#ifndef LEDGER_IN_MEMORY_LEDGER_STORE_HPP_
#define LEDGER_IN_MEMORY_LEDGER_STORE_HPP_

#include "ledger_store.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ledger {

/**
 * Process-local LedgerStore.
 *
 * Each account lives in its own entry guarded by a timed shared mutex, so
 * operations on different accounts never contend. Mutations hold the entry
 * lock exclusively for the whole read-modify-append and only write once every
 * check has passed; a failed check leaves the entry untouched. Lock waits are
 * bounded by `lock_timeout` and fail with StorageTimeout.
 */
class InMemoryLedgerStore : public LedgerStore {
 public:
  explicit InMemoryLedgerStore(
      std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));
  ~InMemoryLedgerStore() override = default;

  // Non-copyable
  InMemoryLedgerStore(const InMemoryLedgerStore&) = delete;
  InMemoryLedgerStore& operator=(const InMemoryLedgerStore&) = delete;

  void createAccount(const std::string& account_id, const std::string& customer_name,
                     Money opening_balance) override;

  Account getAccount(const std::string& account_id) override;

  std::vector<Account> listAccounts() override;

  std::vector<Transaction> getRecentTransactions(const std::string& account_id,
                                                 size_t limit) override;

  std::vector<Transaction> getTransactions(const std::string& account_id) override;

  std::vector<InterestRecord> getInterestHistory(const std::string& account_id) override;

  PostingResult post(const PostingRequest& request) override;

  std::pair<PostingResult, PostingResult> postPair(const PostingRequest& first,
                                                   const PostingRequest& second) override;

 private:
  struct AccountEntry {
    std::shared_timed_mutex mutex;
    Account account;
    std::vector<Transaction> transactions;  // commit order
    std::vector<InterestRecord> interest_history;
    std::set<std::string> accrued_dates;
  };

  /**
   * Resolve an entry. Entries are never removed, so the pointer stays valid
   * after the map lock is released.
   */
  AccountEntry* findEntry(const std::string& account_id) const;

  std::unique_lock<std::shared_timed_mutex> lockExclusive(AccountEntry& entry) const;
  std::shared_lock<std::shared_timed_mutex> lockShared(AccountEntry& entry) const;

  /**
   * Validate a staged posting against the entry; throws without writing.
   */
  void checkInterest(const AccountEntry& entry, const PostingRequest& request) const;

  /**
   * Append the staged posting. Must not throw past this point except on
   * allocation failure.
   */
  PostingResult apply(AccountEntry& entry, const PostingRequest& request,
                      const StagedPosting& staged, Timestamp timestamp);

  std::chrono::milliseconds lock_timeout_;
  std::unordered_map<std::string, std::unique_ptr<AccountEntry>> accounts_;
  mutable std::shared_mutex accounts_mutex_;  // guards the map itself
  std::atomic<int64_t> next_transaction_id_;
  std::atomic<int64_t> next_interest_id_;
};

}  // namespace ledger

#endif  // LEDGER_IN_MEMORY_LEDGER_STORE_HPP_
