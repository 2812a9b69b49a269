#ifndef LEDGER_ACCOUNT_LOCK_TABLE_HPP_
#define LEDGER_ACCOUNT_LOCK_TABLE_HPP_

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ledger {
namespace concurrent {

/**
 * One timed mutex per account id, created on first use and kept for the life
 * of the table.
 *
 * Pairs are always locked lower id first, so two callers locking {A, B} and
 * {B, A} queue on the same mutex instead of deadlocking.
 */
class AccountLockTable {
 public:
  /**
   * Holds both locks of a pair; releases them in reverse order on destruction.
   */
  class PairGuard {
   public:
    PairGuard(std::unique_lock<std::timed_mutex> lower, std::unique_lock<std::timed_mutex> upper);
    ~PairGuard();

    PairGuard(PairGuard&&) = default;
    PairGuard& operator=(PairGuard&&) = delete;

   private:
    std::unique_lock<std::timed_mutex> lower_;
    std::unique_lock<std::timed_mutex> upper_;
  };

  explicit AccountLockTable(
      std::chrono::milliseconds lock_timeout = std::chrono::milliseconds(5000));

  // Non-copyable
  AccountLockTable(const AccountLockTable&) = delete;
  AccountLockTable& operator=(const AccountLockTable&) = delete;

  /**
   * Lock a single account. Throws LedgerError(StorageTimeout) when the wait
   * exceeds the configured timeout.
   */
  std::unique_lock<std::timed_mutex> lock(const std::string& account_id);

  /**
   * Lock two distinct accounts in lexicographic id order, independent of the
   * argument order.
   */
  PairGuard lockPair(const std::string& account_a, const std::string& account_b);

  size_t size() const;

 private:
  std::timed_mutex& mutexFor(const std::string& account_id);

  std::chrono::milliseconds lock_timeout_;
  std::unordered_map<std::string, std::unique_ptr<std::timed_mutex>> mutexes_;
  mutable std::mutex table_mutex_;
};

}  // namespace concurrent
}  // namespace ledger

#endif  // LEDGER_ACCOUNT_LOCK_TABLE_HPP_
