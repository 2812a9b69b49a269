#include "concurrent/account_lock_table.hpp"
#include "ledger_error.hpp"

#include <utility>

namespace ledger {
namespace concurrent {

AccountLockTable::PairGuard::PairGuard(std::unique_lock<std::timed_mutex> lower,
                                       std::unique_lock<std::timed_mutex> upper)
    : lower_(std::move(lower)), upper_(std::move(upper)) {
}

AccountLockTable::PairGuard::~PairGuard() {
  if (upper_.owns_lock()) upper_.unlock();
  if (lower_.owns_lock()) lower_.unlock();
}

AccountLockTable::AccountLockTable(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout) {
}

std::unique_lock<std::timed_mutex> AccountLockTable::lock(const std::string& account_id) {
  std::unique_lock<std::timed_mutex> guard(mutexFor(account_id), std::defer_lock);
  if (!guard.try_lock_for(lock_timeout_)) {
    throw LedgerError(ErrorKind::StorageTimeout,
                      "Timed out acquiring lock for account " + account_id);
  }
  return guard;
}

AccountLockTable::PairGuard AccountLockTable::lockPair(const std::string& account_a,
                                                       const std::string& account_b) {
  if (account_a == account_b) {
    throw LedgerError(ErrorKind::InvalidTransfer,
                      "Cannot lock account " + account_a + " against itself");
  }

  const std::string& lower_id = account_a < account_b ? account_a : account_b;
  const std::string& upper_id = account_a < account_b ? account_b : account_a;

  // If the second wait times out, `lower` is released as the exception unwinds.
  auto lower = lock(lower_id);
  auto upper = lock(upper_id);
  return PairGuard(std::move(lower), std::move(upper));
}

size_t AccountLockTable::size() const {
  std::lock_guard<std::mutex> guard(table_mutex_);
  return mutexes_.size();
}

std::timed_mutex& AccountLockTable::mutexFor(const std::string& account_id) {
  std::lock_guard<std::mutex> guard(table_mutex_);
  auto& mutex_ptr = mutexes_[account_id];
  if (!mutex_ptr) {
    mutex_ptr = std::make_unique<std::timed_mutex>();
  }
  return *mutex_ptr;
}

}  // namespace concurrent
}  // namespace ledger
