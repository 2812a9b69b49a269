#include "in_memory_ledger_store.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"

#include <algorithm>
#include <mutex>

namespace ledger {

InMemoryLedgerStore::InMemoryLedgerStore(std::chrono::milliseconds lock_timeout)
    : lock_timeout_(lock_timeout), next_transaction_id_(1), next_interest_id_(1) {
}

void InMemoryLedgerStore::createAccount(const std::string& account_id,
                                        const std::string& customer_name,
                                        Money opening_balance) {
  if (account_id.empty()) {
    throw LedgerError(ErrorKind::ConstraintViolation, "Account id must not be empty");
  }
  if (opening_balance.isNegative() || opening_balance.cents() > Money::kMaxCents) {
    throw LedgerError(ErrorKind::ConstraintViolation,
                      "Opening balance of " + account_id + " out of range: " +
                          opening_balance.toString());
  }

  std::unique_lock<std::shared_mutex> lock(accounts_mutex_);
  auto& slot = accounts_[account_id];
  if (slot) {
    throw LedgerError(ErrorKind::ConstraintViolation, "Account already exists: " + account_id);
  }

  slot = std::make_unique<AccountEntry>();
  slot->account.account_id = account_id;
  slot->account.customer_name = customer_name;
  slot->account.balance = opening_balance;
  slot->account.opening_balance = opening_balance;
  slot->account.created_at = currentTimestamp();
}

Account InMemoryLedgerStore::getAccount(const std::string& account_id) {
  AccountEntry* entry = findEntry(account_id);
  auto lock = lockShared(*entry);
  return entry->account;
}

std::vector<Account> InMemoryLedgerStore::listAccounts() {
  std::vector<AccountEntry*> entries;
  {
    std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
    entries.reserve(accounts_.size());
    for (const auto& [id, entry] : accounts_) {
      entries.push_back(entry.get());
    }
  }

  std::vector<Account> result;
  result.reserve(entries.size());
  for (AccountEntry* entry : entries) {
    auto lock = lockShared(*entry);
    result.push_back(entry->account);
  }

  std::sort(result.begin(), result.end(),
            [](const Account& a, const Account& b) { return a.account_id < b.account_id; });
  return result;
}

std::vector<Transaction> InMemoryLedgerStore::getRecentTransactions(const std::string& account_id,
                                                                    size_t limit) {
  AccountEntry* entry = findEntry(account_id);
  std::vector<Transaction> result;
  {
    auto lock = lockShared(*entry);
    result = entry->transactions;
  }

  std::sort(result.begin(), result.end(), [](const Transaction& a, const Transaction& b) {
    if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
    return a.transaction_id > b.transaction_id;
  });
  if (result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

std::vector<Transaction> InMemoryLedgerStore::getTransactions(const std::string& account_id) {
  AccountEntry* entry = findEntry(account_id);
  auto lock = lockShared(*entry);
  return entry->transactions;
}

std::vector<InterestRecord> InMemoryLedgerStore::getInterestHistory(const std::string& account_id) {
  AccountEntry* entry = findEntry(account_id);
  std::vector<InterestRecord> result;
  {
    auto lock = lockShared(*entry);
    result = entry->interest_history;
  }

  std::sort(result.begin(), result.end(), [](const InterestRecord& a, const InterestRecord& b) {
    if (a.calculation_date != b.calculation_date) return a.calculation_date < b.calculation_date;
    return a.id < b.id;
  });
  return result;
}

PostingResult InMemoryLedgerStore::post(const PostingRequest& request) {
  AccountEntry* entry = findEntry(request.account_id);
  auto lock = lockExclusive(*entry);

  StagedPosting staged = stagePosting(request, entry->account);
  checkInterest(*entry, request);

  return apply(*entry, request, staged, currentTimestamp());
}

std::pair<PostingResult, PostingResult> InMemoryLedgerStore::postPair(
    const PostingRequest& first, const PostingRequest& second) {
  if (first.account_id == second.account_id) {
    throw LedgerError(ErrorKind::InvalidTransfer,
                      "A paired posting needs two distinct accounts, got " + first.account_id +
                          " twice");
  }

  AccountEntry* first_entry = findEntry(first.account_id);
  AccountEntry* second_entry = findEntry(second.account_id);

  // Lower account id first, whatever the direction of the pair.
  bool first_is_lower = first.account_id < second.account_id;
  auto lower_lock = lockExclusive(first_is_lower ? *first_entry : *second_entry);
  auto upper_lock = lockExclusive(first_is_lower ? *second_entry : *first_entry);

  StagedPosting first_staged = stagePosting(first, first_entry->account);
  StagedPosting second_staged = stagePosting(second, second_entry->account);
  checkInterest(*first_entry, first);
  checkInterest(*second_entry, second);

  Timestamp timestamp = currentTimestamp();
  PostingResult first_result = apply(*first_entry, first, first_staged, timestamp);
  PostingResult second_result = apply(*second_entry, second, second_staged, timestamp);
  return {first_result, second_result};
}

InMemoryLedgerStore::AccountEntry* InMemoryLedgerStore::findEntry(
    const std::string& account_id) const {
  std::shared_lock<std::shared_mutex> lock(accounts_mutex_);
  auto it = accounts_.find(account_id);
  if (it == accounts_.end()) {
    throw LedgerError(ErrorKind::AccountNotFound, "Account not found: " + account_id);
  }
  return it->second.get();
}

std::unique_lock<std::shared_timed_mutex> InMemoryLedgerStore::lockExclusive(
    AccountEntry& entry) const {
  std::unique_lock<std::shared_timed_mutex> lock(entry.mutex, std::defer_lock);
  if (!lock.try_lock_for(lock_timeout_)) {
    LEDGER_LOG_WARN("Timed out waiting for write lock on " + entry.account.account_id);
    throw LedgerError(ErrorKind::StorageTimeout,
                      "Timed out waiting for account " + entry.account.account_id);
  }
  return lock;
}

std::shared_lock<std::shared_timed_mutex> InMemoryLedgerStore::lockShared(
    AccountEntry& entry) const {
  std::shared_lock<std::shared_timed_mutex> lock(entry.mutex, std::defer_lock);
  if (!lock.try_lock_for(lock_timeout_)) {
    throw LedgerError(ErrorKind::StorageTimeout,
                      "Timed out reading account " + entry.account.account_id);
  }
  return lock;
}

void InMemoryLedgerStore::checkInterest(const AccountEntry& entry,
                                        const PostingRequest& request) const {
  if (!request.interest) return;

  if (entry.accrued_dates.count(request.interest->calculation_date) > 0) {
    throw LedgerError(ErrorKind::ConstraintViolation,
                      "Interest already accrued for " + entry.account.account_id + " on " +
                          request.interest->calculation_date,
                      kInterestPerDayConstraint);
  }
}

PostingResult InMemoryLedgerStore::apply(AccountEntry& entry, const PostingRequest& request,
                                         const StagedPosting& staged, Timestamp timestamp) {
  // Reserve first so that nothing below can fail half way.
  entry.transactions.reserve(entry.transactions.size() + 1);
  if (request.interest) {
    entry.interest_history.reserve(entry.interest_history.size() + 1);
  }

  PostingResult result;
  result.transaction.transaction_id = next_transaction_id_.fetch_add(1);
  result.transaction.account_id = entry.account.account_id;
  result.transaction.type = request.type;
  result.transaction.amount = staged.amount;
  result.transaction.timestamp = timestamp;
  result.transaction.description = request.description;
  result.transaction.reference_id = request.reference_id;
  result.balance_after = staged.balance_after;

  if (request.interest) {
    InterestRecord record;
    record.id = next_interest_id_.fetch_add(1);
    record.account_id = entry.account.account_id;
    record.interest_rate = request.interest->rate;
    record.calculated_interest = staged.amount;
    record.calculation_date = request.interest->calculation_date;
    record.transaction_id = result.transaction.transaction_id;
    record.calculated_at = timestamp;
    result.interest_record = record;

    entry.accrued_dates.insert(record.calculation_date);
    entry.interest_history.push_back(record);
  }

  entry.transactions.push_back(result.transaction);
  entry.account.balance = staged.balance_after;
  return result;
}

}  // namespace ledger
