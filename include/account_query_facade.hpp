#ifndef LEDGER_ACCOUNT_QUERY_FACADE_HPP_
#define LEDGER_ACCOUNT_QUERY_FACADE_HPP_

#include "ledger_store.hpp"

#include <string>
#include <vector>

namespace ledger {

/**
 * Result of checking balance == opening balance + signed sum of the log.
 */
struct ReconciliationReport {
  std::string account_id;
  Money opening_balance;
  Money ledger_sum;
  Money balance;
  size_t transaction_count = 0;
  bool balanced = false;
};

/**
 * Read-only composition of the store's query paths. The sub-queries are not
 * read under one snapshot; a concurrent write may land between them.
 */
class AccountQueryFacade {
 public:
  static constexpr size_t kRecentTransactionLimit = 10;

  explicit AccountQueryFacade(LedgerStore& store);

  /**
   * Balance, the ten most recent transactions and the total interest ever
   * credited. Throws AccountNotFound.
   */
  AccountInfo getAccountInfo(const std::string& account_id);

  std::vector<InterestRecord> getInterestHistory(const std::string& account_id);

  ReconciliationReport reconcile(const std::string& account_id);

 private:
  LedgerStore& store_;
};

}  // namespace ledger

#endif  // LEDGER_ACCOUNT_QUERY_FACADE_HPP_
