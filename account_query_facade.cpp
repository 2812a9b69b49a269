#include "account_query_facade.hpp"

namespace ledger {

AccountQueryFacade::AccountQueryFacade(LedgerStore& store) : store_(store) {
}

AccountInfo AccountQueryFacade::getAccountInfo(const std::string& account_id) {
  AccountInfo info;
  info.account = store_.getAccount(account_id);
  info.recent_transactions = store_.getRecentTransactions(account_id, kRecentTransactionLimit);

  for (const auto& record : store_.getInterestHistory(account_id)) {
    info.accumulated_interest += record.calculated_interest;
  }
  return info;
}

std::vector<InterestRecord> AccountQueryFacade::getInterestHistory(const std::string& account_id) {
  // Resolve first so an unknown id is reported even by stores that would
  // simply return an empty history.
  store_.getAccount(account_id);
  return store_.getInterestHistory(account_id);
}

ReconciliationReport AccountQueryFacade::reconcile(const std::string& account_id) {
  ReconciliationReport report;
  report.account_id = account_id;

  // Log before balance: a concurrent write can leave the balance newer than
  // the sum, never older.
  auto transactions = store_.getTransactions(account_id);
  Account account = store_.getAccount(account_id);

  report.opening_balance = account.opening_balance;
  report.balance = account.balance;
  report.transaction_count = transactions.size();
  for (const auto& tx : transactions) {
    report.ledger_sum += tx.signedAmount();
  }
  report.balanced = report.opening_balance + report.ledger_sum == report.balance;
  return report;
}

}  // namespace ledger
