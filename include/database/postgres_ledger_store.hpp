#ifndef LEDGER_POSTGRES_LEDGER_STORE_HPP_
#define LEDGER_POSTGRES_LEDGER_STORE_HPP_

#include "database/postgres_connection.hpp"
#include "ledger_store.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ledger {
namespace database {

/**
 * LedgerStore backed by the `accounts`, `transactions` and `interest_history`
 * tables.
 *
 * Every mutation leases one pooled connection and runs inside a
 * TransactionGuard. Affected account rows are locked with SELECT ... FOR
 * UPDATE in ascending account id order, so the balance read by a posting rule
 * cannot change before commit.
 */
class PostgresLedgerStore : public LedgerStore {
 public:
  explicit PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool);
  ~PostgresLedgerStore() override = default;

  // Non-copyable
  PostgresLedgerStore(const PostgresLedgerStore&) = delete;
  PostgresLedgerStore& operator=(const PostgresLedgerStore&) = delete;

  /**
   * Execute the schema script at `schema_path`.
   */
  void initializeSchema(const std::string& schema_path);

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
  /**
   * SELECT ... FOR UPDATE on one account row. Throws AccountNotFound.
   */
  Account lockAccount(PostgresConnection& conn, const std::string& account_id);

  /**
   * Throws AccountNotFound unless the account row exists.
   */
  void requireAccount(PostgresConnection& conn, const std::string& account_id);

  /**
   * Update the balance and append the transaction (and interest record).
   */
  PostingResult writePosting(PostgresConnection& conn, const PostingRequest& request,
                             const StagedPosting& staged, Timestamp timestamp);

  std::shared_ptr<ConnectionPool> pool_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_POSTGRES_LEDGER_STORE_HPP_
