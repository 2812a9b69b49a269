#include "database/postgres_ledger_store.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"

#include <fstream>
#include <sstream>
#include <utility>

namespace ledger {
namespace database {

namespace {

const char* const kAccountColumns = R"(
  account_id, customer_name, balance::text, opening_balance::text,
  (EXTRACT(EPOCH FROM created_at) * 1000000)::bigint
)";

const char* const kTransactionColumns = R"(
  transaction_id, account_id, transaction_type, amount::text,
  (EXTRACT(EPOCH FROM posted_at) * 1000000)::bigint, description,
  COALESCE(reference_id, '')
)";

const char* const kInterestColumns = R"(
  id, account_id, interest_rate::text, calculated_interest::text,
  to_char(calculation_date, 'YYYY-MM-DD'), transaction_id,
  (EXTRACT(EPOCH FROM calculated_at) * 1000000)::bigint
)";

std::string text(PGresult* result, int row, int column) {
  return PQgetvalue(result, row, column);
}

int64_t integer(PGresult* result, int row, int column) {
  return std::stoll(PQgetvalue(result, row, column));
}

Account accountFromRow(PGresult* result, int row) {
  Account account;
  account.account_id = text(result, row, 0);
  account.customer_name = text(result, row, 1);
  account.balance = Money::parseStored(text(result, row, 2));
  account.opening_balance = Money::parseStored(text(result, row, 3));
  account.created_at = integer(result, row, 4);
  return account;
}

Transaction transactionFromRow(PGresult* result, int row) {
  Transaction txn;
  txn.transaction_id = integer(result, row, 0);
  txn.account_id = text(result, row, 1);

  std::string type = text(result, row, 2);
  auto parsed = transactionTypeFromString(type);
  if (!parsed) {
    throw LedgerError(ErrorKind::StorageFailure, "Unknown transaction type in ledger: " + type);
  }
  txn.type = *parsed;

  txn.amount = Money::parseStored(text(result, row, 3));
  txn.timestamp = integer(result, row, 4);
  txn.description = text(result, row, 5);
  txn.reference_id = text(result, row, 6);
  return txn;
}

InterestRecord interestFromRow(PGresult* result, int row) {
  InterestRecord record;
  record.id = integer(result, row, 0);
  record.account_id = text(result, row, 1);
  record.interest_rate = InterestRate::parse(text(result, row, 2));
  record.calculated_interest = Money::parseStored(text(result, row, 3));
  record.calculation_date = text(result, row, 4);
  record.transaction_id = integer(result, row, 5);
  record.calculated_at = integer(result, row, 6);
  return record;
}

}  // namespace

PostgresLedgerStore::PostgresLedgerStore(std::shared_ptr<ConnectionPool> pool)
    : pool_(std::move(pool)) {
}

void PostgresLedgerStore::initializeSchema(const std::string& schema_path) {
  std::ifstream file(schema_path);
  if (!file.is_open()) {
    throw LedgerError(ErrorKind::StorageFailure, "Cannot open schema file: " + schema_path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  auto conn = pool_->acquire();
  conn->execute(buffer.str());

  LEDGER_LOG_INFO("Database schema initialized from " + schema_path);
}

void PostgresLedgerStore::createAccount(const std::string& account_id,
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

  auto conn = pool_->acquire();
  conn->executeParams(R"(
    INSERT INTO accounts (account_id, customer_name, balance, opening_balance)
    VALUES ($1, $2, $3::numeric, $3::numeric)
  )",
                      {account_id, customer_name, opening_balance.toString()});

  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Account created")
      .field("account_id", account_id)
      .field("opening_balance", opening_balance);
}

Account PostgresLedgerStore::getAccount(const std::string& account_id) {
  auto conn = pool_->acquire();
  ResultPtr result = conn->executeParams(
      std::string("SELECT") + kAccountColumns + "FROM accounts WHERE account_id = $1",
      {account_id});

  if (PQntuples(result.get()) == 0) {
    throw LedgerError(ErrorKind::AccountNotFound, "Account not found: " + account_id);
  }
  return accountFromRow(result.get(), 0);
}

std::vector<Account> PostgresLedgerStore::listAccounts() {
  auto conn = pool_->acquire();
  ResultPtr result =
      conn->execute(std::string("SELECT") + kAccountColumns + "FROM accounts ORDER BY account_id");

  std::vector<Account> accounts;
  int rows = PQntuples(result.get());
  accounts.reserve(rows);
  for (int i = 0; i < rows; ++i) {
    accounts.push_back(accountFromRow(result.get(), i));
  }
  return accounts;
}

std::vector<Transaction> PostgresLedgerStore::getRecentTransactions(
    const std::string& account_id, size_t limit) {
  auto conn = pool_->acquire();
  requireAccount(*conn, account_id);

  ResultPtr result = conn->executeParams(
      std::string("SELECT") + kTransactionColumns + R"(
        FROM transactions WHERE account_id = $1
        ORDER BY posted_at DESC, transaction_id DESC
        LIMIT $2::bigint
      )",
      {account_id, std::to_string(limit)});

  std::vector<Transaction> transactions;
  int rows = PQntuples(result.get());
  transactions.reserve(rows);
  for (int i = 0; i < rows; ++i) {
    transactions.push_back(transactionFromRow(result.get(), i));
  }
  return transactions;
}

std::vector<Transaction> PostgresLedgerStore::getTransactions(const std::string& account_id) {
  auto conn = pool_->acquire();
  requireAccount(*conn, account_id);

  ResultPtr result = conn->executeParams(
      std::string("SELECT") + kTransactionColumns +
          "FROM transactions WHERE account_id = $1 ORDER BY posted_at, transaction_id",
      {account_id});

  std::vector<Transaction> transactions;
  int rows = PQntuples(result.get());
  transactions.reserve(rows);
  for (int i = 0; i < rows; ++i) {
    transactions.push_back(transactionFromRow(result.get(), i));
  }
  return transactions;
}

std::vector<InterestRecord> PostgresLedgerStore::getInterestHistory(
    const std::string& account_id) {
  auto conn = pool_->acquire();
  requireAccount(*conn, account_id);

  ResultPtr result = conn->executeParams(
      std::string("SELECT") + kInterestColumns +
          "FROM interest_history WHERE account_id = $1 ORDER BY calculation_date, id",
      {account_id});

  std::vector<InterestRecord> records;
  int rows = PQntuples(result.get());
  records.reserve(rows);
  for (int i = 0; i < rows; ++i) {
    records.push_back(interestFromRow(result.get(), i));
  }
  return records;
}

PostingResult PostgresLedgerStore::post(const PostingRequest& request) {
  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  Account account = lockAccount(*conn, request.account_id);
  StagedPosting staged = stagePosting(request, account);
  PostingResult result = writePosting(*conn, request, staged, currentTimestamp());

  transaction.commit();
  return result;
}

std::pair<PostingResult, PostingResult> PostgresLedgerStore::postPair(
    const PostingRequest& first, const PostingRequest& second) {
  if (first.account_id == second.account_id) {
    throw LedgerError(ErrorKind::InvalidTransfer,
                      "A paired posting needs two distinct accounts, got " + first.account_id +
                          " twice");
  }

  auto conn = pool_->acquire();
  TransactionGuard transaction(*conn);

  // Row locks in ascending id order, whatever the direction of the pair.
  bool first_is_lower = first.account_id < second.account_id;
  Account lower = lockAccount(*conn, first_is_lower ? first.account_id : second.account_id);
  Account upper = lockAccount(*conn, first_is_lower ? second.account_id : first.account_id);
  const Account& first_account = first_is_lower ? lower : upper;
  const Account& second_account = first_is_lower ? upper : lower;

  StagedPosting first_staged = stagePosting(first, first_account);
  StagedPosting second_staged = stagePosting(second, second_account);

  Timestamp timestamp = currentTimestamp();
  PostingResult first_result = writePosting(*conn, first, first_staged, timestamp);
  PostingResult second_result = writePosting(*conn, second, second_staged, timestamp);

  transaction.commit();
  return {first_result, second_result};
}

Account PostgresLedgerStore::lockAccount(PostgresConnection& conn,
                                         const std::string& account_id) {
  ResultPtr result = conn.executeParams(
      std::string("SELECT") + kAccountColumns +
          "FROM accounts WHERE account_id = $1 FOR UPDATE",
      {account_id});

  if (PQntuples(result.get()) == 0) {
    throw LedgerError(ErrorKind::AccountNotFound, "Account not found: " + account_id);
  }
  return accountFromRow(result.get(), 0);
}

void PostgresLedgerStore::requireAccount(PostgresConnection& conn,
                                         const std::string& account_id) {
  ResultPtr result =
      conn.executeParams("SELECT 1 FROM accounts WHERE account_id = $1", {account_id});
  if (PQntuples(result.get()) == 0) {
    throw LedgerError(ErrorKind::AccountNotFound, "Account not found: " + account_id);
  }
}

PostingResult PostgresLedgerStore::writePosting(PostgresConnection& conn,
                                                const PostingRequest& request,
                                                const StagedPosting& staged,
                                                Timestamp timestamp) {
  std::string ts = std::to_string(timestamp);

  conn.executeParams("UPDATE accounts SET balance = $2::numeric WHERE account_id = $1",
                     {request.account_id, staged.balance_after.toString()});

  QueryParam reference;
  if (!request.reference_id.empty()) {
    reference = request.reference_id;
  }

  ResultPtr inserted = conn.executeParams(R"(
    INSERT INTO transactions
      (account_id, transaction_type, amount, posted_at, description, reference_id)
    VALUES
      ($1, $2, $3::numeric, TIMESTAMPTZ 'epoch' + $4::bigint * INTERVAL '1 microsecond', $5, $6)
    RETURNING transaction_id
  )",
                                          {request.account_id, toString(request.type),
                                           staged.amount.toString(), ts, request.description,
                                           reference});

  PostingResult result;
  result.transaction.transaction_id = integer(inserted.get(), 0, 0);
  result.transaction.account_id = request.account_id;
  result.transaction.type = request.type;
  result.transaction.amount = staged.amount;
  result.transaction.timestamp = timestamp;
  result.transaction.description = request.description;
  result.transaction.reference_id = request.reference_id;
  result.balance_after = staged.balance_after;

  if (request.interest) {
    // uq_interest_account_day turns a second accrual for the day into
    // ConstraintViolation, which rolls back the deposit above.
    ResultPtr record_row = conn.executeParams(R"(
      INSERT INTO interest_history
        (account_id, interest_rate, calculated_interest, calculation_date,
         transaction_id, calculated_at)
      VALUES
        ($1, $2::numeric, $3::numeric, $4::date, $5::bigint,
         TIMESTAMPTZ 'epoch' + $6::bigint * INTERVAL '1 microsecond')
      RETURNING id
    )",
                                              {request.account_id,
                                               request.interest->rate.toString(),
                                               staged.amount.toString(),
                                               request.interest->calculation_date,
                                               std::to_string(result.transaction.transaction_id),
                                               ts});

    InterestRecord record;
    record.id = integer(record_row.get(), 0, 0);
    record.account_id = request.account_id;
    record.interest_rate = request.interest->rate;
    record.calculated_interest = staged.amount;
    record.calculation_date = request.interest->calculation_date;
    record.transaction_id = result.transaction.transaction_id;
    record.calculated_at = timestamp;
    result.interest_record = record;
  }

  return result;
}

}  // namespace database
}  // namespace ledger
