#ifndef LEDGER_POSTGRES_CONNECTION_HPP_
#define LEDGER_POSTGRES_CONNECTION_HPP_

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <postgresql/libpq-fe.h>

namespace ledger {
namespace database {

/**
 * Owning handle for a PGresult.
 */
struct ResultDeleter {
  void operator()(PGresult* result) const { PQclear(result); }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

// Text-format query parameter; nullopt binds SQL NULL.
using QueryParam = std::optional<std::string>;

/**
 * PostgreSQL database connection wrapper.
 *
 * Failures are raised as LedgerError: statement or lock timeouts as
 * StorageTimeout, integrity violations as ConstraintViolation, everything else
 * as StorageFailure. A connection is used by one thread at a time; share
 * connections through ConnectionPool.
 */
class PostgresConnection {
 public:
  /**
   * Connection configuration
   */
  struct Config {
    std::string host = "localhost";
    int port = 5432;
    std::string database = "ledger";
    std::string username = "ledger_user";
    std::string password = "";
    int connection_timeout = 10;      // seconds
    int max_connections = 8;          // pool size
    int statement_timeout_ms = 5000;  // per statement, 0 disables
    int lock_timeout_ms = 3000;       // row lock waits, 0 disables
  };

  explicit PostgresConnection(const Config& config);
  ~PostgresConnection();

  // Non-copyable
  PostgresConnection(const PostgresConnection&) = delete;
  PostgresConnection& operator=(const PostgresConnection&) = delete;

  /**
   * Connect and apply the session timeouts. Throws StorageFailure.
   */
  void connect();

  /**
   * Disconnect from the database, rolling back an open transaction.
   */
  void disconnect();

  bool isConnected() const;

  /**
   * Run one or more statements without parameters.
   */
  ResultPtr execute(const std::string& sql);

  /**
   * Run a single parameterized statement.
   */
  ResultPtr executeParams(const std::string& sql, const std::vector<QueryParam>& params);

  void beginTransaction();
  void commitTransaction();

  /**
   * Roll back the open transaction, if any. Never throws.
   */
  bool rollbackTransaction() noexcept;

  bool inTransaction() const { return in_transaction_; }

  std::string getLastError() const;

  /**
   * Get connection info for logging (no password).
   */
  std::string getConnectionInfo() const;

 private:
  ResultPtr checkResult(PGresult* raw, const std::string& sql);

  Config config_;
  PGconn* connection_;
  bool in_transaction_;
};

/**
 * Fixed set of connections handed out one caller at a time.
 */
class ConnectionPool {
 public:
  /**
   * Returns its connection to the pool on destruction.
   */
  class Lease {
   public:
    Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> connection);
    ~Lease();

    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&&) = delete;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;

    PostgresConnection& operator*() const { return *connection_; }
    PostgresConnection* operator->() const { return connection_.get(); }

   private:
    ConnectionPool* pool_;
    std::unique_ptr<PostgresConnection> connection_;
  };

  explicit ConnectionPool(const PostgresConnection::Config& config);

  // Non-copyable
  ConnectionPool(const ConnectionPool&) = delete;
  ConnectionPool& operator=(const ConnectionPool&) = delete;

  /**
   * Open every connection. Throws StorageFailure if any fails.
   */
  void open();

  /**
   * Wait for a free connection, at most the configured connection timeout.
   * Throws StorageTimeout when none frees up in time.
   */
  Lease acquire();

  size_t available() const;

  const PostgresConnection::Config& config() const { return config_; }

 private:
  void release(std::unique_ptr<PostgresConnection> connection);

  PostgresConnection::Config config_;
  std::vector<std::unique_ptr<PostgresConnection>> idle_;
  mutable std::mutex mutex_;
  std::condition_variable available_;
};

/**
 * RAII wrapper for database transactions: rolls back unless commit() ran.
 */
class TransactionGuard {
 public:
  explicit TransactionGuard(PostgresConnection& conn);
  ~TransactionGuard();

  // Non-copyable
  TransactionGuard(const TransactionGuard&) = delete;
  TransactionGuard& operator=(const TransactionGuard&) = delete;

  /**
   * Commit the transaction. Throws if COMMIT fails; the transaction is then
   * rolled back by the server.
   */
  void commit();

  /**
   * Rollback the transaction.
   */
  void rollback();

 private:
  PostgresConnection& conn_;
  bool finished_;
};

}  // namespace database
}  // namespace ledger

#endif  // LEDGER_POSTGRES_CONNECTION_HPP_
