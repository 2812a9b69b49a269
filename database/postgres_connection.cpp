#include "database/postgres_connection.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"

#include <sstream>
#include <utility>

namespace ledger {
namespace database {

namespace {

ErrorKind classifySqlState(const char* sqlstate) {
  if (!sqlstate) return ErrorKind::StorageFailure;

  std::string code(sqlstate);
  if (code == "57014" || code == "55P03") {
    // statement_timeout / lock_timeout expired
    return ErrorKind::StorageTimeout;
  }
  if (code.compare(0, 2, "23") == 0) {
    return ErrorKind::ConstraintViolation;
  }
  return ErrorKind::StorageFailure;
}

}  // namespace

PostgresConnection::PostgresConnection(const Config& config)
    : config_(config), connection_(nullptr), in_transaction_(false) {
}

PostgresConnection::~PostgresConnection() {
  disconnect();
}

void PostgresConnection::connect() {
  if (connection_) {
    disconnect();
  }

  std::string port = std::to_string(config_.port);
  std::string timeout = std::to_string(config_.connection_timeout);
  const char* keywords[] = {"host", "port", "dbname", "user", "password",
                            "connect_timeout", "application_name", nullptr};
  const char* values[] = {config_.host.c_str(), port.c_str(), config_.database.c_str(),
                          config_.username.c_str(), config_.password.c_str(),
                          timeout.c_str(), "ledger", nullptr};

  connection_ = PQconnectdbParams(keywords, values, 0);

  if (!connection_ || PQstatus(connection_) != CONNECTION_OK) {
    std::string reason = connection_ ? PQerrorMessage(connection_) : "out of memory";
    if (connection_) {
      PQfinish(connection_);
      connection_ = nullptr;
    }
    throw LedgerError(ErrorKind::StorageFailure,
                      "Database connection to " + getConnectionInfo() + " failed: " + reason);
  }

  std::stringstream session;
  session << "SET statement_timeout = " << config_.statement_timeout_ms << ";"
          << "SET lock_timeout = " << config_.lock_timeout_ms << ";"
          << "SET TIME ZONE 'UTC';";
  execute(session.str());

  LEDGER_LOG_DEBUG("Connected to PostgreSQL database: " + getConnectionInfo());
}

void PostgresConnection::disconnect() {
  if (connection_) {
    if (in_transaction_) {
      rollbackTransaction();
    }
    PQfinish(connection_);
    connection_ = nullptr;
  }
}

bool PostgresConnection::isConnected() const {
  return connection_ && PQstatus(connection_) == CONNECTION_OK;
}

ResultPtr PostgresConnection::execute(const std::string& sql) {
  if (!connection_) {
    throw LedgerError(ErrorKind::StorageFailure, "Not connected to " + getConnectionInfo());
  }
  return checkResult(PQexec(connection_, sql.c_str()), sql);
}

ResultPtr PostgresConnection::executeParams(const std::string& sql,
                                            const std::vector<QueryParam>& params) {
  if (!connection_) {
    throw LedgerError(ErrorKind::StorageFailure, "Not connected to " + getConnectionInfo());
  }

  // `params` outlives the call, so the pointers stay valid.
  std::vector<const char*> values;
  values.reserve(params.size());
  for (const auto& param : params) {
    values.push_back(param ? param->c_str() : nullptr);
  }

  PGresult* raw = PQexecParams(connection_, sql.c_str(), static_cast<int>(values.size()),
                               nullptr, values.data(), nullptr, nullptr, 0);
  return checkResult(raw, sql);
}

ResultPtr PostgresConnection::checkResult(PGresult* raw, const std::string& sql) {
  ResultPtr result(raw);
  if (!result) {
    throw LedgerError(ErrorKind::StorageFailure,
                      "Query execution failed: " + getLastError());
  }

  ExecStatusType status = PQresultStatus(result.get());
  if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
    return result;
  }

  ErrorKind kind = classifySqlState(PQresultErrorField(result.get(), PG_DIAG_SQLSTATE));
  std::string message = PQresultErrorMessage(result.get());
  const char* constraint = PQresultErrorField(result.get(), PG_DIAG_CONSTRAINT_NAME);
  LEDGER_LOG_EVENT(observability::LogLevel::DEBUG, "Query failed")
      .field("sql", sql.substr(0, 120))
      .field("error_kind", errorKindName(kind))
      .field("reason", message);
  throw LedgerError(kind, "Query failed: " + message, constraint ? constraint : "");
}

void PostgresConnection::beginTransaction() {
  execute("BEGIN ISOLATION LEVEL READ COMMITTED");
  in_transaction_ = true;
}

void PostgresConnection::commitTransaction() {
  if (!in_transaction_) {
    throw LedgerError(ErrorKind::StorageFailure, "COMMIT without an open transaction");
  }

  // A failed COMMIT ends the transaction on the server side as well.
  in_transaction_ = false;
  execute("COMMIT");
}

bool PostgresConnection::rollbackTransaction() noexcept {
  if (!in_transaction_ || !connection_) {
    in_transaction_ = false;
    return false;
  }

  in_transaction_ = false;
  ResultPtr result(PQexec(connection_, "ROLLBACK"));
  bool success = result && PQresultStatus(result.get()) == PGRES_COMMAND_OK;
  if (!success) {
    LEDGER_LOG_ERROR("ROLLBACK failed: " + getLastError());
  }
  return success;
}

std::string PostgresConnection::getLastError() const {
  if (!connection_) {
    return "Not connected";
  }

  return PQerrorMessage(connection_);
}

std::string PostgresConnection::getConnectionInfo() const {
  std::stringstream ss;
  ss << config_.username << "@" << config_.host << ":" << config_.port << "/" << config_.database;
  return ss.str();
}

// ConnectionPool implementation
ConnectionPool::Lease::Lease(ConnectionPool& pool, std::unique_ptr<PostgresConnection> connection)
    : pool_(&pool), connection_(std::move(connection)) {
}

ConnectionPool::Lease::Lease(Lease&& other) noexcept
    : pool_(other.pool_), connection_(std::move(other.connection_)) {
  other.pool_ = nullptr;
}

ConnectionPool::Lease::~Lease() {
  if (pool_ && connection_) {
    if (connection_->inTransaction()) {
      connection_->rollbackTransaction();
    }
    pool_->release(std::move(connection_));
  }
}

ConnectionPool::ConnectionPool(const PostgresConnection::Config& config) : config_(config) {
}

void ConnectionPool::open() {
  int size = config_.max_connections > 0 ? config_.max_connections : 1;

  std::vector<std::unique_ptr<PostgresConnection>> opened;
  for (int i = 0; i < size; ++i) {
    auto conn = std::make_unique<PostgresConnection>(config_);
    conn->connect();
    opened.push_back(std::move(conn));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& conn : opened) {
      idle_.push_back(std::move(conn));
    }
  }
  available_.notify_all();

  LEDGER_LOG_INFO("Opened " + std::to_string(size) + " connections to " +
                  opened.front()->getConnectionInfo());
}

ConnectionPool::Lease ConnectionPool::acquire() {
  std::unique_ptr<PostgresConnection> conn;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = available_.wait_for(lock, std::chrono::seconds(config_.connection_timeout),
                                     [this] { return !idle_.empty(); });
    if (!ready) {
      throw LedgerError(ErrorKind::StorageTimeout,
                        "Timed out waiting for a database connection");
    }
    conn = std::move(idle_.back());
    idle_.pop_back();
  }

  Lease lease(*this, std::move(conn));
  if (!lease->isConnected()) {
    LEDGER_LOG_WARN("Reconnecting dropped database connection");
    lease->connect();
  }
  return lease;
}

size_t ConnectionPool::available() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return idle_.size();
}

void ConnectionPool::release(std::unique_ptr<PostgresConnection> connection) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    idle_.push_back(std::move(connection));
  }
  available_.notify_one();
}

// TransactionGuard implementation
TransactionGuard::TransactionGuard(PostgresConnection& conn)
    : conn_(conn), finished_(false) {
  conn_.beginTransaction();
}

TransactionGuard::~TransactionGuard() {
  if (!finished_) {
    conn_.rollbackTransaction();
  }
}

void TransactionGuard::commit() {
  if (finished_) return;
  finished_ = true;
  conn_.commitTransaction();
}

void TransactionGuard::rollback() {
  if (!finished_) {
    finished_ = true;
    conn_.rollbackTransaction();
  }
}

}  // namespace database
}  // namespace ledger
