#ifndef LEDGER_CONFIG_HPP_
#define LEDGER_CONFIG_HPP_

#include "database/postgres_connection.hpp"
#include "observability/logger.hpp"

#include <functional>
#include <stdexcept>
#include <string>

namespace ledger {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

enum class StorageBackend {
  Memory,
  Postgres
};

/**
 * Process configuration: built-in defaults, then LEDGER_* environment
 * variables, then command line flags.
 */
struct LedgerConfig {
  using EnvLookup = std::function<const char*(const char*)>;

  int port = 8080;
  StorageBackend storage = StorageBackend::Memory;
  database::PostgresConnection::Config database;
  std::string schema_path = "database/schema.sql";
  int lock_timeout_ms = 3000;          // in-memory lock waits and PostgreSQL lock_timeout
  int accrual_interval_seconds = 0;    // 0 disables the scheduler
  int max_connections = 64;
  int idle_timeout_seconds = 300;      // 0 keeps idle connections open
  observability::LogLevel log_level = observability::LogLevel::INFO;
  bool show_help = false;

  /**
   * Apply every LEDGER_* variable `lookup` knows. Throws ConfigError on an
   * invalid value.
   */
  void applyEnvironment(const EnvLookup& lookup);

  /**
   * Apply "--flag value" and "--flag=value" arguments. Throws ConfigError on
   * an unknown flag, a missing value or an invalid value.
   */
  void applyArguments(int argc, const char* const argv[]);

  /**
   * Defaults, then the process environment, then `argv`.
   */
  static LedgerConfig load(int argc, const char* const argv[]);

  static std::string usage(const std::string& program);
};

std::string toString(StorageBackend backend);

}  // namespace ledger

#endif  // LEDGER_CONFIG_HPP_
