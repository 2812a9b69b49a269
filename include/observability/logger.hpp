#ifndef LEDGER_LOGGER_HPP_
#define LEDGER_LOGGER_HPP_

#include "ledger_error.hpp"
#include "ledger_types.hpp"

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ledger {
namespace observability {

enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

const char* toString(LogLevel level);

/**
 * Case-insensitive parse of "debug", "info", "warn", "error", "fatal".
 */
std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * Process-wide JSON-lines logger. Every line carries timestamp, level, thread
 * and message, plus the component and correlation id when given and any
 * structured fields.
 */
class Logger {
 public:
  static Logger& instance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  LogLevel level() const;

  // Default: std::cout. The stream must outlive its use by the logger.
  void setOutput(std::ostream& stream);

  bool enabled(LogLevel level) const;

  void write(LogLevel level, const std::string& message, const std::string& component = "",
             const std::string& correlation_id = "",
             const nlohmann::json& fields = nlohmann::json::object());

 private:
  Logger();
  ~Logger() = default;

  LogLevel min_level_;
  std::ostream* output_;
  mutable std::mutex mutex_;
};

/**
 * One structured log line, written when the event goes out of scope. Fields
 * are only collected when the level is enabled.
 */
class LogEvent {
 public:
  LogEvent(LogLevel level, const std::string& message, const std::string& component = "",
           const std::string& correlation_id = "");
  ~LogEvent();

  LogEvent(const LogEvent&) = delete;
  LogEvent& operator=(const LogEvent&) = delete;

  LogEvent& field(const std::string& key, const std::string& value);
  LogEvent& field(const std::string& key, const char* value);
  LogEvent& field(const std::string& key, int value);
  LogEvent& field(const std::string& key, int64_t value);
  LogEvent& field(const std::string& key, size_t value);
  LogEvent& field(const std::string& key, double value);
  LogEvent& field(const std::string& key, bool value);

  // Rendered as a decimal string, e.g. "250.50".
  LogEvent& field(const std::string& key, Money value);

  // Adds error_kind and reason.
  LogEvent& error(const LedgerError& e);

 private:
  bool enabled_;
  LogLevel level_;
  std::string message_;
  std::string component_;
  std::string correlation_id_;
  nlohmann::json fields_;
};

#define LEDGER_LOG(level, msg) \
  ledger::observability::Logger::instance().write(level, msg, __func__)

#define LEDGER_LOG_DEBUG(msg) LEDGER_LOG(ledger::observability::LogLevel::DEBUG, msg)
#define LEDGER_LOG_INFO(msg) LEDGER_LOG(ledger::observability::LogLevel::INFO, msg)
#define LEDGER_LOG_WARN(msg) LEDGER_LOG(ledger::observability::LogLevel::WARN, msg)
#define LEDGER_LOG_ERROR(msg) LEDGER_LOG(ledger::observability::LogLevel::ERROR, msg)
#define LEDGER_LOG_FATAL(msg) LEDGER_LOG(ledger::observability::LogLevel::FATAL, msg)

#define LEDGER_LOG_EVENT(level, msg) ledger::observability::LogEvent(level, msg, __func__)

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_LOGGER_HPP_
