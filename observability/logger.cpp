#include "observability/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <thread>

namespace ledger {
namespace observability {

namespace {

std::string currentThreadId() {
  std::ostringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace

const char* toString(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
  }
  return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(const std::string& name) {
  std::string lower(name);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lower == "debug") return LogLevel::DEBUG;
  if (lower == "info") return LogLevel::INFO;
  if (lower == "warn" || lower == "warning") return LogLevel::WARN;
  if (lower == "error") return LogLevel::ERROR;
  if (lower == "fatal") return LogLevel::FATAL;
  return std::nullopt;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : min_level_(LogLevel::INFO), output_(&std::cout) {}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::level() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void Logger::setOutput(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_ = &stream;
}

bool Logger::enabled(LogLevel level) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level >= min_level_;
}

void Logger::write(LogLevel level, const std::string& message, const std::string& component,
                   const std::string& correlation_id, const nlohmann::json& fields) {
  nlohmann::json line = {{"timestamp", formatTimestamp(currentTimestamp())},
                         {"level", toString(level)},
                         {"thread", currentThreadId()},
                         {"message", message}};
  if (!component.empty()) line["component"] = component;
  if (!correlation_id.empty()) line["correlation_id"] = correlation_id;
  line.update(fields);

  // Invalid UTF-8 in a customer name must not turn a log call into a throw.
  std::string text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;
  *output_ << text << '\n';
  output_->flush();
}

LogEvent::LogEvent(LogLevel level, const std::string& message, const std::string& component,
                   const std::string& correlation_id)
    : enabled_(Logger::instance().enabled(level)),
      level_(level),
      fields_(nlohmann::json::object()) {
  if (enabled_) {
    message_ = message;
    component_ = component;
    correlation_id_ = correlation_id;
  }
}

LogEvent::~LogEvent() {
  if (enabled_) {
    Logger::instance().write(level_, message_, component_, correlation_id_, fields_);
  }
}

LogEvent& LogEvent::field(const std::string& key, const std::string& value) {
  if (enabled_) fields_[key] = value;
  return *this;
}

LogEvent& LogEvent::field(const std::string& key, const char* value) {
  return field(key, std::string(value));
}

LogEvent& LogEvent::field(const std::string& key, int value) {
  if (enabled_) fields_[key] = value;
  return *this;
}

LogEvent& LogEvent::field(const std::string& key, int64_t value) {
  if (enabled_) fields_[key] = value;
  return *this;
}

LogEvent& LogEvent::field(const std::string& key, size_t value) {
  if (enabled_) fields_[key] = value;
  return *this;
}

LogEvent& LogEvent::field(const std::string& key, double value) {
  if (enabled_) fields_[key] = value;
  return *this;
}

LogEvent& LogEvent::field(const std::string& key, bool value) {
  if (enabled_) fields_[key] = value;
  return *this;
}

LogEvent& LogEvent::field(const std::string& key, Money value) {
  return field(key, value.toString());
}

LogEvent& LogEvent::error(const LedgerError& e) {
  if (enabled_) {
    fields_["error_kind"] = e.kindName();
    fields_["reason"] = e.what();
  }
  return *this;
}

}  // namespace observability
}  // namespace ledger
