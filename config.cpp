#include "config.hpp"

#include <cstdlib>
#include <sstream>
#include <vector>

namespace ledger {

namespace {

int parseInt(const std::string& name, const std::string& value, int min, int max) {
  size_t consumed = 0;
  long parsed = 0;
  try {
    parsed = std::stol(value, &consumed);
  } catch (const std::exception&) {
    throw ConfigError(name + " expects an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw ConfigError(name + " expects an integer, got '" + value + "'");
  }
  if (parsed < min || parsed > max) {
    throw ConfigError(name + " must be between " + std::to_string(min) + " and " +
                      std::to_string(max) + ", got " + value);
  }
  return static_cast<int>(parsed);
}

struct Option {
  const char* flag;
  const char* env;
  const char* help;
  std::function<void(LedgerConfig&, const std::string&, const std::string&)> apply;
};

const std::vector<Option>& options() {
  static const std::vector<Option> kOptions = {
      {"--port", "LEDGER_PORT", "TCP port to listen on (0 picks a free port)",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.port = parseInt(n, v, 0, 65535);
       }},
      {"--storage", "LEDGER_STORAGE", "memory | postgres",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         if (v == "memory") {
           c.storage = StorageBackend::Memory;
         } else if (v == "postgres") {
           c.storage = StorageBackend::Postgres;
         } else {
           throw ConfigError(n + " must be 'memory' or 'postgres', got '" + v + "'");
         }
       }},
      {"--db-host", "LEDGER_DB_HOST", "PostgreSQL host",
       [](LedgerConfig& c, const std::string&, const std::string& v) { c.database.host = v; }},
      {"--db-port", "LEDGER_DB_PORT", "PostgreSQL port",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.database.port = parseInt(n, v, 1, 65535);
       }},
      {"--db-name", "LEDGER_DB_NAME", "PostgreSQL database",
       [](LedgerConfig& c, const std::string&, const std::string& v) { c.database.database = v; }},
      {"--db-user", "LEDGER_DB_USER", "PostgreSQL user",
       [](LedgerConfig& c, const std::string&, const std::string& v) { c.database.username = v; }},
      {"--db-password", "LEDGER_DB_PASSWORD", "PostgreSQL password",
       [](LedgerConfig& c, const std::string&, const std::string& v) { c.database.password = v; }},
      {"--db-pool-size", "LEDGER_DB_POOL_SIZE", "pooled PostgreSQL connections",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.database.max_connections = parseInt(n, v, 1, 256);
       }},
      {"--statement-timeout-ms", "LEDGER_STATEMENT_TIMEOUT_MS",
       "PostgreSQL statement_timeout, 0 disables",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.database.statement_timeout_ms = parseInt(n, v, 0, 3600000);
       }},
      {"--lock-timeout-ms", "LEDGER_LOCK_TIMEOUT_MS", "bound on waiting for an account lock",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.lock_timeout_ms = parseInt(n, v, 1, 3600000);
         c.database.lock_timeout_ms = c.lock_timeout_ms;
       }},
      {"--schema", "LEDGER_SCHEMA", "schema script run at start-up (postgres)",
       [](LedgerConfig& c, const std::string&, const std::string& v) { c.schema_path = v; }},
      {"--accrual-interval-seconds", "LEDGER_ACCRUAL_INTERVAL_SECONDS",
       "run interest accrual every N seconds, 0 disables",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.accrual_interval_seconds = parseInt(n, v, 0, 7 * 24 * 3600);
       }},
      {"--max-connections", "LEDGER_MAX_CONNECTIONS",
       "open client connections; further ones get SERVER_BUSY",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.max_connections = parseInt(n, v, 1, 4096);
       }},
      {"--idle-timeout-seconds", "LEDGER_IDLE_TIMEOUT_SECONDS",
       "close connections silent for N seconds, 0 disables",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         c.idle_timeout_seconds = parseInt(n, v, 0, 24 * 3600);
       }},
      {"--log-level", "LEDGER_LOG_LEVEL", "debug | info | warn | error",
       [](LedgerConfig& c, const std::string& n, const std::string& v) {
         auto level = observability::parseLogLevel(v);
         if (!level) {
           throw ConfigError(n + " must be one of debug, info, warn, error, got '" + v + "'");
         }
         c.log_level = *level;
       }},
  };
  return kOptions;
}

}  // namespace

void LedgerConfig::applyEnvironment(const EnvLookup& lookup) {
  for (const auto& option : options()) {
    const char* value = lookup(option.env);
    if (value) {
      option.apply(*this, option.env, value);
    }
  }
}

void LedgerConfig::applyArguments(int argc, const char* const argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      show_help = true;
      continue;
    }

    std::string flag = arg;
    std::string value;
    bool has_value = false;
    size_t eq = arg.find('=');
    if (eq != std::string::npos) {
      flag = arg.substr(0, eq);
      value = arg.substr(eq + 1);
      has_value = true;
    }

    const Option* match = nullptr;
    for (const auto& option : options()) {
      if (flag == option.flag) {
        match = &option;
        break;
      }
    }
    if (!match) {
      throw ConfigError("Unknown option: " + flag);
    }

    if (!has_value) {
      if (i + 1 >= argc) {
        throw ConfigError(flag + " requires a value");
      }
      value = argv[++i];
    }
    match->apply(*this, flag, value);
  }
}

LedgerConfig LedgerConfig::load(int argc, const char* const argv[]) {
  LedgerConfig config;
  config.applyEnvironment([](const char* name) { return std::getenv(name); });
  config.applyArguments(argc, argv);
  return config;
}

std::string LedgerConfig::usage(const std::string& program) {
  std::stringstream ss;
  ss << "Usage: " << program << " [options]\n\nOptions (environment variable in brackets):\n";
  for (const auto& option : options()) {
    ss << "  " << option.flag << " <value>  " << option.help << " [" << option.env << "]\n";
  }
  ss << "  --help  show this message\n";
  return ss.str();
}

std::string toString(StorageBackend backend) {
  switch (backend) {
    case StorageBackend::Memory:
      return "memory";
    case StorageBackend::Postgres:
      return "postgres";
  }
  return "unknown";
}

}  // namespace ledger
