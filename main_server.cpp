#include "account_query_facade.hpp"
#include "account_service.hpp"
#include "concurrent/account_lock_table.hpp"
#include "concurrent/accrual_scheduler.hpp"
#include "config.hpp"
#include "database/postgres_ledger_store.hpp"
#include "in_memory_ledger_store.hpp"
#include "interest_accrual_engine.hpp"
#include "ledger_error.hpp"
#include "ledger_server.hpp"
#include "observability/logger.hpp"
#include "transfer_coordinator.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>

namespace {

std::atomic<bool> running{true};

void signalHandler(int) {
  running = false;
}

std::unique_ptr<ledger::LedgerStore> openStore(const ledger::LedgerConfig& config) {
  if (config.storage == ledger::StorageBackend::Postgres) {
    auto pool = std::make_shared<ledger::database::ConnectionPool>(config.database);
    pool->open();

    auto store = std::make_unique<ledger::database::PostgresLedgerStore>(pool);
    store->initializeSchema(config.schema_path);
    return store;
  }

  auto store = std::make_unique<ledger::InMemoryLedgerStore>(
      std::chrono::milliseconds(config.lock_timeout_ms));
  ledger::seedDemoAccounts(*store);
  return store;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace ledger;

  LedgerConfig config;
  try {
    config = LedgerConfig::load(argc, argv);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n\n" << LedgerConfig::usage(argv[0]);
    return 2;
  }

  if (config.show_help) {
    std::cout << LedgerConfig::usage(argv[0]);
    return 0;
  }

  observability::Logger::instance().setLevel(config.log_level);

  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Starting ledger server")
      .field("port", config.port)
      .field("storage", toString(config.storage))
      .field("lock_timeout_ms", config.lock_timeout_ms)
      .field("max_connections", config.max_connections)
      .field("accrual_interval_seconds", config.accrual_interval_seconds);

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  try {
    std::unique_ptr<LedgerStore> store = openStore(config);

    concurrent::AccountLockTable locks(std::chrono::milliseconds(config.lock_timeout_ms));
    AccountService accounts(*store);
    TransferCoordinator transfers(*store, locks);
    InterestAccrualEngine interest(*store, accounts);
    AccountQueryFacade queries(*store);

    network::TCPServer::Options transport;
    transport.port = config.port;
    transport.max_connections = static_cast<size_t>(config.max_connections);
    transport.idle_timeout = std::chrono::seconds(config.idle_timeout_seconds);

    LedgerServer server(transport, accounts, transfers, interest, queries);
    if (!server.start()) {
      LEDGER_LOG_FATAL("Failed to start ledger server");
      return 1;
    }

    std::unique_ptr<concurrent::AccrualScheduler> scheduler;
    if (config.accrual_interval_seconds > 0) {
      scheduler = std::make_unique<concurrent::AccrualScheduler>(
          interest, std::chrono::seconds(config.accrual_interval_seconds));
      scheduler->start();
    }

    auto last_report = std::chrono::steady_clock::now();
    while (running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

      if (std::chrono::steady_clock::now() - last_report >= std::chrono::minutes(1)) {
        last_report = std::chrono::steady_clock::now();
        auto stats = server.getStats();
        LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Server statistics")
            .field("active_connections", stats.active_connections)
            .field("accrual_runs", scheduler ? scheduler->completedRuns() : size_t{0});
      }
    }

    LEDGER_LOG_INFO("Shutdown requested");
    if (scheduler) {
      scheduler->stop();
    }
    server.stop();
  } catch (const LedgerError& e) {
    LEDGER_LOG_EVENT(observability::LogLevel::FATAL, "Ledger server failed").error(e);
    return 1;
  }

  LEDGER_LOG_INFO("Server shutdown complete");
  return 0;
}
