#include "transfer_coordinator.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <utility>

namespace ledger {

std::string generateTransferId() {
  thread_local std::mt19937_64 gen(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;

  uint64_t high = dist(gen);
  uint64_t low = dist(gen);

  std::ostringstream ss;
  ss << std::hex << std::setfill('0');
  ss << std::setw(8) << ((high >> 32) & 0xFFFFFFFF) << "-";
  ss << std::setw(4) << ((high >> 16) & 0xFFFF) << "-";
  ss << std::setw(4) << ((high & 0x0FFF) | 0x4000) << "-";
  ss << std::setw(4) << (((low >> 48) & 0x3FFF) | 0x8000) << "-";
  ss << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
  return ss.str();
}

TransferCoordinator::TransferCoordinator(LedgerStore& store, concurrent::AccountLockTable& locks)
    : TransferCoordinator(store, locks, generateTransferId) {
}

TransferCoordinator::TransferCoordinator(LedgerStore& store, concurrent::AccountLockTable& locks,
                                         IdGenerator id_generator)
    : store_(store), locks_(locks), id_generator_(std::move(id_generator)) {
}

TransferReceipt TransferCoordinator::transfer(const std::string& from_account_id,
                                              const std::string& to_account_id, Money amount,
                                              const std::string& description) {
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "ledger_transfer_duration_seconds");
  std::string transfer_id = id_generator_();

  try {
    TransferReceipt receipt =
        execute(transfer_id, from_account_id, to_account_id, amount, description);

    metrics.incrementCounter("ledger_operations_total",
                             {{"operation", "transfer"}, {"outcome", "committed"}});
    LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Transfer committed")
        .field("transfer_id", transfer_id)
        .field("from", from_account_id)
        .field("to", to_account_id)
        .field("amount", amount)
        .field("from_balance", receipt.from_balance)
        .field("to_balance", receipt.to_balance);
    return receipt;
  } catch (const LedgerError& e) {
    metrics.incrementCounter("ledger_operations_total",
                             {{"operation", "transfer"}, {"outcome", e.kindName()}});
    auto level = isStorageError(e.kind()) ? observability::LogLevel::ERROR
                                          : observability::LogLevel::WARN;
    observability::LogEvent(level, "Transfer rolled back", "transfer_coordinator",
                            transfer_id)
        .field("from", from_account_id)
        .field("to", to_account_id)
        .field("amount", amount)
        .error(e);
    throw;
  }
}

TransferReceipt TransferCoordinator::execute(const std::string& transfer_id,
                                             const std::string& from_account_id,
                                             const std::string& to_account_id, Money amount,
                                             const std::string& description) {
  if (!amount.isPositive()) {
    throw LedgerError(ErrorKind::InvalidAmount,
                      "Transfer amount must be greater than zero, got " + amount.toString());
  }
  if (from_account_id == to_account_id) {
    throw LedgerError(ErrorKind::InvalidTransfer,
                      "Cannot transfer from account " + from_account_id + " to itself");
  }

  // Resolve both sides before locking; the store checks again inside the unit.
  store_.getAccount(from_account_id);
  store_.getAccount(to_account_id);

  auto guard = locks_.lockPair(from_account_id, to_account_id);

  std::string text = description.empty()
                         ? "Transfer " + transfer_id + " from " + from_account_id + " to " +
                               to_account_id
                         : description;

  PostingRequest debit;
  debit.account_id = from_account_id;
  debit.type = TransactionType::TRANSFER_OUT;
  debit.description = text;
  debit.reference_id = transfer_id;
  debit.amount_rule = [amount](const Account& account) {
    if (account.balance < amount) {
      throw LedgerError(ErrorKind::InsufficientFunds,
                        "Insufficient funds in " + account.account_id + ": balance " +
                            account.balance.toString() + ", requested " + amount.toString());
    }
    return amount;
  };

  PostingRequest credit =
      PostingRequest::fixed(to_account_id, TransactionType::TRANSFER_IN, amount, text, transfer_id);

  auto [debit_result, credit_result] = store_.postPair(debit, credit);

  TransferReceipt receipt;
  receipt.transfer_id = transfer_id;
  receipt.from_account_id = from_account_id;
  receipt.to_account_id = to_account_id;
  receipt.amount = amount;
  receipt.from_balance = debit_result.balance_after;
  receipt.to_balance = credit_result.balance_after;
  receipt.timestamp = debit_result.transaction.timestamp;
  return receipt;
}

}  // namespace ledger
