#include "account_service.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

namespace ledger {

namespace {

void requirePositive(Money amount) {
  if (!amount.isPositive()) {
    throw LedgerError(ErrorKind::InvalidAmount,
                      "Amount must be greater than zero, got " + amount.toString());
  }
}

void logFailure(const char* operation, const std::string& account_id, Money amount,
                const LedgerError& e) {
  auto level = isStorageError(e.kind()) ? observability::LogLevel::ERROR
                                        : observability::LogLevel::WARN;
  observability::LogEvent(level, std::string(operation) + " rejected", "account_service")
      .field("account_id", account_id)
      .field("amount", amount)
      .error(e);
}

}  // namespace

AccountService::AccountService(LedgerStore& store) : store_(store), queries_(store) {
}

Money AccountService::deposit(const std::string& account_id, Money amount,
                              const std::string& description) {
  auto& metrics = observability::getGlobalMetrics();
  try {
    requirePositive(amount);

    PostingResult result = store_.post(
        PostingRequest::fixed(account_id, TransactionType::DEPOSIT, amount, description));

    metrics.incrementCounter("ledger_operations_total",
                             {{"operation", "deposit"}, {"outcome", "committed"}});
    LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Deposit committed")
        .field("account_id", account_id)
        .field("amount", amount)
        .field("balance", result.balance_after)
        .field("transaction_id", result.transaction.transaction_id);
    return result.balance_after;
  } catch (const LedgerError& e) {
    metrics.incrementCounter("ledger_operations_total",
                             {{"operation", "deposit"}, {"outcome", e.kindName()}});
    logFailure("Deposit", account_id, amount, e);
    throw;
  }
}

Money AccountService::withdraw(const std::string& account_id, Money amount,
                               const std::string& description) {
  auto& metrics = observability::getGlobalMetrics();
  try {
    requirePositive(amount);

    PostingRequest request;
    request.account_id = account_id;
    request.type = TransactionType::WITHDRAWAL;
    request.description = description;
    request.amount_rule = [amount](const Account& account) {
      if (account.balance < amount) {
        throw LedgerError(ErrorKind::InsufficientFunds,
                          "Insufficient funds in " + account.account_id + ": balance " +
                              account.balance.toString() + ", requested " + amount.toString());
      }
      return amount;
    };

    PostingResult result = store_.post(request);

    metrics.incrementCounter("ledger_operations_total",
                             {{"operation", "withdrawal"}, {"outcome", "committed"}});
    LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Withdrawal committed")
        .field("account_id", account_id)
        .field("amount", amount)
        .field("balance", result.balance_after)
        .field("transaction_id", result.transaction.transaction_id);
    return result.balance_after;
  } catch (const LedgerError& e) {
    metrics.incrementCounter("ledger_operations_total",
                             {{"operation", "withdrawal"}, {"outcome", e.kindName()}});
    logFailure("Withdrawal", account_id, amount, e);
    throw;
  }
}

PostingResult AccountService::creditInterest(const std::string& account_id, InterestRate rate,
                                             const std::string& calculation_date) {
  PostingRequest request;
  request.account_id = account_id;
  request.type = TransactionType::DEPOSIT;
  request.description = "Daily interest " + calculation_date + " at " + rate.toString();
  request.amount_rule = [rate](const Account& account) { return rate.applyTo(account.balance); };
  request.interest = InterestAttachment{rate, calculation_date};

  auto& metrics = observability::getGlobalMetrics();
  PostingResult result;
  try {
    result = store_.post(request);
  } catch (const LedgerError& e) {
    metrics.incrementCounter("ledger_operations_total",
                             {{"operation", "interest"}, {"outcome", e.kindName()}});
    throw;
  }

  metrics.incrementCounter("ledger_operations_total",
                           {{"operation", "interest"}, {"outcome", "committed"}});
  LEDGER_LOG_EVENT(observability::LogLevel::DEBUG, "Interest credited")
      .field("account_id", account_id)
      .field("interest", result.transaction.amount)
      .field("calculation_date", calculation_date)
      .field("balance", result.balance_after);
  return result;
}

AccountInfo AccountService::getAccountInfo(const std::string& account_id) {
  return queries_.getAccountInfo(account_id);
}

}  // namespace ledger
