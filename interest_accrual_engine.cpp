#include "interest_accrual_engine.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <utility>

namespace ledger {

InterestAccrualEngine::InterestAccrualEngine(LedgerStore& store, AccountService& accounts,
                                             InterestRate daily_rate)
    : store_(store), accounts_(accounts), daily_rate_(daily_rate) {
}

AccrualSummary InterestAccrualEngine::accrueDaily() {
  return accrueDaily(calendarDate(currentTimestamp()));
}

AccrualSummary InterestAccrualEngine::accrueDaily(const std::string& calculation_date) {
  auto& metrics = observability::getGlobalMetrics();
  observability::MetricsCollector::Timer timer(metrics, "ledger_accrual_duration_seconds");

  AccrualSummary summary;
  summary.calculation_date = calculation_date;

  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Interest accrual started")
      .field("calculation_date", calculation_date)
      .field("rate", daily_rate_.toString());

  for (const Account& account : store_.listAccounts()) {
    ++summary.accounts_scanned;

    try {
      // Cheap pre-filter; the amount actually posted is recomputed in the unit.
      if (!daily_rate_.applyTo(account.balance).isPositive()) {
        ++summary.skipped;
        continue;
      }

      PostingResult result =
          accounts_.creditInterest(account.account_id, daily_rate_, calculation_date);
      ++summary.accounts_credited;
      summary.total_interest += result.transaction.amount;
    } catch (const LedgerError& e) {
      if (e.kind() == ErrorKind::ConstraintViolation &&
          e.constraint() == kInterestPerDayConstraint) {
        ++summary.already_accrued;
        LEDGER_LOG_DEBUG("Interest already accrued for " + account.account_id + " on " +
                         calculation_date);
      } else if (e.kind() == ErrorKind::InvalidAmount) {
        // Balance dropped between the listing and the unit.
        ++summary.skipped;
      } else {
        ++summary.failed;
        LEDGER_LOG_EVENT(observability::LogLevel::ERROR, "Interest accrual failed")
            .field("account_id", account.account_id)
            .field("calculation_date", calculation_date)
            .error(e)
            .field("constraint", e.constraint());
      }
    }
  }

  metrics.incrementCounter("ledger_accrual_runs_total");
  const std::pair<const char*, size_t> results[] = {{"credited", summary.accounts_credited},
                                                    {"already_accrued", summary.already_accrued},
                                                    {"skipped", summary.skipped},
                                                    {"failed", summary.failed}};
  for (const auto& [result, count] : results) {
    metrics.incrementCounter("ledger_accrual_accounts_total", {{"result", result}},
                             static_cast<double>(count));
  }

  LEDGER_LOG_EVENT(observability::LogLevel::INFO, "Interest accrual finished")
      .field("calculation_date", calculation_date)
      .field("scanned", summary.accounts_scanned)
      .field("credited", summary.accounts_credited)
      .field("already_accrued", summary.already_accrued)
      .field("skipped", summary.skipped)
      .field("failed", summary.failed)
      .field("total_interest", summary.total_interest);
  return summary;
}

}  // namespace ledger
