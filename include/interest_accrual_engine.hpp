#ifndef LEDGER_INTEREST_ACCRUAL_ENGINE_HPP_
#define LEDGER_INTEREST_ACCRUAL_ENGINE_HPP_

#include "account_service.hpp"
#include "ledger_store.hpp"

#include <string>

namespace ledger {

/**
 * Outcome of one accrual batch.
 */
struct AccrualSummary {
  std::string calculation_date;
  size_t accounts_scanned = 0;
  size_t accounts_credited = 0;
  size_t already_accrued = 0;  // credited earlier for the same date
  size_t skipped = 0;          // interest rounds to zero
  size_t failed = 0;
  Money total_interest;
};

/**
 * Applies the flat daily rate to every account.
 *
 * Each account is credited in its own atomic unit through
 * AccountService::creditInterest(); one account failing does not stop or undo
 * the others. A (account, calculation date) pair is credited at most once, so
 * re-running a day only picks up accounts that were missed.
 */
class InterestAccrualEngine {
 public:
  static constexpr int64_t kDefaultDailyRatePerMillion = 500;  // 0.05%

  InterestAccrualEngine(LedgerStore& store, AccountService& accounts,
                        InterestRate daily_rate =
                            InterestRate::fromPerMillion(kDefaultDailyRatePerMillion));

  // Non-copyable
  InterestAccrualEngine(const InterestAccrualEngine&) = delete;
  InterestAccrualEngine& operator=(const InterestAccrualEngine&) = delete;

  /**
   * Accrue for the current UTC date.
   */
  AccrualSummary accrueDaily();

  /**
   * Accrue for an explicit date (YYYY-MM-DD). Throws only when the account
   * list itself cannot be read.
   */
  AccrualSummary accrueDaily(const std::string& calculation_date);

  InterestRate dailyRate() const { return daily_rate_; }

 private:
  LedgerStore& store_;
  AccountService& accounts_;
  InterestRate daily_rate_;
};

}  // namespace ledger

#endif  // LEDGER_INTEREST_ACCRUAL_ENGINE_HPP_
