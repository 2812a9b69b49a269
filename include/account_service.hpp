#ifndef LEDGER_ACCOUNT_SERVICE_HPP_
#define LEDGER_ACCOUNT_SERVICE_HPP_

#include "account_query_facade.hpp"
#include "ledger_store.hpp"

#include <string>

namespace ledger {

/**
 * Single-account money movements. Every mutation is one LedgerStore::post()
 * call; the service keeps no balances of its own.
 */
class AccountService {
 public:
  explicit AccountService(LedgerStore& store);

  // Non-copyable
  AccountService(const AccountService&) = delete;
  AccountService& operator=(const AccountService&) = delete;

  /**
   * Credits `amount` and returns the new balance.
   * Throws InvalidAmount for amount <= 0 and AccountNotFound.
   */
  Money deposit(const std::string& account_id, Money amount,
                const std::string& description = "Deposit");

  /**
   * Debits `amount` and returns the new balance. The balance check runs inside
   * the atomic unit and throws InsufficientFunds.
   */
  Money withdraw(const std::string& account_id, Money amount,
                 const std::string& description = "Withdrawal");

  /**
   * Deposit of `rate` applied to the balance read inside the unit, recorded
   * together with its InterestRecord. Throws InvalidAmount when the computed
   * interest is not positive and ConstraintViolation when the account was
   * already credited for `calculation_date`.
   */
  PostingResult creditInterest(const std::string& account_id, InterestRate rate,
                               const std::string& calculation_date);

  AccountInfo getAccountInfo(const std::string& account_id);

 private:
  LedgerStore& store_;
  AccountQueryFacade queries_;
};

}  // namespace ledger

#endif  // LEDGER_ACCOUNT_SERVICE_HPP_
