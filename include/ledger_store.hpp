#ifndef LEDGER_STORE_HPP_
#define LEDGER_STORE_HPP_

#include "ledger_types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ledger {

// Constraint named by the LedgerError for a second accrual on the same day.
constexpr const char* kInterestPerDayConstraint = "uq_interest_account_day";

/**
 * Interest credit attached to a DEPOSIT posting. The store writes the matching
 * InterestRecord inside the same atomic unit and rejects a second accrual for
 * the same account and calculation date.
 */
struct InterestAttachment {
  InterestRate rate;
  std::string calculation_date;
};

/**
 * One read-modify-append against a single account.
 */
struct PostingRequest {
  // Computes the positive amount to post from the account as read inside the
  // atomic unit. Throwing a LedgerError aborts the unit with no effect.
  using AmountRule = std::function<Money(const Account&)>;

  std::string account_id;
  TransactionType type = TransactionType::DEPOSIT;
  AmountRule amount_rule;
  std::string description;
  std::string reference_id;
  std::optional<InterestAttachment> interest;

  static PostingRequest fixed(const std::string& account_id, TransactionType type, Money amount,
                              const std::string& description = "",
                              const std::string& reference_id = "");
};

struct PostingResult {
  Transaction transaction;
  Money balance_after;
  std::optional<InterestRecord> interest_record;
};

/**
 * Amount and resulting balance of a posting, before anything is written.
 */
struct StagedPosting {
  Money amount;
  Money balance_after;
};

/**
 * Evaluates the request's amount rule against `account` as read inside the
 * atomic unit. Throws InvalidAmount for a non-positive amount and
 * ConstraintViolation when the balance would drop below zero. Shared by every
 * LedgerStore implementation.
 */
StagedPosting stagePosting(const PostingRequest& request, const Account& account);

/**
 * Abstract ledger storage: keyed accounts plus their append-only transaction
 * log and interest history. Mutations happen only through post() and
 * postPair(), each of which commits completely or not at all.
 */
class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  /**
   * Seeds an account. Fails with ConstraintViolation for a duplicate id or a
   * negative opening balance.
   */
  virtual void createAccount(const std::string& account_id, const std::string& customer_name,
                             Money opening_balance) = 0;

  /**
   * Throws LedgerError(AccountNotFound) when the id does not resolve.
   */
  virtual Account getAccount(const std::string& account_id) = 0;

  /**
   * All accounts ordered by id.
   */
  virtual std::vector<Account> listAccounts() = 0;

  /**
   * Newest first: timestamp descending, then transaction id descending.
   */
  virtual std::vector<Transaction> getRecentTransactions(const std::string& account_id,
                                                         size_t limit) = 0;

  /**
   * Full log of an account in commit order.
   */
  virtual std::vector<Transaction> getTransactions(const std::string& account_id) = 0;

  /**
   * Ordered by calculation date, then record id.
   */
  virtual std::vector<InterestRecord> getInterestHistory(const std::string& account_id) = 0;

  /**
   * Atomic read-modify-append on one account.
   */
  virtual PostingResult post(const PostingRequest& request) = 0;

  /**
   * Atomic read-modify-append on two distinct accounts as one unit. Both rows
   * share a single timestamp.
   */
  virtual std::pair<PostingResult, PostingResult> postPair(const PostingRequest& first,
                                                           const PostingRequest& second) = 0;
};

/**
 * Creates ACC001 (1000.00), ACC002 (500.00) and ACC003 (0.00), skipping any
 * that already exist.
 */
void seedDemoAccounts(LedgerStore& store);

}  // namespace ledger

#endif  // LEDGER_STORE_HPP_
