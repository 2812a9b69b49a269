#ifndef LEDGER_TYPES_HPP_
#define LEDGER_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ledger {

// Microseconds since the Unix epoch, UTC.
using Timestamp = int64_t;

Timestamp currentTimestamp();

// ISO-8601 rendering, e.g. "2026-10-18T07:10:00.000123Z".
std::string formatTimestamp(Timestamp ts);

// UTC calendar date of a timestamp as "YYYY-MM-DD".
std::string calendarDate(Timestamp ts);

// True for a valid "YYYY-MM-DD" Gregorian date.
bool isCalendarDate(const std::string& text);

/**
 * Fixed-point decimal amount with two fraction digits, held as cents.
 */
class Money {
 public:
  // Largest balance a NUMERIC(18,2) column holds, 9999999999999999.99.
  static constexpr int64_t kMaxCents = 999999999999999999;

  Money() : cents_(0) {}

  static Money fromCents(int64_t cents) { return Money(cents); }

  /**
   * Parses "[-]digits[.d[d]]". Throws LedgerError(InvalidAmount) on anything else.
   */
  static Money parse(const std::string& text);

  // Same syntax, for values read back from a NUMERIC(18,2) column; accepts
  // anything up to kMaxCents.
  static Money parseStored(const std::string& text);

  int64_t cents() const { return cents_; }
  bool isPositive() const { return cents_ > 0; }
  bool isNegative() const { return cents_ < 0; }

  std::string toString() const;

  Money operator+(Money other) const { return Money(cents_ + other.cents_); }
  Money operator-(Money other) const { return Money(cents_ - other.cents_); }
  Money operator-() const { return Money(-cents_); }
  Money& operator+=(Money other) {
    cents_ += other.cents_;
    return *this;
  }
  Money& operator-=(Money other) {
    cents_ -= other.cents_;
    return *this;
  }

  bool operator==(Money other) const { return cents_ == other.cents_; }
  bool operator!=(Money other) const { return cents_ != other.cents_; }
  bool operator<(Money other) const { return cents_ < other.cents_; }
  bool operator<=(Money other) const { return cents_ <= other.cents_; }
  bool operator>(Money other) const { return cents_ > other.cents_; }
  bool operator>=(Money other) const { return cents_ >= other.cents_; }

 private:
  explicit Money(int64_t cents) : cents_(cents) {}

  static int64_t parseCents(const std::string& text, size_t max_integer_digits);

  int64_t cents_;
};

/**
 * Interest rate in parts per million; 0.05% is 500.
 */
struct InterestRate {
  int64_t per_million = 0;

  static InterestRate fromPerMillion(int64_t ppm) { return InterestRate{ppm}; }

  // Parses a decimal rate such as "0.0005" (at most six fraction digits).
  static InterestRate parse(const std::string& text);

  // balance * rate, rounded half away from zero to the cent. Throws
  // LedgerError(ConstraintViolation) when the result does not fit in Money.
  Money applyTo(Money balance) const;

  std::string toString() const;

  bool operator==(const InterestRate& other) const { return per_million == other.per_million; }
};

enum class TransactionType {
  DEPOSIT,
  WITHDRAWAL,
  TRANSFER_IN,
  TRANSFER_OUT
};

std::string toString(TransactionType type);
std::optional<TransactionType> transactionTypeFromString(const std::string& name);

// DEPOSIT and TRANSFER_IN add to the balance; the others subtract.
bool isCredit(TransactionType type);

struct Account {
  std::string account_id;
  std::string customer_name;
  Money balance;
  Money opening_balance;  // balance at creation, base of reconciliation
  Timestamp created_at = 0;
};

/**
 * Immutable ledger row. `amount` is always positive; the sign follows `type`.
 */
struct Transaction {
  int64_t transaction_id = 0;
  std::string account_id;
  TransactionType type = TransactionType::DEPOSIT;
  Money amount;
  Timestamp timestamp = 0;
  std::string description;
  std::string reference_id;  // transfer correlation id, empty otherwise

  Money signedAmount() const { return isCredit(type) ? amount : -amount; }
};

struct InterestRecord {
  int64_t id = 0;
  std::string account_id;
  InterestRate interest_rate;
  Money calculated_interest;
  std::string calculation_date;  // YYYY-MM-DD
  int64_t transaction_id = 0;    // the DEPOSIT row that credited it
  Timestamp calculated_at = 0;
};

struct TransferReceipt {
  std::string transfer_id;
  std::string from_account_id;
  std::string to_account_id;
  Money amount;
  Money from_balance;
  Money to_balance;
  Timestamp timestamp = 0;
};

struct AccountInfo {
  Account account;
  std::vector<Transaction> recent_transactions;
  Money accumulated_interest;
};

}  // namespace ledger

#endif  // LEDGER_TYPES_HPP_
