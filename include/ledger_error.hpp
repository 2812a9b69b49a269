#ifndef LEDGER_ERROR_HPP_
#define LEDGER_ERROR_HPP_

#include <stdexcept>
#include <string>

namespace ledger {

/**
 * Failure categories surfaced by the ledger core.
 */
enum class ErrorKind {
  InvalidAmount,
  InvalidTransfer,
  AccountNotFound,
  InsufficientFunds,
  ConstraintViolation,
  StorageTimeout,
  StorageFailure
};

/**
 * Stable identifier of an error kind, e.g. "INSUFFICIENT_FUNDS".
 */
const char* errorKindName(ErrorKind kind);

/**
 * True for kinds raised by the storage layer itself (timeouts and faults).
 */
bool isStorageError(ErrorKind kind);

/**
 * Exception carrying an ErrorKind and a human-readable reason. Integrity
 * failures also name the violated constraint when it is known, e.g.
 * "uq_interest_account_day".
 */
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorKind kind, const std::string& message, const std::string& constraint = "");

  ErrorKind kind() const { return kind_; }
  const char* kindName() const { return errorKindName(kind_); }
  const std::string& constraint() const { return constraint_; }

 private:
  ErrorKind kind_;
  std::string constraint_;
};

}  // namespace ledger

#endif  // LEDGER_ERROR_HPP_
