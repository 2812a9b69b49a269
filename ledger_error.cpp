#include "ledger_error.hpp"

namespace ledger {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidAmount: return "INVALID_AMOUNT";
    case ErrorKind::InvalidTransfer: return "INVALID_TRANSFER";
    case ErrorKind::AccountNotFound: return "ACCOUNT_NOT_FOUND";
    case ErrorKind::InsufficientFunds: return "INSUFFICIENT_FUNDS";
    case ErrorKind::ConstraintViolation: return "CONSTRAINT_VIOLATION";
    case ErrorKind::StorageTimeout: return "STORAGE_TIMEOUT";
    case ErrorKind::StorageFailure: return "STORAGE_FAILURE";
  }
  return "UNKNOWN";
}

bool isStorageError(ErrorKind kind) {
  return kind == ErrorKind::StorageTimeout || kind == ErrorKind::StorageFailure;
}

LedgerError::LedgerError(ErrorKind kind, const std::string& message,
                         const std::string& constraint)
    : std::runtime_error(message), kind_(kind), constraint_(constraint) {
}

}  // namespace ledger
