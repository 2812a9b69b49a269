#include "ledger_store.hpp"
#include "ledger_error.hpp"
#include "observability/logger.hpp"

namespace ledger {

PostingRequest PostingRequest::fixed(const std::string& account_id, TransactionType type,
                                     Money amount, const std::string& description,
                                     const std::string& reference_id) {
  PostingRequest request;
  request.account_id = account_id;
  request.type = type;
  request.amount_rule = [amount](const Account&) { return amount; };
  request.description = description;
  request.reference_id = reference_id;
  return request;
}

StagedPosting stagePosting(const PostingRequest& request, const Account& account) {
  if (!request.amount_rule) {
    throw LedgerError(ErrorKind::InvalidAmount, "Posting has no amount rule");
  }

  StagedPosting staged;
  staged.amount = request.amount_rule(account);
  if (!staged.amount.isPositive()) {
    throw LedgerError(ErrorKind::InvalidAmount,
                      "Posting amount must be positive, got " + staged.amount.toString());
  }

  // Balances stay within [0, kMaxCents], so only a credit can overflow.
  if (isCredit(request.type) &&
      staged.amount.cents() > Money::kMaxCents - account.balance.cents()) {
    throw LedgerError(ErrorKind::ConstraintViolation,
                      "Balance of " + account.account_id + " would exceed " +
                          Money::fromCents(Money::kMaxCents).toString());
  }

  staged.balance_after = isCredit(request.type) ? account.balance + staged.amount
                                                : account.balance - staged.amount;
  if (staged.balance_after.isNegative()) {
    throw LedgerError(ErrorKind::ConstraintViolation,
                      "Balance of " + account.account_id + " would become " +
                          staged.balance_after.toString());
  }

  if (request.interest && request.type != TransactionType::DEPOSIT) {
    throw LedgerError(ErrorKind::ConstraintViolation,
                      "Interest may only be attached to a DEPOSIT posting");
  }

  return staged;
}

void seedDemoAccounts(LedgerStore& store) {
  struct Seed {
    const char* account_id;
    const char* customer_name;
    int64_t cents;
  };
  static const Seed kSeeds[] = {
      {"ACC001", "Juan Perez", 100000},
      {"ACC002", "Maria Garcia", 50000},
      {"ACC003", "Carlos Lopez", 0},
  };

  for (const auto& seed : kSeeds) {
    try {
      store.createAccount(seed.account_id, seed.customer_name, Money::fromCents(seed.cents));
    } catch (const LedgerError& e) {
      if (e.kind() != ErrorKind::ConstraintViolation) throw;
      LEDGER_LOG_DEBUG(std::string("Seed account already present: ") + seed.account_id);
    }
  }
}

}  // namespace ledger
