#ifndef LEDGER_TRANSFER_COORDINATOR_HPP_
#define LEDGER_TRANSFER_COORDINATOR_HPP_

#include "concurrent/account_lock_table.hpp"
#include "ledger_store.hpp"

#include <functional>
#include <string>

namespace ledger {

/**
 * Moves money between two accounts as one all-or-nothing unit.
 *
 * Protocol per transfer:
 *  1. amount > 0, otherwise InvalidAmount
 *  2. from != to, otherwise InvalidTransfer
 *  3. both accounts resolve, otherwise AccountNotFound
 *  4. both account locks taken lower id first
 *  5. one LedgerStore::postPair() whose debit rule re-checks the source
 *     balance at commit time (InsufficientFunds)
 * The TRANSFER_OUT and TRANSFER_IN rows share the transfer id and timestamp.
 */
class TransferCoordinator {
 public:
  using IdGenerator = std::function<std::string()>;

  TransferCoordinator(LedgerStore& store, concurrent::AccountLockTable& locks);
  TransferCoordinator(LedgerStore& store, concurrent::AccountLockTable& locks,
                      IdGenerator id_generator);

  // Non-copyable
  TransferCoordinator(const TransferCoordinator&) = delete;
  TransferCoordinator& operator=(const TransferCoordinator&) = delete;

  TransferReceipt transfer(const std::string& from_account_id, const std::string& to_account_id,
                           Money amount, const std::string& description = "");

 private:
  TransferReceipt execute(const std::string& transfer_id, const std::string& from_account_id,
                          const std::string& to_account_id, Money amount,
                          const std::string& description);

  LedgerStore& store_;
  concurrent::AccountLockTable& locks_;
  IdGenerator id_generator_;
};

/**
 * Random UUID v4 string.
 */
std::string generateTransferId();

}  // namespace ledger

#endif  // LEDGER_TRANSFER_COORDINATOR_HPP_
