#ifndef ENGINE_HPP_
#define ENGINE_HPP_

#include "account_store.hpp"
#include "engine_error.hpp"
#include "ledger.hpp"
#include "transaction.hpp"

#include <optional>
#include <string>

namespace payments {

/**
 * Which ledger entries may be disputed.
 */
struct DisputePolicy {
  // Deposits are always disputable. Withdrawals only when this is set.
  bool allow_withdrawal_disputes = false;
};

/**
 * Applies transaction records, in order, to the accounts and ledger it owns.
 *
 * Every record is either applied completely or rejected with an EngineError
 * and no change to any account or ledger entry. Records must be applied in
 * input order: dispute handling and funds checks depend on prior history.
 */
class Engine {
 public:
  Engine() = default;
  explicit Engine(DisputePolicy policy) : policy_(policy) {}

  // Non-copyable
  Engine(const Engine&) = delete;
  Engine& operator=(const Engine&) = delete;

  /**
   * Validates and applies one record. Returns nullopt when applied.
   * Throws std::logic_error if accounts and ledger disagree.
   */
  std::optional<EngineError> apply(const TransactionRecord& record);

  const AccountStore& accounts() const { return accounts_; }
  const Ledger& ledger() const { return ledger_; }
  const Account* findAccount(ClientId client) const { return accounts_.find(client); }
  const DisputePolicy& policy() const { return policy_; }

 private:
  std::optional<EngineError> applyDispute(const TransactionRecord& record);
  std::optional<EngineError> applyResolve(const TransactionRecord& record);
  std::optional<EngineError> applyChargeback(const TransactionRecord& record);

  // Deposit or withdrawal. The balance change is made on a copy of the
  // account and committed, with the ledger entry, only if it succeeds.
  std::optional<EngineError> applyValueMove(const TransactionRecord& record, Amount amount);

  // Looks up the referenced entry and checks it belongs to the record's client.
  // On success `entry` points into the ledger.
  std::optional<EngineError> lookupReferenced(const TransactionRecord& record,
                                              const LedgerEntry*& entry) const;

  // Account owning a ledger entry. Its absence is an internal fault.
  Account& accountFor(const TransactionRecord& record);

  void commitTransition(const TransactionRecord& record, DisputeStatus next);

  static EngineError reject(ErrorKind kind, const TransactionRecord& record,
                            const std::string& detail);

  DisputePolicy policy_;
  AccountStore accounts_;
  Ledger ledger_;
};

}  // namespace payments

#endif  // ENGINE_HPP_
