#ifndef LEDGER_HPP_
#define LEDGER_HPP_

#include "amount.hpp"
#include "engine_error.hpp"
#include "transaction.hpp"

#include <cstddef>
#include <optional>
#include <unordered_map>

namespace payments {

/**
 * Dispute lifecycle of a recorded transaction.
 *
 *   NORMAL -> DISPUTED -> RESOLVED -> DISPUTED ...
 *                      -> CHARGED_BACK (terminal)
 */
enum class DisputeStatus {
  NORMAL,
  DISPUTED,
  RESOLVED,
  CHARGED_BACK
};

const char* disputeStatusName(DisputeStatus status);

// True only for the four legal edges of the lifecycle above.
bool isValidTransition(DisputeStatus from, DisputeStatus to);

/**
 * Facts of an applied deposit or withdrawal. Everything but `status` is fixed
 * at insertion.
 */
struct LedgerEntry {
  ClientId client = 0;
  TransactionType kind = TransactionType::DEPOSIT;
  Amount amount;
  DisputeStatus status = DisputeStatus::NORMAL;
};

/**
 * Every deposit and withdrawal applied during the run, keyed by tx id.
 * Entries are never removed because any of them may be disputed later.
 */
class Ledger {
 public:
  using Map = std::unordered_map<TransactionId, LedgerEntry>;

  bool contains(TransactionId tx) const;

  /**
   * Records a value-moving transaction in NORMAL status.
   * Returns false if `tx` is already present. Throws std::invalid_argument
   * for kinds other than DEPOSIT and WITHDRAWAL.
   */
  bool insert(TransactionId tx, ClientId client, TransactionType kind, Amount amount);

  // nullptr when `tx` was never recorded.
  const LedgerEntry* find(TransactionId tx) const;

  /**
   * Moves the entry for `tx` to `next`.
   * Rejects with UNKNOWN_TRANSACTION or INVALID_DISPUTE_STATE without
   * touching the entry.
   */
  std::optional<ErrorKind> transition(TransactionId tx, DisputeStatus next);

  // Sum of amounts of `client`'s entries currently DISPUTED.
  Amount disputedTotal(ClientId client) const;

  std::size_t size() const { return entries_.size(); }
  const Map& entries() const { return entries_; }

 private:
  Map entries_;
};

}  // namespace payments

#endif  // LEDGER_HPP_
