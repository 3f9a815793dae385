#include "ledger.hpp"

#include <stdexcept>
#include <string>

namespace payments {

const char* disputeStatusName(DisputeStatus status) {
  switch (status) {
    case DisputeStatus::NORMAL: return "Normal";
    case DisputeStatus::DISPUTED: return "Disputed";
    case DisputeStatus::RESOLVED: return "Resolved";
    case DisputeStatus::CHARGED_BACK: return "ChargedBack";
  }
  return "Unknown";
}

bool isValidTransition(DisputeStatus from, DisputeStatus to) {
  switch (to) {
    case DisputeStatus::DISPUTED:
      return from == DisputeStatus::NORMAL || from == DisputeStatus::RESOLVED;
    case DisputeStatus::RESOLVED:
    case DisputeStatus::CHARGED_BACK:
      return from == DisputeStatus::DISPUTED;
    case DisputeStatus::NORMAL:
      return false;
  }
  return false;
}

bool Ledger::contains(TransactionId tx) const {
  return entries_.find(tx) != entries_.end();
}

bool Ledger::insert(TransactionId tx, ClientId client, TransactionType kind, Amount amount) {
  if (kind != TransactionType::DEPOSIT && kind != TransactionType::WITHDRAWAL) {
    throw std::invalid_argument(std::string("ledger cannot record a ") +
                                transactionTypeName(kind));
  }
  return entries_.emplace(tx, LedgerEntry{client, kind, amount, DisputeStatus::NORMAL}).second;
}

const LedgerEntry* Ledger::find(TransactionId tx) const {
  auto it = entries_.find(tx);
  if (it == entries_.end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<ErrorKind> Ledger::transition(TransactionId tx, DisputeStatus next) {
  auto it = entries_.find(tx);
  if (it == entries_.end()) {
    return ErrorKind::UNKNOWN_TRANSACTION;
  }
  if (!isValidTransition(it->second.status, next)) {
    return ErrorKind::INVALID_DISPUTE_STATE;
  }
  it->second.status = next;
  return std::nullopt;
}

Amount Ledger::disputedTotal(ClientId client) const {
  Amount sum;
  for (const auto& [tx, entry] : entries_) {
    if (entry.client == client && entry.status == DisputeStatus::DISPUTED) {
      sum += entry.amount;
    }
  }
  return sum;
}

}  // namespace payments
