#include "engine.hpp"

#include <stdexcept>
#include <string>
#include <variant>

namespace payments {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

std::string txLabel(const TransactionRecord& record) {
  return "tx " + std::to_string(record.tx) + " (client " + std::to_string(record.client) + ")";
}

}  // namespace

EngineError Engine::reject(ErrorKind kind, const TransactionRecord& record,
                           const std::string& detail) {
  return EngineError{kind, record.client, record.tx, txLabel(record) + ": " + detail};
}

std::optional<EngineError> Engine::apply(const TransactionRecord& record) {
  return std::visit(
      Overloaded{
          [&](const Deposit& deposit) { return applyValueMove(record, deposit.amount); },
          [&](const Withdrawal& withdrawal) { return applyValueMove(record, withdrawal.amount); },
          [&](const Dispute&) { return applyDispute(record); },
          [&](const Resolve&) { return applyResolve(record); },
          [&](const Chargeback&) { return applyChargeback(record); },
      },
      record.payload);
}

std::optional<EngineError> Engine::applyValueMove(const TransactionRecord& record,
                                                  Amount amount) {
  const TransactionType kind = record.type();

  if (amount.isNegative()) {
    return reject(ErrorKind::NEGATIVE_AMOUNT, record,
                  std::string(transactionTypeName(kind)) + " amount " + amount.toString() +
                      " is negative");
  }
  if (ledger_.contains(record.tx)) {
    return reject(ErrorKind::DUPLICATE_TRANSACTION_ID, record, "duplicate transaction id");
  }

  // Work on a copy so that a rejection neither mutates nor creates the account.
  const Account* existing = accounts_.find(record.client);
  Account candidate = existing ? *existing : Account(record.client);

  const std::optional<ErrorKind> failure = kind == TransactionType::DEPOSIT
                                               ? candidate.creditAvailable(amount)
                                               : candidate.debitAvailable(amount);
  if (failure) {
    std::string detail;
    switch (*failure) {
      case ErrorKind::ACCOUNT_LOCKED:
        detail = "account is locked";
        break;
      case ErrorKind::INSUFFICIENT_FUNDS:
        detail = "insufficient funds: requested " + amount.toString() + ", available " +
                 candidate.available().toString();
        break;
      default:
        detail = std::string(transactionTypeName(kind)) + " rejected";
        break;
    }
    return reject(*failure, record, detail);
  }

  if (!ledger_.insert(record.tx, record.client, kind, amount)) {
    throw std::logic_error("ledger refused new entry " + std::to_string(record.tx));
  }
  accounts_.getOrCreate(record.client) = candidate;
  return std::nullopt;
}

std::optional<EngineError> Engine::lookupReferenced(const TransactionRecord& record,
                                                    const LedgerEntry*& entry) const {
  entry = ledger_.find(record.tx);
  if (!entry) {
    return reject(ErrorKind::UNKNOWN_TRANSACTION, record, "transaction not found");
  }
  if (entry->client != record.client) {
    return reject(ErrorKind::CLIENT_MISMATCH, record,
                  "client mismatch (expected " + std::to_string(entry->client) + ", got " +
                      std::to_string(record.client) + ")");
  }
  return std::nullopt;
}

Account& Engine::accountFor(const TransactionRecord& record) {
  Account* account = accounts_.find(record.client);
  if (!account) {
    throw std::logic_error("ledger entry " + std::to_string(record.tx) +
                           " has no account for client " + std::to_string(record.client));
  }
  return *account;
}

void Engine::commitTransition(const TransactionRecord& record, DisputeStatus next) {
  if (ledger_.transition(record.tx, next)) {
    throw std::logic_error("ledger entry " + std::to_string(record.tx) +
                           " refused validated transition to " + disputeStatusName(next));
  }
}

std::optional<EngineError> Engine::applyDispute(const TransactionRecord& record) {
  const LedgerEntry* entry = nullptr;
  if (auto error = lookupReferenced(record, entry)) {
    return error;
  }
  if (entry->kind != TransactionType::DEPOSIT && !policy_.allow_withdrawal_disputes) {
    return reject(ErrorKind::CANNOT_DISPUTE_TARGET, record,
                  std::string("cannot dispute a ") + transactionTypeName(entry->kind));
  }
  if (!isValidTransition(entry->status, DisputeStatus::DISPUTED)) {
    return reject(ErrorKind::INVALID_DISPUTE_STATE, record,
                  std::string("cannot dispute a transaction in state ") +
                      disputeStatusName(entry->status));
  }

  Account& account = accountFor(record);
  if (auto failure = account.hold(entry->amount)) {
    return reject(*failure, record,
                  "insufficient funds to hold " + entry->amount.toString() + ", available " +
                      account.available().toString());
  }
  commitTransition(record, DisputeStatus::DISPUTED);
  return std::nullopt;
}

std::optional<EngineError> Engine::applyResolve(const TransactionRecord& record) {
  const LedgerEntry* entry = nullptr;
  if (auto error = lookupReferenced(record, entry)) {
    return error;
  }
  if (!isValidTransition(entry->status, DisputeStatus::RESOLVED)) {
    return reject(ErrorKind::INVALID_DISPUTE_STATE, record,
                  std::string("cannot resolve a transaction in state ") +
                      disputeStatusName(entry->status));
  }

  accountFor(record).release(entry->amount);
  commitTransition(record, DisputeStatus::RESOLVED);
  return std::nullopt;
}

std::optional<EngineError> Engine::applyChargeback(const TransactionRecord& record) {
  const LedgerEntry* entry = nullptr;
  if (auto error = lookupReferenced(record, entry)) {
    return error;
  }
  if (!isValidTransition(entry->status, DisputeStatus::CHARGED_BACK)) {
    return reject(ErrorKind::INVALID_DISPUTE_STATE, record,
                  std::string("cannot charge back a transaction in state ") +
                      disputeStatusName(entry->status));
  }

  accountFor(record).chargeback(entry->amount);
  commitTransition(record, DisputeStatus::CHARGED_BACK);
  return std::nullopt;
}

}  // namespace payments
