#include "transaction.hpp"

namespace payments {

const char* transactionTypeName(TransactionType type) {
  switch (type) {
    case TransactionType::DEPOSIT: return "deposit";
    case TransactionType::WITHDRAWAL: return "withdrawal";
    case TransactionType::DISPUTE: return "dispute";
    case TransactionType::RESOLVE: return "resolve";
    case TransactionType::CHARGEBACK: return "chargeback";
  }
  return "unknown";
}

std::optional<TransactionType> parseTransactionType(std::string_view text) {
  if (text == "deposit") return TransactionType::DEPOSIT;
  if (text == "withdrawal") return TransactionType::WITHDRAWAL;
  if (text == "dispute") return TransactionType::DISPUTE;
  if (text == "resolve") return TransactionType::RESOLVE;
  if (text == "chargeback") return TransactionType::CHARGEBACK;
  return std::nullopt;
}

TransactionType TransactionRecord::type() const {
  // Variant alternatives are declared in enum order.
  return static_cast<TransactionType>(payload.index());
}

std::optional<Amount> TransactionRecord::amount() const {
  if (const auto* deposit = std::get_if<Deposit>(&payload)) {
    return deposit->amount;
  }
  if (const auto* withdrawal = std::get_if<Withdrawal>(&payload)) {
    return withdrawal->amount;
  }
  return std::nullopt;
}

TransactionRecord TransactionRecord::deposit(ClientId client, TransactionId tx, Amount amount) {
  return TransactionRecord{client, tx, Deposit{amount}};
}

TransactionRecord TransactionRecord::withdrawal(ClientId client, TransactionId tx,
                                                Amount amount) {
  return TransactionRecord{client, tx, Withdrawal{amount}};
}

TransactionRecord TransactionRecord::dispute(ClientId client, TransactionId tx) {
  return TransactionRecord{client, tx, Dispute{}};
}

TransactionRecord TransactionRecord::resolve(ClientId client, TransactionId tx) {
  return TransactionRecord{client, tx, Resolve{}};
}

TransactionRecord TransactionRecord::chargeback(ClientId client, TransactionId tx) {
  return TransactionRecord{client, tx, Chargeback{}};
}

}  // namespace payments
