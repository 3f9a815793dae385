#ifndef TRANSACTION_HPP_
#define TRANSACTION_HPP_

#include "amount.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace payments {

using ClientId = std::uint16_t;
using TransactionId = std::uint32_t;

// Transaction kinds as they appear in the input `type` column.
enum class TransactionType {
  DEPOSIT,
  WITHDRAWAL,
  DISPUTE,
  RESOLVE,
  CHARGEBACK
};

const char* transactionTypeName(TransactionType type);
std::optional<TransactionType> parseTransactionType(std::string_view text);

// Per-kind payloads. Only value-moving kinds carry an amount.
struct Deposit {
  Amount amount;
};
struct Withdrawal {
  Amount amount;
};
struct Dispute {};
struct Resolve {};
struct Chargeback {};

using TransactionPayload = std::variant<Deposit, Withdrawal, Dispute, Resolve, Chargeback>;

/**
 * One parsed input record.
 */
struct TransactionRecord {
  ClientId client = 0;
  TransactionId tx = 0;
  TransactionPayload payload;

  TransactionType type() const;

  // Amount of a deposit or withdrawal, nullopt for dispute-family records.
  std::optional<Amount> amount() const;

  static TransactionRecord deposit(ClientId client, TransactionId tx, Amount amount);
  static TransactionRecord withdrawal(ClientId client, TransactionId tx, Amount amount);
  static TransactionRecord dispute(ClientId client, TransactionId tx);
  static TransactionRecord resolve(ClientId client, TransactionId tx);
  static TransactionRecord chargeback(ClientId client, TransactionId tx);
};

}  // namespace payments

#endif  // TRANSACTION_HPP_
