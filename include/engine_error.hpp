#ifndef ENGINE_ERROR_HPP_
#define ENGINE_ERROR_HPP_

#include "transaction.hpp"

#include <string>

namespace payments {

/**
 * Reasons a record is rejected. None of them stop the run.
 */
enum class ErrorKind {
  PARSE_ERROR,
  NEGATIVE_AMOUNT,
  DUPLICATE_TRANSACTION_ID,
  ACCOUNT_LOCKED,
  INSUFFICIENT_FUNDS,
  UNKNOWN_TRANSACTION,
  CLIENT_MISMATCH,
  CANNOT_DISPUTE_TARGET,
  INVALID_DISPUTE_STATE
};

// Stable CamelCase name, e.g. "InsufficientFunds".
const char* errorKindName(ErrorKind kind);

// snake_case name used in metric names, e.g. "insufficient_funds".
const char* errorKindMetricName(ErrorKind kind);

/**
 * A rejected record: what went wrong and which record it was.
 */
struct EngineError {
  ErrorKind kind;
  ClientId client = 0;
  TransactionId tx = 0;
  std::string message;

  // "<Kind>: <message>"
  std::string toString() const;
};

}  // namespace payments

#endif  // ENGINE_ERROR_HPP_
