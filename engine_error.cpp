#include "engine_error.hpp"

namespace payments {

const char* errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PARSE_ERROR: return "ParseError";
    case ErrorKind::NEGATIVE_AMOUNT: return "NegativeAmount";
    case ErrorKind::DUPLICATE_TRANSACTION_ID: return "DuplicateTransactionId";
    case ErrorKind::ACCOUNT_LOCKED: return "AccountLocked";
    case ErrorKind::INSUFFICIENT_FUNDS: return "InsufficientFunds";
    case ErrorKind::UNKNOWN_TRANSACTION: return "UnknownTransaction";
    case ErrorKind::CLIENT_MISMATCH: return "ClientMismatch";
    case ErrorKind::CANNOT_DISPUTE_TARGET: return "CannotDisputeTarget";
    case ErrorKind::INVALID_DISPUTE_STATE: return "InvalidDisputeState";
  }
  return "Unknown";
}

const char* errorKindMetricName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::PARSE_ERROR: return "parse_error";
    case ErrorKind::NEGATIVE_AMOUNT: return "negative_amount";
    case ErrorKind::DUPLICATE_TRANSACTION_ID: return "duplicate_transaction_id";
    case ErrorKind::ACCOUNT_LOCKED: return "account_locked";
    case ErrorKind::INSUFFICIENT_FUNDS: return "insufficient_funds";
    case ErrorKind::UNKNOWN_TRANSACTION: return "unknown_transaction";
    case ErrorKind::CLIENT_MISMATCH: return "client_mismatch";
    case ErrorKind::CANNOT_DISPUTE_TARGET: return "cannot_dispute_target";
    case ErrorKind::INVALID_DISPUTE_STATE: return "invalid_dispute_state";
  }
  return "unknown";
}

std::string EngineError::toString() const {
  return std::string(errorKindName(kind)) + ": " + message;
}

}  // namespace payments
