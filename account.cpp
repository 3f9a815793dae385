#include "account.hpp"

#include <stdexcept>
#include <string>

namespace payments {

void Account::requireNonNegative(Amount amount, const char* operation) {
  if (amount.isNegative()) {
    throw std::logic_error(std::string(operation) + " with negative amount " +
                           amount.toString());
  }
}

std::optional<ErrorKind> Account::creditAvailable(Amount amount) {
  if (amount.isNegative()) return ErrorKind::NEGATIVE_AMOUNT;
  if (locked_) return ErrorKind::ACCOUNT_LOCKED;

  available_ += amount;
  return std::nullopt;
}

std::optional<ErrorKind> Account::debitAvailable(Amount amount) {
  if (amount.isNegative()) return ErrorKind::NEGATIVE_AMOUNT;
  if (locked_) return ErrorKind::ACCOUNT_LOCKED;
  if (available_ < amount) return ErrorKind::INSUFFICIENT_FUNDS;

  available_ -= amount;
  return std::nullopt;
}

std::optional<ErrorKind> Account::hold(Amount amount) {
  requireNonNegative(amount, "hold");
  if (available_ < amount) return ErrorKind::INSUFFICIENT_FUNDS;

  available_ -= amount;
  held_ += amount;
  return std::nullopt;
}

void Account::release(Amount amount) {
  requireNonNegative(amount, "release");
  if (held_ < amount) {
    throw std::logic_error("release of " + amount.toString() + " exceeds held " +
                           held_.toString() + " for client " + std::to_string(client_));
  }
  held_ -= amount;
  available_ += amount;
}

void Account::chargeback(Amount amount) {
  requireNonNegative(amount, "chargeback");
  if (held_ < amount) {
    throw std::logic_error("chargeback of " + amount.toString() + " exceeds held " +
                           held_.toString() + " for client " + std::to_string(client_));
  }
  held_ -= amount;
  locked_ = true;
}

}  // namespace payments
