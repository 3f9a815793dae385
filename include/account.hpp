#ifndef ACCOUNT_HPP_
#define ACCOUNT_HPP_

#include "amount.hpp"
#include "engine_error.hpp"
#include "transaction.hpp"

#include <optional>

namespace payments {

/**
 * Balance state of one client.
 *
 * Mutators return nullopt on success or the reason for rejection; a rejected
 * call leaves the account untouched. total() is always available + held.
 */
class Account {
 public:
  explicit Account(ClientId client) : client_(client) {}

  ClientId client() const { return client_; }
  Amount available() const { return available_; }
  Amount held() const { return held_; }
  Amount total() const { return available_ + held_; }
  bool locked() const { return locked_; }

  /**
   * Adds `amount` to available funds.
   * Rejects with NEGATIVE_AMOUNT or ACCOUNT_LOCKED.
   */
  std::optional<ErrorKind> creditAvailable(Amount amount);

  /**
   * Removes `amount` from available funds.
   * Rejects with NEGATIVE_AMOUNT, ACCOUNT_LOCKED or INSUFFICIENT_FUNDS.
   */
  std::optional<ErrorKind> debitAvailable(Amount amount);

  /**
   * Moves `amount` from available to held. Allowed on locked accounts.
   * Rejects with INSUFFICIENT_FUNDS; a negative amount is a logic_error.
   */
  std::optional<ErrorKind> hold(Amount amount);

  // Amounts for release and chargeback come from the ledger. Both throw
  // std::logic_error when held funds do not cover them.

  // Moves `amount` from held back to available.
  void release(Amount amount);

  // Removes `amount` from held permanently and locks the account.
  void chargeback(Amount amount);

 private:
  static void requireNonNegative(Amount amount, const char* operation);

  ClientId client_;
  Amount available_;
  Amount held_;
  bool locked_ = false;
};

}  // namespace payments

#endif  // ACCOUNT_HPP_
