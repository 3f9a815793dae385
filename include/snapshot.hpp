#ifndef SNAPSHOT_HPP_
#define SNAPSHOT_HPP_

#include "account_store.hpp"
#include "amount.hpp"
#include "transaction.hpp"

#include <vector>

namespace payments {

/**
 * Final state of one client as written to the output.
 */
struct AccountSnapshot {
  ClientId client = 0;
  Amount available;
  Amount held;
  Amount total;
  bool locked = false;
};

// One row per account, ascending client id.
std::vector<AccountSnapshot> buildSnapshot(const AccountStore& accounts);

}  // namespace payments

#endif  // SNAPSHOT_HPP_
