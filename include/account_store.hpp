#ifndef ACCOUNT_STORE_HPP_
#define ACCOUNT_STORE_HPP_

#include "account.hpp"
#include "transaction.hpp"

#include <cstddef>
#include <unordered_map>

namespace payments {

/**
 * All accounts seen during a run, keyed by client id.
 */
class AccountStore {
 public:
  using Map = std::unordered_map<ClientId, Account>;

  // Returns the account for `client`, creating a zeroed one if needed.
  Account& getOrCreate(ClientId client);

  // nullptr when no record for `client` has been applied yet.
  Account* find(ClientId client);
  const Account* find(ClientId client) const;

  std::size_t size() const { return accounts_.size(); }
  const Map& accounts() const { return accounts_; }

 private:
  Map accounts_;
};

}  // namespace payments

#endif  // ACCOUNT_STORE_HPP_
