#include "account_store.hpp"

#include "observability/logger.hpp"

#include <string>

namespace payments {

Account& AccountStore::getOrCreate(ClientId client) {
  auto [it, inserted] = accounts_.try_emplace(client, client);
  if (inserted) {
    LOG_DEBUG("Created account for client " + std::to_string(client));
  }
  return it->second;
}

Account* AccountStore::find(ClientId client) {
  auto it = accounts_.find(client);
  return it == accounts_.end() ? nullptr : &it->second;
}

const Account* AccountStore::find(ClientId client) const {
  auto it = accounts_.find(client);
  return it == accounts_.end() ? nullptr : &it->second;
}

}  // namespace payments
