#include "snapshot.hpp"

#include <algorithm>

namespace payments {

std::vector<AccountSnapshot> buildSnapshot(const AccountStore& accounts) {
  std::vector<AccountSnapshot> rows;
  rows.reserve(accounts.size());

  for (const auto& [client, account] : accounts.accounts()) {
    rows.push_back({client, account.available(), account.held(), account.total(),
                    account.locked()});
  }

  std::sort(rows.begin(), rows.end(),
            [](const AccountSnapshot& a, const AccountSnapshot& b) { return a.client < b.client; });
  return rows;
}

}  // namespace payments
