#include "tools/transaction_generator.hpp"

#include "amount.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <unordered_map>

namespace payments {
namespace tools {

namespace {

struct Candidate {
  ClientId client;
  TransactionId tx;
};

bool isProbability(double value) {
  return value >= 0.0 && value <= 1.0;
}

Amount toAmount(double value) {
  return Amount::fromUnits(std::llround(value * static_cast<double>(Amount::kScale)));
}

/**
 * Uniform amounts in [low, high] on the grid of the configured precision.
 */
class AmountSampler {
 public:
  explicit AmountSampler(int precision) : step_(1) {
    for (int i = precision; i < Amount::kScaleDigits; ++i) step_ *= 10;
  }

  Amount sample(std::mt19937_64& rng, Amount low, Amount high) const {
    std::int64_t first = (low.units() + step_ - 1) / step_;
    std::int64_t last = high.units() / step_;
    if (last < first) last = first;
    std::uniform_int_distribution<std::int64_t> dist(first, last);
    return Amount::fromUnits(dist(rng) * step_);
  }

 private:
  std::int64_t step_;
};

}  // namespace

GeneratorParams parseGeneratorParams(const nlohmann::json& document) {
  GeneratorParams params;
  try {
    params.account_count = document.at("accounts").at("count").get<std::int64_t>();

    const auto& transactions = document.at("transactions");
    params.min_per_account = transactions.at("min_per_account").get<std::int64_t>();
    params.max_per_account = transactions.at("max_per_account").get<std::int64_t>();

    const auto& amounts = document.at("amounts");
    params.amount_min = amounts.at("min").get<double>();
    params.amount_max = amounts.at("max").get<double>();
    params.amount_precision = amounts.at("precision").get<int>();

    const auto& withdrawals = document.at("withdrawals");
    params.withdrawal_probability = withdrawals.at("probability").get<double>();
    params.overdraw_probability = withdrawals.at("overdraw_probability").get<double>();

    const auto& disputes = document.at("disputes");
    params.dispute_probability = disputes.at("probability").get<double>();
    params.resolution_probability = disputes.at("resolution_probability").get<double>();

    const auto& output = document.at("output");
    params.output_file = output.at("file").get<std::string>();
    auto seed = output.find("seed");
    if (seed != output.end() && !seed->is_null()) {
      params.seed = seed->get<std::uint64_t>();
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error(std::string("Failed to parse generator params: ") + e.what());
  }
  return params;
}

void validateGeneratorParams(const GeneratorParams& params) {
  if (params.account_count < 1 ||
      params.account_count > std::numeric_limits<ClientId>::max()) {
    throw std::invalid_argument("accounts.count must be between 1 and 65535");
  }
  if (params.min_per_account < 0) {
    throw std::invalid_argument("transactions.min_per_account must be >= 0");
  }
  if (params.max_per_account > std::numeric_limits<TransactionId>::max()) {
    throw std::invalid_argument("transactions.max_per_account must be <= 4294967295");
  }
  if (params.min_per_account > params.max_per_account) {
    throw std::invalid_argument("transactions.min_per_account must be <= max_per_account");
  }
  if (params.amount_min > params.amount_max) {
    throw std::invalid_argument("amounts.min must be <= amounts.max");
  }
  if (params.amount_min < 0.0) {
    throw std::invalid_argument("amounts.min must be >= 0");
  }
  if (params.amount_precision < 0 || params.amount_precision > Amount::kScaleDigits) {
    throw std::invalid_argument("amounts.precision must be between 0 and 4");
  }
  if (!isProbability(params.withdrawal_probability)) {
    throw std::invalid_argument("withdrawals.probability must be between 0.0 and 1.0");
  }
  if (!isProbability(params.overdraw_probability)) {
    throw std::invalid_argument("withdrawals.overdraw_probability must be between 0.0 and 1.0");
  }
  if (!isProbability(params.dispute_probability)) {
    throw std::invalid_argument("disputes.probability must be between 0.0 and 1.0");
  }
  if (!isProbability(params.resolution_probability)) {
    throw std::invalid_argument("disputes.resolution_probability must be between 0.0 and 1.0");
  }
}

std::vector<TransactionRecord> generateTransactions(const GeneratorParams& params) {
  std::mt19937_64 rng(params.seed ? *params.seed : std::random_device{}());
  std::uniform_real_distribution<double> chance(0.0, 1.0);

  const AmountSampler sampler(params.amount_precision);
  const Amount amount_min = toAmount(params.amount_min);
  const Amount amount_max = toAmount(params.amount_max);

  std::vector<TransactionRecord> records;
  TransactionId next_tx = 1;

  // Estimated available balance per client, used to keep most withdrawals valid.
  std::unordered_map<ClientId, Amount> available;
  std::unordered_map<ClientId, std::uint32_t> remaining;
  std::vector<ClientId> active;

  std::uniform_int_distribution<std::uint32_t> per_account(
      static_cast<std::uint32_t>(params.min_per_account),
      static_cast<std::uint32_t>(params.max_per_account));
  for (std::int64_t client = 1; client <= params.account_count; ++client) {
    const ClientId id = static_cast<ClientId>(client);
    const std::uint32_t count = per_account(rng);
    if (count > 0) {
      remaining[id] = count;
      active.push_back(id);
    }
  }

  std::vector<Candidate> disputable;

  while (!active.empty()) {
    std::uniform_int_distribution<std::size_t> pick(0, active.size() - 1);
    const std::size_t index = pick(rng);
    const ClientId client = active[index];
    Amount& balance = available[client];

    if (chance(rng) < params.withdrawal_probability) {
      Amount amount;
      if (balance <= Amount::zero() || chance(rng) < params.overdraw_probability) {
        amount = sampler.sample(rng, amount_min, amount_max);
      } else {
        const Amount high = std::min(balance, amount_max);
        const Amount low = std::min(amount_min, high);
        amount = sampler.sample(rng, low, high);
      }
      records.push_back(TransactionRecord::withdrawal(client, next_tx, amount));
      if (amount <= balance) {
        balance -= amount;
      }
    } else {
      const Amount amount = sampler.sample(rng, amount_min, amount_max);
      records.push_back(TransactionRecord::deposit(client, next_tx, amount));
      balance += amount;
      if (chance(rng) < params.dispute_probability) {
        disputable.push_back({client, next_tx});
      }
    }

    ++next_tx;
    if (--remaining[client] == 0) {
      active[index] = active.back();
      active.pop_back();
    }
  }

  std::shuffle(disputable.begin(), disputable.end(), rng);
  for (const auto& candidate : disputable) {
    records.push_back(TransactionRecord::dispute(candidate.client, candidate.tx));
  }
  for (const auto& candidate : disputable) {
    if (chance(rng) < params.resolution_probability) {
      records.push_back(TransactionRecord::resolve(candidate.client, candidate.tx));
    } else {
      records.push_back(TransactionRecord::chargeback(candidate.client, candidate.tx));
    }
  }

  return records;
}

}  // namespace tools
}  // namespace payments
