#ifndef TRANSACTION_GENERATOR_HPP_
#define TRANSACTION_GENERATOR_HPP_

#include "transaction.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace payments {
namespace tools {

/**
 * Parameters for synthetic input generation.
 */
struct GeneratorParams {
  // Read wide so that out-of-range values are rejected, not truncated.
  std::int64_t account_count = 10;
  std::int64_t min_per_account = 5;
  std::int64_t max_per_account = 20;

  double amount_min = 1.0;
  double amount_max = 1000.0;
  int amount_precision = 4;  // fractional digits, at most 4

  double withdrawal_probability = 0.3;
  double overdraw_probability = 0.05;  // withdrawal ignores the tracked balance

  double dispute_probability = 0.05;    // per deposit
  double resolution_probability = 0.5;  // resolve rather than chargeback

  std::string output_file = "-";  // "-" is stdout
  std::optional<std::uint64_t> seed;
};

/**
 * Reads the sectioned parameter document:
 *   {"accounts": {"count"}, "transactions": {"min_per_account", "max_per_account"},
 *    "amounts": {"min", "max", "precision"},
 *    "withdrawals": {"probability", "overdraw_probability"},
 *    "disputes": {"probability", "resolution_probability"},
 *    "output": {"file", "seed"?}}
 * Throws std::runtime_error on missing or mistyped keys.
 */
GeneratorParams parseGeneratorParams(const nlohmann::json& document);

/**
 * Throws std::invalid_argument describing the first inconsistent parameter.
 */
void validateGeneratorParams(const GeneratorParams& params);

/**
 * Generates records with sequential tx ids from 1. Deposits and withdrawals
 * for randomly chosen clients come first, then disputes of sampled deposits,
 * then one resolve or chargeback per dispute. Same seed, same output.
 */
std::vector<TransactionRecord> generateTransactions(const GeneratorParams& params);

}  // namespace tools
}  // namespace payments

#endif  // TRANSACTION_GENERATOR_HPP_
