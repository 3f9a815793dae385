#include "io/csv_codec.hpp"
#include "tools/transaction_generator.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
  const std::string params_path = argc >= 2 ? argv[1] : "generator_params.json";

  try {
    std::ifstream params_file(params_path);
    if (!params_file.is_open()) {
      throw std::runtime_error("Failed to read '" + params_path + "'");
    }

    nlohmann::json document;
    try {
      document = nlohmann::json::parse(params_file);
    } catch (const nlohmann::json::parse_error& e) {
      throw std::runtime_error("Failed to parse '" + params_path + "': " + e.what());
    }

    const auto params = payments::tools::parseGeneratorParams(document);
    payments::tools::validateGeneratorParams(params);

    const auto records = payments::tools::generateTransactions(params);

    std::unique_ptr<std::ofstream> file;
    std::ostream* out = &std::cout;
    if (params.output_file != "-") {
      file = std::make_unique<std::ofstream>(params.output_file, std::ios::out | std::ios::trunc);
      if (!file->is_open()) {
        throw std::runtime_error("Failed to create '" + params.output_file + "'");
      }
      out = file.get();
    }

    *out << payments::io::kTransactionHeader << '\n';
    for (const auto& record : records) {
      *out << payments::io::formatTransactionRow(record) << '\n';
    }
    out->flush();
    if (!*out) {
      throw std::runtime_error("Failed to write generated transactions");
    }

    std::cerr << "Generated " << records.size() << " transactions for "
              << params.account_count << " accounts" << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
