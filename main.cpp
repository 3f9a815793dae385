#include "config/config_loader.hpp"
#include "io/error_sink.hpp"
#include "observability/logger.hpp"
#include "payments_app.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

void usage(const char* prog) {
  std::cerr << "Usage: " << prog << " <transactions.csv> [config.json]" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2 || argc > 3) {
    usage(argv[0]);
    return 1;
  }

  const std::string input_path = argv[1];

  try {
    payments::config::AppConfig config;
    if (argc == 3) {
      config = payments::config::loadConfig(argv[2]);
    }
    payments::observability::Logger::getInstance().setLogLevel(config.log_level);

    LOG_BUILDER(payments::observability::LogLevel::INFO, "Starting transaction processing")
        .field("input", input_path)
        .field("error_log", config.error_log)
        .field("allow_withdrawal_disputes", config.allow_withdrawal_disputes);

    std::ifstream input(input_path);
    if (!input.is_open()) {
      throw std::runtime_error("Failed to open '" + input_path + "'");
    }

    payments::io::FileErrorSink errors(config.error_log);
    payments::PaymentsApp app(config, errors);
    app.run(input, std::cout);
  } catch (const std::exception& e) {
    LOG_ERROR(std::string("Fatal error: ") + e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
