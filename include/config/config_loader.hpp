#ifndef CONFIG_LOADER_HPP_
#define CONFIG_LOADER_HPP_

#include "observability/logger.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace payments {
namespace config {

/**
 * Run settings. Every field has a default, so an empty JSON object is a
 * valid configuration.
 */
struct AppConfig {
  // Where rejected records are described, one per line.
  std::string error_log = "errors.log";
  observability::LogLevel log_level = observability::LogLevel::WARN;
  bool allow_withdrawal_disputes = false;
  // Prometheus text export at end of run; empty disables it.
  std::string metrics_file;
};

/**
 * Builds a configuration from a JSON object. Unknown keys are ignored.
 * Throws std::runtime_error on a wrongly typed value or unknown log level.
 */
AppConfig parseConfig(const nlohmann::json& document);

/**
 * Reads and parses a JSON configuration file.
 * Throws std::runtime_error if the file cannot be read or is invalid.
 */
AppConfig loadConfig(const std::string& path);

}  // namespace config
}  // namespace payments

#endif  // CONFIG_LOADER_HPP_
