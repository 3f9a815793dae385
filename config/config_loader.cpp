#include "config/config_loader.hpp"

#include <fstream>
#include <stdexcept>

namespace payments {
namespace config {

namespace {

template <typename T>
void readOptional(const nlohmann::json& document, const char* key, T& out) {
  auto it = document.find(key);
  if (it == document.end() || it->is_null()) return;
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::type_error& e) {
    throw std::runtime_error(std::string("config key '") + key + "': " + e.what());
  }
}

}  // namespace

AppConfig parseConfig(const nlohmann::json& document) {
  if (!document.is_object()) {
    throw std::runtime_error("config must be a JSON object");
  }

  AppConfig config;
  readOptional(document, "error_log", config.error_log);
  readOptional(document, "allow_withdrawal_disputes", config.allow_withdrawal_disputes);
  readOptional(document, "metrics_file", config.metrics_file);

  std::string level_name;
  readOptional(document, "log_level", level_name);
  if (!level_name.empty()) {
    auto level = observability::parseLogLevel(level_name);
    if (!level) {
      throw std::runtime_error("config key 'log_level': unknown level '" + level_name + "'");
    }
    config.log_level = *level;
  }
  return config;
}

AppConfig loadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open config '" + path + "'");
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(in);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::runtime_error("Failed to parse config '" + path + "': " + e.what());
  }
  return parseConfig(document);
}

}  // namespace config
}  // namespace payments
