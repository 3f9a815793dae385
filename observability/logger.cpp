#include "observability/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace payments {
namespace observability {

std::optional<LogLevel> parseLogLevel(std::string_view name) {
  if (name == "DEBUG") return LogLevel::DEBUG;
  if (name == "INFO") return LogLevel::INFO;
  if (name == "WARN") return LogLevel::WARN;
  if (name == "ERROR") return LogLevel::ERROR;
  if (name == "FATAL") return LogLevel::FATAL;
  return std::nullopt;
}

Logger& Logger::getInstance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : min_level_(LogLevel::WARN), output_stream_(&std::cerr) {}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(mutex_);
  min_level_ = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return min_level_;
}

void Logger::setOutputStream(std::ostream& stream) {
  std::lock_guard<std::mutex> lock(mutex_);
  output_stream_ = &stream;
}

void Logger::debug(const std::string& message, const std::string& component) {
  log(LogLevel::DEBUG, message, component);
}

void Logger::info(const std::string& message, const std::string& component) {
  log(LogLevel::INFO, message, component);
}

void Logger::warn(const std::string& message, const std::string& component) {
  log(LogLevel::WARN, message, component);
}

void Logger::error(const std::string& message, const std::string& component) {
  log(LogLevel::ERROR, message, component);
}

void Logger::fatal(const std::string& message, const std::string& component) {
  log(LogLevel::FATAL, message, component);
}

Logger::LogBuilder::LogBuilder(LogLevel level, const std::string& message,
                               const std::string& component)
    : level_(level), message_(message), component_(component) {}

Logger::LogBuilder::~LogBuilder() {
  Logger::getInstance().log(level_, message_, component_, fields_);
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::string& component,
                 const nlohmann::ordered_json& fields) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < min_level_) return;

  nlohmann::ordered_json entry;
  entry["timestamp"] = getCurrentTimestamp();
  entry["level"] = levelToString(level);
  entry["thread"] = getThreadId();
  entry["message"] = message;

  if (!component.empty()) {
    entry["component"] = component;
  }

  for (const auto& [key, value] : fields.items()) {
    entry[key] = value;
  }

  // Replace invalid UTF-8 rather than throw from a destructor path.
  *output_stream_ << entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
                  << '\n';
  output_stream_->flush();
}

std::string Logger::levelToString(LogLevel level) const {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARN: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::FATAL: return "FATAL";
    default: return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
      now.time_since_epoch()) % 1000000;

  std::stringstream ss;
  ss << std::put_time(std::gmtime(&time_t), "%Y-%m-%dT%H:%M:%S")
     << "." << std::setfill('0') << std::setw(6) << microseconds.count() << "Z";
  return ss.str();
}

std::string Logger::getThreadId() const {
  std::stringstream ss;
  ss << std::this_thread::get_id();
  return ss.str();
}

}  // namespace observability
}  // namespace payments
