#ifndef LOGGER_HPP_
#define LOGGER_HPP_

#include <nlohmann/json.hpp>

#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace payments {
namespace observability {

/**
 * Log levels for structured logging.
 */
enum class LogLevel {
  DEBUG,
  INFO,
  WARN,
  ERROR,
  FATAL
};

// Accepts the upper-case level names, e.g. "WARN".
std::optional<LogLevel> parseLogLevel(std::string_view name);

/**
 * Structured logger writing one JSON object per line.
 * Writes to std::cerr by default since std::cout carries the account output.
 */
class Logger {
 public:
  static Logger& getInstance();

  // Non-copyable
  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  // Set minimum log level
  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  bool isEnabled(LogLevel level) const { return level >= getLogLevel(); }

  // Set output stream (default: std::cerr)
  void setOutputStream(std::ostream& stream);

  void debug(const std::string& message, const std::string& component = "");
  void info(const std::string& message, const std::string& component = "");
  void warn(const std::string& message, const std::string& component = "");
  void error(const std::string& message, const std::string& component = "");
  void fatal(const std::string& message, const std::string& component = "");

  // Structured logging with key-value pairs, emitted on destruction.
  class LogBuilder {
   public:
    LogBuilder(LogLevel level, const std::string& message,
               const std::string& component = "");

    ~LogBuilder();

    template <typename T>
    LogBuilder& field(const std::string& key, const T& value) {
      fields_[key] = value;
      return *this;
    }

   private:
    LogLevel level_;
    std::string message_;
    std::string component_;
    nlohmann::ordered_json fields_ = nlohmann::ordered_json::object();
  };

 private:
  Logger();
  ~Logger() = default;

  void log(LogLevel level, const std::string& message,
           const std::string& component,
           const nlohmann::ordered_json& fields = nlohmann::ordered_json::object());

  std::string levelToString(LogLevel level) const;
  std::string getCurrentTimestamp() const;
  std::string getThreadId() const;

  LogLevel min_level_;
  std::ostream* output_stream_;
  mutable std::mutex mutex_;
};

// Convenience macros for logging
#define LOG_DEBUG(msg) payments::observability::Logger::getInstance().debug(msg, __func__)
#define LOG_INFO(msg) payments::observability::Logger::getInstance().info(msg, __func__)
#define LOG_WARN(msg) payments::observability::Logger::getInstance().warn(msg, __func__)
#define LOG_ERROR(msg) payments::observability::Logger::getInstance().error(msg, __func__)
#define LOG_FATAL(msg) payments::observability::Logger::getInstance().fatal(msg, __func__)

// Structured logging helper
#define LOG_BUILDER(level, msg) \
  payments::observability::Logger::LogBuilder(level, msg, __func__)

}  // namespace observability
}  // namespace payments

#endif  // LOGGER_HPP_
