#include "io/error_sink.hpp"

#include "observability/logger.hpp"

namespace payments {
namespace io {

FileErrorSink::FileErrorSink(const std::string& path) : out_(path, std::ios::out | std::ios::trunc) {
  if (!out_.is_open()) {
    LOG_BUILDER(observability::LogLevel::DEBUG, "Cannot open error log, discarding diagnostics")
        .field("path", path);
  }
}

FileErrorSink::~FileErrorSink() {
  if (out_.is_open()) {
    out_.flush();
  }
}

void FileErrorSink::report(const std::string& line) {
  if (!out_.is_open()) return;
  out_ << line << '\n';
}

}  // namespace io
}  // namespace payments
