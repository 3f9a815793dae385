#ifndef ERROR_SINK_HPP_
#define ERROR_SINK_HPP_

#include <fstream>
#include <string>

namespace payments {
namespace io {

/**
 * Destination for diagnostics about rejected or malformed records.
 * Reporting is best effort and must never interrupt processing.
 */
class ErrorSink {
 public:
  virtual ~ErrorSink() = default;

  /**
   * Appends one diagnostic line.
   */
  virtual void report(const std::string& line) = 0;
};

/**
 * Writes diagnostics to a file. If the file cannot be opened every report is
 * discarded.
 */
class FileErrorSink : public ErrorSink {
 public:
  explicit FileErrorSink(const std::string& path);
  ~FileErrorSink() override;

  // Non-copyable
  FileErrorSink(const FileErrorSink&) = delete;
  FileErrorSink& operator=(const FileErrorSink&) = delete;

  void report(const std::string& line) override;

  bool isOpen() const { return out_.is_open(); }

 private:
  std::ofstream out_;
};

}  // namespace io
}  // namespace payments

#endif  // ERROR_SINK_HPP_
