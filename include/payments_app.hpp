#ifndef PAYMENTS_APP_HPP_
#define PAYMENTS_APP_HPP_

#include "config/config_loader.hpp"
#include "engine.hpp"
#include "engine_error.hpp"
#include "io/error_sink.hpp"
#include "observability/metrics.hpp"

#include <cstddef>
#include <istream>
#include <ostream>

namespace payments {

/**
 * One processing run: reads transaction CSV, applies every record in order,
 * reports rejections to the error sink and writes the account snapshot.
 */
class PaymentsApp {
 public:
  PaymentsApp(const config::AppConfig& config, io::ErrorSink& errors);

  // Non-copyable
  PaymentsApp(const PaymentsApp&) = delete;
  PaymentsApp& operator=(const PaymentsApp&) = delete;

  struct Stats {
    std::size_t records = 0;
    std::size_t applied = 0;
    std::size_t rejected = 0;
    std::size_t accounts = 0;
    std::size_t ledger_entries = 0;
  };

  /**
   * Processes all of `input` and writes the snapshot CSV to `output`.
   * Rejected records never stop the run. Throws std::runtime_error if
   * `input` fails at the stream level.
   */
  Stats run(std::istream& input, std::ostream& output);

  const Engine& engine() const { return engine_; }
  const observability::MetricsCollector& metrics() const { return metrics_; }

 private:
  void recordRejection(std::size_t line_number, const EngineError& error);
  void exportMetrics() const;

  config::AppConfig config_;
  io::ErrorSink& errors_;
  Engine engine_;
  observability::MetricsCollector metrics_;
};

}  // namespace payments

#endif  // PAYMENTS_APP_HPP_
