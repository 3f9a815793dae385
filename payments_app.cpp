#include "payments_app.hpp"

#include "io/csv_codec.hpp"
#include "observability/logger.hpp"
#include "snapshot.hpp"

#include <fstream>
#include <string>

namespace payments {

PaymentsApp::PaymentsApp(const config::AppConfig& config, io::ErrorSink& errors)
    : config_(config),
      errors_(errors),
      engine_(DisputePolicy{config.allow_withdrawal_disputes}) {}

PaymentsApp::Stats PaymentsApp::run(std::istream& input, std::ostream& output) {
  Stats stats;
  io::TransactionCsvReader reader(input);
  io::ParsedRow row;

  while (reader.next(row)) {
    ++stats.records;
    metrics_.incrementCounter("payments_records_total");

    if (!row.record) {
      ++stats.rejected;
      recordRejection(row.line_number, EngineError{ErrorKind::PARSE_ERROR, 0, 0, row.error});
      continue;
    }

    std::optional<EngineError> error;
    {
      observability::MetricsCollector::Timer timer(metrics_, "payments_apply_seconds");
      error = engine_.apply(*row.record);
    }

    if (error) {
      ++stats.rejected;
      recordRejection(row.line_number, *error);
    } else {
      ++stats.applied;
      metrics_.incrementCounter("payments_records_applied_total");
    }
  }

  io::writeSnapshotCsv(output, buildSnapshot(engine_.accounts()));

  stats.accounts = engine_.accounts().size();
  stats.ledger_entries = engine_.ledger().size();
  metrics_.setGauge("payments_accounts", static_cast<double>(stats.accounts));
  metrics_.setGauge("payments_ledger_entries", static_cast<double>(stats.ledger_entries));

  LOG_BUILDER(observability::LogLevel::INFO, "Processing complete")
      .field("records", stats.records)
      .field("applied", stats.applied)
      .field("rejected", stats.rejected)
      .field("accounts", stats.accounts);

  if (!config_.metrics_file.empty()) {
    exportMetrics();
  }
  return stats;
}

void PaymentsApp::recordRejection(std::size_t line_number, const EngineError& error) {
  metrics_.incrementCounter("payments_records_rejected_total");
  metrics_.incrementCounter(std::string("payments_rejected_") +
                            errorKindMetricName(error.kind) + "_total");

  LOG_BUILDER(observability::LogLevel::DEBUG, "Record rejected")
      .field("line", line_number)
      .field("kind", errorKindName(error.kind))
      .field("client", error.client)
      .field("tx", error.tx)
      .field("detail", error.message);

  errors_.report("line " + std::to_string(line_number) + ": " + error.toString());
}

void PaymentsApp::exportMetrics() const {
  std::ofstream out(config_.metrics_file, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    LOG_BUILDER(observability::LogLevel::WARN, "Cannot write metrics file")
        .field("path", config_.metrics_file);
    return;
  }
  out << metrics_.exportMetrics();
}

}  // namespace payments
