#ifndef METRICS_HPP_
#define METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace payments {
namespace observability {

/**
 * Counters, gauges and histograms for one run, exported in Prometheus text
 * format.
 */
class MetricsCollector {
 public:
  MetricsCollector() = default;

  // Non-copyable
  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);
  double counterValue(const std::string& name) const;

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);
  double gaugeValue(const std::string& name) const;

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);
  std::size_t histogramCount(const std::string& name) const;

  // Records elapsed seconds into a histogram on destruction.
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus format
  std::string exportMetrics() const;

  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    std::size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::size_t count{0};
    double sum{0.0};
  };

  mutable std::mutex mutex_;
  // Ordered so that exports are stable between runs.
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;

  // Per-record apply latencies are sub-millisecond.
  static std::vector<double> defaultBuckets();
};

}  // namespace observability
}  // namespace payments

#endif  // METRICS_HPP_
