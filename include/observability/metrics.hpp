#ifndef LEDGER_METRICS_HPP_
#define LEDGER_METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace ledger {
namespace observability {

using Labels = std::map<std::string, std::string>;

/**
 * Labelled counters, gauges and latency histograms, exported in Prometheus
 * text format. Families and series are kept sorted so exports are stable.
 */
class MetricsCollector {
 public:
  MetricsCollector() = default;

  // Non-copyable
  MetricsCollector(const MetricsCollector&) = delete;
  MetricsCollector& operator=(const MetricsCollector&) = delete;

  // HELP line for a metric family.
  void describe(const std::string& name, const std::string& help);

  void incrementCounter(const std::string& name, const Labels& labels = {}, double value = 1.0);
  double counterValue(const std::string& name, const Labels& labels = {}) const;

  void setGauge(const std::string& name, double value, const Labels& labels = {});
  void addGauge(const std::string& name, double delta, const Labels& labels = {});
  double gaugeValue(const std::string& name, const Labels& labels = {}) const;

  void observeHistogram(const std::string& name, double seconds);
  size_t histogramCount(const std::string& name) const;

  /**
   * Records its own lifetime, in seconds, into a histogram.
   */
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  std::string exportMetrics() const;

  // Drops every series; HELP text is kept.
  void reset();

 private:
  struct Histogram {
    std::vector<size_t> bucket_counts;  // per bound, non-cumulative; last is +Inf
    size_t count = 0;
    double sum = 0.0;
  };

  using Series = std::map<Labels, double>;

  void writeHeader(std::ostream& out, const std::string& name, const char* type) const;

  static const std::vector<double>& bucketBounds();

  mutable std::mutex mutex_;
  std::map<std::string, Series> counters_;
  std::map<std::string, Series> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;
};

/**
 * Process-wide collector, with the HELP text of every ledger metric family
 * registered.
 */
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace ledger

#endif  // LEDGER_METRICS_HPP_
