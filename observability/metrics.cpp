#include "observability/metrics.hpp"

#include <ostream>
#include <sstream>

namespace ledger {
namespace observability {

namespace {

// Prometheus label values escape backslash, quote and newline.
std::string escapeLabelValue(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"': out += "\\\""; break;
      case '\n': out += "\\n"; break;
      default: out += c;
    }
  }
  return out;
}

std::string seriesName(const std::string& name, const Labels& labels) {
  if (labels.empty()) return name;

  std::string out = name + "{";
  bool first = true;
  for (const auto& [key, value] : labels) {
    if (!first) out += ",";
    out += key + "=\"" + escapeLabelValue(value) + "\"";
    first = false;
  }
  return out + "}";
}

double valueOf(const std::map<std::string, std::map<Labels, double>>& families,
               const std::string& name, const Labels& labels) {
  auto family = families.find(name);
  if (family == families.end()) return 0.0;
  auto series = family->second.find(labels);
  return series == family->second.end() ? 0.0 : series->second;
}

void registerLedgerMetrics(MetricsCollector& metrics) {
  metrics.describe("ledger_operations_total",
                   "Account operations by operation and outcome (committed or error kind)");
  metrics.describe("ledger_requests_total", "Requests answered, by response status");
  metrics.describe("ledger_request_duration_seconds", "Time to answer one request");
  metrics.describe("ledger_transfer_duration_seconds", "Time to run one transfer");
  metrics.describe("ledger_accrual_duration_seconds", "Time to run one accrual batch");
  metrics.describe("ledger_accrual_runs_total", "Interest accrual batches run");
  metrics.describe("ledger_accrual_accounts_total",
                   "Accounts visited by accrual, by result");
  metrics.describe("ledger_connections_total", "TCP connections accepted");
  metrics.describe("ledger_active_connections", "TCP connections currently open");
}

}  // namespace

void MetricsCollector::describe(const std::string& name, const std::string& help) {
  std::lock_guard<std::mutex> lock(mutex_);
  help_[name] = help;
}

void MetricsCollector::incrementCounter(const std::string& name, const Labels& labels,
                                        double value) {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_[name][labels] += value;
}

double MetricsCollector::counterValue(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return valueOf(counters_, name, labels);
}

void MetricsCollector::setGauge(const std::string& name, double value, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name][labels] = value;
}

void MetricsCollector::addGauge(const std::string& name, double delta, const Labels& labels) {
  std::lock_guard<std::mutex> lock(mutex_);
  gauges_[name][labels] += delta;
}

double MetricsCollector::gaugeValue(const std::string& name, const Labels& labels) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return valueOf(gauges_, name, labels);
}

const std::vector<double>& MetricsCollector::bucketBounds() {
  // Seconds; ledger units are milliseconds when healthy and hit the lock
  // timeout when not.
  static const std::vector<double> kBounds = {0.0005, 0.001, 0.0025, 0.005, 0.01, 0.025,
                                              0.05,   0.1,   0.25,   0.5,   1.0,  2.5,
                                              5.0,    10.0};
  return kBounds;
}

void MetricsCollector::observeHistogram(const std::string& name, double seconds) {
  const auto& bounds = bucketBounds();

  std::lock_guard<std::mutex> lock(mutex_);
  Histogram& hist = histograms_[name];
  if (hist.bucket_counts.empty()) {
    hist.bucket_counts.assign(bounds.size() + 1, 0);
  }

  size_t bucket = 0;
  while (bucket < bounds.size() && seconds > bounds[bucket]) ++bucket;
  ++hist.bucket_counts[bucket];
  ++hist.count;
  hist.sum += seconds;
}

size_t MetricsCollector::histogramCount(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = histograms_.find(name);
  return it == histograms_.end() ? 0 : it->second.count;
}

MetricsCollector::Timer::Timer(MetricsCollector& collector, const std::string& name)
    : collector_(collector), name_(name), start_(std::chrono::steady_clock::now()) {
}

MetricsCollector::Timer::~Timer() {
  std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
  collector_.observeHistogram(name_, elapsed.count());
}

void MetricsCollector::writeHeader(std::ostream& out, const std::string& name,
                                   const char* type) const {
  auto help = help_.find(name);
  if (help != help_.end()) {
    out << "# HELP " << name << " " << help->second << "\n";
  }
  out << "# TYPE " << name << " " << type << "\n";
}

std::string MetricsCollector::exportMetrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::ostringstream out;

  for (const auto& [name, series] : counters_) {
    writeHeader(out, name, "counter");
    for (const auto& [labels, value] : series) {
      out << seriesName(name, labels) << " " << value << "\n";
    }
  }

  for (const auto& [name, series] : gauges_) {
    writeHeader(out, name, "gauge");
    for (const auto& [labels, value] : series) {
      out << seriesName(name, labels) << " " << value << "\n";
    }
  }

  const auto& bounds = bucketBounds();
  for (const auto& [name, hist] : histograms_) {
    writeHeader(out, name, "histogram");
    size_t cumulative = 0;
    for (size_t i = 0; i < hist.bucket_counts.size(); ++i) {
      cumulative += hist.bucket_counts[i];
      out << name << "_bucket{le=\"";
      if (i < bounds.size()) {
        out << bounds[i];
      } else {
        out << "+Inf";
      }
      out << "\"} " << cumulative << "\n";
    }
    out << name << "_sum " << hist.sum << "\n";
    out << name << "_count " << hist.count << "\n";
  }

  return out.str();
}

void MetricsCollector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
  gauges_.clear();
  histograms_.clear();
}

MetricsCollector& getGlobalMetrics() {
  static MetricsCollector* metrics = [] {
    auto* collector = new MetricsCollector();
    registerLedgerMetrics(*collector);
    return collector;
  }();
  return *metrics;
}

}  // namespace observability
}  // namespace ledger
