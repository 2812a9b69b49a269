#include "observability/logger.hpp"
#include "observability/metrics.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace ledger::observability;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    previous_level_ = Logger::instance().level();
    Logger::instance().setOutput(output_);
    Logger::instance().setLevel(LogLevel::INFO);
  }

  void TearDown() override {
    Logger::instance().setOutput(std::cout);
    Logger::instance().setLevel(previous_level_);
  }

  nlohmann::json lastLine() {
    std::string line;
    std::string last;
    std::istringstream lines(output_.str());
    while (std::getline(lines, line)) last = line;
    return nlohmann::json::parse(last);
  }

  std::ostringstream output_;
  LogLevel previous_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  Logger::instance().write(LogLevel::INFO, "Deposit committed", "account_service", "req-9");

  nlohmann::json entry = lastLine();
  EXPECT_EQ(entry["level"], "INFO");
  EXPECT_EQ(entry["message"], "Deposit committed");
  EXPECT_EQ(entry["component"], "account_service");
  EXPECT_EQ(entry["correlation_id"], "req-9");
  EXPECT_TRUE(entry.contains("timestamp"));
}

TEST_F(LoggerTest, BuilderAddsFields) {
  LogEvent(LogLevel::WARN, "Transfer rolled back", "transfer_coordinator")
      .field("amount", ledger::Money::fromCents(30000))
      .field("attempt", 2)
      .field("retried", false)
      .error(ledger::LedgerError(ledger::ErrorKind::InsufficientFunds, "balance too low"));

  nlohmann::json entry = lastLine();
  EXPECT_EQ(entry["level"], "WARN");
  EXPECT_EQ(entry["amount"], "300.00");
  EXPECT_EQ(entry["attempt"], 2);
  EXPECT_EQ(entry["retried"], false);
  EXPECT_EQ(entry["error_kind"], "INSUFFICIENT_FUNDS");
  EXPECT_EQ(entry["reason"], "balance too low");
}

TEST_F(LoggerTest, FiltersBelowLevel) {
  Logger::instance().write(LogLevel::DEBUG, "hidden");
  LogEvent(LogLevel::DEBUG, "also hidden").field("amount", 1);
  EXPECT_TRUE(output_.str().empty());
  EXPECT_FALSE(Logger::instance().enabled(LogLevel::DEBUG));
  EXPECT_TRUE(Logger::instance().enabled(LogLevel::ERROR));

  EXPECT_EQ(parseLogLevel("Warning"), LogLevel::WARN);
  EXPECT_FALSE(parseLogLevel("verbose").has_value());
  EXPECT_STREQ(toString(LogLevel::ERROR), "ERROR");
}

TEST(MetricsTest, LabelledCountersAreSeparateSeries) {
  MetricsCollector metrics;
  metrics.describe("ledger_operations_total", "Account operations");
  metrics.incrementCounter("ledger_operations_total",
                           {{"operation", "deposit"}, {"outcome", "committed"}});
  metrics.incrementCounter("ledger_operations_total",
                           {{"outcome", "committed"}, {"operation", "deposit"}}, 2);
  metrics.incrementCounter("ledger_operations_total",
                           {{"operation", "withdrawal"}, {"outcome", "INSUFFICIENT_FUNDS"}});

  EXPECT_EQ(metrics.counterValue("ledger_operations_total",
                                 {{"operation", "deposit"}, {"outcome", "committed"}}),
            3);
  EXPECT_EQ(metrics.counterValue("ledger_operations_total"), 0);
  EXPECT_EQ(metrics.counterValue("never_touched"), 0);

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP ledger_operations_total Account operations\n"
                      "# TYPE ledger_operations_total counter\n"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_operations_total{operation=\"deposit\",outcome=\"committed\"} 3"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_operations_total{operation=\"withdrawal\","
                      "outcome=\"INSUFFICIENT_FUNDS\"} 1"),
            std::string::npos);
}

TEST(MetricsTest, LabelValuesAreEscaped) {
  MetricsCollector metrics;
  metrics.incrementCounter("ledger_requests_total", {{"path", "say \"hi\"\n"}});
  EXPECT_NE(metrics.exportMetrics().find("ledger_requests_total{path=\"say \\\"hi\\\"\\n\"} 1"),
            std::string::npos);
}

TEST(MetricsTest, GaugesTrackUpAndDown) {
  MetricsCollector metrics;
  metrics.addGauge("ledger_active_connections", 1);
  metrics.addGauge("ledger_active_connections", 1);
  metrics.addGauge("ledger_active_connections", -1);
  EXPECT_EQ(metrics.gaugeValue("ledger_active_connections"), 1);

  metrics.setGauge("ledger_active_connections", 7);
  EXPECT_EQ(metrics.gaugeValue("ledger_active_connections"), 7);
  EXPECT_NE(metrics.exportMetrics().find("# TYPE ledger_active_connections gauge"),
            std::string::npos);
}

TEST(MetricsTest, HistogramBucketsAreCumulative) {
  MetricsCollector metrics;
  metrics.observeHistogram("ledger_request_duration_seconds", 0.0004);
  metrics.observeHistogram("ledger_request_duration_seconds", 0.003);
  metrics.observeHistogram("ledger_request_duration_seconds", 60.0);

  EXPECT_EQ(metrics.histogramCount("ledger_request_duration_seconds"), 3u);
  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("ledger_request_duration_seconds_bucket{le=\"0.0005\"} 1"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_request_duration_seconds_bucket{le=\"0.005\"} 2"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_request_duration_seconds_bucket{le=\"10\"} 2"), std::string::npos);
  EXPECT_NE(text.find("ledger_request_duration_seconds_bucket{le=\"+Inf\"} 3"),
            std::string::npos);
  EXPECT_NE(text.find("ledger_request_duration_seconds_count 3"), std::string::npos);
}

TEST(MetricsTest, ResetKeepsHelpText) {
  MetricsCollector metrics;
  metrics.describe("ledger_accrual_runs_total", "Interest accrual batches run");
  metrics.incrementCounter("ledger_accrual_runs_total");
  metrics.reset();

  EXPECT_EQ(metrics.counterValue("ledger_accrual_runs_total"), 0);
  metrics.incrementCounter("ledger_accrual_runs_total");
  EXPECT_NE(metrics.exportMetrics().find("# HELP ledger_accrual_runs_total"), std::string::npos);
}

TEST(MetricsTest, GlobalCollectorDescribesLedgerFamilies) {
  auto& metrics = getGlobalMetrics();
  metrics.incrementCounter("ledger_accrual_runs_total", {}, 0);
  EXPECT_NE(metrics.exportMetrics().find("# HELP ledger_accrual_runs_total"), std::string::npos);
}

TEST(MetricsTest, TimerObservesOnDestruction) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "ledger_transfer_duration_seconds");
  }
  EXPECT_NE(metrics.exportMetrics().find("ledger_transfer_duration_seconds_count 1"),
            std::string::npos);
}
