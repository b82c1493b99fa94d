#include <intent/collaborators.h>
#include <intent/errors.h>
#include <intent/logging.h>

#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace intent {
namespace {

ToolMetric Metric(const std::string &tool_id, bool success, int duration_ms,
                  double confidence) {
  ToolMetric metric;
  metric.tool_id = tool_id;
  metric.operation = "analyze-intent";
  metric.success = success;
  metric.duration = std::chrono::milliseconds(duration_ms);
  metric.confidence = confidence;
  return metric;
}

Insight CodeIssues() {
  Insight insight;
  insight.type = "code-issues";
  insight.anti_patterns = {"Magic Numbers - use named constants"};
  insight.confidence = 0.7;
  insight.affects = {"security-scanner", "smart-reviewer"};
  return insight;
}

TEST(InMemoryPerformanceTrackerTest, AggregatesPerTool) {
  InMemoryPerformanceTracker tracker;
  tracker.Track(Metric("semantic-analyzer", true, 10, 0.8));
  tracker.Track(Metric("semantic-analyzer", false, 30, 0.0));
  tracker.Track(Metric("other", true, 100, 0.5));

  EXPECT_EQ(tracker.Metrics("semantic-analyzer").size(), 2u);
  const auto aggregate = tracker.Aggregate("semantic-analyzer");
  EXPECT_EQ(aggregate.total_operations, 2u);
  EXPECT_DOUBLE_EQ(aggregate.success_rate, 0.5);
  EXPECT_DOUBLE_EQ(aggregate.average_duration_ms, 20.0);
  EXPECT_DOUBLE_EQ(aggregate.average_confidence, 0.4);
}

TEST(InMemoryPerformanceTrackerTest, EmptyAggregateIsZero) {
  InMemoryPerformanceTracker tracker;
  const auto aggregate = tracker.Aggregate("semantic-analyzer");

  EXPECT_EQ(aggregate.total_operations, 0u);
  EXPECT_DOUBLE_EQ(aggregate.success_rate, 0.0);
}

TEST(InMemoryPerformanceTrackerTest, AcceptsConcurrentTracking) {
  InMemoryPerformanceTracker tracker;
  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&tracker] {
      for (int j = 0; j < 25; ++j) {
        tracker.Track(Metric("semantic-analyzer", true, 1, 0.5));
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  EXPECT_EQ(tracker.Aggregate("semantic-analyzer").total_operations, 100u);
}

TEST(InMemoryPerformanceTrackerTest, KeepsNewestThousandMetrics) {
  InMemoryPerformanceTracker tracker;
  for (int i = 0; i < 1001; ++i) {
    tracker.Track(Metric("semantic-analyzer", true, i, 0.5));
  }

  const auto metrics = tracker.Metrics("semantic-analyzer");
  ASSERT_EQ(metrics.size(), 1000u);
  EXPECT_EQ(metrics.front().duration.count(), 1);
  EXPECT_EQ(metrics.back().duration.count(), 1000);
}

TEST(InMemoryPerformanceTrackerTest, RejectsZeroRetention) {
  EXPECT_THROW(InMemoryPerformanceTracker tracker(0), std::invalid_argument);
}

TEST(InMemoryInsightBusTest, DeliversToSubscribersOfTheType) {
  InMemoryInsightBus bus;
  std::vector<std::string> received;
  bus.Subscribe("code-issues",
                [&](const std::string &source_id, const Insight &insight) {
                  received.push_back(source_id + ":" + insight.type);
                });
  bus.Subscribe("performance", [&](const std::string &, const Insight &) {
    received.push_back("unexpected");
  });

  bus.ShareInsight("semantic-analyzer", CodeIssues());

  EXPECT_EQ(received,
            (std::vector<std::string>{"semantic-analyzer:code-issues"}));
  ASSERT_EQ(bus.History().size(), 1u);
  EXPECT_EQ(bus.History()[0].source_id, "semantic-analyzer");
  EXPECT_EQ(bus.History()[0].insight.anti_patterns.size(), 1u);
}

TEST(InMemoryInsightBusTest, KeepsNewestThousandInsights) {
  InMemoryInsightBus bus;
  for (int i = 0; i < 1001; ++i) {
    bus.ShareInsight("tool-" + std::to_string(i), CodeIssues());
  }

  const auto history = bus.History();
  ASSERT_EQ(history.size(), 1000u);
  EXPECT_EQ(history.front().source_id, "tool-1");
  EXPECT_EQ(history.back().source_id, "tool-1000");
}

TEST(InMemoryInsightBusTest, RejectsEmptyHandlers) {
  InMemoryInsightBus bus;
  EXPECT_THROW(bus.Subscribe("code-issues", InsightHandler{}),
               std::invalid_argument);
}

TEST(InMemoryInsightBusTest, WrapsHandlerFailures) {
  InMemoryInsightBus bus;
  bus.Subscribe("code-issues", [](const std::string &, const Insight &) {
    throw std::runtime_error("reviewer offline");
  });

  try {
    bus.ShareInsight("semantic-analyzer", CodeIssues());
    FAIL() << "expected CollaboratorError";
  } catch (const CollaboratorError &error) {
    EXPECT_NE(std::string(error.what()).find("reviewer offline"),
              std::string::npos);
  }
  EXPECT_EQ(bus.History().size(), 1u);
}

TEST(LoggingCollaboratorsTest, WriteInfoRecords) {
  std::stringstream stream;
  auto logger = MakeLogger(LoggingConfig{LogLevel::kInfo}, stream);
  LoggingPerformanceTracker tracker(logger);
  LoggingInsightBus bus(logger);

  auto metric = Metric("semantic-analyzer", false, 12, 0.0);
  metric.error = "Unterminated string literal (1:5)";
  tracker.Track(metric);
  bus.ShareInsight("semantic-analyzer", CodeIssues());

  const auto output = stream.str();
  EXPECT_NE(output.find("message=\"telemetry.metric\""), std::string::npos);
  EXPECT_NE(output.find("\"success\": \"false\""), std::string::npos);
  EXPECT_NE(output.find("\"duration_ms\": \"12\""), std::string::npos);
  EXPECT_NE(output.find("\"error\": \"Unterminated string literal (1:5)\""),
            std::string::npos);
  EXPECT_NE(output.find("message=\"insight.shared\""), std::string::npos);
  EXPECT_NE(output.find("\"affects\": \"security-scanner,smart-reviewer\""),
            std::string::npos);
}

TEST(LoggingCollaboratorsTest, QuietBelowInfo) {
  std::stringstream stream;
  LoggingPerformanceTracker tracker(
      MakeLogger(LoggingConfig{LogLevel::kWarn}, stream));

  tracker.Track(Metric("semantic-analyzer", true, 1, 0.5));

  EXPECT_TRUE(stream.str().empty());
}

} // namespace
} // namespace intent
