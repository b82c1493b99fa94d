#pragma once

#include <intent/interfaces.h>
#include <intent/logging.h>

#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace intent {

// Host default: every metric becomes an info record.
class LoggingPerformanceTracker : public PerformanceTracker {
public:
  explicit LoggingPerformanceTracker(std::shared_ptr<Logger> logger);
  void Track(const ToolMetric &metric) override;

private:
  std::shared_ptr<Logger> logger_;
};

struct MetricAggregate {
  std::size_t total_operations = 0;
  double success_rate = 0.0;
  double average_duration_ms = 0.0;
  double average_confidence = 0.0;
};

class InMemoryPerformanceTracker : public PerformanceTracker {
public:
  // Keeps the newest `retention` metrics.
  explicit InMemoryPerformanceTracker(std::size_t retention = 1000);

  void Track(const ToolMetric &metric) override;

  std::vector<ToolMetric> Metrics(const std::string &tool_id) const;
  MetricAggregate Aggregate(const std::string &tool_id) const;

private:
  std::size_t retention_;
  mutable std::mutex mutex_;
  std::deque<ToolMetric> metrics_;
};

class LoggingInsightBus : public InsightBus {
public:
  explicit LoggingInsightBus(std::shared_ptr<Logger> logger);
  void ShareInsight(const std::string &source_id,
                    const Insight &insight) override;

private:
  std::shared_ptr<Logger> logger_;
};

struct SharedInsight {
  std::string source_id;
  Insight insight;
};

using InsightHandler =
    std::function<void(const std::string &source_id, const Insight &insight)>;

// Delivers each insight to the handlers subscribed to its type and keeps the
// newest `retention` insights as history. Handlers run on the sharing thread, outside the lock.
class InMemoryInsightBus : public InsightBus {
public:
  explicit InMemoryInsightBus(std::size_t retention = 1000);

  void Subscribe(const std::string &insight_type, InsightHandler handler);
  void ShareInsight(const std::string &source_id,
                    const Insight &insight) override;

  std::vector<SharedInsight> History() const;

private:
  mutable std::mutex mutex_;
  std::size_t retention_;
  std::map<std::string, std::vector<InsightHandler>> handlers_;
  std::deque<SharedInsight> history_;
};

} // namespace intent
