#include <intent/collaborators.h>

#include <intent/errors.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace intent {
namespace {

std::string FormatNumber(double value) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(4) << value;
  return stream.str();
}

std::string JoinNames(const std::vector<std::string> &names) {
  std::string joined;
  for (const auto &name : names) {
    if (!joined.empty()) {
      joined.append(",");
    }
    joined.append(name);
  }
  return joined;
}

} // namespace

LoggingPerformanceTracker::LoggingPerformanceTracker(
    std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void LoggingPerformanceTracker::Track(const ToolMetric &metric) {
  LogFields fields{{"tool_id", metric.tool_id},
                   {"operation", metric.operation},
                   {"success", metric.success ? "true" : "false"},
                   {"duration_ms", std::to_string(metric.duration.count())},
                   {"input_size", std::to_string(metric.input.size)},
                   {"output_type", metric.output.type},
                   {"output_size", std::to_string(metric.output.size)},
                   {"confidence", FormatNumber(metric.confidence)}};
  if (metric.error) {
    fields.emplace_back("error", *metric.error);
  }
  logger_->Log(LogLevel::kInfo, "telemetry.metric", std::move(fields));
}

InMemoryPerformanceTracker::InMemoryPerformanceTracker(std::size_t retention)
    : retention_(retention) {
  if (retention_ == 0) {
    throw std::invalid_argument("Metric retention must be positive");
  }
}

void InMemoryPerformanceTracker::Track(const ToolMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
  while (metrics_.size() > retention_) {
    metrics_.pop_front();
  }
}

std::vector<ToolMetric>
InMemoryPerformanceTracker::Metrics(const std::string &tool_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ToolMetric> matching;
  for (const auto &metric : metrics_) {
    if (metric.tool_id == tool_id) {
      matching.push_back(metric);
    }
  }
  return matching;
}

MetricAggregate
InMemoryPerformanceTracker::Aggregate(const std::string &tool_id) const {
  const auto metrics = Metrics(tool_id);
  MetricAggregate aggregate;
  aggregate.total_operations = metrics.size();
  if (metrics.empty()) {
    return aggregate;
  }

  std::size_t successes = 0;
  double duration = 0.0;
  double confidence = 0.0;
  for (const auto &metric : metrics) {
    if (metric.success) {
      ++successes;
    }
    duration += static_cast<double>(metric.duration.count());
    confidence += metric.confidence;
  }
  const auto count = static_cast<double>(metrics.size());
  aggregate.success_rate = static_cast<double>(successes) / count;
  aggregate.average_duration_ms = duration / count;
  aggregate.average_confidence = confidence / count;
  return aggregate;
}

LoggingInsightBus::LoggingInsightBus(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

void LoggingInsightBus::ShareInsight(const std::string &source_id,
                                     const Insight &insight) {
  logger_->Log(LogLevel::kInfo, "insight.shared",
               {{"source", source_id},
                {"type", insight.type},
                {"anti_patterns", std::to_string(insight.anti_patterns.size())},
                {"risky_effects", std::to_string(insight.risky_effects.size())},
                {"confidence", FormatNumber(insight.confidence)},
                {"affects", JoinNames(insight.affects)}});
}

InMemoryInsightBus::InMemoryInsightBus(std::size_t retention)
    : retention_(retention) {
  if (retention_ == 0) {
    throw std::invalid_argument("Insight retention must be positive");
  }
}

void InMemoryInsightBus::Subscribe(const std::string &insight_type,
                                   InsightHandler handler) {
  if (!handler) {
    throw std::invalid_argument("Insight handler must not be empty");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_[insight_type].push_back(std::move(handler));
}

void InMemoryInsightBus::ShareInsight(const std::string &source_id,
                                      const Insight &insight) {
  std::vector<InsightHandler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.push_back(SharedInsight{source_id, insight});
    while (history_.size() > retention_) {
      history_.pop_front();
    }
    const auto subscribed = handlers_.find(insight.type);
    if (subscribed != handlers_.end()) {
      handlers = subscribed->second;
    }
  }
  for (const auto &handler : handlers) {
    try {
      handler(source_id, insight);
    } catch (const std::exception &error) {
      throw CollaboratorError("Insight handler failed for '" + insight.type +
                              "': " + error.what());
    }
  }
}

std::vector<SharedInsight> InMemoryInsightBus::History() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {history_.begin(), history_.end()};
}

} // namespace intent
