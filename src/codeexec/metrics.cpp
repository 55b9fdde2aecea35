#include <codeexec/metrics.h>

void MetricsReporter::RecordAdmission(const std::string& language, const std::string& user_id) {
  std::lock_guard lck(mtx_);
  metrics_.language_usage[language]++;
  metrics_.user_usage[user_id]++;
}

void MetricsReporter::RecordResult(const JobResult& result) {
  std::lock_guard lck(mtx_);
  long n = ++metrics_.total_executions;
  if (result.Successful()) {
    metrics_.successful_executions++;
  } else {
    metrics_.failed_executions++;
  }
  // incremental mean
  metrics_.average_duration_ms += (result.duration_ms - metrics_.average_duration_ms) / n;
}

ExecutionMetrics MetricsReporter::Snapshot() const {
  std::lock_guard lck(mtx_);
  return metrics_;
}

HealthStatus MetricsReporter::Classify(bool runtime_available, const QueueStatus& status) {
  if (!runtime_available) return HealthStatus::UNHEALTHY;
  if (status.queue_length > kDegradedQueueLength ||
      status.active_jobs >= (size_t)status.max_concurrent) {
    return HealthStatus::DEGRADED;
  }
  return HealthStatus::HEALTHY;
}
