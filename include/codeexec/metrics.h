#ifndef INCLUDE_CODEEXEC_METRICS_H_
#define INCLUDE_CODEEXEC_METRICS_H_

#include <map>
#include <mutex>
#include <string>

#include "job.h"
#include "scheduler.h"

struct ExecutionMetrics {
  long total_executions;
  long successful_executions;
  long failed_executions;
  double average_duration_ms;
  std::map<std::string, long> language_usage;
  std::map<std::string, long> user_usage;

  ExecutionMetrics() :
      total_executions(0), successful_executions(0), failed_executions(0),
      average_duration_ms(0) {}
};

#define ENUM_HEALTH_STATUS_ \
  X(HEALTHY, "healthy") \
  X(DEGRADED, "degraded") \
  X(UNHEALTHY, "unhealthy")
enum class HealthStatus {
#define X(name, str) name,
  ENUM_HEALTH_STATUS_
#undef X
};

struct HealthReport {
  HealthStatus status;
  bool runtime_available;
  size_t queue_length;
  size_t active_jobs;
  int max_concurrent;
  size_t total_jobs;
};

class MetricsReporter {
  mutable std::mutex mtx_;
  ExecutionMetrics metrics_;
 public:
  static constexpr size_t kDegradedQueueLength = 50;

  // usage counters are counted at admission
  void RecordAdmission(const std::string& language, const std::string& user_id);
  void RecordResult(const JobResult& result);
  ExecutionMetrics Snapshot() const;

  static HealthStatus Classify(bool runtime_available, const QueueStatus& status);
};

#endif  // INCLUDE_CODEEXEC_METRICS_H_
