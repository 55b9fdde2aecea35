#include <gtest/gtest.h>
#include <codeexec/metrics.h>

namespace {

JobResult Result(JobStatus status, int exit_code, long duration_ms) {
  JobResult res;
  res.status = status;
  res.exit_code = exit_code;
  res.duration_ms = duration_ms;
  return res;
}

} // namespace

TEST(MetricsReporter, Counts) {
  MetricsReporter metrics;
  metrics.RecordResult(Result(JobStatus::COMPLETED, 0, 100));
  metrics.RecordResult(Result(JobStatus::COMPLETED, 1, 200));
  metrics.RecordResult(Result(JobStatus::TIMEOUT, -1, 600));
  metrics.RecordResult(Result(JobStatus::FAILED, -1, 300));
  ExecutionMetrics snapshot = metrics.Snapshot();
  EXPECT_EQ(snapshot.total_executions, 4);
  EXPECT_EQ(snapshot.successful_executions, 1);
  EXPECT_EQ(snapshot.failed_executions, 3);
  EXPECT_DOUBLE_EQ(snapshot.average_duration_ms, 300.0);
}

TEST(MetricsReporter, Usage) {
  MetricsReporter metrics;
  metrics.RecordAdmission("python", "alice");
  metrics.RecordAdmission("python", "bob");
  metrics.RecordAdmission("go", "alice");
  ExecutionMetrics snapshot = metrics.Snapshot();
  EXPECT_EQ(snapshot.language_usage["python"], 2);
  EXPECT_EQ(snapshot.language_usage["go"], 1);
  EXPECT_EQ(snapshot.user_usage["alice"], 2);
  EXPECT_EQ(snapshot.total_executions, 0);
}

TEST(MetricsReporter, Classify) {
  EXPECT_EQ(MetricsReporter::Classify(true, {0, 0, 10}), HealthStatus::HEALTHY);
  EXPECT_EQ(MetricsReporter::Classify(true, {50, 9, 10}), HealthStatus::HEALTHY);
  EXPECT_EQ(MetricsReporter::Classify(true, {51, 0, 10}), HealthStatus::DEGRADED);
  EXPECT_EQ(MetricsReporter::Classify(true, {0, 10, 10}), HealthStatus::DEGRADED);
  EXPECT_EQ(MetricsReporter::Classify(false, {0, 0, 10}), HealthStatus::UNHEALTHY);
}
