#ifndef INCLUDE_CODEEXEC_ENGINE_H_
#define INCLUDE_CODEEXEC_ENGINE_H_

#include <mutex>
#include <chrono>
#include <memory>
#include <thread>
#include <condition_variable>

#include "job.h"
#include "policy.h"
#include "metrics.h"
#include "scheduler.h"
#include "rate_limiter.h"
#include "security_gate.h"
#include "runtime_registry.h"
#include "sandbox_runtime.h"
#include "container_manager.h"

struct EngineOptions {
  std::chrono::milliseconds result_retention;
  std::chrono::milliseconds sweep_interval;

  EngineOptions() :
      result_retention(std::chrono::hours(1)),
      sweep_interval(std::chrono::minutes(1)) {}
};

// Owns every piece of engine state. Construct, submit, then Shutdown()
// (also done by the destructor).
class ExecutionEngine {
  std::shared_ptr<SandboxRuntime> runtime_;
  EngineOptions options_;
  RuntimeRegistry registry_;
  ContainerManager manager_;
  MetricsReporter metrics_;

  mutable std::mutex policy_mtx_;
  std::shared_ptr<const SecurityPolicy> policy_;
  std::shared_ptr<const SecurityGate> gate_;

  RateLimiter limiter_;
  JobScheduler scheduler_;

  std::mutex sweep_mtx_;
  std::condition_variable sweep_cv_;
  bool stopping_;
  std::thread sweeper_;

  std::shared_ptr<const SecurityGate> Gate_() const;
  void SweepLoop_();
 public:
  ExecutionEngine(std::shared_ptr<SandboxRuntime> runtime,
                  const SecurityPolicy& policy = SecurityPolicy(),
                  const EngineOptions& options = EngineOptions());
  ~ExecutionEngine();
  ExecutionEngine(const ExecutionEngine&) = delete;
  ExecutionEngine& operator=(const ExecutionEngine&) = delete;

  // throws ValidationError or RateLimitError; returns the job id
  std::string Submit(const ExecutionRequest& request);
  std::optional<JobResult> GetStatus(const std::string& job_id) const;
  std::optional<std::string> GetLogs(const std::string& job_id) const;
  bool Cancel(const std::string& job_id);
  std::vector<std::string> ListSupportedLanguages() const;
  HealthReport HealthCheck();
  ExecutionMetrics GetMetrics() const;

  // blocks until the job is terminal or timeout expires
  std::optional<JobResult> Wait(const std::string& job_id,
                                std::optional<std::chrono::milliseconds> timeout = std::nullopt) const;
  std::optional<std::shared_future<JobResult>> Subscribe(const std::string& job_id) const;
  std::vector<JobResult> ListJobs() const;
  QueueStatus GetQueueStatus() const;
  std::optional<LanguageRuntime> GetLanguageRuntime(const std::string& language) const;
  void RegisterRuntime(LanguageRuntime runtime);
  SecurityPolicy GetSecurityPolicy() const;
  void UpdateSecurityPolicy(const SecurityPolicy& policy);
  void Shutdown();

  // overall deadline of a job: run timeout plus the setup and compile budgets it needs
  static long DeadlineBudget(const JobConfig& config, long max_job_duration_ms);
};

#endif  // INCLUDE_CODEEXEC_ENGINE_H_
