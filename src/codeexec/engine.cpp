#include <codeexec/engine.h>

#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codeexec/utils.h>

namespace {

// the scheduler never runs more jobs than the backend has sandboxes for
SecurityPolicy EffectivePolicy(const SecurityPolicy& policy, const SandboxRuntime& runtime) {
  SecurityPolicy ret = policy;
  int capacity = runtime.Capacity();
  if (capacity > 0 && ret.max_concurrent_jobs > capacity) {
    spdlog::warn("max_concurrent_jobs {} exceeds the sandbox capacity; using {}",
                 ret.max_concurrent_jobs, capacity);
    ret.max_concurrent_jobs = capacity;
  }
  return ret;
}

} // namespace

ExecutionEngine::ExecutionEngine(std::shared_ptr<SandboxRuntime> runtime,
                                 const SecurityPolicy& policy, const EngineOptions& options) :
    runtime_(std::move(runtime)),
    options_(options),
    manager_(*runtime_),
    policy_(std::make_shared<const SecurityPolicy>(EffectivePolicy(policy, *runtime_))),
    gate_(std::make_shared<const SecurityGate>(policy_, registry_)),
    limiter_(policy_->rate_limits),
    scheduler_(
        [this](const JobConfig& config, JobControl& control, JobLog& log) {
          return manager_.Run(config, control, log);
        },
        policy_->max_concurrent_jobs,
        [this](const JobResult& result) { metrics_.RecordResult(result); }),
    stopping_(false) {
  scheduler_.Start();
  sweeper_ = std::thread(&ExecutionEngine::SweepLoop_, this);
  spdlog::info("Execution engine started: max_concurrent={} languages=[{}]",
               policy_->max_concurrent_jobs, fmt::join(ListSupportedLanguages(), ","));
}

ExecutionEngine::~ExecutionEngine() {
  Shutdown();
}

std::shared_ptr<const SecurityGate> ExecutionEngine::Gate_() const {
  std::lock_guard lck(policy_mtx_);
  return gate_;
}

void ExecutionEngine::SweepLoop_() {
  std::unique_lock lck(sweep_mtx_);
  while (!stopping_) {
    if (sweep_cv_.wait_for(lck, options_.sweep_interval, [this] { return stopping_; })) break;
    lck.unlock();
    scheduler_.EvictExpired(options_.result_retention);
    limiter_.Sweep();
    lck.lock();
  }
}

long ExecutionEngine::DeadlineBudget(const JobConfig& config, long max_job_duration_ms) {
  long budget = config.timeout_ms;
  size_t setup = config.runtime.setup_commands.size();
  if (!config.dependencies.empty() && config.runtime.dependency_install) setup++;
  budget += (long)setup * config.setup_timeout_ms;
  if (config.runtime.HasCompile()) budget += config.compile_timeout_ms;
  return std::min(budget, max_job_duration_ms);
}

std::string ExecutionEngine::Submit(const ExecutionRequest& request) {
  {
    std::lock_guard lck(sweep_mtx_);
    if (stopping_) throw std::runtime_error("Engine is shut down");
  }
  auto gate = Gate_();
  JobConfig config = gate->Validate(request);
  if (config.id.empty()) config.id = GetUniqueJobId();
  if (scheduler_.Contains(config.id)) {
    throw ValidationError(ValidationErrorKind::DUPLICATE_ID, "Duplicate job ID: " + config.id);
  }
  RateLimitReason reason = limiter_.Admit(config.user_id, config.project_id);
  if (reason != RateLimitReason::ALLOWED) throw RateLimitError(reason);

  const long budget = DeadlineBudget(config, gate->Policy().max_job_duration_ms);
  std::string id = config.id;
  std::string language = config.language, user_id = config.user_id;
  switch (scheduler_.Enqueue(std::move(config), budget)) {
    case EnqueueStatus::QUEUED: break;
    // a concurrent submission of the same id won
    case EnqueueStatus::DUPLICATE:
      throw ValidationError(ValidationErrorKind::DUPLICATE_ID, "Duplicate job ID: " + id);
    case EnqueueStatus::STOPPED: throw std::runtime_error("Engine is shut down");
  }
  metrics_.RecordAdmission(language, user_id);
  return id;
}

std::optional<JobResult> ExecutionEngine::GetStatus(const std::string& job_id) const {
  return scheduler_.Get(job_id);
}

std::optional<std::string> ExecutionEngine::GetLogs(const std::string& job_id) const {
  return scheduler_.Logs(job_id);
}

bool ExecutionEngine::Cancel(const std::string& job_id) {
  return scheduler_.Cancel(job_id);
}

std::vector<std::string> ExecutionEngine::ListSupportedLanguages() const {
  auto policy = GetSecurityPolicy();
  std::vector<std::string> ret;
  for (auto& i : registry_.Languages()) {
    if (policy.LanguageAllowed(i)) ret.push_back(i);
  }
  return ret;
}

HealthReport ExecutionEngine::HealthCheck() {
  HealthReport ret;
  ret.runtime_available = runtime_->Available();
  QueueStatus status = scheduler_.Status();
  ret.queue_length = status.queue_length;
  ret.active_jobs = status.active_jobs;
  ret.max_concurrent = status.max_concurrent;
  ret.total_jobs = scheduler_.TotalJobs();
  ret.status = MetricsReporter::Classify(ret.runtime_available, status);
  if (ret.status != HealthStatus::HEALTHY) {
    spdlog::warn("Health {}: runtime_available={} queue={} active={}/{}",
                 HealthStatusName(ret.status), ret.runtime_available, ret.queue_length,
                 ret.active_jobs, ret.max_concurrent);
  }
  return ret;
}

ExecutionMetrics ExecutionEngine::GetMetrics() const {
  return metrics_.Snapshot();
}

std::optional<JobResult> ExecutionEngine::Wait(const std::string& job_id,
                                               std::optional<std::chrono::milliseconds> timeout) const {
  auto future = scheduler_.Subscribe(job_id);
  if (!future) return std::nullopt;
  if (!timeout) return future->get();
  if (future->wait_for(*timeout) == std::future_status::ready) return future->get();
  return scheduler_.Get(job_id);
}

std::optional<std::shared_future<JobResult>> ExecutionEngine::Subscribe(const std::string& job_id) const {
  return scheduler_.Subscribe(job_id);
}

std::vector<JobResult> ExecutionEngine::ListJobs() const {
  return scheduler_.List();
}

QueueStatus ExecutionEngine::GetQueueStatus() const {
  return scheduler_.Status();
}

std::optional<LanguageRuntime> ExecutionEngine::GetLanguageRuntime(const std::string& language) const {
  return registry_.Find(language);
}

void ExecutionEngine::RegisterRuntime(LanguageRuntime runtime) {
  registry_.Register(std::move(runtime));
}

SecurityPolicy ExecutionEngine::GetSecurityPolicy() const {
  std::lock_guard lck(policy_mtx_);
  return *policy_;
}

void ExecutionEngine::UpdateSecurityPolicy(const SecurityPolicy& policy) {
  auto snapshot = std::make_shared<const SecurityPolicy>(EffectivePolicy(policy, *runtime_));
  auto gate = std::make_shared<const SecurityGate>(snapshot, registry_);
  const int max_concurrent = snapshot->max_concurrent_jobs;
  {
    std::lock_guard lck(policy_mtx_);
    policy_ = std::move(snapshot);
    gate_ = std::move(gate);
  }
  limiter_.SetLimits(policy.rate_limits);
  scheduler_.SetMaxConcurrent(max_concurrent);
  spdlog::info("Security policy updated: max_concurrent={} max_execution_time={}ms network={}",
               max_concurrent, policy.max_execution_time_ms, policy.network_access);
}

void ExecutionEngine::Shutdown() {
  {
    std::lock_guard lck(sweep_mtx_);
    if (stopping_ && !sweeper_.joinable()) return;
    stopping_ = true;
  }
  sweep_cv_.notify_all();
  if (sweeper_.joinable()) sweeper_.join();
  scheduler_.Shutdown();
}
