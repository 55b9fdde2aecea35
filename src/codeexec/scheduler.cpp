#include <codeexec/scheduler.h>

#include <algorithm>

#include <spdlog/spdlog.h>
#include <codeexec/utils.h>

namespace {

JobResult CancelledResult() {
  JobResult ret;
  ret.status = JobStatus::FAILED;
  ret.error_class = ErrorClass::CANCELLED;
  ret.error = "Job cancelled";
  return ret;
}

} // namespace

JobScheduler::JobScheduler(Executor executor, int max_concurrent, CompletionHook hook) :
    executor_(std::move(executor)),
    hook_(std::move(hook)),
    max_concurrent_(std::max(1, max_concurrent)),
    active_(0),
    started_(false), stop_(false),
    seq_(0) {}

JobScheduler::~JobScheduler() {
  Shutdown();
}

void JobScheduler::Start() {
  std::lock_guard lck(mtx_);
  if (started_ || stop_) return;
  started_ = true;
  dispatcher_ = std::thread(&JobScheduler::DispatchLoop_, this);
}

void JobScheduler::Shutdown() {
  std::vector<JobResult> done;
  {
    std::lock_guard lck(mtx_);
    if (!stop_) spdlog::info("Scheduler shutting down: {} queued, {} running", queue_.size(), running_.size());
    stop_ = true;
    for (auto& i : queue_) {
      if (auto fin = Finish_(*i, CancelledResult())) done.push_back(std::move(*fin));
    }
    queue_.clear();
    for (auto& [id, entry] : running_) {
      if (auto fin = Finish_(*entry, CancelledResult())) done.push_back(std::move(*fin));
      entry->control.Stop();
    }
  }
  cv_.notify_all();
  RunHooks_(done);
  if (dispatcher_.joinable()) dispatcher_.join();
}

std::optional<JobResult> JobScheduler::Finish_(JobEntry& entry, JobResult&& result) {
  if (IsTerminal(entry.result.status)) return std::nullopt;
  if (!IsTerminal(result.status)) {
    spdlog::error("Job {} finished with non-terminal status {}", entry.config.id, JobStatusName(result.status));
    result.status = JobStatus::FAILED;
    result.error_class = ErrorClass::INTERNAL_ERROR;
  }
  result.id = entry.config.id;
  result.language = entry.config.language;
  result.user_id = entry.config.user_id;
  result.created_at = entry.result.created_at;
  result.started_at = entry.result.started_at;
  result.finished_at = NowMs();
  entry.result = std::move(result);
  entry.terminal_at = Clock::now();
  entry.promise.set_value(entry.result);
  spdlog::info("Job {} finished: status={} error_class={} exit_code={} duration={}ms",
               entry.config.id, JobStatusName(entry.result.status),
               ErrorClassName(entry.result.error_class), entry.result.exit_code,
               entry.result.duration_ms);
  return entry.result;
}

std::optional<JobResult> JobScheduler::Dispatch_(const EntryPtr& entry) {
  entry->result.status = JobStatus::RUNNING;
  entry->result.started_at = NowMs();
  entry->dispatched_at = Clock::now();
  entry->deadline = entry->dispatched_at + std::chrono::milliseconds(entry->deadline_budget_ms);
  entry->worker_running = true;
  try {
    workers_.emplace(entry->seq, std::thread(&JobScheduler::Worker_, this, entry));
  } catch (const std::system_error& e) {
    spdlog::error("Failed to start worker for job {}: {}", entry->config.id, e.what());
    entry->worker_running = false;
    JobResult res;
    res.status = JobStatus::FAILED;
    res.error_class = ErrorClass::INTERNAL_ERROR;
    res.error = "Failed to start job worker";
    return Finish_(*entry, std::move(res));
  }
  active_++;
  running_[entry->config.id] = entry;
  spdlog::info("Job {} running (active {}/{})", entry->config.id, active_, max_concurrent_);
  return std::nullopt;
}

void JobScheduler::Worker_(EntryPtr entry) {
  JobResult res;
  try {
    res = executor_(entry->config, entry->control, entry->log);
  } catch (const std::exception& e) {
    spdlog::error("Job {} raised: {}", entry->config.id, e.what());
    res.status = JobStatus::FAILED;
    res.error_class = ErrorClass::INTERNAL_ERROR;
    res.error = "Internal error";
  }
  std::optional<JobResult> fin;
  {
    std::lock_guard lck(mtx_);
    fin = Finish_(*entry, std::move(res));
    entry->worker_running = false;
    running_.erase(entry->config.id);
    active_--;
    finished_workers_.push_back(entry->seq);
  }
  cv_.notify_all();
  if (fin && hook_) hook_(*fin);
}

void JobScheduler::RunHooks_(std::vector<JobResult>& done) {
  if (hook_) {
    for (auto& i : done) hook_(i);
  }
  done.clear();
}

void JobScheduler::JoinFinished_(std::unique_lock<std::mutex>& lck) {
  while (!finished_workers_.empty()) {
    std::vector<std::thread> threads;
    for (long seq : finished_workers_) {
      auto it = workers_.find(seq);
      if (it == workers_.end()) continue;
      threads.push_back(std::move(it->second));
      workers_.erase(it);
    }
    finished_workers_.clear();
    lck.unlock();
    for (auto& i : threads) i.join();
    lck.lock();
  }
}

void JobScheduler::DispatchLoop_() {
  std::unique_lock lck(mtx_);
  std::vector<JobResult> done;
  while (true) {
    JoinFinished_(lck);
    auto now = Clock::now();
    for (auto& [id, entry] : running_) {
      if (IsTerminal(entry->result.status) || entry->deadline > now) continue;
      JobResult res;
      res.status = JobStatus::TIMEOUT;
      res.error_class = ErrorClass::TIMEOUT;
      res.error = "Job exceeded overall deadline";
      res.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
          now - entry->dispatched_at).count();
      spdlog::warn("Job {} exceeded its overall deadline of {} ms", id, entry->deadline_budget_ms);
      if (auto fin = Finish_(*entry, std::move(res))) done.push_back(std::move(*fin));
      // the worker tears the sandbox down once the running phase is killed
      entry->control.Stop();
    }
    while (!stop_ && !queue_.empty() && active_ < (size_t)max_concurrent_) {
      EntryPtr entry = std::move(queue_.front());
      queue_.pop_front();
      if (auto fin = Dispatch_(entry)) done.push_back(std::move(*fin));
    }
    if (!done.empty()) {
      lck.unlock();
      RunHooks_(done);
      lck.lock();
      continue;
    }
    if (!finished_workers_.empty()) continue;
    if (stop_ && workers_.empty()) break;

    std::optional<Clock::time_point> next;
    for (auto& [id, entry] : running_) {
      if (IsTerminal(entry->result.status)) continue;
      if (!next || entry->deadline < *next) next = entry->deadline;
    }
    if (next) {
      cv_.wait_until(lck, *next);
    } else {
      cv_.wait(lck);
    }
  }
  spdlog::debug("Dispatcher exited");
}

EnqueueStatus JobScheduler::Enqueue(JobConfig&& config, long deadline_budget_ms) {
  {
    std::lock_guard lck(mtx_);
    if (stop_) return EnqueueStatus::STOPPED;
    if (jobs_.count(config.id)) return EnqueueStatus::DUPLICATE;
    auto entry = std::make_shared<JobEntry>();
    entry->seq = ++seq_;
    entry->deadline_budget_ms = deadline_budget_ms;
    entry->worker_running = false;
    entry->result.id = config.id;
    entry->result.language = config.language;
    entry->result.user_id = config.user_id;
    entry->result.status = JobStatus::QUEUED;
    entry->result.created_at = NowMs();
    entry->future = entry->promise.get_future().share();
    entry->config = std::move(config);
    jobs_[entry->config.id] = entry;
    queue_.push_back(entry);
    spdlog::info("Job {} queued: language={} user={} (queue length {})",
                 entry->config.id, entry->config.language, entry->config.user_id, queue_.size());
  }
  cv_.notify_all();
  return EnqueueStatus::QUEUED;
}

bool JobScheduler::Cancel(const std::string& id) {
  std::optional<JobResult> fin;
  {
    std::lock_guard lck(mtx_);
    auto it = jobs_.find(id);
    if (it == jobs_.end() || IsTerminal(it->second->result.status)) return false;
    EntryPtr entry = it->second;
    bool queued = entry->result.status == JobStatus::QUEUED;
    if (queued) queue_.erase(std::find(queue_.begin(), queue_.end(), entry));
    spdlog::info("Cancel job {} ({})", id, queued ? "queued" : "running");
    fin = Finish_(*entry, CancelledResult());
    entry->control.Stop();
  }
  cv_.notify_all();
  if (fin && hook_) hook_(*fin);
  return true;
}

std::optional<JobResult> JobScheduler::Get(const std::string& id) const {
  std::lock_guard lck(mtx_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second->result;
}

std::optional<std::string> JobScheduler::Logs(const std::string& id) const {
  std::lock_guard lck(mtx_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second->log.Text();
}

std::optional<std::shared_future<JobResult>> JobScheduler::Subscribe(const std::string& id) const {
  std::lock_guard lck(mtx_);
  auto it = jobs_.find(id);
  if (it == jobs_.end()) return std::nullopt;
  return it->second->future;
}

std::vector<JobResult> JobScheduler::List() const {
  std::vector<std::pair<long, JobResult>> entries;
  {
    std::lock_guard lck(mtx_);
    for (auto& i : jobs_) entries.emplace_back(i.second->seq, i.second->result);
  }
  std::sort(entries.begin(), entries.end(),
            [](const auto& a, const auto& b) { return a.first > b.first; });
  std::vector<JobResult> ret;
  for (auto& i : entries) ret.push_back(std::move(i.second));
  return ret;
}

bool JobScheduler::Contains(const std::string& id) const {
  std::lock_guard lck(mtx_);
  return jobs_.count(id);
}

size_t JobScheduler::TotalJobs() const {
  std::lock_guard lck(mtx_);
  return jobs_.size();
}

QueueStatus JobScheduler::Status() const {
  std::lock_guard lck(mtx_);
  return {queue_.size(), active_, max_concurrent_};
}

void JobScheduler::SetMaxConcurrent(int max_concurrent) {
  {
    std::lock_guard lck(mtx_);
    max_concurrent_ = std::max(1, max_concurrent);
  }
  cv_.notify_all();
}

size_t JobScheduler::EvictExpired(std::chrono::milliseconds retention, Clock::time_point now) {
  std::lock_guard lck(mtx_);
  size_t count = 0;
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    auto& entry = *it->second;
    if (IsTerminal(entry.result.status) && !entry.worker_running && now - entry.terminal_at >= retention) {
      it = jobs_.erase(it);
      count++;
    } else {
      ++it;
    }
  }
  if (count) spdlog::debug("Evicted {} expired job results", count);
  return count;
}
