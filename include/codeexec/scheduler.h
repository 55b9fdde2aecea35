#ifndef INCLUDE_CODEEXEC_SCHEDULER_H_
#define INCLUDE_CODEEXEC_SCHEDULER_H_

#include <map>
#include <deque>
#include <mutex>
#include <chrono>
#include <future>
#include <memory>
#include <thread>
#include <vector>
#include <optional>
#include <functional>
#include <unordered_map>
#include <condition_variable>

#include "job.h"
#include "sandbox_runtime.h"
#include "container_manager.h"

enum class EnqueueStatus {
  QUEUED,
  DUPLICATE, // id already known
  STOPPED, // scheduler is shutting down
};

struct QueueStatus {
  size_t queue_length;
  size_t active_jobs;
  int max_concurrent;
};

// Bounded-concurrency FIFO dispatcher. One dispatcher thread starts a worker
// thread per job while fewer than max_concurrent workers are active, and
// enforces each job's overall deadline.
class JobScheduler {
 public:
  using Clock = std::chrono::steady_clock;
  using Executor = std::function<JobResult(const JobConfig&, JobControl&, JobLog&)>;
  // called once per job, outside of the scheduler lock, after the terminal transition
  using CompletionHook = std::function<void(const JobResult&)>;

 private:
  struct JobEntry {
    long seq;
    JobConfig config;
    JobResult result;
    std::promise<JobResult> promise;
    std::shared_future<JobResult> future;
    JobControl control;
    JobLog log;
    long deadline_budget_ms;
    Clock::time_point dispatched_at, deadline;
    Clock::time_point terminal_at;
    bool worker_running;
  };
  using EntryPtr = std::shared_ptr<JobEntry>;

  Executor executor_;
  CompletionHook hook_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  int max_concurrent_;
  size_t active_;
  bool started_, stop_;
  long seq_;
  std::deque<EntryPtr> queue_;
  std::unordered_map<std::string, EntryPtr> jobs_;
  std::unordered_map<std::string, EntryPtr> running_;
  std::map<long, std::thread> workers_; // by seq
  std::vector<long> finished_workers_;
  std::thread dispatcher_;

  // under mtx_; returns the terminal result if this call made the transition
  std::optional<JobResult> Finish_(JobEntry& entry, JobResult&& result);
  std::optional<JobResult> Dispatch_(const EntryPtr& entry);
  void JoinFinished_(std::unique_lock<std::mutex>& lck);
  void DispatchLoop_();
  void Worker_(EntryPtr entry);
  void RunHooks_(std::vector<JobResult>& done);
 public:
  JobScheduler(Executor executor, int max_concurrent, CompletionHook hook = nullptr);
  ~JobScheduler();
  JobScheduler(const JobScheduler&) = delete;
  JobScheduler& operator=(const JobScheduler&) = delete;

  void Start();
  // cancels queued and running jobs and joins every thread
  void Shutdown();

  EnqueueStatus Enqueue(JobConfig&& config, long deadline_budget_ms);
  // false if unknown or already terminal
  bool Cancel(const std::string& id);

  std::optional<JobResult> Get(const std::string& id) const;
  std::optional<std::string> Logs(const std::string& id) const;
  std::optional<std::shared_future<JobResult>> Subscribe(const std::string& id) const;
  // newest first
  std::vector<JobResult> List() const;
  bool Contains(const std::string& id) const;
  size_t TotalJobs() const;
  QueueStatus Status() const;

  void SetMaxConcurrent(int max_concurrent);
  // forget terminal jobs older than retention; returns the number evicted
  size_t EvictExpired(std::chrono::milliseconds retention, Clock::time_point now = Clock::now());
};

#endif  // INCLUDE_CODEEXEC_SCHEDULER_H_
