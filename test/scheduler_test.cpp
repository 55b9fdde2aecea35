#include <atomic>
#include <thread>
#include <condition_variable>

#include <gtest/gtest.h>
#include <codeexec/scheduler.h>

namespace {

using namespace std::chrono_literals;

// waits until ms elapsed or the control is stopped; false if stopped
bool WaitOrStop(JobControl& control, long ms) {
  auto mtx = std::make_shared<std::mutex>();
  auto cv = std::make_shared<std::condition_variable>();
  auto stopped = std::make_shared<bool>(false);
  if (!control.Arm([=]() {
        std::lock_guard lck(*mtx);
        *stopped = true;
        cv->notify_all();
      })) {
    return false;
  }
  bool ret;
  {
    std::unique_lock lck(*mtx);
    ret = !cv->wait_for(lck, std::chrono::milliseconds(ms), [&] { return *stopped; });
  }
  control.Disarm();
  return ret;
}

JobConfig Config(const std::string& id, const std::string& code = "") {
  JobConfig config;
  config.id = id;
  config.user_id = "user";
  config.language = "fake";
  config.code = code;
  return config;
}

// code: "" completes, "sleep <ms>", "throw", "running" (non-terminal result)
class SchedulerTest : public ::testing::Test {
 protected:
  std::atomic<int> active{0}, max_active{0}, executed{0}, hooks{0};
  std::mutex order_mtx;
  std::vector<std::string> order;

  JobResult Execute(const JobConfig& config, JobControl& control, JobLog& log) {
    int now = ++active;
    for (int prev = max_active; prev < now && !max_active.compare_exchange_weak(prev, now);) {}
    executed++;
    {
      std::lock_guard lck(order_mtx);
      order.push_back(config.id);
    }
    log.Append("executing " + config.id);
    JobResult res;
    res.status = JobStatus::COMPLETED;
    res.exit_code = 0;
    if (config.code.rfind("sleep ", 0) == 0) {
      if (!WaitOrStop(control, std::stol(config.code.substr(6)))) {
        res.status = JobStatus::FAILED;
        res.error_class = ErrorClass::CANCELLED;
      }
    } else if (config.code == "running") {
      res.status = JobStatus::RUNNING;
    }
    active--;
    if (config.code == "throw") throw std::runtime_error("boom");
    return res;
  }

  std::unique_ptr<JobScheduler> Make(int max_concurrent) {
    auto ret = std::make_unique<JobScheduler>(
        [this](const JobConfig& c, JobControl& ctl, JobLog& log) { return Execute(c, ctl, log); },
        max_concurrent, [this](const JobResult&) { hooks++; });
    ret->Start();
    return ret;
  }

  static JobResult Wait(JobScheduler& scheduler, const std::string& id) {
    auto future = scheduler.Subscribe(id);
    EXPECT_TRUE(future);
    EXPECT_EQ(future->wait_for(10s), std::future_status::ready);
    return future->get();
  }
};

} // namespace

TEST_F(SchedulerTest, CompletesJob) {
  auto scheduler = Make(2);
  ASSERT_EQ(scheduler->Enqueue(Config("a"), 10000), EnqueueStatus::QUEUED);
  JobResult res = Wait(*scheduler, "a");
  EXPECT_EQ(res.status, JobStatus::COMPLETED);
  EXPECT_EQ(res.id, "a");
  EXPECT_EQ(res.user_id, "user");
  EXPECT_GT(res.created_at, 0);
  EXPECT_GE(res.started_at, res.created_at);
  EXPECT_GE(res.finished_at, res.started_at);
  EXPECT_NE(scheduler->Logs("a")->find("executing a"), std::string::npos);
  scheduler->Shutdown();
  EXPECT_EQ(hooks, 1);
}

TEST_F(SchedulerTest, ConcurrencyCap) {
  auto scheduler = Make(2);
  for (int i = 0; i < 8; i++) {
    ASSERT_EQ(scheduler->Enqueue(Config("j" + std::to_string(i), "sleep 30"), 10000), EnqueueStatus::QUEUED);
  }
  for (int i = 0; i < 8; i++) {
    EXPECT_EQ(Wait(*scheduler, "j" + std::to_string(i)).status, JobStatus::COMPLETED);
  }
  EXPECT_LE(max_active, 2);
  EXPECT_EQ(executed, 8);
  auto status = scheduler->Status();
  EXPECT_EQ(status.queue_length, 0u);
  EXPECT_EQ(status.max_concurrent, 2);
}

TEST_F(SchedulerTest, FifoOrder) {
  auto scheduler = Make(1);
  for (int i = 0; i < 5; i++) scheduler->Enqueue(Config("f" + std::to_string(i), "sleep 5"), 10000);
  Wait(*scheduler, "f4");
  std::lock_guard lck(order_mtx);
  EXPECT_EQ(order, std::vector<std::string>({"f0", "f1", "f2", "f3", "f4"}));
}

TEST_F(SchedulerTest, DuplicateId) {
  auto scheduler = Make(1);
  EXPECT_EQ(scheduler->Enqueue(Config("dup"), 10000), EnqueueStatus::QUEUED);
  EXPECT_EQ(scheduler->Enqueue(Config("dup"), 10000), EnqueueStatus::DUPLICATE);
  Wait(*scheduler, "dup");
  EXPECT_EQ(scheduler->Enqueue(Config("dup"), 10000), EnqueueStatus::DUPLICATE);
}

TEST_F(SchedulerTest, CancelQueued) {
  auto scheduler = Make(1);
  scheduler->Enqueue(Config("long", "sleep 10000"), 20000);
  scheduler->Enqueue(Config("queued"), 20000);
  EXPECT_EQ(scheduler->Get("queued")->status, JobStatus::QUEUED);
  EXPECT_TRUE(scheduler->Cancel("queued"));
  JobResult res = Wait(*scheduler, "queued");
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::CANCELLED);
  EXPECT_EQ(res.error, "Job cancelled");
  EXPECT_FALSE(scheduler->Cancel("queued"));
  while (executed == 0) std::this_thread::sleep_for(1ms);
  EXPECT_TRUE(scheduler->Cancel("long"));
  Wait(*scheduler, "long");
  scheduler->Shutdown();
  // the cancelled queued job never reached the executor
  EXPECT_EQ(executed, 1);
  EXPECT_EQ(hooks, 2);
}

TEST_F(SchedulerTest, CancelRunning) {
  auto scheduler = Make(1);
  scheduler->Enqueue(Config("run", "sleep 10000"), 20000);
  while (scheduler->Get("run")->status != JobStatus::RUNNING || executed == 0) {
    std::this_thread::sleep_for(1ms);
  }
  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(scheduler->Cancel("run"));
  JobResult res = Wait(*scheduler, "run");
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error, "Job cancelled");
  scheduler->Shutdown();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_EQ(active, 0);
  EXPECT_EQ(scheduler->Get("run")->status, JobStatus::FAILED);
}

TEST_F(SchedulerTest, CancelUnknownOrTerminal) {
  auto scheduler = Make(1);
  EXPECT_FALSE(scheduler->Cancel("nope"));
  scheduler->Enqueue(Config("done"), 10000);
  Wait(*scheduler, "done");
  EXPECT_FALSE(scheduler->Cancel("done"));
  EXPECT_EQ(scheduler->Get("done")->status, JobStatus::COMPLETED);
}

TEST_F(SchedulerTest, OverallDeadline) {
  auto scheduler = Make(1);
  auto start = std::chrono::steady_clock::now();
  scheduler->Enqueue(Config("slow", "sleep 10000"), 100);
  JobResult res = Wait(*scheduler, "slow");
  EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
  EXPECT_EQ(res.status, JobStatus::TIMEOUT);
  EXPECT_EQ(res.error_class, ErrorClass::TIMEOUT);
  EXPECT_EQ(res.error, "Job exceeded overall deadline");
  scheduler->Shutdown();
  // the worker's late result does not override the timeout
  EXPECT_EQ(scheduler->Get("slow")->status, JobStatus::TIMEOUT);
  EXPECT_EQ(hooks, 1);
}

TEST_F(SchedulerTest, ExecutorException) {
  auto scheduler = Make(1);
  scheduler->Enqueue(Config("bad", "throw"), 10000);
  JobResult res = Wait(*scheduler, "bad");
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::INTERNAL_ERROR);
  EXPECT_EQ(res.error, "Internal error");
  // the slot is released
  scheduler->Enqueue(Config("next"), 10000);
  EXPECT_EQ(Wait(*scheduler, "next").status, JobStatus::COMPLETED);
}

TEST_F(SchedulerTest, NonTerminalResult) {
  auto scheduler = Make(1);
  scheduler->Enqueue(Config("odd", "running"), 10000);
  JobResult res = Wait(*scheduler, "odd");
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::INTERNAL_ERROR);
}

TEST_F(SchedulerTest, ListNewestFirst) {
  auto scheduler = Make(4);
  for (auto id : {"l1", "l2", "l3"}) scheduler->Enqueue(Config(id), 10000);
  for (auto id : {"l1", "l2", "l3"}) Wait(*scheduler, id);
  auto list = scheduler->List();
  ASSERT_EQ(list.size(), 3u);
  EXPECT_EQ(list[0].id, "l3");
  EXPECT_EQ(list[2].id, "l1");
  EXPECT_EQ(scheduler->TotalJobs(), 3u);
}

TEST_F(SchedulerTest, EvictExpired) {
  auto scheduler = Make(1);
  scheduler->Enqueue(Config("old"), 10000);
  Wait(*scheduler, "old");
  scheduler->Enqueue(Config("pending", "sleep 10000"), 20000);
  EXPECT_EQ(scheduler->EvictExpired(1h), 0u);
  EXPECT_EQ(scheduler->EvictExpired(1h, JobScheduler::Clock::now() + 2h), 1u);
  EXPECT_FALSE(scheduler->Get("old"));
  EXPECT_TRUE(scheduler->Get("pending"));
  // an evicted id may be reused
  EXPECT_EQ(scheduler->Enqueue(Config("old"), 10000), EnqueueStatus::QUEUED);
  scheduler->Shutdown();
}

TEST_F(SchedulerTest, ShutdownCancelsEverything) {
  auto scheduler = Make(1);
  scheduler->Enqueue(Config("s1", "sleep 10000"), 20000);
  scheduler->Enqueue(Config("s2", "sleep 10000"), 20000);
  auto start = std::chrono::steady_clock::now();
  scheduler->Shutdown();
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  for (auto id : {"s1", "s2"}) {
    auto res = scheduler->Get(id);
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, JobStatus::FAILED);
    EXPECT_EQ(res->error_class, ErrorClass::CANCELLED);
  }
  EXPECT_EQ(scheduler->Enqueue(Config("late"), 10000), EnqueueStatus::STOPPED);
  EXPECT_EQ(hooks, 2);
}

TEST_F(SchedulerTest, RaiseConcurrency) {
  auto scheduler = Make(1);
  scheduler->Enqueue(Config("r1", "sleep 10000"), 20000);
  scheduler->Enqueue(Config("r2"), 20000);
  std::this_thread::sleep_for(50ms);
  EXPECT_EQ(scheduler->Get("r2")->status, JobStatus::QUEUED);
  scheduler->SetMaxConcurrent(2);
  EXPECT_EQ(Wait(*scheduler, "r2").status, JobStatus::COMPLETED);
  scheduler->Shutdown();
}
