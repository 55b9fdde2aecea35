#ifndef INCLUDE_CODEEXEC_SANDBOX_RUNTIME_H_
#define INCLUDE_CODEEXEC_SANDBOX_RUNTIME_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <functional>

// Stop signal shared between the scheduler and the process running a job's
// current phase. The running phase arms an interrupt; Stop() fires it once.
class JobControl {
  mutable std::mutex mtx_;
  bool stopped_;
  std::function<void()> interrupt_;
 public:
  JobControl() : stopped_(false) {}

  // returns false (without arming) if already stopped
  bool Arm(std::function<void()> interrupt);
  void Disarm();
  void Stop();
  bool Stopped() const;
};

class RuntimeUnavailableError : public std::runtime_error {
 public:
  explicit RuntimeUnavailableError(const std::string& msg) : std::runtime_error(msg) {}
};

struct SandboxSpec {
  std::string job_id;
  std::string image;
  long memory_kib;
  double cpu_limit;
  bool network_access;
  std::map<std::string, std::string> environment;
};

struct SandboxHandle {
  std::string id;
  std::string job_id;
  std::string root; // box directory
};

#define ENUM_EXEC_PHASE_ \
  X(SETUP) \
  X(COMPILE) \
  X(RUN)
enum class ExecPhase {
#define X(name) name,
  ENUM_EXEC_PHASE_
#undef X
};

struct ExecOptions {
  ExecPhase phase;
  std::vector<std::string> command;
  std::string stdin_data;
  long wall_time_ms;
  int proc_num;
  long output_limit_kib; // per stream

  ExecOptions() :
      phase(ExecPhase::RUN), wall_time_ms(0), proc_num(0), output_limit_kib(1024) {}
};

struct ExecResult {
  bool ok; // false on infrastructure failure
  bool timed_out;
  bool oom_killed;
  bool interrupted; // killed through JobControl
  int exit_code; // 128 + signal on signal death
  int signal;
  std::string stdout_data, stderr_data;
  long wall_ms, cpu_ms;
  long max_rss_kib;

  ExecResult() :
      ok(false), timed_out(false), oom_killed(false), interrupted(false),
      exit_code(-1), signal(0), wall_ms(0), cpu_ms(0), max_rss_kib(0) {}
};

// Backend that creates isolated sandboxes. Implementations must be safe to
// call from several job workers at once.
class SandboxRuntime {
 public:
  virtual ~SandboxRuntime() = default;

  virtual bool Available() = 0;
  // most sandboxes that can exist at once; 0 if unbounded
  virtual int Capacity() const { return 0; }
  // throws RuntimeUnavailableError; nothing is left behind on failure
  virtual SandboxHandle Provision(const SandboxSpec& spec) = 0;
  // paths are relative to the workspace
  virtual bool WriteFile(const SandboxHandle& handle, const std::string& path,
                         const std::string& content) = 0;
  virtual std::optional<std::string> ReadFile(const SandboxHandle& handle, const std::string& path,
                                              size_t max_size) = 0;
  // blocks until the command exits, times out or is interrupted
  virtual ExecResult Exec(const SandboxHandle& handle, const ExecOptions& opts, JobControl& control) = 0;
  // kills whatever still runs and removes the sandbox; never throws
  virtual void Teardown(const SandboxHandle& handle) noexcept = 0;
};

#endif  // INCLUDE_CODEEXEC_SANDBOX_RUNTIME_H_
