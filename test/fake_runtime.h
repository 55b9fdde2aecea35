#ifndef CODEEXEC_TEST_FAKE_RUNTIME_H_
#define CODEEXEC_TEST_FAKE_RUNTIME_H_

#include <map>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <codeexec/sandbox_runtime.h>
#include <codeexec/runtime_registry.h>

// In-memory SandboxRuntime. The job's source file is a script, one command
// per line:
//   print <text>        append a line to stdout
//   stderr <text>       append a line to stderr
//   cat                 copy stdin to stdout
//   sleep <ms>          interruptible; exceeding the wall limit times out
//   exit <code>         stop with that exit code
//   signal <signo>      stop as killed by a signal
//   oom                 stop as killed by the memory limit
//   write <path> <text> create a workspace file
//   crash               infrastructure failure
//   throw               Exec throws std::runtime_error
// Lines prefixed with "setup-" or "compile-" (e.g. "setup-fail",
// "compile-sleep 100") apply to that phase instead of the run phase.
class FakeSandboxRuntime : public SandboxRuntime {
 public:
  struct ExecRecord {
    std::string job_id;
    ExecPhase phase;
    std::vector<std::string> command;
  };

 private:
  struct Box {
    std::string job_id;
    SandboxSpec spec;
    std::map<std::string, std::string> files;
  };
  std::mutex mtx_;
  std::map<std::string, Box> boxes_;
  std::map<std::string, std::map<std::string, std::string>> removed_; // by job id
  std::vector<ExecRecord> execs_;
  std::vector<SandboxSpec> specs_;
  std::vector<std::string> source_files_;
  long seq_;

  std::string Script_(const SandboxHandle&);
 public:
  std::atomic<bool> available;
  std::atomic<bool> fail_provision;
  std::atomic<int> provisions, teardowns;
  std::atomic<int> active, max_active;
  std::atomic<int> capacity;

  // scripts are read from the first workspace file named like one of source_files
  explicit FakeSandboxRuntime(std::vector<std::string> source_files = {});

  bool Available() override { return available; }
  int Capacity() const override { return capacity; }
  SandboxHandle Provision(const SandboxSpec& spec) override;
  bool WriteFile(const SandboxHandle& handle, const std::string& path,
                 const std::string& content) override;
  std::optional<std::string> ReadFile(const SandboxHandle& handle, const std::string& path,
                                      size_t max_size) override;
  ExecResult Exec(const SandboxHandle& handle, const ExecOptions& opts, JobControl& control) override;
  void Teardown(const SandboxHandle& handle) noexcept override;

  std::vector<ExecRecord> Execs();
  std::vector<SandboxSpec> Specs();
  // workspace of the job's sandbox, kept after teardown
  std::map<std::string, std::string> Files(const std::string& job_id);
};

// a registry entry driven entirely by the fake runtime
LanguageRuntime FakeLanguage(const std::string& name = "fake", bool compiled = false);

#endif  // CODEEXEC_TEST_FAKE_RUNTIME_H_
