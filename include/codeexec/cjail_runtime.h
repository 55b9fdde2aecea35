#ifndef INCLUDE_CODEEXEC_CJAIL_RUNTIME_H_
#define INCLUDE_CODEEXEC_CJAIL_RUNTIME_H_

#include <memory>
#include <mutex>
#include <vector>
#include <unordered_map>

#include "sandbox_runtime.h"

// Sandboxes backed by cjail (chroot, namespaces and cgroups), entered through
// the codeexec-sandbox helper. Needs root.
class CJailRuntime : public SandboxRuntime {
  struct Box;

  std::mutex mtx_;
  std::vector<int> uid_pool_, cpu_pool_;
  std::unordered_map<std::string, std::shared_ptr<Box>> boxes_;
  long seq_;

  std::shared_ptr<Box> GetBox_(const SandboxHandle&);
  void Release_(Box&);
 public:
  static constexpr int kUidBase = 50000, kUidPoolSize = 100;
  static constexpr long kWorkspaceKib = 256 * 1024;
  static constexpr long kIoKib = 32 * 1024;
  static constexpr long kTmpKib = 100 * 1024;
  static constexpr const char* kWorkspace = "/workspace";

  explicit CJailRuntime(const std::vector<int>& pinned_cpus = {});
  ~CJailRuntime() override;

  bool Available() override;
  int Capacity() const override { return kUidPoolSize; }
  SandboxHandle Provision(const SandboxSpec& spec) override;
  bool WriteFile(const SandboxHandle& handle, const std::string& path,
                 const std::string& content) override;
  std::optional<std::string> ReadFile(const SandboxHandle& handle, const std::string& path,
                                      size_t max_size) override;
  ExecResult Exec(const SandboxHandle& handle, const ExecOptions& opts, JobControl& control) override;
  void Teardown(const SandboxHandle& handle) noexcept override;
};

#endif  // INCLUDE_CODEEXEC_CJAIL_RUNTIME_H_
