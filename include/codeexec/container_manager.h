#ifndef INCLUDE_CODEEXEC_CONTAINER_MANAGER_H_
#define INCLUDE_CODEEXEC_CONTAINER_MANAGER_H_

#include <mutex>
#include <string>

#include "job.h"
#include "sandbox_runtime.h"

// Append-only text log of one job, readable while the job runs.
class JobLog {
  mutable std::mutex mtx_;
  std::string text_;
 public:
  void Append(const std::string& line);
  std::string Text() const;
};

// Runs one job through provision, workspace, setup, compile, run,
// output collection and teardown.
class ContainerManager {
  SandboxRuntime& runtime_;

  ExecResult Exec_(const SandboxHandle&, ExecOptions&&, JobControl&, JobLog&);
  bool Materialize_(const SandboxHandle&, const JobConfig&, JobLog&, std::string& error);
  void CollectOutputs_(const SandboxHandle&, const JobConfig&, JobResult&, JobLog&);
 public:
  static constexpr size_t kMaxOutputLength = 10000;
  static constexpr long kStreamLimitKib = 1024;

  explicit ContainerManager(SandboxRuntime& runtime) : runtime_(runtime) {}

  // result.status is always terminal; never throws for job-level failures
  JobResult Run(const JobConfig& config, JobControl& control, JobLog& log);
};

// content of the manifest file listing the declared dependencies
std::string DependencyManifest(ManifestFormat format, const std::vector<std::string>& dependencies);

#endif  // INCLUDE_CODEEXEC_CONTAINER_MANAGER_H_
