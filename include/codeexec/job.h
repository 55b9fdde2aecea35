#ifndef INCLUDE_CODEEXEC_JOB_H_
#define INCLUDE_CODEEXEC_JOB_H_

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "runtime_registry.h"

#define ENUM_JOB_STATUS_ \
  X(QUEUED, "queued") \
  X(RUNNING, "running") \
  X(COMPLETED, "completed") \
  X(FAILED, "failed") \
  X(TIMEOUT, "timeout")
enum class JobStatus {
#define X(name, str) name,
  ENUM_JOB_STATUS_
#undef X
};

#define ENUM_ERROR_CLASS_ \
  X(NONE, "none") \
  X(SETUP_FAILED, "setup_failed") \
  X(COMPILATION_FAILED, "compilation_failed") \
  X(RUNTIME_UNAVAILABLE, "runtime_unavailable") \
  X(TIMEOUT, "timeout") \
  X(CANCELLED, "cancelled") \
  X(INTERNAL_ERROR, "internal_error")
enum class ErrorClass {
#define X(name, str) name,
  ENUM_ERROR_CLASS_
#undef X
};

inline bool IsTerminal(JobStatus status) {
  return status == JobStatus::COMPLETED || status == JobStatus::FAILED ||
         status == JobStatus::TIMEOUT;
}

struct WorkspaceFile {
  std::string path; // relative to the workspace
  std::string content;
};

struct ExecutionRequest {
  std::string id; // optional; generated when empty
  std::string user_id;
  std::string project_id; // optional
  std::string code;
  std::string language;
  std::optional<long> timeout_ms;
  std::optional<std::string> memory_limit; // e.g. "256m"
  std::optional<double> cpu_limit; // cores
  std::map<std::string, std::string> environment;
  std::vector<WorkspaceFile> input_files;
  std::vector<std::string> expected_outputs;
  std::string stdin_data;
  std::vector<std::string> dependencies;
};

// Sanitized and policy-clamped form of an ExecutionRequest
struct JobConfig {
  std::string id;
  std::string user_id;
  std::string project_id;
  std::string language;
  LanguageRuntime runtime;
  std::string code;
  std::map<std::string, std::string> environment;
  long timeout_ms;
  long memory_kib;
  double cpu_limit;
  bool network_access;
  int max_processes;
  long setup_timeout_ms;
  long compile_timeout_ms;
  std::vector<WorkspaceFile> input_files;
  std::vector<std::string> expected_outputs;
  std::string stdin_data;
  std::vector<std::string> dependencies;

  JobConfig() :
      timeout_ms(0), memory_kib(0), cpu_limit(1),
      network_access(false), max_processes(0),
      setup_timeout_ms(0), compile_timeout_ms(0) {}
};

struct JobResult {
  std::string id;
  JobStatus status;
  std::string output;
  std::string error;
  ErrorClass error_class;
  int exit_code;
  long duration_ms;
  long memory_kib; // peak
  long cpu_ms;
  std::vector<WorkspaceFile> output_files;
  std::string language;
  std::string user_id;
  // unix time in ms; 0 if not reached
  int64_t created_at, started_at, finished_at;

  JobResult() :
      status(JobStatus::QUEUED), error_class(ErrorClass::NONE),
      exit_code(-1), duration_ms(0), memory_kib(0), cpu_ms(0),
      created_at(0), started_at(0), finished_at(0) {}

  bool Successful() const { return status == JobStatus::COMPLETED && exit_code == 0; }
};

#endif  // INCLUDE_CODEEXEC_JOB_H_
