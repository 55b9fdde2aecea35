#include <codeexec/container_manager.h>

#include <chrono>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <codeexec/utils.h>

namespace {

// tears the sandbox down on every path out of Run
class TeardownGuard {
  SandboxRuntime& runtime_;
  const SandboxHandle& handle_;
 public:
  TeardownGuard(SandboxRuntime& runtime, const SandboxHandle& handle) :
      runtime_(runtime), handle_(handle) {}
  ~TeardownGuard() { runtime_.Teardown(handle_); }
};

std::string Combine(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  return a + (a.back() == '\n' ? "" : "\n") + b;
}

} // namespace

void JobLog::Append(const std::string& line) {
  std::lock_guard lck(mtx_);
  text_ += line;
  text_ += '\n';
}

std::string JobLog::Text() const {
  std::lock_guard lck(mtx_);
  return text_;
}

std::string DependencyManifest(ManifestFormat format, const std::vector<std::string>& dependencies) {
  switch (format) {
    case ManifestFormat::LINES: {
      std::string ret;
      for (auto& i : dependencies) ret += i + '\n';
      return ret;
    }
    case ManifestFormat::PACKAGE_JSON: {
      nlohmann::json deps = nlohmann::json::object();
      for (auto& i : dependencies) {
        // "name@range" pins a version; a leading @ belongs to the scope
        size_t at = i.find('@', 1);
        if (at == std::string::npos) {
          deps[i] = "latest";
        } else {
          deps[i.substr(0, at)] = i.substr(at + 1);
        }
      }
      nlohmann::json package = {
        {"name", "workspace"},
        {"version", "1.0.0"},
        {"private", true},
        {"dependencies", deps},
      };
      return package.dump(2) + '\n';
    }
  }
  __builtin_unreachable();
}

ExecResult ContainerManager::Exec_(const SandboxHandle& handle, ExecOptions&& opts,
                                   JobControl& control, JobLog& log) {
  log.Append(fmt::format("[{}] $ {}", ExecPhaseName(opts.phase), fmt::join(opts.command, " ")));
  if (control.Stopped()) {
    ExecResult ret;
    ret.ok = ret.interrupted = true;
    return ret;
  }
  ExecResult ret = runtime_.Exec(handle, opts, control);
  if (!ret.ok) {
    log.Append(fmt::format("[{}] sandbox failure", ExecPhaseName(opts.phase)));
  } else if (ret.interrupted) {
    log.Append(fmt::format("[{}] interrupted", ExecPhaseName(opts.phase)));
  } else {
    log.Append(fmt::format("[{}] exit {} in {} ms{}{}", ExecPhaseName(opts.phase), ret.exit_code,
                           ret.wall_ms, ret.timed_out ? " (timed out)" : "",
                           ret.oom_killed ? " (out of memory)" : ""));
  }
  return ret;
}

bool ContainerManager::Materialize_(const SandboxHandle& handle, const JobConfig& config,
                                    JobLog& log, std::string& error) {
  auto Write = [&](const std::string& path, const std::string& content) {
    if (runtime_.WriteFile(handle, path, content)) {
      log.Append(fmt::format("[workspace] wrote {} ({} bytes)", path, content.size()));
      return true;
    }
    error = "Setup failed: could not write " + path;
    return false;
  };
  const auto& install = config.runtime.dependency_install;
  if (!config.dependencies.empty() && install &&
      !Write(install->manifest_file, DependencyManifest(install->format, config.dependencies))) {
    return false;
  }
  if (!Write(config.runtime.source_file, config.code)) return false;
  for (auto& i : config.input_files) {
    if (!Write(i.path, i.content)) return false;
  }
  return true;
}

void ContainerManager::CollectOutputs_(const SandboxHandle& handle, const JobConfig& config,
                                       JobResult& result, JobLog& log) {
  for (auto& path : config.expected_outputs) {
    auto content = runtime_.ReadFile(handle, path, kStreamLimitKib * 1024);
    if (!content) {
      spdlog::info("Job {}: expected output {} not produced", config.id, path);
      log.Append("[collect] missing " + path);
      continue;
    }
    log.Append(fmt::format("[collect] {} ({} bytes)", path, content->size()));
    result.output_files.push_back({path, std::move(*content)});
  }
}

JobResult ContainerManager::Run(const JobConfig& config, JobControl& control, JobLog& log) {
  const auto start = std::chrono::steady_clock::now();
  JobResult result;
  result.id = config.id;
  result.language = config.language;
  result.user_id = config.user_id;
  auto Finish = [&](JobStatus status, ErrorClass error_class, const std::string& error) {
    result.status = status;
    result.error_class = error_class;
    result.error = SanitizeOutput(Combine(error, result.error), kMaxOutputLength);
    result.output = SanitizeOutput(result.output, kMaxOutputLength);
    result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    log.Append(fmt::format("[done] {} in {} ms", JobStatusName(status), result.duration_ms));
    return result;
  };
  auto Cancelled = [&]() {
    return Finish(JobStatus::FAILED, ErrorClass::CANCELLED, "Job cancelled");
  };
  if (control.Stopped()) return Cancelled();

  SandboxSpec spec;
  spec.job_id = config.id;
  spec.image = config.runtime.image;
  spec.memory_kib = config.memory_kib;
  spec.cpu_limit = config.cpu_limit;
  spec.network_access = config.network_access;
  spec.environment = config.environment;
  SandboxHandle handle;
  try {
    handle = runtime_.Provision(spec);
  } catch (const std::exception& e) {
    spdlog::error("Job {}: provisioning failed: {}", config.id, e.what());
    log.Append(std::string("[provision] failed: ") + e.what());
    return Finish(JobStatus::FAILED, ErrorClass::RUNTIME_UNAVAILABLE,
                  std::string("Runtime unavailable: ") + e.what());
  }
  TeardownGuard guard(runtime_, handle);
  log.Append("[provision] sandbox " + handle.id);

  std::string error;
  if (!Materialize_(handle, config, log, error)) {
    return Finish(JobStatus::FAILED, ErrorClass::SETUP_FAILED, error);
  }

  auto Options = [&](ExecPhase phase, const std::vector<std::string>& command, long wall_time_ms) {
    ExecOptions opts;
    opts.phase = phase;
    opts.command = command;
    opts.wall_time_ms = wall_time_ms;
    opts.proc_num = config.max_processes;
    opts.output_limit_kib = kStreamLimitKib;
    return opts;
  };
  auto SandboxFailure = [&](ExecPhase phase) {
    return Finish(JobStatus::FAILED, ErrorClass::INTERNAL_ERROR,
                  std::string("Sandbox failure during ") + ExecPhaseName(phase));
  };

  std::vector<std::vector<std::string>> setup;
  if (!config.dependencies.empty() && config.runtime.dependency_install) {
    setup.push_back(config.runtime.dependency_install->command);
  }
  setup.insert(setup.end(), config.runtime.setup_commands.begin(), config.runtime.setup_commands.end());
  for (auto& command : setup) {
    ExecResult res = Exec_(handle, Options(ExecPhase::SETUP, command, config.setup_timeout_ms), control, log);
    if (res.interrupted) return Cancelled();
    if (!res.ok) return SandboxFailure(ExecPhase::SETUP);
    if (res.timed_out) return Finish(JobStatus::TIMEOUT, ErrorClass::TIMEOUT, "Setup timed out");
    if (res.exit_code != 0) {
      return Finish(JobStatus::FAILED, ErrorClass::SETUP_FAILED,
                    "Setup failed: " + Combine(res.stderr_data, res.stdout_data));
    }
  }

  if (config.runtime.HasCompile()) {
    ExecResult res = Exec_(handle, Options(ExecPhase::COMPILE, config.runtime.compile_command,
                                           config.compile_timeout_ms), control, log);
    if (res.interrupted) return Cancelled();
    if (!res.ok) return SandboxFailure(ExecPhase::COMPILE);
    if (res.timed_out) return Finish(JobStatus::TIMEOUT, ErrorClass::TIMEOUT, "Compilation timed out");
    if (res.exit_code != 0) {
      return Finish(JobStatus::FAILED, ErrorClass::COMPILATION_FAILED,
                    "Compilation failed\n" + Combine(res.stderr_data, res.stdout_data));
    }
  }

  ExecOptions run_opts = Options(ExecPhase::RUN, config.runtime.run_command, config.timeout_ms);
  run_opts.stdin_data = config.stdin_data;
  ExecResult res = Exec_(handle, std::move(run_opts), control, log);
  if (res.interrupted) return Cancelled();
  if (!res.ok) return SandboxFailure(ExecPhase::RUN);
  result.output = res.stdout_data;
  result.error = res.stderr_data;
  result.exit_code = res.exit_code;
  result.memory_kib = res.max_rss_kib;
  result.cpu_ms = res.cpu_ms;
  CollectOutputs_(handle, config, result, log);
  if (res.timed_out) return Finish(JobStatus::TIMEOUT, ErrorClass::TIMEOUT, "Execution timed out");
  // a non-zero exit of the program itself is still a completed job
  return Finish(JobStatus::COMPLETED, ErrorClass::NONE,
                res.oom_killed ? "Memory limit exceeded" : "");
}
