#include <codeexec/security_gate.h>

#include <cmath>
#include <cctype>
#include <algorithm>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

std::string Trim(const std::string& str) {
  size_t l = str.find_first_not_of(" \t\r\n\f\v");
  if (l == std::string::npos) return "";
  size_t r = str.find_last_not_of(" \t\r\n\f\v");
  return str.substr(l, r - l + 1);
}

// Whitespace runs become one space before scanning, so a quantified \s in a
// pattern matches at most one character regardless of the input.
std::string CollapseWhitespace(const std::string& str) {
  std::string ret;
  ret.reserve(str.size());
  bool space = false;
  for (char c : str) {
    if (std::isspace((unsigned char)c)) {
      if (!space) ret.push_back(' ');
      space = true;
    } else {
      ret.push_back(c);
      space = false;
    }
  }
  return ret;
}

} // namespace

SecurityGate::SecurityGate(std::shared_ptr<const SecurityPolicy> policy, const RuntimeRegistry& registry) :
    policy_(std::move(policy)), registry_(registry) {
  for (auto& [language, list] : policy_->blocked_patterns) {
    auto& compiled = patterns_[language];
    for (auto& i : list) {
      // a malformed pattern is a configuration error; let std::regex_error propagate
      compiled.push_back({std::regex(i.regex, std::regex::ECMAScript | std::regex::optimize),
                          i.pattern_class});
    }
  }
}

void SecurityGate::CheckPath_(const std::string& path, const char* what) const {
  if (!IsSafeRelativePath(path)) {
    throw ValidationError(ValidationErrorKind::INVALID_PATH,
                          std::string("Invalid ") + what + " path: " + path);
  }
}

JobConfig SecurityGate::Validate(const ExecutionRequest& req) const {
  static const std::regex kIdRegex("^[A-Za-z0-9_.-]{1,64}$");
  // package specifiers only; no options, URLs with spaces or manifest syntax
  static const std::regex kDependencyRegex("^[A-Za-z0-9@][A-Za-z0-9@/._~^<>=!:+-]{0,127}$");
  const SecurityPolicy& policy = *policy_;

  if (Trim(req.code).empty()) {
    throw ValidationError(ValidationErrorKind::EMPTY_CODE, "Code cannot be empty");
  }
  if (req.user_id.empty()) {
    throw ValidationError(ValidationErrorKind::MISSING_USER, "User ID is required");
  }
  if (req.code.size() > policy.max_code_size) {
    throw ValidationError(ValidationErrorKind::CODE_TOO_LARGE,
        "Code exceeds maximum size of " + std::to_string(policy.max_code_size) + " bytes");
  }
  if (!req.id.empty() && !std::regex_match(req.id, kIdRegex)) {
    throw ValidationError(ValidationErrorKind::INVALID_ID, "Invalid job ID: " + req.id);
  }

  std::optional<LanguageRuntime> runtime;
  if (policy.LanguageAllowed(req.language)) runtime = registry_.Find(req.language);
  if (!runtime) {
    throw ValidationError(ValidationErrorKind::UNSUPPORTED_LANGUAGE,
                          "Language not supported: " + req.language);
  }

  if (auto it = patterns_.find(req.language); it != patterns_.end()) {
    const std::string scanned = CollapseWhitespace(req.code);
    for (auto& i : it->second) {
      if (std::regex_search(scanned, i.re)) {
        spdlog::info("Rejected code of user {}: blocked pattern {}", req.user_id, i.pattern_class);
        throw ValidationError(ValidationErrorKind::BLOCKED_PATTERN,
                              "Blocked pattern detected: " + i.pattern_class);
      }
    }
  }

  JobConfig config;
  config.id = req.id;
  config.user_id = req.user_id;
  config.project_id = req.project_id;
  config.language = req.language;
  config.code = req.code;

  for (auto& [name, value] : req.environment) {
    if (!policy.EnvironmentAllowed(name)) {
      spdlog::debug("Dropped environment variable {} of user {}", name, req.user_id);
      continue;
    }
    config.environment[name] = value.substr(0, policy.max_env_value_length);
  }

  // limits are only ever lowered to the policy maxima
  if (req.timeout_ms && *req.timeout_ms <= 0) {
    throw ValidationError(ValidationErrorKind::INVALID_LIMIT, "Timeout must be positive");
  }
  config.timeout_ms = std::min(req.timeout_ms.value_or(policy.max_execution_time_ms),
                               policy.max_execution_time_ms);
  config.memory_kib = policy.max_memory_kib;
  if (req.memory_limit) {
    std::optional<long> mem = ParseMemoryLimit(*req.memory_limit);
    if (!mem || *mem <= 0) {
      throw ValidationError(ValidationErrorKind::INVALID_LIMIT,
                            "Invalid memory limit: " + *req.memory_limit);
    }
    config.memory_kib = std::min(*mem, policy.max_memory_kib);
  }
  if (req.cpu_limit && !(std::isfinite(*req.cpu_limit) && *req.cpu_limit > 0)) {
    throw ValidationError(ValidationErrorKind::INVALID_LIMIT, "CPU limit must be positive");
  }
  config.cpu_limit = std::min(req.cpu_limit.value_or(1.0), policy.max_cpu);
  config.network_access = policy.network_access;
  config.max_processes = policy.max_processes;
  config.setup_timeout_ms = policy.setup_timeout_ms;
  config.compile_timeout_ms = policy.compile_timeout_ms;

  for (auto& i : req.input_files) {
    CheckPath_(i.path, "input file");
    if (fs::path(i.path).lexically_normal() == fs::path(runtime->source_file)) {
      throw ValidationError(ValidationErrorKind::INVALID_PATH,
                            "Input file conflicts with the source file: " + i.path);
    }
  }
  for (auto& i : req.expected_outputs) CheckPath_(i, "output file");
  for (auto& i : req.dependencies) {
    if (!std::regex_match(i, kDependencyRegex)) {
      throw ValidationError(ValidationErrorKind::INVALID_DEPENDENCY, "Invalid dependency: " + i);
    }
  }
  if (!req.dependencies.empty() && !runtime->dependency_install) {
    throw ValidationError(ValidationErrorKind::INVALID_DEPENDENCY,
                          "Dependencies are not supported for " + req.language);
  }
  config.input_files = req.input_files;
  config.expected_outputs = req.expected_outputs;
  config.stdin_data = req.stdin_data;
  config.dependencies = req.dependencies;
  config.runtime = std::move(*runtime);
  return config;
}
