#ifndef INCLUDE_CODEEXEC_POLICY_H_
#define INCLUDE_CODEEXEC_POLICY_H_

#include <map>
#include <string>
#include <vector>

struct RateLimits {
  int per_user;
  int per_project;
  long window_ms;
};

struct BlockedPattern {
  std::string regex; // ECMAScript syntax
  std::string pattern_class; // reported to the caller instead of the regex
};

struct SecurityPolicy {
  std::vector<std::string> allowed_languages;
  long max_execution_time_ms;
  long max_memory_kib;
  double max_cpu;
  int max_concurrent_jobs;
  bool network_access;
  std::map<std::string, std::vector<BlockedPattern>> blocked_patterns; // language -> patterns
  RateLimits rate_limits;
  size_t max_code_size; // bytes
  std::vector<std::string> allowed_environment;
  size_t max_env_value_length;
  long max_job_duration_ms;
  long setup_timeout_ms;
  long compile_timeout_ms;
  int max_processes;

  // defaults of a fresh deployment
  SecurityPolicy();

  bool LanguageAllowed(const std::string& language) const;
  bool EnvironmentAllowed(const std::string& name) const;
};

std::map<std::string, std::vector<BlockedPattern>> DefaultBlockedPatterns();

#endif  // INCLUDE_CODEEXEC_POLICY_H_
