#include <codeexec/policy.h>

#include <algorithm>

std::map<std::string, std::vector<BlockedPattern>> DefaultBlockedPatterns() {
  std::vector<BlockedPattern> js = {
    {R"(\brequire\s*\(\s*['"`]child_process['"`]\s*\))", "process-spawn import"},
    {R"(\bfrom\s+['"`]child_process['"`])", "process-spawn import"},
    {R"(\brequire\s*\(\s*['"`]fs['"`]\s*\))", "filesystem import"},
    {R"(\bfrom\s+['"`]fs['"`])", "filesystem import"},
    {R"(\bprocess\.exit\b)", "process exit"},
    {R"(\beval\s*\()", "dynamic eval"},
    {R"(\bFunction\s*\()", "dynamic function constructor"},
  };
  std::vector<BlockedPattern> python = {
    {R"(\bimport\s+os\b)", "os import"},
    {R"(\bfrom\s+os\b)", "os import"},
    {R"(\bimport\s+subprocess\b)", "process-spawn import"},
    {R"(\bfrom\s+subprocess\b)", "process-spawn import"},
    {R"(\bimport\s+sys\b)", "sys import"},
    {R"(\bfrom\s+sys\b)", "sys import"},
    {R"(\bexec\s*\()", "dynamic exec"},
    {R"(\beval\s*\()", "dynamic eval"},
    {R"(\b__import__\s*\()", "dynamic import"},
  };
  return {
    {"javascript", js},
    {"typescript", js},
    {"python", python},
  };
}

SecurityPolicy::SecurityPolicy() :
    allowed_languages({"javascript", "typescript", "python", "go", "rust", "java", "cpp"}),
    max_execution_time_ms(30'000),
    max_memory_kib(512 * 1024),
    max_cpu(2),
    max_concurrent_jobs(10),
    network_access(false),
    blocked_patterns(DefaultBlockedPatterns()),
    rate_limits({100, 500, 3600L * 1000}),
    max_code_size(100'000),
    allowed_environment({"NODE_ENV", "PYTHONPATH", "GOPATH", "JAVA_HOME"}),
    max_env_value_length(1000),
    max_job_duration_ms(300'000),
    setup_timeout_ms(60'000),
    compile_timeout_ms(30'000),
    max_processes(128) {}

bool SecurityPolicy::LanguageAllowed(const std::string& language) const {
  return std::find(allowed_languages.begin(), allowed_languages.end(), language) !=
         allowed_languages.end();
}

bool SecurityPolicy::EnvironmentAllowed(const std::string& name) const {
  return std::find(allowed_environment.begin(), allowed_environment.end(), name) !=
         allowed_environment.end();
}
