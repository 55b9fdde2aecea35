#ifndef INCLUDE_CODEEXEC_UTILS_H_
#define INCLUDE_CODEEXEC_UTILS_H_

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include "job.h"
#include "metrics.h"
#include "rate_limiter.h"
#include "security_gate.h"
#include "sandbox_runtime.h"
#include "runtime_registry.h"

std::string GetUniqueJobId();
int64_t NowMs();

const char* JobStatusName(JobStatus);
std::optional<JobStatus> ParseJobStatus(const std::string&);
const char* ErrorClassName(ErrorClass);
const char* HealthStatusName(HealthStatus);
const char* RateLimitReasonDesc(RateLimitReason);
const char* ManifestFormatName(ManifestFormat);
std::optional<ManifestFormat> ParseManifestFormat(const std::string&);

// logging
const char* ValidationErrorKindName(ValidationErrorKind);
const char* ExecPhaseName(ExecPhase);

// "512m", "1g", "65536k", "1048576" (bytes) -> KiB; nullopt if malformed
std::optional<long> ParseMemoryLimit(const std::string&);
// "0-3,8,10-14:2" or "all"; nullopt if malformed
std::optional<std::vector<int>> ParseCpuList(const std::string&, int ncpu);
std::vector<std::string> SplitList(const std::string&, char sep = ',');

// relative, non-empty, no ".." component
bool IsSafeRelativePath(const std::string&);
// redacts workspace and temp paths, then truncates to max_length
std::string SanitizeOutput(const std::string&, size_t max_length);

#endif  // INCLUDE_CODEEXEC_UTILS_H_
