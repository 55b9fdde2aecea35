#ifndef INCLUDE_CODEEXEC_JSON_H_
#define INCLUDE_CODEEXEC_JSON_H_

#include <nlohmann/json.hpp>

#include "job.h"
#include "policy.h"
#include "metrics.h"
#include "scheduler.h"
#include "runtime_registry.h"

void to_json(nlohmann::json&, const WorkspaceFile&);
void from_json(const nlohmann::json&, WorkspaceFile&);
// throws nlohmann::json::exception on missing userId/code/language or wrong types
void from_json(const nlohmann::json&, ExecutionRequest&);
void to_json(nlohmann::json&, const ExecutionRequest&);
void to_json(nlohmann::json&, const JobResult&);
void to_json(nlohmann::json&, const ExecutionMetrics&);
void to_json(nlohmann::json&, const HealthReport&);
void to_json(nlohmann::json&, const QueueStatus&);
void to_json(nlohmann::json&, const LanguageRuntime&);
// also throws std::invalid_argument on an unknown manifest format
void from_json(const nlohmann::json&, LanguageRuntime&);

#endif  // INCLUDE_CODEEXEC_JSON_H_
