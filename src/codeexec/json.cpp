#include <codeexec/json.h>

#include <cmath>
#include <limits>
#include <stdexcept>

#include <codeexec/utils.h>

using nlohmann::json;

namespace {

// out-of-range numbers saturate instead of wrapping; the gate clamps or rejects them
long SaturatingLong(const json& j) {
  constexpr long kMax = std::numeric_limits<long>::max(), kMin = std::numeric_limits<long>::min();
  if (j.is_number_unsigned()) {
    auto value = j.get<json::number_unsigned_t>();
    return value > (json::number_unsigned_t)kMax ? kMax : (long)value;
  }
  if (j.is_number_float()) {
    double value = j.get<double>();
    if (std::isnan(value)) return 0;
    if (value >= (double)kMax) return kMax;
    if (value <= (double)kMin) return kMin;
    return (long)value;
  }
  return j.get<long>();
}

} // namespace

void to_json(json& j, const WorkspaceFile& f) {
  j = json{{"path", f.path}, {"content", f.content}};
}

void from_json(const json& j, WorkspaceFile& f) {
  j.at("path").get_to(f.path);
  j.at("content").get_to(f.content);
}

void from_json(const json& j, ExecutionRequest& req) {
  req = ExecutionRequest();
  if (j.contains("id")) j.at("id").get_to(req.id);
  j.at("userId").get_to(req.user_id);
  if (j.contains("projectId")) j.at("projectId").get_to(req.project_id);
  j.at("code").get_to(req.code);
  j.at("language").get_to(req.language);
  if (j.contains("timeout")) req.timeout_ms = SaturatingLong(j.at("timeout"));
  if (j.contains("memoryLimit")) req.memory_limit = j.at("memoryLimit").get<std::string>();
  if (j.contains("cpuLimit")) req.cpu_limit = j.at("cpuLimit").get<double>();
  if (j.contains("environment")) j.at("environment").get_to(req.environment);
  if (j.contains("inputFiles")) j.at("inputFiles").get_to(req.input_files);
  if (j.contains("expectedOutputs")) j.at("expectedOutputs").get_to(req.expected_outputs);
  if (j.contains("stdin")) j.at("stdin").get_to(req.stdin_data);
  if (j.contains("dependencies")) j.at("dependencies").get_to(req.dependencies);
}

void to_json(json& j, const ExecutionRequest& req) {
  j = json{
    {"userId", req.user_id},
    {"code", req.code},
    {"language", req.language},
    {"environment", req.environment},
    {"inputFiles", req.input_files},
    {"expectedOutputs", req.expected_outputs},
    {"dependencies", req.dependencies},
  };
  if (!req.id.empty()) j["id"] = req.id;
  if (!req.project_id.empty()) j["projectId"] = req.project_id;
  if (req.timeout_ms) j["timeout"] = *req.timeout_ms;
  if (req.memory_limit) j["memoryLimit"] = *req.memory_limit;
  if (req.cpu_limit) j["cpuLimit"] = *req.cpu_limit;
  if (!req.stdin_data.empty()) j["stdin"] = req.stdin_data;
}

void to_json(json& j, const JobResult& res) {
  j = json{
    {"id", res.id},
    {"status", JobStatusName(res.status)},
    {"output", res.output},
    {"error", res.error},
    {"errorClass", ErrorClassName(res.error_class)},
    {"exitCode", res.exit_code},
    {"duration", res.duration_ms},
    {"memoryUsage", res.memory_kib},
    {"cpuUsage", res.cpu_ms},
    {"outputFiles", res.output_files},
    {"language", res.language},
    {"userId", res.user_id},
    {"createdAt", res.created_at},
  };
  if (res.started_at) j["startedAt"] = res.started_at;
  if (res.finished_at) j["finishedAt"] = res.finished_at;
}

void to_json(json& j, const ExecutionMetrics& m) {
  j = json{
    {"totalExecutions", m.total_executions},
    {"successfulExecutions", m.successful_executions},
    {"failedExecutions", m.failed_executions},
    {"averageExecutionTime", m.average_duration_ms},
    {"languageUsage", m.language_usage},
    {"userUsage", m.user_usage},
  };
}

void to_json(json& j, const HealthReport& h) {
  j = json{
    {"status", HealthStatusName(h.status)},
    {"runtimeAvailable", h.runtime_available},
    {"queueLength", h.queue_length},
    {"activeJobs", h.active_jobs},
    {"maxConcurrent", h.max_concurrent},
    {"totalJobs", h.total_jobs},
  };
}

void to_json(json& j, const QueueStatus& q) {
  j = json{
    {"queueLength", q.queue_length},
    {"activeJobs", q.active_jobs},
    {"maxConcurrent", q.max_concurrent},
  };
}

void to_json(json& j, const LanguageRuntime& rt) {
  j = json{
    {"name", rt.name},
    {"image", rt.image},
    {"sourceFile", rt.source_file},
    {"fileExtension", rt.file_extension},
    {"setupCommands", rt.setup_commands},
    {"compileCommand", rt.compile_command},
    {"runCommand", rt.run_command},
  };
  if (rt.dependency_install) {
    j["dependencyInstall"] = {
      {"manifestFile", rt.dependency_install->manifest_file},
      {"format", ManifestFormatName(rt.dependency_install->format)},
      {"command", rt.dependency_install->command},
    };
  }
}

void from_json(const json& j, LanguageRuntime& rt) {
  rt = LanguageRuntime();
  j.at("name").get_to(rt.name);
  j.at("image").get_to(rt.image);
  j.at("sourceFile").get_to(rt.source_file);
  if (j.contains("fileExtension")) j.at("fileExtension").get_to(rt.file_extension);
  if (j.contains("setupCommands")) j.at("setupCommands").get_to(rt.setup_commands);
  if (j.contains("compileCommand")) j.at("compileCommand").get_to(rt.compile_command);
  j.at("runCommand").get_to(rt.run_command);
  if (j.contains("dependencyInstall")) {
    const json& dep = j.at("dependencyInstall");
    std::string format = dep.at("format").get<std::string>();
    auto parsed = ParseManifestFormat(format);
    if (!parsed) {
      throw std::invalid_argument("unknown manifest format " + format);
    }
    DependencyInstall install;
    dep.at("manifestFile").get_to(install.manifest_file);
    install.format = *parsed;
    dep.at("command").get_to(install.command);
    rt.dependency_install = std::move(install);
  }
}
