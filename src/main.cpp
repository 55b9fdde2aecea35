#include <fcntl.h>
#include <unistd.h>
#include <csignal>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <codeexec/json.h>
#include <codeexec/utils.h>
#include <codeexec/paths.h>
#include <codeexec/engine.h>
#include <codeexec/logger.h>
#include <codeexec/cjail_runtime.h>

namespace {

struct Settings {
  SecurityPolicy policy;
  EngineOptions options;
  std::string pinned_cpus;
  std::string input;
  bool to_lock = true;
  bool list_languages = false;
  bool health = false;
  int verbosity = 0;
};

bool ParseConfig(const fs::path& conf_path, Settings& settings) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  SecurityPolicy& policy = settings.policy;
  std::string box_root = ini[""]["box_root"] | "";
  std::string image_root = ini[""]["image_root"] | "";
  if (box_root.size()) kBoxRoot = box_root;
  if (image_root.size()) kImageRoot = image_root;
  policy.max_concurrent_jobs = ini[""]["parallel"] | policy.max_concurrent_jobs;
  settings.pinned_cpus = ini[""]["pinned_cpus"] | settings.pinned_cpus;
  policy.max_execution_time_ms = ini[""]["max_execution_time_ms"] | policy.max_execution_time_ms;
  policy.max_memory_kib = (ini[""]["max_memory_mb"] | (policy.max_memory_kib / 1024)) * 1024;
  policy.max_cpu = ini[""]["max_cpu"] | policy.max_cpu;
  policy.max_code_size = (ini[""]["max_code_kb"] | (long)(policy.max_code_size / 1000)) * 1000;
  policy.max_job_duration_ms = ini[""]["max_job_duration_ms"] | policy.max_job_duration_ms;
  policy.network_access = ini[""]["network_access"] | policy.network_access;
  policy.setup_timeout_ms = ini[""]["setup_timeout_ms"] | policy.setup_timeout_ms;
  policy.compile_timeout_ms = ini[""]["compile_timeout_ms"] | policy.compile_timeout_ms;
  std::string languages = ini[""]["allowed_languages"] | "";
  if (languages.size()) policy.allowed_languages = SplitList(languages);
  long retention_s = ini[""]["result_retention_s"] |
      (long)std::chrono::duration_cast<std::chrono::seconds>(settings.options.result_retention).count();
  settings.options.result_retention = std::chrono::seconds(retention_s);
  policy.rate_limits.per_user = ini["rate_limit"]["per_user"] | policy.rate_limits.per_user;
  policy.rate_limits.per_project = ini["rate_limit"]["per_project"] | policy.rate_limits.per_project;
  policy.rate_limits.window_ms = (ini["rate_limit"]["window_s"] | (policy.rate_limits.window_ms / 1000)) * 1000;
  return true;
}

Settings ParseArgs(int argc, char** argv) {
  Settings settings;
  argparse::ArgumentParser parser(argc ? argv[0] : "codeexec-run");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/codeexec.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++settings.verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum concurrent jobs");
  parser.add_argument("-i", "--input")
    .default_value(std::string("-"))
    .help("JSON Lines file of execution requests; - for stdin");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");
  parser.add_argument("--pinned-cpus")
    .default_value(std::string(""))
    .help("Comma-separated list of CPUs to pin or simply \"all\"");
  parser.add_argument("--languages")
    .default_value(false)
    .implicit_value(true)
    .help("Print the supported languages and exit");
  parser.add_argument("--health")
    .default_value(false)
    .implicit_value(true)
    .help("Print the health report and exit");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (settings.verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file, settings)) {
    // the built-in defaults are a complete configuration
    spdlog::warn("Cannot read configuration file {}, using defaults", std::string(config_file));
  }
  if (auto val = parser.present<int>("--parallel")) {
    settings.policy.max_concurrent_jobs = val.value();
  }
  settings.to_lock = parser["--no-lock"] == false;
  if (auto pinned_cpus = parser.get<std::string>("--pinned-cpus"); pinned_cpus.size()) {
    settings.pinned_cpus = pinned_cpus;
  }
  settings.input = parser.get<std::string>("--input");
  settings.list_languages = parser["--languages"] == true;
  settings.health = parser["--health"] == true;
  return settings;
}

bool LockFile() {
  fs::path lock_file = LockFilePath();
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

void PrintJSON(const nlohmann::json& j) {
  std::cout << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

// submits every request, then prints the results in input order
int RunRequests(ExecutionEngine& engine, std::istream& in) {
  using nlohmann::json;
  std::vector<std::string> ids;
  std::string line;
  long lineno = 0;
  int rejected = 0;
  while (std::getline(in, line)) {
    lineno++;
    if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
    try {
      ExecutionRequest req = json::parse(line).get<ExecutionRequest>();
      ids.push_back(engine.Submit(req));
    } catch (const ValidationError& err) {
      rejected++;
      PrintJSON({{"line", lineno}, {"rejected", ValidationErrorKindName(err.Kind())}, {"error", err.what()}});
    } catch (const RateLimitError& err) {
      rejected++;
      PrintJSON({{"line", lineno}, {"rejected", "RATE_LIMITED"}, {"error", err.what()}});
    } catch (const std::exception& err) {
      rejected++;
      spdlog::warn("Malformed request on line {}: {}", lineno, err.what());
      PrintJSON({{"line", lineno}, {"rejected", "MALFORMED"}, {"error", err.what()}});
    }
  }
  int failed = 0;
  for (auto& id : ids) {
    std::optional<JobResult> res = engine.Wait(id);
    if (!res) continue;
    if (!res->Successful()) failed++;
    PrintJSON(*res);
  }
  spdlog::info("{} submitted, {} rejected, {} unsuccessful", ids.size(), rejected, failed);
  return rejected || failed ? 2 : 0;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  // a sandboxed program may close its stdin early
  signal(SIGPIPE, SIG_IGN);
  Settings settings = ParseArgs(argc, argv);

  auto cpus = ParseCpuList(settings.pinned_cpus, std::thread::hardware_concurrency());
  if (!cpus) {
    spdlog::error("Invalid CPU list {}", settings.pinned_cpus);
    return 1;
  }
  auto runtime = std::make_shared<CJailRuntime>(*cpus);
  if (!settings.list_languages && !settings.health) {
    if (geteuid() != 0) {
      spdlog::error("Must be run as root.");
      return 1;
    }
    if (settings.to_lock && !LockFile()) {
      spdlog::error("Another engine instance is running.");
      return 1;
    }
  }

  ExecutionEngine engine(runtime, settings.policy, settings.options);
  if (settings.list_languages) {
    for (auto& i : engine.ListSupportedLanguages()) std::cout << i << '\n';
    return 0;
  }
  if (settings.health) {
    PrintJSON(engine.HealthCheck());
    return 0;
  }

  int ret;
  if (settings.input == "-") {
    ret = RunRequests(engine, std::cin);
  } else {
    std::ifstream fin(settings.input);
    if (!fin) {
      spdlog::error("Cannot open input file {}", settings.input);
      return 1;
    }
    ret = RunRequests(engine, fin);
  }
  if (settings.verbosity) PrintJSON({{"metrics", engine.GetMetrics()}});
  engine.Shutdown();
  return ret;
}
