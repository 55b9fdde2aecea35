#ifndef INCLUDE_CODEEXEC_RUNTIME_REGISTRY_H_
#define INCLUDE_CODEEXEC_RUNTIME_REGISTRY_H_

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <optional>

#define ENUM_MANIFEST_FORMAT_ \
  X(LINES) /* one dependency per line, e.g. requirements.txt */ \
  X(PACKAGE_JSON)
enum class ManifestFormat {
#define X(name) name,
  ENUM_MANIFEST_FORMAT_
#undef X
};

struct DependencyInstall {
  std::string manifest_file; // relative to the workspace
  ManifestFormat format;
  std::vector<std::string> command;
};

// Execution recipe of one language.
// Commands run inside the sandbox with the workspace as working directory.
struct LanguageRuntime {
  std::string name;
  std::string image;
  std::string source_file; // naming convention of the entry point, e.g. Main.java
  std::string file_extension;
  std::vector<std::vector<std::string>> setup_commands;
  std::vector<std::string> compile_command; // empty if interpreted
  std::vector<std::string> run_command;
  std::optional<DependencyInstall> dependency_install;

  bool HasCompile() const { return !compile_command.empty(); }
};

std::vector<LanguageRuntime> DefaultRuntimes();

class RuntimeRegistry {
  mutable std::mutex mtx_;
  std::map<std::string, LanguageRuntime> runtimes_;
 public:
  explicit RuntimeRegistry(bool load_defaults = true);

  // adds or overrides the entry of runtime.name
  void Register(LanguageRuntime runtime);
  std::optional<LanguageRuntime> Find(const std::string& language) const;
  bool Contains(const std::string& language) const;
  std::vector<std::string> Languages() const;
};

#endif  // INCLUDE_CODEEXEC_RUNTIME_REGISTRY_H_
