#include <codeexec/runtime_registry.h>

#include <spdlog/spdlog.h>

std::vector<LanguageRuntime> DefaultRuntimes() {
  std::vector<LanguageRuntime> ret;
  {
    LanguageRuntime rt;
    rt.name = "python";
    rt.image = "python:3.11-slim";
    rt.source_file = "main.py";
    rt.file_extension = ".py";
    rt.run_command = {"/usr/bin/env", "python3", "main.py"};
    rt.dependency_install = DependencyInstall{
        "requirements.txt", ManifestFormat::LINES,
        {"/usr/bin/env", "python3", "-m", "pip", "install", "--user", "--no-cache-dir",
         "-r", "requirements.txt"}};
    ret.push_back(std::move(rt));
  }
  {
    LanguageRuntime rt;
    rt.name = "javascript";
    rt.image = "node:18-alpine";
    rt.source_file = "main.js";
    rt.file_extension = ".js";
    rt.run_command = {"/usr/bin/env", "node", "main.js"};
    rt.dependency_install = DependencyInstall{
        "package.json", ManifestFormat::PACKAGE_JSON,
        {"/usr/bin/env", "npm", "install", "--no-audit", "--no-fund"}};
    ret.push_back(std::move(rt));
  }
  {
    LanguageRuntime rt;
    rt.name = "typescript";
    rt.image = "node:18-alpine";
    rt.source_file = "main.ts";
    rt.file_extension = ".ts";
    rt.run_command = {"/usr/bin/env", "npx", "--no-install", "tsx", "main.ts"};
    rt.dependency_install = DependencyInstall{
        "package.json", ManifestFormat::PACKAGE_JSON,
        {"/usr/bin/env", "npm", "install", "--no-audit", "--no-fund"}};
    ret.push_back(std::move(rt));
  }
  {
    LanguageRuntime rt;
    rt.name = "java";
    rt.image = "openjdk:17-alpine";
    rt.source_file = "Main.java"; // public class Main
    rt.file_extension = ".java";
    rt.compile_command = {"/usr/bin/env", "javac", "-encoding", "UTF-8", "Main.java"};
    rt.run_command = {"/usr/bin/env", "java", "-cp", ".", "Main"};
    ret.push_back(std::move(rt));
  }
  {
    LanguageRuntime rt;
    rt.name = "cpp";
    rt.image = "gcc:13";
    rt.source_file = "main.cpp";
    rt.file_extension = ".cpp";
    rt.compile_command = {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-w", "-o", "main", "main.cpp"};
    rt.run_command = {"./main"};
    ret.push_back(std::move(rt));
  }
  {
    LanguageRuntime rt;
    rt.name = "c";
    rt.image = "gcc:13";
    rt.source_file = "main.c";
    rt.file_extension = ".c";
    rt.compile_command = {"/usr/bin/env", "gcc", "-std=c17", "-O2", "-w", "-o", "main", "main.c", "-lm"};
    rt.run_command = {"./main"};
    ret.push_back(std::move(rt));
  }
  {
    LanguageRuntime rt;
    rt.name = "go";
    rt.image = "golang:1.21-alpine";
    rt.source_file = "main.go";
    rt.file_extension = ".go";
    rt.setup_commands = {{"/usr/bin/env", "go", "mod", "init", "main"}};
    rt.run_command = {"/usr/bin/env", "go", "run", "main.go"};
    ret.push_back(std::move(rt));
  }
  {
    LanguageRuntime rt;
    rt.name = "rust";
    rt.image = "rust:1.75-slim";
    rt.source_file = "main.rs";
    rt.file_extension = ".rs";
    rt.compile_command = {"/usr/bin/env", "rustc", "-O", "-o", "main", "main.rs"};
    rt.run_command = {"./main"};
    ret.push_back(std::move(rt));
  }
  return ret;
}

RuntimeRegistry::RuntimeRegistry(bool load_defaults) {
  if (!load_defaults) return;
  for (auto& i : DefaultRuntimes()) runtimes_.emplace(i.name, std::move(i));
}

void RuntimeRegistry::Register(LanguageRuntime runtime) {
  std::lock_guard lck(mtx_);
  auto it = runtimes_.find(runtime.name);
  if (it != runtimes_.end()) {
    spdlog::info("Override language runtime {} (image {})", runtime.name, runtime.image);
    it->second = std::move(runtime);
  } else {
    spdlog::info("Register language runtime {} (image {})", runtime.name, runtime.image);
    std::string name = runtime.name;
    runtimes_.emplace(std::move(name), std::move(runtime));
  }
}

std::optional<LanguageRuntime> RuntimeRegistry::Find(const std::string& language) const {
  std::lock_guard lck(mtx_);
  auto it = runtimes_.find(language);
  if (it == runtimes_.end()) return std::nullopt;
  return it->second;
}

bool RuntimeRegistry::Contains(const std::string& language) const {
  std::lock_guard lck(mtx_);
  return runtimes_.count(language);
}

std::vector<std::string> RuntimeRegistry::Languages() const {
  std::lock_guard lck(mtx_);
  std::vector<std::string> ret;
  for (auto& i : runtimes_) ret.push_back(i.first);
  return ret;
}
