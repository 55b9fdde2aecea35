#include <thread>

#include <gtest/gtest.h>
#include <codeexec/container_manager.h>

#include "fake_runtime.h"

namespace {

class ContainerManagerTest : public ::testing::Test {
 protected:
  FakeSandboxRuntime runtime;
  ContainerManager manager{runtime};
  JobControl control;
  JobLog log;

  JobConfig Config(const std::string& script, bool compiled = false) {
    JobConfig config;
    config.id = "job-1";
    config.user_id = "user-1";
    config.language = "fake";
    config.runtime = FakeLanguage("fake", compiled);
    config.code = script;
    config.timeout_ms = 1000;
    config.memory_kib = 65536;
    config.max_processes = 128;
    config.setup_timeout_ms = 1000;
    config.compile_timeout_ms = 1000;
    return config;
  }

  void TearDown() override {
    EXPECT_EQ(runtime.provisions, runtime.teardowns);
  }
};

} // namespace

TEST_F(ContainerManagerTest, Completed) {
  JobResult res = manager.Run(Config("print hello\nstderr warn"), control, log);
  EXPECT_EQ(res.status, JobStatus::COMPLETED);
  EXPECT_EQ(res.error_class, ErrorClass::NONE);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.output, "hello\n");
  EXPECT_EQ(res.error, "warn\n");
  EXPECT_TRUE(res.Successful());
  EXPECT_EQ(runtime.provisions, 1);
  auto execs = runtime.Execs();
  ASSERT_EQ(execs.size(), 2u);
  EXPECT_EQ(execs[0].phase, ExecPhase::SETUP);
  EXPECT_EQ(execs[1].phase, ExecPhase::RUN);
  EXPECT_NE(log.Text().find("[RUN] exit 0"), std::string::npos);
}

TEST_F(ContainerManagerTest, NonZeroExitIsCompleted) {
  JobResult res = manager.Run(Config("print partial\nexit 3"), control, log);
  EXPECT_EQ(res.status, JobStatus::COMPLETED);
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_FALSE(res.Successful());
}

TEST_F(ContainerManagerTest, SignalDeath) {
  JobResult res = manager.Run(Config("signal 11"), control, log);
  EXPECT_EQ(res.status, JobStatus::COMPLETED);
  EXPECT_EQ(res.exit_code, 139);
}

TEST_F(ContainerManagerTest, MemoryLimit) {
  JobResult res = manager.Run(Config("oom"), control, log);
  EXPECT_EQ(res.status, JobStatus::COMPLETED);
  EXPECT_EQ(res.exit_code, 137);
  EXPECT_NE(res.error.find("Memory limit exceeded"), std::string::npos);
}

TEST_F(ContainerManagerTest, StdinIsPiped) {
  auto config = Config("cat");
  config.stdin_data = "1 2 3\n";
  JobResult res = manager.Run(config, control, log);
  EXPECT_EQ(res.output, "1 2 3\n");
}

TEST_F(ContainerManagerTest, SpecCarriesLimits) {
  auto config = Config("print x");
  config.environment = {{"NODE_ENV", "test"}};
  config.cpu_limit = 0.5;
  manager.Run(config, control, log);
  auto specs = runtime.Specs();
  ASSERT_EQ(specs.size(), 1u);
  EXPECT_EQ(specs[0].image, "fake:1");
  EXPECT_EQ(specs[0].memory_kib, 65536);
  EXPECT_DOUBLE_EQ(specs[0].cpu_limit, 0.5);
  EXPECT_FALSE(specs[0].network_access);
  EXPECT_EQ(specs[0].environment.at("NODE_ENV"), "test");
}

TEST_F(ContainerManagerTest, SetupFailure) {
  JobResult res = manager.Run(Config("setup-fail\nprint never"), control, log);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::SETUP_FAILED);
  EXPECT_EQ(res.error.rfind("Setup failed: ", 0), 0u);
  EXPECT_NE(res.error.find("install error"), std::string::npos);
  EXPECT_EQ(res.output, "");
}

TEST_F(ContainerManagerTest, SetupTimeout) {
  auto config = Config("setup-sleep 5000");
  config.setup_timeout_ms = 50;
  JobResult res = manager.Run(config, control, log);
  EXPECT_EQ(res.status, JobStatus::TIMEOUT);
  EXPECT_EQ(res.error, "Setup timed out");
}

TEST_F(ContainerManagerTest, CompilationFailure) {
  JobResult res = manager.Run(Config("compile-fail", true), control, log);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::COMPILATION_FAILED);
  EXPECT_EQ(res.error.rfind("Compilation failed\n", 0), 0u);
  EXPECT_NE(res.error.find("expected ';'"), std::string::npos);
  for (auto& i : runtime.Execs()) EXPECT_NE(i.phase, ExecPhase::RUN);
}

TEST_F(ContainerManagerTest, CompilationTimeout) {
  auto config = Config("compile-sleep 5000", true);
  config.compile_timeout_ms = 50;
  JobResult res = manager.Run(config, control, log);
  EXPECT_EQ(res.status, JobStatus::TIMEOUT);
  EXPECT_EQ(res.error, "Compilation timed out");
}

TEST_F(ContainerManagerTest, RunTimeout) {
  auto config = Config("print started\nsleep 5000");
  config.timeout_ms = 100;
  auto start = std::chrono::steady_clock::now();
  JobResult res = manager.Run(config, control, log);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
  EXPECT_EQ(res.status, JobStatus::TIMEOUT);
  EXPECT_EQ(res.error_class, ErrorClass::TIMEOUT);
  EXPECT_NE(res.error.find("Execution timed out"), std::string::npos);
  EXPECT_EQ(res.output, "started\n");
}

TEST_F(ContainerManagerTest, ProvisionFailure) {
  runtime.fail_provision = true;
  JobResult res = manager.Run(Config("print x"), control, log);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::RUNTIME_UNAVAILABLE);
  EXPECT_EQ(res.error.rfind("Runtime unavailable: ", 0), 0u);
  EXPECT_EQ(runtime.provisions, 0);
  EXPECT_EQ(runtime.teardowns, 0);
}

TEST_F(ContainerManagerTest, WriteFailure) {
  auto config = Config("print x");
  config.input_files = {{"unwritable.txt", "data"}};
  JobResult res = manager.Run(config, control, log);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::SETUP_FAILED);
  EXPECT_EQ(res.error, "Setup failed: could not write unwritable.txt");
  EXPECT_EQ(runtime.teardowns, 1);
}

TEST_F(ContainerManagerTest, SandboxFailure) {
  JobResult res = manager.Run(Config("crash"), control, log);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::INTERNAL_ERROR);
  EXPECT_EQ(res.error, "Sandbox failure during RUN");
}

TEST_F(ContainerManagerTest, ExceptionStillTearsDown) {
  EXPECT_THROW(manager.Run(Config("throw"), control, log), std::runtime_error);
  EXPECT_EQ(runtime.teardowns, 1);
}

TEST_F(ContainerManagerTest, StoppedBeforeStart) {
  control.Stop();
  JobResult res = manager.Run(Config("print x"), control, log);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::CANCELLED);
  EXPECT_EQ(runtime.provisions, 0);
}

TEST_F(ContainerManagerTest, StopWhileRunning) {
  std::thread stopper([this]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    control.Stop();
  });
  auto config = Config("sleep 10000");
  config.timeout_ms = 20000;
  JobResult res = manager.Run(config, control, log);
  stopper.join();
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::CANCELLED);
  EXPECT_EQ(res.error, "Job cancelled");
  EXPECT_EQ(runtime.teardowns, 1);
}

TEST_F(ContainerManagerTest, WorkspaceMaterialization) {
  auto config = Config("print x");
  config.input_files = {{"data/in.txt", "42"}};
  config.dependencies = {"left-pad", "chalk"};
  manager.Run(config, control, log);
  auto files = runtime.Files("job-1");
  EXPECT_EQ(files.at("main.fake"), "print x");
  EXPECT_EQ(files.at("data/in.txt"), "42");
  EXPECT_EQ(files.at("deps.txt"), "left-pad\nchalk\n");
  auto execs = runtime.Execs();
  ASSERT_EQ(execs.size(), 3u);
  // dependency install runs before the recipe setup commands
  EXPECT_EQ(execs[0].command, std::vector<std::string>({"install", "deps.txt"}));
  EXPECT_EQ(execs[1].command, std::vector<std::string>({"prepare"}));
}

TEST_F(ContainerManagerTest, NoManifestWithoutDependencies) {
  manager.Run(Config("print x"), control, log);
  EXPECT_FALSE(runtime.Files("job-1").count("deps.txt"));
  EXPECT_EQ(runtime.Execs().size(), 2u);
}

TEST_F(ContainerManagerTest, CollectOutputs) {
  auto config = Config("write out/a.txt alpha\nwrite b.txt /workspace/secret");
  config.expected_outputs = {"out/a.txt", "b.txt", "missing.txt"};
  JobResult res = manager.Run(config, control, log);
  ASSERT_EQ(res.output_files.size(), 2u);
  EXPECT_EQ(res.output_files[0].path, "out/a.txt");
  EXPECT_EQ(res.output_files[0].content, "alpha");
  EXPECT_EQ(res.output_files[1].content, "/workspace/secret");
  EXPECT_NE(log.Text().find("[collect] missing missing.txt"), std::string::npos);
}

TEST_F(ContainerManagerTest, OutputIsSanitized) {
  JobResult res = manager.Run(
      Config("print " + std::string(20000, 'a') + "\nstderr File \"/workspace/main.py\", line 1 /tmp/xyz"),
      control, log);
  EXPECT_EQ(res.output.size(), ContainerManager::kMaxOutputLength);
  EXPECT_EQ(res.error, "File \"[workspace] line 1 [temp]\n");
}
