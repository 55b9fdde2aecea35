#include <unistd.h>
#include <thread>

#include <gtest/gtest.h>
#include <codeexec/paths.h>
#include <codeexec/utils.h>
#include <codeexec/engine.h>
#include <codeexec/cjail_runtime.h>

namespace {

using namespace std::chrono_literals;

// Runs real programs through cjail; needs root and the interpreters on the host.
class SandboxScenario : public ::testing::Test {
 protected:
  std::shared_ptr<CJailRuntime> runtime;
  std::unique_ptr<ExecutionEngine> engine;

  void Require(const std::vector<std::string>& tools) {
    if (geteuid() != 0) GTEST_SKIP() << "needs root";
    if (!fs::exists(SandboxHelperPath())) GTEST_SKIP() << SandboxHelperPath() << " not built";
    for (auto& i : tools) {
      if (!fs::exists(fs::path("/usr/bin") / i)) GTEST_SKIP() << i << " not installed";
    }
    runtime = std::make_shared<CJailRuntime>();
    SecurityPolicy policy;
    policy.max_concurrent_jobs = 2;
    engine = std::make_unique<ExecutionEngine>(runtime, policy);
  }

  void TearDown() override {
    if (engine) engine->Shutdown();
  }

  static ExecutionRequest Request(const std::string& language, const std::string& code) {
    ExecutionRequest req;
    req.user_id = "scenario";
    req.language = language;
    req.code = code;
    return req;
  }
};

} // namespace

TEST_F(SandboxScenario, PythonHelloWorld) {
  Require({"python3"});
  if (IsSkipped()) return;
  std::string id = engine->Submit(Request("python", "print('Hello, World!')"));
  JobResult res = *engine->Wait(id, 60s);
  EXPECT_EQ(res.status, JobStatus::COMPLETED) << res.error;
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_NE(res.output.find("Hello, World!"), std::string::npos);
}

TEST_F(SandboxScenario, PythonStdinAndFiles) {
  Require({"python3"});
  if (IsSkipped()) return;
  auto req = Request("python",
      "n = int(input())\n"
      "data = open('data/in.txt').read()\n"
      "open('out.txt', 'w').write(str(n * int(data)))\n");
  req.stdin_data = "6\n";
  req.input_files = {{"data/in.txt", "7"}};
  req.expected_outputs = {"out.txt"};
  JobResult res = *engine->Wait(engine->Submit(req), 60s);
  EXPECT_EQ(res.status, JobStatus::COMPLETED) << res.error;
  ASSERT_EQ(res.output_files.size(), 1u);
  EXPECT_EQ(res.output_files[0].content, "42");
}

TEST_F(SandboxScenario, JavaCompilationFailure) {
  Require({"javac", "java"});
  if (IsSkipped()) return;
  std::string id = engine->Submit(Request("java",
      "public class Main { public static void main(String[] a) { System.out.println(1) } }"));
  JobResult res = *engine->Wait(id, 120s);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_EQ(res.error_class, ErrorClass::COMPILATION_FAILED);
  EXPECT_EQ(res.error.rfind("Compilation failed", 0), 0u);
}

TEST_F(SandboxScenario, PythonTimeout) {
  Require({"python3"});
  if (IsSkipped()) return;
  auto req = Request("python", "import time\ntime.sleep(10)");
  req.timeout_ms = 2000;
  auto start = std::chrono::steady_clock::now();
  JobResult res = *engine->Wait(engine->Submit(req), 60s);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_EQ(res.status, JobStatus::TIMEOUT);
  EXPECT_GE(elapsed, 2s);
  EXPECT_LT(elapsed, 4s);
}

TEST_F(SandboxScenario, CancelMidRun) {
  Require({"python3"});
  if (IsSkipped()) return;
  std::string id = engine->Submit(Request("python", "import time\nprint('go', flush=True)\ntime.sleep(30)"));
  for (int i = 0; i < 2000 && engine->GetStatus(id)->status != JobStatus::RUNNING; i++) {
    std::this_thread::sleep_for(5ms);
  }
  std::this_thread::sleep_for(300ms);
  EXPECT_TRUE(engine->Cancel(id));
  JobResult res = *engine->Wait(id, 10s);
  EXPECT_EQ(res.status, JobStatus::FAILED);
  EXPECT_NE(res.error.find("cancelled"), std::string::npos);
  engine->Shutdown();
  // every box directory is gone once the workers are joined
  std::error_code ec;
  EXPECT_TRUE(fs::is_empty(kBoxRoot, ec) || !fs::exists(kBoxRoot));
}

TEST_F(SandboxScenario, NetworkIsDisabled) {
  Require({"python3"});
  if (IsSkipped()) return;
  auto req = Request("python",
      "import socket\n"
      "try:\n"
      "  socket.create_connection(('1.1.1.1', 53), timeout=2)\n"
      "  print('connected')\n"
      "except OSError:\n"
      "  print('offline')\n");
  JobResult res = *engine->Wait(engine->Submit(req), 60s);
  EXPECT_EQ(res.status, JobStatus::COMPLETED) << res.error;
  EXPECT_NE(res.output.find("offline"), std::string::npos);
}

TEST_F(SandboxScenario, TmpIsSizeCapped) {
  Require({"python3"});
  if (IsSkipped()) return;
  auto req = Request("python",
      "chunk = b'x' * (4 << 20)\n"
      "written = 0\n"
      "try:\n"
      "  for i in range(100):\n"
      "    with open('/tmp/f%d' % i, 'wb') as f:\n"
      "      f.write(chunk)\n"
      "    written += 4\n"
      "except OSError:\n"
      "  pass\n"
      "print('written', written)\n");
  JobResult res = *engine->Wait(engine->Submit(req), 60s);
  ASSERT_EQ(res.status, JobStatus::COMPLETED) << res.error;
  size_t pos = res.output.find("written ");
  ASSERT_NE(pos, std::string::npos) << res.output;
  long written = std::stol(res.output.substr(pos + 8));
  EXPECT_GT(written, 0);
  EXPECT_LE(written * 1024, CJailRuntime::kTmpKib);
}
