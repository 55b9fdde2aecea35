#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <codeexec/paths.h>
#include "utils.h"

namespace {

bool WriteAll(int fd, const void* buf, size_t len) {
  const char* ptr = static_cast<const char*>(buf);
  while (len) {
    ssize_t ret = write(fd, ptr, len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) return false;
    ptr += ret, len -= ret;
  }
  return true;
}

bool ReadAll(int fd, void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t ret = read(fd, ptr, len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) {
      if (ret == 0) errno = EPIPE;
      return false;
    }
    ptr += ret, len -= ret;
  }
  return true;
}

} // namespace

struct cjail_result SandboxExec(const SandboxOptions& opt,
                                const std::function<void(pid_t)>& on_start,
                                const std::function<void()>& on_exit) {
  struct cjail_result ret = {};
  int inpipe[2], outpipe[2];
  pid_t pid;
  auto cmd = SandboxHelperPath();
  // serialize before forking; the child must not allocate
  auto vec = opt.Serialize();
  long size = vec.size();
  if (pipe2(inpipe, O_CLOEXEC) < 0) goto err;
  if (pipe2(outpipe, O_CLOEXEC) < 0) {
    close(inpipe[0]);
    close(inpipe[1]);
    goto err;
  }
  pid = fork();
  if (pid < 0) {
    int saved = errno;
    close(inpipe[0]), close(inpipe[1]), close(outpipe[0]), close(outpipe[1]);
    errno = saved;
    goto err;
  }
  if (pid == 0) {
    setpgid(0, 0);
    dup2(inpipe[1], 1);
    dup2(outpipe[0], 0);
    CloseFrom(3);
    if (execl(cmd.c_str(), cmd.c_str(), nullptr) < 0) _exit(1);
  }
  setpgid(pid, pid); // either side may win the race
  close(inpipe[1]);
  close(outpipe[0]);
  spdlog::debug("cjail_exec pid={} childpid={} boxdir={} command={}",
      getpid(), pid, opt.boxdir, fmt::format("{}", opt.command));
  if (on_start) on_start(pid);
  if (!WriteAll(outpipe[1], &size, sizeof(size)) ||
      !WriteAll(outpipe[1], vec.data(), vec.size()) ||
      !ReadAll(inpipe[0], &ret, sizeof(ret))) {
    int saved = errno;
    if (on_exit) on_exit();
    kill(pid, SIGKILL);
    close(inpipe[0]);
    close(outpipe[1]);
    waitpid(pid, nullptr, 0);
    errno = saved;
    goto err;
  }
  if (on_exit) on_exit();
  close(inpipe[0]);
  close(outpipe[1]);
  waitpid(pid, nullptr, 0);
  if (ret.timekill == -1) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.oomkill, strerror(ret.oomkill));
  }
  return ret;
err:
  spdlog::warn("SandboxExec error: errno={} {}", errno, strerror(errno));
  ret = {};
  ret.oomkill = errno;
  ret.timekill = -1;
  return ret;
}
