#include <codeexec/cjail_runtime.h>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <cmath>
#include <cerrno>
#include <cstring>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <codeexec/paths.h>
#include "sandbox_exec.h"
#include "utils.h"

namespace {

constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;
constexpr fs::perms kPerm711 =
    fs::perms::owner_all | fs::perms::group_exec | fs::perms::others_exec;
constexpr fs::perms kPermTmp = fs::perms::all | fs::perms::sticky_bit;

const std::vector<std::string> kSystemDirs = {
  "/usr", "/lib", "/lib64", "/lib32", "/bin", "/sbin", "/opt", "/etc/alternatives", "/etc/ssl",
};

// image references like "python:3.11-slim" become a directory name under kImageRoot
std::string ImageDirName(const std::string& image) {
  std::string ret = image;
  for (auto& c : ret) {
    if (c == '/' || c == ':') c = '_';
  }
  return ret;
}

inline long ToMs(const struct timeval& v) {
  return (long)v.tv_sec * 1000 + v.tv_usec / 1000;
}

// Opens rel below dir without following any symlink. Intermediate
// directories are created (owned by uid) when create_parents is set.
int OpenBeneath(const fs::path& dir, const fs::path& rel, int flags, mode_t mode,
                bool create_parents, int uid) {
  std::vector<std::string> comps;
  for (auto& i : rel) {
    if (i.empty() || i == ".") continue;
    if (i == "..") {
      errno = EPERM;
      return -1;
    }
    comps.push_back(i);
  }
  if (comps.empty()) {
    errno = EINVAL;
    return -1;
  }
  int dfd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
  if (dfd < 0) return -1;
  for (size_t i = 0; i + 1 < comps.size(); i++) {
    if (create_parents && mkdirat(dfd, comps[i].c_str(), 0755) == 0 && uid >= 0) {
      IGNORE_RETURN(fchownat(dfd, comps[i].c_str(), uid, uid, AT_SYMLINK_NOFOLLOW));
    }
    int nfd = openat(dfd, comps[i].c_str(), O_RDONLY | O_DIRECTORY | O_NOFOLLOW | O_CLOEXEC);
    int saved = errno;
    close(dfd);
    if (nfd < 0) {
      errno = saved;
      return -1;
    }
    dfd = nfd;
  }
  int fd = openat(dfd, comps.back().c_str(), flags | O_NOFOLLOW | O_CLOEXEC, mode);
  int saved = errno;
  close(dfd);
  errno = saved;
  return fd;
}

} // namespace

struct CJailRuntime::Box {
  SandboxHandle handle;
  SandboxSpec spec;
  int uid;
  std::vector<int> cpus;
  fs::path root;
  bool workspace_mounted, io_mounted, tmp_mounted;
  SandboxOptions base;

  fs::path Workspace() const { return root / fs::path(kWorkspace).relative_path(); }
  fs::path IoDir() const { return root / "io"; }
  fs::path TmpDir() const { return root / "tmp"; }
};

CJailRuntime::CJailRuntime(const std::vector<int>& pinned_cpus) : cpu_pool_(pinned_cpus), seq_(0) {
  for (int i = 0; i < kUidPoolSize; i++) uid_pool_.push_back(kUidBase + kUidPoolSize - 1 - i);
}

CJailRuntime::~CJailRuntime() {
  std::vector<SandboxHandle> left;
  {
    std::lock_guard lck(mtx_);
    for (auto& i : boxes_) left.push_back(i.second->handle);
  }
  for (auto& i : left) Teardown(i);
}

bool CJailRuntime::Available() {
  if (geteuid() != 0) {
    spdlog::debug("cjail runtime unavailable: not running as root");
    return false;
  }
  std::error_code ec;
  if (!fs::exists(SandboxHelperPath(), ec)) {
    spdlog::debug("cjail runtime unavailable: {} missing", SandboxHelperPath().c_str());
    return false;
  }
  if (!fs::is_directory(kBoxRoot, ec) && !CreateDirs(kBoxRoot, kPerm755)) return false;
  return true;
}

std::shared_ptr<CJailRuntime::Box> CJailRuntime::GetBox_(const SandboxHandle& handle) {
  std::lock_guard lck(mtx_);
  auto it = boxes_.find(handle.id);
  if (it == boxes_.end()) return nullptr;
  return it->second;
}

// undo everything Provision did; safe on a partially provisioned box
void CJailRuntime::Release_(Box& box) {
  if (box.workspace_mounted) Umount(box.Workspace());
  if (box.io_mounted) Umount(box.IoDir());
  if (box.tmp_mounted) Umount(box.TmpDir());
  box.workspace_mounted = box.io_mounted = box.tmp_mounted = false;
  RemoveAll(box.root);
  std::lock_guard lck(mtx_);
  uid_pool_.push_back(box.uid);
  cpu_pool_.insert(cpu_pool_.end(), box.cpus.begin(), box.cpus.end());
  box.cpus.clear();
}

SandboxHandle CJailRuntime::Provision(const SandboxSpec& spec) {
  if (!Available()) throw RuntimeUnavailableError("Sandbox runtime is not available");
  auto box = std::make_shared<Box>();
  box->spec = spec;
  box->workspace_mounted = box->io_mounted = box->tmp_mounted = false;
  {
    std::lock_guard lck(mtx_);
    if (uid_pool_.empty()) throw RuntimeUnavailableError("No free sandbox uid");
    box->uid = uid_pool_.back();
    uid_pool_.pop_back();
    size_t ncpu = std::max(1, (int)std::ceil(spec.cpu_limit));
    if (cpu_pool_.size() >= ncpu) {
      box->cpus.assign(cpu_pool_.end() - ncpu, cpu_pool_.end());
      cpu_pool_.resize(cpu_pool_.size() - ncpu);
    }
    box->handle.id = fmt::format("{:06}", ++seq_);
  }
  box->handle.job_id = spec.job_id;
  box->root = kBoxRoot / box->handle.id;
  box->handle.root = box->root;

  SandboxOptions& opt = box->base;
  opt.boxdir = box->root;
  opt.uid = opt.gid = box->uid;
  opt.cpu_set = box->cpus;
  opt.rss = spec.memory_kib;
  opt.network = spec.network_access;
  opt.file_num = 256;
  opt.fsize = kWorkspaceKib;
  opt.workdir = kWorkspace;
  std::error_code image_ec;
  if (fs::path image_dir = kImageRoot / ImageDirName(spec.image); fs::is_directory(image_dir, image_ec)) {
    opt.mount_root = image_dir;
  } else {
    spdlog::debug("Image {} not found under {}, using host directories", spec.image, kImageRoot.c_str());
  }
  opt.dirs = kSystemDirs;
  opt.FilterDirs();
  opt.envs = {"PATH=/usr/local/bin:/usr/bin:/bin", std::string("HOME=") + kWorkspace, "USER=nobody"};
  for (auto& [name, value] : spec.environment) opt.envs.push_back(name + "=" + value);

  auto Fail = [&](const std::string& msg) {
    Release_(*box);
    return RuntimeUnavailableError(msg);
  };
  if (!CreateDirs(box->root, kPerm755)) throw Fail("Failed to create sandbox root");
  {
    // symlinked system dirs (merged /usr) are recreated as links; the rest become mount points
    std::vector<std::string> mounted;
    fs::path source_root = opt.mount_root.empty() ? fs::path("/") : fs::path(opt.mount_root);
    for (auto& i : opt.dirs) {
      fs::path source = source_root / fs::path(i).relative_path();
      fs::path target = box->root / fs::path(i).relative_path();
      std::error_code ec;
      if (fs::is_symlink(source, ec)) {
        fs::path link = fs::read_symlink(source, ec);
        if (!ec) CreateDirs(target.parent_path(), kPerm755);
        if (!ec) fs::create_symlink(link, target, ec);
        if (ec) spdlog::warn("Failed linking {} in sandbox: {}", i, ec.message());
        continue;
      }
      if (!CreateDirs(target, kPerm755)) throw Fail("Failed to create mount point " + i);
      mounted.push_back(i);
    }
    opt.dirs = std::move(mounted);
  }
  if (!CreateDirs(box->TmpDir(), kPermTmp) ||
      !CreateDirs(box->root / "etc", kPerm755) ||
      !CreateDirs(box->IoDir(), kPerm711) ||
      !CreateDirs(box->Workspace(), kPerm755)) {
    throw Fail("Failed to create sandbox directories");
  }
  if (!MountTmpfs(box->Workspace(), kWorkspaceKib)) throw Fail("Failed to mount workspace");
  box->workspace_mounted = true;
  if (!MountTmpfs(box->IoDir(), kIoKib)) throw Fail("Failed to mount io directory");
  box->io_mounted = true;
  // the jailed program may not fill the host disk through /tmp
  if (!MountTmpfs(box->TmpDir(), kTmpKib)) throw Fail("Failed to mount tmp directory");
  box->tmp_mounted = true;
  std::error_code ec;
  fs::permissions(box->IoDir(), kPerm711, ec);
  if (!ec) fs::permissions(box->TmpDir(), kPermTmp, ec);
  if (ec || !Chown(box->Workspace(), box->uid, box->uid)) throw Fail("Failed to prepare workspace");

  spdlog::info("Provisioned sandbox {} for job {}: uid={} cpus={} image_root={}",
               box->handle.id, spec.job_id, box->uid, box->cpus.size(),
               opt.mount_root.empty() ? "/" : opt.mount_root);
  std::lock_guard lck(mtx_);
  boxes_[box->handle.id] = box;
  return box->handle;
}

bool CJailRuntime::WriteFile(const SandboxHandle& handle, const std::string& path,
                             const std::string& content) {
  auto box = GetBox_(handle);
  if (!box) return false;
  int fd = OpenBeneath(box->Workspace(), path, O_WRONLY | O_CREAT | O_TRUNC, 0644, true, box->uid);
  if (fd < 0) {
    spdlog::warn("Failed opening {} in sandbox {}: {}", path, handle.id, strerror(errno));
    return false;
  }
  bool ok = fchown(fd, box->uid, box->uid) == 0;
  for (size_t written = 0; ok && written < content.size();) {
    ssize_t ret = write(fd, content.data() + written, content.size() - written);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) {
      ok = false;
      break;
    }
    written += ret;
  }
  if (!ok) spdlog::warn("Failed writing {} in sandbox {}: {}", path, handle.id, strerror(errno));
  close(fd);
  return ok;
}

std::optional<std::string> CJailRuntime::ReadFile(const SandboxHandle& handle, const std::string& path,
                                                  size_t max_size) {
  auto box = GetBox_(handle);
  if (!box) return std::nullopt;
  int fd = OpenBeneath(box->Workspace(), path, O_RDONLY | O_NONBLOCK, 0, false, -1);
  if (fd < 0) return std::nullopt;
  auto ret = ReadFd(fd, max_size);
  close(fd);
  return ret;
}

ExecResult CJailRuntime::Exec(const SandboxHandle& handle, const ExecOptions& opts, JobControl& control) {
  ExecResult ret;
  auto box = GetBox_(handle);
  if (!box) {
    spdlog::warn("Exec on unknown sandbox {}", handle.id);
    return ret;
  }
  // stdin is readable by the jailed uid; stdout/stderr are owned by it
  fs::path io = box->IoDir();
  RemoveAll(io / "stdout");
  RemoveAll(io / "stderr");
  if (!::WriteFile(io / "stdin", opts.stdin_data, fs::perms::owner_read | fs::perms::owner_write |
                                                  fs::perms::group_read | fs::perms::others_read) ||
      !::WriteFile(io / "stdout", "", fs::perms::owner_read | fs::perms::owner_write) ||
      !::WriteFile(io / "stderr", "", fs::perms::owner_read | fs::perms::owner_write) ||
      !Chown(io / "stdout", box->uid, box->uid) ||
      !Chown(io / "stderr", box->uid, box->uid)) {
    return ret;
  }

  SandboxOptions opt = box->base;
  opt.command = opts.command;
  opt.input = "/io/stdin";
  opt.output = "/io/stdout";
  opt.error = "/io/stderr";
  opt.wall_time = opts.wall_time_ms * 1000;
  opt.proc_num = opts.proc_num;
  spdlog::debug("Exec phase {} in sandbox {} for job {}, wall={}ms",
                ExecPhaseName(opts.phase), handle.id, handle.job_id, opts.wall_time_ms);

  struct cjail_result res = SandboxExec(opt,
      [&control](pid_t pid) {
        // the helper leads its own process group
        if (!control.Arm([pid]() { kill(-pid, SIGKILL); })) kill(-pid, SIGKILL);
      },
      [&control]() { control.Disarm(); });

  ret.interrupted = control.Stopped();
  if (res.timekill == -1) {
    ret.ok = ret.interrupted;
    return ret;
  }
  ret.ok = true;
  ret.timed_out = res.timekill > 0;
  ret.oom_killed = res.oomkill > 0;
  if (res.info.si_code == CLD_KILLED || res.info.si_code == CLD_DUMPED) {
    ret.signal = res.info.si_status;
    ret.exit_code = 128 + res.info.si_status;
  } else {
    ret.exit_code = res.info.si_status;
  }
  ret.wall_ms = ToMs(res.time);
  ret.cpu_ms = ToMs(res.rus.ru_utime) + ToMs(res.rus.ru_stime);
  ret.max_rss_kib = res.rus.ru_maxrss;
  size_t limit = opts.output_limit_kib * 1024;
  ret.stdout_data = ::ReadFile(io / "stdout", limit).value_or("");
  ret.stderr_data = ::ReadFile(io / "stderr", limit).value_or("");
  return ret;
}

void CJailRuntime::Teardown(const SandboxHandle& handle) noexcept {
  std::shared_ptr<Box> box;
  {
    std::lock_guard lck(mtx_);
    auto it = boxes_.find(handle.id);
    if (it == boxes_.end()) {
      spdlog::warn("Teardown of unknown sandbox {}", handle.id);
      return;
    }
    box = std::move(it->second);
    boxes_.erase(it);
  }
  try {
    Release_(*box);
    spdlog::info("Removed sandbox {} of job {}", handle.id, handle.job_id);
  } catch (const std::exception& e) {
    spdlog::error("Teardown of sandbox {} failed: {}", handle.id, e.what());
  }
}
