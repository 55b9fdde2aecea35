#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <atomic>
#include <cctype>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <fstream>
#include <regex>
#include <limits>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace {

std::atomic_long job_id_seq = 0;

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

std::string GetUniqueJobId() {
  return fmt::format("job-{:x}-{}", NowMs(), ++job_id_seq);
}

int64_t NowMs() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(JobStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* JobStatusName, JobStatus, ENUM_JOB_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(ErrorClass, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ErrorClassName, ErrorClass, ENUM_ERROR_CLASS_)
#undef X

#define X(...) X_RETURN_ARG2(HealthStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* HealthStatusName, HealthStatus, ENUM_HEALTH_STATUS_)
#undef X

#define X(...) X_RETURN_ARG2(RateLimitReason, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* RateLimitReasonDesc, RateLimitReason, ENUM_RATE_LIMIT_REASON_)
#undef X

#define X(...) X_RETURN_ARG1(ManifestFormat, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ManifestFormatName, ManifestFormat, ENUM_MANIFEST_FORMAT_)
#undef X

#define X(...) X_RETURN_ARG1(ValidationErrorKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ValidationErrorKindName, ValidationErrorKind, ENUM_VALIDATION_ERROR_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ExecPhase, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecPhaseName, ExecPhase, ENUM_EXEC_PHASE_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

std::optional<JobStatus> ParseJobStatus(const std::string& str) {
#define X(name, desc) if (str == desc) return JobStatus::name;
  ENUM_JOB_STATUS_
#undef X
  return std::nullopt;
}

std::optional<ManifestFormat> ParseManifestFormat(const std::string& str) {
#define X(name) if (str == #name) return ManifestFormat::name;
  ENUM_MANIFEST_FORMAT_
#undef X
  return std::nullopt;
}

std::optional<long> ParseMemoryLimit(const std::string& str) {
  static const std::regex kMemoryRegex("^([0-9]{1,15})([kKmMgG]?)[bB]?$");
  std::smatch match;
  if (!std::regex_match(str, match, kMemoryRegex)) return std::nullopt;
  long value = std::stol(match[1].str());
  long multiplier = 1;
  switch (match[2].length() ? std::tolower(match[2].str()[0]) : 0) {
    case 'k': break;
    case 'm': multiplier = 1024; break;
    case 'g': multiplier = 1024 * 1024; break;
    default: return (value + 1023) / 1024; // bytes
  }
  // saturate; callers clamp to their maximum
  if (value > std::numeric_limits<long>::max() / multiplier) return std::numeric_limits<long>::max();
  return value * multiplier;
}

std::vector<std::string> SplitList(const std::string& str, char sep) {
  std::vector<std::string> ret;
  size_t start = 0;
  while (start <= str.size()) {
    size_t end = str.find(sep, start);
    if (end == std::string::npos) end = str.size();
    std::string item = str.substr(start, end - start);
    size_t l = item.find_first_not_of(" \t");
    size_t r = item.find_last_not_of(" \t");
    if (l != std::string::npos) ret.push_back(item.substr(l, r - l + 1));
    start = end + 1;
  }
  return ret;
}

std::optional<std::vector<int>> ParseCpuList(const std::string& str, int ncpu) {
  std::vector<int> ret;
  if (str == "all") {
    for (int i = 0; i < ncpu; i++) ret.push_back(i);
    return ret;
  }
  if (str.empty() || str == "none") return ret;
  // a[-b[:stride]]
  static const std::regex kRangeRegex("^([0-9]{1,6})(?:-([0-9]{1,6})(?::([0-9]{1,6}))?)?$");
  for (auto& item : SplitList(str)) {
    std::smatch match;
    if (!std::regex_match(item, match, kRangeRegex)) return std::nullopt;
    int a = std::stoi(match[1].str());
    int b = match[2].matched ? std::stoi(match[2].str()) : a;
    int s = match[3].matched ? std::stoi(match[3].str()) : 1;
    if (a > b || s == 0) return std::nullopt;
    for (; a <= b && a < ncpu; a += s) ret.push_back(a);
  }
  std::sort(ret.begin(), ret.end());
  ret.erase(std::unique(ret.begin(), ret.end()), ret.end());
  return ret;
}

bool IsSafeRelativePath(const std::string& str) {
  if (str.empty() || str.find('\0') != std::string::npos) return false;
  fs::path path(str);
  if (path.is_absolute() || path.has_root_name()) return false;
  bool has_name = false;
  for (auto& i : path) {
    if (i == "..") return false;
    if (!i.empty() && i != ".") has_name = true;
  }
  return has_name;
}

std::string SanitizeOutput(const std::string& str, size_t max_length) {
  static const std::regex kWorkspaceRegex("/workspace\\S*");
  static const std::regex kTempRegex("/tmp/\\S*");
  // redaction never grows a fragment by more than one character
  std::string ret = str.substr(0, max_length * 2 + 64);
  ret = std::regex_replace(ret, kWorkspaceRegex, "[workspace]");
  ret = std::regex_replace(ret, kTempRegex, "[temp]");
  if (ret.size() > max_length) {
    size_t cut = max_length;
    while (cut > 0 && (static_cast<unsigned char>(ret[cut]) & 0xC0) == 0x80) cut--;
    ret.resize(cut);
  }
  return ret;
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}", path.c_str(), size_kib);
  bool ret = 0 == mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV,
                        ("size=" + std::to_string(size_kib) + 'k').c_str());
  if (!ret) spdlog::warn("Failed mounting tmpfs on {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  bool ret = 0 == umount2(path.c_str(), MNT_DETACH);
  if (!ret) spdlog::warn("Failed unmounting {}: {}", path.c_str(), strerror(errno));
  return ret;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool Chown(const fs::path& path, int uid, int gid) {
  if (lchown(path.c_str(), uid, gid) == 0) return true;
  spdlog::warn("Failed changing owner of {} to {}: {}", path.c_str(), uid, strerror(errno));
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::error_code ec;
  int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_NOFOLLOW | O_CLOEXEC, 0644);
  if (fd < 0) {
    ec.assign(errno, std::generic_category());
    goto err;
  }
  for (size_t written = 0; written < content.size();) {
    ssize_t ret = write(fd, content.data() + written, content.size() - written);
    if (ret < 0) {
      if (errno == EINTR) continue;
      ec.assign(errno, std::generic_category());
      close(fd);
      goto err;
    }
    written += ret;
  }
  close(fd);
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed writing {}: {}", path.c_str(), ec.message());
  return false;
}

std::optional<std::string> ReadFd(int fd, size_t max_size) {
  struct stat st;
  if (fstat(fd, &st) < 0 || !S_ISREG(st.st_mode)) return std::nullopt;
  std::string ret(std::min<size_t>(st.st_size, max_size), '\0');
  size_t cur = 0;
  while (cur < ret.size()) {
    ssize_t n = read(fd, ret.data() + cur, ret.size() - cur);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    cur += n;
  }
  ret.resize(cur);
  return ret;
}

std::optional<std::string> ReadFile(const fs::path& path, size_t max_size) {
  int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC | O_NONBLOCK);
  if (fd < 0) return std::nullopt;
  auto ret = ReadFd(fd, max_size);
  close(fd);
  return ret;
}
