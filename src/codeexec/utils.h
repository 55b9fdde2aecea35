#ifndef CODEEXEC_UTILS_H_
#define CODEEXEC_UTILS_H_

#include <string>
#include <optional>
#include <filesystem>

#include <codeexec/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

int CloseFrom(int minfd);

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool Chown(const fs::path&, int uid, int gid);

// does not follow a symlink at the final component
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);
// reads at most max_size bytes; nullopt if missing, not a regular file or unreadable
std::optional<std::string> ReadFile(const fs::path&, size_t max_size);
std::optional<std::string> ReadFd(int fd, size_t max_size);

#endif  // CODEEXEC_UTILS_H_
