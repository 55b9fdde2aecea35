#ifndef CODEEXEC_SANDBOX_H_
#define CODEEXEC_SANDBOX_H_

#include <string>
#include <cstdint>
#include <vector>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  std::vector<std::string> str_buf_;
  std::vector<struct jail_mount_ctx> mnt_buf_;
  struct jail_mount_list* mnt_list_;
  cpu_set_t cpu_set_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

// Everything the helper process needs to enter one jail.
class SandboxOptions {
  using Int = long; // serialize
 public:
  std::string boxdir;
  std::vector<std::string> command;
  std::vector<std::string> envs;
  // inside box (relative to boxdir but start with /)
  std::string workdir, input, output, error;
  std::vector<int> cpu_set;
  int uid, gid;
  long wall_time, cpu_time; // us
  long rss, vss; // KiB
  int proc_num;
  int file_num;
  long fsize; // KiB
  bool network;
  // bind-mounted read-only from mount_root/<dir> onto <dir> inside the box
  std::string mount_root;
  std::vector<std::string> dirs;

  SandboxOptions() :
      uid(65534), gid(65534),
      wall_time(0), cpu_time(0),
      rss(0), vss(0),
      proc_num(0),
      file_num(0),
      fsize(0),
      network(false) {}
  SandboxOptions(const std::vector<uint8_t>& serial);

  // drop dirs that do not exist under mount_root
  void FilterDirs();
  // platform dependent, only intended for same machine
  std::vector<uint8_t> Serialize() const;
  // the context points into this object; keep it alive and unmodified while ctx is used
  void ToCJailCtx(CJailCtxClass& ctx) const;
};

#endif  // CODEEXEC_SANDBOX_H_
