#include "sandbox.h"

#include <unistd.h>
#include <cstring>
#include <stdexcept>
#include <filesystem>

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& vec) {
  size_t cur = 0;
  auto Need = [&](size_t len) {
    if (len > vec.size() || cur > vec.size() - len) throw std::length_error("truncated sandbox options");
  };
  auto ReadInt = [&]() {
    Need(sizeof(Int));
    Int r;
    memcpy(&r, vec.data() + cur, sizeof(Int));
    cur += sizeof(Int);
    return r;
  };
  auto ReadString = [&]() {
    Int size = ReadInt();
    if (size < 0) throw std::length_error("negative string size");
    Need(size);
    std::string str(size, '\0');
    memcpy(str.data(), vec.data() + cur, size);
    cur += size;
    return str;
  };
  auto ReadSize = [&]() {
    Int size = ReadInt();
    if (size < 0 || (size_t)size > vec.size()) throw std::length_error("bad list size");
    return (size_t)size;
  };
  boxdir = ReadString();
  command.resize(ReadSize());
  for (auto& i : command) i = ReadString();
  envs.resize(ReadSize());
  for (auto& i : envs) i = ReadString();
  workdir = ReadString();
  input = ReadString();
  output = ReadString();
  error = ReadString();
  cpu_set.resize(ReadSize());
  for (auto& i : cpu_set) i = ReadInt();
  uid = ReadInt();
  gid = ReadInt();
  wall_time = ReadInt();
  cpu_time = ReadInt();
  rss = ReadInt();
  vss = ReadInt();
  proc_num = ReadInt();
  file_num = ReadInt();
  fsize = ReadInt();
  network = ReadInt();
  mount_root = ReadString();
  dirs.resize(ReadSize());
  for (auto& i : dirs) i = ReadString();
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  auto PushInt = [&](Int r) {
    size_t cur = ret.size();
    ret.resize(cur + sizeof(Int));
    memcpy(ret.data() + cur, &r, sizeof(Int));
  };
  auto PushString = [&](const std::string& str){
    PushInt(str.size());
    ret.insert(ret.end(), str.begin(), str.end());
  };
  PushString(boxdir);
  PushInt(command.size());
  for (auto& i : command) PushString(i);
  PushInt(envs.size());
  for (auto& i : envs) PushString(i);
  PushString(workdir);
  PushString(input);
  PushString(output);
  PushString(error);
  PushInt(cpu_set.size());
  for (auto& i : cpu_set) PushInt(i);
  PushInt(uid);
  PushInt(gid);
  PushInt(wall_time);
  PushInt(cpu_time);
  PushInt(rss);
  PushInt(vss);
  PushInt(proc_num);
  PushInt(file_num);
  PushInt(fsize);
  PushInt(network);
  PushString(mount_root);
  PushInt(dirs.size());
  for (auto& i : dirs) PushString(i);
  return ret;
}

void SandboxOptions::FilterDirs() {
  namespace fs = std::filesystem;
  std::vector<std::string> kept;
  for (auto& i : dirs) {
    std::error_code ec;
    fs::path source = fs::path(mount_root.empty() ? "/" : mount_root) / fs::path(i).relative_path();
    if (fs::is_directory(source, ec)) kept.push_back(i);
  }
  dirs = std::move(kept);
}

void SandboxOptions::ToCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  ctx.preservefd = 0;
  ctx.sharenet = network ? 1 : 0;
  if (!input.empty()) ctx.redir_input = input.data();
  if (!output.empty()) ctx.redir_output = output.data();
  if (!error.empty()) ctx.redir_error = error.data();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
  ret.env_buf_.push_back(nullptr);
  ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  ctx.chroot = boxdir.data();
  ctx.working_dir = workdir.data();
  // default: cgroup_root
  if (cpu_set.empty()) {
    ctx.cpuset = nullptr;
  } else {
    CPU_ZERO(&ret.cpu_set_);
    for (auto& i : cpu_set) CPU_SET(i, &ret.cpu_set_);
    ctx.cpuset = &ret.cpu_set_;
  }
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_as = vss;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_nofile = file_num;
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  // default: rlim_stack (no limit)
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time % 1'000'000;
  // default: cputime_poll_interval
  // default: seccomp_cfg
  // bind mounts; mount contexts and their strings must not move after being listed
  ret.str_buf_.reserve(dirs.size() * 2);
  ret.mnt_buf_.reserve(dirs.size());
  for (auto& i : dirs) {
    ret.mnt_buf_.emplace_back();
    struct jail_mount_ctx& mnt_ctx = ret.mnt_buf_.back();
    ret.str_buf_.push_back("bind");
    mnt_ctx.type = ret.str_buf_.back().data();
    if (mount_root.empty()) {
      mnt_ctx.source = i.data();
    } else {
      ret.str_buf_.push_back(mount_root + i);
      mnt_ctx.source = ret.str_buf_.back().data();
    }
    mnt_ctx.target = i.data();
    mnt_ctx.fstype = mnt_ctx.data = nullptr;
    mnt_ctx.flags = 0;
    mnt_list_add(ret.mnt_list_, &mnt_ctx);
  }
  ctx.mount_cfg = ret.mnt_list_;
}
