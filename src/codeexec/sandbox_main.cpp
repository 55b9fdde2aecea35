#include <errno.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <stdexcept>

#include "sandbox.h"

namespace {

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  CJailCtxClass ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(&ctx.GetCtx(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

bool ReadAll(void* buf, size_t len) {
  char* ptr = static_cast<char*>(buf);
  while (len) {
    ssize_t ret = read(0, ptr, len);
    if (ret < 0 && errno == EINTR) continue;
    if (ret <= 0) return false;
    ptr += ret, len -= ret;
  }
  return true;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(&sz, sizeof(sz)) || sz < 0 || sz > (64L << 20)) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(buf.data(), sz)) return 1;
  struct cjail_result res = {};
  if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
    res.oomkill = errno;
    res.timekill = -1;
  } else {
    try {
      res = SandboxExec(SandboxOptions(buf));
    } catch (const std::length_error&) {
      res.oomkill = EINVAL;
      res.timekill = -1;
    }
  }
  if (write(1, &res, sizeof(res)) != sizeof(res)) return 1;
}
