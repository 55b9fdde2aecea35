#include <codeexec/paths.h>

fs::path kBoxRoot = "/tmp/codeexec_box";
fs::path kImageRoot = "/var/lib/codeexec/images";

namespace internal {
fs::path kDataDir = fs::path(CODEEXEC_DATA_DIR);
} // internal

fs::path SandboxHelperPath() {
  return internal::kDataDir / "codeexec-sandbox";
}

fs::path LockFilePath() {
  return internal::kDataDir / "lock";
}
