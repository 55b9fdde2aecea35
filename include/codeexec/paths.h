#ifndef INCLUDE_CODEEXEC_PATHS_H_
#define INCLUDE_CODEEXEC_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kBoxRoot;
extern fs::path kImageRoot;

namespace internal {

// does not meant to be publicly used; only for testing
extern fs::path kDataDir;

} // internal

// helper binary that enters the jail
fs::path SandboxHelperPath();
fs::path LockFilePath();

#endif  // INCLUDE_CODEEXEC_PATHS_H_
