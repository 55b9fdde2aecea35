#ifndef CODEEXEC_SANDBOX_EXEC_H_
#define CODEEXEC_SANDBOX_EXEC_H_

#include <sys/types.h>
#include <functional>

#include "sandbox.h"

// We separate this from sandbox.h because this function needs logging,
//   while sandbox.h is also linked into the small helper binary

// Runs the options in the codeexec-sandbox helper and waits for its result.
// The helper leads its own process group; on_start receives its pid right
// after fork, and on_exit runs once the result is read but before the helper
// is reaped, so killing the group inside [on_start, on_exit] never hits a
// recycled pid.
// On infrastructure failure the result has timekill = -1 and errno in oomkill.
struct cjail_result SandboxExec(const SandboxOptions&,
                                const std::function<void(pid_t)>& on_start = nullptr,
                                const std::function<void()>& on_exit = nullptr);

#endif  // CODEEXEC_SANDBOX_EXEC_H_
