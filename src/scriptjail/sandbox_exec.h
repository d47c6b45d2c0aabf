#ifndef SCRIPTJAIL_SANDBOX_EXEC_H_
#define SCRIPTJAIL_SANDBOX_EXEC_H_

#include <sys/types.h>

#include "sandbox.h"

// We separate this from sandbox.h because this needs logging functions,
//   while sandbox.h is also compiled into the small sandbox-exec helper

// fd layout of the helper; the jail keeps them (preservefd) and gets
//   fd 0/1/2 from kJailInputFd/kJailStdoutFd/kJailStderrFd
constexpr int kJailResultFd = 3;
constexpr int kJailStdoutFd = 4;
constexpr int kJailStderrFd = 5;
constexpr int kJailInputFd = 6;

// parent-side descriptors handed to the helper; they stay owned by the caller
struct SandboxFds {
  int result, output, error, input;
};

// cjail is not guaranteed to be thread-safe, so every run forks & execs sandbox-exec:
// 1. the child moves SandboxFds to the fixed layout, closes everything else,
//    starts a new process group and execs the helper
// 2. the serialized options are written to the helper's stdin
// 3. the helper writes back exactly one struct cjail_result on control_fd
// Returns the helper pid (== its process group id), or -1 on error.
// All descriptors created here are close-on-exec so concurrent spawns do not leak them.
pid_t SandboxSpawn(const SandboxOptions&, const SandboxFds&, int& control_fd);

#endif  // SCRIPTJAIL_SANDBOX_EXEC_H_
