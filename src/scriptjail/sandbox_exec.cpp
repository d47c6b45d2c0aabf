#include "sandbox_exec.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

bool WriteAll(int fd, const void* buf, size_t len) {
  auto ptr = static_cast<const uint8_t*>(buf);
  while (len) {
    ssize_t n = write(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, len -= n;
  }
  return true;
}

// runs between fork and exec: async-signal-safe calls only
[[noreturn]] void ChildExec(const char* cmd, int inpipe, int outpipe, const SandboxFds& fds) {
  constexpr int kHigh = 16;
  int src[] = {inpipe, outpipe, fds.result, fds.output, fds.error, fds.input};
  int dst[] = {0, 1, kJailResultFd, kJailStdoutFd, kJailStderrFd, kJailInputFd};
  int tmp[6];
  // go through high fds first so that no source is overwritten before it is copied
  for (int i = 0; i < 6; i++) {
    if ((tmp[i] = fcntl(src[i], F_DUPFD, kHigh)) < 0) _exit(1);
  }
  for (int i = 0; i < 6; i++) {
    if (dup2(tmp[i], dst[i]) < 0) _exit(1);
  }
  CloseFrom(kJailInputFd + 1);
  setpgid(0, 0);
  execl(cmd, cmd, nullptr);
  _exit(1);
}

} // namespace

pid_t SandboxSpawn(const SandboxOptions& opt, const SandboxFds& fds, int& control_fd) {
  int inpipe[2] = {-1, -1}, outpipe[2] = {-1, -1};
  auto cmd = SandboxHelperPath();
  pid_t pid = -1;
  if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(outpipe, O_CLOEXEC) < 0) goto err;
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) ChildExec(cmd.c_str(), inpipe[0], outpipe[1], fds);
  // avoid racing with the child on the process group
  setpgid(pid, pid);
  close(inpipe[0]);
  close(outpipe[1]);
  spdlog::debug("sandbox-exec pid={} root={} uid={} argv={}",
      pid, opt.root, opt.uid, fmt::format("{}", opt.argv));
  {
    auto vec = opt.Serialize();
    long size = vec.size();
    bool ok = WriteAll(inpipe[1], &size, sizeof(size)) &&
              WriteAll(inpipe[1], vec.data(), vec.size());
    int saved_errno = errno;
    close(inpipe[1]);
    if (!ok) {
      kill(-pid, SIGKILL);
      waitpid(pid, nullptr, 0);
      close(outpipe[0]);
      errno = saved_errno;
      spdlog::warn("Failed sending options to sandbox-exec: errno={} {}", errno, strerror(errno));
      return -1;
    }
  }
  control_fd = outpipe[0];
  return pid;
err:
  {
    int saved_errno = errno;
    for (int fd : {inpipe[0], inpipe[1], outpipe[0], outpipe[1]}) {
      if (fd >= 0) close(fd);
    }
    errno = saved_errno;
  }
  spdlog::warn("SandboxSpawn error: errno={} {}", errno, strerror(errno));
  return -1;
}
