#include <errno.h>
#include <unistd.h>
#include <vector>
#include <stdexcept>

#include "sandbox.h"

// sandbox-exec: reads serialized SandboxOptions from stdin, runs the jail,
//   writes the raw cjail_result to stdout.
// fds 3.. are set up by the parent (see sandbox_exec.cpp) and handed to the jail.

namespace {

bool ReadAll(int fd, void* buf, size_t len) {
  auto ptr = static_cast<uint8_t*>(buf);
  while (len) {
    ssize_t n = read(fd, ptr, len);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) return false;
    ptr += n, len -= n;
  }
  return true;
}

struct cjail_result SandboxExec(const SandboxOptions& opt) {
  CJailContext ctx;
  opt.ToCJailCtx(ctx);
  struct cjail_result ret = {};
  if (cjail_exec(ctx.Get(), &ret) < 0) {
    ret.oomkill = errno;
    ret.timekill = -1;
  }
  return ret;
}

} // namespace

int main() {
  long sz = 0;
  if (!ReadAll(0, &sz, sizeof(sz)) || sz <= 0 || sz > (16L << 20)) return 1;
  std::vector<uint8_t> buf(sz);
  if (!ReadAll(0, buf.data(), sz)) return 1;
  close(0);
  struct cjail_result res = {};
  try {
    res = SandboxExec(SandboxOptions(buf));
  } catch (std::out_of_range&) {
    res.oomkill = EINVAL;
    res.timekill = -1;
  }
  if (write(1, &res, sizeof(res)) != sizeof(res)) return 1;
}
