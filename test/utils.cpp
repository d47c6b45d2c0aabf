#include "utils.h"

#include <unistd.h>
#include <sys/wait.h>
#include <filesystem>
#include <scriptjail/paths.h>

const char kTestBoxRoot[] = "/tmp/scriptjail_test_box";

SandboxPolicy TestPolicy() {
  SandboxPolicy policy;
  policy.box_root = kTestBoxRoot;
  policy.wall_time_us = 2'000'000;
  policy.cpu_time_us = 2'000'000;
  policy.kill_grace_us = 500'000;
  policy.memory_kib = 256 * 1024;
  policy.max_stdout_bytes = 64 << 10;
  return policy;
}

bool CanRunSandbox(const SandboxPolicy& policy) {
  std::error_code ec;
  return geteuid() == 0 &&
         fs::exists(internal::kDataDir / "sandbox-exec", ec) &&
         fs::exists(internal::kDataDir / "entry_point.py", ec) &&
         fs::exists(policy.python, ec);
}

RunRecord ExitedRecord(int exit_code, const std::string& channel,
                       const std::string& out, const std::string& err) {
  SandboxPolicy policy = TestPolicy();
  RunRecord rec(policy.max_stdout_bytes, policy.max_stderr_bytes, policy.max_result_bytes);
  rec.helper_reported = true;
  rec.result.info.si_code = CLD_EXITED;
  rec.result.info.si_status = exit_code;
  rec.channel.Append(channel.data(), channel.size());
  rec.out.Append(out.data(), out.size());
  rec.err.Append(err.data(), err.size());
  return rec;
}

RunRecord KilledRecord(int signal, long maxrss_kib, const std::string& channel) {
  RunRecord rec = ExitedRecord(0, channel);
  rec.result.info.si_code = CLD_KILLED;
  rec.result.info.si_status = signal;
  rec.result.rus.ru_maxrss = maxrss_kib;
  return rec;
}
