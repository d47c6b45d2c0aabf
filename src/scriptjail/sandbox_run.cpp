#include "sandbox_run.h"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <cstring>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "sandbox_exec.h"
#include "utils.h"

namespace {

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

SandboxOptions RunOptions(const SandboxRun& run, const SandboxPolicy& policy) {
  SandboxOptions opt;
  opt.root = run.box.string();
  opt.argv = {policy.python, "-I", "-B", "-u",
                 RunBoxAdapter(policy.box_root, run.id, true).string(),
                 RunBoxScript(policy.box_root, run.id, true).string()};
  opt.envp = {
    "PATH=/usr/local/bin:/usr/bin:/bin",
    "HOME=/" + std::string(kWorkdirRelative),
    "TMPDIR=/" + std::string(kWorkdirRelative),
    "LANG=C.UTF-8",
    // numeric libraries would otherwise spawn one thread per core and hit max_processes
    "OPENBLAS_NUM_THREADS=1",
    "OMP_NUM_THREADS=1",
    "MKL_NUM_THREADS=1",
  };
  opt.cwd = Workdir("/").string();
  opt.stdin_fd = kJailInputFd;
  opt.stdout_fd = kJailStdoutFd;
  opt.stderr_fd = kJailStderrFd;
  opt.keep_fds = true;
  opt.share_network = policy.share_network;
  opt.uid = run.uid;
  opt.gid = policy.gid;
  opt.wall_time_us = policy.wall_time_us;
  opt.cpu_time_us = policy.cpu_time_us;
  opt.rss_kib = policy.memory_kib;
  opt.as_kib = policy.address_space_kib;
  opt.max_procs = policy.max_processes;
  opt.max_files = policy.max_open_files;
  opt.fsize_kib = policy.max_file_kib;
  opt.bind_dirs = policy.library_dirs;
  opt.FilterDirs();
  return opt;
}

} // namespace

SandboxRun::SandboxRun(long id, const SandboxPolicy& policy) :
    id(id), uid(policy.RunUid(id)), box(RunBoxPath(policy.box_root, id)),
    helper(-1), control_fd(-1), stdout_fd(-1), stderr_fd(-1), result_fd(-1),
    record(policy.max_stdout_bytes, policy.max_stderr_bytes, policy.max_result_bytes),
    mounted_(false) {}

SandboxRun::~SandboxRun() {
  if (helper > 0) {
    kill(-helper, SIGKILL);
    Reap();
  }
  CloseFd(control_fd);
  CloseFd(stdout_fd);
  CloseFd(stderr_fd);
  CloseFd(result_fd);
  if (mounted_) Umount(Workdir(fs::path(box)));
  RemoveAll(box);
}

bool SandboxRun::Prepare(const std::string& script, const SandboxPolicy& policy) {
  auto workdir = Workdir(fs::path(box));
  if (!CreateDirs(box, kPerm755)) return false;
  if (!CreateDirs(workdir)) return false;
  if (!MountTmpfs(workdir, policy.scratch_kib)) return false;
  mounted_ = true;
  if (!Chown(workdir, uid, policy.gid)) return false;
  if (!SetPerms(workdir, fs::perms::owner_all)) return false;
  if (!WriteFile(RunBoxScript(policy.box_root, id), script, kPerm644)) return false;
  if (!Copy(AdapterSourcePath(), RunBoxAdapter(policy.box_root, id), kPerm644)) return false;
  return true;
}

bool SandboxRun::Spawn(const SandboxPolicy& policy) {
  int out[2] = {-1, -1}, err[2] = {-1, -1}, res[2] = {-1, -1};
  int devnull = -1;
  bool ok = false;
  if (pipe2(out, O_CLOEXEC) < 0 || pipe2(err, O_CLOEXEC) < 0 || pipe2(res, O_CLOEXEC) < 0 ||
      (devnull = open("/dev/null", O_RDONLY | O_CLOEXEC)) < 0) {
    spdlog::warn("Failed creating pipes for run {}: {}", id, strerror(errno));
  } else {
    SandboxFds fds = {res[1], out[1], err[1], devnull};
    helper = SandboxSpawn(RunOptions(*this, policy), fds, control_fd);
    ok = helper > 0;
  }
  // the write ends now only live in the helper
  for (int* fd : {&out[1], &err[1], &res[1], &devnull}) CloseFd(*fd);
  stdout_fd = out[0];
  stderr_fd = err[0];
  result_fd = res[0];
  if (!ok) return false;
  for (int fd : {control_fd, stdout_fd, stderr_fd, result_fd}) SetNonblocking(fd);
  return true;
}

void SandboxRun::Reap() {
  if (helper <= 0) return;
  int status;
  while (waitpid(helper, &status, 0) < 0 && errno == EINTR);
  helper = -1;
}
