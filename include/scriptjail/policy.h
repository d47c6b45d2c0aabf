#ifndef INCLUDE_SCRIPTJAIL_POLICY_H_
#define INCLUDE_SCRIPTJAIL_POLICY_H_

#include <string>
#include <vector>
#include <filesystem>

// Isolation boundary applied to every run.
// Built once at startup and only ever passed around by const reference.
class SandboxPolicy {
 public:
  // filesystem
  std::filesystem::path box_root; // per-run boxes are created under it
  std::vector<std::string> library_dirs; // bind-mounted into every box
  long scratch_kib; // tmpfs on /workdir

  // interpreter path inside the box
  std::string python;

  // limits; 0 means unlimited where noted
  long wall_time_us, cpu_time_us;
  long memory_kib; // cgroup RSS
  long address_space_kib; // 0 = unlimited
  int max_processes;
  int max_open_files;
  long max_file_kib;

  // capture caps (bytes)
  size_t max_stdout_bytes, max_stderr_bytes, max_result_bytes;
  size_t max_script_bytes;

  bool share_network;

  // sandbox identity: uid_base + run_id % uid_count
  int uid_base, uid_count;
  int gid;

  // extra time the parent waits past wall_time_us before killing the jail itself
  long kill_grace_us;

  // root modules a script may import; empty disables screening
  std::vector<std::string> allowed_modules;
  // call / attribute fragments a script may not contain outside strings and comments,
  // e.g. "eval(" or ".__subclasses__"; empty disables the screen
  std::vector<std::string> denied_patterns;

  SandboxPolicy() :
      box_root("/tmp/scriptjail_box"),
      library_dirs{"/usr", "/lib", "/lib64", "/bin", "/etc/alternatives"},
      scratch_kib(64 * 1024),
      python("/usr/bin/python3"),
      wall_time_us(5'000'000), cpu_time_us(5'000'000),
      memory_kib(256 * 1024),
      address_space_kib(0),
      max_processes(16),
      max_open_files(64),
      max_file_kib(16 * 1024),
      max_stdout_bytes(1 << 20), max_stderr_bytes(64 << 10), max_result_bytes(4 << 20),
      max_script_bytes(256 << 10),
      share_network(false),
      uid_base(50000), uid_count(100),
      gid(65534),
      kill_grace_us(1'000'000) {}

  int RunUid(long run_id) const {
    return uid_base + (int)(run_id % (uid_count > 0 ? uid_count : 1));
  }
};

#endif  // INCLUDE_SCRIPTJAIL_POLICY_H_
