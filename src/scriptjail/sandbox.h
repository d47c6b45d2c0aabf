#ifndef SCRIPTJAIL_SANDBOX_H_
#define SCRIPTJAIL_SANDBOX_H_

#include <string>
#include <vector>
#include <cstdint>

#include <cjail/cjail.h>

// Owns every buffer a cjail_ctx points into.
class CJailContext {
  std::vector<const char*> argv_;
  std::vector<const char*> envp_;
  std::vector<struct jail_mount_ctx> mounts_;
  struct jail_mount_list* mount_list_;
  struct cjail_ctx ctx_;

  friend class SandboxOptions;
 public:
  CJailContext() : mount_list_(mnt_list_new()) {}
  CJailContext(const CJailContext&) = delete;
  CJailContext& operator=(const CJailContext&) = delete;
  ~CJailContext() { mnt_list_free(mount_list_); }

  struct cjail_ctx* Get() { return &ctx_; }
};

// Everything sandbox-exec needs to build the jail of one run.
// Passed from the server to the helper as a flat byte string.
class SandboxOptions {
 public:
  std::string root; // host path, becomes "/"
  std::string cwd; // inside the jail
  std::vector<std::string> argv;
  std::vector<std::string> envp;
  std::vector<std::string> bind_dirs; // mounted at the same path inside the jail
  // helper-side fds that become the jail's stdin/stdout/stderr
  int stdin_fd, stdout_fd, stderr_fd;
  bool keep_fds; // fds >= 3 stay open in the jail (the result channel)
  bool share_network;
  int uid, gid;
  long wall_time_us, cpu_time_us;
  long rss_kib, as_kib; // 0 = unlimited
  long fsize_kib;
  int max_procs, max_files;

  SandboxOptions() :
      stdin_fd(-1), stdout_fd(-1), stderr_fd(-1),
      keep_fds(false), share_network(false),
      uid(65534), gid(65534),
      wall_time_us(0), cpu_time_us(0),
      rss_kib(0), as_kib(0), fsize_kib(0),
      max_procs(0), max_files(0) {}
  // throws std::out_of_range on a short or corrupted buffer
  explicit SandboxOptions(const std::vector<uint8_t>& bytes);

  // only meaningful between processes of the same build on the same machine
  std::vector<uint8_t> Serialize() const;

  // keep only bind_dirs that exist on the host, first occurrence of each
  void FilterDirs();

  // ctx points into this object and into ctx's own buffers; neither may change afterwards
  void ToCJailCtx(CJailContext& ctx) const;

 private:
  // visits every field in wire order; Self is SandboxOptions or const SandboxOptions
  template <class Self, class Archive> static void Fields(Self& self, Archive& ar);
};

#endif  // SCRIPTJAIL_SANDBOX_H_
