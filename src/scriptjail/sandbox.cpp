#include "sandbox.h"

#include <sys/mount.h>
#include <cstring>
#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <type_traits>

namespace {

using Int = int64_t;

class Writer {
  std::vector<uint8_t>& buf_;

  void Put(Int val) {
    auto ptr = reinterpret_cast<const uint8_t*>(&val);
    buf_.insert(buf_.end(), ptr, ptr + sizeof(val));
  }
 public:
  explicit Writer(std::vector<uint8_t>& buf) : buf_(buf) {}

  template <class T, class = std::enable_if_t<std::is_arithmetic_v<T>>>
  void operator()(T val) { Put(static_cast<Int>(val)); }
  void operator()(const std::string& str) {
    Put(str.size());
    buf_.insert(buf_.end(), str.begin(), str.end());
  }
  void operator()(const std::vector<std::string>& list) {
    Put(list.size());
    for (auto& str : list) (*this)(str);
  }
};

class Reader {
  const std::vector<uint8_t>& buf_;
  size_t pos_;

  const uint8_t* Take(size_t len) {
    if (len > buf_.size() - pos_) throw std::out_of_range("sandbox options truncated");
    const uint8_t* ret = buf_.data() + pos_;
    pos_ += len;
    return ret;
  }
  size_t Length() {
    Int len;
    memcpy(&len, Take(sizeof(len)), sizeof(len));
    if (len < 0 || (size_t)len > buf_.size() - pos_) {
      throw std::out_of_range("sandbox options: bad length");
    }
    return len;
  }
 public:
  explicit Reader(const std::vector<uint8_t>& buf) : buf_(buf), pos_(0) {}

  template <class T, class = std::enable_if_t<std::is_arithmetic_v<T>>>
  void operator()(T& val) {
    Int tmp;
    memcpy(&tmp, Take(sizeof(tmp)), sizeof(tmp));
    val = static_cast<T>(tmp);
  }
  void operator()(std::string& str) {
    size_t len = Length();
    auto ptr = reinterpret_cast<const char*>(Take(len));
    str.assign(ptr, len);
  }
  void operator()(std::vector<std::string>& list) {
    size_t count = Length();
    // every element takes at least one length word
    if (count > (buf_.size() - pos_) / sizeof(Int)) {
      throw std::out_of_range("sandbox options: bad list length");
    }
    list.resize(count);
    for (auto& str : list) (*this)(str);
  }
  bool Done() const { return pos_ == buf_.size(); }
};

} // namespace

template <class Self, class Archive>
void SandboxOptions::Fields(Self& self, Archive& ar) {
  ar(self.root);
  ar(self.cwd);
  ar(self.argv);
  ar(self.envp);
  ar(self.bind_dirs);
  ar(self.stdin_fd);
  ar(self.stdout_fd);
  ar(self.stderr_fd);
  ar(self.keep_fds);
  ar(self.share_network);
  ar(self.uid);
  ar(self.gid);
  ar(self.wall_time_us);
  ar(self.cpu_time_us);
  ar(self.rss_kib);
  ar(self.as_kib);
  ar(self.fsize_kib);
  ar(self.max_procs);
  ar(self.max_files);
}

SandboxOptions::SandboxOptions(const std::vector<uint8_t>& bytes) {
  Reader reader(bytes);
  Fields(*this, reader);
  if (!reader.Done()) throw std::out_of_range("sandbox options: trailing bytes");
}

std::vector<uint8_t> SandboxOptions::Serialize() const {
  std::vector<uint8_t> ret;
  Writer writer(ret);
  Fields(*this, writer);
  return ret;
}

void SandboxOptions::FilterDirs() {
  std::vector<std::string> kept;
  for (auto& dir : bind_dirs) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) continue;
    if (std::find(kept.begin(), kept.end(), dir) == kept.end()) kept.push_back(dir);
  }
  bind_dirs.swap(kept);
}

void SandboxOptions::ToCJailCtx(CJailContext& jail) const {
  struct cjail_ctx& ctx = jail.ctx_;
  cjail_ctx_init(&ctx);

  for (auto& arg : argv) jail.argv_.push_back(arg.c_str());
  jail.argv_.push_back(nullptr);
  for (auto& env : envp) jail.envp_.push_back(env.c_str());
  jail.envp_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(jail.argv_.data());
  ctx.environ = const_cast<char* const*>(jail.envp_.data());
  ctx.chroot = const_cast<char*>(root.c_str());
  ctx.working_dir = const_cast<char*>(cwd.c_str());

  if (stdin_fd >= 0) ctx.fd_input = stdin_fd;
  if (stdout_fd >= 0) ctx.fd_output = stdout_fd;
  if (stderr_fd >= 0) ctx.fd_error = stderr_fd;
  ctx.preservefd = keep_fds;
  ctx.sharenet = share_network;
  ctx.uid = uid;
  ctx.gid = gid;
  // no cpuset pinning: every run may use any CPU
  ctx.cpuset = nullptr;

  ctx.lim_time.tv_sec = wall_time_us / 1'000'000;
  ctx.lim_time.tv_usec = wall_time_us % 1'000'000;
  ctx.lim_cputime.tv_sec = cpu_time_us / 1'000'000;
  ctx.lim_cputime.tv_usec = cpu_time_us % 1'000'000;
  ctx.cg_rss = rss_kib;
  ctx.rlim_as = as_kib;
  ctx.rlim_fsize = fsize_kib;
  ctx.rlim_proc = max_procs;
  ctx.rlim_nofile = max_files;
  ctx.rlim_core = 0;

  // MS_RDONLY takes effect only if cjail remounts the bind; the dirs are owned
  // by root on the host, so the unprivileged jail uid cannot write them either way
  jail.mounts_.resize(bind_dirs.size());
  for (size_t i = 0; i < bind_dirs.size(); i++) {
    struct jail_mount_ctx& mnt = jail.mounts_[i];
    mnt.type = const_cast<char*>("bind");
    mnt.source = mnt.target = const_cast<char*>(bind_dirs[i].c_str());
    mnt.fstype = nullptr;
    mnt.data = nullptr;
    mnt.flags = MS_RDONLY;
    mnt_list_add(jail.mount_list_, &mnt);
  }
  ctx.mount_cfg = jail.mount_list_;
}
