#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <atomic>
#include <cstring>
#include <fstream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "result_record.h"

namespace {

std::atomic_long run_id_seq = 0;

bool Failed(const char* what, const fs::path& path, int err) {
  spdlog::warn("Failed {} {}: {}", what, path.c_str(), strerror(err));
  return false;
}

} // namespace

int CloseFrom(int minfd) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, (unsigned)minfd, ~0U, 0) == 0) return 0;
#endif
  // kernels before 5.9
  struct rlimit lim;
  int maxfd = getrlimit(RLIMIT_NOFILE, &lim) == 0 && lim.rlim_cur != RLIM_INFINITY
      ? (int)lim.rlim_cur : 65536;
  for (int fd = minfd; fd < maxfd; fd++) close(fd);
  return 0;
}

void SetNonblocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) return;
  IGNORE_RETURN(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

long GetUniqueRunId() {
  return ++run_id_seq;
}

const char* OutcomeKindAbr(OutcomeKind kind) {
  switch (kind) {
#define X(name, abr) case OutcomeKind::name: return abr;
    ENUM_OUTCOME_KIND_
#undef X
  }
  __builtin_unreachable();
}

const char* ResourceKindName(ResourceKind kind) {
  switch (kind) {
#define X(name, abr) case ResourceKind::name: return abr;
    ENUM_RESOURCE_KIND_
#undef X
  }
  __builtin_unreachable();
}

const char* RecordStatusName(RecordStatus status) {
  switch (status) {
#define X(name, abr) case RecordStatus::name: return abr;
    ENUM_RECORD_STATUS_
#undef X
  }
  __builtin_unreachable();
}

bool MountTmpfs(const fs::path& path, long size_kib) {
  spdlog::debug("Mount tmpfs on {}, size {}k", path.c_str(), size_kib);
  std::string data = fmt::format("size={}k,mode=0700", size_kib);
  if (mount("tmpfs", path.c_str(), "tmpfs", MS_NOSUID | MS_NODEV, data.c_str()) < 0) {
    return Failed("mounting tmpfs on", path, errno);
  }
  return true;
}

bool Umount(const fs::path& path) {
  spdlog::debug("Umount {}", path.c_str());
  if (umount2(path.c_str(), MNT_DETACH) < 0) return Failed("unmounting", path, errno);
  return true;
}

bool SetPerms(const fs::path& path, fs::perms perms) {
  if (perms == fs::perms::unknown) return true;
  std::error_code ec;
  fs::permissions(path, perms, ec);
  if (ec) return Failed("setting permission of", path, ec.value());
  return true;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) return Failed("creating directory", path, ec.value());
  return SetPerms(path, perms);
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) return Failed("deleting", path, ec.value());
  return true;
}

bool Chown(const fs::path& path, int uid, int gid) {
  spdlog::debug("Chown {} to {}:{}", path.c_str(), uid, gid);
  if (chown(path.c_str(), uid, gid) < 0) return Failed("chown", path, errno);
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content, fs::perms perms) {
  spdlog::debug("Write file {}, size {}", path.c_str(), content.size());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout.write(content.data(), content.size()) || !fout.flush()) {
    return Failed("writing", path, errno ? errno : EIO);
  }
  fout.close();
  return SetPerms(path, perms);
}

bool Copy(const fs::path& from, const fs::path& to, fs::perms perms) {
  spdlog::debug("Copy file {} -> {}", from.c_str(), to.c_str());
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) return Failed("copying to", to, ec.value());
  return SetPerms(to, perms);
}
