#ifndef SCRIPTJAIL_UTILS_H_
#define SCRIPTJAIL_UTILS_H_

#include <string>
#include <filesystem>

#include <scriptjail/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

constexpr fs::perms kPerm644 =
    fs::perms::owner_read | fs::perms::owner_write |
    fs::perms::group_read | fs::perms::others_read;
constexpr fs::perms kPerm755 =
    fs::perms::owner_all |
    fs::perms::group_read | fs::perms::group_exec |
    fs::perms::others_read | fs::perms::others_exec;

// close every fd >= minfd; async-signal-safe
int CloseFrom(int minfd);
void SetNonblocking(int fd);

bool MountTmpfs(const fs::path&, long size_kib);
bool Umount(const fs::path&);
bool SetPerms(const fs::path&, fs::perms); // no-op for perms::unknown
bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool Chown(const fs::path&, int uid, int gid);
bool WriteFile(const fs::path&, const std::string& content, fs::perms = fs::perms::unknown);

// resolves symlinks
bool Copy(const fs::path& from, const fs::path& to, fs::perms = fs::perms::unknown);

#endif  // SCRIPTJAIL_UTILS_H_
