#include "paths.h"

#include <unistd.h>

namespace internal {
fs::path kDataDir = fs::path(SCRIPTJAIL_DATA_DIR);
} // internal

const char kWorkdirRelative[] = "workdir";
fs::path Workdir(fs::path&& path) {
  path /= kWorkdirRelative;
  return path;
}

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

inline fs::path BoxRoot(const fs::path& root, long id, bool inside_box) {
  return inside_box ? fs::path("/") : RunBoxPath(root, id);
}

} // namespace

// pid is included so that several servers can share one box_root
fs::path RunBoxPath(const fs::path& root, long id) {
  return root / (std::to_string(getpid()) + "-" + PadInt(id, 6));
}
fs::path RunBoxScript(const fs::path& root, long id, bool inside_box) {
  return Workdir(BoxRoot(root, id, inside_box)) / "script.py";
}
fs::path RunBoxAdapter(const fs::path& root, long id, bool inside_box) {
  return BoxRoot(root, id, inside_box) / "entry_point.py";
}

fs::path SandboxHelperPath() {
  return internal::kDataDir / "sandbox-exec";
}
fs::path AdapterSourcePath() {
  return internal::kDataDir / "entry_point.py";
}
