#ifndef SCRIPTJAIL_PATHS_H_
#define SCRIPTJAIL_PATHS_H_

#include <scriptjail/paths.h>

extern const char kWorkdirRelative[];
fs::path Workdir(fs::path&&);

// if inside_box = true, root and id are not used
fs::path RunBoxPath(const fs::path& root, long id);
fs::path RunBoxScript(const fs::path& root, long id, bool inside_box = false);
fs::path RunBoxAdapter(const fs::path& root, long id, bool inside_box = false);

fs::path SandboxHelperPath();
fs::path AdapterSourcePath();

#endif  // SCRIPTJAIL_PATHS_H_
