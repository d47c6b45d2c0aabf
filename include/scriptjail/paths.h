#ifndef INCLUDE_SCRIPTJAIL_PATHS_H_
#define INCLUDE_SCRIPTJAIL_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

namespace internal {

// does not meant to be publicly used; only for testing
// holds sandbox-exec and entry_point.py
extern fs::path kDataDir;

} // internal

#endif  // INCLUDE_SCRIPTJAIL_PATHS_H_
