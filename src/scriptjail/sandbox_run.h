#ifndef SCRIPTJAIL_SANDBOX_RUN_H_
#define SCRIPTJAIL_SANDBOX_RUN_H_

#include <sys/types.h>
#include <string>
#include <filesystem>

#include <scriptjail/policy.h>
#include "extractor.h"

// One execution attempt, owned by a single Execute() call.
// The destructor kills & reaps the helper, closes the pipes, unmounts the
// scratch tmpfs and removes the box, whichever step the run got to.
class SandboxRun {
 public:
  const long id;
  const int uid;
  const std::filesystem::path box;
  pid_t helper; // also the process group; -1 if not running
  int control_fd; // helper's report
  int stdout_fd, stderr_fd, result_fd; // read ends of the capture pipes
  RunRecord record;

  SandboxRun(long id, const SandboxPolicy& policy);
  SandboxRun(const SandboxRun&) = delete;
  SandboxRun& operator=(const SandboxRun&) = delete;
  ~SandboxRun();

  // create the box, the scratch workdir, the script and the adapter
  bool Prepare(const std::string& script, const SandboxPolicy& policy);
  // create the capture pipes and start sandbox-exec
  bool Spawn(const SandboxPolicy& policy);
  // blocking waitpid on the helper; no-op if already reaped
  void Reap();

 private:
  bool mounted_;
};

#endif  // SCRIPTJAIL_SANDBOX_RUN_H_
