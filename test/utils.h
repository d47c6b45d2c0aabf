#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <string>
#include <gtest/gtest.h>
#include <scriptjail/policy.h>
#include "extractor.h"

extern const char kTestBoxRoot[];

// small limits so the resource tests finish quickly
SandboxPolicy TestPolicy();

// root, the sandbox-exec helper and the interpreter are all needed for real runs
bool CanRunSandbox(const SandboxPolicy&);

#define SKIP_WITHOUT_SANDBOX(policy) \
  if (!CanRunSandbox(policy)) GTEST_SKIP() << "needs root, sandbox-exec and python"

// A run as the extractor would have recorded it
RunRecord ExitedRecord(int exit_code, const std::string& channel,
                       const std::string& out = "", const std::string& err = "");
RunRecord KilledRecord(int signal, long maxrss_kib = 0, const std::string& channel = "");

#endif // TEST_UTILS_H_
