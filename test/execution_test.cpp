#include <thread>
#include <gtest/gtest.h>
#include <scriptjail/execution.h>
#include <scriptjail/paths.h>
#include <scriptjail/utils.h>

#include "utils.h"

namespace {

struct RunParam {
  const char* name;
  OutcomeKind kind;
  ResourceKind resource;
  std::string script;
};

std::string ParamName(const ::testing::TestParamInfo<RunParam>& info) {
  std::string ret = std::string(OutcomeKindAbr(info.param.kind)) + "_" + info.param.name;
  return ret;
}

ExecutionOutcome Run(const std::string& script, const SandboxPolicy& policy) {
  ExecutionRequest req;
  req.script = script;
  return Execute(req, policy);
}

} // namespace

class ScriptOutcome : public testing::TestWithParam<RunParam> {};
TEST_P(ScriptOutcome, Kind) {
  auto& param = GetParam();
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run(param.script, policy);
  EXPECT_EQ(outcome.kind, param.kind) << OutcomeKindAbr(outcome.kind) << ": " << outcome.message;
  if (param.kind == OutcomeKind::RESOURCE_EXCEEDED) {
    EXPECT_EQ(outcome.resource, param.resource) << ResourceKindName(outcome.resource);
  }
}
INSTANTIATE_TEST_SUITE_P(Execute, ScriptOutcome,
    testing::Values(
      (RunParam){"dict", OutcomeKind::SUCCESS, ResourceKind::NONE,
                 "def main():\n    return {'a': 1}\n"},
      (RunParam){"async", OutcomeKind::SUCCESS, ResourceKind::NONE,
                 "async def main():\n    return [1, 2]\n"},
      (RunParam){"stdlib", OutcomeKind::SUCCESS, ResourceKind::NONE,
                 "import json, math, collections\ndef main():\n    return math.floor(2.5)\n"},
      (RunParam){"no_main", OutcomeKind::CONTRACT_VIOLATION, ResourceKind::NONE,
                 "x = 1\n"},
      (RunParam){"main_not_callable", OutcomeKind::CONTRACT_VIOLATION, ResourceKind::NONE,
                 "main = 5\n"},
      (RunParam){"main_with_args", OutcomeKind::CONTRACT_VIOLATION, ResourceKind::NONE,
                 "def main(x):\n    return x\n"},
      (RunParam){"set_result", OutcomeKind::CONTRACT_VIOLATION, ResourceKind::NONE,
                 "def main():\n    return {1, 2}\n"},
      (RunParam){"nan_result", OutcomeKind::CONTRACT_VIOLATION, ResourceKind::NONE,
                 "def main():\n    return float('nan')\n"},
      (RunParam){"exit_without_result", OutcomeKind::CONTRACT_VIOLATION, ResourceKind::NONE,
                 "import os\ndef main():\n    os._exit(0)\n"},
      (RunParam){"raise", OutcomeKind::RUNTIME_FAILURE, ResourceKind::NONE,
                 "def main():\n    raise ValueError('x')\n"},
      (RunParam){"syntax_error", OutcomeKind::RUNTIME_FAILURE, ResourceKind::NONE,
                 "def main():\n    return (\n"},
      (RunParam){"import_error", OutcomeKind::RUNTIME_FAILURE, ResourceKind::NONE,
                 "import no_such_module_here\ndef main():\n    return 1\n"},
      (RunParam){"sys_exit", OutcomeKind::RUNTIME_FAILURE, ResourceKind::NONE,
                 "import sys\ndef main():\n    sys.exit(3)\n"},
      (RunParam){"raised_memory_error", OutcomeKind::RUNTIME_FAILURE, ResourceKind::NONE,
                 "def main():\n    raise MemoryError('cache full')\n"},
      (RunParam){"nonblocking_read", OutcomeKind::RUNTIME_FAILURE, ResourceKind::NONE,
                 "import os\ndef main():\n    r, w = os.pipe()\n    os.set_blocking(r, False)\n"
                 "    return os.read(r, 1)\n"},
      (RunParam){"infinite_loop", OutcomeKind::RESOURCE_EXCEEDED, ResourceKind::TIME,
                 "def main():\n    while True:\n        pass\n"},
      (RunParam){"sleep", OutcomeKind::RESOURCE_EXCEEDED, ResourceKind::TIME,
                 "import time\ndef main():\n    time.sleep(60)\n"},
      (RunParam){"memory", OutcomeKind::RESOURCE_EXCEEDED, ResourceKind::MEMORY,
                 "def main():\n    a = []\n    while True:\n        a.append(bytearray(1 << 20))\n"},
      (RunParam){"fork_bomb", OutcomeKind::RESOURCE_EXCEEDED, ResourceKind::PROCESS,
                 "import os\ndef main():\n    while True:\n        if os.fork() == 0:\n"
                 "            os._exit(0)\n"}
    ),
    ParamName);

TEST(Execute, SuccessWithEmptyStdout) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run("def main():\n    return {'a': 1}\n", policy);
  ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
  EXPECT_EQ(outcome.result, nlohmann::json({{"a", 1}}));
  EXPECT_EQ(outcome.stdout_text, "");
}

TEST(Execute, StdoutSeparateFromResult) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run("def main():\n    print('hi')\n    return 42\n", policy);
  ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
  EXPECT_EQ(outcome.result, 42);
  EXPECT_EQ(outcome.stdout_text, "hi\n");
}

TEST(Execute, RuntimeFailureHasNoHostFrames) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run("def main():\n    raise ValueError('x')\n", policy);
  ASSERT_EQ(outcome.kind, OutcomeKind::RUNTIME_FAILURE);
  EXPECT_NE(outcome.message.find("ValueError: x"), std::string::npos);
  EXPECT_NE(outcome.message.find("<script>"), std::string::npos);
  EXPECT_EQ(outcome.message.find("entry_point.py"), std::string::npos) << outcome.message;
  EXPECT_EQ(outcome.message.find(kTestBoxRoot), std::string::npos) << outcome.message;
}

TEST(Execute, StdoutTruncated) {
  auto policy = TestPolicy();
  policy.max_stdout_bytes = 1000;
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run("def main():\n    print('a' * 100000)\n    return 1\n", policy);
  ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
  EXPECT_EQ(outcome.stdout_text.substr(0, 1000), std::string(1000, 'a'));
  EXPECT_NE(outcome.stdout_text.find("[output truncated after 1000 bytes]"), std::string::npos);
}

TEST(Execute, HostFilesystemIsReadOnly) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run(
      "def main():\n"
      "    for p in ['/usr/scriptjail_write_check', '/entry_point.py']:\n"
      "        try:\n"
      "            open(p, 'w')\n"
      "            return p\n"
      "        except OSError:\n"
      "            pass\n"
      "    open('/workdir/scratch', 'w').write('ok')\n"
      "    return open('/workdir/scratch').read()\n", policy);
  ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
  EXPECT_EQ(outcome.result, "ok");
}

TEST(Execute, NoNetwork) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run(
      "import socket\n"
      "def main():\n"
      "    s = socket.socket()\n"
      "    s.settimeout(1)\n"
      "    try:\n"
      "        s.connect(('1.1.1.1', 80))\n"
      "        return 'connected'\n"
      "    except OSError:\n"
      "        return 'isolated'\n", policy);
  ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
  EXPECT_EQ(outcome.result, "isolated");
}

TEST(Execute, Idempotent) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  const std::string script = "def main():\n    return sorted({'b': 2, 'a': 1}.items())\n";
  auto first = Run(script, policy);
  auto second = Run(script, policy);
  ASSERT_EQ(first.kind, OutcomeKind::SUCCESS) << first.message;
  ASSERT_EQ(second.kind, OutcomeKind::SUCCESS) << second.message;
  EXPECT_EQ(first.result, second.result);
  EXPECT_EQ(first.stdout_text, second.stdout_text);
}

TEST(Execute, ConcurrentRunsAreIsolated) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  // each run leaves a marker in its scratch dir and looks for the other's
  auto Script = [](const std::string& mine, const std::string& other) {
    return "import os, time\n"
           "def main():\n"
           "    open('/workdir/" + mine + "', 'w').write('x')\n"
           "    print('" + mine + "')\n"
           "    time.sleep(0.5)\n"
           "    return os.path.exists('/workdir/" + other + "')\n";
  };
  ExecutionOutcome a, b;
  std::thread ta([&] { a = Run(Script("alpha", "beta"), policy); });
  std::thread tb([&] { b = Run(Script("beta", "alpha"), policy); });
  ta.join();
  tb.join();
  ASSERT_EQ(a.kind, OutcomeKind::SUCCESS) << a.message;
  ASSERT_EQ(b.kind, OutcomeKind::SUCCESS) << b.message;
  EXPECT_EQ(a.result, false);
  EXPECT_EQ(b.result, false);
  EXPECT_EQ(a.stdout_text, "alpha\n");
  EXPECT_EQ(b.stdout_text, "beta\n");
  EXPECT_NE(a.run_id, b.run_id);
}

TEST(Execute, BoxRemoved) {
  auto policy = TestPolicy();
  SKIP_WITHOUT_SANDBOX(policy);
  auto outcome = Run("def main():\n    return 1\n", policy);
  ASSERT_EQ(outcome.kind, OutcomeKind::SUCCESS) << outcome.message;
  std::error_code ec;
  EXPECT_TRUE(fs::is_empty(policy.box_root, ec) || !fs::exists(policy.box_root, ec));
}
