#include <scriptjail/execution.h>

#include <chrono>

#include <spdlog/spdlog.h>
#include <scriptjail/utils.h>
#include "extractor.h"
#include "sandbox_run.h"
#include "validator.h"

ExecutionOutcome ExecutionOutcome::Success(nlohmann::json&& result, std::string&& stdout_text) {
  ExecutionOutcome ret;
  ret.kind = OutcomeKind::SUCCESS;
  ret.result = std::move(result);
  ret.stdout_text = std::move(stdout_text);
  return ret;
}

ExecutionOutcome ExecutionOutcome::ContractViolation(const std::string& reason) {
  ExecutionOutcome ret;
  ret.kind = OutcomeKind::CONTRACT_VIOLATION;
  ret.message = reason;
  return ret;
}

ExecutionOutcome ExecutionOutcome::RuntimeFailure(const std::string& excerpt) {
  ExecutionOutcome ret;
  ret.kind = OutcomeKind::RUNTIME_FAILURE;
  ret.message = excerpt;
  return ret;
}

ExecutionOutcome ExecutionOutcome::ResourceExceeded(ResourceKind kind) {
  ExecutionOutcome ret;
  ret.kind = OutcomeKind::RESOURCE_EXCEEDED;
  ret.resource = kind;
  return ret;
}

ExecutionOutcome ExecutionOutcome::SandboxFailure(const std::string& reason) {
  ExecutionOutcome ret;
  ret.kind = OutcomeKind::SANDBOX_FAILURE;
  ret.message = reason;
  return ret;
}

namespace {

ExecutionOutcome RunSandboxed(SandboxRun& run, const ExecutionRequest& req, const SandboxPolicy& policy) {
  if (!run.Prepare(req.script, policy)) {
    return ExecutionOutcome::SandboxFailure("failed to prepare sandbox directory");
  }
  if (!run.Spawn(policy)) {
    return ExecutionOutcome::SandboxFailure("failed to start sandbox helper");
  }
  CollectRun(run, policy);
  return ClassifyRun(run.record, policy);
}

} // namespace

ExecutionOutcome Execute(const ExecutionRequest& req, const SandboxPolicy& policy) {
  auto start = std::chrono::steady_clock::now();
  long id = GetUniqueRunId();
  ExecutionOutcome ret;
  if (req.script.empty()) {
    ret = ExecutionOutcome::ContractViolation("script must not be empty");
  } else if (auto reason = ValidateScript(req.script, policy)) {
    ret = ExecutionOutcome::ContractViolation(*reason);
  } else {
    spdlog::info("Run started: id={}, script={} bytes", id, req.script.size());
    // cleanup happens when run goes out of scope, before the outcome is returned
    SandboxRun run(id, policy);
    ret = RunSandboxed(run, req, policy);
  }
  ret.run_id = id;
  ret.duration_us = std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
  if (ret.kind == OutcomeKind::SANDBOX_FAILURE) {
    spdlog::error("Run {}: sandbox failure: {}", id, ret.message);
  }
  spdlog::info("Run finished: id={}, outcome={}{}{}, {} us", id, OutcomeKindAbr(ret.kind),
      ret.kind == OutcomeKind::RESOURCE_EXCEEDED ? "/" : "", ResourceKindName(ret.resource),
      ret.duration_us);
  return ret;
}
