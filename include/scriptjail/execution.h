#ifndef INCLUDE_SCRIPTJAIL_EXECUTION_H_
#define INCLUDE_SCRIPTJAIL_EXECUTION_H_

#include <string>

#include <nlohmann/json.hpp>
#include "policy.h"

#define ENUM_OUTCOME_KIND_ \
  X(SUCCESS, "success") \
  X(CONTRACT_VIOLATION, "contract_violation") \
  X(RUNTIME_FAILURE, "runtime_failure") \
  X(RESOURCE_EXCEEDED, "resource_exceeded") \
  X(SANDBOX_FAILURE, "sandbox_failure")
enum class OutcomeKind {
#define X(name, abr) name,
  ENUM_OUTCOME_KIND_
#undef X
};

#define ENUM_RESOURCE_KIND_ \
  X(NONE, "") \
  X(TIME, "time") \
  X(MEMORY, "memory") \
  X(PROCESS, "process")
enum class ResourceKind {
#define X(name, abr) name,
  ENUM_RESOURCE_KIND_
#undef X
};

class ExecutionRequest {
 public:
  std::string script;
};

// Exactly one is produced per request.
// result is only meaningful for SUCCESS, resource only for RESOURCE_EXCEEDED;
// message holds the violation reason, the failure excerpt or the sandbox error.
class ExecutionOutcome {
 public:
  OutcomeKind kind;
  ResourceKind resource;
  nlohmann::json result;
  std::string stdout_text;
  std::string message;
  long run_id;
  long duration_us;

  ExecutionOutcome() :
      kind(OutcomeKind::SANDBOX_FAILURE), resource(ResourceKind::NONE),
      run_id(-1), duration_us(0) {}

  static ExecutionOutcome Success(nlohmann::json&& result, std::string&& stdout_text);
  static ExecutionOutcome ContractViolation(const std::string& reason);
  static ExecutionOutcome RuntimeFailure(const std::string& excerpt);
  static ExecutionOutcome ResourceExceeded(ResourceKind kind);
  static ExecutionOutcome SandboxFailure(const std::string& reason);
};

// Validate, isolate, run and classify one script. Thread-safe; never throws for
// anything the script does.
ExecutionOutcome Execute(const ExecutionRequest&, const SandboxPolicy&);

#endif  // INCLUDE_SCRIPTJAIL_EXECUTION_H_
