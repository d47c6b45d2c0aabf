#ifndef SCRIPTJAIL_VALIDATOR_H_
#define SCRIPTJAIL_VALIDATOR_H_

#include <string>
#include <vector>
#include <optional>

#include <scriptjail/policy.h>

// Logical lines of Python source: comments and string contents removed,
// bracketed / backslash continuations joined, split on ';'.
// Each entry keeps its leading indentation.
std::vector<std::string> LogicalLines(const std::string& source);

// Returns the contract violation reason, or nullopt if the script may run.
// Static and textual only; false negatives are caught by the adapter.
std::optional<std::string> ValidateScript(const std::string& script, const SandboxPolicy& policy);

#endif  // SCRIPTJAIL_VALIDATOR_H_
