#ifndef INCLUDE_SCRIPTJAIL_RESPONSE_H_
#define INCLUDE_SCRIPTJAIL_RESPONSE_H_

#include <string>

#include <nlohmann/json.hpp>
#include "execution.h"

struct Response {
  int status;
  nlohmann::json body;

  std::string Dump() const;
};

Response ComposeResponse(const ExecutionOutcome&);

// Failures detected before the engine is invoked (bad body, admission control)
Response InvalidRequestResponse(int status, const std::string& message);
Response BusyResponse();

// Strip paths and non-script frames from a diagnostic excerpt
std::string SanitizeDetail(const std::string&, size_t max_len = 2000);

#endif  // INCLUDE_SCRIPTJAIL_RESPONSE_H_
