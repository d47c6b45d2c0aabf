#ifndef INCLUDE_SCRIPTJAIL_UTILS_H_
#define INCLUDE_SCRIPTJAIL_UTILS_H_

#include <string>

#include "execution.h"

long GetUniqueRunId();

const char* OutcomeKindAbr(OutcomeKind);
const char* ResourceKindName(ResourceKind);

#endif  // INCLUDE_SCRIPTJAIL_UTILS_H_
