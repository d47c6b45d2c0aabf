#ifndef SCRIPTJAIL_RESULT_RECORD_H_
#define SCRIPTJAIL_RESULT_RECORD_H_

#include <string>

#include <nlohmann/json.hpp>
#include <scriptjail/execution.h>

// Deeper records are MALFORMED; serializing them would exhaust the stack.
constexpr int kMaxRecordDepth = 512;

// Record written by entry_point.py on the result channel.
// MALFORMED: something was written but it is not a valid record;
// ABSENT: nothing was written at all.
#define ENUM_RECORD_STATUS_ \
  X(OK, "ok") \
  X(MISSING_ENTRY_POINT, "missing_entry_point") \
  X(BAD_SIGNATURE, "bad_signature") \
  X(NOT_SERIALIZABLE, "not_serializable") \
  X(ERROR, "error") \
  X(RESOURCE, "resource") \
  X(MALFORMED, "") \
  X(ABSENT, "")
enum class RecordStatus {
#define X(name, abr) name,
  ENUM_RECORD_STATUS_
#undef X
};

const char* RecordStatusName(RecordStatus);

struct ResultRecord {
  RecordStatus status;
  nlohmann::json result; // OK
  std::string type; // ERROR, NOT_SERIALIZABLE: exception type name
  std::string message; // ERROR
  std::string trace; // ERROR: frames of the script only
  ResourceKind resource; // RESOURCE

  ResultRecord() : status(RecordStatus::ABSENT), resource(ResourceKind::NONE) {}

  bool IsContractViolation() const {
    return status == RecordStatus::MISSING_ENTRY_POINT ||
           status == RecordStatus::BAD_SIGNATURE ||
           status == RecordStatus::NOT_SERIALIZABLE;
  }
  // human-readable reason for a contract violation record
  std::string ContractReason() const;
  // "Type: message" followed by the filtered trace
  std::string ErrorExcerpt() const;
};

// Never throws; a truncated channel is always MALFORMED.
ResultRecord ParseResultRecord(const std::string& channel, bool truncated);

#endif  // SCRIPTJAIL_RESULT_RECORD_H_
