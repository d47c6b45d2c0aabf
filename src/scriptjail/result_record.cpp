#include "result_record.h"

#include <spdlog/spdlog.h>

namespace {

std::string GetString(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

} // namespace

std::string ResultRecord::ContractReason() const {
  switch (status) {
    case RecordStatus::MISSING_ENTRY_POINT:
      return "script must define a main() function";
    case RecordStatus::BAD_SIGNATURE:
      return "main() must take no arguments";
    case RecordStatus::NOT_SERIALIZABLE:
      return type.empty() ? "main() must return a JSON-serializable value" :
          "main() must return a JSON-serializable value, got " + type;
    case RecordStatus::ABSENT:
      return "script did not produce a result";
    default:
      return "script produced an invalid result";
  }
}

std::string ResultRecord::ErrorExcerpt() const {
  std::string ret = type.empty() ? "Error" : type;
  if (!message.empty()) ret += ": " + message;
  if (!trace.empty()) ret += "\n" + trace;
  return ret;
}

ResultRecord ParseResultRecord(const std::string& channel, bool truncated) {
  ResultRecord ret;
  if (channel.empty() && !truncated) return ret;
  ret.status = RecordStatus::MALFORMED;
  if (truncated) return ret;

  nlohmann::json obj;
  bool too_deep = false;
  auto depth_guard = [&too_deep](int depth, nlohmann::json::parse_event_t, nlohmann::json&) {
    if (depth > kMaxRecordDepth) too_deep = true;
    return !too_deep;
  };
  try {
    // a single JSON value, nothing but whitespace around it
    obj = nlohmann::json::parse(channel, depth_guard);
  } catch (nlohmann::json::exception& e) {
    spdlog::debug("Result record parse error: {}", e.what());
    return ret;
  }
  if (too_deep) {
    spdlog::debug("Result record nested deeper than {}", kMaxRecordDepth);
    return ret;
  }
  if (!obj.is_object()) return ret;
  std::string status = GetString(obj, "status");
  if (status == "ok") {
    auto it = obj.find("result");
    if (it == obj.end()) return ret;
    ret.result = std::move(*it);
    ret.status = RecordStatus::OK;
  } else if (status == "missing_entry_point") {
    ret.status = RecordStatus::MISSING_ENTRY_POINT;
  } else if (status == "bad_signature") {
    ret.status = RecordStatus::BAD_SIGNATURE;
  } else if (status == "not_serializable") {
    ret.type = GetString(obj, "type");
    ret.status = RecordStatus::NOT_SERIALIZABLE;
  } else if (status == "error") {
    ret.type = GetString(obj, "type");
    ret.message = GetString(obj, "message");
    ret.trace = GetString(obj, "trace");
    ret.status = RecordStatus::ERROR;
  } else if (status == "resource") {
    std::string kind = GetString(obj, "kind");
    if (kind == "memory") {
      ret.resource = ResourceKind::MEMORY;
    } else if (kind == "process") {
      ret.resource = ResourceKind::PROCESS;
    } else if (kind == "time") {
      ret.resource = ResourceKind::TIME;
    } else {
      return ret;
    }
    ret.status = RecordStatus::RESOURCE;
  }
  return ret;
}
