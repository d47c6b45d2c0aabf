#include <scriptjail/response.h>

#include <regex>

#include <scriptjail/utils.h>

namespace {

const char kScriptFile[] = "<script>";

const char* ResourceMessage(ResourceKind kind) {
  switch (kind) {
    case ResourceKind::TIME: return "time limit exceeded";
    case ResourceKind::MEMORY: return "memory limit exceeded";
    case ResourceKind::PROCESS: return "process limit exceeded";
    default: return "resource limit exceeded";
  }
}

} // namespace

std::string Response::Dump() const {
  // script output is arbitrary bytes; never throw on invalid UTF-8
  return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string SanitizeDetail(const std::string& detail, size_t max_len) {
  static const std::regex kFileRef(R"re(File "([^"]*)")re");
  static const std::regex kAbsPath(R"re((^|[\s'"(=:,])/[^\s'"),:]+)re");
  std::string ret;
  {
    // File "..." references first, so their paths are not turned into <path>
    std::string tmp;
    auto begin = std::sregex_iterator(detail.begin(), detail.end(), kFileRef);
    size_t last = 0;
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      tmp.append(detail, last, it->position() - last);
      tmp += (*it)[1] == kScriptFile ? it->str() : std::string("File \"<internal>\"");
      last = it->position() + it->length();
    }
    tmp.append(detail, last, std::string::npos);
    ret = std::regex_replace(tmp, kAbsPath, "$1<path>");
  }
  if (ret.size() > max_len) {
    ret.resize(max_len);
    ret += "...";
  }
  return ret;
}

Response ComposeResponse(const ExecutionOutcome& outcome) {
  Response ret;
  switch (outcome.kind) {
    case OutcomeKind::SUCCESS:
      ret.status = 200;
      ret.body = {{"result", outcome.result}, {"stdout", outcome.stdout_text}};
      return ret;
    case OutcomeKind::CONTRACT_VIOLATION:
      ret.status = 400;
      ret.body = {{"error", outcome.message}, {"stdout", outcome.stdout_text}};
      break;
    case OutcomeKind::RUNTIME_FAILURE:
      ret.status = 400;
      ret.body = {
        {"error", "script raised an error"},
        {"detail", SanitizeDetail(outcome.message)},
        {"stdout", outcome.stdout_text},
      };
      break;
    case OutcomeKind::RESOURCE_EXCEEDED:
      ret.status = 400;
      ret.body = {
        {"error", ResourceMessage(outcome.resource)},
        {"limit", ResourceKindName(outcome.resource)},
        {"stdout", outcome.stdout_text},
      };
      break;
    case OutcomeKind::SANDBOX_FAILURE:
      // nothing script-derived; the reason is in the log
      ret.status = 500;
      ret.body = {{"error", "internal error"}};
      break;
  }
  ret.body["kind"] = OutcomeKindAbr(outcome.kind);
  return ret;
}

Response InvalidRequestResponse(int status, const std::string& message) {
  Response ret;
  ret.status = status;
  ret.body = {{"error", message}, {"kind", "invalid_request"}};
  return ret;
}

Response BusyResponse() {
  Response ret;
  ret.status = 503;
  ret.body = {{"error", "server is busy"}, {"kind", "busy"}};
  return ret;
}
