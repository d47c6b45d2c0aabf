#include "http_utils.h"
#include <spdlog/spdlog.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Headers& headers) {
  std::string ret;
  for (auto& [key, value] : headers) {
    if (!ret.empty()) ret += ", ";
    ret += key + ": " + value;
  }
  return ret;
}

std::string RemoteAddr(const httplib::Request& req) {
  return req.remote_addr + ':' + std::to_string(req.remote_port);
}

void LogRequest(const httplib::Request& req, const httplib::Response& res, long duration_us) {
  auto level = res.status >= 500 ? spdlog::level::warn : spdlog::level::info;
  spdlog::log(level, "{} {} {} -> {} ({} bytes in, {} us)", RemoteAddr(req), req.method, req.path,
      res.status, req.body.size(), duration_us);
  spdlog::debug("Request headers: {}", FormatOneParam(req.headers));
}

} // namespace http_utils
