#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <string>
#include <httplib.h>

namespace http_utils {

std::string FormatOneParam(const httplib::Headers&);

// client address as "ip:port"
std::string RemoteAddr(const httplib::Request&);

// info for 2xx/4xx, warn for 5xx
void LogRequest(const httplib::Request&, const httplib::Response&, long duration_us);

} // namespace http_utils

#endif  // HTTP_UTILS_H_
