#include "http_utils.h"

#include <strings.h>

#include <fmt/format.h>

namespace http_utils {

#define X(name, code, status, msg) case ApiCode::name: return code;
int EnvelopeCode(ApiCode c) {
  switch (c) { ENUM_API_CODE_ }
  __builtin_unreachable();
}
#undef X

#define X(name, code, status, msg) case ApiCode::name: return status;
int HttpStatus(ApiCode c) {
  switch (c) { ENUM_API_CODE_ }
  __builtin_unreachable();
}
#undef X

#define X(name, code, status, msg) case ApiCode::name: return msg;
const char* DefaultMessage(ApiCode c) {
  switch (c) { ENUM_API_CODE_ }
  __builtin_unreachable();
}
#undef X

nlohmann::json Envelope(ApiCode code, const std::string& message, nlohmann::json data) {
  return {{"code", EnvelopeCode(code)}, {"message", message}, {"data", std::move(data)}};
}

void Reply(httplib::Response& res, ApiCode code, nlohmann::json data) {
  Reply(res, code, DefaultMessage(code), std::move(data));
}

void Reply(httplib::Response& res, ApiCode code, const std::string& message, nlohmann::json data) {
  res.status = HttpStatus(code);
  res.set_content(Envelope(code, message, std::move(data)).dump(), "application/json");
}

std::string FormatHeaders(const httplib::Headers& headers) {
  std::string ret;
  for (auto& [key, val] : headers) {
    if (!ret.empty()) ret += ", ";
    ret += fmt::format("{}={}", key, strcasecmp(key.c_str(), "X-Api-Key") == 0 ? "***" : val);
  }
  return ret.empty() ? "(none)" : ret;
}

} // namespace http_utils
