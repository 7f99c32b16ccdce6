#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Response envelopes and request logging

#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>

#define ENUM_API_CODE_ \
  X(SUCCESS, 0, 200, "success") \
  X(UNSUPPORTED_LANGUAGE, -400, 200, "unsupported language") \
  X(UNAUTHORIZED, -401, 401, "Unauthorized") \
  X(INVALID_REQUEST, -422, 422, "invalid request") \
  X(TOO_MANY_REQUESTS, -503, 200, "Too many requests")
// (name, envelope code, HTTP status, default message)
enum class ApiCode {
#define X(name, code, status, msg) name,
  ENUM_API_CODE_
#undef X
};

namespace http_utils {

int EnvelopeCode(ApiCode);
int HttpStatus(ApiCode);
const char* DefaultMessage(ApiCode);

// {"code": ..., "message": ..., "data": ...}
nlohmann::json Envelope(ApiCode code, const std::string& message, nlohmann::json data = nullptr);
void Reply(httplib::Response& res, ApiCode code, nlohmann::json data = nullptr);
void Reply(httplib::Response& res, ApiCode code, const std::string& message, nlohmann::json data);

// header dump for debug logs; the API key is masked
std::string FormatHeaders(const httplib::Headers&);

} // namespace http_utils

#endif  // HTTP_UTILS_H_
