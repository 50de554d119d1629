#ifndef AUTHBRIDGE_SRC_COMMON_HTTP_HEADERS_H_
#define AUTHBRIDGE_SRC_COMMON_HTTP_HEADERS_H_

namespace authbridge {
namespace common {
namespace http {
// Standard HTTP headers
namespace headers {
static const char *Accept = "accept";
static const char *Authorization = "authorization";
static const char *CacheControl = "cache-control";
static const char *ContentType = "content-type";
static const char *Pragma = "pragma";

namespace CacheControlDirectives {
static const char *NoCache = "no-cache";
}  // namespace CacheControlDirectives

namespace ContentTypeDirectives {
static const char *FormUrlEncoded = "application/x-www-form-urlencoded";
static const char *Json = "application/json";
static const char *TextPlain = "text/plain";
}  // namespace ContentTypeDirectives

namespace PragmaDirectives {
static const char *NoCache = "no-cache";
}  // namespace PragmaDirectives

}  // namespace headers
}  // namespace http
}  // namespace common
}  // namespace authbridge

#endif  // AUTHBRIDGE_SRC_COMMON_HTTP_HEADERS_H_
