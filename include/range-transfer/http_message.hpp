#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rangexfer {

class HttpParseError : public std::runtime_error {
public:
  explicit HttpParseError(const std::string &message)
      : std::runtime_error("Malformed HTTP message: " + message) {}
};

struct CaseInsensitiveLess {
  bool operator()(const std::string &a, const std::string &b) const;
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

namespace header {
inline constexpr const char *ACCEPT_ENCODING = "Accept-Encoding";
inline constexpr const char *ACCEPT_RANGES = "Accept-Ranges";
inline constexpr const char *ALLOW = "Allow";
inline constexpr const char *CONNECTION = "Connection";
inline constexpr const char *CONTENT_ENCODING = "Content-Encoding";
inline constexpr const char *CONTENT_LENGTH = "Content-Length";
inline constexpr const char *CONTENT_RANGE = "Content-Range";
inline constexpr const char *CONTENT_TYPE = "Content-Type";
inline constexpr const char *CONTENT_TYPE_OPTIONS = "X-Content-Type-Options";
inline constexpr const char *HOST = "Host";
inline constexpr const char *RANGE = "Range";
inline constexpr const char *TRANSFER_ENCODING = "Transfer-Encoding";
} // namespace header

namespace status {
inline constexpr int OK = 200;
inline constexpr int PARTIAL_CONTENT = 206;
inline constexpr int BAD_REQUEST = 400;
inline constexpr int NOT_FOUND = 404;
inline constexpr int METHOD_NOT_ALLOWED = 405;
inline constexpr int RANGE_NOT_SATISFIABLE = 416;
inline constexpr int INTERNAL_SERVER_ERROR = 500;
inline constexpr int BAD_GATEWAY = 502;
} // namespace status

struct HttpRequest {
  std::string method;
  std::string target;
  HttpHeaders headers;
};

struct HttpResponseHead {
  int status{status::OK};
  std::string reason;
  HttpHeaders headers;
};

std::optional<std::string> headerValue(const HttpHeaders &headers,
                                       const std::string &name);

/**
 * @brief Declared Content-Length, if any
 * @throws HttpParseError when the field is present but not a decimal number
 */
std::optional<uint64_t> contentLength(const HttpHeaders &headers);

/**
 * @brief Offset just past the blank line ending a message head
 * @return std::string_view::npos while the head is still incomplete
 */
size_t findHeadEnd(std::string_view buffer);

HttpRequest parseRequestHead(std::string_view head);
HttpResponseHead parseResponseHead(std::string_view head);

std::string serializeRequest(const HttpRequest &request);
std::string serializeResponseHead(const HttpResponseHead &response);

const char *statusReason(int status_code);

/**
 * @brief Decodes %XX escapes of a path segment
 * @throws HttpParseError on a truncated or non-hex escape
 */
std::string percentDecode(std::string_view text);
std::string percentEncode(std::string_view text);

} // namespace rangexfer
