#pragma once

#include "http_message.hpp"

#include <cstddef>
#include <optional>
#include <stop_token>
#include <string>

namespace rangexfer {

/**
 * @brief Server side of one HTTP exchange
 *
 * writeHead() commits the status line and headers; after that the status can
 * no longer change and failures can only abort the connection.
 *
 * stopToken() is signalled once the client went away or the server gave up on
 * the exchange; long-running handlers pass it on to their own I/O.
 */
class ResponseWriter {
public:
  virtual ~ResponseWriter() = default;

  virtual void writeHead(const HttpResponseHead &head) = 0;
  virtual void writeBody(const char *data, size_t length) = 0;
  virtual bool committed() const = 0;
  virtual std::stop_token stopToken() const { return {}; }
};

/**
 * @brief Application logic behind an HttpServer
 *
 * handle() turns failures it can still report into complete error responses.
 * It throws only after the response was committed, in which case the caller
 * drops the connection.
 */
class RequestHandler {
public:
  virtual ~RequestHandler() = default;

  virtual void handle(const HttpRequest &request, ResponseWriter &response) = 0;
};

/**
 * @brief Writes a complete text/plain response
 *
 * For HEAD requests only the head is written; Content-Length still describes
 * the body a GET would have received.
 */
void writeTextResponse(ResponseWriter &response, int status_code,
                       const std::string &text, bool head_only = false);

/**
 * @brief Extracts and percent-decodes {fileName} from "/download/{fileName}"
 *
 * Any query string is ignored.
 * @return std::nullopt if the target does not match the route
 * @throws HttpParseError on a malformed percent escape
 */
std::optional<std::string> downloadRouteIdentifier(const std::string &target);

} // namespace rangexfer
