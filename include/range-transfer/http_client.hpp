#pragma once
#include "byte_sink.hpp"
#include "constants.hpp"
#include "http_message.hpp"

#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>

namespace rangexfer {

struct ServerEndpoint {
  std::string host;
  int port{80};

  std::string toString() const;
};

/**
 * @brief Parses "http://host[:port][/]" into an endpoint
 * @throws std::invalid_argument for other schemes or a bad port
 */
ServerEndpoint parseEndpoint(const std::string &url);

/**
 * @brief Response whose head has been read and whose body is still pending
 */
class HttpResponseStream {
public:
  virtual ~HttpResponseStream() = default;

  virtual const HttpResponseHead &head() const = 0;

  /**
   * @brief Streams the body into the sink
   *
   * A body with a declared Content-Length must arrive complete; otherwise the
   * body ends when the server closes the connection.
   *
   * @throws IoError on a short body or transport failure
   * @throws CancelledError if stop was requested
   */
  virtual void readBody(const ByteSink &sink, std::stop_token stop = {}) = 0;

  std::string readAll(std::stop_token stop = {});
};

/**
 * @brief Sends HTTP requests to one server
 */
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  /**
   * @throws IoError if the server cannot be reached or the head is unreadable
   * @throws CancelledError if stop was requested before the head arrived
   */
  virtual std::unique_ptr<HttpResponseStream>
  send(const HttpRequest &request, std::stop_token stop = {}) = 0;
};

/**
 * @brief HttpTransport over plain TCP, one connection per request
 */
class TcpHttpTransport : public HttpTransport {
public:
  /**
   * @brief Constructor
   * @param endpoint Server to talk to
   * @param socket_timeout_ms Send/receive timeout in milliseconds
   */
  explicit TcpHttpTransport(
      ServerEndpoint endpoint,
      uint32_t socket_timeout_ms =
          constants::resumable_fetcher::DEFAULT_SOCKET_TIMEOUT_MS);

  /**
   * A stop request shuts the socket down, so blocked connect, send and
   * receive calls return at once instead of waiting out the timeout.
   */
  std::unique_ptr<HttpResponseStream>
  send(const HttpRequest &request, std::stop_token stop = {}) override;

  const ServerEndpoint &endpoint() const { return endpoint_; }

private:
  int connect_(std::stop_token stop) const;

  const ServerEndpoint endpoint_;
  const uint32_t socket_timeout_ms_;
};

} // namespace rangexfer
