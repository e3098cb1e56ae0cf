#include <range-transfer/errors.hpp>
#include <range-transfer/http_client.hpp>
#include <range-transfer/socket_io.hpp>

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <cstring>
#include <functional>
#include <netdb.h>
#include <optional>
#include <stop_token>
#include <stdexcept>
#include <string_view>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace rangexfer {

namespace {

std::stop_callback<std::function<void()>> shutdownOnStop(std::stop_token stop,
                                                         int sock) {
  return std::stop_callback<std::function<void()>>(
      std::move(stop), [sock]() { shutdown(sock, SHUT_RDWR); });
}

class SocketResponseStream : public HttpResponseStream {
public:
  SocketResponseStream(int sock, HttpResponseHead head, std::string leftover,
                       bool expects_body)
      : sock_(sock), head_(std::move(head)), leftover_(std::move(leftover)),
        expects_body_(expects_body) {}

  ~SocketResponseStream() override { close(sock_); }

  SocketResponseStream(const SocketResponseStream &) = delete;
  SocketResponseStream &operator=(const SocketResponseStream &) = delete;

  const HttpResponseHead &head() const override { return head_; }

  void readBody(const ByteSink &sink, std::stop_token stop) override {
    if (!expects_body_ || consumed_) {
      return;
    }
    consumed_ = true;

    if (headerValue(head_.headers, header::TRANSFER_ENCODING)) {
      throw ProtocolViolationError("unsupported Transfer-Encoding");
    }
    std::optional<uint64_t> declared;
    try {
      declared = contentLength(head_.headers);
    } catch (const HttpParseError &e) {
      throw ProtocolViolationError(e.what());
    }

    uint64_t received = 0;
    auto deliver = [&](const char *data, size_t length) {
      if (declared) {
        length = static_cast<size_t>(
            std::min<uint64_t>(length, *declared - received));
      }
      if (length > 0) {
        sink(data, length);
        received += length;
      }
    };

    deliver(leftover_.data(), leftover_.size());
    leftover_.clear();

    auto abort_io = shutdownOnStop(stop, sock_);
    std::vector<char> buffer(constants::http::RECV_BUFFER_SIZE);
    try {
      while (!declared || received < *declared) {
        if (stop.stop_requested()) {
          throw CancelledError();
        }
        size_t count = receiveSome(sock_, buffer.data(), buffer.size());
        if (count == 0) {
          if (stop.stop_requested()) {
            throw CancelledError();
          }
          break;
        }
        deliver(buffer.data(), count);
      }
    } catch (const IoError &) {
      if (stop.stop_requested()) {
        throw CancelledError();
      }
      throw;
    }

    if (declared && received < *declared) {
      throw IoError("Connection closed after " + std::to_string(received) +
                    " of " + std::to_string(*declared) + " body bytes");
    }
  }

private:
  int sock_;
  HttpResponseHead head_;
  std::string leftover_;
  bool expects_body_;
  bool consumed_{false};
};

} // namespace

std::string ServerEndpoint::toString() const {
  return "http://" + host + ":" + std::to_string(port);
}

ServerEndpoint parseEndpoint(const std::string &url) {
  std::string_view rest = url;
  constexpr std::string_view scheme = "http://";
  if (!rest.starts_with(scheme)) {
    throw std::invalid_argument("Unsupported server URL '" + url +
                                "', expected http://host[:port]");
  }
  rest.remove_prefix(scheme.size());
  rest = rest.substr(0, rest.find('/'));

  ServerEndpoint endpoint;
  auto colon = rest.rfind(':');
  if (colon == std::string_view::npos) {
    endpoint.host = std::string(rest);
  } else {
    endpoint.host = std::string(rest.substr(0, colon));
    auto port_text = rest.substr(colon + 1);
    auto [ptr, ec] = std::from_chars(
        port_text.data(), port_text.data() + port_text.size(), endpoint.port);
    if (port_text.empty() || ec != std::errc() ||
        ptr != port_text.data() + port_text.size() || endpoint.port <= 0 ||
        endpoint.port > 65535) {
      throw std::invalid_argument("Invalid port in server URL '" + url + "'");
    }
  }
  if (endpoint.host.empty()) {
    throw std::invalid_argument("Missing host in server URL '" + url + "'");
  }
  return endpoint;
}

std::string HttpResponseStream::readAll(std::stop_token stop) {
  std::string body;
  readBody([&body](const char *data, size_t length) { body.append(data, length); },
           stop);
  return body;
}

TcpHttpTransport::TcpHttpTransport(ServerEndpoint endpoint,
                                   uint32_t socket_timeout_ms)
    : endpoint_(std::move(endpoint)), socket_timeout_ms_(socket_timeout_ms) {}

int TcpHttpTransport::connect_(std::stop_token stop) const {
  struct addrinfo hints{};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo *results = nullptr;
  std::string service = std::to_string(endpoint_.port);
  int rc = getaddrinfo(endpoint_.host.c_str(), service.c_str(), &hints, &results);
  if (rc != 0) {
    throw IoError("Error resolving hostname " + endpoint_.host + ": " +
                  gai_strerror(rc));
  }
  std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> guard(results,
                                                                  freeaddrinfo);

  std::string last_error = "no addresses";
  for (auto *info = results; info != nullptr; info = info->ai_next) {
    int sock = socket(info->ai_family, info->ai_socktype, info->ai_protocol);
    if (sock == -1) {
      last_error = strerror(errno);
      continue;
    }
    try {
      setSocketTimeouts(sock, socket_timeout_ms_);
    } catch (const std::runtime_error &e) {
      close(sock);
      throw IoError(e.what());
    }
    int rc;
    {
      auto abort_connect = shutdownOnStop(stop, sock);
      rc = connect(sock, info->ai_addr, info->ai_addrlen);
      last_error = strerror(errno);
    }
    if (stop.stop_requested()) {
      close(sock);
      throw CancelledError();
    }
    if (rc == 0) {
      return sock;
    }
    close(sock);
  }
  throw IoError("Error connecting to " + endpoint_.toString() + ": " +
                last_error);
}

std::unique_ptr<HttpResponseStream>
TcpHttpTransport::send(const HttpRequest &request, std::stop_token stop) {
  HttpRequest framed = request;
  framed.headers[header::HOST] =
      endpoint_.host + ":" + std::to_string(endpoint_.port);
  framed.headers[header::CONNECTION] = "close";
  std::string serialized = serializeRequest(framed);

  if (stop.stop_requested()) {
    throw CancelledError();
  }
  int sock = connect_(stop);
  try {
    auto abort_io = shutdownOnStop(stop, sock);
    sendAll(sock, serialized.data(), serialized.size());

    std::string buffer;
    std::vector<char> chunk(constants::http::RECV_BUFFER_SIZE);
    size_t head_end = std::string::npos;
    while ((head_end = findHeadEnd(buffer)) == std::string::npos) {
      if (buffer.size() > constants::http::MAX_HEAD_SIZE) {
        throw ProtocolViolationError("response head too large");
      }
      size_t received = receiveSome(sock, chunk.data(), chunk.size());
      if (received == 0) {
        throw IoError("Connection closed before response head was complete");
      }
      buffer.append(chunk.data(), received);
    }

    HttpResponseHead head;
    try {
      head = parseResponseHead(std::string_view(buffer).substr(0, head_end));
    } catch (const HttpParseError &e) {
      throw ProtocolViolationError(e.what());
    }
    bool expects_body = request.method != "HEAD";
    return std::make_unique<SocketResponseStream>(
        sock, std::move(head), buffer.substr(head_end), expects_body);
  } catch (const IoError &) {
    close(sock);
    if (stop.stop_requested()) {
      throw CancelledError();
    }
    throw;
  } catch (...) {
    close(sock);
    throw;
  }
}

} // namespace rangexfer
