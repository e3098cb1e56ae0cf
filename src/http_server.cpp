#include <range-transfer/errors.hpp>
#include <range-transfer/http_server.hpp>
#include <range-transfer/logger.hpp>
#include <range-transfer/socket_io.hpp>

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace rangexfer {

namespace {

class SocketResponseWriter : public ResponseWriter {
public:
  SocketResponseWriter(int client_socket, std::stop_token stop)
      : client_socket_(client_socket), stop_(std::move(stop)) {}

  void writeHead(const HttpResponseHead &head) override {
    HttpResponseHead framed = head;
    framed.headers[header::CONNECTION] = "close";
    std::string serialized = serializeResponseHead(framed);
    committed_ = true;
    sendAll(client_socket_, serialized.data(), serialized.size());
  }

  void writeBody(const char *data, size_t length) override {
    sendAll(client_socket_, data, length);
  }

  bool committed() const override { return committed_; }
  std::stop_token stopToken() const override { return stop_; }

private:
  int client_socket_;
  std::stop_token stop_;
  bool committed_{false};
};

// The request was read in full, so the only thing the peer can still do is
// hang up.
void watchForHangup(int client_socket, std::stop_source &connection,
                    std::stop_token done) {
  while (!done.stop_requested() && !connection.stop_requested()) {
    struct pollfd peer{client_socket, POLLRDHUP, 0};
    int ready = poll(&peer, 1, constants::http_server::PEER_POLL_INTERVAL_MS);
    if ((ready == -1 && errno != EINTR) ||
        (ready > 0 && (peer.revents & POLLNVAL))) {
      return;
    }
    if (ready > 0 && (peer.revents & (POLLRDHUP | POLLHUP | POLLERR))) {
      Logger::log(LogLevel::DEBUG, "Client hung up before the response was done");
      connection.request_stop();
      return;
    }
  }
}

} // namespace

HttpServer::~HttpServer() {
  stop();
  for (auto &worker : workers_) {
    worker.thread.request_stop();
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  if (server_socket_ != -1) {
    close(server_socket_);
  }
}

void HttpServer::stop() { should_stop_ = true; }

size_t HttpServer::activeConnections() const {
  std::lock_guard lock(clients_mutex_);
  return active_clients_.size();
}

int HttpServer::initializeSocket_(int port, int max_clients) {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock == -1) {
    throw std::runtime_error("Failed opening stream socket: " +
                             std::string(strerror(errno)));
  }

  int reuseaddr = 1;
  if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuseaddr,
                 sizeof(reuseaddr)) == -1) {
    close(sock);
    throw std::runtime_error("Failed to set SO_REUSEADDR: " +
                             std::string(strerror(errno)));
  }

  struct sockaddr_in server{};
  server.sin_family = AF_INET;
  server.sin_port = htons(static_cast<uint16_t>(port));
  server.sin_addr.s_addr = INADDR_ANY;
  if (bind(sock, reinterpret_cast<struct sockaddr *>(&server), sizeof(server)) <
      0) {
    close(sock);
    throw std::runtime_error("Binding socket failed: " +
                             std::string(strerror(errno)));
  }
  if (::listen(sock, max_clients) == -1) {
    close(sock);
    throw std::runtime_error("Failed listen: " + std::string(strerror(errno)));
  }

  socklen_t length = sizeof(server);
  if (getsockname(sock, reinterpret_cast<struct sockaddr *>(&server),
                  &length) == -1) {
    close(sock);
    throw std::runtime_error("Failed getsockname: " +
                             std::string(strerror(errno)));
  }
  port_ = ntohs(server.sin_port);
  return sock;
}

void HttpServer::listen() {
  if (server_socket_ != -1) {
    return;
  }
  server_socket_ = initializeSocket_(port_, max_clients_);
  Logger::log(LogLevel::INFO, "Listening on port " + std::to_string(port_));
}

void HttpServer::handleClient_(int client_socket,
                               std::stop_token server_stop) {
  std::stop_source connection;
  std::stop_callback forward_stop(server_stop,
                                  [&connection]() { connection.request_stop(); });
  SocketResponseWriter writer(client_socket, connection.get_token());
  try {
    setSocketTimeouts(client_socket,
                      constants::http_server::CLIENT_SOCKET_TIMEOUT_MS);

    std::string buffer;
    std::vector<char> chunk(constants::http::RECV_BUFFER_SIZE);
    size_t head_end = std::string::npos;
    while ((head_end = findHeadEnd(buffer)) == std::string::npos) {
      if (buffer.size() > constants::http::MAX_HEAD_SIZE) {
        writeTextResponse(writer, 431, statusReason(431));
        return;
      }
      size_t received = receiveSome(client_socket, chunk.data(), chunk.size());
      if (received == 0) {
        return;
      }
      buffer.append(chunk.data(), received);
    }

    HttpRequest request;
    try {
      request = parseRequestHead(std::string_view(buffer).substr(0, head_end));
    } catch (const HttpParseError &e) {
      Logger::log(LogLevel::WARN, e.what());
      writeTextResponse(writer, status::BAD_REQUEST,
                        statusReason(status::BAD_REQUEST));
      return;
    }

    Logger::log(LogLevel::DEBUG, request.method + " " + request.target);
    std::jthread hangup_watch([client_socket, &connection](std::stop_token done) {
      watchForHangup(client_socket, connection, done);
    });
    handler_->handle(request, writer);
  } catch (const std::exception &e) {
    if (!writer.committed()) {
      try {
        writeTextResponse(writer, status::INTERNAL_SERVER_ERROR, e.what());
      } catch (const std::exception &send_error) {
        Logger::log(LogLevel::ERROR,
                    std::string("Failed to send error response: ") +
                        send_error.what());
      }
    } else {
      Logger::log(LogLevel::ERROR,
                  std::string("Connection aborted mid-response: ") + e.what());
    }
  }
}

void HttpServer::reapWorkers_() {
  std::erase_if(workers_, [](Worker &worker) {
    if (!worker.done->load()) {
      return false;
    }
    worker.thread.join();
    return true;
  });
}

void HttpServer::drainConnections_() {
  std::unique_lock lock(clients_mutex_);
  if (!active_clients_.empty()) {
    Logger::log(LogLevel::INFO,
                "Waiting up to " + std::to_string(grace_period_.count()) +
                    "ms for " + std::to_string(active_clients_.size()) +
                    " in-flight connection(s)");
  }
  bool drained = clients_cv_.wait_for(lock, grace_period_, [this] {
    return active_clients_.empty();
  });
  if (!drained) {
    Logger::log(LogLevel::WARN, "Grace period elapsed, force-closing " +
                                    std::to_string(active_clients_.size()) +
                                    " connection(s)");
    for (auto &worker : workers_) {
      worker.thread.request_stop();
    }
    for (int client_socket : active_clients_) {
      shutdown(client_socket, SHUT_RDWR);
    }
  }
  lock.unlock();

  for (auto &worker : workers_) {
    if (worker.thread.joinable()) {
      worker.thread.join();
    }
  }
  workers_.clear();
}

void HttpServer::serve() {
  try {
    if (server_socket_ < 0) {
      throw std::runtime_error("serve() called before listen()");
    }

    while (!should_stop_) {
      struct pollfd listener{server_socket_, POLLIN, 0};
      int ready =
          poll(&listener, 1, constants::http_server::ACCEPT_POLL_TIMEOUT_MS);
      reapWorkers_();
      if (ready <= 0) {
        if (ready == -1 && errno != EINTR) {
          throw std::runtime_error("poll failed: " +
                                   std::string(strerror(errno)));
        }
        continue;
      }

      struct sockaddr_in client{};
      socklen_t client_length = sizeof(client);
      int client_socket =
          accept(server_socket_, reinterpret_cast<struct sockaddr *>(&client),
                 &client_length);
      if (client_socket == -1) {
        continue;
      }

      char client_ip[INET_ADDRSTRLEN];
      inet_ntop(AF_INET, &(client.sin_addr), client_ip, INET_ADDRSTRLEN);
      Logger::log(LogLevel::DEBUG,
                  "New connection from " + std::string(client_ip));

      {
        std::lock_guard lock(clients_mutex_);
        active_clients_.insert(client_socket);
      }

      try {
        auto done = std::make_shared<std::atomic<bool>>(false);
        workers_.push_back(Worker{
            std::jthread([this, client_socket, done](std::stop_token stop) {
              handleClient_(client_socket, stop);
              {
                std::lock_guard lock(clients_mutex_);
                active_clients_.erase(client_socket);
              }
              close(client_socket);
              clients_cv_.notify_all();
              *done = true;
            }),
            done});
      } catch (const std::exception &e) {
        Logger::log(LogLevel::ERROR,
                    std::string("Failed to create client thread: ") + e.what());
        {
          std::lock_guard lock(clients_mutex_);
          active_clients_.erase(client_socket);
        }
        close(client_socket);
      }
    }

    close(server_socket_);
    server_socket_ = -1;
    Logger::log(LogLevel::INFO, "Stopped accepting connections");
    drainConnections_();
  } catch (const std::exception &e) {
    Logger::log(LogLevel::ERROR, std::string("Server error: ") + e.what());
    throw;
  }
}

void HttpServer::run() {
  listen();
  serve();
}

} // namespace rangexfer
