#pragma once
#include "constants.hpp"
#include "request_handler.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <thread>

namespace rangexfer {
/**
 * @brief HTTP/1.1 server dispatching requests to a RequestHandler
 *
 * Accepts TCP connections and serves each on its own thread: one request per
 * connection, every response sent with "Connection: close". Handlers do not
 * share state through the server.
 *
 * Each exchange carries a stop token (ResponseWriter::stopToken()) that fires
 * when the client hangs up mid-request or when stop() gives up on it after the
 * grace period.
 */
class HttpServer {
public:
  /**
   * @brief Constructs the server; nothing is bound until listen()
   * @param handler Application logic invoked for every request
   * @param port The port to listen on, 0 for an ephemeral port
   * @param max_clients Maximum number of queued client connections
   * @param grace_period How long stop() lets in-flight responses finish
   */
  explicit HttpServer(
      std::shared_ptr<RequestHandler> handler,
      int port = constants::range_server::DEFAULT_PORT,
      int max_clients = constants::http_server::DEFAULT_MAX_CLIENTS,
      std::chrono::milliseconds grace_period =
          constants::http_server::DEFAULT_GRACE_PERIOD)
      : handler_(std::move(handler)), port_(port), max_clients_(max_clients),
        grace_period_(grace_period) {}

  ~HttpServer();

  HttpServer(const HttpServer &) = delete;
  HttpServer &operator=(const HttpServer &) = delete;

  /**
   * @brief Binds and starts listening
   * @throws std::runtime_error if the socket cannot be set up
   */
  void listen();

  /**
   * @brief Accept loop; returns once stop() was requested and in-flight
   * connections finished or were force-closed after the grace period
   */
  void serve();

  void run();

  /**
   * @brief Requests shutdown. Safe to call from any thread.
   */
  void stop();

  int port() const { return port_; }
  size_t activeConnections() const;

private:
  struct Worker {
    std::jthread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  /**
   * @brief Initializes TCP server socket for accepting requests
   *
   * Enables address reuse to handle server restarts. Updates port_ with the
   * bound port when an ephemeral port was requested.
   *
   * @return Socket descriptor
   */
  int initializeSocket_(int port, int max_clients);

  /**
   * @brief Reads one request from the connection and answers it
   *
   * @param client_socket Socket for connected client
   * @param server_stop Signalled when the grace period ran out
   */
  void handleClient_(int client_socket, std::stop_token server_stop);

  void reapWorkers_();
  void drainConnections_();

  std::shared_ptr<RequestHandler> handler_;
  int server_socket_{-1};
  int port_;
  const int max_clients_;
  const std::chrono::milliseconds grace_period_;
  std::atomic<bool> should_stop_{false};

  std::list<Worker> workers_;
  mutable std::mutex clients_mutex_;
  std::condition_variable clients_cv_;
  std::set<int> active_clients_;
};

} // namespace rangexfer
