#include <range-transfer/errors.hpp>
#include <range-transfer/fetch_service.hpp>
#include <range-transfer/http_client.hpp>
#include <range-transfer/http_server.hpp>
#include <range-transfer/range_server.hpp>
#include <range-transfer/resumable_fetcher.hpp>

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <stop_token>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace std::chrono_literals;
using test_support::TempDir;

namespace {

/** Keeps a response open, trickling body bytes until the peer goes away. */
class TricklingHandler : public rangexfer::RequestHandler {
public:
  explicit TricklingHandler(std::chrono::milliseconds duration)
      : duration_(duration) {}

  void handle(const rangexfer::HttpRequest &,
              rangexfer::ResponseWriter &response) override {
    rangexfer::HttpResponseHead head;
    head.headers["Content-Length"] = "100000000";
    response.writeHead(head);
    started_ = true;

    std::string piece(1000, 'x');
    auto deadline = std::chrono::steady_clock::now() + duration_;
    while (std::chrono::steady_clock::now() < deadline) {
      response.writeBody(piece.data(), piece.size());
      std::this_thread::sleep_for(20ms);
    }
  }

  bool started() const { return started_; }

private:
  std::chrono::milliseconds duration_;
  std::atomic<bool> started_{false};
};

/** Answers after a fixed delay. */
class SlowHandler : public rangexfer::RequestHandler {
public:
  explicit SlowHandler(std::chrono::milliseconds delay) : delay_(delay) {}

  void handle(const rangexfer::HttpRequest &,
              rangexfer::ResponseWriter &response) override {
    std::this_thread::sleep_for(delay_);
    rangexfer::writeTextResponse(response, 200, "done");
  }

private:
  std::chrono::milliseconds delay_;
};

/** Holds the response open until the exchange is cancelled. */
class StallingHandler : public rangexfer::RequestHandler {
public:
  explicit StallingHandler(bool send_head) : send_head_(send_head) {}

  void handle(const rangexfer::HttpRequest &,
              rangexfer::ResponseWriter &response) override {
    if (send_head_) {
      rangexfer::HttpResponseHead head;
      head.headers["Content-Length"] = "1000";
      response.writeHead(head);
    }
    started_ = true;
    auto stop = response.stopToken();
    auto deadline = std::chrono::steady_clock::now() + 10000ms;
    while (!stop.stop_requested() &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(10ms);
    }
    cancelled_ = stop.stop_requested();
  }

  bool started() const { return started_; }
  bool cancelled() const { return cancelled_; }

private:
  bool send_head_;
  std::atomic<bool> started_{false};
  std::atomic<bool> cancelled_{false};
};

/** Delays every request to the wrapped handler and counts them. */
class DelayedHandler : public rangexfer::RequestHandler {
public:
  DelayedHandler(std::shared_ptr<rangexfer::RequestHandler> inner,
                 std::chrono::milliseconds delay)
      : inner_(std::move(inner)), delay_(delay) {}

  void handle(const rangexfer::HttpRequest &request,
              rangexfer::ResponseWriter &response) override {
    ++requests_;
    std::this_thread::sleep_for(delay_);
    inner_->handle(request, response);
  }

  int requests() const { return requests_; }

private:
  std::shared_ptr<rangexfer::RequestHandler> inner_;
  std::chrono::milliseconds delay_;
  std::atomic<int> requests_{0};
};

/** Opens a connection, sends the request and leaves the socket open. */
int openExchange(int port, const std::string &request) {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock == -1) {
    throw std::runtime_error("socket failed");
  }
  struct sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(static_cast<uint16_t>(port));
  inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
  if (connect(sock, reinterpret_cast<struct sockaddr *>(&address),
              sizeof(address)) == -1 ||
      send(sock, request.data(), request.size(), MSG_NOSIGNAL) !=
          static_cast<ssize_t>(request.size())) {
    close(sock);
    throw std::runtime_error("exchange failed");
  }
  return sock;
}

std::string rawExchange(int port, const std::string &request) {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock == -1) {
    throw std::runtime_error("socket failed");
  }
  struct sockaddr_in address{};
  address.sin_family = AF_INET;
  address.sin_port = htons(static_cast<uint16_t>(port));
  inet_pton(AF_INET, "127.0.0.1", &address.sin_addr);
  if (connect(sock, reinterpret_cast<struct sockaddr *>(&address),
              sizeof(address)) == -1) {
    close(sock);
    throw std::runtime_error("connect failed");
  }
  if (send(sock, request.data(), request.size(), MSG_NOSIGNAL) !=
      static_cast<ssize_t>(request.size())) {
    close(sock);
    throw std::runtime_error("send failed");
  }

  std::string response;
  char buffer[4096];
  ssize_t received;
  while ((received = recv(sock, buffer, sizeof(buffer), 0)) > 0) {
    response.append(buffer, static_cast<size_t>(received));
  }
  close(sock);
  return response;
}

bool waitFor(const std::function<bool()> &condition,
             std::chrono::milliseconds timeout = 5000ms) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(10ms);
  }
  return true;
}

} // namespace

class HttpServerTest : public ::testing::Test {
protected:
  HttpServerTest()
      : server_dir_("http_server_remote"), client_dir_("http_server_local") {}

  void SetUp() override {
    source_ = test_support::makeText(1500000);
    test_support::writeFile(server_dir_ / "report.txt", source_);
    startServer(std::make_shared<rangexfer::RangeServer>(server_dir_.path()));
  }

  void TearDown() override {
    std::cout << "TearDown: Stopping server thread" << std::endl;
    stopServer();
    stopUpstream();
  }

  void startServer(std::shared_ptr<rangexfer::RequestHandler> handler,
                   std::chrono::milliseconds grace = 2000ms) {
    server_ = std::make_unique<rangexfer::HttpServer>(std::move(handler), 0, 64,
                                                      grace);
    server_->listen();
    server_thread_ = std::thread([this]() { server_->serve(); });
  }

  void stopServer() {
    if (!server_) {
      return;
    }
    server_->stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
    server_.reset();
  }

  std::shared_ptr<rangexfer::TcpHttpTransport> transport() const {
    return std::make_shared<rangexfer::TcpHttpTransport>(
        rangexfer::ServerEndpoint{"127.0.0.1", server_->port()}, 10000);
  }

  std::unique_ptr<rangexfer::ResumableFetcher>
  makeFetcher(const std::filesystem::path &dir, bool compression = true) {
    rangexfer::FetcherConfig config;
    config.download_dir = dir;
    config.accept_compression = compression;
    return std::make_unique<rangexfer::ResumableFetcher>(transport(), config);
  }

  /**
   * Puts a FetchService in front of a slow upstream serving a 20 KiB file in
   * 1 KiB chunks, so a full fetch takes several seconds.
   */
  void startSlowFetchService() {
    test_support::writeFile(server_dir_ / "small.txt",
                            test_support::makeText(20 * 1024));
    upstream_ = std::make_shared<DelayedHandler>(
        std::make_shared<rangexfer::RangeServer>(server_dir_.path()), 300ms);
    upstream_server_ = std::make_unique<rangexfer::HttpServer>(upstream_, 0);
    upstream_server_->listen();
    upstream_thread_ = std::thread([this]() { upstream_server_->serve(); });

    rangexfer::FetcherConfig config;
    config.download_dir = client_dir_.path();
    config.chunk_size = 1024;
    auto upstream_transport = std::make_shared<rangexfer::TcpHttpTransport>(
        rangexfer::ServerEndpoint{"127.0.0.1", upstream_server_->port()},
        10000);
    stopServer();
    startServer(std::make_shared<rangexfer::FetchService>(
                    std::make_shared<rangexfer::ResumableFetcher>(
                        upstream_transport, config)),
                100ms);
  }

  void stopUpstream() {
    if (!upstream_server_) {
      return;
    }
    upstream_server_->stop();
    if (upstream_thread_.joinable()) {
      upstream_thread_.join();
    }
    upstream_server_.reset();
  }

  TempDir server_dir_;
  TempDir client_dir_;
  std::string source_;
  std::unique_ptr<rangexfer::HttpServer> server_;
  std::thread server_thread_;
  std::shared_ptr<DelayedHandler> upstream_;
  std::unique_ptr<rangexfer::HttpServer> upstream_server_;
  std::thread upstream_thread_;
};

TEST_F(HttpServerTest, BindsEphemeralPort) {
  EXPECT_GT(server_->port(), 0);
  EXPECT_EQ(server_->activeConnections(), 0u);
}

TEST_F(HttpServerTest, AnswersSizeProbe) {
  rangexfer::HttpRequest request{"HEAD", "/download/report.txt", {}};
  auto response = transport()->send(request);

  EXPECT_EQ(response->head().status, 200);
  EXPECT_EQ(rangexfer::headerValue(response->head().headers, "Content-Length"),
            "1500000");
  EXPECT_EQ(rangexfer::headerValue(response->head().headers, "Connection"),
            "close");
  EXPECT_EQ(response->readAll(), "");
}

TEST_F(HttpServerTest, DownloadsOverSocketsWithGzip) {
  auto fetcher = makeFetcher(client_dir_.path());

  auto result = fetcher->fetch("report.txt");

  EXPECT_EQ(result.outcome, rangexfer::FetchOutcome::Completed);
  EXPECT_EQ(result.chunks_fetched, 3u);
  EXPECT_TRUE(test_support::readFile(client_dir_ / "report.txt") == source_);
}

TEST_F(HttpServerTest, DownloadsOverSocketsWithoutGzip) {
  auto fetcher = makeFetcher(client_dir_.path(), false);

  fetcher->fetch("report.txt");

  EXPECT_TRUE(test_support::readFile(client_dir_ / "report.txt") == source_);
}

TEST_F(HttpServerTest, ReportsErrorsAsPlainText) {
  auto response = rawExchange(server_->port(),
                              "GET /download/report.txt HTTP/1.1\r\n"
                              "Host: localhost\r\n\r\n");

  EXPECT_EQ(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
  EXPECT_NE(response.find("\r\n\r\nRange header required\n"),
            std::string::npos);
}

TEST_F(HttpServerTest, RejectsMalformedRequest) {
  auto response = rawExchange(server_->port(), "NONSENSE\r\n\r\n");

  EXPECT_EQ(response.rfind("HTTP/1.1 400 ", 0), 0u);
}

TEST_F(HttpServerTest, ConcurrentDownloadsAreIndependent) {
  constexpr int client_count = 4;
  std::vector<std::unique_ptr<TempDir>> dirs;
  for (int i = 0; i < client_count; ++i) {
    dirs.push_back(
        std::make_unique<TempDir>("http_server_client_" + std::to_string(i)));
  }

  std::atomic<int> succeeded{0};
  std::vector<std::thread> clients;
  for (int i = 0; i < client_count; ++i) {
    clients.emplace_back([&, i]() {
      try {
        auto fetcher = makeFetcher(dirs[i]->path(), i % 2 == 0);
        fetcher->fetch("report.txt");
        if (test_support::readFile(*dirs[i] / "report.txt") == source_) {
          ++succeeded;
        }
      } catch (const std::exception &e) {
        std::cerr << "Client " << i << " failed: " << e.what() << std::endl;
      }
    });
  }
  for (auto &client : clients) {
    client.join();
  }

  EXPECT_EQ(succeeded.load(), client_count);
}

TEST_F(HttpServerTest, FetchServiceSerializesSameName) {
  rangexfer::FetcherConfig config;
  config.download_dir = client_dir_.path();
  config.chunk_size = 64 * 1024;
  rangexfer::FetchService service(
      std::make_shared<rangexfer::ResumableFetcher>(transport(), config));

  constexpr int request_count = 4;
  std::vector<std::string> bodies(request_count);
  std::vector<std::thread> requests;
  for (int i = 0; i < request_count; ++i) {
    requests.emplace_back([&, i]() {
      test_support::MemoryResponseWriter response;
      service.handle(
          rangexfer::HttpRequest{"GET", "/download/report.txt", {}}, response);
      bodies[i] = std::to_string(response.status()) + " " + response.body();
    });
  }
  for (auto &request : requests) {
    request.join();
  }

  int completed = 0;
  int already = 0;
  for (const auto &body : bodies) {
    completed += body == "200 Download complete\n" ? 1 : 0;
    already += body == "200 File already downloaded\n" ? 1 : 0;
  }
  EXPECT_EQ(completed, 1);
  EXPECT_EQ(already, request_count - 1);
  EXPECT_TRUE(test_support::readFile(client_dir_ / "report.txt") == source_);
}

TEST_F(HttpServerTest, StopLetsInFlightResponseFinish) {
  stopServer();
  startServer(std::make_shared<SlowHandler>(300ms));

  std::string response;
  std::thread client([&]() {
    response = rawExchange(server_->port(), "GET / HTTP/1.1\r\n\r\n");
  });
  ASSERT_TRUE(waitFor([this]() { return server_->activeConnections() == 1; }));

  stopServer();
  client.join();

  EXPECT_EQ(response.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
  EXPECT_NE(response.find("\r\n\r\ndone\n"), std::string::npos);
}

TEST_F(HttpServerTest, StopForceClosesAfterGracePeriod) {
  stopServer();
  auto handler = std::make_shared<TricklingHandler>(10000ms);
  startServer(handler, 200ms);
  auto client_transport = transport();

  std::atomic<bool> short_body{false};
  std::thread client([&]() {
    auto response =
        client_transport->send(rangexfer::HttpRequest{"GET", "/", {}});
    try {
      response->readAll();
    } catch (const rangexfer::IoError &e) {
      std::cout << "Client saw: " << e.what() << std::endl;
      short_body = true;
    } catch (const std::exception &e) {
      std::cerr << "Unexpected client error: " << e.what() << std::endl;
    }
  });
  ASSERT_TRUE(waitFor([&handler]() { return handler->started(); }));

  auto stop_started = std::chrono::steady_clock::now();
  stopServer();
  auto stop_took = std::chrono::steady_clock::now() - stop_started;
  client.join();

  EXPECT_TRUE(short_body.load());
  EXPECT_LT(stop_took, 5000ms);
}

TEST_F(HttpServerTest, ClientHangupCancelsUpstreamFetch) {
  startSlowFetchService();

  int sock = openExchange(server_->port(), "GET /download/small.txt HTTP/1.1\r\n"
                                           "Host: localhost\r\n\r\n");
  std::this_thread::sleep_for(700ms);
  close(sock);
  ASSERT_TRUE(waitFor([this]() { return server_->activeConnections() == 0; },
                      1000ms));

  auto stop_started = std::chrono::steady_clock::now();
  stopServer();
  auto stop_took = std::chrono::steady_clock::now() - stop_started;

  std::cout << "Upstream saw " << upstream_->requests() << " request(s)"
            << std::endl;
  EXPECT_LT(stop_took, 1500ms);
  EXPECT_LT(upstream_->requests(), 21);
}

TEST_F(HttpServerTest, GracePeriodExpiryCancelsUpstreamFetch) {
  startSlowFetchService();

  int sock = openExchange(server_->port(), "GET /download/small.txt HTTP/1.1\r\n"
                                           "Host: localhost\r\n\r\n");
  ASSERT_TRUE(waitFor([this]() { return upstream_->requests() >= 2; }));

  auto stop_started = std::chrono::steady_clock::now();
  stopServer();
  auto stop_took = std::chrono::steady_clock::now() - stop_started;
  close(sock);

  EXPECT_LT(stop_took, 1500ms);
  EXPECT_LT(upstream_->requests(), 21);
}

TEST_F(HttpServerTest, StopTokenInterruptsStalledBody) {
  stopServer();
  auto handler = std::make_shared<StallingHandler>(true);
  startServer(handler);
  auto client_transport = transport();

  std::stop_source cancel;
  auto response = client_transport->send(
      rangexfer::HttpRequest{"GET", "/", {}}, cancel.get_token());
  ASSERT_EQ(response->head().status, 200);

  std::thread canceller([&cancel]() {
    std::this_thread::sleep_for(200ms);
    cancel.request_stop();
  });
  auto read_started = std::chrono::steady_clock::now();
  EXPECT_THROW(response->readAll(cancel.get_token()), rangexfer::CancelledError);
  auto read_took = std::chrono::steady_clock::now() - read_started;
  canceller.join();

  EXPECT_LT(read_took, 1500ms);
  EXPECT_TRUE(waitFor([&handler]() { return handler->cancelled(); }));
}

TEST_F(HttpServerTest, StopTokenInterruptsWaitForHead) {
  stopServer();
  auto handler = std::make_shared<StallingHandler>(false);
  startServer(handler);
  auto client_transport = transport();

  std::stop_source cancel;
  std::thread canceller([&cancel, &handler]() {
    waitFor([&handler]() { return handler->started(); });
    std::this_thread::sleep_for(200ms);
    cancel.request_stop();
  });
  auto send_started = std::chrono::steady_clock::now();
  EXPECT_THROW(client_transport->send(rangexfer::HttpRequest{"GET", "/", {}},
                                      cancel.get_token()),
               rangexfer::CancelledError);
  auto send_took = std::chrono::steady_clock::now() - send_started;
  canceller.join();

  EXPECT_LT(send_took, 1500ms);
}

TEST_F(HttpServerTest, UnreachableServerIsAnIoError) {
  int port = server_->port();
  stopServer();

  rangexfer::TcpHttpTransport closed(rangexfer::ServerEndpoint{"127.0.0.1", port},
                                     1000);
  EXPECT_THROW(closed.send(rangexfer::HttpRequest{"HEAD", "/download/a", {}}),
               rangexfer::IoError);
}

TEST(ServerEndpointTest, ParsesServerUrls) {
  auto endpoint = rangexfer::parseEndpoint("http://localhost:8000");
  EXPECT_EQ(endpoint.host, "localhost");
  EXPECT_EQ(endpoint.port, 8000);

  auto defaulted = rangexfer::parseEndpoint("http://example.org/");
  EXPECT_EQ(defaulted.host, "example.org");
  EXPECT_EQ(defaulted.port, 80);
  EXPECT_EQ(defaulted.toString(), "http://example.org:80");

  EXPECT_THROW(rangexfer::parseEndpoint("https://example.org"),
               std::invalid_argument);
  EXPECT_THROW(rangexfer::parseEndpoint("http://host:0"),
               std::invalid_argument);
  EXPECT_THROW(rangexfer::parseEndpoint("http://:80"), std::invalid_argument);
}
