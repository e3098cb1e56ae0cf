#include "range-transfer/http_server.hpp"
#include "range-transfer/logger.hpp"
#include "range-transfer/range_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool> shutdown_requested{false};

void signalHandler(int) { shutdown_requested = true; }

class Application {
public:
  Application(int port, const std::filesystem::path &root,
              std::chrono::seconds grace_period)
      : server_(std::make_shared<rangexfer::RangeServer>(root), port,
                constants::http_server::DEFAULT_MAX_CLIENTS, grace_period) {}

  ~Application() { stop(); }

  void start() {
    server_.listen();
    server_thread_ = std::jthread([this]() {
      try {
        server_.serve();
      } catch (const std::exception &e) {
        std::cerr << "Server failed: " << e.what() << std::endl;
        failed_ = true;
        shutdown_requested = true;
      }
    });
    std::cout << "Started server on port: " << server_.port() << std::endl;
  }

  void stop() {
    server_.stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  bool failed() const { return failed_; }

private:
  rangexfer::HttpServer server_;
  std::jthread server_thread_;
  std::atomic<bool> failed_{false};
};

int main(int argc, char *argv[]) {
  try {
    std::vector<std::string> args;
    bool verbose = false;
    for (int i = 1; i < argc; ++i) {
      if (std::strcmp(argv[i], "-v") == 0) {
        verbose = true;
      } else {
        args.emplace_back(argv[i]);
      }
    }
    if (args.size() > 3) {
      std::cerr << "Usage: " << argv[0]
                << " [port=8000] [root=files] [grace_seconds=30] [-v]\n";
      return 1;
    }

    int port = args.size() > 0 ? std::stoi(args[0])
                               : constants::range_server::DEFAULT_PORT;
    std::filesystem::path root =
        args.size() > 1 ? args[1] : constants::range_server::DEFAULT_ROOT;
    std::chrono::seconds grace_period =
        args.size() > 2 ? std::chrono::seconds(std::stoi(args[2]))
                        : constants::http_server::DEFAULT_GRACE_PERIOD;

    if (port < 0 || port > 65535 || grace_period.count() < 0) {
      std::cerr << "Invalid port or grace period\n";
      return 1;
    }
    if (!std::filesystem::is_directory(root)) {
      std::cerr << "Serving root " << root << " is not a directory\n";
      return 1;
    }

    rangexfer::Logger::setComponent("range-server");
    if (verbose) {
      rangexfer::Logger::setLevel(rangexfer::LogLevel::DEBUG);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    Application app(port, root, grace_period);
    app.start();
    while (!shutdown_requested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cout << "\nShutting down...\n";
    app.stop();
    if (app.failed()) {
      return 1;
    }
    std::cout << "Server shutdown successfully." << std::endl;
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
