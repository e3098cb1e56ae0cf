#include "range-transfer/errors.hpp"
#include "range-transfer/fetch_service.hpp"
#include "range-transfer/http_client.hpp"
#include "range-transfer/http_server.hpp"
#include "range-transfer/logger.hpp"
#include "range-transfer/resumable_fetcher.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool> shutdown_requested{false};

void signalHandler(int) { shutdown_requested = true; }

namespace {

void printUsage(const char *program) {
  std::cerr << "Usage:\n"
            << "  " << program
            << " get <server_url> <file_name> [download_dir=.] [--no-gzip] "
               "[--attempts=N] [-v]\n"
            << "  " << program
            << " serve <server_url> [port=8888] [download_dir=.] [-v]\n";
}

struct Options {
  std::vector<std::string> positional;
  rangexfer::FetcherConfig config;
  bool verbose{false};
};

Options parseOptions(int argc, char *argv[]) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-v") {
      options.verbose = true;
    } else if (arg == "--no-gzip") {
      options.config.accept_compression = false;
    } else if (arg.rfind("--attempts=", 0) == 0) {
      options.config.max_attempts = std::stoi(arg.substr(11));
      if (options.config.max_attempts < 1) {
        throw std::invalid_argument("--attempts must be at least 1");
      }
    } else if (arg.rfind("--", 0) == 0) {
      throw std::invalid_argument("Unknown option " + arg);
    } else {
      options.positional.push_back(arg);
    }
  }
  return options;
}

int runGet(Options &options) {
  if (options.positional.size() < 3 || options.positional.size() > 4) {
    return -1;
  }
  if (options.positional.size() == 4) {
    options.config.download_dir = options.positional[3];
  }
  auto transport = std::make_shared<rangexfer::TcpHttpTransport>(
      rangexfer::parseEndpoint(options.positional[1]));
  rangexfer::ResumableFetcher fetcher(transport, options.config);

  int last_percentage = -1;
  fetcher.setProgressCallback([&last_percentage](
                                  const rangexfer::FetchProgress &progress) {
    int current_percentage = static_cast<int>(
        (progress.downloadedBytes * 100) / progress.totalSize);
    if (current_percentage != last_percentage) {
      std::cout << "\rDownloading: " << progress.downloadedBytes << "/"
                << progress.totalSize << " bytes (" << current_percentage
                << "%, " << progress.speedMBps << " MB/s)    " << std::flush;
      last_percentage = current_percentage;
    }
  });

  std::stop_source stop_source;
  std::jthread signal_watcher([&stop_source](std::stop_token own) {
    while (!own.stop_requested()) {
      if (shutdown_requested) {
        stop_source.request_stop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  try {
    auto result =
        fetcher.fetchWithRetries(options.positional[2], stop_source.get_token());
    if (result.outcome == rangexfer::FetchOutcome::AlreadyComplete) {
      std::cout << "File already downloaded" << std::endl;
    } else {
      std::cout << "\nDownload complete" << std::endl;
    }
    return 0;
  } catch (const rangexfer::TransferError &e) {
    std::cerr << "\nDownload failed (" << rangexfer::errorKindName(e.kind())
              << "): " << e.what() << std::endl;
    return 1;
  }
}

int runServe(Options &options) {
  if (options.positional.size() < 2 || options.positional.size() > 4) {
    return -1;
  }
  int port = options.positional.size() > 2
                 ? std::stoi(options.positional[2])
                 : constants::resumable_fetcher::DEFAULT_SERVICE_PORT;
  if (options.positional.size() == 4) {
    options.config.download_dir = options.positional[3];
  }
  auto transport = std::make_shared<rangexfer::TcpHttpTransport>(
      rangexfer::parseEndpoint(options.positional[1]));
  auto fetcher =
      std::make_shared<rangexfer::ResumableFetcher>(transport, options.config);

  rangexfer::HttpServer server(
      std::make_shared<rangexfer::FetchService>(fetcher), port);
  server.listen();
  std::atomic<bool> failed{false};
  std::jthread server_thread([&server, &failed]() {
    try {
      server.serve();
    } catch (const std::exception &e) {
      std::cerr << "Server failed: " << e.what() << std::endl;
      failed = true;
      shutdown_requested = true;
    }
  });
  std::cout << "Started server on port: " << server.port() << std::endl;

  while (!shutdown_requested) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  std::cout << "\nShutting down...\n";
  server.stop();
  server_thread.join();
  if (failed) {
    return 1;
  }
  std::cout << "Server shutdown successfully." << std::endl;
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    Options options = parseOptions(argc, argv);
    if (options.positional.empty()) {
      printUsage(argv[0]);
      return 1;
    }

    rangexfer::Logger::setComponent("range-fetcher");
    if (options.verbose) {
      rangexfer::Logger::setLevel(rangexfer::LogLevel::DEBUG);
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);

    int rc = -1;
    if (options.positional[0] == "get") {
      rc = runGet(options);
    } else if (options.positional[0] == "serve") {
      rc = runServe(options);
    }
    if (rc < 0) {
      printUsage(argv[0]);
      return 1;
    }
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
