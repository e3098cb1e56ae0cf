#include <range-transfer/compression.hpp>
#include <range-transfer/errors.hpp>
#include <range-transfer/local_file.hpp>
#include <range-transfer/logger.hpp>
#include <range-transfer/resumable_fetcher.hpp>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <optional>
#include <stdexcept>

namespace rangexfer {

namespace {

std::string formatSeconds(double seconds) {
  char text[32];
  std::snprintf(text, sizeof(text), "%.3f", seconds);
  return text;
}

} // namespace

std::string downloadTarget(const std::string &identifier) {
  return std::string(constants::http::DOWNLOAD_ROUTE) +
         percentEncode(identifier);
}

ResumableFetcher::ResumableFetcher(std::shared_ptr<HttpTransport> transport,
                                   FetcherConfig config)
    : transport_(std::move(transport)), config_(std::move(config)),
      download_root_(config_.download_dir) {
  if (config_.chunk_size == 0) {
    throw std::invalid_argument("chunk size must be greater than zero");
  }
}

uint64_t ResumableFetcher::probeRemoteSize(const std::string &identifier,
                                           std::stop_token stop) {
  HttpRequest request{"HEAD", downloadTarget(identifier), {}};
  auto response = transport_->send(request, stop);

  const auto &head = response->head();
  if (head.status != status::OK) {
    throw UpstreamError(head.status, response->readAll(stop));
  }

  std::optional<uint64_t> size;
  try {
    size = contentLength(head.headers);
  } catch (const HttpParseError &e) {
    throw ProtocolViolationError(e.what());
  }
  if (!size) {
    throw ProtocolViolationError("size probe answered without Content-Length");
  }
  return *size;
}

FetchResult ResumableFetcher::fetch(const std::string &identifier,
                                    std::stop_token stop) {
  auto path = download_root_.resolve(identifier);
  LocalFile file(path);
  uint64_t local_size = file.size();

  uint64_t total_size = probeRemoteSize(identifier, stop);

  if (local_size >= total_size) {
    if (local_size > total_size) {
      Logger::log(LogLevel::WARN,
                  path.string() + " is larger than the remote file (" +
                      std::to_string(local_size) + " > " +
                      std::to_string(total_size) + " bytes)");
    }
    Logger::log(LogLevel::INFO, identifier + " already downloaded");
    return FetchResult{FetchOutcome::AlreadyComplete, local_size, total_size,
                       0};
  }

  Logger::log(LogLevel::INFO,
              "Fetching " + identifier + " from offset " +
                  std::to_string(local_size) + " of " +
                  std::to_string(total_size) + " bytes");

  file.seek(local_size);

  auto start_time = std::chrono::steady_clock::now();
  BufferedFileWriter writer(file, config_.write_buffer_size);
  size_t chunks = 0;

  try {
    for (uint64_t cursor = local_size; cursor < total_size;) {
      if (stop.stop_requested()) {
        throw CancelledError();
      }
      ByteRange window = nextWindow(cursor, config_.chunk_size, total_size);
      fetchChunk_(identifier, window, total_size, writer, stop);
      ++chunks;
      cursor = window.end + 1;

      if (progress_callback_) {
        std::chrono::duration<double> elapsed =
            std::chrono::steady_clock::now() - start_time;
        double speed = elapsed.count() > 0
                           ? static_cast<double>(cursor - local_size) /
                                 elapsed.count() /
                                 constants::resumable_fetcher::MIB
                           : 0.0;
        progress_callback_(FetchProgress{identifier, total_size, cursor,
                                         speed, cursor >= total_size});
      }
    }
  } catch (...) {
    try {
      writer.flush();
    } catch (const std::exception &flush_error) {
      Logger::log(LogLevel::ERROR,
                  std::string("Failed to flush partial download: ") +
                      flush_error.what());
    }
    throw;
  }
  writer.flush();

  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start_time;
  Logger::log(LogLevel::INFO,
              "Took " + formatSeconds(elapsed.count()) + "s to download " +
                  std::to_string(total_size /
                                 constants::resumable_fetcher::MIB) +
                  "MB (" + std::to_string(chunks) + " chunks)");

  return FetchResult{FetchOutcome::Completed, local_size, total_size, chunks};
}

void ResumableFetcher::fetchChunk_(const std::string &identifier,
                                   const ByteRange &window,
                                   uint64_t total_size,
                                   BufferedFileWriter &writer,
                                   std::stop_token stop) {
  HttpRequest request{"GET", downloadTarget(identifier), {}};
  request.headers[header::RANGE] = formatRangeHeader(window);
  if (config_.accept_compression) {
    request.headers[header::ACCEPT_ENCODING] = "gzip";
  }

  auto response = transport_->send(request, stop);
  const auto &head = response->head();

  if (head.status >= status::BAD_REQUEST) {
    throw UpstreamError(head.status, response->readAll(stop));
  }
  if (head.status != status::PARTIAL_CONTENT) {
    throw ProtocolViolationError("expected 206 for " +
                                 formatRangeHeader(window) + ", got " +
                                 std::to_string(head.status));
  }

  auto content_range = headerValue(head.headers, header::CONTENT_RANGE);
  ContentRange expected{window, total_size};
  if (!content_range || parseContentRange(*content_range) != expected) {
    throw ProtocolViolationError("Content-Range '" +
                                 content_range.value_or("") +
                                 "' does not match requested '" +
                                 formatContentRange(expected) + "'");
  }

  auto encoding = headerValue(head.headers, header::CONTENT_ENCODING);
  bool compressed = encoding && *encoding == "gzip";
  if (encoding && !compressed && *encoding != "identity") {
    throw ProtocolViolationError("unsupported Content-Encoding '" + *encoding +
                                 "'");
  }
  if (compressed && !config_.accept_compression) {
    throw ProtocolViolationError("gzip body sent without being accepted");
  }

  if (!compressed) {
    std::optional<uint64_t> declared;
    try {
      declared = contentLength(head.headers);
    } catch (const HttpParseError &e) {
      throw ProtocolViolationError(e.what());
    }
    if (declared != window.length()) {
      throw ProtocolViolationError(
          "raw chunk declares " +
          (declared ? std::to_string(*declared) : std::string("no")) +
          " bytes for a " + std::to_string(window.length()) + " byte range");
    }
  }

  uint64_t delivered = 0;
  ByteSink file_sink = [&](const char *data, size_t length) {
    if (delivered + length > window.length()) {
      throw ProtocolViolationError("received more than the " +
                                   std::to_string(window.length()) +
                                   " bytes requested");
    }
    writer.write(data, length);
    delivered += length;
  };

  if (compressed) {
    GzipInflater inflater(file_sink);
    response->readBody(
        [&inflater](const char *data, size_t length) {
          inflater.write(data, length);
        },
        stop);
    inflater.finish();
  } else {
    response->readBody(file_sink, stop);
  }

  if (delivered != window.length()) {
    throw ProtocolViolationError("received " + std::to_string(delivered) +
                                 " of " + std::to_string(window.length()) +
                                 " bytes requested");
  }

  Logger::log(LogLevel::INFO, "Downloaded " + *content_range +
                                  (compressed ? " (gzip)" : ""));
}

FetchResult ResumableFetcher::fetchWithRetries(const std::string &identifier,
                                               std::stop_token stop) {
  int attempts = std::max(config_.max_attempts, 1);
  for (int attempt = 1;; ++attempt) {
    try {
      return fetch(identifier, stop);
    } catch (const IoError &e) {
      if (attempt >= attempts || stop.stop_requested()) {
        throw;
      }
      Logger::log(LogLevel::WARN, "Attempt " + std::to_string(attempt) + "/" +
                                      std::to_string(attempts) + " for " +
                                      identifier + " failed: " + e.what() +
                                      "; retrying from the local file size");
    }
  }
}

} // namespace rangexfer
