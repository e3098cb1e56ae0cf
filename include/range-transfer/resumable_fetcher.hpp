#pragma once
#include "byte_range.hpp"
#include "constants.hpp"
#include "http_client.hpp"
#include "transfer_target.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>

namespace rangexfer {

class BufferedFileWriter;

struct FetcherConfig {
  std::filesystem::path download_dir{"."};
  uint64_t chunk_size{constants::resumable_fetcher::DEFAULT_CHUNK_SIZE};
  size_t write_buffer_size{
      constants::resumable_fetcher::DEFAULT_WRITE_BUFFER_SIZE};
  bool accept_compression{true};
  int max_attempts{constants::resumable_fetcher::DEFAULT_MAX_ATTEMPTS};
};

enum class FetchOutcome { AlreadyComplete, Completed };

struct FetchResult {
  FetchOutcome outcome;
  uint64_t resumed_from;
  uint64_t total_size;
  size_t chunks_fetched;
};

/**
 * @brief Structure representing download progress information
 *
 * Reported after every chunk that reached the write buffer.
 */
struct FetchProgress {
  std::string resourceName;
  uint64_t totalSize;
  uint64_t downloadedBytes;
  double speedMBps;
  bool completed;
};

/**
 * @brief Class responsible for bringing a local file up to date with a
 * remote Range Server
 *
 * Each attempt re-measures the local file, probes the remote size and then
 * requests the missing bytes as a strictly sequential series of ranges, so an
 * interrupted attempt resumes wherever the file ends. Concurrent fetches into
 * the same local file must be serialized by the caller.
 */
class ResumableFetcher {
public:
  using ProgressCallback = std::function<void(const FetchProgress &)>;

  /**
   * @brief Constructor
   * @param transport Connection to the Range Server
   * @param config Download directory, chunk and buffer sizes
   * @throws std::invalid_argument if chunk_size is zero
   */
  explicit ResumableFetcher(std::shared_ptr<HttpTransport> transport,
                            FetcherConfig config = {});

  ~ResumableFetcher() = default;

  ResumableFetcher(const ResumableFetcher &) = delete;
  ResumableFetcher &operator=(const ResumableFetcher &) = delete;

  /**
   * @brief Runs one transfer attempt
   *
   * The write buffer is flushed before returning or throwing, so every byte
   * received up to a failure counts as resumable progress.
   *
   * @param identifier Name of the transfer target
   * @param stop Cancels the attempt between and during chunks
   * @return How the attempt ended
   * @throws InvalidIdentifierError, IoError, UpstreamError,
   * ProtocolViolationError or CancelledError
   */
  FetchResult fetch(const std::string &identifier, std::stop_token stop = {});

  /**
   * @brief Repeats fetch() after IoError up to config.max_attempts times
   *
   * Each attempt starts over from the size of the file on disk.
   */
  FetchResult fetchWithRetries(const std::string &identifier,
                               std::stop_token stop = {});

  /**
   * @brief Size probe against the remote server
   * @throws UpstreamError for any non-200 answer
   */
  uint64_t probeRemoteSize(const std::string &identifier,
                           std::stop_token stop = {});

  void setProgressCallback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
  }

  const FetcherConfig &config() const { return config_; }

private:
  void fetchChunk_(const std::string &identifier, const ByteRange &window,
                   uint64_t total_size, BufferedFileWriter &writer,
                   std::stop_token stop);

  std::shared_ptr<HttpTransport> transport_;
  const FetcherConfig config_;
  const TransferRoot download_root_;
  ProgressCallback progress_callback_;
};

/**
 * @brief Request target for a transfer identifier: "/download/<encoded name>"
 */
std::string downloadTarget(const std::string &identifier);

} // namespace rangexfer
