#pragma once

#include "byte_sink.hpp"
#include "constants.hpp"

#include <cstdint>
#include <string_view>
#include <vector>
#include <zlib.h>

namespace rangexfer {

/**
 * @brief Whether an Accept-Encoding value lists gzip without q=0
 */
bool acceptsGzip(std::string_view accept_encoding);

/**
 * @brief Per-chunk compression decision
 *
 * Pure function of the client's capability, the content classification and
 * the chunk size. Chunks smaller than min_size are always sent raw.
 */
bool shouldCompress(bool client_accepts_gzip, std::string_view content_type,
                    uint64_t chunk_size,
                    uint64_t min_size =
                        constants::compression::MIN_COMPRESSION_SIZE);

/**
 * @brief Streaming gzip encoder
 *
 * Input is fed through write(); compressed output is handed to the sink in
 * pieces no larger than the fixed output window. finish() emits the trailer
 * and must be called exactly once.
 */
class GzipDeflater {
public:
  explicit GzipDeflater(ByteSink sink, int level = Z_BEST_SPEED);
  ~GzipDeflater();

  GzipDeflater(const GzipDeflater &) = delete;
  GzipDeflater &operator=(const GzipDeflater &) = delete;

  void write(const char *data, size_t length);
  void finish();

  uint64_t bytesIn() const { return stream_.total_in; }
  uint64_t bytesOut() const { return stream_.total_out; }

private:
  void pump_(int flush);

  z_stream stream_{};
  ByteSink sink_;
  std::vector<char> window_;
  bool finished_{false};
};

/**
 * @brief Streaming gzip decoder
 *
 * Decoded bytes go to the sink as they become available. finish() throws
 * IoError if the gzip trailer was never reached, which is how a truncated
 * body shows up.
 */
class GzipInflater {
public:
  explicit GzipInflater(ByteSink sink);
  ~GzipInflater();

  GzipInflater(const GzipInflater &) = delete;
  GzipInflater &operator=(const GzipInflater &) = delete;

  void write(const char *data, size_t length);
  void finish();

  bool streamEnded() const { return ended_; }
  uint64_t bytesOut() const { return stream_.total_out; }

private:
  z_stream stream_{};
  ByteSink sink_;
  std::vector<char> window_;
  bool ended_{false};
};

} // namespace rangexfer
