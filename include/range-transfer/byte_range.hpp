#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rangexfer {

/**
 * @brief Inclusive span [start, end] of absolute file offsets
 */
struct ByteRange {
  uint64_t start;
  uint64_t end;

  uint64_t length() const { return end - start + 1; }
  bool operator==(const ByteRange &) const = default;
};

/**
 * @brief Framing of a partial response: the served range and total size
 */
struct ContentRange {
  ByteRange range;
  uint64_t total;

  bool operator==(const ContentRange &) const = default;
};

/**
 * @brief Parses a single explicit "bytes=<start>-<end>" range
 *
 * Open-ended, suffix and multi-range forms are not part of the protocol and
 * are rejected like any other malformed value.
 *
 * @throws InvalidRangeError on malformed syntax or numeric overflow
 */
ByteRange parseRangeHeader(std::string_view value);

/**
 * @brief Enforces 0 <= start <= end < total
 * @throws RangeNotSatisfiableError otherwise (always for total == 0)
 */
void validateRange(const ByteRange &range, uint64_t total);

std::string formatRangeHeader(const ByteRange &range);
std::string formatContentRange(const ContentRange &content_range);
std::optional<ContentRange> parseContentRange(std::string_view value);

/**
 * @brief Window the fetcher requests next: [cursor, min(cursor + chunk, total) - 1]
 *
 * Requires cursor < total and chunk_size > 0.
 */
ByteRange nextWindow(uint64_t cursor, uint64_t chunk_size, uint64_t total);

} // namespace rangexfer
