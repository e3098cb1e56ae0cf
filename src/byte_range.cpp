#include <range-transfer/byte_range.hpp>
#include <range-transfer/errors.hpp>

#include <algorithm>
#include <charconv>

namespace rangexfer {

namespace {

constexpr std::string_view RANGE_UNIT = "bytes=";
constexpr std::string_view CONTENT_RANGE_UNIT = "bytes ";

bool parseOffset(std::string_view text, uint64_t &value) {
  if (text.empty() ||
      !std::all_of(text.begin(), text.end(),
                   [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  return ec == std::errc() && ptr == text.data() + text.size();
}

std::optional<ByteRange> parseSpan(std::string_view text) {
  auto dash = text.find('-');
  if (dash == std::string_view::npos) {
    return std::nullopt;
  }
  ByteRange range{};
  if (!parseOffset(text.substr(0, dash), range.start) ||
      !parseOffset(text.substr(dash + 1), range.end)) {
    return std::nullopt;
  }
  return range;
}

} // namespace

ByteRange parseRangeHeader(std::string_view value) {
  if (!value.starts_with(RANGE_UNIT)) {
    throw InvalidRangeError(std::string(value));
  }
  auto range = parseSpan(value.substr(RANGE_UNIT.size()));
  if (!range) {
    throw InvalidRangeError(std::string(value));
  }
  return *range;
}

void validateRange(const ByteRange &range, uint64_t total) {
  if (range.start > range.end || range.end >= total) {
    throw RangeNotSatisfiableError(
        "Range " + std::to_string(range.start) + "-" +
        std::to_string(range.end) + " not satisfiable for size " +
        std::to_string(total));
  }
}

std::string formatRangeHeader(const ByteRange &range) {
  return std::string(RANGE_UNIT) + std::to_string(range.start) + "-" +
         std::to_string(range.end);
}

std::string formatContentRange(const ContentRange &content_range) {
  return std::string(CONTENT_RANGE_UNIT) +
         std::to_string(content_range.range.start) + "-" +
         std::to_string(content_range.range.end) + "/" +
         std::to_string(content_range.total);
}

std::optional<ContentRange> parseContentRange(std::string_view value) {
  if (!value.starts_with(CONTENT_RANGE_UNIT)) {
    return std::nullopt;
  }
  value.remove_prefix(CONTENT_RANGE_UNIT.size());

  auto slash = value.find('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }
  auto range = parseSpan(value.substr(0, slash));
  uint64_t total = 0;
  if (!range || !parseOffset(value.substr(slash + 1), total)) {
    return std::nullopt;
  }
  return ContentRange{*range, total};
}

ByteRange nextWindow(uint64_t cursor, uint64_t chunk_size, uint64_t total) {
  uint64_t end = total - 1;
  if (chunk_size <= total - cursor) {
    end = cursor + chunk_size - 1;
  }
  return ByteRange{cursor, end};
}

} // namespace rangexfer
