#include <range-transfer/compression.hpp>
#include <range-transfer/content_type.hpp>
#include <range-transfer/errors.hpp>

#include <algorithm>
#include <cctype>
#include <limits>
#include <string>

namespace rangexfer {

namespace {

constexpr int GZIP_WINDOW_BITS = 15 + 16;
constexpr int MEMORY_LEVEL = 8;

std::string_view trim(std::string_view value) {
  auto first = value.find_first_not_of(" \t");
  if (first == std::string_view::npos) {
    return {};
  }
  auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
           return std::tolower(static_cast<unsigned char>(x)) ==
                  std::tolower(static_cast<unsigned char>(y));
         });
}

bool hasZeroQuality(std::string_view params) {
  while (!params.empty()) {
    auto semicolon = params.find(';');
    auto param = trim(params.substr(0, semicolon));
    if (param.size() > 2 && (param[0] == 'q' || param[0] == 'Q') &&
        param[1] == '=') {
      auto value = param.substr(2);
      return value.find_first_not_of("0.") == std::string_view::npos;
    }
    if (semicolon == std::string_view::npos) {
      break;
    }
    params.remove_prefix(semicolon + 1);
  }
  return false;
}

std::string zlibMessage(const z_stream &stream, int code) {
  if (stream.msg != nullptr) {
    return stream.msg;
  }
  return "zlib error " + std::to_string(code);
}

} // namespace

bool acceptsGzip(std::string_view accept_encoding) {
  while (!accept_encoding.empty()) {
    auto comma = accept_encoding.find(',');
    auto coding = accept_encoding.substr(0, comma);
    auto semicolon = coding.find(';');
    auto name = trim(coding.substr(0, semicolon));
    if (equalsIgnoreCase(name, "gzip") || equalsIgnoreCase(name, "x-gzip")) {
      return semicolon == std::string_view::npos ||
             !hasZeroQuality(coding.substr(semicolon + 1));
    }
    if (comma == std::string_view::npos) {
      break;
    }
    accept_encoding.remove_prefix(comma + 1);
  }
  return false;
}

bool shouldCompress(bool client_accepts_gzip, std::string_view content_type,
                    uint64_t chunk_size, uint64_t min_size) {
  return client_accepts_gzip && isCompressibleType(content_type) &&
         chunk_size >= min_size;
}

GzipDeflater::GzipDeflater(ByteSink sink, int level)
    : sink_(std::move(sink)),
      window_(constants::compression::OUTPUT_WINDOW_SIZE) {
  int code = deflateInit2(&stream_, level, Z_DEFLATED, GZIP_WINDOW_BITS,
                          MEMORY_LEVEL, Z_DEFAULT_STRATEGY);
  if (code != Z_OK) {
    throw IoError("Failed to initialize gzip compression: " +
                  zlibMessage(stream_, code));
  }
}

GzipDeflater::~GzipDeflater() { deflateEnd(&stream_); }

void GzipDeflater::write(const char *data, size_t length) {
  while (length > 0) {
    auto piece = static_cast<uInt>(
        std::min<size_t>(length, std::numeric_limits<uInt>::max()));
    stream_.next_in =
        reinterpret_cast<Bytef *>(const_cast<char *>(data));
    stream_.avail_in = piece;
    pump_(Z_NO_FLUSH);
    data += piece;
    length -= piece;
  }
}

void GzipDeflater::finish() {
  if (finished_) {
    return;
  }
  stream_.next_in = nullptr;
  stream_.avail_in = 0;
  pump_(Z_FINISH);
  finished_ = true;
}

void GzipDeflater::pump_(int flush) {
  int code;
  do {
    stream_.next_out = reinterpret_cast<Bytef *>(window_.data());
    stream_.avail_out = static_cast<uInt>(window_.size());

    code = deflate(&stream_, flush);
    if (code == Z_STREAM_ERROR) {
      throw IoError("gzip compression failed: " + zlibMessage(stream_, code));
    }

    size_t produced = window_.size() - stream_.avail_out;
    if (produced > 0) {
      sink_(window_.data(), produced);
    }
  } while (stream_.avail_out == 0 || (flush == Z_FINISH && code != Z_STREAM_END));
}

GzipInflater::GzipInflater(ByteSink sink)
    : sink_(std::move(sink)),
      window_(constants::compression::OUTPUT_WINDOW_SIZE) {
  int code = inflateInit2(&stream_, GZIP_WINDOW_BITS);
  if (code != Z_OK) {
    throw IoError("Failed to initialize gzip decompression: " +
                  zlibMessage(stream_, code));
  }
}

GzipInflater::~GzipInflater() { inflateEnd(&stream_); }

void GzipInflater::write(const char *data, size_t length) {
  while (length > 0) {
    if (ended_) {
      throw IoError("Unexpected data after end of gzip stream");
    }
    auto piece = static_cast<uInt>(
        std::min<size_t>(length, std::numeric_limits<uInt>::max()));
    stream_.next_in =
        reinterpret_cast<Bytef *>(const_cast<char *>(data));
    stream_.avail_in = piece;

    do {
      stream_.next_out = reinterpret_cast<Bytef *>(window_.data());
      stream_.avail_out = static_cast<uInt>(window_.size());

      int code = inflate(&stream_, Z_NO_FLUSH);
      if (code == Z_NEED_DICT || code == Z_DATA_ERROR ||
          code == Z_MEM_ERROR || code == Z_STREAM_ERROR) {
        throw IoError("gzip decompression failed: " +
                      zlibMessage(stream_, code));
      }

      size_t produced = window_.size() - stream_.avail_out;
      if (produced > 0) {
        sink_(window_.data(), produced);
      }
      if (code == Z_STREAM_END) {
        ended_ = true;
        break;
      }
      if (code == Z_BUF_ERROR && produced == 0) {
        break;
      }
    } while (stream_.avail_in > 0 || stream_.avail_out == 0);

    if (ended_ && stream_.avail_in > 0) {
      throw IoError("Unexpected data after end of gzip stream");
    }
    data += piece;
    length -= piece;
  }
}

void GzipInflater::finish() {
  if (!ended_) {
    throw IoError("Truncated gzip stream after " +
                  std::to_string(stream_.total_out) + " decoded bytes");
  }
}

} // namespace rangexfer
