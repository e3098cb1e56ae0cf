#include <range-transfer/compression.hpp>
#include <range-transfer/constants.hpp>
#include <range-transfer/content_type.hpp>
#include <range-transfer/errors.hpp>
#include <range-transfer/logger.hpp>
#include <range-transfer/range_server.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <vector>

namespace rangexfer {

namespace {

std::string errorBody(const TransferError &error) {
  switch (error.kind()) {
  case ErrorKind::InvalidIdentifier:
    return statusReason(status::BAD_REQUEST);
  case ErrorKind::RangeRequired:
    return "Range header required";
  case ErrorKind::InvalidRange:
    return "Invalid range format";
  case ErrorKind::RangeNotSatisfiable:
    return "Invalid range";
  default:
    return error.what();
  }
}

void addRangeFraming(HttpResponseHead &head, const ByteRange &range,
                     uint64_t total, const std::string &content_type) {
  head.status = status::PARTIAL_CONTENT;
  head.headers[header::CONTENT_TYPE] = content_type;
  head.headers[header::ACCEPT_RANGES] = "bytes";
  head.headers[header::CONTENT_RANGE] =
      formatContentRange(ContentRange{range, total});
}

} // namespace

int statusForError(const TransferError &error) {
  switch (error.kind()) {
  case ErrorKind::InvalidIdentifier:
  case ErrorKind::RangeRequired:
  case ErrorKind::InvalidRange:
    return status::BAD_REQUEST;
  case ErrorKind::RangeNotSatisfiable:
    return status::RANGE_NOT_SATISFIABLE;
  default:
    return status::INTERNAL_SERVER_ERROR;
  }
}

RangeServer::RangeServer(const std::filesystem::path &root) : root_(root) {}

void RangeServer::handle(const HttpRequest &request,
                         ResponseWriter &response) {
  const bool head_only = request.method == "HEAD";

  std::optional<std::string> identifier;
  try {
    identifier = downloadRouteIdentifier(request.target);
  } catch (const HttpParseError &) {
    writeTextResponse(response, status::BAD_REQUEST,
                      statusReason(status::BAD_REQUEST), head_only);
    return;
  }
  if (!identifier) {
    writeTextResponse(response, status::NOT_FOUND, "404 page not found",
                      head_only);
    return;
  }
  if (request.method != "GET" && !head_only) {
    HttpResponseHead head;
    head.status = status::METHOD_NOT_ALLOWED;
    head.headers[header::ALLOW] = "GET, HEAD";
    head.headers[header::CONTENT_LENGTH] = "0";
    response.writeHead(head);
    return;
  }

  try {
    if (head_only) {
      uint64_t size = probeSize(*identifier);
      HttpResponseHead head;
      head.status = status::OK;
      head.headers[header::CONTENT_LENGTH] = std::to_string(size);
      head.headers[header::ACCEPT_RANGES] = "bytes";
      response.writeHead(head);
      return;
    }

    serveRange(*identifier, headerValue(request.headers, header::RANGE),
               acceptsGzip(headerValue(request.headers, header::ACCEPT_ENCODING)
                               .value_or("")),
               response);
  } catch (const TransferError &e) {
    if (response.committed()) {
      Logger::log(LogLevel::ERROR, "Aborting stream of '" + *identifier +
                                       "': " + e.what());
      throw;
    }
    Logger::log(LogLevel::WARN, request.method + " " + request.target +
                                    " rejected (" + errorKindName(e.kind()) +
                                    "): " + e.what());
    writeTextResponse(response, statusForError(e), errorBody(e), head_only);
  }
}

RangeServer::OpenTarget
RangeServer::open_(const std::string &identifier) const {
  OpenTarget target{root_.resolve(identifier), {}, 0};

  errno = 0;
  target.file.open(target.path, std::ios::binary);
  if (!target.file) {
    int err = errno;
    std::string message = "open " + target.path.string() + ": " +
                          (err != 0 ? std::strerror(err) : "open failed");
    if (err == ENOENT || err == ENOTDIR) {
      throw NotFoundError(message);
    }
    throw IoError(message);
  }

  std::error_code ec;
  auto file_status = std::filesystem::status(target.path, ec);
  if (ec) {
    throw IoError("stat " + target.path.string() + ": " + ec.message());
  }
  if (!std::filesystem::is_regular_file(file_status)) {
    throw IoError("read " + target.path.string() + ": is not a regular file");
  }
  target.size = std::filesystem::file_size(target.path, ec);
  if (ec) {
    throw IoError("stat " + target.path.string() + ": " + ec.message());
  }
  return target;
}

uint64_t RangeServer::probeSize(const std::string &identifier) const {
  return open_(identifier).size;
}

void RangeServer::serveRange(const std::string &identifier,
                             const std::optional<std::string> &range_header,
                             bool accepts_gzip,
                             ResponseWriter &response) const {
  auto target = open_(identifier);

  if (!range_header) {
    throw RangeRequiredError();
  }
  ByteRange range = parseRangeHeader(*range_header);
  validateRange(range, target.size);

  std::string content_type =
      classifyContentType(target.path.filename().string(), target.file);
  bool compress = shouldCompress(accepts_gzip, content_type, range.length());

  target.file.seekg(static_cast<std::streamoff>(range.start));
  if (!target.file) {
    throw IoError("seek " + target.path.string() + " to " +
                  std::to_string(range.start) + " failed");
  }

  Logger::log(LogLevel::INFO,
              "Serving " + identifier + " " +
                  formatContentRange(ContentRange{range, target.size}) + " (" +
                  content_type + ", " + (compress ? "gzip" : "raw") + ")");

  HttpResponseHead head;
  addRangeFraming(head, range, target.size, content_type);
  if (compress) {
    head.headers[header::CONTENT_ENCODING] = "gzip";
    response.writeHead(head);
    streamCompressed_(target.file, range, response);
  } else {
    head.headers[header::CONTENT_LENGTH] = std::to_string(range.length());
    response.writeHead(head);
    streamRaw_(target.file, range, response);
  }
}

void RangeServer::streamRaw_(std::ifstream &file, const ByteRange &range,
                             ResponseWriter &response) const {
  std::vector<char> buffer(constants::range_server::TRANSFER_BUFFER_SIZE);
  uint64_t remaining = range.length();

  while (remaining > 0) {
    auto want = static_cast<std::streamsize>(
        std::min<uint64_t>(remaining, buffer.size()));
    file.read(buffer.data(), want);
    auto got = file.gcount();
    if (got <= 0) {
      throw IoError("read failed with " + std::to_string(remaining) +
                    " bytes of the range left");
    }
    response.writeBody(buffer.data(), static_cast<size_t>(got));
    remaining -= static_cast<uint64_t>(got);
  }
}

void RangeServer::streamCompressed_(std::ifstream &file,
                                    const ByteRange &range,
                                    ResponseWriter &response) const {
  GzipDeflater deflater([&response](const char *data, size_t length) {
    response.writeBody(data, length);
  });

  std::vector<char> buffer(constants::range_server::TRANSFER_BUFFER_SIZE);
  uint64_t remaining = range.length();

  while (remaining > 0) {
    auto want = static_cast<std::streamsize>(
        std::min<uint64_t>(remaining, buffer.size()));
    file.read(buffer.data(), want);
    auto got = file.gcount();
    if (got <= 0) {
      throw IoError("read failed with " + std::to_string(remaining) +
                    " bytes of the range left");
    }
    deflater.write(buffer.data(), static_cast<size_t>(got));
    remaining -= static_cast<uint64_t>(got);
  }
  deflater.finish();

  Logger::log(LogLevel::DEBUG, "Compressed " + std::to_string(deflater.bytesIn()) +
                                   " -> " + std::to_string(deflater.bytesOut()) +
                                   " bytes");
}

} // namespace rangexfer
