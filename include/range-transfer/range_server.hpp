#pragma once

#include "byte_range.hpp"
#include "errors.hpp"
#include "request_handler.hpp"
#include "transfer_target.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace rangexfer {

/**
 * @brief Serves byte-range slices of files under a fixed root
 *
 * Answers two requests on /download/{fileName}:
 *  - HEAD: the file's total size in Content-Length, no content read.
 *  - GET with an explicit "Range: bytes=<start>-<end>": exactly that slice as
 *    206 Partial Content, gzip-compressed when the client accepts gzip, the
 *    content is text-like and the slice is large enough.
 *
 * The handler keeps no state between requests. Every request opens its own
 * file handle, so concurrent requests for the same file are independent.
 */
class RangeServer : public RequestHandler {
public:
  explicit RangeServer(const std::filesystem::path &root);

  ~RangeServer() override = default;

  RangeServer(const RangeServer &) = delete;
  RangeServer &operator=(const RangeServer &) = delete;

  void handle(const HttpRequest &request, ResponseWriter &response) override;

  /**
   * @brief Size probe: total size of a target, from metadata only
   * @throws InvalidIdentifierError, NotFoundError or IoError
   */
  uint64_t probeSize(const std::string &identifier) const;

  /**
   * @brief Range fetch: validates the request and streams the slice
   *
   * Validation failures are thrown before anything is written. Failures after
   * the head was written are rethrown as-is.
   *
   * @param identifier Transfer target name
   * @param range_header Raw Range header value, std::nullopt if absent
   * @param accepts_gzip Client declared gzip support
   * @param response Destination of the framed response
   */
  void serveRange(const std::string &identifier,
                  const std::optional<std::string> &range_header,
                  bool accepts_gzip, ResponseWriter &response) const;

  const std::filesystem::path &root() const { return root_.path(); }

private:
  struct OpenTarget {
    std::filesystem::path path;
    std::ifstream file;
    uint64_t size;
  };

  OpenTarget open_(const std::string &identifier) const;
  void streamRaw_(std::ifstream &file, const ByteRange &range,
                  ResponseWriter &response) const;
  void streamCompressed_(std::ifstream &file, const ByteRange &range,
                         ResponseWriter &response) const;

  TransferRoot root_;
};

/**
 * @brief HTTP status reported for a failure detected before commit
 */
int statusForError(const TransferError &error);

} // namespace rangexfer
