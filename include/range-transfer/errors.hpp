#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace rangexfer {

enum class ErrorKind {
  InvalidIdentifier,
  NotFound,
  IoError,
  RangeRequired,
  InvalidRange,
  RangeNotSatisfiable,
  UpstreamError,
  ProtocolViolation,
  Cancelled
};

const char *errorKindName(ErrorKind kind);

/**
 * @brief Base class for every failure of the range-transfer protocol
 *
 * Carries an ErrorKind so callers that map failures onto HTTP statuses or
 * retry decisions do not have to switch on the dynamic type.
 */
class TransferError : public std::runtime_error {
public:
  TransferError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class InvalidIdentifierError : public TransferError {
public:
  explicit InvalidIdentifierError(const std::string &identifier)
      : TransferError(ErrorKind::InvalidIdentifier,
                      "Invalid transfer identifier: '" + identifier + "'") {}
};

class NotFoundError : public TransferError {
public:
  explicit NotFoundError(const std::string &message)
      : TransferError(ErrorKind::NotFound, message) {}
};

class IoError : public TransferError {
public:
  explicit IoError(const std::string &message)
      : TransferError(ErrorKind::IoError, message) {}
};

class RangeRequiredError : public TransferError {
public:
  RangeRequiredError()
      : TransferError(ErrorKind::RangeRequired, "Range header required") {}
};

class InvalidRangeError : public TransferError {
public:
  explicit InvalidRangeError(const std::string &value)
      : TransferError(ErrorKind::InvalidRange,
                      "Invalid range format: '" + value + "'") {}
};

class RangeNotSatisfiableError : public TransferError {
public:
  explicit RangeNotSatisfiableError(const std::string &message)
      : TransferError(ErrorKind::RangeNotSatisfiable, message) {}
};

/**
 * @brief Non-success answer from the remote side
 *
 * Status and body are kept verbatim so they can be relayed unchanged.
 */
class UpstreamError : public TransferError {
public:
  UpstreamError(int status, std::string body)
      : TransferError(ErrorKind::UpstreamError,
                      "Upstream responded " + std::to_string(status) +
                          (body.empty() ? std::string() : ": " + body)),
        status_(status), body_(std::move(body)) {}

  int status() const noexcept { return status_; }
  const std::string &body() const noexcept { return body_; }

private:
  int status_;
  std::string body_;
};

class ProtocolViolationError : public TransferError {
public:
  explicit ProtocolViolationError(const std::string &message)
      : TransferError(ErrorKind::ProtocolViolation,
                      "Protocol violation: " + message) {}
};

class CancelledError : public TransferError {
public:
  CancelledError() : TransferError(ErrorKind::Cancelled, "Transfer cancelled") {}
};

} // namespace rangexfer
