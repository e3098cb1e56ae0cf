#include <range-transfer/errors.hpp>

namespace rangexfer {

const char *errorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidIdentifier:
    return "InvalidIdentifier";
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::IoError:
    return "IOError";
  case ErrorKind::RangeRequired:
    return "RangeRequired";
  case ErrorKind::InvalidRange:
    return "InvalidRange";
  case ErrorKind::RangeNotSatisfiable:
    return "RangeNotSatisfiable";
  case ErrorKind::UpstreamError:
    return "UpstreamError";
  case ErrorKind::ProtocolViolation:
    return "ProtocolViolation";
  case ErrorKind::Cancelled:
    return "Cancelled";
  default:
    return "Unknown";
  }
}

} // namespace rangexfer
