#include <range-transfer/constants.hpp>
#include <range-transfer/errors.hpp>
#include <range-transfer/transfer_target.hpp>

namespace rangexfer {

bool isValidIdentifier(const std::string &identifier) {
  if (identifier.empty() ||
      identifier.length() >
          constants::transfer_target::MAX_IDENTIFIER_LENGTH) {
    return false;
  }
  if (identifier.front() == '/' ||
      identifier.find('\0') != std::string::npos) {
    return false;
  }
  return identifier.find("..") == std::string::npos;
}

void validateIdentifier(const std::string &identifier) {
  if (!isValidIdentifier(identifier)) {
    throw InvalidIdentifierError(identifier);
  }
}

TransferRoot::TransferRoot(const std::filesystem::path &root)
    : root_(std::filesystem::absolute(root).lexically_normal()) {}

std::filesystem::path
TransferRoot::resolve(const std::string &identifier) const {
  validateIdentifier(identifier);
  return root_ / std::filesystem::path(identifier).relative_path();
}

} // namespace rangexfer
