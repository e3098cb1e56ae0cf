#pragma once

#include <filesystem>
#include <string>

namespace rangexfer {

/**
 * @brief Checks whether a transfer identifier is safe to map onto a file
 *
 * An identifier is rejected when it is empty, longer than
 * constants::transfer_target::MAX_IDENTIFIER_LENGTH, absolute, contains a NUL
 * byte or contains a parent-directory sequence ("..") anywhere.
 */
bool isValidIdentifier(const std::string &identifier);

/**
 * @brief Throws InvalidIdentifierError unless isValidIdentifier() holds
 */
void validateIdentifier(const std::string &identifier);

/**
 * @brief Directory that transfer identifiers are resolved against
 *
 * Used by the server for the served tree and by the fetcher for the download
 * directory. Resolution never touches the file system.
 */
class TransferRoot {
public:
  explicit TransferRoot(const std::filesystem::path &root);

  /**
   * @brief Maps an identifier to an absolute path under the root
   * @throws InvalidIdentifierError if the identifier is not valid
   */
  std::filesystem::path resolve(const std::string &identifier) const;

  const std::filesystem::path &path() const { return root_; }

private:
  std::filesystem::path root_;
};

} // namespace rangexfer
