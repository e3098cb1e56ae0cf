#pragma once

#include <istream>
#include <optional>
#include <string>
#include <string_view>

namespace rangexfer {

/**
 * @brief MIME type registered for a file name's extension, parameters stripped
 * @return std::nullopt if the extension is missing or unknown
 */
std::optional<std::string> contentTypeByExtension(const std::string &file_name);

/**
 * @brief Guesses a MIME type from the leading bytes of a file
 *
 * Always returns a type; "application/octet-stream" when nothing matches.
 */
std::string sniffContentType(std::string_view data);

/**
 * @brief Classifies a served file
 *
 * Extension lookup first; when inconclusive, sniffs up to the first 512 bytes
 * of the stream and restores its read position. Falls back to
 * "application/octet-stream" for empty or unreadable content.
 */
std::string classifyContentType(const std::string &file_name,
                                std::istream &content);

/**
 * @brief Whether the content type is text-like and worth compressing
 */
bool isCompressibleType(std::string_view content_type);

} // namespace rangexfer
