#pragma once

#include <cstddef>
#include <functional>

namespace rangexfer {

/**
 * @brief Destination for a stream of bytes (socket, file, decompressor...)
 *
 * Implementations throw on failure; a sink never reports short writes.
 */
using ByteSink = std::function<void(const char *data, size_t length)>;

} // namespace rangexfer
