#pragma once

#include <cstddef>
#include <cstdint>
#include <sys/types.h>

namespace rangexfer {

/**
 * @brief Applies SO_RCVTIMEO and SO_SNDTIMEO to a socket
 * @throws std::runtime_error if setsockopt fails
 */
void setSocketTimeouts(int sock, uint32_t timeout_ms);

/**
 * @brief Sends the whole buffer, retrying partial sends and EINTR
 * @throws IoError when the peer goes away or the send times out
 */
void sendAll(int sock, const char *data, size_t length);

/**
 * @brief One recv() call retried on EINTR
 * @return bytes received, 0 on orderly shutdown
 * @throws IoError on failure or timeout
 */
size_t receiveSome(int sock, char *buffer, size_t capacity);

} // namespace rangexfer
