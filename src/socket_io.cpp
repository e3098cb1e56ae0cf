#include <range-transfer/errors.hpp>
#include <range-transfer/socket_io.hpp>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/time.h>

namespace rangexfer {

void setSocketTimeouts(int sock, uint32_t timeout_ms) {
  struct timeval timeout;
  timeout.tv_sec = timeout_ms / 1000;
  timeout.tv_usec = (timeout_ms % 1000) * 1000;

  if (setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) <
      0) {
    throw std::runtime_error("Error setting receive timeout: " +
                             std::string(strerror(errno)));
  }
  if (setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) <
      0) {
    throw std::runtime_error("Error setting send timeout: " +
                             std::string(strerror(errno)));
  }
}

void sendAll(int sock, const char *data, size_t length) {
  size_t bytes_sent = 0;
  while (bytes_sent < length) {
    ssize_t sent =
        send(sock, data + bytes_sent, length - bytes_sent, MSG_NOSIGNAL);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      throw IoError("Failed to send data: " + std::string(strerror(errno)));
    }
    bytes_sent += static_cast<size_t>(sent);
  }
}

size_t receiveSome(int sock, char *buffer, size_t capacity) {
  while (true) {
    ssize_t received = recv(sock, buffer, capacity, 0);
    if (received >= 0) {
      return static_cast<size_t>(received);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      throw IoError("Timed out waiting for data");
    }
    throw IoError("Failed to receive data: " + std::string(strerror(errno)));
  }
}

} // namespace rangexfer
