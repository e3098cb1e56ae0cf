#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace constants {

namespace transfer_target {
static constexpr size_t MAX_IDENTIFIER_LENGTH = 256;
} // namespace transfer_target

namespace http {
static constexpr size_t MAX_HEAD_SIZE = 64 * 1024;
static constexpr size_t RECV_BUFFER_SIZE = 16 * 1024;
static constexpr const char *DOWNLOAD_ROUTE = "/download/";
} // namespace http

namespace compression {
static constexpr uint64_t MIN_COMPRESSION_SIZE = 8 * 1024;
static constexpr size_t OUTPUT_WINDOW_SIZE = 32 * 1024;
static constexpr size_t SNIFF_LENGTH = 512;
} // namespace compression

namespace range_server {
static constexpr int DEFAULT_PORT = 8000;
static constexpr const char *DEFAULT_ROOT = "files";
static constexpr size_t TRANSFER_BUFFER_SIZE = 32 * 1024;
} // namespace range_server

namespace http_server {
static constexpr int DEFAULT_MAX_CLIENTS = 64;
static constexpr std::chrono::seconds DEFAULT_GRACE_PERIOD{30};
static constexpr int ACCEPT_POLL_TIMEOUT_MS = 200;
static constexpr int PEER_POLL_INTERVAL_MS = 50;
static constexpr uint32_t CLIENT_SOCKET_TIMEOUT_MS = 60000;
} // namespace http_server

namespace resumable_fetcher {
static constexpr uint64_t DEFAULT_CHUNK_SIZE = 512 * 1024;
static constexpr size_t DEFAULT_WRITE_BUFFER_SIZE = 64 * 1024;
static constexpr uint32_t DEFAULT_SOCKET_TIMEOUT_MS = 60000;
static constexpr int DEFAULT_MAX_ATTEMPTS = 1;
static constexpr int DEFAULT_SERVICE_PORT = 8888;
static constexpr uint64_t MIB = 1'000'000;
} // namespace resumable_fetcher

} // namespace constants
