#pragma once

#include <cstddef>  // for size_t
#include <cstdint>

namespace benefice {

// Upload limits
constexpr size_t MIB = 1024 * 1024;
constexpr size_t DEFAULT_SIZE_LIMIT_MIB = 10;                    // Default workload size
constexpr size_t STARRED_SIZE_LIMIT_MIB = 50;                    // Starred workload size
constexpr size_t CONFIG_MAX_BYTES = 256 * 1024;                  // 256KiB Enarx.toml ceiling
constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;                 // 1MB for buffered (non-upload) bodies
constexpr size_t MAX_HEADER_SIZE = 16 * 1024;                    // Request line + headers
constexpr size_t MAX_PART_HEADER_SIZE = 8 * 1024;                // Multipart part headers
constexpr size_t MAX_CONFIG_NESTING = 128;                       // Enarx.toml arrays, tables and dotted keys

// Time limits
constexpr int DEFAULT_TIMEOUT_SECONDS = 5 * 60;                  // 5 minutes
constexpr int STARRED_TIMEOUT_SECONDS = 15 * 60;                 // 15 minutes
constexpr int READ_TIMEOUT_MS = 500;                             // Output poll deadline
constexpr int SESSION_TTL_SECONDS = 24 * 60 * 60;                // Idle session expiry

// Ports
constexpr uint16_t DEFAULT_PORT_MIN = 2000;                      // Lowest listen port allowed
constexpr uint16_t DEFAULT_PORT_MAX = 30000;                     // Highest listen port allowed

// Process limits
constexpr int MAX_OPEN_FILES = 1024;                             // Max file descriptors per workload

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t OUTPUT_READ_SIZE = 4096;                        // Bytes served per output poll
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer

// Network
constexpr int DEFAULT_HTTP_PORT = 3000;                          // Default server port
constexpr int LISTEN_BACKLOG = 64;                               // Socket listen backlog
constexpr int CLIENT_READ_TIMEOUT_SECONDS = 30;                  // Idle limit while reading a request
constexpr const char* USER_HEADER = "X-Forwarded-User";          // Set by the identity-aware proxy

// Multipart field names and types
constexpr const char* WORKLOAD_FIELD = "wasm";
constexpr const char* CONFIG_FIELD = "toml";
constexpr const char* WORKLOAD_CONTENT_TYPE = "application/wasm";

} // namespace benefice
