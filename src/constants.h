#pragma once

#include <cstddef>  // for size_t

namespace sniprun {

// Payload limits
constexpr size_t DEFAULT_MAX_SOURCE_BYTES = 64 * 1024;           // 64KB of source per snippet
constexpr size_t DEFAULT_MAX_STDIN_BYTES = 64 * 1024;            // 64KB of stdin per snippet
constexpr size_t MAX_REQUEST_SIZE = 1024 * 1024;                 // 1MB max HTTP request
constexpr size_t DEFAULT_OUTPUT_LIMIT_BYTES = 64 * 1024;         // stdout+stderr cap

// Runtime defaults
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 128 * 1024 * 1024; // 128MB
constexpr double DEFAULT_CPU_LIMIT = 1.0;                        // One core
constexpr int DEFAULT_WALL_CLOCK_MS = 5000;                      // 5 seconds
constexpr size_t DEFAULT_MAX_FILE_SIZE_BYTES = 8 * 1024 * 1024;  // 8MB per written file
constexpr size_t TMPFS_SIZE_LIMIT = 16 * 1024 * 1024;            // 16MB private /tmp
constexpr int KILL_GRACE_MS = 1000;                              // Drain time after SIGKILL

// Process limits
constexpr int MAX_PROCESSES_PER_SNIPPET = 16;                    // Max threads/processes
constexpr int MAX_OPEN_FILES = 64;                               // Max file descriptors

// Pool and queue
constexpr size_t DEFAULT_MAX_WORKERS = 8;                        // Concurrent sandboxes
constexpr size_t DEFAULT_WARM_POOL = 1;                          // Ready workers per runtime
constexpr int MAX_WARMUP_FAILURES = 3;                           // Consecutive failures before a runtime is disabled
constexpr size_t DEFAULT_MAX_QUEUE_DEPTH = 64;                   // Pending requests
constexpr int DEFAULT_MAX_QUEUE_WAIT_MS = 20 * 1000;             // Max time spent queued
constexpr int DEFAULT_MAX_END_TO_END_MS = 30 * 1000;             // Queue + execution deadline
constexpr int DEFAULT_DELIVERY_WAIT_MS = 60 * 1000;              // Keep results for pollers

// Rate limiting
constexpr double DEFAULT_BUCKET_CAPACITY = 10.0;                 // Burst of submissions
constexpr double DEFAULT_REFILL_PER_SECOND = 0.5;                // One token every 2 seconds
constexpr int MAX_CONCURRENT_PER_SESSION = 2;                    // Per session limit
constexpr int ABUSE_THRESHOLD = 5;                               // Limit hits before ban
constexpr int ABUSE_WINDOW_SECONDS = 10 * 60;
constexpr int BAN_DURATION_SECONDS = 15 * 60;
constexpr int SESSION_CLEANUP_MINUTES = 60;                      // Forget idle sessions

// Buffer sizes
constexpr size_t PIPE_BUFFER_SIZE = 4096;                        // Read buffer size
constexpr size_t INITIAL_HTTP_BUFFER = 8192;                     // Initial HTTP buffer
constexpr size_t CHILD_STACK_SIZE = 256 * 1024;                  // clone() stack

// Network
constexpr int DEFAULT_PORT = 8443;                               // Default server port
constexpr int LISTEN_BACKLOG = 128;                              // Socket listen backlog
constexpr size_t MAX_CONNECTIONS = 512;                          // Concurrent HTTP clients
constexpr int CLIENT_IO_TIMEOUT_SECONDS = 10;                    // Per read or write on a client socket

// Filesystem
constexpr const char* DEFAULT_WORK_ROOT = "/tmp/sniprun";
constexpr const char* DEFAULT_CGROUP_ROOT = "/sys/fs/cgroup/sniprun";

} // namespace sniprun
