#pragma once

#include <cstddef>  // for size_t

namespace labshot {

// Execution limits
constexpr size_t DEFAULT_MEMORY_LIMIT_BYTES = 512 * 1024 * 1024;  // 512MB
constexpr long DEFAULT_CPU_QUOTA_US = 50000;                      // Half a CPU...
constexpr long DEFAULT_CPU_PERIOD_US = 100000;                    // ...per 100ms period
constexpr int DEFAULT_TIMEOUT_SECONDS = 30;
constexpr int TIMEOUT_EXIT_CODE = 124;
constexpr int MAX_PROCESSES_PER_TASK = 64;
constexpr int MAX_OPEN_FILES = 100;
constexpr size_t MAX_FILE_WRITE_BYTES = 10 * 1024 * 1024;          // 10MB per written file
constexpr size_t MAX_CAPTURE_BYTES = 64 * 1024;                   // Per stream
constexpr size_t MAX_OUTPUT_FILE_BYTES = 64 * 1024;               // Per previewed file
constexpr size_t MAX_OUTPUT_FILES = 5;
constexpr int TEARDOWN_GRACE_MS = 2000;
constexpr size_t SANDBOX_TMPFS_BYTES = 64 * 1024 * 1024;          // Private /tmp per task
constexpr size_t CLONE_STACK_BYTES = 1024 * 1024;
constexpr unsigned DEFAULT_SANDBOX_UID_BASE = 200000;            // Host ids for tasks when run as root
constexpr unsigned SANDBOX_UID_COUNT = 4096;

// Validation
constexpr size_t MAX_SOURCE_LENGTH = 5000;

// Scheduling
constexpr size_t DEFAULT_WORKERS = 3;

// Text generation collaborator
constexpr int DEFAULT_TEXT_TIMEOUT_SECONDS = 45;
constexpr int DEFAULT_TEXT_RETRIES = 1;
constexpr int DEFAULT_TEXT_BACKOFF_MS = 500;
constexpr size_t MAX_OUTSTANDING_TEXT_CALLS = 8;        // Includes calls abandoned after a timeout

// Routes captured for a project that declares none
constexpr const char* DEFAULT_ROUTES[] = {"/", "/about", "/contact"};

// Display cropping
constexpr size_t DISPLAY_MAX_LINES = 20;
constexpr size_t DISPLAY_HEAD_LINES = 10;
constexpr size_t DISPLAY_TAIL_LINES = 5;
constexpr size_t DISPLAY_MAX_LINE_LENGTH = 120;
constexpr size_t DISPLAY_LINE_HEAD = 100;
constexpr size_t DISPLAY_LINE_TAIL = 15;
constexpr size_t MAX_CODE_LINES_RENDERED = 60;

// Rendering
constexpr int DEFAULT_FONT_SIZE = 14;
constexpr size_t PIPE_BUFFER_SIZE = 4096;

} // namespace labshot
