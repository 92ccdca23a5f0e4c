#pragma once

#include <iterator>
#include <string>
#include <vector>

#include "labshot/constants.h"
#include "labshot/executor.h"
#include "labshot/text_generator.h"

namespace labshot {

struct Config {
    Config();

    // Scheduling
    size_t workers = DEFAULT_WORKERS;

    // Sandbox
    int timeout_seconds = DEFAULT_TIMEOUT_SECONDS;
    size_t memory_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    long cpu_quota_us = DEFAULT_CPU_QUOTA_US;
    long cpu_period_us = DEFAULT_CPU_PERIOD_US;
    int max_processes = MAX_PROCESSES_PER_TASK;
    int max_open_files = MAX_OPEN_FILES;
    size_t max_capture_bytes = MAX_CAPTURE_BYTES;
    std::string work_dir = "/tmp/labshot";
    std::string cgroup_root = "/sys/fs/cgroup/labshot";
    bool require_seccomp = true;
    bool require_isolation = true;

    // Text generation
    int text_timeout_seconds = DEFAULT_TEXT_TIMEOUT_SECONDS;
    int text_retries = DEFAULT_TEXT_RETRIES;
    int text_backoff_ms = DEFAULT_TEXT_BACKOFF_MS;

    // Storage
    std::string database_path = "labshot.db";
    std::string artifact_dir = "artifacts";

    // Rendering
    std::string font_path;  // Empty searches well-known locations
    int font_size = DEFAULT_FONT_SIZE;

    // Validation
    size_t max_source_length = MAX_SOURCE_LENGTH;

    std::vector<std::string> default_routes{std::begin(DEFAULT_ROUTES), std::end(DEFAULT_ROUTES)};

    ExecutionLimits execution_limits() const;
    TextCallPolicy text_policy() const;

    // Throws ConfigError for out-of-range values
    void check() const;

    // Overlays keys present in a JSON object; unknown keys are ignored.
    // Throws ConfigError on unreadable files or wrong-typed values.
    static Config load_file(const std::string& path, Config base = {});
    static Config from_json_text(const std::string& text, Config base = {});
};

inline Config::Config() = default;

} // namespace labshot
