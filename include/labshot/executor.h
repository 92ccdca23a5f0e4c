#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "labshot/constants.h"
#include "labshot/theme.h"

namespace labshot {

struct ExecutionLimits {
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_SECONDS * 1000};
    size_t memory_bytes = DEFAULT_MEMORY_LIMIT_BYTES;
    long cpu_quota_us = DEFAULT_CPU_QUOTA_US;
    long cpu_period_us = DEFAULT_CPU_PERIOD_US;
    int max_processes = MAX_PROCESSES_PER_TASK;
    int max_open_files = MAX_OPEN_FILES;
    size_t max_file_bytes = MAX_FILE_WRITE_BYTES;
    size_t max_capture_bytes = MAX_CAPTURE_BYTES;  // Per stream
    bool network = false;                          // Always disabled by ProcessRuntime
};

// provisioning -> running -> {completed | timed_out | crashed} -> torn_down
enum class ExecutionPhase {
    PROVISIONING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    CRASHED,
    TORN_DOWN
};

enum class ExecutionStatus {
    COMPLETED,   // Exited with status 0
    TIMED_OUT,   // Killed at the wall-clock limit
    CRASHED      // Non-zero exit, signal, or environment fault
};

// A file the program left in its working directory
struct OutputFile {
    std::string name;
    std::string content;
};

// Owned by one execution, immutable once returned
struct ExecutionResult {
    ExecutionStatus status = ExecutionStatus::CRASHED;
    int exit_code = -1;
    std::string stdout_output;
    std::string stderr_output;
    bool stdout_truncated = false;
    bool stderr_truncated = false;
    std::chrono::milliseconds wall_time{0};
    std::string error_message;
    std::vector<OutputFile> output_files;

    bool timed_out() const { return status == ExecutionStatus::TIMED_OUT; }
};

std::string to_string(ExecutionStatus status);
std::string to_string(ExecutionPhase phase);

// One disposable environment. Serves exactly one run.
class Environment {
public:
    virtual ~Environment() = default;

    virtual const std::string& id() const = 0;

    // Runs the snippet to completion or timeout. Timeouts and crashes are
    // reported in the result, not thrown.
    virtual ExecutionResult run(const std::string& source, Language language,
                                const ExecutionLimits& limits) = 0;

    // Kills anything left and releases the environment. May throw; the
    // executor logs and moves on.
    virtual void teardown() = 0;
};

// Creates environments. Only the SandboxExecutor talks to a runtime.
class ExecutionRuntime {
public:
    virtual ~ExecutionRuntime() = default;

    virtual std::string name() const = 0;
    virtual std::unique_ptr<Environment> provision(const ExecutionLimits& limits) = 0;
};

// Mediates all access to the runtime and caps live environments
class SandboxExecutor {
public:
    SandboxExecutor(std::unique_ptr<ExecutionRuntime> runtime, size_t max_live_environments);
    ~SandboxExecutor();

    SandboxExecutor(const SandboxExecutor&) = delete;
    SandboxExecutor& operator=(const SandboxExecutor&) = delete;

    ExecutionResult execute(const std::string& source, Language language,
                            const ExecutionLimits& limits);

    // Counters for tests and status reporting
    size_t executions() const { return executions_.load(); }
    size_t live_environments() const;
    size_t peak_live_environments() const;
    size_t teardown_failures() const { return teardown_failures_.load(); }
    size_t max_live_environments() const { return max_live_; }

private:
    void acquire_slot();
    void release_slot();

    std::unique_ptr<ExecutionRuntime> runtime_;
    const size_t max_live_;

    mutable std::mutex slots_mutex_;
    std::condition_variable slots_cv_;
    size_t live_ = 0;
    size_t peak_live_ = 0;

    std::atomic<size_t> executions_{0};
    std::atomic<size_t> teardown_failures_{0};
};

} // namespace labshot
