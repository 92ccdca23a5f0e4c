#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "labshot/theme.h"

namespace labshot {

enum class TaskKind {
    CODE_EXECUTION,
    ANSWER_REQUEST,
    SCREENSHOT_ONLY,
    PROJECT_MULTI_FILE
};

// pending -> running -> completed | failed, nothing else
enum class TaskStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

enum class Insertion {
    BELOW_QUESTION,
    BOTTOM_OF_PAGE
};

enum class ErrorKind {
    NONE,
    VALIDATION_REJECTED,
    EXECUTION_TIMED_OUT,
    EXECUTION_CRASHED,
    RENDER_FAILURE,
    UPSTREAM_SERVICE_FAILURE,
    CANCELLED,
    INTERRUPTED
};

enum class BatchStatus {
    PENDING,
    COMPLETED,
    FAILED
};

struct ProjectFile {
    std::string path;
    std::string content;
};

// Reference to a stored, write-once rendered image
struct ArtifactRef {
    std::string ref;      // Storage key, e.g. "b-1f2e/q1_0.png"
    std::string label;    // Human readable, e.g. "main.py" or "Route /about"
    std::string kind;     // code | terminal | combined | browser | file
    std::string digest;   // SHA-256 of the PNG bytes
};

// What the caller asked for
struct TaskSpec {
    std::string id;
    TaskKind kind = TaskKind::CODE_EXECUTION;
    Language language = Language::PYTHON;
    std::string source;
    std::string question;
    std::string filename;                // Optional display name for the code pane
    std::vector<ProjectFile> files;      // PROJECT_MULTI_FILE only
    std::vector<std::string> routes;     // PROJECT_MULTI_FILE only
    std::optional<Insertion> insertion;  // Falls back to the batch default
};

struct TaskResult {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code = 0;
    std::vector<ArtifactRef> artifacts;
    std::string caption;
    std::string answer;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error;
};

struct TaskRecord {
    std::string batch_id;
    int ordinal = 0;
    TaskSpec spec;
    Theme theme = Theme::IDLE;
    Insertion insertion = Insertion::BELOW_QUESTION;
    TaskStatus status = TaskStatus::PENDING;
    TaskResult result;
    int64_t updated_at = 0;

    bool terminal() const {
        return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED;
    }
};

struct BatchRecord {
    std::string id;
    std::string owner_ref;     // Opaque, interpreted upstream
    std::string theme;         // As submitted, may be "auto"
    Insertion default_insertion = Insertion::BELOW_QUESTION;
    std::string document;      // Original document the composer anchors into
    bool cancelled = false;
    int64_t created_at = 0;
};

struct BatchStatusReport {
    std::string batch_id;
    BatchStatus aggregate = BatchStatus::PENDING;
    bool cancelled = false;
    std::vector<TaskRecord> tasks;  // Every submitted task, in submission order
};

// Derived on every query, never stored
BatchStatus aggregate_status(const std::vector<TaskStatus>& statuses);
BatchStatus aggregate_status(const std::vector<TaskRecord>& tasks);

// Forward-only state machine check
bool is_legal_transition(TaskStatus from, TaskStatus to);

std::string to_string(TaskKind kind);
std::string to_string(TaskStatus status);
std::string to_string(Insertion insertion);
std::string to_string(ErrorKind kind);
std::string to_string(BatchStatus status);

// Parsers throw std::invalid_argument on unknown names
TaskKind parse_task_kind(const std::string& name);
TaskStatus parse_task_status(const std::string& name);
Insertion parse_insertion(const std::string& name);
ErrorKind parse_error_kind(const std::string& name);

} // namespace labshot
