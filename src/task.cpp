#include "labshot/task.h"

#include <stdexcept>

namespace labshot {

BatchStatus aggregate_status(const std::vector<TaskStatus>& statuses) {
    bool any_failed = false;
    for (TaskStatus status : statuses) {
        if (status == TaskStatus::PENDING || status == TaskStatus::RUNNING) {
            return BatchStatus::PENDING;
        }
        if (status == TaskStatus::FAILED) {
            any_failed = true;
        }
    }
    return any_failed ? BatchStatus::FAILED : BatchStatus::COMPLETED;
}

BatchStatus aggregate_status(const std::vector<TaskRecord>& tasks) {
    std::vector<TaskStatus> statuses;
    statuses.reserve(tasks.size());
    for (const auto& task : tasks) {
        statuses.push_back(task.status);
    }
    return aggregate_status(statuses);
}

bool is_legal_transition(TaskStatus from, TaskStatus to) {
    switch (from) {
        case TaskStatus::PENDING:
            return to == TaskStatus::RUNNING;
        case TaskStatus::RUNNING:
            return to == TaskStatus::COMPLETED || to == TaskStatus::FAILED;
        case TaskStatus::COMPLETED:
        case TaskStatus::FAILED:
            return false;
    }
    return false;
}

std::string to_string(TaskKind kind) {
    switch (kind) {
        case TaskKind::CODE_EXECUTION: return "code_execution";
        case TaskKind::ANSWER_REQUEST: return "answer_request";
        case TaskKind::SCREENSHOT_ONLY: return "screenshot_only";
        case TaskKind::PROJECT_MULTI_FILE: return "project_multi_file";
    }
    return "unknown";
}

std::string to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::RUNNING: return "running";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
    }
    return "unknown";
}

std::string to_string(Insertion insertion) {
    switch (insertion) {
        case Insertion::BELOW_QUESTION: return "below_question";
        case Insertion::BOTTOM_OF_PAGE: return "bottom_of_page";
    }
    return "unknown";
}

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE: return "";
        case ErrorKind::VALIDATION_REJECTED: return "ValidationRejected";
        case ErrorKind::EXECUTION_TIMED_OUT: return "ExecutionTimedOut";
        case ErrorKind::EXECUTION_CRASHED: return "ExecutionCrashed";
        case ErrorKind::RENDER_FAILURE: return "RenderFailure";
        case ErrorKind::UPSTREAM_SERVICE_FAILURE: return "UpstreamServiceFailure";
        case ErrorKind::CANCELLED: return "Cancelled";
        case ErrorKind::INTERRUPTED: return "Interrupted";
    }
    return "unknown";
}

std::string to_string(BatchStatus status) {
    switch (status) {
        case BatchStatus::PENDING: return "pending";
        case BatchStatus::COMPLETED: return "completed";
        case BatchStatus::FAILED: return "failed";
    }
    return "unknown";
}

TaskKind parse_task_kind(const std::string& name) {
    if (name == "code_execution") return TaskKind::CODE_EXECUTION;
    if (name == "answer_request") return TaskKind::ANSWER_REQUEST;
    if (name == "screenshot_only" || name == "screenshot_request") return TaskKind::SCREENSHOT_ONLY;
    if (name == "project_multi_file" || name == "react_project") return TaskKind::PROJECT_MULTI_FILE;
    throw std::invalid_argument("Unknown task kind: " + name);
}

TaskStatus parse_task_status(const std::string& name) {
    if (name == "pending") return TaskStatus::PENDING;
    if (name == "running") return TaskStatus::RUNNING;
    if (name == "completed") return TaskStatus::COMPLETED;
    if (name == "failed") return TaskStatus::FAILED;
    throw std::invalid_argument("Unknown task status: " + name);
}

Insertion parse_insertion(const std::string& name) {
    if (name == "below_question") return Insertion::BELOW_QUESTION;
    if (name == "bottom_of_page") return Insertion::BOTTOM_OF_PAGE;
    throw std::invalid_argument("Unknown insertion preference: " + name);
}

ErrorKind parse_error_kind(const std::string& name) {
    if (name.empty()) return ErrorKind::NONE;
    if (name == "ValidationRejected") return ErrorKind::VALIDATION_REJECTED;
    if (name == "ExecutionTimedOut") return ErrorKind::EXECUTION_TIMED_OUT;
    if (name == "ExecutionCrashed") return ErrorKind::EXECUTION_CRASHED;
    if (name == "RenderFailure") return ErrorKind::RENDER_FAILURE;
    if (name == "UpstreamServiceFailure") return ErrorKind::UPSTREAM_SERVICE_FAILURE;
    if (name == "Cancelled") return ErrorKind::CANCELLED;
    if (name == "Interrupted") return ErrorKind::INTERRUPTED;
    throw std::invalid_argument("Unknown error kind: " + name);
}

} // namespace labshot
