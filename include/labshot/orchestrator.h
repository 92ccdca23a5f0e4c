#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <iterator>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "labshot/executor.h"
#include "labshot/renderer.h"
#include "labshot/store.h"
#include "labshot/task.h"
#include "labshot/text_generator.h"
#include "labshot/validator.h"

namespace labshot {

struct Config;

// What a caller hands over; ids are caller-assigned
struct BatchSubmission {
    std::string owner_ref;
    std::string theme = "auto";
    Insertion default_insertion = Insertion::BELOW_QUESTION;
    std::string document;
    std::vector<TaskSpec> tasks;
};

struct OrchestratorOptions {
    size_t workers = DEFAULT_WORKERS;
    ExecutionLimits limits;
    size_t max_source_length = MAX_SOURCE_LENGTH;
    std::vector<std::string> default_routes{std::begin(DEFAULT_ROUTES), std::end(DEFAULT_ROUTES)};

    static OrchestratorOptions from_config(const Config& config);
};

std::optional<BatchStatusReport> load_status_report(TaskStore& store, const std::string& batch_id);

// Marks the batch cancelled and fails its pending tasks with "cancelled".
// Returns how many were skipped, or nullopt for an unknown batch.
std::optional<size_t> cancel_pending(TaskStore& store, const std::string& batch_id);

// Accepts batches, persists them, and drives each task through
// validate -> execute -> render -> describe on a fixed worker pool.
// Task failures are recorded on the task and never escape.
class JobOrchestrator {
public:
    JobOrchestrator(TaskStore& store, SandboxExecutor& executor, ArtifactRenderer& renderer,
                    TextService& text, OrchestratorOptions options = OrchestratorOptions{});
    ~JobOrchestrator();

    JobOrchestrator(const JobOrchestrator&) = delete;
    JobOrchestrator& operator=(const JobOrchestrator&) = delete;

    // Recovers interrupted work, re-enqueues pending tasks, spawns workers
    void start();

    // Finishes in-flight tasks and joins workers. Queued tasks stay
    // pending in the store.
    void stop();

    // Persists and enqueues; returns the batch id. Throws InvalidBatchError
    // for a malformed submission and StoreError when nothing could be
    // persisted.
    std::string submit_batch(const BatchSubmission& submission);

    std::optional<BatchStatusReport> get_batch_status(const std::string& batch_id);

    // Pending tasks fail with "cancelled"; running tasks finish. False for
    // an unknown batch.
    bool cancel_batch(const std::string& batch_id);

    // True once every task is terminal
    bool wait_for_batch(const std::string& batch_id, std::chrono::milliseconds timeout);

    // Processes one task on the calling thread. A terminal task is
    // returned unchanged.
    std::optional<TaskRecord> run_task(const std::string& batch_id, const std::string& task_id);

    std::vector<BatchRecord> list_batches(const std::string& owner_ref);

    size_t queued() const;
    bool running() const;

private:
    void worker_loop(size_t index);
    void enqueue(const TaskKey& key);
    void notify_progress();

    // Claims a pending task and drives it to a terminal state
    bool process(const TaskKey& key);

    TaskResult execute_task(const TaskRecord& task);
    TaskResult run_code(const TaskRecord& task);
    TaskResult run_answer(const TaskRecord& task);
    TaskResult run_screenshot(const TaskRecord& task);
    TaskResult run_project(const TaskRecord& task);

    // Renders into result.artifacts; a failure marks the result and
    // returns false
    bool render_into(TaskResult& result, const TaskRecord& task, const RenderContent& content,
                     Language language, RenderKind kind);

    void fail_task(const TaskKey& key, TaskStatus from, ErrorKind kind, const std::string& error);

    TaskStore& store_;
    SandboxExecutor& executor_;
    ArtifactRenderer& renderer_;
    TextService& text_;
    OrchestratorOptions options_;
    CodeValidator validator_;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<TaskKey> queue_;
    bool stopping_ = false;
    bool started_ = false;
    std::vector<std::thread> workers_;

    std::mutex progress_mutex_;
    std::condition_variable progress_cv_;
};

} // namespace labshot
