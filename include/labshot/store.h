#pragma once

#include <optional>
#include <string>
#include <vector>

#include "labshot/task.h"

namespace labshot {

struct TaskKey {
    std::string batch_id;
    std::string task_id;
};

// Durable Batch/Task/Artifact records. Implementations throw StoreError
// when persistence is unavailable.
class TaskStore {
public:
    virtual ~TaskStore() = default;

    // Batch plus its tasks, all or nothing
    virtual void create_batch(const BatchRecord& batch, const std::vector<TaskRecord>& tasks) = 0;

    virtual std::optional<BatchRecord> get_batch(const std::string& batch_id) = 0;
    virtual std::vector<BatchRecord> list_batches(const std::string& owner_ref) = 0;

    // In submission order
    virtual std::vector<TaskRecord> get_tasks(const std::string& batch_id) = 0;
    virtual std::optional<TaskRecord> get_task(const std::string& batch_id,
                                               const std::string& task_id) = 0;

    // Compare-and-set on status. Returns false when the task is not in
    // `from`. Throws std::logic_error for a transition the state machine
    // forbids. `result`, when given, replaces the stored result.
    virtual bool transition(const std::string& batch_id, const std::string& task_id,
                            TaskStatus from, TaskStatus to,
                            const TaskResult* result = nullptr) = 0;

    virtual bool mark_cancelled(const std::string& batch_id) = 0;

    // Oldest batch first, submission order within a batch
    virtual std::vector<TaskKey> find_tasks(TaskStatus status) = 0;
};

} // namespace labshot
