#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "labshot/store.h"

struct sqlite3;
struct sqlite3_stmt;

namespace labshot {

// SQLite-backed store. One connection guarded by a mutex; ":memory:"
// gives a private in-memory database.
class SqliteTaskStore : public TaskStore {
public:
    explicit SqliteTaskStore(const std::string& path);
    ~SqliteTaskStore() override;

    SqliteTaskStore(const SqliteTaskStore&) = delete;
    SqliteTaskStore& operator=(const SqliteTaskStore&) = delete;

    void create_batch(const BatchRecord& batch, const std::vector<TaskRecord>& tasks) override;
    std::optional<BatchRecord> get_batch(const std::string& batch_id) override;
    std::vector<BatchRecord> list_batches(const std::string& owner_ref) override;
    std::vector<TaskRecord> get_tasks(const std::string& batch_id) override;
    std::optional<TaskRecord> get_task(const std::string& batch_id,
                                       const std::string& task_id) override;
    bool transition(const std::string& batch_id, const std::string& task_id,
                    TaskStatus from, TaskStatus to, const TaskResult* result = nullptr) override;
    bool mark_cancelled(const std::string& batch_id) override;
    std::vector<TaskKey> find_tasks(TaskStatus status) override;

    const std::string& path() const { return path_; }

private:
    struct DbDeleter {
        void operator()(sqlite3* db) const;
    };

    class Statement;

    void execute(const char* sql);
    void create_tables();
    int64_t next_timestamp();
    std::vector<TaskRecord> query_tasks(const std::string& batch_id, const std::string* task_id);
    void load_artifacts(TaskRecord& task);

    std::string path_;
    std::unique_ptr<sqlite3, DbDeleter> db_;
    std::mutex mutex_;
    int64_t last_timestamp_ = 0;
};

} // namespace labshot
