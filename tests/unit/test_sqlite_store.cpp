#include <gtest/gtest.h>
#include "labshot/errors.h"
#include "labshot/sqlite_store.h"
#include "file_utils.h"

#include <atomic>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

namespace labshot {
namespace {

BatchRecord make_batch(const std::string& id, const std::string& owner = "upload-7") {
    BatchRecord batch;
    batch.id = id;
    batch.owner_ref = owner;
    batch.theme = "auto";
    batch.document = "1. Print 2+2\n";
    batch.created_at = 1000;
    return batch;
}

TaskRecord make_task(const std::string& batch_id, const std::string& id, int ordinal) {
    TaskRecord task;
    task.batch_id = batch_id;
    task.ordinal = ordinal;
    task.spec.id = id;
    task.spec.kind = TaskKind::CODE_EXECUTION;
    task.spec.language = Language::PYTHON;
    task.spec.source = "print(2+2)";
    task.spec.question = "Print 2+2";
    task.theme = Theme::IDLE;
    return task;
}

class SqliteStoreTest : public ::testing::Test {
protected:
    SqliteTaskStore store{":memory:"};
};

TEST_F(SqliteStoreTest, CreateAndReadBack) {
    // Given: A batch of two tasks, the second a project with files and routes
    auto project = make_task("b-1", "p1", 1);
    project.spec.kind = TaskKind::PROJECT_MULTI_FILE;
    project.spec.language = Language::REACT;
    project.spec.files = {{"src/App.jsx", "export default () => <h1>Hi</h1>;"}};
    project.spec.routes = {"/", "/about"};
    project.spec.insertion = Insertion::BOTTOM_OF_PAGE;
    project.insertion = Insertion::BOTTOM_OF_PAGE;
    store.create_batch(make_batch("b-1"), {make_task("b-1", "q1", 0), project});

    // When: Reading the batch and tasks
    auto batch = store.get_batch("b-1");
    auto tasks = store.get_tasks("b-1");

    // Then: Everything round-trips, in submission order, all pending
    ASSERT_TRUE(batch.has_value());
    EXPECT_EQ(batch->owner_ref, "upload-7");
    EXPECT_EQ(batch->document, "1. Print 2+2\n");
    EXPECT_FALSE(batch->cancelled);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].spec.id, "q1");
    EXPECT_EQ(tasks[0].status, TaskStatus::PENDING);
    EXPECT_FALSE(tasks[0].spec.insertion.has_value());
    EXPECT_EQ(tasks[1].spec.kind, TaskKind::PROJECT_MULTI_FILE);
    ASSERT_EQ(tasks[1].spec.files.size(), 1u);
    EXPECT_EQ(tasks[1].spec.files[0].path, "src/App.jsx");
    EXPECT_EQ(tasks[1].spec.routes, (std::vector<std::string>{"/", "/about"}));
    EXPECT_EQ(tasks[1].spec.insertion, Insertion::BOTTOM_OF_PAGE);
}

TEST_F(SqliteStoreTest, UnknownIdsAreEmpty) {
    EXPECT_FALSE(store.get_batch("nope").has_value());
    EXPECT_FALSE(store.get_task("nope", "q1").has_value());
    EXPECT_TRUE(store.get_tasks("nope").empty());
    EXPECT_FALSE(store.mark_cancelled("nope"));
}

TEST_F(SqliteStoreTest, SubmissionIsAllOrNothing) {
    // Given: A batch whose task list repeats an id
    std::vector<TaskRecord> tasks = {make_task("b-2", "q1", 0), make_task("b-2", "q1", 1)};

    // When: Persisting it
    EXPECT_THROW(store.create_batch(make_batch("b-2"), tasks), StoreError);

    // Then: Neither the batch nor the first task survived
    EXPECT_FALSE(store.get_batch("b-2").has_value());
    EXPECT_TRUE(store.get_tasks("b-2").empty());
}

TEST_F(SqliteStoreTest, TransitionsAreCompareAndSet) {
    store.create_batch(make_batch("b-1"), {make_task("b-1", "q1", 0)});

    EXPECT_TRUE(store.transition("b-1", "q1", TaskStatus::PENDING, TaskStatus::RUNNING));
    EXPECT_FALSE(store.transition("b-1", "q1", TaskStatus::PENDING, TaskStatus::RUNNING))
        << "A second claim must lose";

    TaskResult result;
    result.stdout_output = "4\n";
    result.exit_code = 0;
    result.caption = "Code execution successful";
    result.artifacts = {{"b-1/q1_0.png", "main.py", "combined", "abc"},
                        {"b-1/q1_1.png", "file_out.txt", "file", "def"}};
    EXPECT_TRUE(store.transition("b-1", "q1", TaskStatus::RUNNING, TaskStatus::COMPLETED,
                                 &result));

    auto task = store.get_task("b-1", "q1");
    ASSERT_TRUE(task.has_value());
    EXPECT_EQ(task->status, TaskStatus::COMPLETED);
    EXPECT_EQ(task->result.stdout_output, "4\n");
    ASSERT_EQ(task->result.artifacts.size(), 2u);
    EXPECT_EQ(task->result.artifacts[0].ref, "b-1/q1_0.png");
    EXPECT_EQ(task->result.artifacts[1].label, "file_out.txt");
}

TEST_F(SqliteStoreTest, IllegalTransitionThrows) {
    store.create_batch(make_batch("b-1"), {make_task("b-1", "q1", 0)});
    EXPECT_THROW(store.transition("b-1", "q1", TaskStatus::PENDING, TaskStatus::COMPLETED),
                 std::logic_error);
    EXPECT_THROW(store.transition("b-1", "q1", TaskStatus::COMPLETED, TaskStatus::RUNNING),
                 std::logic_error);
}

TEST_F(SqliteStoreTest, UpdatedAtStrictlyIncreases) {
    store.create_batch(make_batch("b-1"), {make_task("b-1", "q1", 0)});
    int64_t created = store.get_task("b-1", "q1")->updated_at;

    ASSERT_TRUE(store.transition("b-1", "q1", TaskStatus::PENDING, TaskStatus::RUNNING));
    int64_t running = store.get_task("b-1", "q1")->updated_at;

    TaskResult result;
    ASSERT_TRUE(store.transition("b-1", "q1", TaskStatus::RUNNING, TaskStatus::FAILED, &result));
    int64_t failed = store.get_task("b-1", "q1")->updated_at;

    EXPECT_LT(created, running);
    EXPECT_LT(running, failed);
}

TEST_F(SqliteStoreTest, FindTasksByStatusInOrder) {
    auto first = make_batch("b-a");
    first.created_at = 1;
    auto second = make_batch("b-b");
    second.created_at = 2;
    store.create_batch(second, {make_task("b-b", "x", 0)});
    store.create_batch(first, {make_task("b-a", "q1", 0), make_task("b-a", "q2", 1)});
    ASSERT_TRUE(store.transition("b-a", "q2", TaskStatus::PENDING, TaskStatus::RUNNING));

    auto pending = store.find_tasks(TaskStatus::PENDING);
    ASSERT_EQ(pending.size(), 2u);
    EXPECT_EQ(pending[0].batch_id, "b-a");
    EXPECT_EQ(pending[0].task_id, "q1");
    EXPECT_EQ(pending[1].batch_id, "b-b");

    auto running = store.find_tasks(TaskStatus::RUNNING);
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].task_id, "q2");
}

TEST_F(SqliteStoreTest, ListBatchesByOwner) {
    store.create_batch(make_batch("b-1", "upload-1"), {make_task("b-1", "q1", 0)});
    store.create_batch(make_batch("b-2", "upload-2"), {make_task("b-2", "q1", 0)});
    auto batches = store.list_batches("upload-2");
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].id, "b-2");
}

TEST_F(SqliteStoreTest, ConcurrentClaimsHaveOneWinner) {
    store.create_batch(make_batch("b-1"), {make_task("b-1", "q1", 0)});
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            if (store.transition("b-1", "q1", TaskStatus::PENDING, TaskStatus::RUNNING)) {
                winners++;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(winners.load(), 1);
}

TEST(SqliteStoreFileTest, SurvivesReopen) {
    // Given: A database file with a running task
    auto path = std::filesystem::temp_directory_path() /
                ("labshot_store_" + FileUtils::random_hex(4) + ".db");
    {
        SqliteTaskStore store(path.string());
        store.create_batch(make_batch("b-1"), {make_task("b-1", "q1", 0)});
        ASSERT_TRUE(store.transition("b-1", "q1", TaskStatus::PENDING, TaskStatus::RUNNING));
    }

    // When: Reopening it
    SqliteTaskStore reopened(path.string());

    // Then: The state is durable
    auto running = reopened.find_tasks(TaskStatus::RUNNING);
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].task_id, "q1");

    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::remove(path.string() + suffix);
    }
}

TEST(SqliteStoreFileTest, UnopenablePathThrows) {
    EXPECT_THROW(SqliteTaskStore("/nonexistent-dir/labshot/x.db"), StoreError);
}

} // namespace
} // namespace labshot
