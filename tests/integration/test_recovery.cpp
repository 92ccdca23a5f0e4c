#include <gtest/gtest.h>
#include "labshot/orchestrator.h"
#include "labshot/sqlite_store.h"
#include "file_utils.h"
#include "pipeline_fakes.h"

#include <chrono>
#include <filesystem>
#include <memory>

namespace labshot {
namespace {

using namespace std::chrono_literals;

TaskRecord stored_task(const std::string& batch_id, const std::string& id, int ordinal) {
    TaskRecord task;
    task.batch_id = batch_id;
    task.ordinal = ordinal;
    task.spec.id = id;
    task.spec.source = "print('" + id + "')";
    task.theme = Theme::IDLE;
    return task;
}

class RecoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        db_path = std::filesystem::temp_directory_path() /
                  ("labshot_recovery_" + FileUtils::random_hex(4) + ".db");
        executor = std::make_unique<SandboxExecutor>(std::make_unique<fakes::ScriptedRuntime>(), 2);
        text = std::make_unique<TextService>(std::make_shared<TemplateTextGenerator>(),
                                             fakes::quick_text_policy());
    }

    void TearDown() override {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            std::filesystem::remove(db_path.string() + suffix);
        }
    }

    std::filesystem::path db_path;
    fakes::RecordingRenderer renderer;
    std::unique_ptr<SandboxExecutor> executor;
    std::unique_ptr<TextService> text;
};

TEST_F(RecoveryTest, RunningTasksBecomeInterrupted) {
    // Given: A previous process died with q1 running and q2 still pending
    {
        SqliteTaskStore store(db_path.string());
        BatchRecord batch;
        batch.id = "b-crashed";
        store.create_batch(batch, {stored_task("b-crashed", "q1", 0),
                                   stored_task("b-crashed", "q2", 1)});
        ASSERT_TRUE(store.transition("b-crashed", "q1", TaskStatus::PENDING, TaskStatus::RUNNING));
    }

    // When: A new orchestrator starts on the same database
    SqliteTaskStore store(db_path.string());
    JobOrchestrator orchestrator(store, *executor, renderer, *text);
    orchestrator.start();
    ASSERT_TRUE(orchestrator.wait_for_batch("b-crashed", 10s));

    // Then: q1 is marked interrupted and q2 runs to completion
    auto q1 = store.get_task("b-crashed", "q1");
    ASSERT_TRUE(q1.has_value());
    EXPECT_EQ(q1->status, TaskStatus::FAILED);
    EXPECT_EQ(q1->result.error_kind, ErrorKind::INTERRUPTED);
    EXPECT_EQ(q1->result.error, "Interrupted before completion");

    auto q2 = store.get_task("b-crashed", "q2");
    ASSERT_TRUE(q2.has_value());
    EXPECT_EQ(q2->status, TaskStatus::COMPLETED);
    EXPECT_EQ(q2->result.stdout_output, "print('q2')\n");
    EXPECT_EQ(executor->executions(), 1u) << "The interrupted task must not be rerun";
}

TEST_F(RecoveryTest, QueuedWorkSurvivesAStop) {
    // Given: A batch accepted by an orchestrator that never started workers
    std::string batch_id;
    {
        SqliteTaskStore store(db_path.string());
        JobOrchestrator first(store, *executor, renderer, *text);
        BatchSubmission submission;
        TaskSpec spec;
        spec.id = "q1";
        spec.source = "print(1)";
        submission.tasks = {spec};
        batch_id = first.submit_batch(submission);
    }

    // When: Another orchestrator starts
    SqliteTaskStore store(db_path.string());
    JobOrchestrator second(store, *executor, renderer, *text);
    second.start();

    // Then: The pending task is picked up and finished
    ASSERT_TRUE(second.wait_for_batch(batch_id, 10s));
    auto report = second.get_batch_status(batch_id);
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->aggregate, BatchStatus::COMPLETED);
}

TEST_F(RecoveryTest, StartTwiceIsHarmless) {
    SqliteTaskStore store(db_path.string());
    JobOrchestrator orchestrator(store, *executor, renderer, *text);
    orchestrator.start();
    orchestrator.start();
    EXPECT_TRUE(orchestrator.running());
    orchestrator.stop();
    EXPECT_FALSE(orchestrator.running());
    orchestrator.stop();
}

} // namespace
} // namespace labshot
