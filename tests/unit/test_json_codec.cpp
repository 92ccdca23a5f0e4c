#include <gtest/gtest.h>
#include <string>
#include "labshot/errors.h"
#include "labshot/json_codec.h"

namespace labshot {
namespace {

using namespace std::string_literals;

// ============================================================================
// Batch parsing
// ============================================================================

TEST(ParseBatchTest, FullSubmission) {
    auto submission = parse_batch(R"json({
        "owner_ref": "upload-42",
        "theme": "vscode",
        "default_insertion": "bottom_of_page",
        "document": "1. Print 2+2\n",
        "tasks": [
            {"id": "q1", "kind": "code_execution", "language": "python",
             "source": "print(2+2)", "question": "Print 2+2"},
            {"id": "q2", "kind": "react_project", "language": "react",
             "files": [{"path": "src/App.jsx", "content": "<h1/>"}],
             "routes": ["/", "/about"], "insertion": "below_question"}
        ]
    })json"s);

    EXPECT_EQ(submission.owner_ref, "upload-42");
    EXPECT_EQ(submission.theme, "vscode");
    EXPECT_EQ(submission.default_insertion, Insertion::BOTTOM_OF_PAGE);
    EXPECT_EQ(submission.document, "1. Print 2+2\n");
    ASSERT_EQ(submission.tasks.size(), 2u);
    EXPECT_EQ(submission.tasks[0].source, "print(2+2)");
    EXPECT_FALSE(submission.tasks[0].insertion.has_value());
    EXPECT_EQ(submission.tasks[1].kind, TaskKind::PROJECT_MULTI_FILE);
    ASSERT_EQ(submission.tasks[1].files.size(), 1u);
    EXPECT_EQ(submission.tasks[1].files[0].path, "src/App.jsx");
    EXPECT_EQ(submission.tasks[1].routes.size(), 2u);
    EXPECT_EQ(submission.tasks[1].insertion, Insertion::BELOW_QUESTION);
}

TEST(ParseBatchTest, Defaults) {
    auto submission = parse_batch(R"json({"tasks": [{"id": "q1", "source": "print(1)"}]})json"s);
    EXPECT_EQ(submission.theme, "auto");
    EXPECT_EQ(submission.default_insertion, Insertion::BELOW_QUESTION);
    ASSERT_EQ(submission.tasks.size(), 1u);
    EXPECT_EQ(submission.tasks[0].kind, TaskKind::CODE_EXECUTION);
    EXPECT_EQ(submission.tasks[0].language, Language::PYTHON);
}

TEST(ParseBatchTest, MalformedInputThrows) {
    EXPECT_THROW(parse_batch("not json"s), InvalidBatchError);
    EXPECT_THROW(parse_batch("[]"s), InvalidBatchError);
    EXPECT_THROW(parse_batch(R"({"theme": "idle"})"s), InvalidBatchError);
    EXPECT_THROW(parse_batch(R"({"tasks": [1]})"s), InvalidBatchError);
    EXPECT_THROW(parse_batch(R"({"tasks": [{"kind": "teleport"}]})"s), InvalidBatchError);
    EXPECT_THROW(parse_batch(R"({"tasks": [{"language": "cobol"}]})"s), InvalidBatchError);
    EXPECT_THROW(parse_batch(R"({"tasks": [{"source": 5}]})"s), InvalidBatchError);
    EXPECT_THROW(parse_batch(R"({"tasks": [{"routes": "/"}]})"s), InvalidBatchError);
    EXPECT_THROW(parse_batch(R"({"tasks": [{"insertion": "sideways"}]})"s), InvalidBatchError);
}

// ============================================================================
// Reports
// ============================================================================

TEST(ToJsonTest, PendingTaskHasNoResult) {
    TaskRecord task;
    task.spec.id = "q1";
    Json::Value json = to_json(task);
    EXPECT_EQ(json["status"].asString(), "pending");
    EXPECT_FALSE(json.isMember("stdout"));
    EXPECT_FALSE(json.isMember("error_kind"));
}

TEST(ToJsonTest, FailedTaskCarriesErrorAndArtifacts) {
    TaskRecord task;
    task.spec.id = "q1";
    task.status = TaskStatus::FAILED;
    task.result.exit_code = 124;
    task.result.error_kind = ErrorKind::EXECUTION_TIMED_OUT;
    task.result.error = "Timed out after 30 seconds";
    task.result.artifacts = {{"b-1/q1_0.png", "main.py", "combined", "abcd"}};

    Json::Value json = to_json(task);

    EXPECT_EQ(json["status"].asString(), "failed");
    EXPECT_EQ(json["exit_code"].asInt(), 124);
    EXPECT_EQ(json["error_kind"].asString(), "ExecutionTimedOut");
    ASSERT_EQ(json["artifacts"].size(), 1u);
    EXPECT_EQ(json["artifacts"][0]["sha256"].asString(), "abcd");
}

TEST(ToJsonTest, StatusReport) {
    BatchStatusReport report;
    report.batch_id = "b-1";
    report.aggregate = BatchStatus::COMPLETED;
    report.tasks.resize(2);

    Json::Value json = to_json(report);

    EXPECT_EQ(json["batch_id"].asString(), "b-1");
    EXPECT_EQ(json["status"].asString(), "completed");
    EXPECT_EQ(json["tasks"].size(), 2u);
}

TEST(ToJsonTest, PrettyPrintsWithTwoSpaces) {
    Json::Value value;
    value["a"] = 1;
    EXPECT_EQ(to_json_string(value), "{\n  \"a\" : 1\n}");
}

} // namespace
} // namespace labshot
