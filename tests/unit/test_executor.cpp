#include <gtest/gtest.h>
#include "labshot/executor.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

namespace labshot {
namespace {

// Counters shared between a fake runtime and the test body
struct FakeCounters {
    std::atomic<int> provisioned{0};
    std::atomic<int> torn_down{0};
};

class FakeEnvironment : public Environment {
public:
    FakeEnvironment(std::string id, FakeCounters& counters, bool throw_in_run,
                    bool throw_in_teardown, std::chrono::milliseconds delay)
        : id_(std::move(id)), counters_(counters), throw_in_run_(throw_in_run),
          throw_in_teardown_(throw_in_teardown), delay_(delay) {}

    const std::string& id() const override { return id_; }

    ExecutionResult run(const std::string& source, Language, const ExecutionLimits&) override {
        std::this_thread::sleep_for(delay_);
        if (throw_in_run_) {
            throw std::runtime_error("runtime went away");
        }
        ExecutionResult result;
        result.status = ExecutionStatus::COMPLETED;
        result.exit_code = 0;
        result.stdout_output = "ran: " + source;
        return result;
    }

    void teardown() override {
        counters_.torn_down++;
        if (throw_in_teardown_) {
            throw std::runtime_error("cleanup failed");
        }
    }

private:
    std::string id_;
    FakeCounters& counters_;
    bool throw_in_run_;
    bool throw_in_teardown_;
    std::chrono::milliseconds delay_;
};

class FakeRuntime : public ExecutionRuntime {
public:
    explicit FakeRuntime(FakeCounters& counters) : counters_(counters) {}

    std::string name() const override { return "fake"; }

    std::unique_ptr<Environment> provision(const ExecutionLimits&) override {
        if (fail_provision) {
            throw std::runtime_error("no capacity");
        }
        int n = ++counters_.provisioned;
        return std::make_unique<FakeEnvironment>("fake-" + std::to_string(n), counters_,
                                                 throw_in_run, throw_in_teardown, delay);
    }

    bool fail_provision = false;
    bool throw_in_run = false;
    bool throw_in_teardown = false;
    std::chrono::milliseconds delay{0};

private:
    FakeCounters& counters_;
};

class SandboxExecutorTest : public ::testing::Test {
protected:
    FakeCounters counters;
    ExecutionLimits limits;
};

TEST_F(SandboxExecutorTest, RunsAndTearsDown) {
    SandboxExecutor executor(std::make_unique<FakeRuntime>(counters), 2);

    auto result = executor.execute("print(1)", Language::PYTHON, limits);

    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(result.stdout_output, "ran: print(1)");
    EXPECT_EQ(executor.executions(), 1u);
    EXPECT_EQ(counters.provisioned.load(), 1);
    EXPECT_EQ(counters.torn_down.load(), 1);
    EXPECT_EQ(executor.live_environments(), 0u);
}

TEST_F(SandboxExecutorTest, EnvironmentFaultStillTearsDown) {
    // Given: A runtime whose environments throw from run()
    auto runtime = std::make_unique<FakeRuntime>(counters);
    runtime->throw_in_run = true;
    SandboxExecutor executor(std::move(runtime), 1);

    // When: Executing
    auto result = executor.execute("x", Language::PYTHON, limits);

    // Then: The fault is reported as a crash and the environment is gone
    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_NE(result.error_message.find("runtime went away"), std::string::npos);
    EXPECT_EQ(counters.torn_down.load(), 1);
    EXPECT_EQ(executor.live_environments(), 0u);
}

TEST_F(SandboxExecutorTest, TeardownFailureIsCountedNotThrown) {
    auto runtime = std::make_unique<FakeRuntime>(counters);
    runtime->throw_in_teardown = true;
    SandboxExecutor executor(std::move(runtime), 1);

    ExecutionResult result;
    EXPECT_NO_THROW(result = executor.execute("x", Language::PYTHON, limits));
    EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
    EXPECT_EQ(executor.teardown_failures(), 1u);
}

TEST_F(SandboxExecutorTest, ProvisioningFailureIsACrash) {
    auto runtime = std::make_unique<FakeRuntime>(counters);
    runtime->fail_provision = true;
    SandboxExecutor executor(std::move(runtime), 1);

    auto result = executor.execute("x", Language::PYTHON, limits);

    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_NE(result.error_message.find("Provisioning failed"), std::string::npos);
    EXPECT_EQ(counters.torn_down.load(), 0);
    EXPECT_EQ(executor.live_environments(), 0u) << "The slot must be released";
}

TEST_F(SandboxExecutorTest, NonExecutableLanguageNeverProvisions) {
    SandboxExecutor executor(std::make_unique<FakeRuntime>(counters), 1);

    auto result = executor.execute("<h1>Hi</h1>", Language::HTML, limits);

    EXPECT_EQ(result.status, ExecutionStatus::CRASHED);
    EXPECT_EQ(executor.executions(), 1u);
    EXPECT_EQ(counters.provisioned.load(), 0);
}

TEST_F(SandboxExecutorTest, LiveEnvironmentsNeverExceedCap) {
    // Given: A cap of two and slow environments
    auto runtime = std::make_unique<FakeRuntime>(counters);
    runtime->delay = std::chrono::milliseconds(50);
    SandboxExecutor executor(std::move(runtime), 2);

    // When: Six callers execute at once
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; ++i) {
        threads.emplace_back([&executor, this, i]() {
            auto result = executor.execute("job " + std::to_string(i), Language::PYTHON, limits);
            EXPECT_EQ(result.status, ExecutionStatus::COMPLETED);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Then: Every run completed, never more than two at a time
    EXPECT_EQ(executor.executions(), 6u);
    EXPECT_LE(executor.peak_live_environments(), 2u);
    EXPECT_EQ(counters.torn_down.load(), 6);
}

TEST_F(SandboxExecutorTest, RequiresRuntime) {
    EXPECT_THROW(SandboxExecutor(nullptr, 1), std::invalid_argument);
}

} // namespace
} // namespace labshot
