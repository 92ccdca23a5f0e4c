#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "labshot/executor.h"
#include "labshot/renderer.h"
#include "labshot/text_generator.h"

namespace labshot {
namespace fakes {

// Holds runs at a known point until the test lets them go
class RunGate {
public:
    void enter() {
        std::unique_lock<std::mutex> lock(mutex_);
        entered_++;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    bool wait_entered(int count, std::chrono::milliseconds limit) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, limit, [&] { return entered_ >= count; });
    }

    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int entered_ = 0;
    bool open_ = false;
};

// Behaviour is picked by markers in the source:
//   "crash"        -> exits 1 with a traceback on stderr
//   "spin_forever" -> times out
//   "slow"         -> sleeps 50ms, then completes
//   "hold"         -> waits on the runtime's gate, then completes
//   anything else  -> completes, echoing the first line to stdout
class ScriptedEnvironment : public Environment {
public:
    ScriptedEnvironment(std::string id, std::shared_ptr<RunGate> gate)
        : id_(std::move(id)), gate_(std::move(gate)) {}

    const std::string& id() const override { return id_; }

    ExecutionResult run(const std::string& source, Language,
                        const ExecutionLimits& limits) override {
        ExecutionResult result;
        if (source.find("crash") != std::string::npos) {
            result.status = ExecutionStatus::CRASHED;
            result.exit_code = 1;
            result.stderr_output = "Traceback (most recent call last):\nRuntimeError: crash\n";
            result.error_message = "Exited with code 1";
        } else if (source.find("spin_forever") != std::string::npos) {
            result.status = ExecutionStatus::TIMED_OUT;
            result.exit_code = TIMEOUT_EXIT_CODE;
            result.wall_time = limits.timeout;
            result.error_message = "Execution timed out after " +
                std::to_string(std::chrono::duration_cast<std::chrono::seconds>(
                    limits.timeout).count()) + "s";
        } else {
            if (source.find("slow") != std::string::npos) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (source.find("hold") != std::string::npos) {
                gate_->enter();
            }
            result.status = ExecutionStatus::COMPLETED;
            result.exit_code = 0;
            result.stdout_output = source.substr(0, source.find('\n')) + "\n";
            if (source.find("write_file") != std::string::npos) {
                result.output_files.push_back({"out.txt", "written\n"});
            }
        }
        return result;
    }

    void teardown() override {}

private:
    std::string id_;
    std::shared_ptr<RunGate> gate_;
};

class ScriptedRuntime : public ExecutionRuntime {
public:
    std::string name() const override { return "scripted"; }

    std::unique_ptr<Environment> provision(const ExecutionLimits&) override {
        return std::make_unique<ScriptedEnvironment>("scripted-" + std::to_string(++counter_),
                                                     gate);
    }

    std::shared_ptr<RunGate> gate = std::make_shared<RunGate>();

private:
    std::atomic<int> counter_{0};
};

struct RenderCall {
    std::string key;
    RenderKind kind;
    Theme theme;
    RenderContent content;
};

// Records what would have been drawn; optionally fails one kind
class RecordingRenderer : public ArtifactRenderer {
public:
    ArtifactRef render(const RenderContent& content, Language, Theme theme, RenderKind kind,
                       const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_kind && *fail_kind == kind) {
            throw std::runtime_error("canvas exploded");
        }
        calls_.push_back({key, kind, theme, content});
        return {key, content.filename.empty() ? "snippet" : content.filename, to_string(kind),
                "digest-" + key};
    }

    std::vector<RenderCall> snapshot() {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

    std::optional<RenderKind> fail_kind;

private:
    std::mutex mutex_;
    std::vector<RenderCall> calls_;
};

// Every call fails like an unavailable upstream
class FailingGenerator : public TextGenerator {
public:
    std::string name() const override { return "failing"; }
    std::string generate(const std::string&) override {
        calls++;
        throw std::runtime_error("503 Service Unavailable");
    }

    std::atomic<int> calls{0};
};

// Every call outlasts any sensible timeout
class StallingGenerator : public TextGenerator {
public:
    std::string name() const override { return "stalling"; }
    std::string generate(const std::string&) override {
        calls++;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return "too late";
    }

    std::atomic<int> calls{0};
};

inline TextCallPolicy quick_text_policy() {
    TextCallPolicy policy;
    policy.timeout = std::chrono::milliseconds(2000);
    policy.retries = 0;
    policy.backoff = std::chrono::milliseconds(1);
    return policy;
}

} // namespace fakes
} // namespace labshot
