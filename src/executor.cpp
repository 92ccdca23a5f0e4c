#include "labshot/executor.h"

#include <iostream>
#include <stdexcept>

namespace labshot {

namespace {

// Runs teardown on every path out of execute()
class TeardownGuard {
public:
    TeardownGuard(Environment& env, std::atomic<size_t>& failures)
        : env_(env), failures_(failures) {}

    ~TeardownGuard() {
        try {
            env_.teardown();
            std::cout << "[Executor] " << env_.id() << " "
                      << to_string(ExecutionPhase::TORN_DOWN) << std::endl;
        } catch (const std::exception& e) {
            failures_++;
            std::cerr << "[Executor] Teardown of " << env_.id()
                      << " failed: " << e.what() << std::endl;
        }
    }

private:
    Environment& env_;
    std::atomic<size_t>& failures_;
};

ExecutionPhase phase_for(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED: return ExecutionPhase::COMPLETED;
        case ExecutionStatus::TIMED_OUT: return ExecutionPhase::TIMED_OUT;
        case ExecutionStatus::CRASHED: return ExecutionPhase::CRASHED;
    }
    return ExecutionPhase::CRASHED;
}

} // namespace

std::string to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::TIMED_OUT: return "timed_out";
        case ExecutionStatus::CRASHED: return "crashed";
    }
    return "unknown";
}

std::string to_string(ExecutionPhase phase) {
    switch (phase) {
        case ExecutionPhase::PROVISIONING: return "provisioning";
        case ExecutionPhase::RUNNING: return "running";
        case ExecutionPhase::COMPLETED: return "completed";
        case ExecutionPhase::TIMED_OUT: return "timed_out";
        case ExecutionPhase::CRASHED: return "crashed";
        case ExecutionPhase::TORN_DOWN: return "torn_down";
    }
    return "unknown";
}

SandboxExecutor::SandboxExecutor(std::unique_ptr<ExecutionRuntime> runtime,
                                 size_t max_live_environments)
    : runtime_(std::move(runtime)),
      max_live_(max_live_environments == 0 ? 1 : max_live_environments) {
    if (!runtime_) {
        throw std::invalid_argument("SandboxExecutor requires a runtime");
    }
    std::cout << "[Executor] Using " << runtime_->name() << " runtime, at most "
              << max_live_ << " live environments" << std::endl;
}

SandboxExecutor::~SandboxExecutor() = default;

size_t SandboxExecutor::live_environments() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return live_;
}

size_t SandboxExecutor::peak_live_environments() const {
    std::lock_guard<std::mutex> lock(slots_mutex_);
    return peak_live_;
}

void SandboxExecutor::acquire_slot() {
    std::unique_lock<std::mutex> lock(slots_mutex_);
    slots_cv_.wait(lock, [this] { return live_ < max_live_; });
    live_++;
    if (live_ > peak_live_) {
        peak_live_ = live_;
    }
}

void SandboxExecutor::release_slot() {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        live_--;
    }
    slots_cv_.notify_one();
}

ExecutionResult SandboxExecutor::execute(const std::string& source, Language language,
                                         const ExecutionLimits& limits) {
    executions_++;

    if (!is_executable(language)) {
        ExecutionResult result;
        result.status = ExecutionStatus::CRASHED;
        result.error_message = "Language " + language_name(language) + " is not executable";
        return result;
    }

    acquire_slot();
    struct SlotRelease {
        SandboxExecutor* self;
        ~SlotRelease() { self->release_slot(); }
    } slot{this};

    std::unique_ptr<Environment> env;
    try {
        env = runtime_->provision(limits);
    } catch (const std::exception& e) {
        std::cerr << "[Executor] Provisioning failed: " << e.what() << std::endl;
        ExecutionResult result;
        result.status = ExecutionStatus::CRASHED;
        result.error_message = std::string("Provisioning failed: ") + e.what();
        return result;
    }
    std::cout << "[Executor] " << env->id() << " "
              << to_string(ExecutionPhase::PROVISIONING) << " -> "
              << to_string(ExecutionPhase::RUNNING) << std::endl;

    TeardownGuard guard(*env, teardown_failures_);

    ExecutionResult result;
    try {
        result = env->run(source, language, limits);
    } catch (const std::exception& e) {
        result = ExecutionResult{};
        result.status = ExecutionStatus::CRASHED;
        result.error_message = std::string("Environment fault: ") + e.what();
    }

    std::cout << "[Executor] " << env->id() << " -> "
              << to_string(phase_for(result.status)) << " (exit " << result.exit_code
              << ", " << result.wall_time.count() << "ms)" << std::endl;
    return result;
}

} // namespace labshot
