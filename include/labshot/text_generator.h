#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "labshot/constants.h"
#include "labshot/task.h"

namespace labshot {

// Remote prose generation (answers and captions). Implementations may
// block and may throw; callers go through TextService.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;

    virtual std::string name() const = 0;

    // Throws UpstreamError (or any std::exception) on failure
    virtual std::string generate(const std::string& prompt) = 0;
};

// Offline generator. Output depends only on the prompt.
class TemplateTextGenerator : public TextGenerator {
public:
    std::string name() const override { return "template"; }
    std::string generate(const std::string& prompt) override;
};

struct TextCallPolicy {
    std::chrono::milliseconds timeout{DEFAULT_TEXT_TIMEOUT_SECONDS * 1000};
    int retries = DEFAULT_TEXT_RETRIES;
    std::chrono::milliseconds backoff{DEFAULT_TEXT_BACKOFF_MS};
    size_t max_outstanding = MAX_OUTSTANDING_TEXT_CALLS;
};

// Bounds the generate() calls still running, abandoned ones included
class TextCallSlots {
public:
    explicit TextCallSlots(size_t capacity);

    bool try_acquire();
    void release();

    size_t in_flight() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    size_t in_flight_ = 0;
};

std::string caption_prompt(TaskKind kind, const std::string& code, const std::string& stdout_text,
                           int exit_code);
std::string answer_prompt(const std::string& question);

// Caption used when the generator is unavailable
std::string fallback_caption(TaskKind kind, int exit_code, size_t route_count = 0);

// Runs one generate() call on its own thread and stops waiting after
// `timeout`. The thread holds a slot until generate() returns. Throws
// UpstreamError on timeout or when no slot is free; rethrows generator errors.
std::string generate_with_timeout(const std::shared_ptr<TextGenerator>& generator,
                                  const std::string& prompt, std::chrono::milliseconds timeout,
                                  const std::shared_ptr<TextCallSlots>& slots);

// Timeout-bound, retried access to a TextGenerator
class TextService {
public:
    TextService(std::shared_ptr<TextGenerator> generator, TextCallPolicy policy = {});

    // Throws UpstreamError once the retry is spent
    std::string generate(const std::string& prompt) const;

    // Never throws; falls back to a deterministic caption
    std::string caption(TaskKind kind, const std::string& code, const std::string& stdout_text,
                        int exit_code, size_t route_count = 0) const;

    // Throws UpstreamError
    std::string answer(const std::string& question) const;

    const TextCallPolicy& policy() const { return policy_; }
    size_t calls_in_flight() const { return slots_->in_flight(); }

private:
    std::shared_ptr<TextGenerator> generator_;
    TextCallPolicy policy_;
    std::shared_ptr<TextCallSlots> slots_;
};

} // namespace labshot
