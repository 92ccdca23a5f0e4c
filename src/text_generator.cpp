#include "labshot/text_generator.h"
#include "labshot/errors.h"
#include "file_utils.h"

#include <exception>
#include <future>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <thread>

namespace labshot {

namespace {

const char* kAnswerHeader = "Answer this programming question:";
const char* kCaptionHeader = "Task type:";

std::string first_line(const std::string& text) {
    auto lines = FileUtils::split_lines(text);
    for (const auto& line : lines) {
        if (line.find_first_not_of(" \t") != std::string::npos) {
            return line;
        }
    }
    return "";
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

// Value of "Key: value" inside a prompt
std::string field(const std::string& prompt, const std::string& key) {
    for (const auto& line : FileUtils::split_lines(prompt)) {
        if (line.compare(0, key.size(), key) == 0) {
            return trim(line.substr(key.size()));
        }
    }
    return "";
}

} // namespace

std::string TemplateTextGenerator::generate(const std::string& prompt) {
    if (prompt.compare(0, std::string(kAnswerHeader).size(), kAnswerHeader) == 0) {
        std::string question = trim(prompt.substr(std::string(kAnswerHeader).size()));
        if (question.empty()) {
            throw UpstreamError("empty question");
        }
        std::string topic = first_line(question);
        if (topic.size() > 120) {
            topic = topic.substr(0, 117) + "...";
        }
        std::ostringstream answer;
        answer << "The question asks: " << topic << "\n\n"
               << "Start from the definitions involved, work through a small example by hand, "
               << "and then state the general result.";
        return answer.str();
    }

    if (prompt.compare(0, std::string(kCaptionHeader).size(), kCaptionHeader) == 0) {
        std::string kind = field(prompt, kCaptionHeader);
        std::string exit_code = field(prompt, "Exit code:");
        std::string output;
        size_t output_at = prompt.find("Output:\n");
        if (output_at != std::string::npos) {
            output = first_line(prompt.substr(output_at + 8));
        }
        std::ostringstream caption;
        caption << "Result of the " << kind << " task";
        if (!exit_code.empty()) {
            caption << " (exit code " << exit_code << ")";
        }
        if (!output.empty() && output.compare(0, 10, "Exit code:") != 0) {
            caption << ", first output line: " << trim(output);
        }
        caption << ".";
        return caption.str();
    }

    throw UpstreamError("unrecognised prompt");
}

std::string caption_prompt(TaskKind kind, const std::string& code, const std::string& stdout_text,
                           int exit_code) {
    std::ostringstream prompt;
    prompt << kCaptionHeader << " " << to_string(kind) << "\n"
           << "Code executed:\n" << code << "\n\n"
           << "Output:\n" << stdout_text << "\n\n"
           << "Exit code: " << exit_code << "\n\n"
           << "Generate a caption for this execution result.";
    return prompt.str();
}

std::string answer_prompt(const std::string& question) {
    return std::string(kAnswerHeader) + "\n\n" + question;
}

std::string fallback_caption(TaskKind kind, int exit_code, size_t route_count) {
    if (kind == TaskKind::PROJECT_MULTI_FILE) {
        return "React SPA project with " + std::to_string(route_count) +
               " routes captured successfully";
    }
    return std::string("Code execution ") + (exit_code == 0 ? "successful" : "failed");
}

TextCallSlots::TextCallSlots(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("TextCallSlots needs at least one slot");
    }
}

bool TextCallSlots::try_acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ >= capacity_) {
        return false;
    }
    in_flight_++;
    return true;
}

void TextCallSlots::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_ > 0) {
        in_flight_--;
    }
}

size_t TextCallSlots::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

std::string generate_with_timeout(const std::shared_ptr<TextGenerator>& generator,
                                  const std::string& prompt, std::chrono::milliseconds timeout,
                                  const std::shared_ptr<TextCallSlots>& slots) {
    if (!slots->try_acquire()) {
        throw UpstreamError(generator->name() + " has " + std::to_string(slots->capacity()) +
                            " calls outstanding");
    }

    // The worker thread owns its own references, so an abandoned call can
    // finish in the background without touching freed state.
    auto result = std::make_shared<std::promise<std::string>>();
    std::future<std::string> future = result->get_future();

    try {
        std::thread([generator, prompt, result, slots]() {
            try {
                result->set_value(generator->generate(prompt));
            } catch (...) {
                result->set_exception(std::current_exception());
            }
            slots->release();
        }).detach();
    } catch (const std::system_error& e) {
        slots->release();
        throw UpstreamError("cannot start " + generator->name() + " call: " + e.what());
    }

    if (future.wait_for(timeout) != std::future_status::ready) {
        throw UpstreamError(generator->name() + " timed out after " +
                            std::to_string(timeout.count()) + "ms");
    }
    return future.get();
}

TextService::TextService(std::shared_ptr<TextGenerator> generator, TextCallPolicy policy)
    : generator_(std::move(generator)), policy_(policy),
      slots_(std::make_shared<TextCallSlots>(policy.max_outstanding)) {
    if (!generator_) {
        throw std::invalid_argument("TextService requires a generator");
    }
}

std::string TextService::generate(const std::string& prompt) const {
    std::string last_error;
    for (int attempt = 0; attempt <= policy_.retries; ++attempt) {
        if (attempt > 0) {
            std::cerr << "[TextGen] Retrying in " << policy_.backoff.count() << "ms after: "
                      << last_error << std::endl;
            std::this_thread::sleep_for(policy_.backoff * attempt);
        }
        try {
            return generate_with_timeout(generator_, prompt, policy_.timeout, slots_);
        } catch (const std::exception& e) {
            last_error = e.what();
        }
    }
    throw UpstreamError(generator_->name() + " failed after " +
                        std::to_string(policy_.retries + 1) + " attempts: " + last_error);
}

std::string TextService::caption(TaskKind kind, const std::string& code,
                                 const std::string& stdout_text, int exit_code,
                                 size_t route_count) const {
    if (kind == TaskKind::PROJECT_MULTI_FILE) {
        return fallback_caption(kind, exit_code, route_count);
    }
    try {
        return generate(caption_prompt(kind, code, stdout_text, exit_code));
    } catch (const UpstreamError& e) {
        std::cerr << "[TextGen] Caption fallback: " << e.what() << std::endl;
        return fallback_caption(kind, exit_code, route_count);
    }
}

std::string TextService::answer(const std::string& question) const {
    return generate(answer_prompt(question));
}

} // namespace labshot
