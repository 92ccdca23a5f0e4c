#include "labshot/composer.h"
#include "labshot/artifact_store.h"
#include "labshot/errors.h"
#include "labshot/store.h"
#include "file_utils.h"

#include <cctype>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>

namespace labshot {

namespace {

const char* kTrailingHeading = "## Lab programs with output";

// Non-blank lines kept verbatim; `gap` is the exact text up to the next
// paragraph so an untouched document reassembles byte for byte
struct Paragraph {
    std::string text;
    std::string gap;
};

struct ParsedDocument {
    std::string lead;
    std::vector<Paragraph> paragraphs;
};

bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& text) {
    size_t begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    return text.substr(begin, text.find_last_not_of(" \t\r\n") - begin + 1);
}

ParsedDocument parse_paragraphs(const std::string& document) {
    ParsedDocument parsed;
    bool open = false;
    std::string pending;  // Line terminator not yet assigned

    size_t pos = 0;
    while (pos < document.size()) {
        size_t newline = document.find('\n', pos);
        std::string line = document.substr(pos, newline == std::string::npos ? std::string::npos
                                                                             : newline - pos);
        std::string terminator = newline == std::string::npos ? "" : "\n";
        pos = newline == std::string::npos ? document.size() : newline + 1;

        if (is_blank(line)) {
            std::string& sink = parsed.paragraphs.empty() ? parsed.lead
                                                          : parsed.paragraphs.back().gap;
            if (open) {
                sink += pending;
                open = false;
            }
            sink += line + terminator;
        } else if (open) {
            parsed.paragraphs.back().text += pending + line;
            pending = terminator;
        } else {
            parsed.paragraphs.push_back({line, ""});
            pending = terminator;
            open = true;
        }
    }
    if (open) {
        parsed.paragraphs.back().gap += pending;
    }
    return parsed;
}

bool is_section_heading(const std::string& text) {
    static const std::regex lettered("^[A-Z]\\.\\s+[A-Z]");
    static const std::regex markdown("^#{1,6}\\s");
    std::string line = trim(text.substr(0, text.find('\n')));
    return std::regex_search(line, lettered) || std::regex_search(line, markdown);
}

std::string first_line(const std::string& text) {
    for (const auto& line : FileUtils::split_lines(text)) {
        if (!is_blank(line)) {
            return trim(line);
        }
    }
    return "";
}

std::optional<int> number_from_id(const std::string& id) {
    size_t end = id.size();
    size_t begin = end;
    while (begin > 0 && std::isdigit(static_cast<unsigned char>(id[begin - 1]))) {
        begin--;
    }
    if (begin == end || end - begin > 6) {
        return std::nullopt;
    }
    return std::stoi(id.substr(begin));
}

// Paragraph after which the task's blocks go, or nullopt
std::optional<size_t> find_anchor(const std::vector<Paragraph>& paragraphs,
                                  const TaskRecord& task) {
    std::optional<size_t> start;

    std::string question = first_line(task.spec.question);
    if (!question.empty()) {
        for (size_t i = 0; i < paragraphs.size(); ++i) {
            if (paragraphs[i].text.find(question) != std::string::npos) {
                start = i;
                break;
            }
        }
    }

    if (!start) {
        auto number = find_question_number(task.spec.question);
        if (!number) {
            number = number_from_id(task.spec.id);
        }
        if (number) {
            for (size_t i = 0; i < paragraphs.size(); ++i) {
                if (find_question_number(paragraphs[i].text) == number) {
                    start = i;
                    break;
                }
            }
        }
    }

    if (!start) {
        return std::nullopt;
    }

    // The question runs until the next numbered item or section heading
    for (size_t i = *start + 1; i < paragraphs.size(); ++i) {
        if (find_question_number(paragraphs[i].text) || is_section_heading(paragraphs[i].text)) {
            return i - 1;
        }
    }
    return *start;
}

std::string task_block(const TaskRecord& task, const std::string& link_prefix) {
    std::ostringstream block;
    bool first = true;
    auto separate = [&]() {
        if (!first) {
            block << "\n\n";
        }
        first = false;
    };

    for (const auto& artifact : task.result.artifacts) {
        separate();
        block << "![" << artifact.label << "](" << link_prefix << artifact.ref << ")";
    }
    if (!task.result.caption.empty()) {
        separate();
        block << "*" << task.result.caption << "*";
    }
    if (!task.result.answer.empty()) {
        separate();
        block << trim(task.result.answer);
    }
    if (task.status == TaskStatus::FAILED) {
        std::string reason = task.result.error.empty() ? to_string(task.result.error_kind)
                                                       : task.result.error;
        separate();
        block << "> Execution failed: " << reason;
    }
    if (first) {
        block << "> No output recorded for task " << task.spec.id;
    }
    return block.str();
}

} // namespace

std::optional<int> find_question_number(const std::string& text) {
    static const std::regex named("\\b(?:question|task|problem|exercise)\\s*#?\\s*(\\d+)",
                                  std::regex::icase);
    static const std::regex listed("^\\s*(\\d+)\\s*[.)]");
    static const std::regex short_form("\\bQ(\\d+)\\b", std::regex::icase);

    for (const auto& line : FileUtils::split_lines(text)) {
        std::smatch match;
        if (std::regex_search(line, match, named) || std::regex_search(line, match, listed) ||
            std::regex_search(line, match, short_form)) {
            std::string digits = match[1].str();
            if (digits.size() > 6) {
                continue;
            }
            return std::stoi(digits);
        }
    }
    return std::nullopt;
}

ComposedDocument compose_document(const std::string& original,
                                  const std::vector<TaskRecord>& tasks,
                                  const std::vector<std::string>& ordering,
                                  const std::map<std::string, Insertion>& overrides,
                                  const std::string& link_prefix) {
    std::map<std::string, const TaskRecord*> by_id;
    for (const auto& task : tasks) {
        by_id[task.spec.id] = &task;
    }

    std::vector<const TaskRecord*> placed;
    if (ordering.empty()) {
        for (const auto& task : tasks) {
            placed.push_back(&task);
        }
    } else {
        std::set<std::string> seen;
        for (const auto& id : ordering) {
            auto it = by_id.find(id);
            if (it == by_id.end()) {
                throw ComposeError("unknown task '" + id + "' in ordering");
            }
            if (!seen.insert(id).second) {
                throw ComposeError("task '" + id + "' appears twice in ordering");
            }
            placed.push_back(it->second);
        }
    }
    for (const auto& entry : overrides) {
        if (!by_id.count(entry.first)) {
            throw ComposeError("unknown task '" + entry.first + "' in insertion overrides");
        }
    }

    ParsedDocument parsed = parse_paragraphs(original);
    std::map<size_t, std::vector<std::string>> anchored;
    std::vector<const TaskRecord*> trailing;
    ComposedDocument composed;

    for (const TaskRecord* task : placed) {
        if (!task->terminal()) {
            throw ComposeError("task '" + task->spec.id + "' is still " +
                               to_string(task->status));
        }
        auto override_it = overrides.find(task->spec.id);
        Insertion insertion = override_it != overrides.end() ? override_it->second
                                                             : task->insertion;
        if (insertion == Insertion::BELOW_QUESTION) {
            if (auto anchor = find_anchor(parsed.paragraphs, *task)) {
                anchored[*anchor].push_back(task_block(*task, link_prefix));
                continue;
            }
            composed.warnings.push_back("No anchor for task '" + task->spec.id +
                                        "', placed in the trailing section");
        }
        trailing.push_back(task);
    }

    std::string text = parsed.lead;
    for (size_t i = 0; i < parsed.paragraphs.size(); ++i) {
        const Paragraph& paragraph = parsed.paragraphs[i];
        text += paragraph.text;
        auto it = anchored.find(i);
        if (it != anchored.end()) {
            for (const auto& block : it->second) {
                text += "\n\n" + block;
            }
            if (paragraph.gap.find('\n') == std::string::npos) {
                text += "\n";
            }
        }
        text += paragraph.gap;
    }

    if (!trailing.empty()) {
        if (!text.empty()) {
            if (text.back() != '\n') {
                text += "\n";
            }
            text += "\n";
        }
        text += std::string(kTrailingHeading) + "\n";
        int number = 1;
        for (const TaskRecord* task : trailing) {
            std::string title = first_line(task->spec.question);
            if (title.empty()) {
                title = "Task " + task->spec.id;
            }
            text += "\n" + std::to_string(number++) + ") " + title + "\n\n" +
                    task_block(*task, link_prefix) + "\n";
        }
    }

    composed.text = std::move(text);
    return composed;
}

ReportComposer::ReportComposer(TaskStore& store, ArtifactStore& artifacts)
    : store_(store), artifacts_(artifacts) {}

ComposedDocument ReportComposer::compose(const std::string& batch_id,
                                         const std::vector<std::string>& ordering,
                                         const std::map<std::string, Insertion>& overrides) {
    auto batch = store_.get_batch(batch_id);
    if (!batch) {
        throw ComposeError("unknown batch " + batch_id);
    }
    auto tasks = store_.get_tasks(batch_id);
    if (aggregate_status(tasks) == BatchStatus::PENDING) {
        throw ComposeError("batch " + batch_id + " still has unfinished tasks");
    }

    // Reports live beside the artifacts, one directory below the root
    ComposedDocument composed = compose_document(batch->document, tasks, ordering, overrides,
                                                 "../");
    for (const auto& warning : composed.warnings) {
        std::cerr << "[Composer] " << batch_id << ": " << warning << std::endl;
    }
    composed.ref = artifacts_.put_content_addressed(batch_id, "report", "md", composed.text);
    std::cout << "[Composer] Composed " << composed.ref << std::endl;
    return composed;
}

} // namespace labshot
