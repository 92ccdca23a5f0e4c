#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "labshot/task.h"

namespace labshot {

class TaskStore;
class ArtifactStore;

struct ComposedDocument {
    std::string text;                   // Markdown
    std::vector<std::string> warnings;  // Anchors that fell back to the trailing section
    std::string ref;                    // Storage key, set by ReportComposer
};

// Task number named by "Question 3", "Task 3", "3.", "3)", "Q3" and the
// like. nullopt when the text names none.
std::optional<int> find_question_number(const std::string& text);

// Inserts each task's artifacts and text into `original`. An empty
// `ordering` means submission order; otherwise only the listed tasks are
// placed, in that order. Throws ComposeError for unknown or repeated ids
// and for tasks that are not terminal. Paragraphs of `original` are
// copied byte for byte.
ComposedDocument compose_document(const std::string& original,
                                  const std::vector<TaskRecord>& tasks,
                                  const std::vector<std::string>& ordering,
                                  const std::map<std::string, Insertion>& overrides = {},
                                  const std::string& link_prefix = "");

// Composes a stored batch against its stored document and writes the
// result content-addressed next to the batch's artifacts
class ReportComposer {
public:
    ReportComposer(TaskStore& store, ArtifactStore& artifacts);

    ComposedDocument compose(const std::string& batch_id,
                             const std::vector<std::string>& ordering,
                             const std::map<std::string, Insertion>& overrides = {});

private:
    TaskStore& store_;
    ArtifactStore& artifacts_;
};

} // namespace labshot
