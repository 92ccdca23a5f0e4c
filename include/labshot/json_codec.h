#pragma once

#include <string>

#include <json/json.h>

#include "labshot/composer.h"
#include "labshot/orchestrator.h"
#include "labshot/task.h"

namespace labshot {

// Batch description as handed over by the parsing collaborator. Throws
// InvalidBatchError for malformed JSON, unknown kinds or languages, or
// wrong-typed fields.
BatchSubmission parse_batch(const std::string& json_text);
BatchSubmission parse_batch(const Json::Value& root);

Json::Value to_json(const TaskRecord& task);
Json::Value to_json(const BatchStatusReport& report);
Json::Value to_json(const BatchRecord& batch);
Json::Value to_json(const ComposedDocument& composed);

// Pretty-printed with two-space indentation
std::string to_json_string(const Json::Value& value);

} // namespace labshot
