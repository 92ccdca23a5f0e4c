#include "labshot/json_codec.h"
#include "labshot/errors.h"

#include <sstream>
#include <stdexcept>

namespace labshot {

namespace {

std::string optional_string(const Json::Value& object, const char* key,
                            const std::string& context) {
    if (!object.isMember(key) || object[key].isNull()) {
        return "";
    }
    if (!object[key].isString()) {
        throw InvalidBatchError(context + ": '" + key + "' must be a string");
    }
    return object[key].asString();
}

Insertion insertion_field(const std::string& name, const std::string& context) {
    try {
        return parse_insertion(name);
    } catch (const std::invalid_argument& e) {
        throw InvalidBatchError(context + ": " + e.what());
    }
}

TaskSpec parse_task(const Json::Value& item, size_t index) {
    std::string context = "task #" + std::to_string(index + 1);
    if (!item.isObject()) {
        throw InvalidBatchError(context + " must be an object");
    }

    TaskSpec spec;
    spec.id = optional_string(item, "id", context);
    if (!spec.id.empty()) {
        context = "task '" + spec.id + "'";
    }

    std::string kind = optional_string(item, "kind", context);
    try {
        spec.kind = parse_task_kind(kind.empty() ? "code_execution" : kind);
        std::string language = optional_string(item, "language", context);
        spec.language = parse_language(language.empty() ? "python" : language);
    } catch (const std::invalid_argument& e) {
        throw InvalidBatchError(context + ": " + e.what());
    }

    spec.source = optional_string(item, "source", context);
    spec.question = optional_string(item, "question", context);
    spec.filename = optional_string(item, "filename", context);

    std::string insertion = optional_string(item, "insertion", context);
    if (!insertion.empty()) {
        spec.insertion = insertion_field(insertion, context);
    }

    if (item.isMember("files")) {
        if (!item["files"].isArray()) {
            throw InvalidBatchError(context + ": 'files' must be an array");
        }
        for (const auto& file : item["files"]) {
            if (!file.isObject()) {
                throw InvalidBatchError(context + ": each file must be an object");
            }
            spec.files.push_back({optional_string(file, "path", context),
                                  optional_string(file, "content", context)});
        }
    }

    if (item.isMember("routes")) {
        if (!item["routes"].isArray()) {
            throw InvalidBatchError(context + ": 'routes' must be an array");
        }
        for (const auto& route : item["routes"]) {
            if (!route.isString()) {
                throw InvalidBatchError(context + ": routes must be strings");
            }
            spec.routes.push_back(route.asString());
        }
    }
    return spec;
}

} // namespace

BatchSubmission parse_batch(const Json::Value& root) {
    if (!root.isObject()) {
        throw InvalidBatchError("batch must be a JSON object");
    }

    BatchSubmission submission;
    submission.owner_ref = optional_string(root, "owner_ref", "batch");
    std::string theme = optional_string(root, "theme", "batch");
    submission.theme = theme.empty() ? "auto" : theme;
    submission.document = optional_string(root, "document", "batch");

    std::string insertion = optional_string(root, "default_insertion", "batch");
    if (!insertion.empty()) {
        submission.default_insertion = insertion_field(insertion, "batch");
    }

    if (!root.isMember("tasks") || !root["tasks"].isArray()) {
        throw InvalidBatchError("batch needs a 'tasks' array");
    }
    const Json::Value& tasks = root["tasks"];
    for (Json::ArrayIndex i = 0; i < tasks.size(); ++i) {
        submission.tasks.push_back(parse_task(tasks[i], i));
    }
    return submission;
}

BatchSubmission parse_batch(const std::string& json_text) {
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(json_text);
    if (!Json::parseFromStream(builder, stream, &root, &errors)) {
        throw InvalidBatchError("malformed JSON: " + errors);
    }
    return parse_batch(root);
}

Json::Value to_json(const TaskRecord& task) {
    Json::Value json;
    json["id"] = task.spec.id;
    json["kind"] = to_string(task.spec.kind);
    json["language"] = language_name(task.spec.language);
    json["theme"] = theme_name(task.theme);
    json["insertion"] = to_string(task.insertion);
    json["status"] = to_string(task.status);
    json["updated_at"] = static_cast<Json::Int64>(task.updated_at);

    if (task.terminal()) {
        json["stdout"] = task.result.stdout_output;
        json["stderr"] = task.result.stderr_output;
        json["exit_code"] = task.result.exit_code;
        json["caption"] = task.result.caption;
        if (!task.result.answer.empty()) {
            json["answer"] = task.result.answer;
        }
        Json::Value artifacts(Json::arrayValue);
        for (const auto& artifact : task.result.artifacts) {
            Json::Value item;
            item["ref"] = artifact.ref;
            item["label"] = artifact.label;
            item["kind"] = artifact.kind;
            item["sha256"] = artifact.digest;
            artifacts.append(item);
        }
        json["artifacts"] = artifacts;
    }
    if (task.result.error_kind != ErrorKind::NONE) {
        json["error_kind"] = to_string(task.result.error_kind);
        json["error"] = task.result.error;
    }
    return json;
}

Json::Value to_json(const BatchStatusReport& report) {
    Json::Value json;
    json["batch_id"] = report.batch_id;
    json["status"] = to_string(report.aggregate);
    json["cancelled"] = report.cancelled;
    Json::Value tasks(Json::arrayValue);
    for (const auto& task : report.tasks) {
        tasks.append(to_json(task));
    }
    json["tasks"] = tasks;
    return json;
}

Json::Value to_json(const BatchRecord& batch) {
    Json::Value json;
    json["id"] = batch.id;
    json["owner_ref"] = batch.owner_ref;
    json["theme"] = batch.theme;
    json["default_insertion"] = to_string(batch.default_insertion);
    json["cancelled"] = batch.cancelled;
    json["created_at"] = static_cast<Json::Int64>(batch.created_at);
    return json;
}

Json::Value to_json(const ComposedDocument& composed) {
    Json::Value json;
    json["ref"] = composed.ref;
    Json::Value warnings(Json::arrayValue);
    for (const auto& warning : composed.warnings) {
        warnings.append(warning);
    }
    json["warnings"] = warnings;
    return json;
}

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, value);
}

} // namespace labshot
