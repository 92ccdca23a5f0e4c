#include "labshot/orchestrator.h"
#include "labshot/artifact_store.h"
#include "labshot/config.h"
#include "labshot/errors.h"
#include "file_utils.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>
#include <stdexcept>

namespace labshot {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string describe(const TaskKey& key) {
    return key.batch_id + "/" + key.task_id;
}

std::string file_stem(const std::string& path) {
    auto slash = path.rfind('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    return name.substr(0, name.find('.'));
}

// The file whose markup a browser shows for `route`
const ProjectFile& page_for_route(const std::string& route, const std::vector<ProjectFile>& files) {
    auto begin = route.find_first_not_of('/');
    std::string segment = begin == std::string::npos ? "" : lowercase(route.substr(begin));
    segment = segment.substr(0, segment.find('/'));
    if (!segment.empty()) {
        for (const auto& file : files) {
            if (lowercase(file_stem(file.path)) == segment) {
                return file;
            }
        }
    }
    for (const char* entry : {"app", "index", "main"}) {
        for (const auto& file : files) {
            if (lowercase(file_stem(file.path)) == entry) {
                return file;
            }
        }
    }
    for (const auto& file : files) {
        Language language = language_for_path(file.path, Language::REACT);
        if (language == Language::REACT || language == Language::HTML) {
            return file;
        }
    }
    return files.front();
}

void check_submission(const BatchSubmission& submission) {
    if (submission.tasks.empty()) {
        throw InvalidBatchError("a batch needs at least one task");
    }
    if (submission.theme != "auto" && !submission.theme.empty()) {
        try {
            parse_theme(submission.theme);
        } catch (const UnknownThemeError& e) {
            throw InvalidBatchError(e.what());
        }
    }

    std::set<std::string> ids;
    for (const auto& spec : submission.tasks) {
        if (spec.id.empty()) {
            throw InvalidBatchError("task id must not be empty");
        }
        if (!FileUtils::is_safe_identifier(spec.id)) {
            throw InvalidBatchError("task id '" + spec.id + "' must match [A-Za-z0-9._-]{1,64}");
        }
        if (!ids.insert(spec.id).second) {
            throw InvalidBatchError("duplicate task id '" + spec.id + "'");
        }

        switch (spec.kind) {
            case TaskKind::CODE_EXECUTION:
            case TaskKind::SCREENSHOT_ONLY:
                if (spec.source.empty()) {
                    throw InvalidBatchError("task '" + spec.id + "' has no source code");
                }
                break;
            case TaskKind::ANSWER_REQUEST:
                if (spec.question.empty()) {
                    throw InvalidBatchError("task '" + spec.id + "' has no question");
                }
                break;
            case TaskKind::PROJECT_MULTI_FILE:
                if (spec.files.empty()) {
                    throw InvalidBatchError("project task '" + spec.id + "' has no files");
                }
                for (const auto& file : spec.files) {
                    try {
                        FileUtils::sanitize_relative_path(file.path);
                    } catch (const std::invalid_argument& e) {
                        throw InvalidBatchError("task '" + spec.id + "': " + e.what());
                    }
                }
                for (const auto& route : spec.routes) {
                    if (route.empty() || route[0] != '/') {
                        throw InvalidBatchError("task '" + spec.id + "': route '" + route +
                                                "' must start with '/'");
                    }
                }
                break;
        }
    }
}

ErrorKind error_kind_for(const ExecutionResult& execution) {
    switch (execution.status) {
        case ExecutionStatus::COMPLETED: return ErrorKind::NONE;
        case ExecutionStatus::TIMED_OUT: return ErrorKind::EXECUTION_TIMED_OUT;
        case ExecutionStatus::CRASHED: return ErrorKind::EXECUTION_CRASHED;
    }
    return ErrorKind::EXECUTION_CRASHED;
}

} // namespace

std::optional<BatchStatusReport> load_status_report(TaskStore& store, const std::string& batch_id) {
    auto batch = store.get_batch(batch_id);
    if (!batch) {
        return std::nullopt;
    }
    BatchStatusReport report;
    report.batch_id = batch_id;
    report.cancelled = batch->cancelled;
    report.tasks = store.get_tasks(batch_id);
    report.aggregate = aggregate_status(report.tasks);
    return report;
}

std::optional<size_t> cancel_pending(TaskStore& store, const std::string& batch_id) {
    if (!store.mark_cancelled(batch_id)) {
        return std::nullopt;
    }
    TaskResult cancelled;
    cancelled.exit_code = -1;
    cancelled.error_kind = ErrorKind::CANCELLED;
    cancelled.error = "cancelled";

    size_t skipped = 0;
    for (const auto& task : store.get_tasks(batch_id)) {
        if (task.status != TaskStatus::PENDING) {
            continue;
        }
        // A lost race means a worker claimed it first; that run finishes
        if (!store.transition(batch_id, task.spec.id, TaskStatus::PENDING, TaskStatus::RUNNING)) {
            continue;
        }
        if (store.transition(batch_id, task.spec.id, TaskStatus::RUNNING, TaskStatus::FAILED,
                             &cancelled)) {
            skipped++;
        }
    }
    return skipped;
}

OrchestratorOptions OrchestratorOptions::from_config(const Config& config) {
    OrchestratorOptions options;
    options.workers = config.workers;
    options.limits = config.execution_limits();
    options.max_source_length = config.max_source_length;
    options.default_routes = config.default_routes;
    return options;
}

JobOrchestrator::JobOrchestrator(TaskStore& store, SandboxExecutor& executor,
                                 ArtifactRenderer& renderer, TextService& text,
                                 OrchestratorOptions options)
    : store_(store),
      executor_(executor),
      renderer_(renderer),
      text_(text),
      options_(std::move(options)),
      validator_(options_.max_source_length) {
    if (options_.workers == 0) {
        options_.workers = 1;
    }
}

JobOrchestrator::~JobOrchestrator() {
    stop();
}

void JobOrchestrator::start() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (started_) {
            return;
        }
        started_ = true;
        stopping_ = false;
    }

    // A task still running at startup belonged to a process that died
    for (const auto& key : store_.find_tasks(TaskStatus::RUNNING)) {
        std::cerr << "[Orchestrator] Recovering interrupted task " << describe(key) << std::endl;
        fail_task(key, TaskStatus::RUNNING, ErrorKind::INTERRUPTED,
                  "Interrupted before completion");
    }

    auto pending = store_.find_tasks(TaskStatus::PENDING);
    for (const auto& key : pending) {
        enqueue(key);
    }

    for (size_t i = 0; i < options_.workers; ++i) {
        workers_.emplace_back(&JobOrchestrator::worker_loop, this, i);
    }
    std::cout << "[Orchestrator] Started " << options_.workers << " workers, "
              << pending.size() << " pending tasks re-enqueued" << std::endl;
}

void JobOrchestrator::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!started_) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        started_ = false;
        queue_.clear();
    }
    std::cout << "[Orchestrator] Stopped" << std::endl;
}

size_t JobOrchestrator::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return queue_.size();
}

bool JobOrchestrator::running() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return started_ && !stopping_;
}

void JobOrchestrator::enqueue(const TaskKey& key) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(key);
    }
    queue_cv_.notify_one();
}

void JobOrchestrator::notify_progress() {
    {
        std::lock_guard<std::mutex> lock(progress_mutex_);
    }
    progress_cv_.notify_all();
}

void JobOrchestrator::worker_loop(size_t index) {
    while (true) {
        TaskKey key;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (stopping_) {
                return;
            }
            key = queue_.front();
            queue_.pop_front();
        }

        try {
            process(key);
        } catch (const std::exception& e) {
            // Persistence failed mid-task; the task stays running and is
            // recovered as interrupted on the next start
            std::cerr << "[Orchestrator] Worker " << index << " lost task " << describe(key)
                      << ": " << e.what() << std::endl;
        }
        notify_progress();
    }
}

std::string JobOrchestrator::submit_batch(const BatchSubmission& submission) {
    check_submission(submission);

    BatchRecord batch;
    batch.id = "b-" + FileUtils::random_hex(8);
    batch.owner_ref = submission.owner_ref;
    batch.theme = submission.theme.empty() ? "auto" : submission.theme;
    batch.default_insertion = submission.default_insertion;
    batch.document = submission.document;
    batch.created_at = now_ms();

    std::vector<TaskRecord> tasks;
    tasks.reserve(submission.tasks.size());
    for (size_t i = 0; i < submission.tasks.size(); ++i) {
        TaskRecord task;
        task.batch_id = batch.id;
        task.ordinal = static_cast<int>(i);
        task.spec = submission.tasks[i];
        task.theme = resolve_theme(batch.theme, task.spec.language);
        task.insertion = task.spec.insertion.value_or(batch.default_insertion);
        tasks.push_back(std::move(task));
    }

    store_.create_batch(batch, tasks);
    std::cout << "[Orchestrator] Accepted batch " << batch.id << " with " << tasks.size()
              << " tasks (theme " << batch.theme << ")" << std::endl;

    for (const auto& task : tasks) {
        enqueue({batch.id, task.spec.id});
    }
    return batch.id;
}

std::optional<BatchStatusReport> JobOrchestrator::get_batch_status(const std::string& batch_id) {
    return load_status_report(store_, batch_id);
}

std::vector<BatchRecord> JobOrchestrator::list_batches(const std::string& owner_ref) {
    return store_.list_batches(owner_ref);
}

bool JobOrchestrator::cancel_batch(const std::string& batch_id) {
    auto skipped = cancel_pending(store_, batch_id);
    if (!skipped) {
        return false;
    }
    std::cout << "[Orchestrator] Cancelled batch " << batch_id << ", " << *skipped
              << " pending tasks skipped" << std::endl;
    notify_progress();
    return true;
}

bool JobOrchestrator::wait_for_batch(const std::string& batch_id,
                                     std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(progress_mutex_);
    while (true) {
        auto report = get_batch_status(batch_id);
        if (!report) {
            return false;
        }
        if (report->aggregate != BatchStatus::PENDING) {
            return true;
        }
        if (progress_cv_.wait_until(lock, deadline) == std::cv_status::timeout) {
            report = get_batch_status(batch_id);
            return report && report->aggregate != BatchStatus::PENDING;
        }
    }
}

std::optional<TaskRecord> JobOrchestrator::run_task(const std::string& batch_id,
                                                    const std::string& task_id) {
    auto task = store_.get_task(batch_id, task_id);
    if (!task) {
        return std::nullopt;
    }
    if (!task->terminal()) {
        if (task->status == TaskStatus::PENDING) {
            process({batch_id, task_id});
            notify_progress();
        }
        // Claimed by a worker; wait for it to land
        std::unique_lock<std::mutex> lock(progress_mutex_);
        while (true) {
            task = store_.get_task(batch_id, task_id);
            if (!task || task->terminal()) {
                break;
            }
            progress_cv_.wait_for(lock, std::chrono::milliseconds(200));
        }
    }
    return task;
}

void JobOrchestrator::fail_task(const TaskKey& key, TaskStatus from, ErrorKind kind,
                                const std::string& error) {
    TaskResult result;
    result.exit_code = -1;
    result.error_kind = kind;
    result.error = error;
    if (store_.transition(key.batch_id, key.task_id, from, TaskStatus::FAILED, &result)) {
        std::cout << "[Orchestrator] " << describe(key) << " -> failed (" << to_string(kind)
                  << ")" << std::endl;
    }
}

bool JobOrchestrator::process(const TaskKey& key) {
    auto task = store_.get_task(key.batch_id, key.task_id);
    if (!task) {
        std::cerr << "[Orchestrator] Unknown task " << describe(key) << std::endl;
        return false;
    }
    if (task->status != TaskStatus::PENDING) {
        return false;
    }
    if (!store_.transition(key.batch_id, key.task_id, TaskStatus::PENDING, TaskStatus::RUNNING)) {
        return false;
    }
    std::cout << "[Orchestrator] " << describe(key) << " -> running (" << to_string(task->spec.kind)
              << ", " << language_name(task->spec.language) << ")" << std::endl;

    auto batch = store_.get_batch(key.batch_id);
    if (!batch || batch->cancelled) {
        fail_task(key, TaskStatus::RUNNING, ErrorKind::CANCELLED, "cancelled");
        return true;
    }

    TaskResult result;
    try {
        result = execute_task(*task);
    } catch (const StoreError&) {
        throw;
    } catch (const std::exception& e) {
        result = TaskResult{};
        result.exit_code = -1;
        result.error_kind = ErrorKind::EXECUTION_CRASHED;
        result.error = std::string("Internal error: ") + e.what();
    }

    TaskStatus to = result.error_kind == ErrorKind::NONE ? TaskStatus::COMPLETED
                                                         : TaskStatus::FAILED;
    if (!store_.transition(key.batch_id, key.task_id, TaskStatus::RUNNING, to, &result)) {
        std::cerr << "[Orchestrator] " << describe(key) << " changed state while running"
                  << std::endl;
        return false;
    }
    std::cout << "[Orchestrator] " << describe(key) << " -> " << to_string(to);
    if (result.error_kind != ErrorKind::NONE) {
        std::cout << " (" << to_string(result.error_kind) << ": " << result.error << ")";
    }
    std::cout << std::endl;
    return true;
}

TaskResult JobOrchestrator::execute_task(const TaskRecord& task) {
    switch (task.spec.kind) {
        case TaskKind::CODE_EXECUTION: return run_code(task);
        case TaskKind::ANSWER_REQUEST: return run_answer(task);
        case TaskKind::SCREENSHOT_ONLY: return run_screenshot(task);
        case TaskKind::PROJECT_MULTI_FILE: return run_project(task);
    }
    throw std::logic_error("unhandled task kind");
}

bool JobOrchestrator::render_into(TaskResult& result, const TaskRecord& task,
                                  const RenderContent& content, Language language,
                                  RenderKind kind) {
    std::string key = ArtifactStore::artifact_key(task.batch_id, task.spec.id,
                                                  result.artifacts.size());
    try {
        result.artifacts.push_back(renderer_.render(content, language, task.theme, kind, key));
        return true;
    } catch (const std::exception& e) {
        std::cerr << "[Orchestrator] Rendering " << key << " failed: " << e.what() << std::endl;
        if (result.error_kind == ErrorKind::NONE) {
            result.error_kind = ErrorKind::RENDER_FAILURE;
            result.error = e.what();
        } else {
            result.error += "; render failed: " + std::string(e.what());
        }
        return false;
    }
}

TaskResult JobOrchestrator::run_code(const TaskRecord& task) {
    TaskResult result;
    const TaskSpec& spec = task.spec;

    ValidationResult verdict = validator_.validate(spec.source, spec.language);
    if (!verdict.accepted) {
        result.exit_code = -1;
        result.error_kind = ErrorKind::VALIDATION_REJECTED;
        result.error = verdict.reason;
        return result;
    }

    if (!is_executable(spec.language)) {
        // Markup renders as source plus the page it produces
        RenderContent content;
        content.filename = spec.filename;
        content.code = spec.source;
        content.route = "/";
        if (render_into(result, task, content, spec.language, RenderKind::CODE)) {
            render_into(result, task, content, spec.language, RenderKind::BROWSER);
        }
        result.caption = text_.caption(spec.kind, spec.source, "", 0);
        return result;
    }

    ExecutionResult execution = executor_.execute(spec.source, spec.language, options_.limits);
    result.stdout_output = execution.stdout_output;
    result.stderr_output = execution.stderr_output;
    result.exit_code = execution.exit_code;
    result.error_kind = error_kind_for(execution);
    if (result.error_kind != ErrorKind::NONE) {
        result.error = !execution.error_message.empty()
                           ? execution.error_message
                           : "Exited with code " + std::to_string(execution.exit_code);
    }

    RenderContent content;
    content.filename = spec.filename;
    content.code = spec.source;
    content.stdout_text = execution.stdout_output;
    content.stderr_text = execution.stderr_output;
    if (execution.timed_out()) {
        if (!content.stderr_text.empty() && content.stderr_text.back() != '\n') {
            content.stderr_text += '\n';
        }
        content.stderr_text += execution.error_message;
    }
    content.exit_code = execution.exit_code;

    if (render_into(result, task, content, spec.language, RenderKind::COMBINED)) {
        for (const auto& file : execution.output_files) {
            RenderContent preview;
            preview.filename = file.name;
            preview.code = file.content;
            if (!render_into(result, task, preview, spec.language, RenderKind::FILE)) {
                break;
            }
        }
    }

    result.caption = text_.caption(spec.kind, spec.source, execution.stdout_output,
                                   execution.exit_code);
    return result;
}

TaskResult JobOrchestrator::run_answer(const TaskRecord& task) {
    TaskResult result;
    try {
        result.answer = text_.answer(task.spec.question);
    } catch (const UpstreamError& e) {
        result.exit_code = -1;
        result.error_kind = ErrorKind::UPSTREAM_SERVICE_FAILURE;
        result.error = e.what();
        return result;
    }
    if (!task.spec.source.empty()) {
        // Code quoted alongside the answer is shown, not run
        RenderContent content;
        content.filename = task.spec.filename;
        content.code = task.spec.source;
        render_into(result, task, content, task.spec.language, RenderKind::CODE);
    }
    return result;
}

TaskResult JobOrchestrator::run_screenshot(const TaskRecord& task) {
    TaskResult result;
    const TaskSpec& spec = task.spec;

    ValidationResult verdict = validator_.validate(spec.source, spec.language);
    if (!verdict.accepted) {
        result.exit_code = -1;
        result.error_kind = ErrorKind::VALIDATION_REJECTED;
        result.error = verdict.reason;
        return result;
    }

    RenderContent content;
    content.filename = spec.filename;
    content.code = spec.source;
    render_into(result, task, content, spec.language, RenderKind::CODE);
    result.caption = text_.caption(spec.kind, spec.source, "", 0);
    return result;
}

TaskResult JobOrchestrator::run_project(const TaskRecord& task) {
    TaskResult result;
    const TaskSpec& spec = task.spec;

    std::vector<ProjectFile> files;
    for (const auto& file : spec.files) {
        std::string path = FileUtils::sanitize_relative_path(file.path);
        Language language = language_for_path(path, spec.language);
        ValidationResult verdict = validator_.validate(file.content, language);
        if (!verdict.accepted) {
            result.exit_code = -1;
            result.error_kind = ErrorKind::VALIDATION_REJECTED;
            result.error = path + ": " + verdict.reason;
            return result;
        }
        files.push_back({path, file.content});
    }

    for (const auto& file : files) {
        RenderContent content;
        content.filename = file.path;
        content.code = file.content;
        if (!render_into(result, task, content, language_for_path(file.path, spec.language),
                         RenderKind::CODE)) {
            return result;
        }
    }

    const auto& routes = spec.routes.empty() ? options_.default_routes : spec.routes;
    for (const auto& route : routes) {
        const ProjectFile& page = page_for_route(route, files);
        Language language = language_for_path(page.path, spec.language);
        RenderContent content;
        content.filename = page.path;
        content.code = page.content;
        content.route = route;
        if (!render_into(result, task, content,
                         language == Language::HTML ? Language::HTML : Language::REACT,
                         RenderKind::BROWSER)) {
            return result;
        }
    }

    result.caption = text_.caption(spec.kind, "", "", 0, routes.size());
    return result;
}

} // namespace labshot
