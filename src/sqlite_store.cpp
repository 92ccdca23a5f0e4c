#include "labshot/sqlite_store.h"
#include "labshot/errors.h"

#include <json/json.h>
#include <sqlite3.h>

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace labshot {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string compact_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parse_json(const std::string& text) {
    Json::Value value;
    if (text.empty()) {
        return value;
    }
    Json::CharReaderBuilder builder;
    std::string errors;
    std::istringstream stream(text);
    if (!Json::parseFromStream(builder, stream, &value, &errors)) {
        throw StoreError("corrupt JSON column: " + errors);
    }
    return value;
}

std::string files_to_json(const std::vector<ProjectFile>& files) {
    Json::Value array(Json::arrayValue);
    for (const auto& file : files) {
        Json::Value item;
        item["path"] = file.path;
        item["content"] = file.content;
        array.append(item);
    }
    return compact_json(array);
}

std::vector<ProjectFile> files_from_json(const std::string& text) {
    std::vector<ProjectFile> files;
    for (const auto& item : parse_json(text)) {
        files.push_back({item["path"].asString(), item["content"].asString()});
    }
    return files;
}

std::string routes_to_json(const std::vector<std::string>& routes) {
    Json::Value array(Json::arrayValue);
    for (const auto& route : routes) {
        array.append(route);
    }
    return compact_json(array);
}

std::vector<std::string> routes_from_json(const std::string& text) {
    std::vector<std::string> routes;
    for (const auto& item : parse_json(text)) {
        routes.push_back(item.asString());
    }
    return routes;
}

const char* kTaskColumns =
    "batch_id, task_id, ordinal, kind, language, theme, insertion, explicit_insertion, "
    "source, question, filename, files_json, routes_json, status, stdout, stderr, "
    "exit_code, caption, answer, error_kind, error, updated_at";

} // namespace

void SqliteTaskStore::DbDeleter::operator()(sqlite3* db) const {
    if (db) {
        sqlite3_close(db);
    }
}

class SqliteTaskStore::Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    // true while rows remain
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    std::string text(int column) const {
        const unsigned char* value = sqlite3_column_text(stmt_, column);
        if (!value) {
            return "";
        }
        return std::string(reinterpret_cast<const char*>(value),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, column)));
    }

    int64_t integer(int column) const { return sqlite3_column_int64(stmt_, column); }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

namespace {

// Rolls back unless committed
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) { exec("BEGIN IMMEDIATE"); }

    ~Transaction() {
        if (!committed_) {
            char* error = nullptr;
            if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, &error) != SQLITE_OK) {
                std::cerr << "[Store] Rollback failed: " << (error ? error : "unknown")
                          << std::endl;
            }
            sqlite3_free(error);
        }
    }

    void commit() {
        exec("COMMIT");
        committed_ = true;
    }

private:
    void exec(const char* sql) {
        char* error = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &error) != SQLITE_OK) {
            std::string message = error ? error : "unknown";
            sqlite3_free(error);
            throw StoreError(std::string(sql) + " failed: " + message);
        }
    }

    sqlite3* db_;
    bool committed_ = false;
};

} // namespace

SqliteTaskStore::SqliteTaskStore(const std::string& path) : path_(path) {
    sqlite3* raw = nullptr;
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &raw, flags, nullptr) != SQLITE_OK) {
        std::string message = raw ? sqlite3_errmsg(raw) : "out of memory";
        if (raw) {
            sqlite3_close(raw);
        }
        throw StoreError("cannot open " + path + ": " + message);
    }
    db_.reset(raw);

    if (sqlite3_busy_timeout(db_.get(), 5000) != SQLITE_OK) {
        std::cerr << "[Store] Could not set busy timeout" << std::endl;
    }
    try {
        execute("PRAGMA journal_mode=WAL;");
    } catch (const StoreError& e) {
        std::cerr << "[Store] WAL unavailable: " << e.what() << std::endl;
    }
    execute("PRAGMA foreign_keys=ON;");
    create_tables();

    Statement stmt(db_.get(), "SELECT COALESCE(MAX(updated_at), 0) FROM tasks");
    if (stmt.step()) {
        last_timestamp_ = stmt.integer(0);
    }
    std::cout << "[Store] Opened " << path_ << std::endl;
}

SqliteTaskStore::~SqliteTaskStore() = default;

void SqliteTaskStore::execute(const char* sql) {
    char* error = nullptr;
    if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown";
        sqlite3_free(error);
        throw StoreError(message);
    }
}

void SqliteTaskStore::create_tables() {
    execute(R"(
        CREATE TABLE IF NOT EXISTS batches (
            id TEXT PRIMARY KEY,
            owner_ref TEXT NOT NULL DEFAULT '',
            theme TEXT NOT NULL DEFAULT '',
            default_insertion TEXT NOT NULL,
            document TEXT NOT NULL DEFAULT '',
            cancelled INTEGER NOT NULL DEFAULT 0,
            created_at INTEGER NOT NULL
        );

        CREATE TABLE IF NOT EXISTS tasks (
            batch_id TEXT NOT NULL REFERENCES batches(id),
            task_id TEXT NOT NULL,
            ordinal INTEGER NOT NULL,
            kind TEXT NOT NULL,
            language TEXT NOT NULL,
            theme TEXT NOT NULL,
            insertion TEXT NOT NULL,
            explicit_insertion TEXT NOT NULL DEFAULT '',
            source TEXT NOT NULL DEFAULT '',
            question TEXT NOT NULL DEFAULT '',
            filename TEXT NOT NULL DEFAULT '',
            files_json TEXT NOT NULL DEFAULT '[]',
            routes_json TEXT NOT NULL DEFAULT '[]',
            status TEXT NOT NULL DEFAULT 'pending',
            stdout TEXT NOT NULL DEFAULT '',
            stderr TEXT NOT NULL DEFAULT '',
            exit_code INTEGER NOT NULL DEFAULT 0,
            caption TEXT NOT NULL DEFAULT '',
            answer TEXT NOT NULL DEFAULT '',
            error_kind TEXT NOT NULL DEFAULT '',
            error TEXT NOT NULL DEFAULT '',
            updated_at INTEGER NOT NULL,
            PRIMARY KEY (batch_id, task_id)
        );

        CREATE TABLE IF NOT EXISTS artifacts (
            batch_id TEXT NOT NULL,
            task_id TEXT NOT NULL,
            idx INTEGER NOT NULL,
            ref TEXT NOT NULL,
            label TEXT NOT NULL DEFAULT '',
            kind TEXT NOT NULL DEFAULT '',
            digest TEXT NOT NULL DEFAULT '',
            PRIMARY KEY (batch_id, task_id, idx),
            FOREIGN KEY (batch_id, task_id) REFERENCES tasks(batch_id, task_id)
        );

        CREATE INDEX IF NOT EXISTS idx_tasks_status ON tasks(status);
        CREATE INDEX IF NOT EXISTS idx_batches_owner ON batches(owner_ref);
    )");
}

int64_t SqliteTaskStore::next_timestamp() {
    int64_t now = now_ms();
    last_timestamp_ = now > last_timestamp_ ? now : last_timestamp_ + 1;
    return last_timestamp_;
}

void SqliteTaskStore::create_batch(const BatchRecord& batch, const std::vector<TaskRecord>& tasks) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_.get());

    Statement insert_batch(db_.get(),
        "INSERT INTO batches (id, owner_ref, theme, default_insertion, document, cancelled, "
        "created_at) VALUES (?, ?, ?, ?, ?, 0, ?)");
    insert_batch.bind(1, batch.id)
        .bind(2, batch.owner_ref)
        .bind(3, batch.theme)
        .bind(4, to_string(batch.default_insertion))
        .bind(5, batch.document)
        .bind(6, batch.created_at ? batch.created_at : now_ms());
    insert_batch.step();

    for (const auto& task : tasks) {
        Statement insert_task(db_.get(),
            "INSERT INTO tasks (batch_id, task_id, ordinal, kind, language, theme, insertion, "
            "explicit_insertion, source, question, filename, files_json, routes_json, status, "
            "updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'pending', ?)");
        insert_task.bind(1, batch.id)
            .bind(2, task.spec.id)
            .bind(3, static_cast<int64_t>(task.ordinal))
            .bind(4, to_string(task.spec.kind))
            .bind(5, language_name(task.spec.language))
            .bind(6, theme_name(task.theme))
            .bind(7, to_string(task.insertion))
            .bind(8, task.spec.insertion ? to_string(*task.spec.insertion) : std::string())
            .bind(9, task.spec.source)
            .bind(10, task.spec.question)
            .bind(11, task.spec.filename)
            .bind(12, files_to_json(task.spec.files))
            .bind(13, routes_to_json(task.spec.routes))
            .bind(14, next_timestamp());
        insert_task.step();
    }

    tx.commit();
}

std::optional<BatchRecord> SqliteTaskStore::get_batch(const std::string& batch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_.get(),
        "SELECT id, owner_ref, theme, default_insertion, document, cancelled, created_at "
        "FROM batches WHERE id = ?");
    stmt.bind(1, batch_id);
    if (!stmt.step()) {
        return std::nullopt;
    }
    BatchRecord batch;
    batch.id = stmt.text(0);
    batch.owner_ref = stmt.text(1);
    batch.theme = stmt.text(2);
    batch.default_insertion = parse_insertion(stmt.text(3));
    batch.document = stmt.text(4);
    batch.cancelled = stmt.integer(5) != 0;
    batch.created_at = stmt.integer(6);
    return batch;
}

std::vector<BatchRecord> SqliteTaskStore::list_batches(const std::string& owner_ref) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Statement stmt(db_.get(),
            "SELECT id FROM batches WHERE owner_ref = ? ORDER BY created_at, id");
        stmt.bind(1, owner_ref);
        while (stmt.step()) {
            ids.push_back(stmt.text(0));
        }
    }
    std::vector<BatchRecord> batches;
    for (const auto& id : ids) {
        if (auto batch = get_batch(id)) {
            batches.push_back(std::move(*batch));
        }
    }
    return batches;
}

std::vector<TaskRecord> SqliteTaskStore::query_tasks(const std::string& batch_id,
                                                     const std::string* task_id) {
    std::string sql = std::string("SELECT ") + kTaskColumns +
                      " FROM tasks WHERE batch_id = ?" +
                      (task_id ? " AND task_id = ?" : "") + " ORDER BY ordinal";
    Statement stmt(db_.get(), sql);
    stmt.bind(1, batch_id);
    if (task_id) {
        stmt.bind(2, *task_id);
    }

    std::vector<TaskRecord> tasks;
    while (stmt.step()) {
        TaskRecord task;
        task.batch_id = stmt.text(0);
        task.spec.id = stmt.text(1);
        task.ordinal = static_cast<int>(stmt.integer(2));
        task.spec.kind = parse_task_kind(stmt.text(3));
        task.spec.language = parse_language(stmt.text(4));
        task.theme = parse_theme(stmt.text(5));
        task.insertion = parse_insertion(stmt.text(6));
        std::string explicit_insertion = stmt.text(7);
        if (!explicit_insertion.empty()) {
            task.spec.insertion = parse_insertion(explicit_insertion);
        }
        task.spec.source = stmt.text(8);
        task.spec.question = stmt.text(9);
        task.spec.filename = stmt.text(10);
        task.spec.files = files_from_json(stmt.text(11));
        task.spec.routes = routes_from_json(stmt.text(12));
        task.status = parse_task_status(stmt.text(13));
        task.result.stdout_output = stmt.text(14);
        task.result.stderr_output = stmt.text(15);
        task.result.exit_code = static_cast<int>(stmt.integer(16));
        task.result.caption = stmt.text(17);
        task.result.answer = stmt.text(18);
        task.result.error_kind = parse_error_kind(stmt.text(19));
        task.result.error = stmt.text(20);
        task.updated_at = stmt.integer(21);
        tasks.push_back(std::move(task));
    }

    for (auto& task : tasks) {
        load_artifacts(task);
    }
    return tasks;
}

void SqliteTaskStore::load_artifacts(TaskRecord& task) {
    Statement stmt(db_.get(),
        "SELECT ref, label, kind, digest FROM artifacts WHERE batch_id = ? AND task_id = ? "
        "ORDER BY idx");
    stmt.bind(1, task.batch_id).bind(2, task.spec.id);
    while (stmt.step()) {
        task.result.artifacts.push_back({stmt.text(0), stmt.text(1), stmt.text(2), stmt.text(3)});
    }
}

std::vector<TaskRecord> SqliteTaskStore::get_tasks(const std::string& batch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return query_tasks(batch_id, nullptr);
}

std::optional<TaskRecord> SqliteTaskStore::get_task(const std::string& batch_id,
                                                    const std::string& task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto tasks = query_tasks(batch_id, &task_id);
    if (tasks.empty()) {
        return std::nullopt;
    }
    return std::move(tasks.front());
}

bool SqliteTaskStore::transition(const std::string& batch_id, const std::string& task_id,
                                 TaskStatus from, TaskStatus to, const TaskResult* result) {
    if (!is_legal_transition(from, to)) {
        throw std::logic_error("illegal task transition " + to_string(from) + " -> " +
                               to_string(to));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_.get());

    if (result) {
        Statement update(db_.get(),
            "UPDATE tasks SET status = ?, stdout = ?, stderr = ?, exit_code = ?, caption = ?, "
            "answer = ?, error_kind = ?, error = ?, updated_at = ? "
            "WHERE batch_id = ? AND task_id = ? AND status = ?");
        update.bind(1, to_string(to))
            .bind(2, result->stdout_output)
            .bind(3, result->stderr_output)
            .bind(4, static_cast<int64_t>(result->exit_code))
            .bind(5, result->caption)
            .bind(6, result->answer)
            .bind(7, to_string(result->error_kind))
            .bind(8, result->error)
            .bind(9, next_timestamp())
            .bind(10, batch_id)
            .bind(11, task_id)
            .bind(12, to_string(from));
        update.step();
    } else {
        Statement update(db_.get(),
            "UPDATE tasks SET status = ?, updated_at = ? "
            "WHERE batch_id = ? AND task_id = ? AND status = ?");
        update.bind(1, to_string(to))
            .bind(2, next_timestamp())
            .bind(3, batch_id)
            .bind(4, task_id)
            .bind(5, to_string(from));
        update.step();
    }

    if (sqlite3_changes(db_.get()) != 1) {
        return false;
    }

    if (result) {
        Statement clear(db_.get(), "DELETE FROM artifacts WHERE batch_id = ? AND task_id = ?");
        clear.bind(1, batch_id).bind(2, task_id);
        clear.step();
        int64_t index = 0;
        for (const auto& artifact : result->artifacts) {
            Statement insert(db_.get(),
                "INSERT INTO artifacts (batch_id, task_id, idx, ref, label, kind, digest) "
                "VALUES (?, ?, ?, ?, ?, ?, ?)");
            insert.bind(1, batch_id)
                .bind(2, task_id)
                .bind(3, index++)
                .bind(4, artifact.ref)
                .bind(5, artifact.label)
                .bind(6, artifact.kind)
                .bind(7, artifact.digest);
            insert.step();
        }
    }

    tx.commit();
    return true;
}

bool SqliteTaskStore::mark_cancelled(const std::string& batch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement update(db_.get(), "UPDATE batches SET cancelled = 1 WHERE id = ?");
    update.bind(1, batch_id);
    update.step();
    return sqlite3_changes(db_.get()) == 1;
}

std::vector<TaskKey> SqliteTaskStore::find_tasks(TaskStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_.get(),
        "SELECT t.batch_id, t.task_id FROM tasks t JOIN batches b ON b.id = t.batch_id "
        "WHERE t.status = ? ORDER BY b.created_at, b.id, t.ordinal");
    stmt.bind(1, to_string(status));
    std::vector<TaskKey> keys;
    while (stmt.step()) {
        keys.push_back({stmt.text(0), stmt.text(1)});
    }
    return keys;
}

} // namespace labshot
