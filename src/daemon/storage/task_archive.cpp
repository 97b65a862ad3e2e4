#include "task_archive.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* COLUMNS =
    "id, timestamp, task_id, source, method, status, message, error, stats, outputs, bundle";

} // namespace

TaskArchive::TaskArchive() = default;

TaskArchive::~TaskArchive() {
    close();
}

bool TaskArchive::open(const std::string& path) {
    std::lock_guard lock(mu_);

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "archive: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT OR REPLACE INTO tasks (task_id, source, method, status, message, error, "
        "stats, outputs, bundle) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)";

    auto recent_sql = std::string("SELECT ") + COLUMNS + " FROM tasks ORDER BY id DESC LIMIT ?";
    auto find_sql = std::string("SELECT ") + COLUMNS + " FROM tasks WHERE task_id = ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "archive: prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_prepare_v2(db_, recent_sql.c_str(), -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "archive: prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    if (sqlite3_prepare_v2(db_, find_sql.c_str(), -1, &find_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "archive: prepare find failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

void TaskArchive::close() {
    std::lock_guard lock(mu_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (find_stmt_) { sqlite3_finalize(find_stmt_); find_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool TaskArchive::insert(const Task& task) {
    std::lock_guard lock(mu_);
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    auto status = std::string(to_string(task.status));
    auto stats = to_json(task.stats).dump();
    auto outputs = nlohmann::json(task.outputs).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

    sqlite3_bind_text(insert_stmt_, 1, task.id.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(2, task.source);
    bind_nullable(3, task.method);
    sqlite3_bind_text(insert_stmt_, 4, status.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(5, task.message);
    bind_nullable(6, task.error);
    sqlite3_bind_text(insert_stmt_, 7, stats.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 8, outputs.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(9, task.bundle);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "archive: insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

ArchivedTask TaskArchive::read_row(sqlite3_stmt* stmt) const {
    auto get_text = [stmt](int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    ArchivedTask t;
    t.id = sqlite3_column_int64(stmt, 0);
    t.timestamp = get_text(1);
    t.task_id = get_text(2);
    t.source = get_text(3);
    t.method = get_text(4);
    t.status = get_text(5);
    t.message = get_text(6);
    t.error = get_text(7);
    t.stats = stats_from_json(nlohmann::json::parse(get_text(8), nullptr, false));

    auto outputs = nlohmann::json::parse(get_text(9), nullptr, false);
    if (outputs.is_object()) {
        for (auto& [fmt, path] : outputs.items()) {
            if (path.is_string()) t.outputs[fmt] = path.get<std::string>();
        }
    }
    t.bundle = get_text(10);
    return t;
}

std::vector<ArchivedTask> TaskArchive::recent(int limit) {
    std::lock_guard lock(mu_);
    std::vector<ArchivedTask> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back(read_row(recent_stmt_));
    }
    return entries;
}

std::optional<ArchivedTask> TaskArchive::find(const std::string& task_id) {
    std::lock_guard lock(mu_);
    if (!find_stmt_) return std::nullopt;

    sqlite3_reset(find_stmt_);
    sqlite3_bind_text(find_stmt_, 1, task_id.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(find_stmt_) != SQLITE_ROW) return std::nullopt;
    return read_row(find_stmt_);
}

bool TaskArchive::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS tasks (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            task_id TEXT NOT NULL UNIQUE,
            source TEXT,
            method TEXT,
            status TEXT NOT NULL,
            message TEXT,
            error TEXT,
            stats TEXT,
            outputs TEXT,
            bundle TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "archive: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
