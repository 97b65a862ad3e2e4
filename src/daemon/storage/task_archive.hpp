#pragma once

#include "pipeline/task.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct ArchivedTask {
    int64_t id = 0;
    std::string timestamp;
    std::string task_id;
    std::string source;
    std::string method;
    std::string status;
    std::string message;
    std::string error;
    TaskStats stats;
    std::map<std::string, std::string> outputs;
    std::string bundle;
};

// SQLite record of finished tasks. Calls are serialized internally so
// task threads can insert while the daemon thread reads.
class TaskArchive {
public:
    TaskArchive();
    ~TaskArchive();

    TaskArchive(const TaskArchive&) = delete;
    TaskArchive& operator=(const TaskArchive&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const Task& task);

    std::vector<ArchivedTask> recent(int limit = 10);
    std::optional<ArchivedTask> find(const std::string& task_id);

private:
    bool create_tables();
    ArchivedTask read_row(sqlite3_stmt* stmt) const;

    std::mutex mu_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* find_stmt_ = nullptr;
};
