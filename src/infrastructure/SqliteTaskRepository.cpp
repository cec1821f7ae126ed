/**
 * @file SqliteTaskRepository.cpp
 * @brief Implementation of SqliteTaskRepository.
 */

#include "infrastructure/SqliteTaskRepository.hpp"
#include "domain/DomainErrors.hpp"
#include "infrastructure/Log.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <sqlite3.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace lancollect::infrastructure {

namespace {

const char* kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS Tasks (
    Id TEXT PRIMARY KEY,
    Slug TEXT NOT NULL UNIQUE,
    Title TEXT NOT NULL,
    Description TEXT,
    TaskType INTEGER NOT NULL DEFAULT 0,
    VersioningMode INTEGER NOT NULL DEFAULT 1,
    MaxLimit INTEGER NOT NULL DEFAULT 0,
    CurrentCount INTEGER NOT NULL DEFAULT 0,
    CollectionPath TEXT NOT NULL,
    TemplatePath TEXT,
    IsActive INTEGER NOT NULL DEFAULT 1,
    CreatedAt INTEGER NOT NULL
);
CREATE TABLE IF NOT EXISTS Submissions (
    Id INTEGER PRIMARY KEY AUTOINCREMENT,
    TaskId TEXT NOT NULL REFERENCES Tasks(Id) ON DELETE CASCADE,
    SubmitterName TEXT,
    Contact TEXT,
    Department TEXT,
    OriginalFilename TEXT,
    StoredFilename TEXT,
    ClientAddress TEXT,
    Attachments TEXT,
    Timestamp INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS IDX_Task_Slug ON Tasks(Slug);
CREATE INDEX IF NOT EXISTS IDX_Sub_TaskId ON Submissions(TaskId);
)SQL";

const char* kTaskColumns =
    "Id, Slug, Title, Description, TaskType, VersioningMode, MaxLimit, CurrentCount, "
    "CollectionPath, TemplatePath, IsActive, CreatedAt";

const char* kSubmissionColumns =
    "Id, TaskId, SubmitterName, Contact, Department, OriginalFilename, StoredFilename, "
    "ClientAddress, Attachments, Timestamp";

long long ToEpochSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromEpochSeconds(long long seconds) {
    return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
}

/**
 * @brief Owns one sqlite3 handle configured for concurrent use.
 */
class Connection {
public:
    Connection(const std::string& path, int busyTimeoutMs) {
        int rc = sqlite3_open_v2(path.c_str(), &m_db,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
        if (rc != SQLITE_OK) {
            std::string message = m_db ? sqlite3_errmsg(m_db) : sqlite3_errstr(rc);
            sqlite3_close(m_db);
            m_db = nullptr;
            throw domain::StorageError("Cannot open database '" + path + "': " + message);
        }
        sqlite3_busy_timeout(m_db, busyTimeoutMs);
        try {
            exec("PRAGMA synchronous=NORMAL;");
            exec("PRAGMA foreign_keys=ON;");
        } catch (...) {
            sqlite3_close(m_db);
            m_db = nullptr;
            throw;
        }
    }

    ~Connection() {
        if (m_db) sqlite3_close(m_db);
    }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    sqlite3* get() const { return m_db; }

    void exec(const std::string& sql) {
        char* error = nullptr;
        int rc = sqlite3_exec(m_db, sql.c_str(), nullptr, nullptr, &error);
        if (rc != SQLITE_OK) {
            std::string message = error ? error : sqlite3_errstr(rc);
            sqlite3_free(error);
            throw domain::StorageError("SQL failed (" + sql.substr(0, 40) + "...): " + message);
        }
    }

    int changes() const { return sqlite3_changes(m_db); }

private:
    sqlite3* m_db = nullptr;
};

/**
 * @brief Prepared statement, finalized when it leaves scope.
 */
class Statement {
public:
    Statement(Connection& conn, const std::string& sql) : m_conn(conn) {
        if (sqlite3_prepare_v2(conn.get(), sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
            throw domain::StorageError("Prepare failed: " + std::string(sqlite3_errmsg(conn.get())));
        }
    }

    ~Statement() {
        sqlite3_finalize(m_stmt);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        sqlite3_bind_text(m_stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }

    Statement& bind(int index, long long value) {
        sqlite3_bind_int64(m_stmt, index, value);
        return *this;
    }

    Statement& bind(int index, int value) {
        sqlite3_bind_int(m_stmt, index, value);
        return *this;
    }

    /** @brief Steps once; true if a row is available. Throws on errors. */
    bool step() {
        int rc = sqlite3_step(m_stmt);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw domain::StorageError(sqlite3_errmsg(m_conn.get()));
    }

    /** @brief Steps once and reports the raw result code instead of throwing. */
    int tryStep() {
        return sqlite3_step(m_stmt);
    }

    std::string text(int col) const {
        const unsigned char* value = sqlite3_column_text(m_stmt, col);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

    long long int64(int col) const { return sqlite3_column_int64(m_stmt, col); }
    int int32(int col) const { return sqlite3_column_int(m_stmt, col); }

private:
    Connection& m_conn;
    sqlite3_stmt* m_stmt = nullptr;
};

/**
 * @brief BEGIN IMMEDIATE scope; rolls back unless commit() was reached.
 */
class Transaction {
public:
    explicit Transaction(Connection& conn) : m_conn(conn) {
        m_conn.exec("BEGIN IMMEDIATE;");
    }

    ~Transaction() {
        if (!m_done) {
            char* error = nullptr;
            if (sqlite3_exec(m_conn.get(), "ROLLBACK;", nullptr, nullptr, &error) != SQLITE_OK) {
                Log::Error("SqliteTaskRepository", std::string("Rollback failed: ") + (error ? error : "unknown"));
            }
            sqlite3_free(error);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        m_conn.exec("COMMIT;");
        m_done = true;
    }

private:
    Connection& m_conn;
    bool m_done = false;
};

domain::Task ReadTask(const Statement& stmt) {
    domain::Task task;
    task.id = stmt.text(0);
    task.slug = stmt.text(1);
    task.title = stmt.text(2);
    task.description = stmt.text(3);
    task.taskType = static_cast<domain::TaskType>(stmt.int32(4));
    task.versioningMode = static_cast<domain::VersioningMode>(stmt.int32(5));
    task.maxLimit = stmt.int32(6);
    task.currentCount = stmt.int32(7);
    task.collectionPath = stmt.text(8);
    task.templatePath = stmt.text(9);
    task.isActive = stmt.int32(10) != 0;
    task.createdAt = FromEpochSeconds(stmt.int64(11));
    return task;
}

domain::Submission ReadSubmission(const Statement& stmt) {
    domain::Submission submission;
    submission.id = stmt.int64(0);
    submission.taskId = stmt.text(1);
    submission.submitterName = stmt.text(2);
    submission.contact = stmt.text(3);
    submission.department = stmt.text(4);
    submission.originalFilename = stmt.text(5);
    submission.storedFilename = stmt.text(6);
    submission.clientAddress = stmt.text(7);

    std::string attachments = stmt.text(8);
    if (!attachments.empty()) {
        auto parsed = json::parse(attachments, nullptr, false);
        if (parsed.is_array()) {
            for (const auto& item : parsed) {
                if (item.is_string()) submission.attachments.push_back(item.get<std::string>());
            }
        } else {
            Log::Warn("SqliteTaskRepository", "Malformed attachment list on submission " +
                      std::to_string(submission.id));
        }
    }

    submission.timestamp = FromEpochSeconds(stmt.int64(9));
    return submission;
}

} // namespace

SqliteTaskRepository::SqliteTaskRepository(const std::string& databasePath, int busyTimeoutMs)
    : m_databasePath(databasePath), m_busyTimeoutMs(busyTimeoutMs) {
    fs::path dbPath(m_databasePath);
    if (dbPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(dbPath.parent_path(), ec);
        if (ec) {
            throw domain::StorageError("Cannot create database directory '" + dbPath.parent_path().string() +
                                       "': " + ec.message());
        }
    }
    initializeSchema();
}

void SqliteTaskRepository::initializeSchema() {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    // journal_mode is persistent, so setting it once here covers every later connection.
    conn.exec("PRAGMA journal_mode=WAL;");
    conn.exec(kSchemaSql);
    Log::Debug("SqliteTaskRepository", "Schema ready at " + m_databasePath);
}

std::vector<domain::Task> SqliteTaskRepository::getAllTasks() {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Statement stmt(conn, std::string("SELECT ") + kTaskColumns + " FROM Tasks ORDER BY CreatedAt DESC, rowid DESC");

    std::vector<domain::Task> tasks;
    while (stmt.step()) {
        tasks.push_back(ReadTask(stmt));
    }
    return tasks;
}

std::optional<domain::Task> SqliteTaskRepository::getTaskBySlug(const std::string& slug) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Statement stmt(conn, std::string("SELECT ") + kTaskColumns + " FROM Tasks WHERE Slug = ?");
    stmt.bind(1, slug);
    if (stmt.step()) return ReadTask(stmt);
    return std::nullopt;
}

std::optional<domain::Task> SqliteTaskRepository::getTaskById(const std::string& taskId) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Statement stmt(conn, std::string("SELECT ") + kTaskColumns + " FROM Tasks WHERE Id = ?");
    stmt.bind(1, taskId);
    if (stmt.step()) return ReadTask(stmt);
    return std::nullopt;
}

bool SqliteTaskRepository::tryCreateTask(const domain::Task& task) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    int rc = SQLITE_OK;
    std::string message;
    {
        Statement stmt(conn, std::string("INSERT INTO Tasks (") + kTaskColumns +
                             ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, task.id)
            .bind(2, task.slug)
            .bind(3, task.title)
            .bind(4, task.description)
            .bind(5, static_cast<int>(task.taskType))
            .bind(6, static_cast<int>(task.versioningMode))
            .bind(7, task.maxLimit)
            .bind(8, task.currentCount)
            .bind(9, task.collectionPath)
            .bind(10, task.templatePath)
            .bind(11, task.isActive ? 1 : 0)
            .bind(12, ToEpochSeconds(task.createdAt));
        rc = stmt.tryStep();
        if (rc != SQLITE_DONE) message = sqlite3_errmsg(conn.get());
    } // statement finalized before the outcome is reported

    if (rc == SQLITE_DONE) return true;

    int extended = sqlite3_extended_errcode(conn.get());
    if (extended == SQLITE_CONSTRAINT_UNIQUE && message.find("Tasks.Slug") != std::string::npos) {
        Log::Debug("SqliteTaskRepository", "Slug already taken: " + task.slug);
        return false;
    }
    throw domain::StorageError("Cannot create task '" + task.title + "': " + message);
}

bool SqliteTaskRepository::updateTask(const domain::Task& task) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Statement stmt(conn,
                   "UPDATE Tasks SET Title = ?, Description = ?, TaskType = ?, VersioningMode = ?, "
                   "MaxLimit = ?, CollectionPath = ?, TemplatePath = ?, IsActive = ? WHERE Id = ?");
    stmt.bind(1, task.title)
        .bind(2, task.description)
        .bind(3, static_cast<int>(task.taskType))
        .bind(4, static_cast<int>(task.versioningMode))
        .bind(5, task.maxLimit)
        .bind(6, task.collectionPath)
        .bind(7, task.templatePath)
        .bind(8, task.isActive ? 1 : 0)
        .bind(9, task.id);
    stmt.step();
    return conn.changes() > 0;
}

bool SqliteTaskRepository::deleteTask(const std::string& taskId) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Transaction tx(conn);
    {
        Statement subs(conn, "DELETE FROM Submissions WHERE TaskId = ?");
        subs.bind(1, taskId);
        subs.step();
    }
    int removed = 0;
    {
        Statement stmt(conn, "DELETE FROM Tasks WHERE Id = ?");
        stmt.bind(1, taskId);
        stmt.step();
        removed = conn.changes();
    }
    tx.commit();
    return removed > 0;
}

domain::Submission SqliteTaskRepository::recordSubmission(const std::string& taskId,
                                                          const domain::SubmissionData& data) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Transaction tx(conn);

    {
        Statement exists(conn, "SELECT 1 FROM Tasks WHERE Id = ?");
        exists.bind(1, taskId);
        if (!exists.step()) {
            throw domain::TaskNotFoundError(taskId);
        }
    }

    domain::Submission submission;
    submission.taskId = taskId;
    submission.submitterName = data.submitterName;
    submission.contact = data.contact;
    submission.department = data.department;
    submission.originalFilename = data.originalFilename;
    submission.storedFilename = data.storedFilename;
    submission.clientAddress = data.clientAddress;
    submission.attachments = data.attachments;
    submission.timestamp = std::chrono::system_clock::now();

    // 1. Insert the record
    {
        json attachments = json::array();
        for (const auto& path : data.attachments) attachments.push_back(path);

        Statement insert(conn,
                         "INSERT INTO Submissions (TaskId, SubmitterName, Contact, Department, OriginalFilename, "
                         "StoredFilename, ClientAddress, Attachments, Timestamp) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        insert.bind(1, taskId)
            .bind(2, data.submitterName)
            .bind(3, data.contact)
            .bind(4, data.department)
            .bind(5, data.originalFilename)
            .bind(6, data.storedFilename)
            .bind(7, data.clientAddress)
            .bind(8, attachments.dump())
            .bind(9, ToEpochSeconds(submission.timestamp));
        insert.step();
        submission.id = sqlite3_last_insert_rowid(conn.get());
    }

    // 2. Guarded increment; zero rows means the task is full
    {
        Statement update(conn,
                         "UPDATE Tasks SET CurrentCount = CurrentCount + 1 "
                         "WHERE Id = ? AND (MaxLimit = 0 OR CurrentCount < MaxLimit)");
        update.bind(1, taskId);
        update.step();
        if (conn.changes() == 0) {
            Log::Warn("SqliteTaskRepository", "Capacity reached for task " + taskId + ", submission rolled back");
            throw domain::CapacityExceededError(taskId);
        }
    }

    tx.commit();
    return submission;
}

std::vector<domain::Submission> SqliteTaskRepository::getSubmissionsByTaskId(const std::string& taskId) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Statement stmt(conn, std::string("SELECT ") + kSubmissionColumns +
                         " FROM Submissions WHERE TaskId = ? ORDER BY Timestamp DESC, Id DESC");
    stmt.bind(1, taskId);

    std::vector<domain::Submission> submissions;
    while (stmt.step()) {
        submissions.push_back(ReadSubmission(stmt));
    }
    return submissions;
}

bool SqliteTaskRepository::deleteSubmission(long long submissionId) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Transaction tx(conn);

    std::string taskId;
    {
        Statement find(conn, "SELECT TaskId FROM Submissions WHERE Id = ?");
        find.bind(1, submissionId);
        if (!find.step()) return false;
        taskId = find.text(0);
    }
    {
        Statement remove(conn, "DELETE FROM Submissions WHERE Id = ?");
        remove.bind(1, submissionId);
        remove.step();
    }
    {
        Statement update(conn, "UPDATE Tasks SET CurrentCount = CurrentCount - 1 WHERE Id = ? AND CurrentCount > 0");
        update.bind(1, taskId);
        update.step();
    }

    tx.commit();
    return true;
}

int SqliteTaskRepository::clearSubmissions(const std::string& taskId) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Transaction tx(conn);

    int removed = 0;
    {
        Statement remove(conn, "DELETE FROM Submissions WHERE TaskId = ?");
        remove.bind(1, taskId);
        remove.step();
        removed = conn.changes();
    }
    {
        Statement reset(conn, "UPDATE Tasks SET CurrentCount = 0 WHERE Id = ?");
        reset.bind(1, taskId);
        reset.step();
    }

    tx.commit();
    return removed;
}

bool SqliteTaskRepository::decrementCurrentCount(const std::string& taskId) {
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Statement stmt(conn, "UPDATE Tasks SET CurrentCount = CurrentCount - 1 WHERE Id = ? AND CurrentCount > 0");
    stmt.bind(1, taskId);
    stmt.step();
    return conn.changes() > 0;
}

bool SqliteTaskRepository::updateCurrentCount(const std::string& taskId, int count) {
    if (count < 0) {
        throw domain::InvalidArgumentError("Submission count cannot be negative");
    }
    Connection conn(m_databasePath, m_busyTimeoutMs);
    Statement stmt(conn, "UPDATE Tasks SET CurrentCount = ? WHERE Id = ?");
    stmt.bind(1, count).bind(2, taskId);
    stmt.step();
    return conn.changes() > 0;
}

} // namespace lancollect::infrastructure
