// File: src/storage/run_journal.cpp
#include "storage/run_journal.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace patcat {

// Read a TEXT column, mapping NULL to an empty string
static std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const unsigned char* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : "";
}

// ============================================================================
// Constructor and Destructor
// ============================================================================

RunJournal::RunJournal(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open journal: " + error);
    }

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    try {
        CreateTables();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

RunJournal::~RunJournal() {
    if (db_) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Schema
// ============================================================================

void RunJournal::CreateTables() {
    std::string create_table = R"(
        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            pattern TEXT NOT NULL,
            input TEXT NOT NULL,
            trace TEXT NOT NULL,
            line_count INTEGER NOT NULL,
            created_at INTEGER NOT NULL
        );
    )";

    if (!ExecuteSQL(create_table)) {
        throw std::runtime_error("Failed to create runs table");
    }
}

bool RunJournal::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Operations
// ============================================================================

int64_t RunJournal::Record(const std::string& pattern, const DemoInput& input,
                           const Trace& trace) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql =
        "INSERT INTO runs (pattern, input, trace, line_count, created_at) "
        "VALUES (?, ?, ?, ?, ?);";
    sqlite3_stmt* stmt;

    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return 0;
    }

    std::string input_text = input.ToString();
    std::string trace_text = JoinLines(trace);
    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    sqlite3_bind_text(stmt, 1, pattern.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, input_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, trace_text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(trace.size()));
    sqlite3_bind_int64(stmt, 5, now);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return 0;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<JournalEntry> RunJournal::Recent(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<JournalEntry> entries;

    const char* sql =
        "SELECT id, pattern, input, trace, line_count, created_at FROM runs "
        "ORDER BY id DESC LIMIT ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return entries;
    }

    sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(limit));

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        JournalEntry entry;
        entry.id = sqlite3_column_int64(stmt, 0);
        entry.pattern = ColumnText(stmt, 1);
        entry.input = ColumnText(stmt, 2);
        entry.trace = SplitLines(ColumnText(stmt, 3),
                                 static_cast<size_t>(sqlite3_column_int64(stmt, 4)));
        entry.created_at_micros = sqlite3_column_int64(stmt, 5);
        entries.push_back(std::move(entry));
    }

    sqlite3_finalize(stmt);
    return entries;
}

size_t RunJournal::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "SELECT COUNT(*) FROM runs;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

bool RunJournal::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ExecuteSQL("DELETE FROM runs;");
}

// ============================================================================
// Helpers
// ============================================================================

std::string RunJournal::JoinLines(const Trace& trace) {
    std::string text;
    for (size_t i = 0; i < trace.size(); ++i) {
        if (i > 0) text += '\n';
        text += trace[i];
    }
    return text;
}

Trace RunJournal::SplitLines(const std::string& text, size_t line_count) {
    Trace lines;
    if (line_count == 0) {
        return lines;
    }

    size_t start = 0;
    while (true) {
        size_t pos = text.find('\n', start);
        if (pos == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return lines;
}

} // namespace patcat
