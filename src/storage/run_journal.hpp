// File: src/storage/run_journal.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace patcat {

/// One recorded demonstration run
struct JournalEntry {
    /// Row id assigned by the journal (increasing)
    int64_t id{0};

    /// Pattern identifier that was run
    std::string pattern;

    /// Input values joined with spaces
    std::string input;

    /// Lines the run produced
    Trace trace;

    /// Wall-clock time of the run, microseconds since the Unix epoch
    int64_t created_at_micros{0};
};

/// Run history backed by SQLite
///
/// Each CLI run is appended as a row. Passing ":memory:" as the path keeps
/// the history for the lifetime of the object only.
class RunJournal {
public:
    /// Configuration for RunJournal
    struct Config {
        /// Path to the SQLite database file, or ":memory:"
        std::string db_path{":memory:"};

        /// Busy timeout in milliseconds
        int busy_timeout_ms{5000};
    };

    /// Open (and create if needed) the journal
    /// @throws std::runtime_error if the database cannot be opened or the
    ///         schema cannot be created
    explicit RunJournal(const Config& config);

    /// Destructor - closes database connection
    ~RunJournal();

    RunJournal(const RunJournal&) = delete;
    RunJournal& operator=(const RunJournal&) = delete;

    /// Append a run
    /// @return Row id of the new entry, or 0 on failure
    int64_t Record(const std::string& pattern, const DemoInput& input, const Trace& trace);

    /// Most recent entries, newest first
    /// @param limit Maximum number of entries to return
    std::vector<JournalEntry> Recent(size_t limit) const;

    /// Number of recorded runs
    size_t Count() const;

    /// Delete every entry
    /// @return true on success
    bool Clear();

    const std::string& GetPath() const { return config_.db_path; }

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    void CreateTables();
    bool ExecuteSQL(const std::string& sql);

    static std::string JoinLines(const Trace& trace);
    static Trace SplitLines(const std::string& text, size_t line_count);
};

} // namespace patcat
