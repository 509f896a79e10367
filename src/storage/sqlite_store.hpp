// File: src/storage/sqlite_store.hpp
#pragma once

#include "storage/solution_store.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <sqlite3.h>

namespace motionrank {

/// Persistent solution store using SQLite
///
/// Each solution is one row of the `solutions` table with a column per
/// field: ISO-8601 UTC timestamps and string enums. Tags and child ids live
/// in side tables keyed by solution id; favorites and the behavior journal
/// have their own tables. Rows whose enums or timestamps cannot be decoded
/// are skipped on load.
class SqliteStore : public SolutionStore {
public:
    /// Configuration for SqliteStore
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private in-memory db)
        std::string db_path;

        /// Enable Write-Ahead Logging
        bool enable_wal{true};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};

        /// Busy timeout in milliseconds
        int busy_timeout_ms{5000};
    };

    /// Open (and create if needed) the database
    /// @param config Configuration options
    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit SqliteStore(const Config& config);

    /// Closes the database connection
    ~SqliteStore() override;

    // SQLite connection is not copyable
    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    // ========================================================================
    // SolutionStore Interface Implementation
    // ========================================================================

    std::vector<Solution> LoadAll() override;
    bool Save(const Solution& solution) override;
    bool Remove(const SolutionID& id) override;

    std::vector<SolutionID> LoadFavorites() override;
    bool SaveFavorites(const std::vector<SolutionID>& favorites) override;

    bool AppendEvent(const BehaviorEvent& event) override;
    std::vector<BehaviorEvent> LoadEvents() override;

    StoreStats GetStats() const override;
    void Clear() override;

    /// Raw handle, for maintenance tooling and tests
    sqlite3* GetHandle() const { return db_; }

private:
    Config config_;

    sqlite3* db_{nullptr};

    mutable std::mutex mutex_;

    /// Records skipped by the most recent LoadAll
    std::atomic<size_t> skipped_records_{0};

    // ========================================================================
    // Helper Methods
    // ========================================================================

    /// Apply pragmas and create the schema
    void InitializeDatabase();

    /// Create tables and indices
    void CreateTables();

    /// Execute a SQL statement
    /// @return true if successful, false otherwise
    bool ExecuteSQL(const std::string& sql);

    /// Count rows of a table; assumes mutex is already locked
    size_t CountRowsUnlocked(const char* table) const;

    /// Write the main row plus tags and children; assumes mutex is locked
    bool SaveUnlocked(const Solution& solution);

    /// Read tags or child ids of one solution; assumes mutex is locked
    std::vector<std::string> LoadListUnlocked(const char* sql, const std::string& id);

    /// Decode one `solutions` row
    /// @throws std::invalid_argument if a field cannot be decoded
    static Solution DecodeSolutionRow(sqlite3_stmt* stmt);

    /// Decode one `behavior_events` row
    /// @throws std::invalid_argument if a field cannot be decoded
    static BehaviorEvent DecodeEventRow(sqlite3_stmt* stmt);

    /// Get database file size in bytes
    size_t GetDatabaseSize() const;

    void BeginTransaction();
    void CommitTransaction();
    void RollbackTransaction();
};

} // namespace motionrank
