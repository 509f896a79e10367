// File: src/storage/sqlite_store.cpp
#include "storage/sqlite_store.hpp"
#include <iostream>
#include <stdexcept>
#include <sys/stat.h>

namespace motionrank {

namespace {

const char* kSelectSolutions = R"(
    SELECT id, name, description, author, category, tech_stack,
           html_code, css_code, js_code,
           quality_score, performance_score, creativity_score,
           usability_score, compatibility_score, quality_tier,
           user_rating, rating_count, favorite_count, usage_count,
           created_at, updated_at, version, parent_id,
           thumbnail_path, preview_path
    FROM solutions ORDER BY seq;
)";

const char* kUpsertSolution = R"(
    INSERT INTO solutions (
        id, name, description, author, category, tech_stack,
        html_code, css_code, js_code,
        quality_score, performance_score, creativity_score,
        usability_score, compatibility_score, overall_score, quality_tier,
        user_rating, rating_count, favorite_count, usage_count,
        created_at, updated_at, version, parent_id,
        thumbnail_path, preview_path)
    VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
    ON CONFLICT(id) DO UPDATE SET
        name = excluded.name,
        description = excluded.description,
        author = excluded.author,
        category = excluded.category,
        tech_stack = excluded.tech_stack,
        html_code = excluded.html_code,
        css_code = excluded.css_code,
        js_code = excluded.js_code,
        quality_score = excluded.quality_score,
        performance_score = excluded.performance_score,
        creativity_score = excluded.creativity_score,
        usability_score = excluded.usability_score,
        compatibility_score = excluded.compatibility_score,
        overall_score = excluded.overall_score,
        quality_tier = excluded.quality_tier,
        user_rating = excluded.user_rating,
        rating_count = excluded.rating_count,
        favorite_count = excluded.favorite_count,
        usage_count = excluded.usage_count,
        created_at = excluded.created_at,
        updated_at = excluded.updated_at,
        version = excluded.version,
        parent_id = excluded.parent_id,
        thumbnail_path = excluded.thumbnail_path,
        preview_path = excluded.preview_path;
)";

std::string ColumnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    if (!text) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
}

std::optional<std::string> ColumnOptionalText(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) {
        return std::nullopt;
    }
    return ColumnText(stmt, col);
}

uint32_t ColumnCount(sqlite3_stmt* stmt, int col, const char* field) {
    sqlite3_int64 value = sqlite3_column_int64(stmt, col);
    if (value < 0 || value > static_cast<sqlite3_int64>(UINT32_MAX)) {
        throw std::invalid_argument(std::string("Counter out of range: ") + field);
    }
    return static_cast<uint32_t>(value);
}

Timestamp ColumnTimestamp(sqlite3_stmt* stmt, int col, const char* field) {
    auto ts = Timestamp::FromIso8601(ColumnText(stmt, col));
    if (!ts) {
        throw std::invalid_argument(std::string("Malformed timestamp: ") + field);
    }
    return *ts;
}

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        BindText(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

} // anonymous namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteStore::SqliteStore(const Config& config)
    : config_(config) {

    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    InitializeDatabase();
}

SqliteStore::~SqliteStore() {
    if (db_) {
        // close_v2 defers the close until outstanding statements are finalized
        sqlite3_close_v2(db_);
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteStore::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal) {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();
}

void SqliteStore::CreateTables() {
    const char* create_solutions = R"(
        CREATE TABLE IF NOT EXISTS solutions (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            id TEXT NOT NULL UNIQUE,
            name TEXT NOT NULL,
            description TEXT NOT NULL,
            author TEXT NOT NULL,
            category TEXT NOT NULL,
            tech_stack TEXT NOT NULL,
            html_code TEXT NOT NULL,
            css_code TEXT NOT NULL,
            js_code TEXT NOT NULL,
            quality_score REAL NOT NULL,
            performance_score REAL NOT NULL,
            creativity_score REAL NOT NULL,
            usability_score REAL NOT NULL,
            compatibility_score REAL NOT NULL,
            overall_score REAL NOT NULL,
            quality_tier TEXT NOT NULL,
            user_rating REAL NOT NULL,
            rating_count INTEGER NOT NULL,
            favorite_count INTEGER NOT NULL,
            usage_count INTEGER NOT NULL,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL,
            version TEXT NOT NULL,
            parent_id TEXT,
            thumbnail_path TEXT,
            preview_path TEXT
        );
    )";

    const char* create_tags = R"(
        CREATE TABLE IF NOT EXISTS solution_tags (
            solution_id TEXT NOT NULL,
            position INTEGER NOT NULL,
            tag TEXT NOT NULL,
            PRIMARY KEY (solution_id, position)
        );
    )";

    const char* create_children = R"(
        CREATE TABLE IF NOT EXISTS solution_children (
            solution_id TEXT NOT NULL,
            position INTEGER NOT NULL,
            child_id TEXT NOT NULL,
            PRIMARY KEY (solution_id, position)
        );
    )";

    const char* create_favorites = R"(
        CREATE TABLE IF NOT EXISTS favorites (
            position INTEGER PRIMARY KEY,
            solution_id TEXT NOT NULL
        );
    )";

    const char* create_events = R"(
        CREATE TABLE IF NOT EXISTS behavior_events (
            seq INTEGER PRIMARY KEY AUTOINCREMENT,
            action TEXT NOT NULL,
            solution_id TEXT NOT NULL,
            category TEXT NOT NULL,
            tech_stack TEXT NOT NULL,
            rating REAL,
            timestamp TEXT NOT NULL
        );
    )";

    for (const char* sql : {create_solutions, create_tags, create_children,
                            create_favorites, create_events}) {
        if (!ExecuteSQL(sql)) {
            throw std::runtime_error(std::string("Failed to create schema: ") +
                                     sqlite3_errmsg(db_));
        }
    }

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_events_solution ON behavior_events(solution_id);");
}

bool SqliteStore::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        if (error_msg) {
            std::cerr << "[sqlite_store] " << error_msg << std::endl;
            sqlite3_free(error_msg);
        }
        return false;
    }

    return true;
}

// ============================================================================
// Solutions
// ============================================================================

std::vector<Solution> SqliteStore::LoadAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Solution> results;
    size_t skipped = 0;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, kSelectSolutions, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "[sqlite_store] Failed to read solutions: "
                  << sqlite3_errmsg(db_) << std::endl;
        return results;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        try {
            results.push_back(DecodeSolutionRow(stmt));
        } catch (const std::invalid_argument& e) {
            ++skipped;
            std::cerr << "[sqlite_store] Skipping corrupt record "
                      << ColumnText(stmt, 0) << ": " << e.what() << std::endl;
        }
    }

    sqlite3_finalize(stmt);

    const char* select_tags =
        "SELECT tag FROM solution_tags WHERE solution_id = ? ORDER BY position;";
    const char* select_children =
        "SELECT child_id FROM solution_children WHERE solution_id = ? ORDER BY position;";

    for (auto& solution : results) {
        solution.SetTags(LoadListUnlocked(select_tags, solution.GetID().value()));
        for (const auto& child : LoadListUnlocked(select_children, solution.GetID().value())) {
            solution.AddChildID(SolutionID(child));
        }
    }

    skipped_records_.store(skipped, std::memory_order_relaxed);

    return results;
}

std::vector<std::string> SqliteStore::LoadListUnlocked(const char* sql, const std::string& id) {
    std::vector<std::string> values;

    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return values;
    }

    BindText(stmt, 1, id);
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        values.push_back(ColumnText(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return values;
}

Solution SqliteStore::DecodeSolutionRow(sqlite3_stmt* stmt) {
    std::string id = ColumnText(stmt, 0);
    if (id.empty()) {
        throw std::invalid_argument("Missing solution id");
    }

    Solution solution{SolutionID(id)};
    solution.SetName(ColumnText(stmt, 1));
    solution.SetDescription(ColumnText(stmt, 2));
    solution.SetAuthor(ColumnText(stmt, 3));
    solution.SetCategory(ParseSolutionCategory(ColumnText(stmt, 4)));
    solution.SetTechStack(ParseTechStack(ColumnText(stmt, 5)));
    solution.SetHtmlCode(ColumnText(stmt, 6));
    solution.SetCssCode(ColumnText(stmt, 7));
    solution.SetJsCode(ColumnText(stmt, 8));

    // The overall score column is informational; it is recomputed from the dimensions
    solution.SetMetrics(SolutionMetrics(
        static_cast<float>(sqlite3_column_double(stmt, 9)),
        static_cast<float>(sqlite3_column_double(stmt, 10)),
        static_cast<float>(sqlite3_column_double(stmt, 11)),
        static_cast<float>(sqlite3_column_double(stmt, 12)),
        static_cast<float>(sqlite3_column_double(stmt, 13))));
    solution.SetQualityTier(ParseQualityTier(ColumnText(stmt, 14)));

    InteractionStats stats;
    stats.user_rating = static_cast<float>(sqlite3_column_double(stmt, 15));
    stats.rating_count = ColumnCount(stmt, 16, "rating_count");
    stats.favorite_count = ColumnCount(stmt, 17, "favorite_count");
    stats.usage_count = ColumnCount(stmt, 18, "usage_count");
    solution.RestoreInteractionStats(stats);

    solution.SetVersion(ColumnText(stmt, 21));

    auto parent = ColumnOptionalText(stmt, 22);
    if (parent && !parent->empty()) {
        solution.SetParentID(SolutionID(*parent));
    }

    solution.SetThumbnailPath(ColumnOptionalText(stmt, 23));
    solution.SetPreviewPath(ColumnOptionalText(stmt, 24));

    // Timestamps last: the setters above refresh updated_at
    solution.SetCreatedAt(ColumnTimestamp(stmt, 19, "created_at"));
    solution.SetUpdatedAt(ColumnTimestamp(stmt, 20, "updated_at"));

    return solution;
}

bool SqliteStore::Save(const Solution& solution) {
    std::lock_guard<std::mutex> lock(mutex_);

    BeginTransaction();
    if (!SaveUnlocked(solution)) {
        std::cerr << "[sqlite_store] Failed to save " << solution.GetID().value()
                  << ": " << sqlite3_errmsg(db_) << std::endl;
        RollbackTransaction();
        return false;
    }
    CommitTransaction();
    return true;
}

bool SqliteStore::SaveUnlocked(const Solution& solution) {
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, kUpsertSolution, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    const SolutionMetrics& metrics = solution.GetMetrics();
    const InteractionStats& stats = solution.GetInteractionStats();

    BindText(stmt, 1, solution.GetID().value());
    BindText(stmt, 2, solution.GetName());
    BindText(stmt, 3, solution.GetDescription());
    BindText(stmt, 4, solution.GetAuthor());
    BindText(stmt, 5, ToString(solution.GetCategory()));
    BindText(stmt, 6, ToString(solution.GetTechStack()));
    BindText(stmt, 7, solution.GetHtmlCode());
    BindText(stmt, 8, solution.GetCssCode());
    BindText(stmt, 9, solution.GetJsCode());
    sqlite3_bind_double(stmt, 10, metrics.GetQuality());
    sqlite3_bind_double(stmt, 11, metrics.GetPerformance());
    sqlite3_bind_double(stmt, 12, metrics.GetCreativity());
    sqlite3_bind_double(stmt, 13, metrics.GetUsability());
    sqlite3_bind_double(stmt, 14, metrics.GetCompatibility());
    sqlite3_bind_double(stmt, 15, metrics.GetOverall());
    BindText(stmt, 16, ToString(solution.GetQualityTier()));
    sqlite3_bind_double(stmt, 17, stats.user_rating);
    sqlite3_bind_int64(stmt, 18, stats.rating_count);
    sqlite3_bind_int64(stmt, 19, stats.favorite_count);
    sqlite3_bind_int64(stmt, 20, stats.usage_count);
    BindText(stmt, 21, solution.GetCreatedAt().ToIso8601());
    BindText(stmt, 22, solution.GetUpdatedAt().ToIso8601());
    BindText(stmt, 23, solution.GetVersion());
    if (solution.GetParentID()) {
        BindText(stmt, 24, solution.GetParentID()->value());
    } else {
        sqlite3_bind_null(stmt, 24);
    }
    BindOptionalText(stmt, 25, solution.GetThumbnailPath());
    BindOptionalText(stmt, 26, solution.GetPreviewPath());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return false;
    }

    // Side tables are rewritten wholesale
    const std::string& id = solution.GetID().value();

    const char* delete_tags = "DELETE FROM solution_tags WHERE solution_id = ?;";
    const char* delete_children = "DELETE FROM solution_children WHERE solution_id = ?;";
    for (const char* sql : {delete_tags, delete_children}) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            return false;
        }
        BindText(stmt, 1, id);
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return false;
        }
    }

    auto insert_list = [&](const char* sql, const std::vector<std::string>& values) {
        sqlite3_stmt* insert;
        if (sqlite3_prepare_v2(db_, sql, -1, &insert, nullptr) != SQLITE_OK) {
            return false;
        }
        bool ok = true;
        for (size_t i = 0; i < values.size() && ok; ++i) {
            BindText(insert, 1, id);
            sqlite3_bind_int64(insert, 2, static_cast<sqlite3_int64>(i));
            BindText(insert, 3, values[i]);
            ok = sqlite3_step(insert) == SQLITE_DONE;
            sqlite3_reset(insert);
        }
        sqlite3_finalize(insert);
        return ok;
    };

    std::vector<std::string> children;
    children.reserve(solution.GetChildIDs().size());
    for (const auto& child : solution.GetChildIDs()) {
        children.push_back(child.value());
    }

    return insert_list("INSERT INTO solution_tags (solution_id, position, tag) VALUES (?, ?, ?);",
                       solution.GetTags()) &&
           insert_list("INSERT INTO solution_children (solution_id, position, child_id) VALUES (?, ?, ?);",
                       children);
}

bool SqliteStore::Remove(const SolutionID& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = "DELETE FROM solutions WHERE id = ?;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    BindText(stmt, 1, id.value());
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return false;
    }

    bool removed = sqlite3_changes(db_) > 0;

    if (removed) {
        for (const char* side : {"DELETE FROM solution_tags WHERE solution_id = ?;",
                                 "DELETE FROM solution_children WHERE solution_id = ?;"}) {
            if (sqlite3_prepare_v2(db_, side, -1, &stmt, nullptr) == SQLITE_OK) {
                BindText(stmt, 1, id.value());
                sqlite3_step(stmt);
                sqlite3_finalize(stmt);
            }
        }
    }

    return removed;
}

// ============================================================================
// Favorites
// ============================================================================

std::vector<SolutionID> SqliteStore::LoadFavorites() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SolutionID> favorites;

    const char* sql = "SELECT solution_id FROM favorites ORDER BY position;";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return favorites;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        favorites.emplace_back(ColumnText(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return favorites;
}

bool SqliteStore::SaveFavorites(const std::vector<SolutionID>& favorites) {
    std::lock_guard<std::mutex> lock(mutex_);

    BeginTransaction();

    if (!ExecuteSQL("DELETE FROM favorites;")) {
        RollbackTransaction();
        return false;
    }

    const char* sql = "INSERT INTO favorites (position, solution_id) VALUES (?, ?);";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        RollbackTransaction();
        return false;
    }

    bool ok = true;
    for (size_t i = 0; i < favorites.size() && ok; ++i) {
        sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(i));
        BindText(stmt, 2, favorites[i].value());
        ok = sqlite3_step(stmt) == SQLITE_DONE;
        sqlite3_reset(stmt);
    }

    sqlite3_finalize(stmt);

    if (!ok) {
        RollbackTransaction();
        return false;
    }

    CommitTransaction();
    return true;
}

// ============================================================================
// Behavior journal
// ============================================================================

bool SqliteStore::AppendEvent(const BehaviorEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* sql = R"(
        INSERT INTO behavior_events (action, solution_id, category, tech_stack, rating, timestamp)
        VALUES (?, ?, ?, ?, ?, ?);
    )";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return false;
    }

    BindText(stmt, 1, ToString(event.action));
    BindText(stmt, 2, event.solution_id.value());
    BindText(stmt, 3, ToString(event.category));
    BindText(stmt, 4, ToString(event.tech_stack));
    if (event.rating) {
        sqlite3_bind_double(stmt, 5, *event.rating);
    } else {
        sqlite3_bind_null(stmt, 5);
    }
    BindText(stmt, 6, event.timestamp.ToIso8601());

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    return rc == SQLITE_DONE;
}

std::vector<BehaviorEvent> SqliteStore::LoadEvents() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<BehaviorEvent> events;

    const char* sql = R"(
        SELECT action, solution_id, category, tech_stack, rating, timestamp
        FROM behavior_events ORDER BY seq;
    )";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        return events;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW) {
        try {
            events.push_back(DecodeEventRow(stmt));
        } catch (const std::invalid_argument& e) {
            std::cerr << "[sqlite_store] Skipping corrupt event: " << e.what() << std::endl;
        }
    }

    sqlite3_finalize(stmt);
    return events;
}

BehaviorEvent SqliteStore::DecodeEventRow(sqlite3_stmt* stmt) {
    BehaviorEvent event;
    event.action = ParseActionKind(ColumnText(stmt, 0));
    event.solution_id = SolutionID(ColumnText(stmt, 1));
    event.category = ParseSolutionCategory(ColumnText(stmt, 2));
    event.tech_stack = ParseTechStack(ColumnText(stmt, 3));
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        event.rating = static_cast<float>(sqlite3_column_double(stmt, 4));
    }
    event.timestamp = ColumnTimestamp(stmt, 5, "timestamp");
    return event;
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

size_t SqliteStore::CountRowsUnlocked(const char* table) const {
    std::string sql = std::string("SELECT COUNT(*) FROM ") + table + ";";
    sqlite3_stmt* stmt;

    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }

    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }

    sqlite3_finalize(stmt);
    return count;
}

StoreStats SqliteStore::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    StoreStats stats;
    stats.total_solutions = CountRowsUnlocked("solutions");
    stats.total_favorites = CountRowsUnlocked("favorites");
    stats.total_events = CountRowsUnlocked("behavior_events");
    stats.skipped_records = skipped_records_.load(std::memory_order_relaxed);
    stats.disk_usage_bytes = GetDatabaseSize();
    return stats;
}

void SqliteStore::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);

    BeginTransaction();
    ExecuteSQL("DELETE FROM solutions;");
    ExecuteSQL("DELETE FROM solution_tags;");
    ExecuteSQL("DELETE FROM solution_children;");
    ExecuteSQL("DELETE FROM favorites;");
    ExecuteSQL("DELETE FROM behavior_events;");
    CommitTransaction();

    skipped_records_.store(0, std::memory_order_relaxed);
}

size_t SqliteStore::GetDatabaseSize() const {
    struct stat st;
    if (stat(config_.db_path.c_str(), &st) == 0) {
        return static_cast<size_t>(st.st_size);
    }
    return 0;
}

void SqliteStore::BeginTransaction() {
    ExecuteSQL("BEGIN TRANSACTION;");
}

void SqliteStore::CommitTransaction() {
    ExecuteSQL("COMMIT;");
}

void SqliteStore::RollbackTransaction() {
    ExecuteSQL("ROLLBACK;");
}

} // namespace motionrank
