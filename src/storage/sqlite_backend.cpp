// File: src/storage/sqlite_backend.cpp
#include "storage/sqlite_backend.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <set>
#include <sstream>
#include <type_traits>

namespace modelstore {

namespace {

/// Prepared statement, finalized on destruction
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string error = sqlite3_errmsg(db_);
            sqlite3_finalize(stmt_);
            throw EngineError("Failed to prepare statement: " + error);
        }
    }

    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& Bind(int index, int value) {
        Check(sqlite3_bind_int(stmt_, index, value));
        return *this;
    }
    Statement& Bind(int index, int64_t value) {
        Check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }
    Statement& Bind(int index, double value) {
        Check(sqlite3_bind_double(stmt_, index, value));
        return *this;
    }
    Statement& Bind(int index, const char* value) {
        Check(sqlite3_bind_text(stmt_, index, value, -1, SQLITE_TRANSIENT));
        return *this;
    }
    Statement& Bind(int index, const std::string& value) {
        Check(sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }
    Statement& Bind(int index, const std::optional<std::string>& value) {
        return value ? Bind(index, *value) : BindNull(index);
    }
    Statement& Bind(int index, const std::optional<int>& value) {
        return value ? Bind(index, *value) : BindNull(index);
    }
    Statement& BindBlob(int index, const std::vector<uint8_t>& blob) {
        Check(sqlite3_bind_blob(stmt_, index, blob.data(), static_cast<int>(blob.size()),
                                SQLITE_TRANSIENT));
        return *this;
    }
    Statement& BindNull(int index) {
        Check(sqlite3_bind_null(stmt_, index));
        return *this;
    }

    /// Advance to the next row
    /// @return true if a row is available, false when done
    /// @throws EngineError on failure
    bool Step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc == SQLITE_DONE) {
            return false;
        }
        throw EngineError(std::string("SQLite error: ") + sqlite3_errmsg(db_));
    }

    /// Step a statement that returns no rows
    void Run() {
        while (Step()) {
        }
    }

    /// Clear bindings and rewind for the next execution
    void Reset() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }

    bool IsNull(int col) const { return sqlite3_column_type(stmt_, col) == SQLITE_NULL; }
    int Int(int col) const { return sqlite3_column_int(stmt_, col); }
    int64_t Int64(int col) const { return sqlite3_column_int64(stmt_, col); }
    double Double(int col) const { return sqlite3_column_double(stmt_, col); }

    std::string Text(int col) const {
        const unsigned char* text = sqlite3_column_text(stmt_, col);
        if (text == nullptr) {
            return std::string();
        }
        return std::string(reinterpret_cast<const char*>(text),
                           static_cast<size_t>(sqlite3_column_bytes(stmt_, col)));
    }

    std::optional<std::string> OptText(int col) const {
        if (IsNull(col)) {
            return std::nullopt;
        }
        return Text(col);
    }

    const void* Blob(int col) const { return sqlite3_column_blob(stmt_, col); }
    int Bytes(int col) const { return sqlite3_column_bytes(stmt_, col); }

private:
    void Check(int rc) {
        if (rc != SQLITE_OK) {
            throw EngineError(std::string("Failed to bind parameter: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{nullptr};
};

int64_t SessionValue(const SessionID& id) {
    return static_cast<int64_t>(id.value());
}

std::string RunLabel(const std::string& model, const std::string& scenario, int version) {
    return model + "/" + scenario + "#" + std::to_string(version);
}

} // namespace

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqliteBackend::Config SqliteBackend::ConfigFromOptions(const BackendOptions& options) {
    RejectUnknownOptions(options, {"path", "user", "enable_wal", "busy_timeout_ms", "synchronous"},
                         "sqlite");

    Config config;
    for (const auto& [key, value] : options) {
        if (key == "path") config.path = value;
        else if (key == "user") config.user = value;
        else if (key == "enable_wal") config.enable_wal = ParseBoolOption(key, value);
        else if (key == "busy_timeout_ms") config.busy_timeout_ms = ParseSizeOption(key, value);
        else if (key == "synchronous") config.synchronous = value;
    }

    if (config.path.empty()) {
        throw ValidationError("Backend 'sqlite' requires option 'path'");
    }
    if (config.synchronous != "FULL" && config.synchronous != "NORMAL" &&
        config.synchronous != "OFF") {
        throw ValidationError("Option 'synchronous' must be FULL, NORMAL or OFF, got '" +
                              config.synchronous + "'");
    }
    return config;
}

SqliteBackend::SqliteBackend(const Config& config)
    : Backend("SqliteBackend"), config_(config) {
    std::lock_guard<std::mutex> lock(mutex_);
    OpenConnection();
}

SqliteBackend::~SqliteBackend() {
    if (db_) {
        // sqlite3_close_v2 waits for outstanding statements and checkpoints the WAL
        if (sqlite3_close_v2(db_) != SQLITE_OK) {
            logger_.Warning("Failed to close database " + config_.path);
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqliteBackend::OpenConnection() {
    int rc = sqlite3_open(config_.path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw EngineError("Failed to open database " + config_.path + ": " + error);
    }

    sqlite3_busy_timeout(db_, static_cast<int>(config_.busy_timeout_ms));

    try {
        if (config_.enable_wal && config_.path != ":memory:") {
            ExecuteSQL("PRAGMA journal_mode=WAL;");
        }
        ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");
        ExecuteSQL("PRAGMA foreign_keys=ON;");

        CreateTables();
        CreateIndices();
    } catch (const EngineError&) {
        sqlite3_close_v2(db_);
        db_ = nullptr;
        throw;
    }

    logger_.Debug("Opened database " + config_.path);
}

void SqliteBackend::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS model_name (
            name TEXT PRIMARY KEY
        );
        CREATE TABLE IF NOT EXISTS scenario_name (
            name TEXT PRIMARY KEY
        );
        CREATE TABLE IF NOT EXISTS unit (
            name TEXT PRIMARY KEY,
            comment TEXT NOT NULL DEFAULT ''
        );
        CREATE TABLE IF NOT EXISTS region (
            region TEXT PRIMARY KEY,
            mapped_to TEXT,
            parent TEXT NOT NULL,
            hierarchy TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS timeslice (
            name TEXT PRIMARY KEY,
            category TEXT NOT NULL,
            duration REAL NOT NULL
        );
        CREATE TABLE IF NOT EXISTS run (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            model TEXT NOT NULL,
            scenario TEXT NOT NULL,
            version INTEGER NOT NULL,
            scheme TEXT NOT NULL DEFAULT '',
            is_scenario INTEGER NOT NULL DEFAULT 0,
            annotation TEXT NOT NULL DEFAULT '',
            committed INTEGER NOT NULL DEFAULT 0,
            is_default INTEGER NOT NULL DEFAULT 0,
            cre_user TEXT NOT NULL,
            cre_date TEXT NOT NULL,
            upd_user TEXT,
            upd_date TEXT,
            lock_session INTEGER,
            lock_ts_only INTEGER NOT NULL DEFAULT 0,
            lock_user TEXT,
            lock_date TEXT,
            UNIQUE (model, scenario, version)
        );
        CREATE TABLE IF NOT EXISTS item (
            run INTEGER NOT NULL REFERENCES run(id) ON DELETE CASCADE,
            name TEXT NOT NULL,
            kind INTEGER NOT NULL,
            ordinal INTEGER NOT NULL,
            index_sets TEXT NOT NULL,
            index_names TEXT NOT NULL,
            PRIMARY KEY (run, name)
        );
        CREATE TABLE IF NOT EXISTS item_element (
            run INTEGER NOT NULL,
            item TEXT NOT NULL,
            ordinal INTEGER NOT NULL,
            key TEXT NOT NULL,
            value REAL NOT NULL DEFAULT 0,
            unit TEXT NOT NULL DEFAULT '',
            level REAL NOT NULL DEFAULT 0,
            marginal REAL NOT NULL DEFAULT 0,
            comment TEXT NOT NULL DEFAULT '',
            PRIMARY KEY (run, item, ordinal),
            FOREIGN KEY (run, item) REFERENCES item(run, name) ON DELETE CASCADE
        );
        CREATE TABLE IF NOT EXISTS timeseries (
            run INTEGER NOT NULL REFERENCES run(id) ON DELETE CASCADE,
            region TEXT NOT NULL,
            variable TEXT NOT NULL,
            unit TEXT NOT NULL,
            subannual TEXT NOT NULL,
            year INTEGER NOT NULL,
            value REAL NOT NULL,
            meta INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (run, region, variable, unit, subannual, year)
        );
        CREATE TABLE IF NOT EXISTS geodata (
            run INTEGER NOT NULL REFERENCES run(id) ON DELETE CASCADE,
            region TEXT NOT NULL,
            variable TEXT NOT NULL,
            subannual TEXT NOT NULL,
            year INTEGER NOT NULL,
            value TEXT NOT NULL,
            unit TEXT NOT NULL,
            meta INTEGER NOT NULL DEFAULT 0,
            PRIMARY KEY (run, region, variable, subannual, year)
        );
        CREATE TABLE IF NOT EXISTS meta (
            model TEXT,
            scenario TEXT,
            version INTEGER,
            key TEXT NOT NULL,
            type INTEGER NOT NULL,
            value TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS checkout_backup (
            run INTEGER PRIMARY KEY REFERENCES run(id) ON DELETE CASCADE,
            data BLOB NOT NULL
        );
    )");

    // Codes present in every database
    ExecuteSQL(R"(
        INSERT OR IGNORE INTO region (region, mapped_to, parent, hierarchy)
            VALUES ('World', NULL, 'World', 'common');
        INSERT OR IGNORE INTO timeslice (name, category, duration)
            VALUES ('Year', 'Common', 1.0);
        INSERT OR IGNORE INTO unit (name, comment)
            VALUES ('???', 'unknown unit');
    )");
}

void SqliteBackend::CreateIndices() {
    // Lookup of runs by (model, scenario) for get, listings and version numbering
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_run_name ON run(model, scenario);");

    // Item and time-series reads are always per run
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_item_run ON item(run, ordinal);");
    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_timeseries_run ON timeseries(run);");
}

sqlite3* SqliteBackend::Db() const {
    if (db_ == nullptr) {
        throw EngineError("Database " + config_.path + " is closed; call open_db() first");
    }
    return db_;
}

void SqliteBackend::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(Db(), sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errmsg(db_);
        if (error_msg) {
            sqlite3_free(error_msg);
        }
        throw EngineError("SQLite error: " + error);
    }
}

void SqliteBackend::BeginTransaction() {
    ExecuteSQL("BEGIN IMMEDIATE TRANSACTION;");
}

void SqliteBackend::CommitTransaction() {
    ExecuteSQL("COMMIT;");
}

void SqliteBackend::RollbackTransaction() {
    if (db_ == nullptr || sqlite3_get_autocommit(db_)) {
        return;
    }
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
        logger_.Error(std::string("Rollback failed: ") + sqlite3_errmsg(db_));
    }
}

template<typename Body>
auto SqliteBackend::InTransaction(Body&& body) -> decltype(body()) {
    BeginTransaction();
    try {
        if constexpr (std::is_void_v<decltype(body())>) {
            body();
            CommitTransaction();
        } else {
            auto result = body();
            CommitTransaction();
            return result;
        }
    } catch (const std::exception&) {
        RollbackTransaction();
        throw;
    }
}

// ============================================================================
// Connection lifecycle
// ============================================================================

void SqliteBackend::OpenDb() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        OpenConnection();
    }
}

void SqliteBackend::CloseDb() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return;
    }
    if (config_.enable_wal && config_.path != ":memory:") {
        // Fold the WAL into the main file before closing
        if (sqlite3_exec(db_, "PRAGMA wal_checkpoint(FULL);", nullptr, nullptr, nullptr) !=
            SQLITE_OK) {
            logger_.Warning("WAL checkpoint failed on " + config_.path);
        }
    }
    sqlite3_close_v2(db_);
    db_ = nullptr;
    logger_.Debug("Closed database " + config_.path);
}

// ============================================================================
// Helper Methods
// ============================================================================

SqliteBackend::RunState SqliteBackend::LoadRunState(const Session& session) const {
    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        throw NotFoundError("Session for " + session.model + "/" + session.scenario +
                            " is not initialized on backend 'sqlite'");
    }

    Statement stmt(Db(), "SELECT model, scenario, version, committed, lock_session, lock_ts_only "
                         "FROM run WHERE id = ?;");
    stmt.Bind(1, it->second);
    if (!stmt.Step()) {
        throw NotFoundError("Run " + std::to_string(it->second) + " no longer exists");
    }

    RunState state;
    state.id = it->second;
    state.model = stmt.Text(0);
    state.scenario = stmt.Text(1);
    state.version = stmt.Int(2);
    state.committed = stmt.Int(3) != 0;
    if (!stmt.IsNull(4)) {
        state.lock_owner = SessionID(static_cast<SessionID::ValueType>(stmt.Int64(4)));
    }
    state.timeseries_only = stmt.Int(5) != 0;
    return state;
}

SqliteBackend::RunState SqliteBackend::WritableRun(const Session& session, bool item_write) const {
    RunState state = LoadRunState(session);
    if (!state.lock_owner || *state.lock_owner != session.id) {
        throw PreconditionError(RunLabel(state.model, state.scenario, state.version) +
                                " is not checked out by this session; call check_out() first");
    }
    if (item_write && state.timeseries_only) {
        throw PreconditionError(RunLabel(state.model, state.scenario, state.version) +
                                " is checked out for time-series edits only");
    }
    return state;
}

int64_t SqliteBackend::CreateRun(const std::string& model, const std::string& scenario,
                                 const std::string& annotation, const std::string& scheme,
                                 bool is_scenario, bool committed,
                                 const std::optional<SessionID>& lock_owner) {
    AddName("model_name", model);
    AddName("scenario_name", scenario);

    Statement next(Db(), "SELECT COALESCE(MAX(version), 0) + 1 FROM run "
                         "WHERE model = ? AND scenario = ?;");
    next.Bind(1, model).Bind(2, scenario);
    next.Step();
    int version = next.Int(0);

    std::string now = CurrentTimestamp();
    Statement insert(Db(), R"(
        INSERT INTO run (model, scenario, version, scheme, is_scenario, annotation, committed,
                         cre_user, cre_date, upd_user, upd_date, lock_session, lock_user, lock_date)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    insert.Bind(1, model).Bind(2, scenario).Bind(3, version).Bind(4, scheme)
          .Bind(5, is_scenario ? 1 : 0).Bind(6, annotation).Bind(7, committed ? 1 : 0)
          .Bind(8, config_.user).Bind(9, now);
    if (committed) {
        insert.Bind(10, config_.user).Bind(11, now);
    } else {
        insert.BindNull(10).BindNull(11);
    }
    if (lock_owner) {
        insert.Bind(12, SessionValue(*lock_owner)).Bind(13, config_.user).Bind(14, now);
    } else {
        insert.BindNull(12).BindNull(13).BindNull(14);
    }
    insert.Run();

    return sqlite3_last_insert_rowid(db_);
}

void SqliteBackend::AddName(const std::string& table, const std::string& name) {
    Statement stmt(Db(), "INSERT OR IGNORE INTO " + table + " (name) VALUES (?);");
    stmt.Bind(1, name).Run();
}

bool SqliteBackend::CodeExists(const std::string& table, const std::string& column,
                               const std::string& value) const {
    Statement stmt(Db(), "SELECT 1 FROM " + table + " WHERE " + column + " = ? LIMIT 1;");
    stmt.Bind(1, value);
    return stmt.Step();
}

void SqliteBackend::RequireCodes(const std::string& region, const std::string& unit,
                                 const std::string& subannual) const {
    if (!CodeExists("region", "region", region)) {
        throw NotFoundError("Region '" + region + "' does not exist");
    }
    if (!CodeExists("unit", "name", unit)) {
        throw NotFoundError("Unit '" + unit + "' does not exist");
    }
    if (!CodeExists("timeslice", "name", subannual)) {
        throw NotFoundError("Time slice '" + subannual + "' does not exist");
    }
}

std::vector<ItemSnapshot> SqliteBackend::LoadItems(int64_t run,
                                                   const std::optional<std::string>& name) const {
    std::string sql = "SELECT name, kind, index_sets, index_names FROM item WHERE run = ?";
    if (name) {
        sql += " AND name = ?";
    }
    sql += " ORDER BY ordinal, rowid;";

    Statement stmt(Db(), sql);
    stmt.Bind(1, run);
    if (name) {
        stmt.Bind(2, *name);
    }

    std::vector<ItemSnapshot> items;
    while (stmt.Step()) {
        ItemSnapshot item;
        item.name = stmt.Text(0);
        item.kind = static_cast<ItemType>(stmt.Int(1));
        item.index_sets = DecodeKey(stmt.Text(2));
        item.index_names = DecodeKey(stmt.Text(3));
        items.push_back(std::move(item));
    }

    Statement rows(Db(), "SELECT key, value, unit, level, marginal, comment FROM item_element "
                         "WHERE run = ? AND item = ? ORDER BY ordinal;");
    for (auto& item : items) {
        rows.Bind(1, run).Bind(2, item.name);
        size_t dimension = item.Dimension();
        while (rows.Step()) {
            ItemRow row;
            row.key = DecodeKey(rows.Text(0));
            if (row.key.empty() && dimension == 1) {
                row.key.emplace_back();
            }
            row.value = rows.Double(1);
            row.unit = rows.Text(2);
            row.level = rows.Double(3);
            row.marginal = rows.Double(4);
            row.comment = rows.Text(5);
            item.rows.push_back(std::move(row));
        }
        rows.Reset();
    }
    return items;
}

ItemLookup SqliteBackend::LoadingLookup(
    int64_t run, std::map<std::string, std::vector<ItemSnapshot>>& loaded) const {
    return [this, run, &loaded](const std::string& name) -> const ItemSnapshot* {
        auto it = loaded.find(name);
        if (it == loaded.end()) {
            it = loaded.emplace(name, LoadItems(run, name)).first;
        }
        return it->second.empty() ? nullptr : &it->second.front();
    };
}

void SqliteBackend::StoreItem(int64_t run, const ItemSnapshot& item, int ordinal) {
    // The ordinal applies to new items only; updates keep definition order
    Statement upsert(Db(), R"(
        INSERT INTO item (run, name, kind, ordinal, index_sets, index_names)
        VALUES (?, ?, ?, ?, ?, ?)
        ON CONFLICT (run, name) DO UPDATE SET
            kind = excluded.kind,
            index_sets = excluded.index_sets,
            index_names = excluded.index_names;
    )");
    upsert.Bind(1, run).Bind(2, item.name).Bind(3, static_cast<int>(item.kind))
          .Bind(4, ordinal).Bind(5, EncodeKey(item.index_sets))
          .Bind(6, EncodeKey(item.index_names));
    upsert.Run();

    Statement clear(Db(), "DELETE FROM item_element WHERE run = ? AND item = ?;");
    clear.Bind(1, run).Bind(2, item.name).Run();

    Statement insert(Db(), R"(
        INSERT INTO item_element (run, item, ordinal, key, value, unit, level, marginal, comment)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )");
    int row_ordinal = 0;
    for (const auto& row : item.rows) {
        insert.Bind(1, run).Bind(2, item.name).Bind(3, row_ordinal++)
              .Bind(4, EncodeKey(row.key)).Bind(5, row.value).Bind(6, row.unit)
              .Bind(7, row.level).Bind(8, row.marginal).Bind(9, row.comment);
        insert.Run();
        insert.Reset();
    }
}

void SqliteBackend::DeleteStoredItem(int64_t run, const std::string& name) {
    Statement elements(Db(), "DELETE FROM item_element WHERE run = ? AND item = ?;");
    elements.Bind(1, run).Bind(2, name).Run();

    Statement item(Db(), "DELETE FROM item WHERE run = ? AND name = ?;");
    item.Bind(1, run).Bind(2, name).Run();
}

std::vector<TimeseriesRecord> SqliteBackend::LoadTimeseries(int64_t run) const {
    Statement stmt(Db(), "SELECT region, variable, unit, subannual, year, value, meta "
                         "FROM timeseries WHERE run = ?;");
    stmt.Bind(1, run);

    std::vector<TimeseriesRecord> rows;
    while (stmt.Step()) {
        rows.push_back(TimeseriesRecord{stmt.Text(0), stmt.Text(1), stmt.Text(2), stmt.Text(3),
                                        stmt.Int(4), stmt.Double(5), stmt.Int(6) != 0});
    }
    SortTimeseries(rows);
    return rows;
}

std::vector<GeodataRecord> SqliteBackend::LoadGeodata(int64_t run) const {
    Statement stmt(Db(), "SELECT region, variable, subannual, year, value, unit, meta "
                         "FROM geodata WHERE run = ?;");
    stmt.Bind(1, run);

    std::vector<GeodataRecord> rows;
    while (stmt.Step()) {
        rows.push_back(GeodataRecord{stmt.Text(0), stmt.Text(1), stmt.Text(2), stmt.Int(3),
                                     stmt.Text(4), stmt.Text(5), stmt.Int(6) != 0});
    }
    SortGeodata(rows);
    return rows;
}

ScenarioSnapshot SqliteBackend::LoadContent(int64_t run) const {
    Statement stmt(Db(), "SELECT scheme, is_scenario FROM run WHERE id = ?;");
    stmt.Bind(1, run);
    if (!stmt.Step()) {
        throw NotFoundError("Run " + std::to_string(run) + " no longer exists");
    }

    ScenarioSnapshot content;
    content.scheme = stmt.Text(0);
    content.is_scenario = stmt.Int(1) != 0;
    content.items = LoadItems(run);
    content.timeseries = LoadTimeseries(run);
    content.geodata = LoadGeodata(run);
    return content;
}

void SqliteBackend::StoreContent(int64_t run, const ScenarioSnapshot& content) {
    for (const char* table : {"item_element", "item", "timeseries", "geodata"}) {
        Statement clear(Db(), std::string("DELETE FROM ") + table + " WHERE run = ?;");
        clear.Bind(1, run).Run();
    }

    Statement update(Db(), "UPDATE run SET scheme = ?, is_scenario = ? WHERE id = ?;");
    update.Bind(1, content.scheme).Bind(2, content.is_scenario ? 1 : 0).Bind(3, run).Run();

    int ordinal = 0;
    for (const auto& item : content.items) {
        StoreItem(run, item, ordinal++);
    }

    Statement ts(Db(), R"(
        INSERT INTO timeseries (run, region, variable, unit, subannual, year, value, meta)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )");
    for (const auto& row : content.timeseries) {
        ts.Bind(1, run).Bind(2, row.region).Bind(3, row.variable).Bind(4, row.unit)
          .Bind(5, row.subannual).Bind(6, row.year).Bind(7, row.value).Bind(8, row.meta ? 1 : 0);
        ts.Run();
        ts.Reset();
    }

    Statement geo(Db(), R"(
        INSERT INTO geodata (run, region, variable, subannual, year, value, unit, meta)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?);
    )");
    for (const auto& row : content.geodata) {
        geo.Bind(1, run).Bind(2, row.region).Bind(3, row.variable).Bind(4, row.subannual)
           .Bind(5, row.year).Bind(6, row.value).Bind(7, row.unit).Bind(8, row.meta ? 1 : 0);
        geo.Run();
        geo.Reset();
    }
}

void SqliteBackend::SaveBackup(int64_t run, const ScenarioSnapshot& content) {
    Statement stmt(Db(), "INSERT OR REPLACE INTO checkout_backup (run, data) VALUES (?, ?);");
    stmt.Bind(1, run).BindBlob(2, SerializeSnapshot(content)).Run();
}

std::optional<ScenarioSnapshot> SqliteBackend::LoadBackup(int64_t run) const {
    Statement stmt(Db(), "SELECT data FROM checkout_backup WHERE run = ?;");
    stmt.Bind(1, run);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return DeserializeSnapshot(stmt.Blob(0), stmt.Bytes(0));
}

void SqliteBackend::DeleteBackup(int64_t run) {
    Statement stmt(Db(), "DELETE FROM checkout_backup WHERE run = ?;");
    stmt.Bind(1, run).Run();
}

std::vector<MetaEntry> SqliteBackend::LoadMeta() const {
    Statement stmt(Db(), "SELECT model, scenario, version, key, type, value FROM meta "
                         "ORDER BY rowid;");

    std::vector<MetaEntry> entries;
    while (stmt.Step()) {
        MetaEntry entry;
        entry.scope.model = stmt.OptText(0);
        entry.scope.scenario = stmt.OptText(1);
        if (!stmt.IsNull(2)) {
            entry.scope.version = stmt.Int(2);
        }
        entry.key = stmt.Text(3);
        entry.value = MetaValue::FromStored(static_cast<MetaValue::Type>(stmt.Int(4)),
                                            stmt.Text(5));
        entries.push_back(std::move(entry));
    }
    return entries;
}

void SqliteBackend::RegisterSnapshotCodes(const ScenarioSnapshot& snapshot) {
    std::set<std::string> units;
    std::set<std::string> regions;
    std::set<std::string> timeslices;

    for (const auto& item : snapshot.items) {
        if (item.kind == ItemType::PAR) {
            for (const auto& row : item.rows) {
                if (!row.unit.empty()) units.insert(row.unit);
            }
        }
    }
    for (const auto& ts : snapshot.timeseries) {
        units.insert(ts.unit);
        regions.insert(ts.region);
        timeslices.insert(ts.subannual);
    }
    for (const auto& geo : snapshot.geodata) {
        units.insert(geo.unit);
        regions.insert(geo.region);
        timeslices.insert(geo.subannual);
    }

    for (const auto& unit : units) {
        if (!CodeExists("unit", "name", unit)) {
            Statement stmt(Db(), "INSERT INTO unit (name, comment) VALUES (?, 'added by clone');");
            stmt.Bind(1, unit).Run();
            logger_.Info("Added unit '" + unit + "' referenced by cloned data");
        }
    }
    for (const auto& region : regions) {
        if (!CodeExists("region", "region", region)) {
            Statement stmt(Db(), "INSERT INTO region (region, mapped_to, parent, hierarchy) "
                                 "VALUES (?, NULL, 'World', '');");
            stmt.Bind(1, region).Run();
            logger_.Info("Added region '" + region + "' referenced by cloned data");
        }
    }
    for (const auto& name : timeslices) {
        if (!CodeExists("timeslice", "name", name)) {
            Statement stmt(Db(), "INSERT INTO timeslice (name, category, duration) "
                                 "VALUES (?, 'Common', 1.0);");
            stmt.Bind(1, name).Run();
            logger_.Info("Added time slice '" + name + "' referenced by cloned data");
        }
    }
}

void SqliteBackend::CheckMetaScopeExists(const MetaScope& scope) const {
    if (scope.model && !CodeExists("model_name", "name", *scope.model)) {
        throw NotFoundError("Model '" + *scope.model + "' does not exist");
    }
    if (scope.scenario && !CodeExists("scenario_name", "name", *scope.scenario)) {
        throw NotFoundError("Scenario '" + *scope.scenario + "' does not exist");
    }
    if (scope.version) {
        Statement stmt(Db(), "SELECT 1 FROM run WHERE model = ? AND scenario = ? "
                             "AND version = ? AND committed = 1;");
        stmt.Bind(1, *scope.model).Bind(2, *scope.scenario).Bind(3, *scope.version);
        if (!stmt.Step()) {
            throw NotFoundError(RunLabel(*scope.model, *scope.scenario, *scope.version) +
                                " does not exist");
        }
    }
}

std::vector<uint8_t> SqliteBackend::SerializeSnapshot(const ScenarioSnapshot& snapshot) {
    std::ostringstream oss(std::ios::binary);
    snapshot.Serialize(oss);
    std::string str = oss.str();
    return std::vector<uint8_t>(str.begin(), str.end());
}

ScenarioSnapshot SqliteBackend::DeserializeSnapshot(const void* data, int size) {
    std::string str(static_cast<const char*>(data), static_cast<size_t>(size));
    std::istringstream iss(str, std::ios::binary);
    return ScenarioSnapshot::Deserialize(iss);
}

// ============================================================================
// Registries
// ============================================================================

void SqliteBackend::SetNode(const std::string& name,
                            const std::optional<std::string>& parent,
                            const std::optional<std::string>& hierarchy,
                            const std::optional<std::string>& synonym) {
    std::lock_guard<std::mutex> lock(mutex_);

    const char* upsert = R"(
        INSERT INTO region (region, mapped_to, parent, hierarchy) VALUES (?, ?, ?, ?)
        ON CONFLICT (region) DO UPDATE SET
            mapped_to = excluded.mapped_to,
            parent = excluded.parent,
            hierarchy = excluded.hierarchy;
    )";

    if (synonym) {
        Statement mapped(Db(), "SELECT parent, hierarchy FROM region WHERE region = ?;");
        mapped.Bind(1, name);
        if (!mapped.Step()) {
            throw NotFoundError("Region '" + name + "' does not exist; cannot add synonym '" +
                                *synonym + "'");
        }
        std::string mapped_parent = mapped.Text(0);
        std::string mapped_hierarchy = mapped.Text(1);

        Statement stmt(Db(), upsert);
        stmt.Bind(1, *synonym).Bind(2, name).Bind(3, mapped_parent).Bind(4, mapped_hierarchy);
        stmt.Run();
        return;
    }

    Statement stmt(Db(), upsert);
    stmt.Bind(1, name).BindNull(2).Bind(3, parent.value_or("World"))
        .Bind(4, hierarchy.value_or(""));
    stmt.Run();
}

std::vector<RegionRecord> SqliteBackend::GetNodes() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(Db(), "SELECT region, mapped_to, parent, hierarchy FROM region ORDER BY rowid;");
    std::vector<RegionRecord> regions;
    while (stmt.Step()) {
        regions.push_back(RegionRecord{stmt.Text(0), stmt.OptText(1), stmt.Text(2), stmt.Text(3)});
    }
    return regions;
}

void SqliteBackend::SetTimeslice(const std::string& name, const std::string& category,
                                 double duration) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(Db(), R"(
        INSERT INTO timeslice (name, category, duration) VALUES (?, ?, ?)
        ON CONFLICT (name) DO UPDATE SET
            category = excluded.category,
            duration = excluded.duration;
    )");
    stmt.Bind(1, name).Bind(2, category).Bind(3, duration).Run();
}

std::vector<TimesliceRecord> SqliteBackend::GetTimeslices() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(Db(), "SELECT name, category, duration FROM timeslice ORDER BY rowid;");
    std::vector<TimesliceRecord> slices;
    while (stmt.Step()) {
        slices.push_back(TimesliceRecord{stmt.Text(0), stmt.Text(1), stmt.Double(2)});
    }
    return slices;
}

void SqliteBackend::AddModelName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    AddName("model_name", name);
}

void SqliteBackend::AddScenarioName(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    AddName("scenario_name", name);
}

std::vector<std::string> SqliteBackend::GetModelNames() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(Db(), "SELECT name FROM model_name ORDER BY rowid;");
    std::vector<std::string> names;
    while (stmt.Step()) {
        names.push_back(stmt.Text(0));
    }
    return names;
}

std::vector<std::string> SqliteBackend::GetScenarioNames() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(Db(), "SELECT name FROM scenario_name ORDER BY rowid;");
    std::vector<std::string> names;
    while (stmt.Step()) {
        names.push_back(stmt.Text(0));
    }
    return names;
}

std::vector<ScenarioInfo> SqliteBackend::GetScenarios(bool default_only,
                                                      const std::optional<std::string>& model,
                                                      const std::optional<std::string>& scenario) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = R"(
        SELECT model, scenario, scheme, is_default, lock_session IS NOT NULL,
               cre_user, cre_date, upd_user, upd_date, lock_user, lock_date,
               annotation, version
        FROM run WHERE committed = 1
    )";
    if (default_only) sql += " AND is_default = 1";
    if (model) sql += " AND model = ?";
    if (scenario) sql += " AND scenario = ?";
    sql += " ORDER BY model, scenario, version;";

    Statement stmt(Db(), sql);
    int index = 1;
    if (model) stmt.Bind(index++, *model);
    if (scenario) stmt.Bind(index++, *scenario);

    std::vector<ScenarioInfo> result;
    while (stmt.Step()) {
        ScenarioInfo info;
        info.model = stmt.Text(0);
        info.scenario = stmt.Text(1);
        info.scheme = stmt.Text(2);
        info.is_default = stmt.Int(3) != 0;
        info.is_locked = stmt.Int(4) != 0;
        info.cre_user = stmt.Text(5);
        info.cre_date = stmt.Text(6);
        info.upd_user = stmt.OptText(7);
        info.upd_date = stmt.OptText(8);
        info.lock_user = stmt.OptText(9);
        info.lock_date = stmt.OptText(10);
        info.annotation = stmt.Text(11);
        info.version = stmt.Int(12);
        result.push_back(std::move(info));
    }
    return result;
}

void SqliteBackend::SetUnit(const std::string& name, const std::string& comment) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(Db(), R"(
        INSERT INTO unit (name, comment) VALUES (?, ?)
        ON CONFLICT (name) DO UPDATE SET comment = excluded.comment;
    )");
    stmt.Bind(1, name).Bind(2, comment).Run();
}

std::vector<std::string> SqliteBackend::GetUnits() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(Db(), "SELECT name FROM unit ORDER BY rowid;");
    std::vector<std::string> names;
    while (stmt.Step()) {
        names.push_back(stmt.Text(0));
    }
    return names;
}

// ============================================================================
// Session lifecycle
// ============================================================================

void SqliteBackend::Init(Session& session, const std::string& annotation) {
    if (session.model.empty() || session.scenario.empty()) {
        throw ValidationError("Model and scenario names must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    int64_t run = InTransaction([&] {
        return CreateRun(session.model, session.scenario, annotation, session.scheme,
                         session.is_scenario, false, session.id);
    });

    sessions_[session.id] = run;
    session.version = 0;
}

void SqliteBackend::Get(Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = "SELECT id, version, scheme FROM run "
                      "WHERE model = ? AND scenario = ? AND committed = 1";
    sql += session.version ? " AND version = ?;" : " AND is_default = 1;";

    Statement stmt(Db(), sql);
    stmt.Bind(1, session.model).Bind(2, session.scenario);
    if (session.version) {
        stmt.Bind(3, *session.version);
    }

    if (!stmt.Step()) {
        if (session.version) {
            throw NotFoundError(RunLabel(session.model, session.scenario, *session.version) +
                                " does not exist");
        }
        throw NotFoundError("No default version of " + session.model + "/" +
                            session.scenario + " exists");
    }

    sessions_[session.id] = stmt.Int64(0);
    session.version = stmt.Int(1);
    session.scheme = stmt.Text(2);
}

void SqliteBackend::DelTs(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (sessions_.count(session.id) == 0) {
        return;
    }
    if (db_ == nullptr) {
        // Without a connection a held lock stays in the file
        logger_.Debug("Released " + session.model + "/" + session.scenario +
                      " while the database is closed");
        sessions_.erase(session.id);
        return;
    }

    try {
        InTransaction([&] {
            RunState state = LoadRunState(session);
            if (!state.lock_owner || *state.lock_owner != session.id) {
                return;
            }

            // The owner is gone: drop its uncommitted run or roll back its edits
            std::string label = RunLabel(state.model, state.scenario, state.version);
            if (!state.committed) {
                Statement drop(Db(), "DELETE FROM run WHERE id = ?;");
                drop.Bind(1, state.id).Run();
                logger_.Debug("Dropped uncommitted " + label);
                return;
            }

            std::optional<ScenarioSnapshot> backup = LoadBackup(state.id);
            if (backup) {
                StoreContent(state.id, *backup);
            }
            DeleteBackup(state.id);
            Statement release(Db(), "UPDATE run SET lock_session = NULL, lock_ts_only = 0, "
                                    "lock_user = NULL, lock_date = NULL WHERE id = ?;");
            release.Bind(1, state.id).Run();
            logger_.Warning("Released the lock on " + label +
                            " held by a closed session; changes discarded");
        });
    } catch (...) {
        sessions_.erase(session.id);
        throw;
    }
    sessions_.erase(session.id);
}

void SqliteBackend::CheckOut(const Session& session, bool timeseries_only) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = LoadRunState(session);
        std::string label = RunLabel(state.model, state.scenario, state.version);
        if (state.lock_owner && *state.lock_owner != session.id) {
            Statement who(Db(), "SELECT lock_user, lock_date FROM run WHERE id = ?;");
            who.Bind(1, state.id);
            who.Step();
            throw PreconditionError(label + " is checked out by another session (user " +
                                    who.OptText(0).value_or("unknown") + " since " +
                                    who.OptText(1).value_or("unknown") + ")");
        }
        if (state.lock_owner && state.committed) {
            throw PreconditionError(label + " is already checked out by this session");
        }

        Statement stmt(Db(), R"(
            UPDATE run SET lock_session = ?, lock_ts_only = ?, lock_user = ?, lock_date = ?
            WHERE id = ? AND (lock_session IS NULL OR lock_session = ?);
        )");
        stmt.Bind(1, SessionValue(session.id)).Bind(2, timeseries_only ? 1 : 0)
            .Bind(3, config_.user).Bind(4, CurrentTimestamp()).Bind(5, state.id)
            .Bind(6, SessionValue(session.id));
        stmt.Run();
        if (sqlite3_changes(db_) == 0) {
            throw PreconditionError(label + " is checked out by another session");
        }

        SaveBackup(state.id, LoadContent(state.id));
    });
}

void SqliteBackend::Commit(Session& session, const std::string& comment) {
    std::lock_guard<std::mutex> lock(mutex_);

    int version = InTransaction([&] {
        RunState state = LoadRunState(session);
        if (!state.lock_owner || *state.lock_owner != session.id) {
            throw PreconditionError(RunLabel(state.model, state.scenario, state.version) +
                                    " is not checked out by this session; nothing to commit");
        }

        Statement stmt(Db(), R"(
            UPDATE run SET committed = 1, upd_user = ?, upd_date = ?,
                           lock_session = NULL, lock_ts_only = 0,
                           lock_user = NULL, lock_date = NULL
            WHERE id = ?;
        )");
        stmt.Bind(1, config_.user).Bind(2, CurrentTimestamp()).Bind(3, state.id).Run();
        DeleteBackup(state.id);

        logger_.Debug("Commit " + RunLabel(state.model, state.scenario, state.version) +
                      (comment.empty() ? std::string() : ": " + comment));
        return state.version;
    });

    session.version = version;
}

void SqliteBackend::DiscardChanges(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = LoadRunState(session);
        if (!state.lock_owner || *state.lock_owner != session.id) {
            throw PreconditionError(RunLabel(state.model, state.scenario, state.version) +
                                    " is not checked out by this session; nothing to discard");
        }

        std::optional<ScenarioSnapshot> backup = LoadBackup(state.id);
        if (backup) {
            StoreContent(state.id, *backup);
        } else if (!state.committed) {
            ScenarioSnapshot empty;
            Statement scheme(Db(), "SELECT scheme, is_scenario FROM run WHERE id = ?;");
            scheme.Bind(1, state.id);
            if (scheme.Step()) {
                empty.scheme = scheme.Text(0);
                empty.is_scenario = scheme.Int(1) != 0;
            }
            StoreContent(state.id, empty);
        }
        DeleteBackup(state.id);

        // A run that was never committed stays editable by its creator
        if (state.committed) {
            Statement stmt(Db(), "UPDATE run SET lock_session = NULL, lock_ts_only = 0, "
                                 "lock_user = NULL, lock_date = NULL WHERE id = ?;");
            stmt.Bind(1, state.id).Run();
        } else {
            Statement stmt(Db(), "UPDATE run SET lock_ts_only = 0 WHERE id = ?;");
            stmt.Bind(1, state.id).Run();
        }
    });
}

void SqliteBackend::SetAsDefault(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = LoadRunState(session);
        if (!state.committed) {
            throw PreconditionError(state.model + "/" + state.scenario +
                                    " must be committed before it can be the default version");
        }

        Statement clear(Db(), "UPDATE run SET is_default = 0 WHERE model = ? AND scenario = ?;");
        clear.Bind(1, state.model).Bind(2, state.scenario).Run();

        Statement set(Db(), "UPDATE run SET is_default = 1 WHERE id = ?;");
        set.Bind(1, state.id).Run();
    });
}

bool SqliteBackend::IsDefault(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = LoadRunState(session);
    Statement stmt(Db(), "SELECT is_default FROM run WHERE id = ?;");
    stmt.Bind(1, state.id);
    return stmt.Step() && stmt.Int(0) != 0;
}

std::optional<std::string> SqliteBackend::LastUpdate(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = LoadRunState(session);
    Statement stmt(Db(), "SELECT upd_date FROM run WHERE id = ?;");
    stmt.Bind(1, state.id);
    if (!stmt.Step()) {
        return std::nullopt;
    }
    return stmt.OptText(0);
}

int64_t SqliteBackend::RunId(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadRunState(session).id;
}

bool SqliteBackend::IsCheckedOut(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    RunState state = LoadRunState(session);
    return state.lock_owner && *state.lock_owner == session.id;
}

// ============================================================================
// Time-series data
// ============================================================================

std::vector<TimeseriesRecord> SqliteBackend::GetData(const Session& session,
                                                     const std::vector<std::string>& regions,
                                                     const std::vector<std::string>& variables,
                                                     const std::vector<std::string>& units,
                                                     const std::vector<int>& years) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = LoadRunState(session);
    return FilterTimeseries(LoadTimeseries(state.id), regions, variables, units, years);
}

void SqliteBackend::SetData(const Session& session, const std::string& region,
                            const std::string& variable, const std::map<int, double>& data,
                            const std::string& unit, const std::string& subannual, bool meta) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, false);
        RequireCodes(region, unit, subannual);

        Statement stmt(Db(), R"(
            INSERT INTO timeseries (run, region, variable, unit, subannual, year, value, meta)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT (run, region, variable, unit, subannual, year) DO UPDATE SET
                value = excluded.value,
                meta = excluded.meta;
        )");
        for (const auto& [year, value] : data) {
            stmt.Bind(1, state.id).Bind(2, region).Bind(3, variable).Bind(4, unit)
                .Bind(5, subannual).Bind(6, year).Bind(7, value).Bind(8, meta ? 1 : 0);
            stmt.Run();
            stmt.Reset();
        }
    });
}

void SqliteBackend::Delete(const Session& session, const std::string& region,
                           const std::string& variable, const std::string& subannual,
                           const std::vector<int>& years, const std::string& unit) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, false);

        Statement stmt(Db(), "DELETE FROM timeseries WHERE run = ? AND region = ? "
                             "AND variable = ? AND subannual = ? AND unit = ? AND year = ?;");
        for (int year : years) {
            stmt.Bind(1, state.id).Bind(2, region).Bind(3, variable).Bind(4, subannual)
                .Bind(5, unit).Bind(6, year);
            stmt.Run();
            stmt.Reset();
        }
    });
}

std::vector<GeodataRecord> SqliteBackend::GetGeo(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadGeodata(LoadRunState(session).id);
}

void SqliteBackend::SetGeo(const Session& session, const GeodataRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = WritableRun(session, false);
    RequireCodes(record.region, record.unit, record.subannual);

    Statement stmt(Db(), R"(
        INSERT INTO geodata (run, region, variable, subannual, year, value, unit, meta)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT (run, region, variable, subannual, year) DO UPDATE SET
            value = excluded.value,
            unit = excluded.unit,
            meta = excluded.meta;
    )");
    stmt.Bind(1, state.id).Bind(2, record.region).Bind(3, record.variable)
        .Bind(4, record.subannual).Bind(5, record.year).Bind(6, record.value)
        .Bind(7, record.unit).Bind(8, record.meta ? 1 : 0);
    stmt.Run();
}

void SqliteBackend::DeleteGeo(const Session& session, const std::string& region,
                              const std::string& variable, const std::string& subannual,
                              const std::vector<int>& years, const std::string& unit) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, false);

        Statement stmt(Db(), "DELETE FROM geodata WHERE run = ? AND region = ? "
                             "AND variable = ? AND subannual = ? AND unit = ? AND year = ?;");
        for (int year : years) {
            stmt.Bind(1, state.id).Bind(2, region).Bind(3, variable).Bind(4, subannual)
                .Bind(5, unit).Bind(6, year);
            stmt.Run();
            stmt.Reset();
        }
    });
}

// ============================================================================
// Item data
// ============================================================================

std::vector<std::string> SqliteBackend::ListItems(const Session& session, ItemType kind) {
    if (kind == ItemType::TS) {
        throw ValidationError("Time series are not items; use get_data()");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = LoadRunState(session);
    Statement stmt(Db(), "SELECT name FROM item WHERE run = ? AND kind = ? "
                         "ORDER BY ordinal, rowid;");
    stmt.Bind(1, state.id).Bind(2, static_cast<int>(kind));

    std::vector<std::string> names;
    while (stmt.Step()) {
        names.push_back(stmt.Text(0));
    }
    return names;
}

void SqliteBackend::InitItem(const Session& session, ItemType kind, const std::string& name,
                             const std::vector<std::string>& index_sets,
                             const std::vector<std::string>& index_names) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, true);

        std::map<std::string, std::vector<ItemSnapshot>> loaded;
        ItemSnapshot item = MakeItemDefinition(kind, name, index_sets, index_names,
                                               LoadingLookup(state.id, loaded));

        Statement next(Db(), "SELECT COALESCE(MAX(ordinal), -1) + 1 FROM item WHERE run = ?;");
        next.Bind(1, state.id);
        next.Step();

        StoreItem(state.id, item, next.Int(0));
    });
}

void SqliteBackend::DeleteItem(const Session& session, ItemType kind, const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, true);

        ScenarioSnapshot content;
        content.items = LoadItems(state.id);
        RequireItem(content.FindItem(name), kind, name);

        auto dependents = ItemsIndexedBy(content.items, name);
        if (!dependents.empty()) {
            std::string names;
            for (const auto& dependent : dependents) {
                names += names.empty() ? dependent : ", " + dependent;
            }
            throw ValidationError("Cannot delete '" + name + "': it indexes " + names);
        }

        DeleteStoredItem(state.id, name);
    });
}

std::vector<std::string> SqliteBackend::ItemIndex(const Session& session,
                                                  const std::string& name,
                                                  IndexField field) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = LoadRunState(session);
    Statement stmt(Db(), "SELECT index_sets, index_names FROM item WHERE run = ? AND name = ?;");
    stmt.Bind(1, state.id).Bind(2, name);
    if (!stmt.Step()) {
        throw NotFoundError("No item named '" + name + "'");
    }
    return DecodeKey(stmt.Text(field == IndexField::SETS ? 0 : 1));
}

ItemData SqliteBackend::ItemGetElements(const Session& session, ItemType kind,
                                        const std::string& name, const Filters& filters) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = LoadRunState(session);
    std::vector<ItemSnapshot> items = LoadItems(state.id, name);
    const ItemSnapshot& item = RequireItem(items.empty() ? nullptr : &items.front(), kind, name);
    return BuildItemData(item, filters);
}

void SqliteBackend::ItemSetElements(const Session& session, ItemType kind,
                                    const std::string& name,
                                    const std::vector<Element>& elements) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, true);

        std::map<std::string, std::vector<ItemSnapshot>> loaded;
        ItemLookup find = LoadingLookup(state.id, loaded);
        RequireItem(find(name), kind, name);
        ItemSnapshot& item = loaded[name].front();

        ValidateElements(item, elements, find,
                         [this](const std::string& unit) {
                             return CodeExists("unit", "name", unit);
                         });
        MergeElements(item, elements);
        StoreItem(state.id, item, 0);
    });
}

void SqliteBackend::ItemSetSolution(const Session& session, ItemType kind,
                                    const std::string& name,
                                    const std::vector<SolutionElement>& elements) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, true);

        std::map<std::string, std::vector<ItemSnapshot>> loaded;
        ItemLookup find = LoadingLookup(state.id, loaded);
        RequireItem(find(name), kind, name);
        ItemSnapshot& item = loaded[name].front();

        ValidateSolution(item, elements, find);
        MergeSolution(item, elements);
        StoreItem(state.id, item, 0);
    });
}

void SqliteBackend::ItemDeleteElements(const Session& session, ItemType kind,
                                       const std::string& name,
                                       const std::vector<Key>& keys) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = WritableRun(session, true);

        std::vector<ItemSnapshot> items = LoadItems(state.id, name);
        RequireItem(items.empty() ? nullptr : &items.front(), kind, name);
        ItemSnapshot& item = items.front();

        std::set<std::string> removed = RemoveElements(item, keys);
        StoreItem(state.id, item, 0);

        // Only set members can be referenced by the rows of other items
        if (removed.empty()) {
            return;
        }
        for (auto& dependent : LoadItems(state.id)) {
            if (dependent.name == name) {
                continue;
            }
            size_t count = RemoveDependentRows(dependent, name, removed);
            if (count > 0) {
                StoreItem(state.id, dependent, 0);
                logger_.Debug("Removed " + std::to_string(count) + " row(s) of '" +
                              dependent.name + "' indexed by removed members of '" + name + "'");
            }
        }
    });
}

// ============================================================================
// Scenario lifecycle
// ============================================================================

ScenarioSnapshot SqliteBackend::ExportSnapshot(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);
    return LoadContent(LoadRunState(session).id);
}

int SqliteBackend::ImportSnapshot(const std::string& model, const std::string& scenario,
                                  const std::string& annotation,
                                  const ScenarioSnapshot& snapshot) {
    if (model.empty() || scenario.empty()) {
        throw ValidationError("Model and scenario names must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    return InTransaction([&] {
        RegisterSnapshotCodes(snapshot);

        int64_t run = CreateRun(model, scenario, annotation, snapshot.scheme,
                                snapshot.is_scenario, true, std::nullopt);
        StoreContent(run, snapshot);

        Statement stmt(Db(), "SELECT version FROM run WHERE id = ?;");
        stmt.Bind(1, run);
        stmt.Step();
        return stmt.Int(0);
    });
}

bool SqliteBackend::HasSolution(const Session& session) {
    std::lock_guard<std::mutex> lock(mutex_);

    RunState state = LoadRunState(session);
    Statement stmt(Db(), "SELECT 1 FROM item_element e JOIN item i "
                         "ON e.run = i.run AND e.item = i.name "
                         "WHERE e.run = ? AND i.kind IN (?, ?) LIMIT 1;");
    stmt.Bind(1, state.id).Bind(2, static_cast<int>(ItemType::VAR))
        .Bind(3, static_cast<int>(ItemType::EQU));
    return stmt.Step();
}

void SqliteBackend::ClearSolution(const Session& session, std::optional<int> from_year) {
    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        RunState state = LoadRunState(session);
        if (state.lock_owner && *state.lock_owner != session.id) {
            throw PreconditionError(RunLabel(state.model, state.scenario, state.version) +
                                    " is checked out by another session");
        }

        ScenarioSnapshot content = LoadContent(state.id);
        ClearSolutionData(content, from_year);
        StoreContent(state.id, content);

        std::optional<ScenarioSnapshot> backup = LoadBackup(state.id);
        if (backup) {
            ClearSolutionData(*backup, from_year);
            SaveBackup(state.id, *backup);
        }

        Statement stmt(Db(), "UPDATE run SET upd_user = ?, upd_date = ? WHERE id = ?;");
        stmt.Bind(1, config_.user).Bind(2, CurrentTimestamp()).Bind(3, state.id).Run();
    });
}

// ============================================================================
// Meta
// ============================================================================

MetaMap SqliteBackend::GetMeta(const std::optional<std::string>& model,
                               const std::optional<std::string>& scenario,
                               const std::optional<int>& version, bool strict) {
    MetaScope scope = MakeMetaScope(model, scenario, version);

    std::lock_guard<std::mutex> lock(mutex_);
    return CollectMeta(LoadMeta(), scope, strict);
}

void SqliteBackend::SetMeta(const MetaMap& meta, const std::optional<std::string>& model,
                            const std::optional<std::string>& scenario,
                            const std::optional<int>& version) {
    MetaScope scope = MakeMetaScope(model, scenario, version);

    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        CheckMetaScopeExists(scope);

        std::vector<std::string> keys;
        for (const auto& [key, value] : meta) {
            keys.push_back(key);
        }
        CheckMetaConflicts(LoadMeta(), scope, keys);

        Statement remove(Db(), "DELETE FROM meta WHERE model IS ? AND scenario IS ? "
                               "AND version IS ? AND key = ?;");
        Statement insert(Db(), "INSERT INTO meta (model, scenario, version, key, type, value) "
                               "VALUES (?, ?, ?, ?, ?, ?);");
        for (const auto& [key, value] : meta) {
            remove.Bind(1, scope.model).Bind(2, scope.scenario).Bind(3, scope.version)
                  .Bind(4, key);
            remove.Run();
            remove.Reset();

            insert.Bind(1, scope.model).Bind(2, scope.scenario).Bind(3, scope.version)
                  .Bind(4, key).Bind(5, static_cast<int>(value.type())).Bind(6, value.ToString());
            insert.Run();
            insert.Reset();
        }
    });
}

void SqliteBackend::RemoveMeta(const std::vector<std::string>& names,
                               const std::optional<std::string>& model,
                               const std::optional<std::string>& scenario,
                               const std::optional<int>& version) {
    MetaScope scope = MakeMetaScope(model, scenario, version);

    std::lock_guard<std::mutex> lock(mutex_);

    InTransaction([&] {
        Statement remove(Db(), "DELETE FROM meta WHERE model IS ? AND scenario IS ? "
                               "AND version IS ? AND key = ?;");
        for (const auto& name : names) {
            remove.Bind(1, scope.model).Bind(2, scope.scenario).Bind(3, scope.version)
                  .Bind(4, name);
            remove.Run();
            remove.Reset();
        }
    });
}

} // namespace modelstore
