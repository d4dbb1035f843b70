// File: src/storage/sqlite_backend.hpp
#pragma once

#include "storage/backend.hpp"
#include "storage/engine_rules.hpp"
#include <map>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <unordered_map>

namespace modelstore {

/// Persistent storage engine using SQLite
///
/// Runs, registries, item elements, time series and meta annotations live in
/// one SQLite database file, so data survives the process and can be shared
/// by several platforms opening the same file. Features:
/// - Durable writes with WAL (Write-Ahead Logging)
/// - Every multi-row write runs in a transaction
/// - Run locks stored with the run, so they are visible to every connection
/// - Checkout backups stored as snapshot blobs and restored by discard
class SqliteBackend : public Backend {
public:
    /// Configuration for SqliteBackend
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private database)
        std::string path;

        /// User recorded as creator/updater/locker of runs
        std::string user{DefaultUser()};

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Time to wait on a locked database before failing
        size_t busy_timeout_ms{5000};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// Build a Config from string options
    /// @throws ValidationError for unknown keys, a missing path or malformed values
    static Config ConfigFromOptions(const BackendOptions& options);

    /// Construct SqliteBackend and open the database
    /// @throws EngineError if the database cannot be opened
    explicit SqliteBackend(const Config& config);

    /// Destructor - closes database connection
    ~SqliteBackend() override;

    // Prevent copying (SQLite connection is not copyable)
    SqliteBackend(const SqliteBackend&) = delete;
    SqliteBackend& operator=(const SqliteBackend&) = delete;

    // ========================================================================
    // Backend Interface Implementation
    // ========================================================================

    std::string Name() const override { return "sqlite"; }

    void OpenDb() override;
    void CloseDb() override;

    void SetNode(const std::string& name,
                 const std::optional<std::string>& parent,
                 const std::optional<std::string>& hierarchy,
                 const std::optional<std::string>& synonym) override;
    std::vector<RegionRecord> GetNodes() override;
    void SetTimeslice(const std::string& name, const std::string& category,
                      double duration) override;
    std::vector<TimesliceRecord> GetTimeslices() override;
    void AddModelName(const std::string& name) override;
    void AddScenarioName(const std::string& name) override;
    std::vector<std::string> GetModelNames() override;
    std::vector<std::string> GetScenarioNames() override;
    std::vector<ScenarioInfo> GetScenarios(bool default_only,
                                           const std::optional<std::string>& model,
                                           const std::optional<std::string>& scenario) override;
    void SetUnit(const std::string& name, const std::string& comment) override;
    std::vector<std::string> GetUnits() override;

    void Init(Session& session, const std::string& annotation) override;
    void Get(Session& session) override;
    void DelTs(const Session& session) override;
    void CheckOut(const Session& session, bool timeseries_only) override;
    void Commit(Session& session, const std::string& comment) override;
    void DiscardChanges(const Session& session) override;
    void SetAsDefault(const Session& session) override;
    bool IsDefault(const Session& session) override;
    std::optional<std::string> LastUpdate(const Session& session) override;
    int64_t RunId(const Session& session) override;
    bool IsCheckedOut(const Session& session) override;

    std::vector<TimeseriesRecord> GetData(const Session& session,
                                          const std::vector<std::string>& regions,
                                          const std::vector<std::string>& variables,
                                          const std::vector<std::string>& units,
                                          const std::vector<int>& years) override;
    void SetData(const Session& session, const std::string& region,
                 const std::string& variable, const std::map<int, double>& data,
                 const std::string& unit, const std::string& subannual, bool meta) override;
    void Delete(const Session& session, const std::string& region,
                const std::string& variable, const std::string& subannual,
                const std::vector<int>& years, const std::string& unit) override;
    std::vector<GeodataRecord> GetGeo(const Session& session) override;
    void SetGeo(const Session& session, const GeodataRecord& record) override;
    void DeleteGeo(const Session& session, const std::string& region,
                   const std::string& variable, const std::string& subannual,
                   const std::vector<int>& years, const std::string& unit) override;

    std::vector<std::string> ListItems(const Session& session, ItemType kind) override;
    void InitItem(const Session& session, ItemType kind, const std::string& name,
                  const std::vector<std::string>& index_sets,
                  const std::vector<std::string>& index_names) override;
    void DeleteItem(const Session& session, ItemType kind, const std::string& name) override;
    std::vector<std::string> ItemIndex(const Session& session, const std::string& name,
                                       IndexField field) override;
    ItemData ItemGetElements(const Session& session, ItemType kind, const std::string& name,
                             const Filters& filters) override;
    void ItemSetElements(const Session& session, ItemType kind, const std::string& name,
                         const std::vector<Element>& elements) override;
    void ItemSetSolution(const Session& session, ItemType kind, const std::string& name,
                         const std::vector<SolutionElement>& elements) override;
    void ItemDeleteElements(const Session& session, ItemType kind, const std::string& name,
                            const std::vector<Key>& keys) override;

    std::string CloneFormat() const override { return kSnapshotFormat; }
    ScenarioSnapshot ExportSnapshot(const Session& session) override;
    int ImportSnapshot(const std::string& model, const std::string& scenario,
                       const std::string& annotation,
                       const ScenarioSnapshot& snapshot) override;
    bool HasSolution(const Session& session) override;
    void ClearSolution(const Session& session, std::optional<int> from_year) override;

    MetaMap GetMeta(const std::optional<std::string>& model,
                    const std::optional<std::string>& scenario,
                    const std::optional<int>& version, bool strict) override;
    void SetMeta(const MetaMap& meta, const std::optional<std::string>& model,
                 const std::optional<std::string>& scenario,
                 const std::optional<int>& version) override;
    void RemoveMeta(const std::vector<std::string>& names,
                    const std::optional<std::string>& model,
                    const std::optional<std::string>& scenario,
                    const std::optional<int>& version) override;

private:
    /// Lock columns of one run row
    struct RunState {
        int64_t id{0};
        std::string model;
        std::string scenario;
        int version{0};
        bool committed{false};
        std::optional<SessionID> lock_owner;
        bool timeseries_only{false};
    };

    // Configuration
    Config config_;

    // SQLite database handle (nullptr while closed)
    sqlite3* db_{nullptr};

    // Mutex for thread safety (one connection shared by all callers)
    mutable std::mutex mutex_;

    // Run each session is bound to; sessions do not outlive the process
    std::unordered_map<SessionID, int64_t> sessions_;

    // ========================================================================
    // Helper Methods (caller holds mutex_)
    // ========================================================================

    /// Open the connection, apply pragmas and create the schema
    void OpenConnection();

    /// Create tables if they don't exist
    void CreateTables();

    /// Create indices for efficient queries
    void CreateIndices();

    /// Open connection handle
    /// @throws EngineError if the database is closed
    sqlite3* Db() const;

    /// Execute SQL without results
    /// @throws EngineError on failure
    void ExecuteSQL(const std::string& sql);

    void BeginTransaction();
    void CommitTransaction();

    /// Roll back the open transaction; failures are logged, not raised
    void RollbackTransaction();

    /// Run body inside a transaction, rolling back if it throws
    template<typename Body>
    auto InTransaction(Body&& body) -> decltype(body());

    /// Lock state of the run bound to a session
    /// @throws NotFoundError if the session was never initialized or loaded
    RunState LoadRunState(const Session& session) const;

    /// Run bound to a session, checked for write access
    /// @throws PreconditionError if the session does not hold the lock
    RunState WritableRun(const Session& session, bool item_write) const;

    int64_t CreateRun(const std::string& model, const std::string& scenario,
                      const std::string& annotation, const std::string& scheme,
                      bool is_scenario, bool committed,
                      const std::optional<SessionID>& lock_owner);

    void AddName(const std::string& table, const std::string& name);

    bool CodeExists(const std::string& table, const std::string& column,
                    const std::string& value) const;

    void RequireCodes(const std::string& region, const std::string& unit,
                      const std::string& subannual) const;

    /// Items of a run in definition order, with their elements
    /// @param name Load only this item
    std::vector<ItemSnapshot> LoadItems(int64_t run,
                                        const std::optional<std::string>& name = std::nullopt) const;

    /// Lookup that loads each item of run on first use
    /// @param loaded Holds the loaded items; must outlive the lookup
    ItemLookup LoadingLookup(int64_t run,
                             std::map<std::string, std::vector<ItemSnapshot>>& loaded) const;

    /// Replace the stored definition and elements of one item
    void StoreItem(int64_t run, const ItemSnapshot& item, int ordinal);

    void DeleteStoredItem(int64_t run, const std::string& name);

    std::vector<TimeseriesRecord> LoadTimeseries(int64_t run) const;
    std::vector<GeodataRecord> LoadGeodata(int64_t run) const;

    /// Complete content of a run
    ScenarioSnapshot LoadContent(int64_t run) const;

    /// Replace the complete content of a run
    void StoreContent(int64_t run, const ScenarioSnapshot& content);

    void SaveBackup(int64_t run, const ScenarioSnapshot& content);
    std::optional<ScenarioSnapshot> LoadBackup(int64_t run) const;
    void DeleteBackup(int64_t run);

    std::vector<MetaEntry> LoadMeta() const;

    void RegisterSnapshotCodes(const ScenarioSnapshot& snapshot);
    void CheckMetaScopeExists(const MetaScope& scope) const;

    static std::vector<uint8_t> SerializeSnapshot(const ScenarioSnapshot& snapshot);
    static ScenarioSnapshot DeserializeSnapshot(const void* data, int size);
};

} // namespace modelstore
