// File: src/storage/memory_backend.hpp
#pragma once

#include "storage/backend.hpp"
#include "storage/engine_rules.hpp"
#include <atomic>
#include <map>
#include <shared_mutex>
#include <unordered_map>

namespace modelstore {

/// In-memory storage engine
///
/// Keeps every run, registry and annotation in process memory. Intended for
/// tests, scratch work and as the reference implementation of the Backend
/// contract. Thread-safe with shared_mutex (multiple readers, single writer).
///
/// Features:
/// - Versions reserved at init, assigned permanently at commit
/// - Per-run locks owned by one session; timeseries-only check outs
/// - Checkout backups restored by discard
/// - Clone into any engine sharing the snapshot format
class MemoryBackend : public Backend {
public:
    /// Configuration for MemoryBackend
    struct Config {
        /// Label used in log messages
        std::string name{"memory"};

        /// User recorded as creator/updater/locker of runs
        std::string user{DefaultUser()};

        /// Region present from the start
        std::string default_region{"World"};

        /// Time slice present from the start (category "Common", duration 1)
        std::string default_timeslice{"Year"};
    };

    /// Build a Config from string options
    /// @throws ValidationError for unknown keys
    static Config ConfigFromOptions(const BackendOptions& options);

    explicit MemoryBackend(const Config& config);

    ~MemoryBackend() override = default;

    // ========================================================================
    // Backend Interface Implementation
    // ========================================================================

    std::string Name() const override { return "memory"; }

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
    /// One stored (model, scenario, version)
    struct Run {
        int64_t id{0};
        std::string model;
        std::string scenario;
        int version{0};
        std::string annotation;
        bool committed{false};
        bool is_default{false};

        std::string cre_user;
        std::string cre_date;
        std::optional<std::string> upd_user;
        std::optional<std::string> upd_date;

        // Lock state
        std::optional<SessionID> lock_owner;
        bool timeseries_only{false};
        std::optional<std::string> lock_user;
        std::optional<std::string> lock_date;

        ScenarioSnapshot content;

        // State at check out, restored by discard
        std::optional<ScenarioSnapshot> backup;
    };

    struct Unit {
        std::string name;
        std::string comment;
    };

    // Configuration
    Config config_;

    // Thread synchronization (shared_mutex allows multiple readers, single writer)
    mutable std::shared_mutex mutex_;

    // Runs by id, and the run each session is bound to
    std::map<int64_t, Run> runs_;
    std::unordered_map<SessionID, int64_t> sessions_;
    std::atomic<int64_t> next_run_id_{1};

    // Registries
    std::vector<RegionRecord> regions_;
    std::vector<TimesliceRecord> timeslices_;
    std::vector<Unit> units_;
    std::vector<std::string> model_names_;
    std::vector<std::string> scenario_names_;

    std::vector<MetaEntry> meta_;

    // ========================================================================
    // Helper Methods (caller holds mutex_)
    // ========================================================================

    /// Run bound to a session
    /// @throws NotFoundError if the session was never initialized or loaded
    Run& RunFor(const Session& session);
    const Run& RunFor(const Session& session) const;

    /// Run bound to a session, checked for write access
    /// @param item_write True for item writes, refused under a timeseries-only lock
    /// @throws PreconditionError if the session does not hold the lock
    Run& WritableRun(const Session& session, bool item_write);

    /// Next version number for (model, scenario), counting uncommitted runs
    int NextVersion(const std::string& model, const std::string& scenario) const;

    /// Create a run and return its id
    int64_t CreateRun(const std::string& model, const std::string& scenario,
                      const std::string& annotation);

    bool HasUnit(const std::string& name) const;
    bool HasRegion(const std::string& name) const;
    bool HasTimeslice(const std::string& name) const;

    static void AddName(std::vector<std::string>& names, const std::string& name);

    ScenarioInfo MakeInfo(const Run& run) const;

    /// Register codes a snapshot refers to that this engine lacks
    void RegisterSnapshotCodes(const ScenarioSnapshot& snapshot);

    /// Raise NotFoundError unless the meta scope names known codes and runs
    void CheckMetaScopeExists(const MetaScope& scope) const;
};

} // namespace modelstore
