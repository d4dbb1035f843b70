// File: src/storage/backend.hpp
#pragma once

#include "core/logging.hpp"
#include "core/types.hpp"
#include "storage/snapshot.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modelstore {

/// Engine-specific construction options (keyword -> value)
using BackendOptions = std::map<std::string, std::string>;

/// State a handle passes to every backend call
///
/// The backend maps the session id to one stored run. version is unset
/// until init/get resolve it; a run created by init carries the provisional
/// version 0 until its first commit.
struct Session {
    SessionID id{SessionID::Generate()};
    std::string model;
    std::string scenario;
    std::optional<int> version;
    std::string scheme;
    bool is_scenario{false};
};

/// Which list item_index returns
enum class IndexField : uint8_t {
    SETS = 0,   // index sets
    NAMES = 1,  // index names (dimension labels)
};

const char* ToString(IndexField field);

// Parse "sets" or "names"
IndexField ParseIndexField(const std::string& str);

/// Parameters of a clone
struct CloneRequest {
    std::string model;
    std::string scenario;
    std::string annotation;
    bool keep_solution{true};
    std::optional<int> first_model_year;
};

/// Abstract storage engine interface
///
/// Platform, TimeSeries and Scenario depend only on this interface. Engines
/// raise the exceptions in core/errors.hpp: NotFoundError for missing
/// runs/items/codes, PreconditionError for writes to a session that is not
/// checked out, ValidationError for malformed arguments, EngineError for
/// storage failures and UnsupportedError for operations they cannot perform.
class Backend {
public:
    virtual ~Backend() = default;

    /// Registered name of the engine class (e.g. "memory", "sqlite")
    virtual std::string Name() const = 0;

    // ========================================================================
    // Engine lifecycle
    // ========================================================================

    /// Open the connection to the engine; no-op where not applicable
    virtual void OpenDb() {}

    /// Close the connection to the engine; no-op where not applicable
    virtual void CloseDb() {}

    virtual void SetLogLevel(LogLevel level) { logger_.SetLevel(level); }
    virtual LogLevel GetLogLevel() const { return logger_.level(); }

    /// Logger shared with the handles bound to this backend
    Logger& logger() { return logger_; }

    // ========================================================================
    // Registries
    // ========================================================================

    /// Add a region, or a synonym of an existing region
    /// @param name Region name (the mapped-to region when synonym is given)
    /// @param parent Parent region
    /// @param hierarchy Hierarchy level, e.g. "country"
    /// @param synonym Alternative name for name
    virtual void SetNode(const std::string& name,
                         const std::optional<std::string>& parent,
                         const std::optional<std::string>& hierarchy,
                         const std::optional<std::string>& synonym) = 0;

    /// Regions and synonyms in the order (region, mapped_to, parent, hierarchy)
    virtual std::vector<RegionRecord> GetNodes() = 0;

    virtual void SetTimeslice(const std::string& name,
                              const std::string& category,
                              double duration) = 0;

    virtual std::vector<TimesliceRecord> GetTimeslices() = 0;

    virtual void AddModelName(const std::string& name) = 0;
    virtual void AddScenarioName(const std::string& name) = 0;
    virtual std::vector<std::string> GetModelNames() = 0;
    virtual std::vector<std::string> GetScenarioNames() = 0;

    /// List committed runs
    /// @param default_only Only the default version of each (model, scenario)
    virtual std::vector<ScenarioInfo> GetScenarios(bool default_only,
                                                   const std::optional<std::string>& model,
                                                   const std::optional<std::string>& scenario) = 0;

    virtual void SetUnit(const std::string& name, const std::string& comment) = 0;
    virtual std::vector<std::string> GetUnits() = 0;

    // ========================================================================
    // Session lifecycle
    // ========================================================================

    /// Create a new version of (model, scenario)
    ///
    /// Reserves the next version number; session.version is set to the
    /// provisional value 0 until commit. The new run is editable by this
    /// session without a check out.
    virtual void Init(Session& session, const std::string& annotation) = 0;

    /// Load an existing version; an unset session.version resolves to the
    /// default version and is written back
    /// @throws NotFoundError if the run does not exist
    virtual void Get(Session& session) = 0;

    /// Forget a session handle; stored data is unaffected
    virtual void DelTs(const Session& session) { (void)session; }

    /// Lock the run for editing by this session
    /// @param timeseries_only Allow only time-series writes
    /// @throws PreconditionError if another session holds the run
    virtual void CheckOut(const Session& session, bool timeseries_only) = 0;

    /// Persist pending changes and release the lock
    ///
    /// A run created by init receives its permanent version here, written to
    /// session.version. On failure the session stays checked out.
    virtual void Commit(Session& session, const std::string& comment) = 0;

    /// Revert to the state at check out and release the lock
    virtual void DiscardChanges(const Session& session) = 0;

    virtual void SetAsDefault(const Session& session) = 0;
    virtual bool IsDefault(const Session& session) = 0;
    virtual std::optional<std::string> LastUpdate(const Session& session) = 0;
    virtual int64_t RunId(const Session& session) = 0;

    /// True while the session holds the lock on its run
    virtual bool IsCheckedOut(const Session& session) = 0;

    /// Load data ahead of use; no-op where not applicable
    virtual void Preload(const Session& session) { (void)session; }

    // ========================================================================
    // Time-series data
    // ========================================================================

    /// Rows matching every non-empty filter list
    virtual std::vector<TimeseriesRecord> GetData(const Session& session,
                                                  const std::vector<std::string>& regions,
                                                  const std::vector<std::string>& variables,
                                                  const std::vector<std::string>& units,
                                                  const std::vector<int>& years) = 0;

    /// Insert or update year -> value points of one series
    virtual void SetData(const Session& session,
                         const std::string& region,
                         const std::string& variable,
                         const std::map<int, double>& data,
                         const std::string& unit,
                         const std::string& subannual,
                         bool meta) = 0;

    virtual void Delete(const Session& session,
                        const std::string& region,
                        const std::string& variable,
                        const std::string& subannual,
                        const std::vector<int>& years,
                        const std::string& unit) = 0;

    virtual std::vector<GeodataRecord> GetGeo(const Session& session) = 0;

    virtual void SetGeo(const Session& session, const GeodataRecord& record) = 0;

    virtual void DeleteGeo(const Session& session,
                           const std::string& region,
                           const std::string& variable,
                           const std::string& subannual,
                           const std::vector<int>& years,
                           const std::string& unit) = 0;

    // ========================================================================
    // Item data
    // ========================================================================

    /// Names of items of one kind in definition order
    virtual std::vector<std::string> ListItems(const Session& session, ItemType kind) = 0;

    /// Define an item
    /// @param index_names Defaults to index_sets when empty
    virtual void InitItem(const Session& session,
                          ItemType kind,
                          const std::string& name,
                          const std::vector<std::string>& index_sets,
                          const std::vector<std::string>& index_names) = 0;

    virtual void DeleteItem(const Session& session, ItemType kind, const std::string& name) = 0;

    /// Index sets or index names of an item of any kind
    virtual std::vector<std::string> ItemIndex(const Session& session,
                                               const std::string& name,
                                               IndexField field) = 0;

    /// Elements of an item, restricted by filters on its dimensions
    virtual ItemData ItemGetElements(const Session& session,
                                     ItemType kind,
                                     const std::string& name,
                                     const Filters& filters) = 0;

    /// Insert or update set or parameter elements; the batch is validated
    /// as a whole before anything is written
    virtual void ItemSetElements(const Session& session,
                                 ItemType kind,
                                 const std::string& name,
                                 const std::vector<Element>& elements) = 0;

    /// Write solver output to a variable or equation
    virtual void ItemSetSolution(const Session& session,
                                 ItemType kind,
                                 const std::string& name,
                                 const std::vector<SolutionElement>& elements) = 0;

    /// Remove elements by key; removing labels from an index set also
    /// removes the rows of items indexed by it that use those labels
    virtual void ItemDeleteElements(const Session& session,
                                    ItemType kind,
                                    const std::string& name,
                                    const std::vector<Key>& keys) = 0;

    // ========================================================================
    // Scenario lifecycle
    // ========================================================================

    /// Copy a run into dest as a new version of (request.model, request.scenario)
    ///
    /// The default implementation exports a ScenarioSnapshot, filters it and
    /// imports it into dest, then copies the meta of the source version.
    /// @return The version number assigned in dest
    /// @throws UnsupportedError if the engines do not share a clone format
    virtual int Clone(const Session& session, Backend& dest, const CloneRequest& request);

    /// Tag of the intermediate representation this engine produces/consumes
    virtual std::string CloneFormat() const = 0;

    virtual ScenarioSnapshot ExportSnapshot(const Session& session) = 0;

    /// Store a snapshot as a new committed, non-default version
    /// @return The version number assigned
    virtual int ImportSnapshot(const std::string& model,
                               const std::string& scenario,
                               const std::string& annotation,
                               const ScenarioSnapshot& snapshot) = 0;

    virtual bool HasSolution(const Session& session) = 0;

    /// Remove the solution (see ClearSolutionData)
    virtual void ClearSolution(const Session& session, std::optional<int> from_year) = 0;

    // ========================================================================
    // Meta
    // ========================================================================

    /// Annotations of one target; non-strict also merges the less specific
    /// targets under it
    virtual MetaMap GetMeta(const std::optional<std::string>& model,
                            const std::optional<std::string>& scenario,
                            const std::optional<int>& version,
                            bool strict) = 0;

    virtual void SetMeta(const MetaMap& meta,
                         const std::optional<std::string>& model,
                         const std::optional<std::string>& scenario,
                         const std::optional<int>& version) = 0;

    virtual void RemoveMeta(const std::vector<std::string>& names,
                            const std::optional<std::string>& model,
                            const std::optional<std::string>& scenario,
                            const std::optional<int>& version) = 0;

    // ========================================================================
    // Access control and caching
    // ========================================================================

    /// Per-model access; grants everything unless overridden
    virtual std::map<std::string, bool> GetAuth(const std::string& user,
                                                const std::vector<std::string>& models,
                                                const std::string& access);

    /// True if item reads through this backend are cached
    virtual bool CacheEnabled() const { return false; }

protected:
    explicit Backend(const std::string& component) : logger_(component) {}

    Logger logger_;
};

// ============================================================================
// Option helpers shared by engine constructors
// ============================================================================

/// @throws ValidationError naming the first key not in accepted
void RejectUnknownOptions(const BackendOptions& options,
                          const std::vector<std::string>& accepted,
                          const std::string& engine);

/// Parse true/false, yes/no, on/off, 1/0
/// @throws ValidationError for anything else
bool ParseBoolOption(const std::string& key, const std::string& value);

/// Parse a non-negative integer option
size_t ParseSizeOption(const std::string& key, const std::string& value);

/// Current local time as "YYYY-MM-DD HH:MM:SS"
std::string CurrentTimestamp();

/// User name from the environment, or "unknown"
std::string DefaultUser();

} // namespace modelstore
