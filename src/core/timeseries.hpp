// File: src/core/timeseries.hpp
#pragma once

#include "config/platform_config.hpp"
#include "core/platform.hpp"
#include "core/types.hpp"
#include "storage/backend.hpp"
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modelstore {

// SessionState: edit state of a session handle
enum class SessionState : uint8_t {
    UNBOUND = 0,      // constructed, not yet resolved against the backend
    NEW = 1,          // created by init; editable, version provisional until commit
    LOADED = 2,       // bound to a committed version, read-only
    CHECKED_OUT = 3,  // locked for editing by this handle
    DETACHED = 4,     // the owning Platform no longer exists
};

const char* ToString(SessionState state);

/// Platform and handle named by an identity URL
template <typename Handle>
struct UrlTarget {
    std::shared_ptr<Platform> platform;

    /// nullptr if loading failed and errors were not raised
    std::unique_ptr<Handle> handle;
};

/// Handle to one stored version of a (model, scenario) holding time series
///
/// The handle keeps a weak reference to its Platform: once the Platform is
/// destroyed, every operation raises ReferenceError. Writes require the
/// handle to be NEW or CHECKED_OUT.
///
/// Example:
///   TimeSeries ts(mp, "model", "scenario", Version::New(), "first run");
///   ts.AddTimeseries("World", "Emissions", "Mt", {{2020, 1.5}, {2030, 1.2}});
///   ts.Commit("initial data");
class TimeSeries {
public:
    /// Bind to a stored version
    ///
    /// Version::New() creates a new version (state NEW); a number loads that
    /// version and an unset version loads the default one (state LOADED).
    /// @throws NotFoundError if the requested version does not exist
    TimeSeries(std::shared_ptr<Platform> platform,
               const std::string& model,
               const std::string& scenario,
               const Version& version = Version(),
               const std::string& annotation = "");

    /// Releases the backend's session state
    virtual ~TimeSeries();

    TimeSeries(const TimeSeries&) = delete;
    TimeSeries& operator=(const TimeSeries&) = delete;

    const std::string& model() const { return session_.model; }
    const std::string& scenario() const { return session_.scenario; }
    const std::string& scheme() const { return session_.scheme; }

    /// Version number; 0 until a NEW handle is first committed
    std::optional<int> version() const { return session_.version; }

    const Session& session() const { return session_; }

    SessionState state() const;

    /// The owning Platform
    /// @throws ReferenceError if it has been destroyed
    std::shared_ptr<Platform> platform() const { return Owner(); }

    // ========================================================================
    // Edit lifecycle
    // ========================================================================

    /// Lock the version for editing
    /// @param timeseries_only Allow only time-series writes
    /// @throws PreconditionError if already checked out, or held by another session
    virtual void CheckOut(bool timeseries_only = false);

    /// Persist changes and release the lock
    ///
    /// A NEW handle receives its permanent version number here.
    /// @return false (and do nothing) if the handle is neither NEW nor checked out
    bool Commit(const std::string& comment);

    /// Revert to the state at check out and release the lock
    /// @throws PreconditionError if the handle is neither NEW nor checked out
    void DiscardChanges();

    /// Run body inside check out / commit
    ///
    /// When condition is true and the handle is not already checked out, it
    /// is checked out before body runs and committed with message after
    /// body returns normally. A handle checked out on entry stays checked
    /// out. If body throws and discard_on_error is set, the changes are
    /// discarded (see DiscardOnError) before the exception propagates;
    /// otherwise a handle checked out here is committed with message
    /// first, and a failure of that commit is logged.
    void Transact(const std::string& message,
                  const std::function<void()>& body,
                  bool condition = true,
                  bool discard_on_error = false);

    void SetAsDefault();
    bool IsDefault();

    /// Time of the last commit, if any
    std::optional<std::string> LastUpdate();

    int64_t RunId();

    /// True while this handle holds the lock on its version
    bool IsCheckedOut();

    // ========================================================================
    // Time-series data
    // ========================================================================

    /// Load time series ahead of bulk reads
    void PreloadTimeseries();

    /// Add or update data points
    ///
    /// Regions, units and time slices must be defined on the Platform.
    /// @param meta Flag the rows as metadata (kept on clone without solution)
    void AddTimeseries(const std::vector<TimeseriesRecord>& records, bool meta = false);

    /// Add or update the year -> value points of one series
    void AddTimeseries(const std::string& region,
                       const std::string& variable,
                       const std::string& unit,
                       const std::map<int, double>& data,
                       const std::string& subannual = "Year",
                       bool meta = false);

    /// Stored data points; empty lists do not filter
    std::vector<TimeseriesRecord> Timeseries(const std::vector<std::string>& regions = {},
                                             const std::vector<std::string>& variables = {},
                                             const std::vector<std::string>& units = {},
                                             const std::vector<int>& years = {});

    /// Remove data points matching (region, variable, unit, subannual, year)
    /// of each record; values are ignored
    void RemoveTimeseries(const std::vector<TimeseriesRecord>& records);

    void AddGeodata(const std::vector<GeodataRecord>& records);
    std::vector<GeodataRecord> GetGeodata();
    void RemoveGeodata(const std::vector<GeodataRecord>& records);

    // ========================================================================
    // Meta
    // ========================================================================

    /// Annotations of this version, merged over those of its model and scenario
    MetaMap GetMeta();

    std::optional<MetaValue> GetMeta(const std::string& name);

    /// Annotate this version
    /// @throws ValidationError if a key is already used at an overlapping level
    void SetMeta(const MetaMap& meta);
    void SetMeta(const std::string& name, const MetaValue& value);

    void RemoveMeta(const std::vector<std::string>& names);

    // ========================================================================
    // Identity
    // ========================================================================

    /// "MODEL/SCENARIO#VERSION"
    std::string Url() const;

    /// Load the handle named by url on platform
    /// @throws ValidationError if url names a different platform
    static std::unique_ptr<TimeSeries> FromUrl(const std::string& url,
                                               const std::shared_ptr<Platform>& platform);

    /// Create the platform named by url (or the default one) and load the handle
    /// @param raise_errors If false, a failure to load the handle is logged and
    ///        the platform is returned with a null handle
    static UrlTarget<TimeSeries> FromUrl(const std::string& url,
                                         const PlatformConfig& config,
                                         bool raise_errors = false);

protected:
    TimeSeries(std::shared_ptr<Platform> platform,
               const std::string& model,
               const std::string& scenario,
               const Version& version,
               const std::string& annotation,
               const std::string& scheme,
               bool is_scenario);

    /// The Platform, kept alive for the duration of one call
    /// @throws ReferenceError if it has been destroyed
    std::shared_ptr<Platform> Owner() const;

    /// @throws PreconditionError unless NEW or CHECKED_OUT
    void RequireEditable(const std::string& operation) const;

    /// "TimeSeries model/scenario#version" for messages
    std::string Describe() const;

    /// Platform for a URL: the configured platform it names, else the default
    static std::shared_ptr<Platform> PlatformForUrl(const std::string& url,
                                                    const PlatformConfig& config);

    Session session_;
    SessionState state_{SessionState::UNBOUND};

private:
    void Bind(const Version& version, const std::string& annotation);

    std::weak_ptr<Platform> platform_;
};

/// Cleanup for a failed edit block: log, discard changes, close the engine
///
/// Failures of the cleanup steps are logged; the caller re-raises error.
void DiscardOnError(TimeSeries& ts, const std::exception& error);

} // namespace modelstore
