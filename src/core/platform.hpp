// File: src/core/platform.hpp
#pragma once

#include "config/platform_config.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"
#include "storage/backend.hpp"
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace modelstore {

/// Filters of Platform::ExportTimeseriesData
struct TimeseriesExportOptions {
    /// Only the default version of each (model, scenario)
    bool default_only{true};

    std::optional<std::string> model;
    std::optional<std::string> scenario;

    /// Empty lists do not filter
    std::vector<std::string> variables;
    std::vector<std::string> units;
    std::vector<std::string> regions;

    /// Every run of every (model, scenario), default or not; excludes model
    /// and scenario filters
    bool export_all_runs{false};
};

/// Instance of a storage backend holding model data
///
/// A Platform exclusively owns its Backend. Session handles (TimeSeries,
/// Scenario) keep a weak reference to the Platform, so a Platform must be
/// created through Create/FromConfig and held by a std::shared_ptr.
///
/// Example:
///   auto mp = Platform::Create("sqlite", {{"path", "/tmp/models.db"}});
///   mp->AddUnit("km");
///   Scenario scen(mp, "model", "baseline", Version::New());
class Platform : public std::enable_shared_from_this<Platform> {
    /// Restricts construction to Create/FromConfig while allowing make_shared
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Create a platform on a registered backend class
    ///
    /// The options "cache" (bool, default true) and "cache_size" configure
    /// the item cache; all other options go to the engine, which rejects
    /// keys it does not know.
    /// @param name Display name of the platform; defaults to the class name
    /// @throws ValidationError for an unknown class or option
    static std::shared_ptr<Platform> Create(const std::string& backend_class,
                                            const BackendOptions& options = {},
                                            const std::string& name = "");

    /// Create a platform on an already constructed backend (used as is)
    static std::shared_ptr<Platform> Create(std::unique_ptr<Backend> backend,
                                            const std::string& name = "");

    /// Create a configured platform; an empty name selects the default one
    /// @throws NotFoundError if the configuration has no such platform
    static std::shared_ptr<Platform> FromConfig(const PlatformConfig& config,
                                                const std::string& name = "");

    Platform(PrivateTag, std::unique_ptr<Backend> backend, std::string name);
    ~Platform() = default;

    Platform(const Platform&) = delete;
    Platform& operator=(const Platform&) = delete;

    const std::string& name() const { return name_; }

    Backend& backend() { return *backend_; }

    Logger& logger() { return backend_->logger(); }

    // ========================================================================
    // Engine and logging
    // ========================================================================

    void OpenDb() { backend_->OpenDb(); }
    void CloseDb() { backend_->CloseDb(); }

    void SetLogLevel(LogLevel level) { backend_->SetLogLevel(level); }
    LogLevel GetLogLevel() const { return backend_->GetLogLevel(); }

    // ========================================================================
    // Scenarios, models and names
    // ========================================================================

    /// Committed runs stored on the platform
    /// @param default_only Only the default version of each (model, scenario)
    std::vector<ScenarioInfo> ScenarioList(bool default_only = true,
                                           const std::optional<std::string>& model = std::nullopt,
                                           const std::optional<std::string>& scenario = std::nullopt);

    void AddModelName(const std::string& name) { backend_->AddModelName(name); }
    void AddScenarioName(const std::string& name) { backend_->AddScenarioName(name); }
    std::vector<std::string> GetModelNames() { return backend_->GetModelNames(); }
    std::vector<std::string> GetScenarioNames() { return backend_->GetScenarioNames(); }

    // ========================================================================
    // Units, regions and time slices
    // ========================================================================

    /// Define a unit; an existing unit is left as is
    void AddUnit(const std::string& unit, const std::string& comment = "None");

    std::vector<std::string> Units() { return backend_->GetUnits(); }

    /// Define a region with a hierarchy level and a parent region
    /// An existing region (or synonym) of that name is left as is.
    void AddRegion(const std::string& region,
                   const std::string& hierarchy,
                   const std::string& parent = "World");

    /// Define region as an alternative name for mapped_to
    void AddRegionSynonym(const std::string& region, const std::string& mapped_to);

    /// Regions and synonyms in (region, mapped_to, parent, hierarchy) form
    std::vector<RegionRecord> Regions() { return backend_->GetNodes(); }

    /// Define a sub-annual time slice
    /// @param duration Fraction of a year
    /// @throws ValidationError if the name exists with a different duration
    void AddTimeslice(const std::string& name, const std::string& category, double duration);

    std::vector<TimesliceRecord> Timeslices() { return backend_->GetTimeslices(); }

    // ========================================================================
    // Access control
    // ========================================================================

    /// Access of user to each of models
    /// @param access "view" or "edit"
    /// @throws ValidationError if models is empty
    std::map<std::string, bool> CheckAccess(const std::string& user,
                                            const std::vector<std::string>& models,
                                            const std::string& access = "view");

    /// Access of user to a single model
    bool CheckAccess(const std::string& user,
                     const std::string& model,
                     const std::string& access = "view");

    // ========================================================================
    // Export
    // ========================================================================

    /// Write the time series of many runs to a CSV file
    ///
    /// Columns: MODEL,SCENARIO,VERSION,VARIABLE,UNIT,REGION,META,SUBANNUAL,YEAR,VALUE
    /// @throws ValidationError if export_all_runs is combined with a model or
    ///         scenario filter
    /// @throws EngineError if the file cannot be written
    void ExportTimeseriesData(const std::string& path,
                              const TimeseriesExportOptions& options = {});

private:
    /// Log and return true if a region or synonym of this name exists
    bool ExistingRegion(const std::string& name);

    std::unique_ptr<Backend> backend_;
    std::string name_;
};

} // namespace modelstore
