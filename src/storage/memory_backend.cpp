// File: src/storage/memory_backend.cpp
#include "storage/memory_backend.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <mutex>
#include <set>
#include <tuple>

namespace modelstore {

namespace {

std::string RunLabel(const std::string& model, const std::string& scenario, int version) {
    return model + "/" + scenario + "#" + std::to_string(version);
}

template<typename Record, typename Match>
void UpsertRecord(std::vector<Record>& records, Record record, Match same) {
    for (auto& existing : records) {
        if (same(existing, record)) {
            existing = std::move(record);
            return;
        }
    }
    records.push_back(std::move(record));
}

} // namespace

// ============================================================================
// Constructor
// ============================================================================

MemoryBackend::Config MemoryBackend::ConfigFromOptions(const BackendOptions& options) {
    RejectUnknownOptions(options, {"name", "user", "default_region", "default_timeslice"},
                         "memory");

    Config config;
    for (const auto& [key, value] : options) {
        if (key == "name") config.name = value;
        else if (key == "user") config.user = value;
        else if (key == "default_region") config.default_region = value;
        else if (key == "default_timeslice") config.default_timeslice = value;
    }
    return config;
}

MemoryBackend::MemoryBackend(const Config& config)
    : Backend("MemoryBackend"), config_(config) {
    regions_.push_back(RegionRecord{config_.default_region, std::nullopt,
                                    config_.default_region, "common"});
    timeslices_.push_back(TimesliceRecord{config_.default_timeslice, "Common", 1.0});
    units_.push_back(Unit{"???", "unknown unit"});
}

// ============================================================================
// Helper Methods
// ============================================================================

MemoryBackend::Run& MemoryBackend::RunFor(const Session& session) {
    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        throw NotFoundError("Session for " + session.model + "/" + session.scenario +
                            " is not initialized on backend '" + config_.name + "'");
    }
    return runs_.at(it->second);
}

const MemoryBackend::Run& MemoryBackend::RunFor(const Session& session) const {
    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        throw NotFoundError("Session for " + session.model + "/" + session.scenario +
                            " is not initialized on backend '" + config_.name + "'");
    }
    return runs_.at(it->second);
}

MemoryBackend::Run& MemoryBackend::WritableRun(const Session& session, bool item_write) {
    Run& run = RunFor(session);
    if (!run.lock_owner || *run.lock_owner != session.id) {
        throw PreconditionError(RunLabel(run.model, run.scenario, run.version) +
                                " is not checked out by this session; call check_out() first");
    }
    if (item_write && run.timeseries_only) {
        throw PreconditionError(RunLabel(run.model, run.scenario, run.version) +
                                " is checked out for time-series edits only");
    }
    return run;
}

int MemoryBackend::NextVersion(const std::string& model, const std::string& scenario) const {
    int version = 0;
    for (const auto& [id, run] : runs_) {
        if (run.model == model && run.scenario == scenario) {
            version = std::max(version, run.version);
        }
    }
    return version + 1;
}

int64_t MemoryBackend::CreateRun(const std::string& model, const std::string& scenario,
                                 const std::string& annotation) {
    AddName(model_names_, model);
    AddName(scenario_names_, scenario);

    Run run;
    run.id = next_run_id_.fetch_add(1, std::memory_order_relaxed);
    run.model = model;
    run.scenario = scenario;
    run.version = NextVersion(model, scenario);
    run.annotation = annotation;
    run.cre_user = config_.user;
    run.cre_date = CurrentTimestamp();

    int64_t id = run.id;
    runs_.emplace(id, std::move(run));
    return id;
}

bool MemoryBackend::HasUnit(const std::string& name) const {
    return std::any_of(units_.begin(), units_.end(),
                       [&](const Unit& unit) { return unit.name == name; });
}

bool MemoryBackend::HasRegion(const std::string& name) const {
    return std::any_of(regions_.begin(), regions_.end(),
                       [&](const RegionRecord& region) { return region.region == name; });
}

bool MemoryBackend::HasTimeslice(const std::string& name) const {
    return std::any_of(timeslices_.begin(), timeslices_.end(),
                       [&](const TimesliceRecord& slice) { return slice.name == name; });
}

void MemoryBackend::AddName(std::vector<std::string>& names, const std::string& name) {
    if (std::find(names.begin(), names.end(), name) == names.end()) {
        names.push_back(name);
    }
}

ScenarioInfo MemoryBackend::MakeInfo(const Run& run) const {
    ScenarioInfo info;
    info.model = run.model;
    info.scenario = run.scenario;
    info.scheme = run.content.scheme;
    info.is_default = run.is_default;
    info.is_locked = run.lock_owner.has_value();
    info.cre_user = run.cre_user;
    info.cre_date = run.cre_date;
    info.upd_user = run.upd_user;
    info.upd_date = run.upd_date;
    info.lock_user = run.lock_user;
    info.lock_date = run.lock_date;
    info.annotation = run.annotation;
    info.version = run.version;
    return info;
}

void MemoryBackend::RegisterSnapshotCodes(const ScenarioSnapshot& snapshot) {
    auto register_unit = [this](const std::string& unit) {
        if (!unit.empty() && !HasUnit(unit)) {
            units_.push_back(Unit{unit, "added by clone"});
            logger_.Info("Added unit '" + unit + "' referenced by cloned data");
        }
    };
    auto register_region = [this](const std::string& region) {
        if (!HasRegion(region)) {
            regions_.push_back(RegionRecord{region, std::nullopt,
                                            config_.default_region, ""});
            logger_.Info("Added region '" + region + "' referenced by cloned data");
        }
    };
    auto register_timeslice = [this](const std::string& name) {
        if (!HasTimeslice(name)) {
            timeslices_.push_back(TimesliceRecord{name, "Common", 1.0});
            logger_.Info("Added time slice '" + name + "' referenced by cloned data");
        }
    };

    for (const auto& item : snapshot.items) {
        if (item.kind == ItemType::PAR) {
            for (const auto& row : item.rows) {
                register_unit(row.unit);
            }
        }
    }
    for (const auto& ts : snapshot.timeseries) {
        register_unit(ts.unit);
        register_region(ts.region);
        register_timeslice(ts.subannual);
    }
    for (const auto& geo : snapshot.geodata) {
        register_unit(geo.unit);
        register_region(geo.region);
        register_timeslice(geo.subannual);
    }
}

void MemoryBackend::CheckMetaScopeExists(const MetaScope& scope) const {
    if (scope.model &&
        std::find(model_names_.begin(), model_names_.end(), *scope.model) == model_names_.end()) {
        throw NotFoundError("Model '" + *scope.model + "' does not exist");
    }
    if (scope.scenario &&
        std::find(scenario_names_.begin(), scenario_names_.end(), *scope.scenario) ==
            scenario_names_.end()) {
        throw NotFoundError("Scenario '" + *scope.scenario + "' does not exist");
    }
    if (scope.version) {
        bool found = std::any_of(runs_.begin(), runs_.end(), [&](const auto& entry) {
            const Run& run = entry.second;
            return run.committed && run.model == *scope.model &&
                   run.scenario == *scope.scenario && run.version == *scope.version;
        });
        if (!found) {
            throw NotFoundError(RunLabel(*scope.model, *scope.scenario, *scope.version) +
                                " does not exist");
        }
    }
}

// ============================================================================
// Registries
// ============================================================================

void MemoryBackend::SetNode(const std::string& name,
                            const std::optional<std::string>& parent,
                            const std::optional<std::string>& hierarchy,
                            const std::optional<std::string>& synonym) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (synonym) {
        auto it = std::find_if(regions_.begin(), regions_.end(),
                               [&](const RegionRecord& r) { return r.region == name; });
        if (it == regions_.end()) {
            throw NotFoundError("Region '" + name + "' does not exist; cannot add synonym '" +
                                *synonym + "'");
        }
        RegionRecord record{*synonym, name, it->parent, it->hierarchy};
        UpsertRecord(regions_, record, [](const RegionRecord& a, const RegionRecord& b) {
            return a.region == b.region;
        });
        return;
    }

    RegionRecord record{name, std::nullopt, parent.value_or(config_.default_region),
                        hierarchy.value_or("")};
    UpsertRecord(regions_, record, [](const RegionRecord& a, const RegionRecord& b) {
        return a.region == b.region;
    });
}

std::vector<RegionRecord> MemoryBackend::GetNodes() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return regions_;
}

void MemoryBackend::SetTimeslice(const std::string& name, const std::string& category,
                                 double duration) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    UpsertRecord(timeslices_, TimesliceRecord{name, category, duration},
                 [](const TimesliceRecord& a, const TimesliceRecord& b) {
                     return a.name == b.name;
                 });
}

std::vector<TimesliceRecord> MemoryBackend::GetTimeslices() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return timeslices_;
}

void MemoryBackend::AddModelName(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    AddName(model_names_, name);
}

void MemoryBackend::AddScenarioName(const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    AddName(scenario_names_, name);
}

std::vector<std::string> MemoryBackend::GetModelNames() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return model_names_;
}

std::vector<std::string> MemoryBackend::GetScenarioNames() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return scenario_names_;
}

std::vector<ScenarioInfo> MemoryBackend::GetScenarios(bool default_only,
                                                      const std::optional<std::string>& model,
                                                      const std::optional<std::string>& scenario) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ScenarioInfo> result;
    for (const auto& [id, run] : runs_) {
        if (!run.committed) continue;
        if (default_only && !run.is_default) continue;
        if (model && run.model != *model) continue;
        if (scenario && run.scenario != *scenario) continue;
        result.push_back(MakeInfo(run));
    }

    std::sort(result.begin(), result.end(), [](const ScenarioInfo& a, const ScenarioInfo& b) {
        return std::tie(a.model, a.scenario, a.version) < std::tie(b.model, b.scenario, b.version);
    });
    return result;
}

void MemoryBackend::SetUnit(const std::string& name, const std::string& comment) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& unit : units_) {
        if (unit.name == name) {
            unit.comment = comment;
            return;
        }
    }
    units_.push_back(Unit{name, comment});
}

std::vector<std::string> MemoryBackend::GetUnits() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(units_.size());
    for (const auto& unit : units_) {
        names.push_back(unit.name);
    }
    return names;
}

// ============================================================================
// Session lifecycle
// ============================================================================

void MemoryBackend::Init(Session& session, const std::string& annotation) {
    if (session.model.empty() || session.scenario.empty()) {
        throw ValidationError("Model and scenario names must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    int64_t id = CreateRun(session.model, session.scenario, annotation);
    Run& run = runs_.at(id);
    run.content.scheme = session.scheme;
    run.content.is_scenario = session.is_scenario;
    run.lock_owner = session.id;
    run.lock_user = config_.user;
    run.lock_date = run.cre_date;

    sessions_[session.id] = id;
    session.version = 0;

    logger_.Debug(config_.name + ": init " + session.model + "/" + session.scenario +
                  ", reserved version " + std::to_string(run.version));
}

void MemoryBackend::Get(Session& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const Run* found = nullptr;
    for (const auto& [id, run] : runs_) {
        if (!run.committed || run.model != session.model || run.scenario != session.scenario) {
            continue;
        }
        if (session.version ? run.version == *session.version : run.is_default) {
            found = &run;
            break;
        }
    }

    if (found == nullptr) {
        if (session.version) {
            throw NotFoundError(RunLabel(session.model, session.scenario, *session.version) +
                                " does not exist");
        }
        throw NotFoundError("No default version of " + session.model + "/" +
                            session.scenario + " exists");
    }

    session.version = found->version;
    session.scheme = found->content.scheme;
    sessions_[session.id] = found->id;
}

void MemoryBackend::DelTs(const Session& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = sessions_.find(session.id);
    if (it == sessions_.end()) {
        return;
    }
    int64_t run_id = it->second;
    sessions_.erase(it);

    auto run_it = runs_.find(run_id);
    if (run_it == runs_.end()) {
        return;
    }
    Run& run = run_it->second;
    if (!run.lock_owner || *run.lock_owner != session.id) {
        return;
    }

    // The owner is gone: drop its uncommitted run or roll back its edits
    std::string label = RunLabel(run.model, run.scenario, run.version);
    if (!run.committed) {
        runs_.erase(run_it);
        logger_.Debug(config_.name + ": dropped uncommitted " + label);
        return;
    }
    if (run.backup) {
        run.content = std::move(*run.backup);
    }
    run.backup.reset();
    run.timeseries_only = false;
    run.lock_owner.reset();
    run.lock_user.reset();
    run.lock_date.reset();
    logger_.Warning(config_.name + ": released the lock on " + label +
                    " held by a closed session; changes discarded");
}

void MemoryBackend::CheckOut(const Session& session, bool timeseries_only) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Run& run = RunFor(session);
    std::string label = RunLabel(run.model, run.scenario, run.version);
    if (run.lock_owner && *run.lock_owner != session.id) {
        throw PreconditionError(label + " is checked out by another session (user " +
                                run.lock_user.value_or("unknown") + " since " +
                                run.lock_date.value_or("unknown") + ")");
    }
    if (run.lock_owner && run.committed) {
        throw PreconditionError(label + " is already checked out by this session");
    }

    run.lock_owner = session.id;
    run.timeseries_only = timeseries_only;
    run.lock_user = config_.user;
    run.lock_date = CurrentTimestamp();
    run.backup = run.content;
}

void MemoryBackend::Commit(Session& session, const std::string& comment) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Run& run = RunFor(session);
    if (!run.lock_owner || *run.lock_owner != session.id) {
        throw PreconditionError(RunLabel(run.model, run.scenario, run.version) +
                                " is not checked out by this session; nothing to commit");
    }

    run.committed = true;
    run.upd_user = config_.user;
    run.upd_date = CurrentTimestamp();
    run.lock_owner.reset();
    run.timeseries_only = false;
    run.lock_user.reset();
    run.lock_date.reset();
    run.backup.reset();

    session.version = run.version;

    logger_.Debug(config_.name + ": commit " + RunLabel(run.model, run.scenario, run.version) +
                  (comment.empty() ? std::string() : ": " + comment));
}

void MemoryBackend::DiscardChanges(const Session& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Run& run = RunFor(session);
    if (!run.lock_owner || *run.lock_owner != session.id) {
        throw PreconditionError(RunLabel(run.model, run.scenario, run.version) +
                                " is not checked out by this session; nothing to discard");
    }

    if (run.backup) {
        run.content = std::move(*run.backup);
    } else if (!run.committed) {
        run.content.items.clear();
        run.content.timeseries.clear();
        run.content.geodata.clear();
    }
    run.backup.reset();
    run.timeseries_only = false;

    // A run that was never committed stays editable by its creator
    if (run.committed) {
        run.lock_owner.reset();
        run.lock_user.reset();
        run.lock_date.reset();
    }
}

void MemoryBackend::SetAsDefault(const Session& session) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Run& target = RunFor(session);
    if (!target.committed) {
        throw PreconditionError(target.model + "/" + target.scenario +
                                " must be committed before it can be the default version");
    }
    for (auto& [id, run] : runs_) {
        if (run.model == target.model && run.scenario == target.scenario) {
            run.is_default = false;
        }
    }
    target.is_default = true;
}

bool MemoryBackend::IsDefault(const Session& session) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return RunFor(session).is_default;
}

std::optional<std::string> MemoryBackend::LastUpdate(const Session& session) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return RunFor(session).upd_date;
}

int64_t MemoryBackend::RunId(const Session& session) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return RunFor(session).id;
}

bool MemoryBackend::IsCheckedOut(const Session& session) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Run& run = RunFor(session);
    return run.lock_owner && *run.lock_owner == session.id;
}

// ============================================================================
// Time-series data
// ============================================================================

std::vector<TimeseriesRecord> MemoryBackend::GetData(const Session& session,
                                                     const std::vector<std::string>& regions,
                                                     const std::vector<std::string>& variables,
                                                     const std::vector<std::string>& units,
                                                     const std::vector<int>& years) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto rows = FilterTimeseries(RunFor(session).content.timeseries, regions, variables,
                                 units, years);
    SortTimeseries(rows);
    return rows;
}

void MemoryBackend::SetData(const Session& session, const std::string& region,
                            const std::string& variable, const std::map<int, double>& data,
                            const std::string& unit, const std::string& subannual, bool meta) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Run& run = WritableRun(session, false);
    if (!HasRegion(region)) throw NotFoundError("Region '" + region + "' does not exist");
    if (!HasUnit(unit)) throw NotFoundError("Unit '" + unit + "' does not exist");
    if (!HasTimeslice(subannual)) {
        throw NotFoundError("Time slice '" + subannual + "' does not exist");
    }

    for (const auto& [year, value] : data) {
        TimeseriesRecord record{region, variable, unit, subannual, year, value, meta};
        UpsertRecord(run.content.timeseries, record,
                     [](const TimeseriesRecord& a, const TimeseriesRecord& b) {
                         return a.region == b.region && a.variable == b.variable &&
                                a.unit == b.unit && a.subannual == b.subannual &&
                                a.year == b.year;
                     });
    }
}

void MemoryBackend::Delete(const Session& session, const std::string& region,
                           const std::string& variable, const std::string& subannual,
                           const std::vector<int>& years, const std::string& unit) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& rows = WritableRun(session, false).content.timeseries;
    std::set<int> doomed(years.begin(), years.end());
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&](const TimeseriesRecord& r) {
                                  return r.region == region && r.variable == variable &&
                                         r.subannual == subannual && r.unit == unit &&
                                         doomed.count(r.year) > 0;
                              }),
               rows.end());
}

std::vector<GeodataRecord> MemoryBackend::GetGeo(const Session& session) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto rows = RunFor(session).content.geodata;
    SortGeodata(rows);
    return rows;
}

void MemoryBackend::SetGeo(const Session& session, const GeodataRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Run& run = WritableRun(session, false);
    if (!HasRegion(record.region)) {
        throw NotFoundError("Region '" + record.region + "' does not exist");
    }
    if (!HasUnit(record.unit)) throw NotFoundError("Unit '" + record.unit + "' does not exist");
    if (!HasTimeslice(record.subannual)) {
        throw NotFoundError("Time slice '" + record.subannual + "' does not exist");
    }

    UpsertRecord(run.content.geodata, record, [](const GeodataRecord& a, const GeodataRecord& b) {
        return a.region == b.region && a.variable == b.variable &&
               a.subannual == b.subannual && a.year == b.year;
    });
}

void MemoryBackend::DeleteGeo(const Session& session, const std::string& region,
                              const std::string& variable, const std::string& subannual,
                              const std::vector<int>& years, const std::string& unit) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& rows = WritableRun(session, false).content.geodata;
    std::set<int> doomed(years.begin(), years.end());
    rows.erase(std::remove_if(rows.begin(), rows.end(),
                              [&](const GeodataRecord& r) {
                                  return r.region == region && r.variable == variable &&
                                         r.subannual == subannual && r.unit == unit &&
                                         doomed.count(r.year) > 0;
                              }),
               rows.end());
}

// ============================================================================
// Item data
// ============================================================================

std::vector<std::string> MemoryBackend::ListItems(const Session& session, ItemType kind) {
    if (kind == ItemType::TS) {
        throw ValidationError("Time series are not items; use get_data()");
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& item : RunFor(session).content.items) {
        if (item.kind == kind) {
            names.push_back(item.name);
        }
    }
    return names;
}

void MemoryBackend::InitItem(const Session& session, ItemType kind, const std::string& name,
                             const std::vector<std::string>& index_sets,
                             const std::vector<std::string>& index_names) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    ScenarioSnapshot& content = WritableRun(session, true).content;
    ItemSnapshot item = MakeItemDefinition(kind, name, index_sets, index_names,
                                           [&](const std::string& n) { return content.FindItem(n); });
    content.items.push_back(std::move(item));
}

void MemoryBackend::DeleteItem(const Session& session, ItemType kind, const std::string& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    ScenarioSnapshot& content = WritableRun(session, true).content;
    RequireItem(content.FindItem(name), kind, name);

    auto dependents = ItemsIndexedBy(content.items, name);
    if (!dependents.empty()) {
        std::string names;
        for (const auto& dependent : dependents) {
            names += names.empty() ? dependent : ", " + dependent;
        }
        throw ValidationError("Cannot delete '" + name + "': it indexes " + names);
    }

    content.items.erase(std::remove_if(content.items.begin(), content.items.end(),
                                       [&](const ItemSnapshot& i) { return i.name == name; }),
                        content.items.end());
}

std::vector<std::string> MemoryBackend::ItemIndex(const Session& session,
                                                  const std::string& name,
                                                  IndexField field) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const ItemSnapshot* item = RunFor(session).content.FindItem(name);
    if (item == nullptr) {
        throw NotFoundError("No item named '" + name + "'");
    }
    return field == IndexField::SETS ? item->index_sets : item->index_names;
}

ItemData MemoryBackend::ItemGetElements(const Session& session, ItemType kind,
                                        const std::string& name, const Filters& filters) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const ItemSnapshot& item = RequireItem(RunFor(session).content.FindItem(name), kind, name);
    return BuildItemData(item, filters);
}

void MemoryBackend::ItemSetElements(const Session& session, ItemType kind,
                                    const std::string& name,
                                    const std::vector<Element>& elements) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    ScenarioSnapshot& content = WritableRun(session, true).content;
    RequireItem(content.FindItem(name), kind, name);
    ItemSnapshot& item = *content.FindItem(name);

    ValidateElements(item, elements,
                     [&](const std::string& n) { return content.FindItem(n); },
                     [this](const std::string& unit) { return HasUnit(unit); });
    MergeElements(item, elements);
}

void MemoryBackend::ItemSetSolution(const Session& session, ItemType kind,
                                    const std::string& name,
                                    const std::vector<SolutionElement>& elements) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    ScenarioSnapshot& content = WritableRun(session, true).content;
    RequireItem(content.FindItem(name), kind, name);
    ItemSnapshot& item = *content.FindItem(name);

    ValidateSolution(item, elements, [&](const std::string& n) { return content.FindItem(n); });
    MergeSolution(item, elements);
}

void MemoryBackend::ItemDeleteElements(const Session& session, ItemType kind,
                                       const std::string& name,
                                       const std::vector<Key>& keys) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    ScenarioSnapshot& content = WritableRun(session, true).content;
    RequireItem(content.FindItem(name), kind, name);

    std::set<std::string> removed = RemoveElements(*content.FindItem(name), keys);
    if (removed.empty()) {
        return;
    }
    for (auto& dependent : content.items) {
        size_t count = RemoveDependentRows(dependent, name, removed);
        if (count > 0) {
            logger_.Debug("Removed " + std::to_string(count) + " row(s) of '" +
                          dependent.name + "' indexed by removed members of '" + name + "'");
        }
    }
}

// ============================================================================
// Scenario lifecycle
// ============================================================================

ScenarioSnapshot MemoryBackend::ExportSnapshot(const Session& session) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return RunFor(session).content;
}

int MemoryBackend::ImportSnapshot(const std::string& model, const std::string& scenario,
                                  const std::string& annotation,
                                  const ScenarioSnapshot& snapshot) {
    if (model.empty() || scenario.empty()) {
        throw ValidationError("Model and scenario names must not be empty");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);

    RegisterSnapshotCodes(snapshot);

    int64_t id = CreateRun(model, scenario, annotation);
    Run& run = runs_.at(id);
    run.content = snapshot;
    run.committed = true;
    run.upd_user = config_.user;
    run.upd_date = run.cre_date;
    return run.version;
}

bool MemoryBackend::HasSolution(const Session& session) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return RunFor(session).content.HasSolution();
}

void MemoryBackend::ClearSolution(const Session& session, std::optional<int> from_year) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    Run& run = RunFor(session);
    if (run.lock_owner && *run.lock_owner != session.id) {
        throw PreconditionError(RunLabel(run.model, run.scenario, run.version) +
                                " is checked out by another session");
    }

    ClearSolutionData(run.content, from_year);
    if (run.backup) {
        ClearSolutionData(*run.backup, from_year);
    }
    run.upd_user = config_.user;
    run.upd_date = CurrentTimestamp();
}

// ============================================================================
// Meta
// ============================================================================

MetaMap MemoryBackend::GetMeta(const std::optional<std::string>& model,
                               const std::optional<std::string>& scenario,
                               const std::optional<int>& version, bool strict) {
    MetaScope scope = MakeMetaScope(model, scenario, version);

    std::shared_lock<std::shared_mutex> lock(mutex_);
    return CollectMeta(meta_, scope, strict);
}

void MemoryBackend::SetMeta(const MetaMap& meta, const std::optional<std::string>& model,
                            const std::optional<std::string>& scenario,
                            const std::optional<int>& version) {
    MetaScope scope = MakeMetaScope(model, scenario, version);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    CheckMetaScopeExists(scope);

    std::vector<std::string> keys;
    for (const auto& [key, value] : meta) {
        keys.push_back(key);
    }
    CheckMetaConflicts(meta_, scope, keys);

    for (const auto& [key, value] : meta) {
        UpsertRecord(meta_, MetaEntry{scope, key, value},
                     [](const MetaEntry& a, const MetaEntry& b) {
                         return a.scope == b.scope && a.key == b.key;
                     });
    }
}

void MemoryBackend::RemoveMeta(const std::vector<std::string>& names,
                               const std::optional<std::string>& model,
                               const std::optional<std::string>& scenario,
                               const std::optional<int>& version) {
    MetaScope scope = MakeMetaScope(model, scenario, version);
    std::set<std::string> doomed(names.begin(), names.end());

    std::unique_lock<std::shared_mutex> lock(mutex_);
    meta_.erase(std::remove_if(meta_.begin(), meta_.end(),
                               [&](const MetaEntry& entry) {
                                   return entry.scope == scope && doomed.count(entry.key) > 0;
                               }),
                meta_.end());
}

} // namespace modelstore
