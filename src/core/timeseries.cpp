// File: src/core/timeseries.cpp
#include "core/timeseries.hpp"
#include "core/errors.hpp"
#include "core/url.hpp"
#include <tuple>

namespace modelstore {

const char* ToString(SessionState state) {
    switch (state) {
        case SessionState::UNBOUND: return "UNBOUND";
        case SessionState::NEW: return "NEW";
        case SessionState::LOADED: return "LOADED";
        case SessionState::CHECKED_OUT: return "CHECKED_OUT";
        case SessionState::DETACHED: return "DETACHED";
    }
    return "UNKNOWN";
}

// ============================================================================
// Construction
// ============================================================================

TimeSeries::TimeSeries(std::shared_ptr<Platform> platform,
                       const std::string& model,
                       const std::string& scenario,
                       const Version& version,
                       const std::string& annotation)
    : TimeSeries(std::move(platform), model, scenario, version, annotation, "", false) {}

TimeSeries::TimeSeries(std::shared_ptr<Platform> platform,
                       const std::string& model,
                       const std::string& scenario,
                       const Version& version,
                       const std::string& annotation,
                       const std::string& scheme,
                       bool is_scenario)
    : platform_(platform) {
    if (!platform) {
        throw ReferenceError("A session handle requires a Platform");
    }
    session_.model = model;
    session_.scenario = scenario;
    session_.scheme = scheme;
    session_.is_scenario = is_scenario;
    Bind(version, annotation);
}

void TimeSeries::Bind(const Version& version, const std::string& annotation) {
    auto mp = Owner();

    if (version.IsNew()) {
        if (annotation.empty()) {
            mp->logger().Info("Initialize " + Describe() + " with no annotation");
        }
        mp->backend().Init(session_, annotation);
        state_ = SessionState::NEW;
        return;
    }

    if (version.IsNumber()) {
        session_.version = version.number();
    }
    mp->backend().Get(session_);
    state_ = SessionState::LOADED;
}

TimeSeries::~TimeSeries() {
    auto mp = platform_.lock();
    if (!mp) {
        return;
    }
    try {
        mp->backend().DelTs(session_);
    } catch (const std::exception& e) {
        mp->logger().Warning("Failed to release " + Describe() + ": " + e.what());
    }
}

SessionState TimeSeries::state() const {
    return platform_.expired() ? SessionState::DETACHED : state_;
}

std::shared_ptr<Platform> TimeSeries::Owner() const {
    auto mp = platform_.lock();
    if (!mp) {
        throw ReferenceError("The Platform of " + Describe() + " has been destroyed");
    }
    return mp;
}

void TimeSeries::RequireEditable(const std::string& operation) const {
    SessionState current = state();
    if (current == SessionState::DETACHED) {
        throw ReferenceError("The Platform of " + Describe() + " has been destroyed");
    }
    if (current != SessionState::NEW && current != SessionState::CHECKED_OUT) {
        throw PreconditionError(operation + " requires " + Describe() +
                                " to be checked out; call check_out() first");
    }
}

std::string TimeSeries::Describe() const {
    std::string text = session_.is_scenario ? "Scenario " : "TimeSeries ";
    text += session_.model + "/" + session_.scenario;
    if (session_.version) {
        text += "#" + std::to_string(*session_.version);
    }
    return text;
}

// ============================================================================
// Edit lifecycle
// ============================================================================

void TimeSeries::CheckOut(bool timeseries_only) {
    auto mp = Owner();
    if (state_ == SessionState::CHECKED_OUT) {
        throw PreconditionError(Describe() + " is already checked out");
    }
    mp->backend().CheckOut(session_, timeseries_only);
    state_ = SessionState::CHECKED_OUT;
}

bool TimeSeries::Commit(const std::string& comment) {
    auto mp = Owner();
    if (state_ != SessionState::NEW && state_ != SessionState::CHECKED_OUT) {
        mp->logger().Debug(Describe() + " is not checked out; nothing to commit");
        return false;
    }
    mp->backend().Commit(session_, comment);
    state_ = SessionState::LOADED;
    return true;
}

void TimeSeries::DiscardChanges() {
    auto mp = Owner();
    if (state_ != SessionState::NEW && state_ != SessionState::CHECKED_OUT) {
        throw PreconditionError(Describe() + " is not checked out; nothing to discard");
    }
    mp->backend().DiscardChanges(session_);
    state_ = session_.version.value_or(0) == 0 ? SessionState::NEW : SessionState::LOADED;
}

void TimeSeries::Transact(const std::string& message,
                          const std::function<void()>& body,
                          bool condition,
                          bool discard_on_error) {
    bool manage = condition && state() != SessionState::CHECKED_OUT;
    if (manage) {
        CheckOut();
    }

    try {
        body();
    } catch (const std::exception& e) {
        if (discard_on_error) {
            DiscardOnError(*this, e);
        } else if (manage) {
            // Leave the version checked in as on entry; the body's error wins
            try {
                Commit(message);
            } catch (const std::exception& commit_error) {
                if (auto mp = platform_.lock()) {
                    mp->logger().Error("Failed to commit " + Describe() + " after error: " +
                                       commit_error.what());
                }
            }
        }
        throw;
    }

    if (manage) {
        Commit(message);
    }
}

void TimeSeries::SetAsDefault() {
    Owner()->backend().SetAsDefault(session_);
}

bool TimeSeries::IsDefault() {
    return Owner()->backend().IsDefault(session_);
}

std::optional<std::string> TimeSeries::LastUpdate() {
    return Owner()->backend().LastUpdate(session_);
}

int64_t TimeSeries::RunId() {
    return Owner()->backend().RunId(session_);
}

bool TimeSeries::IsCheckedOut() {
    return Owner()->backend().IsCheckedOut(session_);
}

void DiscardOnError(TimeSeries& ts, const std::exception& error) {
    auto mp = ts.platform();
    const Logger& logger = mp->logger();

    logger.Error("Avoid locking " + ts.model() + "/" + ts.scenario() + " before raising: " +
                 error.what());
    try {
        ts.DiscardChanges();
        logger.Info("Discarded changes to " + ts.model() + "/" + ts.scenario());
    } catch (const std::exception& e) {
        logger.Error("Failed to discard changes: " + std::string(e.what()));
    }
    try {
        mp->CloseDb();
    } catch (const std::exception& e) {
        logger.Error("Failed to close the database: " + std::string(e.what()));
    }
}

// ============================================================================
// Time-series data
// ============================================================================

void TimeSeries::PreloadTimeseries() {
    Owner()->backend().Preload(session_);
}

void TimeSeries::AddTimeseries(const std::vector<TimeseriesRecord>& records, bool meta) {
    RequireEditable("add_timeseries()");
    auto mp = Owner();

    // One SetData call per series
    using SeriesKey = std::tuple<std::string, std::string, std::string, std::string, bool>;
    std::map<SeriesKey, std::map<int, double>> series;
    for (const auto& record : records) {
        series[SeriesKey{record.region, record.variable, record.unit, record.subannual,
                         meta || record.meta}][record.year] = record.value;
    }

    for (const auto& [key, data] : series) {
        const auto& [region, variable, unit, subannual, is_meta] = key;
        mp->backend().SetData(session_, region, variable, data, unit, subannual, is_meta);
    }
}

void TimeSeries::AddTimeseries(const std::string& region,
                               const std::string& variable,
                               const std::string& unit,
                               const std::map<int, double>& data,
                               const std::string& subannual,
                               bool meta) {
    RequireEditable("add_timeseries()");
    Owner()->backend().SetData(session_, region, variable, data, unit, subannual, meta);
}

std::vector<TimeseriesRecord> TimeSeries::Timeseries(const std::vector<std::string>& regions,
                                                     const std::vector<std::string>& variables,
                                                     const std::vector<std::string>& units,
                                                     const std::vector<int>& years) {
    return Owner()->backend().GetData(session_, regions, variables, units, years);
}

void TimeSeries::RemoveTimeseries(const std::vector<TimeseriesRecord>& records) {
    RequireEditable("remove_timeseries()");
    auto mp = Owner();

    using SeriesKey = std::tuple<std::string, std::string, std::string, std::string>;
    std::map<SeriesKey, std::vector<int>> series;
    for (const auto& record : records) {
        series[SeriesKey{record.region, record.variable, record.subannual, record.unit}]
            .push_back(record.year);
    }

    for (const auto& [key, years] : series) {
        const auto& [region, variable, subannual, unit] = key;
        mp->backend().Delete(session_, region, variable, subannual, years, unit);
    }
}

void TimeSeries::AddGeodata(const std::vector<GeodataRecord>& records) {
    RequireEditable("add_geodata()");
    auto mp = Owner();
    for (const auto& record : records) {
        mp->backend().SetGeo(session_, record);
    }
}

std::vector<GeodataRecord> TimeSeries::GetGeodata() {
    return Owner()->backend().GetGeo(session_);
}

void TimeSeries::RemoveGeodata(const std::vector<GeodataRecord>& records) {
    RequireEditable("remove_geodata()");
    auto mp = Owner();

    using SeriesKey = std::tuple<std::string, std::string, std::string, std::string>;
    std::map<SeriesKey, std::vector<int>> series;
    for (const auto& record : records) {
        series[SeriesKey{record.region, record.variable, record.subannual, record.unit}]
            .push_back(record.year);
    }

    for (const auto& [key, years] : series) {
        const auto& [region, variable, subannual, unit] = key;
        mp->backend().DeleteGeo(session_, region, variable, subannual, years, unit);
    }
}

// ============================================================================
// Meta
// ============================================================================

MetaMap TimeSeries::GetMeta() {
    return Owner()->backend().GetMeta(session_.model, session_.scenario, session_.version,
                                      false);
}

std::optional<MetaValue> TimeSeries::GetMeta(const std::string& name) {
    MetaMap meta = GetMeta();
    auto it = meta.find(name);
    if (it == meta.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TimeSeries::SetMeta(const MetaMap& meta) {
    Owner()->backend().SetMeta(meta, session_.model, session_.scenario, session_.version);
}

void TimeSeries::SetMeta(const std::string& name, const MetaValue& value) {
    SetMeta(MetaMap{{name, value}});
}

void TimeSeries::RemoveMeta(const std::vector<std::string>& names) {
    Owner()->backend().RemoveMeta(names, session_.model, session_.scenario, session_.version);
}

// ============================================================================
// Identity
// ============================================================================

std::string TimeSeries::Url() const {
    return FormatUrl(session_.model, session_.scenario,
                     session_.version ? Version(*session_.version) : Version());
}

std::unique_ptr<TimeSeries> TimeSeries::FromUrl(const std::string& url,
                                                const std::shared_ptr<Platform>& platform) {
    ParsedUrl parsed = ParseUrl(url);
    if (parsed.platform && platform && *parsed.platform != platform->name()) {
        throw ValidationError("URL '" + url + "' names platform '" + *parsed.platform +
                              "', not '" + platform->name() + "'");
    }
    return std::make_unique<TimeSeries>(platform, parsed.model, parsed.scenario,
                                        parsed.version);
}

std::shared_ptr<Platform> TimeSeries::PlatformForUrl(const std::string& url,
                                                     const PlatformConfig& config) {
    ParsedUrl parsed = ParseUrl(url);
    return Platform::FromConfig(config, parsed.platform.value_or(""));
}

UrlTarget<TimeSeries> TimeSeries::FromUrl(const std::string& url,
                                          const PlatformConfig& config,
                                          bool raise_errors) {
    UrlTarget<TimeSeries> target;
    target.platform = PlatformForUrl(url, config);
    try {
        target.handle = FromUrl(url, target.platform);
    } catch (const ModelStoreError& e) {
        if (raise_errors) {
            throw;
        }
        target.platform->logger().Warning(std::string("Failed to load ") + url + ": " +
                                          e.what());
    }
    return target;
}

} // namespace modelstore
