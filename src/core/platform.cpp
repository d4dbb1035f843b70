// File: src/core/platform.cpp
#include "core/platform.hpp"
#include "core/errors.hpp"
#include "storage/backend_registry.hpp"
#include "storage/caching_backend.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>

namespace modelstore {

namespace {

// Releases a temporary session when leaving scope
class SessionGuard {
public:
    SessionGuard(Backend& backend, const Session& session)
        : backend_(backend), session_(session) {}

    ~SessionGuard() {
        try {
            backend_.DelTs(session_);
        } catch (const std::exception& e) {
            backend_.logger().Warning("Failed to release session " + session_.id.ToString() +
                                      ": " + e.what());
        }
    }

    SessionGuard(const SessionGuard&) = delete;
    SessionGuard& operator=(const SessionGuard&) = delete;

private:
    Backend& backend_;
    const Session& session_;
};

// Quote a CSV field containing a separator, quote or line break
std::string CsvField(const std::string& text) {
    if (text.find_first_of(",\"\n") == std::string::npos) {
        return text;
    }
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Platform::Platform(PrivateTag, std::unique_ptr<Backend> backend, std::string name)
    : backend_(std::move(backend)), name_(std::move(name)) {
    if (!backend_) {
        throw ValidationError("Platform requires a backend");
    }
    if (name_.empty()) {
        name_ = backend_->Name();
    }
}

std::shared_ptr<Platform> Platform::Create(const std::string& backend_class,
                                           const BackendOptions& options,
                                           const std::string& name) {
    CachingBackend::Config cache_config;
    BackendOptions engine_options = options;

    auto it = engine_options.find("cache");
    if (it != engine_options.end()) {
        cache_config.enabled = ParseBoolOption(it->first, it->second);
        engine_options.erase(it);
    }
    it = engine_options.find("cache_size");
    if (it != engine_options.end()) {
        cache_config.capacity = ParseSizeOption(it->first, it->second);
        engine_options.erase(it);
    }

    std::unique_ptr<Backend> engine = CreateBackend(backend_class, engine_options);
    auto caching = std::make_unique<CachingBackend>(std::move(engine), cache_config);
    return std::make_shared<Platform>(PrivateTag{}, std::move(caching), name);
}

std::shared_ptr<Platform> Platform::Create(std::unique_ptr<Backend> backend,
                                           const std::string& name) {
    return std::make_shared<Platform>(PrivateTag{}, std::move(backend), name);
}

std::shared_ptr<Platform> Platform::FromConfig(const PlatformConfig& config,
                                               const std::string& name) {
    const PlatformInfo* info = config.GetPlatformInfo(name);
    if (info == nullptr) {
        throw NotFoundError("No platform named '" +
                            (name.empty() ? config.default_platform : name) +
                            "' is configured");
    }
    return Create(info->backend_class, info->options,
                  name.empty() ? config.default_platform : name);
}

// ============================================================================
// Scenarios
// ============================================================================

std::vector<ScenarioInfo> Platform::ScenarioList(bool default_only,
                                                 const std::optional<std::string>& model,
                                                 const std::optional<std::string>& scenario) {
    return backend_->GetScenarios(default_only, model, scenario);
}

// ============================================================================
// Units, regions and time slices
// ============================================================================

void Platform::AddUnit(const std::string& unit, const std::string& comment) {
    std::vector<std::string> units = backend_->GetUnits();
    if (std::find(units.begin(), units.end(), unit) != units.end()) {
        logger().Info("unit '" + unit + "' is already defined on the platform");
        return;
    }
    backend_->SetUnit(unit, comment);
}

bool Platform::ExistingRegion(const std::string& name) {
    for (const auto& record : backend_->GetNodes()) {
        if (record.region != name) {
            continue;
        }
        std::string message = "region '" + name + "' is already defined on the platform";
        if (record.mapped_to) {
            message += " as a synonym for '" + *record.mapped_to + "'";
        }
        if (!record.parent.empty()) {
            message += " under parent '" + record.parent + "'";
        }
        logger().Warning(message);
        return true;
    }
    return false;
}

void Platform::AddRegion(const std::string& region,
                         const std::string& hierarchy,
                         const std::string& parent) {
    if (!ExistingRegion(region)) {
        backend_->SetNode(region, parent, hierarchy, std::nullopt);
    }
}

void Platform::AddRegionSynonym(const std::string& region, const std::string& mapped_to) {
    if (!ExistingRegion(region)) {
        backend_->SetNode(mapped_to, std::nullopt, std::nullopt, region);
    }
}

void Platform::AddTimeslice(const std::string& name, const std::string& category,
                            double duration) {
    for (const auto& slice : backend_->GetTimeslices()) {
        if (slice.name != name) {
            continue;
        }
        std::string message = "timeslice '" + name + "' already defined with duration " +
                              FormatNumber(slice.duration);
        if (std::fabs(slice.duration - duration) > 1e-8 + 1e-5 * std::fabs(slice.duration)) {
            throw ValidationError(message);
        }
        logger().Info(message);
        return;
    }
    backend_->SetTimeslice(name, category, duration);
}

// ============================================================================
// Access control
// ============================================================================

std::map<std::string, bool> Platform::CheckAccess(const std::string& user,
                                                  const std::vector<std::string>& models,
                                                  const std::string& access) {
    if (models.empty()) {
        throw ValidationError("must supply at least 1 model name");
    }
    std::map<std::string, bool> granted = backend_->GetAuth(user, models, access);

    std::map<std::string, bool> result;
    for (const auto& model : models) {
        auto it = granted.find(model);
        result[model] = it != granted.end() && it->second;
    }
    return result;
}

bool Platform::CheckAccess(const std::string& user,
                           const std::string& model,
                           const std::string& access) {
    return CheckAccess(user, std::vector<std::string>{model}, access).at(model);
}

// ============================================================================
// Export
// ============================================================================

void Platform::ExportTimeseriesData(const std::string& path,
                                    const TimeseriesExportOptions& options) {
    if (options.export_all_runs && (options.model || options.scenario)) {
        throw ValidationError("Invalid arguments: export_all_runs cannot be used when "
                              "providing a model or scenario");
    }

    std::ofstream out(path);
    if (!out.is_open()) {
        throw EngineError("Failed to open file for writing: " + path);
    }
    out << "MODEL,SCENARIO,VERSION,VARIABLE,UNIT,REGION,META,SUBANNUAL,YEAR,VALUE\n";

    bool default_only = options.default_only && !options.export_all_runs;
    size_t rows = 0;
    for (const auto& info : backend_->GetScenarios(default_only, options.model,
                                                   options.scenario)) {
        Session session;
        session.model = info.model;
        session.scenario = info.scenario;
        session.version = info.version;

        SessionGuard guard(*backend_, session);
        backend_->Get(session);

        for (const auto& record : backend_->GetData(session, options.regions,
                                                    options.variables, options.units, {})) {
            out << CsvField(info.model) << ',' << CsvField(info.scenario) << ','
                << info.version << ',' << CsvField(record.variable) << ','
                << CsvField(record.unit) << ',' << CsvField(record.region) << ','
                << (record.meta ? 1 : 0) << ',' << CsvField(record.subannual) << ','
                << record.year << ',' << FormatNumber(record.value) << '\n';
            ++rows;
        }
    }

    if (!out) {
        throw EngineError("Failed to write " + path);
    }
    logger().Debug("Exported " + std::to_string(rows) + " time-series rows to " + path);
}

} // namespace modelstore
