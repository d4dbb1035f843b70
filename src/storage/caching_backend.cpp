// File: src/storage/caching_backend.cpp
#include "storage/caching_backend.hpp"
#include "core/errors.hpp"
#include <vector>

namespace modelstore {

// ============================================================================
// Constructor
// ============================================================================

CachingBackend::CachingBackend(std::unique_ptr<Backend> inner, const Config& config)
    : Backend("CachingBackend"),
      inner_(std::move(inner)),
      cache_(config.capacity, config.enabled) {
    if (!inner_) {
        throw ValidationError("CachingBackend requires a backend to wrap");
    }
    logger_.SetLevel(inner_->GetLogLevel());
}

void CachingBackend::SetLogLevel(LogLevel level) {
    logger_.SetLevel(level);
    inner_->SetLogLevel(level);
}

// ============================================================================
// Cache operations
// ============================================================================

std::optional<ItemData> CachingBackend::CacheGet(const CacheKey& key) {
    return cache_.Get(key);
}

bool CachingBackend::CachePut(const CacheKey& key, const ItemData& value) {
    return cache_.Put(key, value);
}

size_t CachingBackend::CacheInvalidate(const Session& session,
                                       const std::optional<ItemType>& kind,
                                       const std::optional<std::string>& name,
                                       const std::optional<Filters>& filters) {
    if (kind && name && filters) {
        return cache_.Remove(CacheKey::Make(session.id, *kind, *name, *filters)) ? 1 : 0;
    }

    CachePattern pattern;
    pattern.session = session.id;
    pattern.kind = kind;
    pattern.name = name;
    return cache_.RemoveMatching(pattern);
}

void CachingBackend::TrackSession(const Session& session) {
    int64_t run = inner_->RunId(session);
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    session_runs_[session.id] = run;
}

void CachingBackend::InvalidateRun(const Session& session,
                                   const std::optional<ItemType>& kind,
                                   const std::optional<std::string>& name) {
    std::vector<SessionID> sessions{session.id};
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = session_runs_.find(session.id);
        if (it != session_runs_.end()) {
            for (const auto& [other, run] : session_runs_) {
                if (run == it->second && other != session.id) {
                    sessions.push_back(other);
                }
            }
        }
    }

    size_t removed = 0;
    for (const auto& id : sessions) {
        CachePattern pattern;
        pattern.session = id;
        pattern.kind = kind;
        pattern.name = name;
        removed += cache_.RemoveMatching(pattern);
    }

    if (removed > 0) {
        logger_.Debug("Invalidated " + std::to_string(removed) + " cached read(s) of " +
                      session.model + "/" + session.scenario);
    }
}

// ============================================================================
// Registries
// ============================================================================

void CachingBackend::SetNode(const std::string& name,
                             const std::optional<std::string>& parent,
                             const std::optional<std::string>& hierarchy,
                             const std::optional<std::string>& synonym) {
    inner_->SetNode(name, parent, hierarchy, synonym);
}

void CachingBackend::SetTimeslice(const std::string& name, const std::string& category,
                                  double duration) {
    inner_->SetTimeslice(name, category, duration);
}

std::vector<ScenarioInfo> CachingBackend::GetScenarios(bool default_only,
                                                       const std::optional<std::string>& model,
                                                       const std::optional<std::string>& scenario) {
    return inner_->GetScenarios(default_only, model, scenario);
}

void CachingBackend::SetUnit(const std::string& name, const std::string& comment) {
    inner_->SetUnit(name, comment);
}

// ============================================================================
// Session lifecycle
// ============================================================================

void CachingBackend::Init(Session& session, const std::string& annotation) {
    inner_->Init(session, annotation);
    TrackSession(session);
}

void CachingBackend::Get(Session& session) {
    inner_->Get(session);
    TrackSession(session);
}

void CachingBackend::DelTs(const Session& session) {
    bool known = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        known = session_runs_.count(session.id) > 0;
    }

    // Releasing a held lock rolls the run back for every session bound to it
    bool held = false;
    if (known) {
        try {
            held = inner_->IsCheckedOut(session);
        } catch (const EngineError& e) {
            logger_.Debug(std::string("Lock state unknown on release: ") + e.what());
        }
    }
    if (held) {
        InvalidateRun(session, std::nullopt, std::nullopt);
    } else {
        CacheInvalidate(session);
    }
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        session_runs_.erase(session.id);
    }
    inner_->DelTs(session);
}

void CachingBackend::CheckOut(const Session& session, bool timeseries_only) {
    inner_->CheckOut(session, timeseries_only);
    InvalidateRun(session, std::nullopt, std::nullopt);
}

void CachingBackend::Commit(Session& session, const std::string& comment) {
    inner_->Commit(session, comment);
}

void CachingBackend::DiscardChanges(const Session& session) {
    // Invalidate even if the engine fails part way
    try {
        inner_->DiscardChanges(session);
    } catch (...) {
        InvalidateRun(session, std::nullopt, std::nullopt);
        throw;
    }
    InvalidateRun(session, std::nullopt, std::nullopt);
}

std::optional<std::string> CachingBackend::LastUpdate(const Session& session) {
    return inner_->LastUpdate(session);
}

// ============================================================================
// Time-series data
// ============================================================================

std::vector<TimeseriesRecord> CachingBackend::GetData(const Session& session,
                                                      const std::vector<std::string>& regions,
                                                      const std::vector<std::string>& variables,
                                                      const std::vector<std::string>& units,
                                                      const std::vector<int>& years) {
    return inner_->GetData(session, regions, variables, units, years);
}

void CachingBackend::SetData(const Session& session, const std::string& region,
                             const std::string& variable, const std::map<int, double>& data,
                             const std::string& unit, const std::string& subannual, bool meta) {
    inner_->SetData(session, region, variable, data, unit, subannual, meta);
}

void CachingBackend::Delete(const Session& session, const std::string& region,
                            const std::string& variable, const std::string& subannual,
                            const std::vector<int>& years, const std::string& unit) {
    inner_->Delete(session, region, variable, subannual, years, unit);
}

std::vector<GeodataRecord> CachingBackend::GetGeo(const Session& session) {
    return inner_->GetGeo(session);
}

void CachingBackend::SetGeo(const Session& session, const GeodataRecord& record) {
    inner_->SetGeo(session, record);
}

void CachingBackend::DeleteGeo(const Session& session, const std::string& region,
                               const std::string& variable, const std::string& subannual,
                               const std::vector<int>& years, const std::string& unit) {
    inner_->DeleteGeo(session, region, variable, subannual, years, unit);
}

// ============================================================================
// Item data
// ============================================================================

std::vector<std::string> CachingBackend::ListItems(const Session& session, ItemType kind) {
    return inner_->ListItems(session, kind);
}

void CachingBackend::InitItem(const Session& session, ItemType kind, const std::string& name,
                              const std::vector<std::string>& index_sets,
                              const std::vector<std::string>& index_names) {
    inner_->InitItem(session, kind, name, index_sets, index_names);
    InvalidateRun(session, kind, name);
}

void CachingBackend::DeleteItem(const Session& session, ItemType kind, const std::string& name) {
    inner_->DeleteItem(session, kind, name);
    InvalidateRun(session, kind, name);
}

std::vector<std::string> CachingBackend::ItemIndex(const Session& session,
                                                   const std::string& name,
                                                   IndexField field) {
    return inner_->ItemIndex(session, name, field);
}

ItemData CachingBackend::ItemGetElements(const Session& session, ItemType kind,
                                         const std::string& name, const Filters& filters) {
    CacheKey key = CacheKey::Make(session.id, kind, name, filters);
    if (auto cached = cache_.Get(key)) {
        return std::move(*cached);
    }

    ItemData data = inner_->ItemGetElements(session, kind, name, filters);
    cache_.Put(key, data);
    return data;
}

void CachingBackend::ItemSetElements(const Session& session, ItemType kind,
                                     const std::string& name,
                                     const std::vector<Element>& elements) {
    inner_->ItemSetElements(session, kind, name, elements);
    InvalidateRun(session, kind, name);
}

void CachingBackend::ItemSetSolution(const Session& session, ItemType kind,
                                     const std::string& name,
                                     const std::vector<SolutionElement>& elements) {
    inner_->ItemSetSolution(session, kind, name, elements);
    InvalidateRun(session, kind, name);
}

void CachingBackend::ItemDeleteElements(const Session& session, ItemType kind,
                                        const std::string& name,
                                        const std::vector<Key>& keys) {
    inner_->ItemDeleteElements(session, kind, name, keys);
    if (kind == ItemType::SET) {
        // Removing set members also removes dependent rows of other items
        InvalidateRun(session, std::nullopt, std::nullopt);
    } else {
        InvalidateRun(session, kind, name);
    }
}

// ============================================================================
// Scenario lifecycle
// ============================================================================

int CachingBackend::Clone(const Session& session, Backend& dest, const CloneRequest& request) {
    return inner_->Clone(session, dest, request);
}

ScenarioSnapshot CachingBackend::ExportSnapshot(const Session& session) {
    return inner_->ExportSnapshot(session);
}

int CachingBackend::ImportSnapshot(const std::string& model, const std::string& scenario,
                                   const std::string& annotation,
                                   const ScenarioSnapshot& snapshot) {
    return inner_->ImportSnapshot(model, scenario, annotation, snapshot);
}

void CachingBackend::ClearSolution(const Session& session, std::optional<int> from_year) {
    inner_->ClearSolution(session, from_year);
    InvalidateRun(session, std::nullopt, std::nullopt);
}

// ============================================================================
// Meta and access
// ============================================================================

MetaMap CachingBackend::GetMeta(const std::optional<std::string>& model,
                                const std::optional<std::string>& scenario,
                                const std::optional<int>& version, bool strict) {
    return inner_->GetMeta(model, scenario, version, strict);
}

void CachingBackend::SetMeta(const MetaMap& meta, const std::optional<std::string>& model,
                             const std::optional<std::string>& scenario,
                             const std::optional<int>& version) {
    inner_->SetMeta(meta, model, scenario, version);
}

void CachingBackend::RemoveMeta(const std::vector<std::string>& names,
                                const std::optional<std::string>& model,
                                const std::optional<std::string>& scenario,
                                const std::optional<int>& version) {
    inner_->RemoveMeta(names, model, scenario, version);
}

std::map<std::string, bool> CachingBackend::GetAuth(const std::string& user,
                                                    const std::vector<std::string>& models,
                                                    const std::string& access) {
    return inner_->GetAuth(user, models, access);
}

} // namespace modelstore
