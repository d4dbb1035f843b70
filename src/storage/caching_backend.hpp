// File: src/storage/caching_backend.hpp
#pragma once

#include "storage/backend.hpp"
#include "storage/item_cache.hpp"
#include <memory>
#include <mutex>
#include <unordered_map>

namespace modelstore {

/// Backend decorator that memoizes item reads
///
/// Wraps any Backend and forwards every call to it. item_get_elements
/// results are cached per (session, kind, name, filters). Entries are
/// invalidated on element writes and deletes, item deletion, check out,
/// discard, solution removal and when a session handle is released. Writes
/// through one session invalidate the entries of every session bound to the
/// same stored run, so handles sharing a run never read stale data.
class CachingBackend : public Backend {
public:
    /// Configuration for CachingBackend
    struct Config {
        /// False turns the cache into a no-op
        bool enabled{true};

        /// Maximum number of cached reads
        size_t capacity{10000};
    };

    /// @param inner Backend to wrap (ownership is taken)
    CachingBackend(std::unique_ptr<Backend> inner, const Config& config);

    ~CachingBackend() override = default;

    CachingBackend(const CachingBackend&) = delete;
    CachingBackend& operator=(const CachingBackend&) = delete;

    Backend& inner() { return *inner_; }

    // ========================================================================
    // Cache operations
    // ========================================================================

    /// Copy of a cached value, or std::nullopt on a miss
    std::optional<ItemData> CacheGet(const CacheKey& key);

    /// Store a value
    /// @return true if an existing entry was replaced
    bool CachePut(const CacheKey& key, const ItemData& value);

    /// Invalidate cached reads of one session
    ///
    /// With kind, name and filters: exactly that entry (empty filters name
    /// the unfiltered entry). With kind and name only: that entry and every
    /// filtered variant. With the session only: all of its entries.
    /// @return Number of entries removed
    size_t CacheInvalidate(const Session& session,
                           const std::optional<ItemType>& kind = std::nullopt,
                           const std::optional<std::string>& name = std::nullopt,
                           const std::optional<Filters>& filters = std::nullopt);

    /// Hits recorded for one key
    uint64_t CacheHitCount(const CacheKey& key) const { return cache_.HitCount(key); }

    ItemCache<ItemData>::Stats CacheStats() const { return cache_.GetStats(); }

    bool CacheEnabled() const override { return cache_.enabled(); }

    // ========================================================================
    // Backend Interface Implementation
    // ========================================================================

    std::string Name() const override { return inner_->Name(); }

    void OpenDb() override { inner_->OpenDb(); }
    void CloseDb() override { inner_->CloseDb(); }
    void SetLogLevel(LogLevel level) override;
    LogLevel GetLogLevel() const override { return inner_->GetLogLevel(); }

    void SetNode(const std::string& name,
                 const std::optional<std::string>& parent,
                 const std::optional<std::string>& hierarchy,
                 const std::optional<std::string>& synonym) override;
    std::vector<RegionRecord> GetNodes() override { return inner_->GetNodes(); }
    void SetTimeslice(const std::string& name, const std::string& category,
                      double duration) override;
    std::vector<TimesliceRecord> GetTimeslices() override { return inner_->GetTimeslices(); }
    void AddModelName(const std::string& name) override { inner_->AddModelName(name); }
    void AddScenarioName(const std::string& name) override { inner_->AddScenarioName(name); }
    std::vector<std::string> GetModelNames() override { return inner_->GetModelNames(); }
    std::vector<std::string> GetScenarioNames() override { return inner_->GetScenarioNames(); }
    std::vector<ScenarioInfo> GetScenarios(bool default_only,
                                           const std::optional<std::string>& model,
                                           const std::optional<std::string>& scenario) override;
    void SetUnit(const std::string& name, const std::string& comment) override;
    std::vector<std::string> GetUnits() override { return inner_->GetUnits(); }

    void Init(Session& session, const std::string& annotation) override;
    void Get(Session& session) override;
    void DelTs(const Session& session) override;
    void CheckOut(const Session& session, bool timeseries_only) override;
    void Commit(Session& session, const std::string& comment) override;
    void DiscardChanges(const Session& session) override;
    void SetAsDefault(const Session& session) override { inner_->SetAsDefault(session); }
    bool IsDefault(const Session& session) override { return inner_->IsDefault(session); }
    std::optional<std::string> LastUpdate(const Session& session) override;
    int64_t RunId(const Session& session) override { return inner_->RunId(session); }
    bool IsCheckedOut(const Session& session) override { return inner_->IsCheckedOut(session); }
    void Preload(const Session& session) override { inner_->Preload(session); }

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

    int Clone(const Session& session, Backend& dest, const CloneRequest& request) override;
    std::string CloneFormat() const override { return inner_->CloneFormat(); }
    ScenarioSnapshot ExportSnapshot(const Session& session) override;
    int ImportSnapshot(const std::string& model, const std::string& scenario,
                       const std::string& annotation,
                       const ScenarioSnapshot& snapshot) override;
    bool HasSolution(const Session& session) override { return inner_->HasSolution(session); }
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

    std::map<std::string, bool> GetAuth(const std::string& user,
                                        const std::vector<std::string>& models,
                                        const std::string& access) override;

private:
    /// Remember which run a session is bound to
    void TrackSession(const Session& session);

    /// Invalidate matching entries of every session bound to the same run
    void InvalidateRun(const Session& session,
                       const std::optional<ItemType>& kind,
                       const std::optional<std::string>& name);

    std::unique_ptr<Backend> inner_;
    ItemCache<ItemData> cache_;

    std::mutex sessions_mutex_;
    std::unordered_map<SessionID, int64_t> session_runs_;
};

} // namespace modelstore
