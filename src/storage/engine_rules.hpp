// File: src/storage/engine_rules.hpp
#pragma once

#include "core/types.hpp"
#include "storage/snapshot.hpp"
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace modelstore {

// Rules shared by every storage engine: item definitions, element
// validation and merging, filtered reads, and meta scopes. Engines load the
// affected records, apply these rules, then store the result.

/// Lookup of an existing item by name (nullptr when absent)
using ItemLookup = std::function<const ItemSnapshot*(const std::string&)>;

/// Check whether a unit of measure is registered
using UnitCheck = std::function<bool(const std::string&)>;

// ============================================================================
// Keys
// ============================================================================

/// Encode a key as a single string for storage (components joined by 0x1f)
std::string EncodeKey(const Key& key);

/// Inverse of EncodeKey
Key DecodeKey(const std::string& encoded);

/// Human-readable key, e.g. "(a, b)"
std::string DescribeKey(const Key& key);

// ============================================================================
// Item definitions
// ============================================================================

/// Validate a new item definition and fill in default index names
///
/// Fails if an item with the same name exists under any kind, if the
/// lengths of index_sets and index_names differ, or if an index set is not a
/// plain set.
/// @throws ValidationError, NotFoundError (missing index set)
ItemSnapshot MakeItemDefinition(ItemType kind,
                                const std::string& name,
                                const std::vector<std::string>& index_sets,
                                const std::vector<std::string>& index_names,
                                const ItemLookup& find);

/// Require an item of the given kind
/// @throws NotFoundError if item is null or of another kind
const ItemSnapshot& RequireItem(const ItemSnapshot* item, ItemType kind, const std::string& name);

/// Dimension names of an item as used for filters and returned columns
std::vector<std::string> EffectiveIndexNames(const ItemSnapshot& item);

/// Names of the items indexed by set_name
std::vector<std::string> ItemsIndexedBy(const std::vector<ItemSnapshot>& items,
                                        const std::string& set_name);

// ============================================================================
// Reads
// ============================================================================

/// True if the row passes every filter on one of the item's dimensions
/// Filters on other names are ignored; values compare by string form.
bool MatchesFilters(const std::vector<std::string>& index_names,
                    const ItemRow& row,
                    const Filters& filters);

/// Shape the filtered elements of an item for return
ItemData BuildItemData(const ItemSnapshot& item, const Filters& filters);

// ============================================================================
// Writes
// ============================================================================

/// Validate a batch of elements before any of them is written
/// @throws ValidationError for malformed elements or keys that are not
///         members of their index sets, NotFoundError for unknown units
void ValidateElements(const ItemSnapshot& item,
                      const std::vector<Element>& elements,
                      const ItemLookup& find,
                      const UnitCheck& unit_exists);

/// Insert or update elements by key, keeping insertion order of new keys
void MergeElements(ItemSnapshot& item, const std::vector<Element>& elements);

/// Validate solver output for a variable or equation
void ValidateSolution(const ItemSnapshot& item,
                      const std::vector<SolutionElement>& elements,
                      const ItemLookup& find);

/// Insert or update (level, marginal) rows by key
void MergeSolution(ItemSnapshot& item, const std::vector<SolutionElement>& elements);

/// Remove elements by key; missing keys are ignored
/// @return labels removed when item is a plain index set, else empty
std::set<std::string> RemoveElements(ItemSnapshot& item, const std::vector<Key>& keys);

/// Remove rows of a dependent item that use any of labels along set_name
/// @return number of rows removed
size_t RemoveDependentRows(ItemSnapshot& dependent,
                           const std::string& set_name,
                           const std::set<std::string>& labels);

// ============================================================================
// Time series
// ============================================================================

/// Keep rows matching every non-empty filter list
std::vector<TimeseriesRecord> FilterTimeseries(const std::vector<TimeseriesRecord>& rows,
                                               const std::vector<std::string>& regions,
                                               const std::vector<std::string>& variables,
                                               const std::vector<std::string>& units,
                                               const std::vector<int>& years);

/// Sort by (region, variable, unit, subannual, year)
void SortTimeseries(std::vector<TimeseriesRecord>& rows);

/// Sort by (region, variable, subannual, year)
void SortGeodata(std::vector<GeodataRecord>& rows);

// ============================================================================
// Meta
// ============================================================================

/// Target of a meta annotation
struct MetaScope {
    std::optional<std::string> model;
    std::optional<std::string> scenario;
    std::optional<int> version;

    bool operator==(const MetaScope& other) const {
        return model == other.model && scenario == other.scenario && version == other.version;
    }
    bool operator!=(const MetaScope& other) const { return !(*this == other); }

    /// "model M, scenario S, version V" with "null" for unset fields
    std::string Describe() const;
};

/// One stored annotation
struct MetaEntry {
    MetaScope scope;
    std::string key;
    MetaValue value;
};

/// Build a scope, accepting only (model), (scenario), (model, scenario)
/// and (model, scenario, version)
/// @throws ValidationError for any other combination
MetaScope MakeMetaScope(const std::optional<std::string>& model,
                        const std::optional<std::string>& scenario,
                        const std::optional<int>& version);

/// True if some (model, scenario, version) lies in both scopes
bool ScopesOverlap(const MetaScope& a, const MetaScope& b);

/// Scopes read by get_meta, least specific first
std::vector<MetaScope> MetaLookupScopes(const MetaScope& scope, bool strict);

/// Raise if any key is already attached at a different, overlapping scope
/// @throws ValidationError
void CheckMetaConflicts(const std::vector<MetaEntry>& existing,
                        const MetaScope& scope,
                        const std::vector<std::string>& keys);

/// Merge entries of the lookup scopes; more specific scopes win
MetaMap CollectMeta(const std::vector<MetaEntry>& entries, const MetaScope& scope, bool strict);

} // namespace modelstore
