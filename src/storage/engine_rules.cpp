// File: src/storage/engine_rules.cpp
#include "storage/engine_rules.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <map>
#include <tuple>
#include <unordered_set>

namespace modelstore {

namespace {

constexpr char kKeySeparator = '\x1f';

std::unordered_set<std::string> IndexSetMembers(const ItemSnapshot& set) {
    std::unordered_set<std::string> members;
    members.reserve(set.rows.size());
    for (const auto& row : set.rows) {
        if (!row.key.empty()) {
            members.insert(row.key.front());
        }
    }
    return members;
}

/// Membership of every key component in its index set, with the member
/// lists built once per batch
class KeyChecker {
public:
    KeyChecker(const ItemSnapshot& item, const ItemLookup& find) : item_(item) {
        for (const auto& set_name : item.index_sets) {
            if (members_.count(set_name) > 0) {
                continue;
            }
            const ItemSnapshot* set = find(set_name);
            if (set == nullptr) {
                throw NotFoundError("Index set '" + set_name + "' of item '" +
                                    item.name + "' does not exist");
            }
            members_.emplace(set_name, IndexSetMembers(*set));
        }
    }

    void Check(const std::optional<Key>& key) const {
        size_t dimension = item_.Dimension();
        size_t size = key ? key->size() : 0;
        if (size != dimension) {
            throw ValidationError("Key " + (key ? DescribeKey(*key) : std::string("()")) +
                                  " has " + std::to_string(size) + " component(s); '" +
                                  item_.name + "' expects " + std::to_string(dimension));
        }
        for (size_t i = 0; i < item_.index_sets.size(); ++i) {
            const auto& set_name = item_.index_sets[i];
            const auto& members = members_.at(set_name);
            if (members.count((*key)[i]) == 0) {
                throw ValidationError("'" + (*key)[i] + "' is not a member of index set '" +
                                      set_name + "' (key " + DescribeKey(*key) +
                                      " of '" + item_.name + "')");
            }
        }
    }

private:
    const ItemSnapshot& item_;
    std::map<std::string, std::unordered_set<std::string>> members_;
};

std::string OptionalText(const std::optional<std::string>& value) {
    return value ? *value : std::string("null");
}

} // namespace

// ============================================================================
// Keys
// ============================================================================

std::string EncodeKey(const Key& key) {
    std::string encoded;
    for (size_t i = 0; i < key.size(); ++i) {
        if (i > 0) {
            encoded += kKeySeparator;
        }
        encoded += key[i];
    }
    return encoded;
}

Key DecodeKey(const std::string& encoded) {
    Key key;
    if (encoded.empty()) {
        return key;
    }
    size_t start = 0;
    while (true) {
        size_t pos = encoded.find(kKeySeparator, start);
        if (pos == std::string::npos) {
            key.push_back(encoded.substr(start));
            break;
        }
        key.push_back(encoded.substr(start, pos - start));
        start = pos + 1;
    }
    return key;
}

std::string DescribeKey(const Key& key) {
    std::string text = "(";
    for (size_t i = 0; i < key.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += key[i];
    }
    return text + ")";
}

// ============================================================================
// Item definitions
// ============================================================================

ItemSnapshot MakeItemDefinition(ItemType kind,
                                const std::string& name,
                                const std::vector<std::string>& index_sets,
                                const std::vector<std::string>& index_names,
                                const ItemLookup& find) {
    if (kind == ItemType::TS) {
        throw ValidationError("Cannot initialize an item of type 'ts'");
    }
    if (name.empty()) {
        throw ValidationError("Item name must not be empty");
    }
    if (const ItemSnapshot* existing = find(name)) {
        throw ValidationError("An item named '" + name + "' already exists as type '" +
                              ToString(existing->kind) + "'");
    }
    if (!index_names.empty() && index_names.size() != index_sets.size()) {
        throw ValidationError("Item '" + name + "' has " + std::to_string(index_sets.size()) +
                              " index set(s) but " + std::to_string(index_names.size()) +
                              " index name(s)");
    }

    for (const auto& set_name : index_sets) {
        const ItemSnapshot* set = find(set_name);
        if (set == nullptr) {
            throw NotFoundError("Index set '" + set_name + "' does not exist");
        }
        if (!set->IsIndexSet()) {
            throw ValidationError("'" + set_name + "' is not a plain index set and cannot index '" +
                                  name + "'");
        }
    }

    ItemSnapshot item;
    item.kind = kind;
    item.name = name;
    item.index_sets = index_sets;
    item.index_names = index_names.empty() ? index_sets : index_names;

    std::set<std::string> unique(item.index_names.begin(), item.index_names.end());
    if (unique.size() != item.index_names.size()) {
        throw ValidationError("Index names of '" + name + "' must be unique");
    }
    return item;
}

const ItemSnapshot& RequireItem(const ItemSnapshot* item, ItemType kind, const std::string& name) {
    if (item == nullptr || item->kind != kind) {
        throw NotFoundError(std::string("No item '") + name + "' of type '" +
                            ToString(kind) + "'");
    }
    return *item;
}

std::vector<std::string> EffectiveIndexNames(const ItemSnapshot& item) {
    if (item.IsIndexSet()) {
        return {item.name};
    }
    return item.index_names;
}

std::vector<std::string> ItemsIndexedBy(const std::vector<ItemSnapshot>& items,
                                        const std::string& set_name) {
    std::vector<std::string> names;
    for (const auto& item : items) {
        if (std::find(item.index_sets.begin(), item.index_sets.end(), set_name) !=
            item.index_sets.end()) {
            names.push_back(item.name);
        }
    }
    return names;
}

// ============================================================================
// Reads
// ============================================================================

bool MatchesFilters(const std::vector<std::string>& index_names,
                    const ItemRow& row,
                    const Filters& filters) {
    for (size_t i = 0; i < index_names.size() && i < row.key.size(); ++i) {
        auto it = filters.find(index_names[i]);
        if (it == filters.end()) {
            continue;
        }
        const auto& allowed = it->second;
        bool found = std::any_of(allowed.begin(), allowed.end(),
                                 [&](const Label& label) { return label.str() == row.key[i]; });
        if (!found) {
            return false;
        }
    }
    return true;
}

ItemData BuildItemData(const ItemSnapshot& item, const Filters& filters) {
    std::vector<std::string> names = EffectiveIndexNames(item);
    size_t dimension = item.Dimension();

    ItemShape shape = ItemShape::INDEX_SET;
    switch (item.kind) {
        case ItemType::SET:
            shape = item.IsIndexSet() ? ItemShape::INDEX_SET : ItemShape::SET_TABLE;
            break;
        case ItemType::PAR:
            shape = dimension == 0 ? ItemShape::SCALAR_PAR : ItemShape::PAR_TABLE;
            break;
        case ItemType::VAR:
        case ItemType::EQU:
            shape = dimension == 0 ? ItemShape::SCALAR_SOLUTION : ItemShape::SOLUTION_TABLE;
            break;
        case ItemType::TS:
            throw ValidationError("Time series are not items");
    }

    ItemData data(item.kind, shape, names);
    for (const auto& row : item.rows) {
        if (MatchesFilters(names, row, filters)) {
            data.mutable_rows().push_back(row);
        }
    }
    return data;
}

// ============================================================================
// Writes
// ============================================================================

void ValidateElements(const ItemSnapshot& item,
                      const std::vector<Element>& elements,
                      const ItemLookup& find,
                      const UnitCheck& unit_exists) {
    if (kSolutionItems.Contains(item.kind)) {
        throw ValidationError("'" + item.name + "' is a " + ToString(item.kind) +
                              "; variables and equations are written only by a solver");
    }

    KeyChecker checker(item, find);
    for (const auto& element : elements) {
        checker.Check(element.key);

        if (item.kind == ItemType::SET) {
            if (element.value || element.unit) {
                throw ValidationError("Elements of set '" + item.name +
                                      "' take no value or unit");
            }
            continue;
        }

        if (!element.value) {
            throw ValidationError("Missing value for key " +
                                  DescribeKey(element.key.value_or(Key())) +
                                  " of parameter '" + item.name + "'");
        }
        if (!element.unit) {
            throw ValidationError("Missing unit for key " +
                                  DescribeKey(element.key.value_or(Key())) +
                                  " of parameter '" + item.name + "'");
        }
        if (!unit_exists(*element.unit)) {
            throw NotFoundError("Unit '" + *element.unit + "' does not exist");
        }
    }
}

void MergeElements(ItemSnapshot& item, const std::vector<Element>& elements) {
    std::map<Key, size_t> positions;
    for (size_t i = 0; i < item.rows.size(); ++i) {
        positions.emplace(item.rows[i].key, i);
    }

    for (const auto& element : elements) {
        Key key = element.key.value_or(Key());
        auto it = positions.find(key);
        ItemRow* row = nullptr;
        if (it == positions.end()) {
            item.rows.emplace_back();
            row = &item.rows.back();
            row->key = key;
            positions.emplace(key, item.rows.size() - 1);
        } else {
            row = &item.rows[it->second];
        }

        if (element.value) row->value = *element.value;
        if (element.unit) row->unit = *element.unit;
        if (element.comment) row->comment = *element.comment;
    }
}

void ValidateSolution(const ItemSnapshot& item,
                      const std::vector<SolutionElement>& elements,
                      const ItemLookup& find) {
    if (!kSolutionItems.Contains(item.kind)) {
        throw ValidationError("'" + item.name + "' is a " + ToString(item.kind) +
                              ", not a variable or equation");
    }
    KeyChecker checker(item, find);
    for (const auto& element : elements) {
        checker.Check(element.key);
    }
}

void MergeSolution(ItemSnapshot& item, const std::vector<SolutionElement>& elements) {
    std::map<Key, size_t> positions;
    for (size_t i = 0; i < item.rows.size(); ++i) {
        positions.emplace(item.rows[i].key, i);
    }

    for (const auto& element : elements) {
        Key key = element.key.value_or(Key());
        auto it = positions.find(key);
        if (it == positions.end()) {
            ItemRow row;
            row.key = key;
            row.level = element.level;
            row.marginal = element.marginal;
            item.rows.push_back(std::move(row));
            positions.emplace(key, item.rows.size() - 1);
        } else {
            item.rows[it->second].level = element.level;
            item.rows[it->second].marginal = element.marginal;
        }
    }
}

std::set<std::string> RemoveElements(ItemSnapshot& item, const std::vector<Key>& keys) {
    std::set<Key> doomed(keys.begin(), keys.end());
    std::set<std::string> removed_labels;

    auto end = std::remove_if(item.rows.begin(), item.rows.end(), [&](const ItemRow& row) {
        if (doomed.count(row.key) == 0) {
            return false;
        }
        if (item.IsIndexSet() && !row.key.empty()) {
            removed_labels.insert(row.key.front());
        }
        return true;
    });
    item.rows.erase(end, item.rows.end());

    return removed_labels;
}

size_t RemoveDependentRows(ItemSnapshot& dependent,
                           const std::string& set_name,
                           const std::set<std::string>& labels) {
    std::vector<size_t> positions;
    for (size_t i = 0; i < dependent.index_sets.size(); ++i) {
        if (dependent.index_sets[i] == set_name) {
            positions.push_back(i);
        }
    }
    if (positions.empty() || labels.empty()) {
        return 0;
    }

    size_t before = dependent.rows.size();
    auto end = std::remove_if(dependent.rows.begin(), dependent.rows.end(),
                              [&](const ItemRow& row) {
                                  for (size_t pos : positions) {
                                      if (pos < row.key.size() && labels.count(row.key[pos]) > 0) {
                                          return true;
                                      }
                                  }
                                  return false;
                              });
    dependent.rows.erase(end, dependent.rows.end());
    return before - dependent.rows.size();
}

// ============================================================================
// Time series
// ============================================================================

std::vector<TimeseriesRecord> FilterTimeseries(const std::vector<TimeseriesRecord>& rows,
                                               const std::vector<std::string>& regions,
                                               const std::vector<std::string>& variables,
                                               const std::vector<std::string>& units,
                                               const std::vector<int>& years) {
    auto allowed = [](const auto& list, const auto& value) {
        return list.empty() || std::find(list.begin(), list.end(), value) != list.end();
    };

    std::vector<TimeseriesRecord> result;
    for (const auto& row : rows) {
        if (allowed(regions, row.region) && allowed(variables, row.variable) &&
            allowed(units, row.unit) && allowed(years, row.year)) {
            result.push_back(row);
        }
    }
    return result;
}

void SortTimeseries(std::vector<TimeseriesRecord>& rows) {
    std::sort(rows.begin(), rows.end(), [](const TimeseriesRecord& a, const TimeseriesRecord& b) {
        return std::tie(a.region, a.variable, a.unit, a.subannual, a.year) <
               std::tie(b.region, b.variable, b.unit, b.subannual, b.year);
    });
}

void SortGeodata(std::vector<GeodataRecord>& rows) {
    std::sort(rows.begin(), rows.end(), [](const GeodataRecord& a, const GeodataRecord& b) {
        return std::tie(a.region, a.variable, a.subannual, a.year) <
               std::tie(b.region, b.variable, b.subannual, b.year);
    });
}

// ============================================================================
// Meta
// ============================================================================

std::string MetaScope::Describe() const {
    return "model " + OptionalText(model) + ", scenario " + OptionalText(scenario) +
           ", version " + (version ? std::to_string(*version) : std::string("null"));
}

MetaScope MakeMetaScope(const std::optional<std::string>& model,
                        const std::optional<std::string>& scenario,
                        const std::optional<int>& version) {
    MetaScope scope{model, scenario, version};
    bool valid = (model || scenario) && (!version || (model && scenario));
    if (!valid) {
        throw ValidationError("Invalid arguments for meta (" + scope.Describe() +
                              "); valid targets are (model), (scenario), "
                              "(model, scenario) and (model, scenario, version)");
    }
    return scope;
}

bool ScopesOverlap(const MetaScope& a, const MetaScope& b) {
    if (a.model && b.model && *a.model != *b.model) return false;
    if (a.scenario && b.scenario && *a.scenario != *b.scenario) return false;
    if (a.version && b.version && *a.version != *b.version) return false;
    return true;
}

std::vector<MetaScope> MetaLookupScopes(const MetaScope& scope, bool strict) {
    if (strict || !scope.model || !scope.scenario) {
        return {scope};
    }

    std::vector<MetaScope> scopes;
    scopes.push_back(MetaScope{scope.model, std::nullopt, std::nullopt});
    scopes.push_back(MetaScope{std::nullopt, scope.scenario, std::nullopt});
    scopes.push_back(MetaScope{scope.model, scope.scenario, std::nullopt});
    if (scope.version) {
        scopes.push_back(scope);
    }
    return scopes;
}

void CheckMetaConflicts(const std::vector<MetaEntry>& existing,
                        const MetaScope& scope,
                        const std::vector<std::string>& keys) {
    std::set<std::string> wanted(keys.begin(), keys.end());
    for (const auto& entry : existing) {
        if (wanted.count(entry.key) == 0 || entry.scope == scope) {
            continue;
        }
        if (ScopesOverlap(entry.scope, scope)) {
            throw ValidationError("The meta category " + entry.key +
                                  " is already used at another level: " +
                                  entry.scope.Describe());
        }
    }
}

MetaMap CollectMeta(const std::vector<MetaEntry>& entries, const MetaScope& scope, bool strict) {
    MetaMap result;
    for (const auto& lookup : MetaLookupScopes(scope, strict)) {
        for (const auto& entry : entries) {
            if (entry.scope == lookup) {
                result[entry.key] = entry.value;
            }
        }
    }
    return result;
}

} // namespace modelstore
