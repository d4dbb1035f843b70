// File: src/storage/snapshot.hpp
#pragma once

#include "core/types.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace modelstore {

/// Definition and elements of one item
struct ItemSnapshot {
    ItemType kind{ItemType::SET};
    std::string name;
    std::vector<std::string> index_sets;
    std::vector<std::string> index_names;
    std::vector<ItemRow> rows;

    /// Number of key components: 1 for a plain index set, else index_sets.size()
    size_t Dimension() const;

    /// True for a set with no index sets of its own
    bool IsIndexSet() const;
};

/// Complete content of one stored run
///
/// Used as the intermediate representation for clone (between engines that
/// share its format tag), as the checkout backup restored by discard, and as
/// the in-memory engine's storage.
struct ScenarioSnapshot {
    std::string scheme;
    bool is_scenario{false};
    std::vector<ItemSnapshot> items;
    std::vector<TimeseriesRecord> timeseries;
    std::vector<GeodataRecord> geodata;

    ItemSnapshot* FindItem(const std::string& name);
    const ItemSnapshot* FindItem(const std::string& name) const;

    /// True if any variable or equation has at least one element
    bool HasSolution() const;

    /// Binary serialization
    void Serialize(std::ostream& out) const;
    static ScenarioSnapshot Deserialize(std::istream& in);
};

/// Format tag shared by engines that produce and consume ScenarioSnapshot
inline constexpr const char* kSnapshotFormat = "snapshot-v1";

/// Remove solution data in place
///
/// Clears the elements of every variable and equation (definitions stay) and
/// removes non-meta time series and geodata rows: all of them, or only those
/// for years at or after from_year when given.
void ClearSolutionData(ScenarioSnapshot& snapshot, std::optional<int> from_year);

/// Reduce a snapshot to what a clone copies
///
/// keep_solution keeps everything; otherwise the solution is dropped and only
/// meta time series rows are kept, plus non-meta rows before
/// first_model_year when it is given.
void ApplyCloneFilter(ScenarioSnapshot& snapshot,
                      bool keep_solution,
                      std::optional<int> first_model_year);

} // namespace modelstore
