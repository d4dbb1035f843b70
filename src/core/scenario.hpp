// File: src/core/scenario.hpp
#pragma once

#include "core/element_input.hpp"
#include "core/timeseries.hpp"
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace modelstore {

class Scenario;

/// Options of Scenario::Clone
struct CloneOptions {
    /// Destination; the source Platform when null
    std::shared_ptr<Platform> platform;

    /// Defaults to the source model and scenario names
    std::optional<std::string> model;
    std::optional<std::string> scenario;

    std::string annotation;

    /// Copy variables, equations and every time series; otherwise only
    /// time series flagged as metadata are copied
    bool keep_solution{true};

    /// Drop the solution and non-metadata time series from this year on;
    /// implies keep_solution = false
    std::optional<int> shift_first_model_year;
};

/// Lazy, restartable sequence of item names
///
/// Names are listed when iteration begins; each item's index is read only
/// as the iterator reaches it.
class ItemNameRange {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::string*;
        using reference = const std::string&;

        Iterator() = default;

        reference operator*() const { return (*names_)[pos_]; }
        pointer operator->() const { return &(*names_)[pos_]; }

        Iterator& operator++();
        Iterator operator++(int) {
            Iterator previous = *this;
            ++*this;
            return previous;
        }

        bool operator==(const Iterator& other) const {
            return AtEnd() == other.AtEnd() && (AtEnd() || pos_ == other.pos_);
        }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        friend class ItemNameRange;

        Iterator(const ItemNameRange* range, std::shared_ptr<const std::vector<std::string>> names);

        bool AtEnd() const { return !names_ || pos_ >= names_->size(); }

        /// Move forward to the first accepted name at or after pos_
        void Settle();

        const ItemNameRange* range_{nullptr};
        std::shared_ptr<const std::vector<std::string>> names_;
        size_t pos_{0};
    };

    ItemNameRange(Scenario& scenario,
                  ItemType kind,
                  Filters filters,
                  std::optional<std::string> indexed_by)
        : scenario_(&scenario), kind_(kind), filters_(std::move(filters)),
          indexed_by_(std::move(indexed_by)) {}

    Iterator begin() const;
    Iterator end() const { return Iterator(); }

    /// Collect the whole sequence
    std::vector<std::string> ToVector() const;

private:
    bool Accepts(const std::string& name) const;

    Scenario* scenario_;
    ItemType kind_;
    Filters filters_;
    std::optional<std::string> indexed_by_;
};

/// Handle to one stored version holding sets, parameters, variables and
/// equations besides time series
///
/// Example:
///   Scenario scen(mp, "transport", "standard", Version::New(), "", "first run");
///   scen.InitSet("i");
///   scen.AddSet("i", {"seattle", "san-diego"});
///   scen.InitPar("a", {"i"});
///   scen.AddPar("a", {"seattle", "san-diego"}, std::vector<double>{350.0, 600.0}, "cases");
///   scen.Commit("initial data");
class Scenario : public TimeSeries {
public:
    /// @param scheme Label of the model scheme, stored with a new version
    Scenario(std::shared_ptr<Platform> platform,
             const std::string& model,
             const std::string& scenario,
             const Version& version = Version(),
             const std::string& scheme = "",
             const std::string& annotation = "");

    ~Scenario() override = default;

    /// Lock the version for editing
    /// @throws PreconditionError if the scenario has a solution and
    ///         timeseries_only is false
    void CheckOut(bool timeseries_only = false) override;

    // ========================================================================
    // Item definitions
    // ========================================================================

    /// Define an item
    ///
    /// Names are unique across sets, parameters, variables and equations.
    /// @param idx_sets Index sets, one per dimension
    /// @param idx_names Dimension names; default to idx_sets
    /// @throws ValidationError for a duplicate name, an unknown index set or
    ///         idx_names of a different length than idx_sets
    void InitItem(ItemType kind,
                  const std::string& name,
                  const std::vector<std::string>& idx_sets = {},
                  const std::vector<std::string>& idx_names = {});

    void InitSet(const std::string& name,
                 const std::vector<std::string>& idx_sets = {},
                 const std::vector<std::string>& idx_names = {});
    void InitPar(const std::string& name,
                 const std::vector<std::string>& idx_sets = {},
                 const std::vector<std::string>& idx_names = {});
    void InitVar(const std::string& name,
                 const std::vector<std::string>& idx_sets = {},
                 const std::vector<std::string>& idx_names = {});
    void InitEqu(const std::string& name,
                 const std::vector<std::string>& idx_sets = {},
                 const std::vector<std::string>& idx_names = {});

    /// Define a zero-dimensional parameter and set its value
    void InitScalar(const std::string& name,
                    double value,
                    const std::string& unit,
                    const std::optional<std::string>& comment = std::nullopt);

    // ========================================================================
    // Item queries
    // ========================================================================

    /// True if an item of one of kinds has this name
    bool HasItem(const std::string& name, ItemTypeSet kinds = kModelItems);

    bool HasSet(const std::string& name) { return HasItem(name, ItemType::SET); }
    bool HasPar(const std::string& name) { return HasItem(name, ItemType::PAR); }
    bool HasVar(const std::string& name) { return HasItem(name, ItemType::VAR); }
    bool HasEqu(const std::string& name) { return HasItem(name, ItemType::EQU); }

    /// Names of the items of one kind in definition order
    std::vector<std::string> ListItems(ItemType kind);

    std::vector<std::string> IdxSets(const std::string& name);
    std::vector<std::string> IdxNames(const std::string& name);

    /// Names of items of one kind, sorted
    ///
    /// With filters, only items with at least one dimension named in filters;
    /// with indexed_by, only items indexed directly by that set.
    ItemNameRange Items(ItemType kind = ItemType::PAR,
                        const Filters& filters = {},
                        const std::optional<std::string>& indexed_by = std::nullopt);

    /// (name, data) of each item Items(kind, filters) yields, each read with
    /// the filters on its own dimensions
    std::vector<std::pair<std::string, ItemData>> IterItemData(ItemType kind = ItemType::PAR,
                                                               const Filters& filters = {});

    // ========================================================================
    // Item reads
    // ========================================================================

    ItemData Set(const std::string& name, const Filters& filters = {});
    ItemData Par(const std::string& name, const Filters& filters = {});
    ItemData Var(const std::string& name, const Filters& filters = {});
    ItemData Equ(const std::string& name, const Filters& filters = {});

    /// Value and unit of a zero-dimensional parameter
    ItemData Scalar(const std::string& name);

    // ========================================================================
    // Item writes
    // ========================================================================
    // Arguments are normalized and validated in full before the backend is
    // called; a flat list of labels for an N-dimensional item (N > 1) is a
    // single key, and must then have exactly N labels.

    void AddSet(const std::string& name, const Label& key, const TextArg& comment = {});
    void AddSet(const std::string& name, std::initializer_list<Label> keys,
                const TextArg& comment = {});
    void AddSet(const std::string& name, const std::vector<Label>& keys,
                const TextArg& comment = {});
    void AddSet(const std::string& name, const std::vector<std::vector<Label>>& keys,
                const TextArg& comment = {});
    void AddSet(const std::string& name, const DataTable& table, const TextArg& comment = {});

    /// One element of a one-dimensional parameter
    void AddPar(const std::string& name,
                const Label& key,
                double value,
                const std::string& unit = "???",
                const std::optional<std::string>& comment = std::nullopt);
    void AddPar(const std::string& name, std::initializer_list<Label> keys,
                const ValueArg& value, const TextArg& unit = {}, const TextArg& comment = {});
    void AddPar(const std::string& name, const std::vector<Label>& keys,
                const ValueArg& value, const TextArg& unit = {}, const TextArg& comment = {});
    void AddPar(const std::string& name, const std::vector<std::vector<Label>>& keys,
                const ValueArg& value, const TextArg& unit = {}, const TextArg& comment = {});
    void AddPar(const std::string& name, const DataTable& table,
                const ValueArg& value = {}, const TextArg& unit = {},
                const TextArg& comment = {});

    /// Set the value of a zero-dimensional parameter
    void ChangeScalar(const std::string& name,
                      double value,
                      const std::string& unit,
                      const std::optional<std::string>& comment = std::nullopt);

    /// Delete the whole set
    /// @throws ValidationError if other items are indexed by it
    void RemoveSet(const std::string& name);

    /// Remove elements; removing labels of an index set also removes the
    /// rows of items indexed by it that use them
    void RemoveSet(const std::string& name, const Label& key);
    void RemoveSet(const std::string& name, std::initializer_list<Label> keys);
    void RemoveSet(const std::string& name, const std::vector<Label>& keys);
    void RemoveSet(const std::string& name, const std::vector<std::vector<Label>>& keys);

    /// Delete the whole parameter
    void RemovePar(const std::string& name);

    void RemovePar(const std::string& name, const Label& key);
    void RemovePar(const std::string& name, std::initializer_list<Label> keys);
    void RemovePar(const std::string& name, const std::vector<Label>& keys);
    void RemovePar(const std::string& name, const std::vector<std::vector<Label>>& keys);

    // ========================================================================
    // Solution
    // ========================================================================

    /// True if any variable or equation holds data
    bool HasSolution();

    /// Write solver output to a variable or equation
    void SetSolution(ItemType kind,
                     const std::string& name,
                     const std::vector<SolutionElement>& elements);

    /// Remove the solution
    ///
    /// Without first_model_year, variables and equations are emptied. With
    /// it, their rows and the non-metadata time series from that year on
    /// are removed.
    /// @throws PreconditionError if there is no solution
    void RemoveSolution(std::optional<int> first_model_year = std::nullopt);

    // ========================================================================
    // Scenario lifecycle
    // ========================================================================

    /// Copy this version into a new version of (model, scenario)
    ///
    /// The destination may be another Platform; both backends must share a
    /// clone format.
    /// @throws UnsupportedError if the backends cannot exchange data
    std::unique_ptr<Scenario> Clone(const CloneOptions& options = {});

    /// Read every item once to fill the cache
    /// @throws PreconditionError if the backend does not cache
    void LoadScenarioData();

    // ========================================================================
    // Identity
    // ========================================================================

    static std::unique_ptr<Scenario> FromUrl(const std::string& url,
                                             const std::shared_ptr<Platform>& platform);

    static UrlTarget<Scenario> FromUrl(const std::string& url,
                                       const PlatformConfig& config,
                                       bool raise_errors = false);

private:
    /// Parser for the elements of a set or parameter
    ElementParser ParserFor(ItemType kind, const std::string& name);

    void WriteElements(ItemType kind, const std::string& name,
                       const std::vector<Element>& elements);
    void DeleteElements(ItemType kind, const std::string& name, const std::vector<Key>& keys);
};

} // namespace modelstore
