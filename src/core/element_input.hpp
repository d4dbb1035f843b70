// File: src/core/element_input.hpp
#pragma once

#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace modelstore {

/// Row-oriented table of labels used as bulk element input
///
/// Columns are named; index columns are matched to an item's index names,
/// and the optional columns "value", "unit" and "comment" carry the
/// element payload.
class DataTable {
public:
    explicit DataTable(std::vector<std::string> columns);

    /// Build a table from parallel columns
    /// @throws ValidationError if the columns differ in length
    static DataTable FromColumns(const std::map<std::string, std::vector<Label>>& columns);

    /// Append a row
    /// @throws ValidationError if the row width differs from the column count
    void AddRow(const std::vector<Label>& row);

    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<std::vector<std::string>>& rows() const { return rows_; }

    bool HasColumn(const std::string& name) const;

    /// @throws ValidationError if the column does not exist
    size_t ColumnIndex(const std::string& name) const;

    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

private:
    std::vector<std::string> columns_;
    std::vector<std::vector<std::string>> rows_;
};

/// Value argument: none, one value for every key, or one value per key
using ValueArg = std::variant<std::monostate, double, std::vector<double>>;

/// Unit or comment argument: none, one for every key, or one per key
using TextArg = std::variant<std::monostate, std::string, std::vector<std::string>>;

/// Converts the accepted bulk-input shapes into canonical Elements
///
/// All checks that do not need stored data happen here, before any backend
/// call: key widths, the flat-list ambiguity rule and the pairing of keys
/// with values, units and comments. Only a single value (not a list of one)
/// is broadcast over several keys; lists must pair one-to-one with the keys.
class ElementParser {
public:
    /// @param kind SET or PAR
    /// @param index_names Dimension names of the item; for a plain index set
    ///        this is the set's own name, for a scalar parameter it is empty
    ElementParser(ItemType kind, std::vector<std::string> index_names);

    size_t dimension() const { return index_names_.size(); }

    /// A single bare key; valid for one-dimensional items only
    std::vector<Key> ParseKeys(const Label& key) const;

    /// A flat list of labels
    ///
    /// For a one-dimensional item every label is a key. For N > 1 dimensions
    /// a flat list of exactly N labels is one N-tuple key; any other length
    /// is an error.
    std::vector<Key> ParseKeys(const std::vector<Label>& labels) const;

    /// A list of keys, each with one label per dimension
    std::vector<Key> ParseKeys(const std::vector<std::vector<Label>>& keys) const;

    /// Elements of a set
    std::vector<Element> SetElements(const std::vector<Key>& keys,
                                     const TextArg& comment = {}) const;

    /// Elements of an indexed parameter
    /// @param unit Defaults to "???" when not given
    /// @throws ValidationError if no value is given or lengths do not match
    std::vector<Element> ParElements(const std::vector<Key>& keys,
                                     const ValueArg& value,
                                     const TextArg& unit = {},
                                     const TextArg& comment = {}) const;

    /// Element of a zero-dimensional parameter
    std::vector<Element> ScalarElements(double value,
                                        const std::string& unit,
                                        const std::optional<std::string>& comment) const;

    /// Elements from a table with one column per index name
    ///
    /// Arguments that are given take precedence over the "value", "unit" and
    /// "comment" columns.
    std::vector<Element> FromTable(const DataTable& table,
                                   const ValueArg& value = {},
                                   const TextArg& unit = {},
                                   const TextArg& comment = {}) const;

private:
    ItemType kind_;
    std::vector<std::string> index_names_;

    /// One optional value per key; nullopt entries when arg is empty
    std::vector<std::optional<double>> ExpandValues(const ValueArg& value, size_t count) const;
    std::vector<std::optional<std::string>> ExpandText(const TextArg& text, size_t count,
                                                       const char* what) const;
};

} // namespace modelstore
