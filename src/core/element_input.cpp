// File: src/core/element_input.cpp
#include "core/element_input.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <cstdlib>

namespace modelstore {

namespace {

double ParseValue(const std::string& text) {
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        throw ValidationError("Parameter value '" + text + "' is not a number");
    }
    return value;
}

std::string JoinLabels(const std::vector<Label>& labels) {
    std::string text = "(";
    for (size_t i = 0; i < labels.size(); ++i) {
        text += (i == 0 ? "" : ", ") + labels[i].str();
    }
    return text + ")";
}

} // namespace

// ============================================================================
// DataTable
// ============================================================================

DataTable::DataTable(std::vector<std::string> columns) : columns_(std::move(columns)) {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (std::find(columns_.begin() + static_cast<std::ptrdiff_t>(i) + 1, columns_.end(),
                      columns_[i]) != columns_.end()) {
            throw ValidationError("Duplicate column '" + columns_[i] + "'");
        }
    }
}

DataTable DataTable::FromColumns(const std::map<std::string, std::vector<Label>>& columns) {
    std::vector<std::string> names;
    size_t length = 0;
    for (const auto& [name, values] : columns) {
        if (!names.empty() && values.size() != length) {
            throw ValidationError("Column '" + name + "' has " + std::to_string(values.size()) +
                                  " values, expected " + std::to_string(length));
        }
        names.push_back(name);
        length = values.size();
    }

    DataTable table(names);
    for (size_t r = 0; r < length; ++r) {
        std::vector<Label> row;
        row.reserve(names.size());
        for (const auto& [name, values] : columns) {
            row.push_back(values[r]);
        }
        table.AddRow(row);
    }
    return table;
}

void DataTable::AddRow(const std::vector<Label>& row) {
    if (row.size() != columns_.size()) {
        throw ValidationError("Row has " + std::to_string(row.size()) + " fields, table has " +
                              std::to_string(columns_.size()) + " columns");
    }
    rows_.push_back(MakeKey(row));
}

bool DataTable::HasColumn(const std::string& name) const {
    return std::find(columns_.begin(), columns_.end(), name) != columns_.end();
}

size_t DataTable::ColumnIndex(const std::string& name) const {
    auto it = std::find(columns_.begin(), columns_.end(), name);
    if (it == columns_.end()) {
        throw ValidationError("Table has no column '" + name + "'");
    }
    return static_cast<size_t>(it - columns_.begin());
}

// ============================================================================
// ElementParser
// ============================================================================

ElementParser::ElementParser(ItemType kind, std::vector<std::string> index_names)
    : kind_(kind), index_names_(std::move(index_names)) {
    if (kind_ != ItemType::SET && kind_ != ItemType::PAR) {
        throw ValidationError(std::string("Elements can only be added to sets and parameters, not ") +
                              ToString(kind_));
    }
}

std::vector<Key> ElementParser::ParseKeys(const Label& key) const {
    if (dimension() != 1) {
        throw ValidationError("A single label is a key only for one-dimensional items; "
                              "this item has " + std::to_string(dimension()) + " dimensions");
    }
    return {Key{key.str()}};
}

std::vector<Key> ElementParser::ParseKeys(const std::vector<Label>& labels) const {
    size_t n = dimension();
    if (n == 0) {
        throw ValidationError("A zero-dimensional item takes no keys");
    }
    if (n == 1) {
        std::vector<Key> keys;
        keys.reserve(labels.size());
        for (const auto& label : labels) {
            keys.push_back(Key{label.str()});
        }
        return keys;
    }
    if (labels.size() == n) {
        return {MakeKey(labels)};
    }
    throw ValidationError("Flat key of length " + std::to_string(labels.size()) +
                          " does not match the " + std::to_string(n) +
                          " dimensions of the item; pass a list of keys");
}

std::vector<Key> ElementParser::ParseKeys(const std::vector<std::vector<Label>>& keys) const {
    size_t n = dimension();
    if (n == 0) {
        throw ValidationError("A zero-dimensional item takes no keys");
    }

    std::vector<Key> result;
    result.reserve(keys.size());
    for (const auto& labels : keys) {
        if (labels.size() != n) {
            throw ValidationError("Key " + JoinLabels(labels) + " has " +
                                  std::to_string(labels.size()) + " labels, expected " +
                                  std::to_string(n));
        }
        result.push_back(MakeKey(labels));
    }
    return result;
}

std::vector<std::optional<double>> ElementParser::ExpandValues(const ValueArg& value,
                                                               size_t count) const {
    if (std::holds_alternative<std::monostate>(value)) {
        return std::vector<std::optional<double>>(count);
    }
    if (const double* scalar = std::get_if<double>(&value)) {
        return std::vector<std::optional<double>>(count, *scalar);
    }

    const auto& values = std::get<std::vector<double>>(value);
    if (values.size() != count) {
        throw ValidationError("Length mismatch between keys and values: " +
                              std::to_string(count) + " keys, " +
                              std::to_string(values.size()) + " values");
    }
    return std::vector<std::optional<double>>(values.begin(), values.end());
}

std::vector<std::optional<std::string>> ElementParser::ExpandText(const TextArg& text,
                                                                  size_t count,
                                                                  const char* what) const {
    if (std::holds_alternative<std::monostate>(text)) {
        return std::vector<std::optional<std::string>>(count);
    }
    if (const std::string* scalar = std::get_if<std::string>(&text)) {
        return std::vector<std::optional<std::string>>(count, *scalar);
    }

    const auto& texts = std::get<std::vector<std::string>>(text);
    if (texts.size() != count) {
        throw ValidationError(std::string("Length mismatch between keys and ") + what + ": " +
                              std::to_string(count) + " keys, " +
                              std::to_string(texts.size()) + " " + what);
    }
    return std::vector<std::optional<std::string>>(texts.begin(), texts.end());
}

std::vector<Element> ElementParser::SetElements(const std::vector<Key>& keys,
                                                const TextArg& comment) const {
    if (kind_ != ItemType::SET) {
        throw ValidationError("Set elements given for a parameter");
    }

    auto comments = ExpandText(comment, keys.size(), "comments");
    std::vector<Element> elements;
    elements.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        Element element;
        element.key = keys[i];
        element.comment = comments[i];
        elements.push_back(std::move(element));
    }
    return elements;
}

std::vector<Element> ElementParser::ParElements(const std::vector<Key>& keys,
                                                const ValueArg& value,
                                                const TextArg& unit,
                                                const TextArg& comment) const {
    if (kind_ != ItemType::PAR) {
        throw ValidationError("Parameter elements given for a set");
    }
    if (std::holds_alternative<std::monostate>(value)) {
        throw ValidationError("no parameter values supplied");
    }

    auto values = ExpandValues(value, keys.size());
    auto units = ExpandText(unit, keys.size(), "units");
    auto comments = ExpandText(comment, keys.size(), "comments");

    std::vector<Element> elements;
    elements.reserve(keys.size());
    for (size_t i = 0; i < keys.size(); ++i) {
        Element element;
        element.key = keys[i];
        element.value = values[i];
        element.unit = units[i].value_or("???");
        element.comment = comments[i];
        elements.push_back(std::move(element));
    }
    return elements;
}

std::vector<Element> ElementParser::ScalarElements(double value,
                                                   const std::string& unit,
                                                   const std::optional<std::string>& comment) const {
    if (kind_ != ItemType::PAR || dimension() != 0) {
        throw ValidationError("A single value without a key is valid only for a scalar parameter");
    }
    Element element;
    element.value = value;
    element.unit = unit;
    element.comment = comment;
    return {element};
}

std::vector<Element> ElementParser::FromTable(const DataTable& table,
                                              const ValueArg& value,
                                              const TextArg& unit,
                                              const TextArg& comment) const {
    std::vector<size_t> key_columns;
    for (const auto& name : index_names_) {
        if (!table.HasColumn(name)) {
            throw ValidationError("Table is missing the index column '" + name + "'");
        }
        key_columns.push_back(table.ColumnIndex(name));
    }

    size_t count = table.size();
    if (dimension() == 0 && count != 1) {
        throw ValidationError("A scalar parameter takes exactly one row, got " +
                              std::to_string(count));
    }

    std::vector<std::optional<Key>> keys;
    keys.reserve(count);
    for (const auto& row : table.rows()) {
        if (dimension() == 0) {
            keys.emplace_back();
            continue;
        }
        Key key;
        for (size_t column : key_columns) {
            key.push_back(row[column]);
        }
        keys.emplace_back(std::move(key));
    }

    auto column = [&](const std::string& name) {
        std::vector<std::string> values;
        size_t index = table.ColumnIndex(name);
        for (const auto& row : table.rows()) {
            values.push_back(row[index]);
        }
        return values;
    };

    TextArg comments = comment;
    if (std::holds_alternative<std::monostate>(comments) && table.HasColumn("comment")) {
        comments = column("comment");
    }
    auto comment_values = ExpandText(comments, count, "comments");

    std::vector<Element> elements;
    elements.reserve(count);

    if (kind_ == ItemType::SET) {
        if (!std::holds_alternative<std::monostate>(value) ||
            !std::holds_alternative<std::monostate>(unit)) {
            throw ValidationError("Elements of a set take no value or unit");
        }
        for (size_t i = 0; i < count; ++i) {
            Element element;
            element.key = keys[i];
            element.comment = comment_values[i];
            elements.push_back(std::move(element));
        }
        return elements;
    }

    ValueArg values = value;
    if (std::holds_alternative<std::monostate>(values) && table.HasColumn("value")) {
        std::vector<double> parsed;
        for (const auto& text : column("value")) {
            parsed.push_back(ParseValue(text));
        }
        values = parsed;
    }
    if (std::holds_alternative<std::monostate>(values)) {
        throw ValidationError("no parameter values supplied");
    }

    TextArg units = unit;
    if (std::holds_alternative<std::monostate>(units) && table.HasColumn("unit")) {
        units = column("unit");
    }

    auto value_list = ExpandValues(values, count);
    auto unit_list = ExpandText(units, count, "units");
    for (size_t i = 0; i < count; ++i) {
        Element element;
        element.key = keys[i];
        element.value = value_list[i];
        element.unit = unit_list[i].value_or("???");
        element.comment = comment_values[i];
        elements.push_back(std::move(element));
    }
    return elements;
}

} // namespace modelstore
