// File: src/core/types.cpp
#include "core/types.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace modelstore {

namespace {

// High 32 bits: random per process; low 32 bits: counter
SessionID::ValueType MakeSessionPrefix() {
    std::random_device device;
    std::mt19937_64 gen(device() ^
        static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));
    SessionID::ValueType prefix = gen() & 0x7fffffff00000000ULL;
    if (prefix == 0) {
        prefix = 0x0000000100000000ULL;
    }
    return prefix;
}

std::string OptionalField(const std::optional<std::string>& value) {
    return value ? *value : std::string();
}

} // namespace

// Static member initialization
std::atomic<SessionID::ValueType> SessionID::next_id_{1};

SessionID SessionID::Generate() {
    static const ValueType prefix = MakeSessionPrefix();
    ValueType counter = next_id_.fetch_add(1, std::memory_order_relaxed);
    return SessionID(prefix | (counter & 0xffffffffULL));
}

std::string SessionID::ToString() const {
    if (!IsValid()) {
        return "SessionID(INVALID)";
    }
    std::ostringstream oss;
    oss << "SessionID(" << std::hex << std::setw(16) << std::setfill('0') << value_ << ")";
    return oss.str();
}

// Enum implementations

const char* ToString(ItemType type) {
    switch (type) {
        case ItemType::TS: return "ts";
        case ItemType::SET: return "set";
        case ItemType::PAR: return "par";
        case ItemType::VAR: return "var";
        case ItemType::EQU: return "equ";
    }
    throw std::invalid_argument("Unknown ItemType value");
}

ItemType ParseItemType(const std::string& str) {
    for (ItemType type : kItemTypes) {
        if (str == ToString(type)) {
            return type;
        }
    }
    throw ValidationError("Unknown item type: " + str);
}

std::vector<ItemType> ItemTypeSet::Members() const {
    std::vector<ItemType> members;
    for (ItemType type : kItemTypes) {
        if (Contains(type)) {
            members.push_back(type);
        }
    }
    return members;
}

std::string ItemTypeSet::ToString() const {
    std::string result;
    for (ItemType type : Members()) {
        if (!result.empty()) {
            result += "|";
        }
        result += modelstore::ToString(type);
    }
    return result;
}

const char* ToString(ItemShape shape) {
    switch (shape) {
        case ItemShape::INDEX_SET: return "INDEX_SET";
        case ItemShape::SET_TABLE: return "SET_TABLE";
        case ItemShape::SCALAR_PAR: return "SCALAR_PAR";
        case ItemShape::SCALAR_SOLUTION: return "SCALAR_SOLUTION";
        case ItemShape::PAR_TABLE: return "PAR_TABLE";
        case ItemShape::SOLUTION_TABLE: return "SOLUTION_TABLE";
    }
    throw std::invalid_argument("Unknown ItemShape value");
}

// Label implementations

std::string FormatNumber(double value) {
    char buffer[32];
    // Shortest of 15 or 17 significant digits that reproduces the value
    std::snprintf(buffer, sizeof(buffer), "%.15g", value);
    if (std::strtod(buffer, nullptr) != value) {
        std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    }
    return buffer;
}

Label::Label(double value) : value_(FormatNumber(value)) {}

std::ostream& operator<<(std::ostream& out, const Label& label) {
    return out << label.str();
}

Key MakeKey(const std::vector<Label>& labels) {
    Key key;
    key.reserve(labels.size());
    for (const auto& label : labels) {
        key.push_back(label.str());
    }
    return key;
}

// ItemRow / ItemData implementations

bool ItemRow::operator==(const ItemRow& other) const {
    return key == other.key && value == other.value && unit == other.unit &&
           level == other.level && marginal == other.marginal &&
           comment == other.comment;
}

ItemData::ItemData(ItemType kind, ItemShape shape, std::vector<std::string> index_names)
    : kind_(kind), shape_(shape), index_names_(std::move(index_names)) {}

std::vector<std::string> ItemData::ColumnNames() const {
    std::vector<std::string> columns;
    switch (shape_) {
        case ItemShape::INDEX_SET:
        case ItemShape::SET_TABLE:
            columns = index_names_;
            break;
        case ItemShape::SCALAR_PAR:
            columns = {"value", "unit"};
            break;
        case ItemShape::SCALAR_SOLUTION:
            columns = {"lvl", "mrg"};
            break;
        case ItemShape::PAR_TABLE:
            columns = index_names_;
            columns.push_back("value");
            columns.push_back("unit");
            break;
        case ItemShape::SOLUTION_TABLE:
            columns = index_names_;
            columns.push_back("lvl");
            columns.push_back("mrg");
            break;
    }
    return columns;
}

std::vector<std::string> ItemData::Keys() const {
    if (shape_ != ItemShape::INDEX_SET) {
        throw ValidationError(std::string("Keys() requires an index set, not ") +
                              ToString(shape_));
    }
    std::vector<std::string> keys;
    keys.reserve(rows_.size());
    for (const auto& row : rows_) {
        keys.push_back(row.key.empty() ? std::string() : row.key.front());
    }
    return keys;
}

std::vector<std::string> ItemData::Column(const std::string& index_name) const {
    auto it = std::find(index_names_.begin(), index_names_.end(), index_name);
    if (it == index_names_.end()) {
        throw ValidationError("'" + index_name + "' is not a dimension of this item");
    }
    size_t pos = static_cast<size_t>(it - index_names_.begin());

    std::vector<std::string> column;
    column.reserve(rows_.size());
    for (const auto& row : rows_) {
        column.push_back(row.key.at(pos));
    }
    return column;
}

const ItemRow& ItemData::ScalarRow(bool solution) const {
    ItemShape expected = solution ? ItemShape::SCALAR_SOLUTION : ItemShape::SCALAR_PAR;
    if (shape_ != expected) {
        throw ValidationError(std::string("item data has shape ") + ToString(shape_) +
                              ", expected " + ToString(expected));
    }
    if (rows_.empty()) {
        throw ValidationError("scalar has no value");
    }
    return rows_.front();
}

double ItemData::ScalarValue() const { return ScalarRow(false).value; }
const std::string& ItemData::ScalarUnit() const { return ScalarRow(false).unit; }
double ItemData::Level() const { return ScalarRow(true).level; }
double ItemData::Marginal() const { return ScalarRow(true).marginal; }

bool ItemData::operator==(const ItemData& other) const {
    return kind_ == other.kind_ && shape_ == other.shape_ &&
           index_names_ == other.index_names_ && rows_ == other.rows_;
}

// MetaValue implementations

bool MetaValue::AsBool() const {
    if (type_ != Type::BOOL) {
        throw ValidationError("meta value is not a bool: " + ToString());
    }
    return int_ != 0;
}

int64_t MetaValue::AsInt() const {
    if (type_ != Type::INT) {
        throw ValidationError("meta value is not an integer: " + ToString());
    }
    return int_;
}

double MetaValue::AsDouble() const {
    if (type_ == Type::INT) {
        return static_cast<double>(int_);
    }
    if (type_ != Type::FLOAT) {
        throw ValidationError("meta value is not numeric: " + ToString());
    }
    return float_;
}

const std::string& MetaValue::AsString() const {
    if (type_ != Type::STRING) {
        throw ValidationError("meta value is not a string: " + ToString());
    }
    return string_;
}

std::string MetaValue::ToString() const {
    switch (type_) {
        case Type::BOOL: return int_ != 0 ? "true" : "false";
        case Type::INT: return std::to_string(int_);
        case Type::FLOAT: return FormatNumber(float_);
        case Type::STRING: return string_;
    }
    return string_;
}

MetaValue MetaValue::FromStored(Type type, const std::string& text) {
    try {
        switch (type) {
            case Type::BOOL: return MetaValue(text == "true");
            case Type::INT: return MetaValue(static_cast<long long>(std::stoll(text)));
            case Type::FLOAT: return MetaValue(std::stod(text));
            case Type::STRING: return MetaValue(text);
        }
    } catch (const std::logic_error&) {
        throw ValidationError("stored meta value is malformed: " + text);
    }
    return MetaValue(text);
}

bool MetaValue::operator==(const MetaValue& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case Type::BOOL:
        case Type::INT: return int_ == other.int_;
        case Type::FLOAT: return float_ == other.float_;
        case Type::STRING: return string_ == other.string_;
    }
    return false;
}

std::ostream& operator<<(std::ostream& out, const MetaValue& value) {
    return out << value.ToString();
}

// Version implementations

std::string Version::ToString() const {
    switch (kind_) {
        case Kind::DEFAULT: return "";
        case Kind::NEW: return "new";
        case Kind::NUMBER: return std::to_string(number_);
    }
    return "";
}

// Record implementations

std::vector<std::string> ScenarioInfo::ToStrings() const {
    return {model, scenario, scheme,
            is_default ? "true" : "false", is_locked ? "true" : "false",
            cre_user, cre_date,
            OptionalField(upd_user), OptionalField(upd_date),
            OptionalField(lock_user), OptionalField(lock_date),
            annotation, std::to_string(version)};
}

std::vector<std::string> RegionRecord::ToStrings() const {
    return {region, OptionalField(mapped_to), parent, hierarchy};
}

std::vector<std::string> TimesliceRecord::ToStrings() const {
    return {name, category, FormatNumber(duration)};
}

std::vector<std::string> TimeseriesRecord::ToStrings() const {
    return {region, variable, unit, subannual, std::to_string(year), FormatNumber(value)};
}

bool TimeseriesRecord::operator==(const TimeseriesRecord& other) const {
    return region == other.region && variable == other.variable &&
           unit == other.unit && subannual == other.subannual &&
           year == other.year && value == other.value && meta == other.meta;
}

std::vector<std::string> GeodataRecord::ToStrings() const {
    return {region, variable, subannual, std::to_string(year), value, unit,
            meta ? "true" : "false"};
}

bool GeodataRecord::operator==(const GeodataRecord& other) const {
    return region == other.region && variable == other.variable &&
           subannual == other.subannual && year == other.year &&
           value == other.value && unit == other.unit && meta == other.meta;
}

} // namespace modelstore
