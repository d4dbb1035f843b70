// File: src/core/types.hpp
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace modelstore {

// SessionID: identity of one in-memory handle bound to a stored run
// Random per-process prefix in the high bits, counter in the low bits, so
// handles opened by different processes against one database never collide.
class SessionID {
public:
    using ValueType = uint64_t;

    // Default constructor creates invalid ID
    SessionID() : value_(kInvalidID) {}

    explicit SessionID(ValueType value) : value_(value) {}

    // Generate new unique ID (thread-safe)
    static SessionID Generate();

    bool IsValid() const { return value_ != kInvalidID; }

    ValueType value() const { return value_; }

    bool operator==(const SessionID& other) const { return value_ == other.value_; }
    bool operator!=(const SessionID& other) const { return value_ != other.value_; }
    bool operator<(const SessionID& other) const { return value_ < other.value_; }

    std::string ToString() const;

    struct Hash {
        size_t operator()(const SessionID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kInvalidID = 0;
    static std::atomic<ValueType> next_id_;

    ValueType value_;
};

// ItemType: kind of a stored item
enum class ItemType : uint8_t {
    TS = 1,    // time series
    SET = 2,   // labeled set
    PAR = 4,   // parameter
    VAR = 8,   // variable (solution)
    EQU = 16,  // equation (solution)
};

// Every ItemType, in declaration order
inline constexpr std::array<ItemType, 5> kItemTypes = {
    ItemType::TS, ItemType::SET, ItemType::PAR, ItemType::VAR, ItemType::EQU};

// Convert ItemType to its short name: ts, set, par, var, equ
const char* ToString(ItemType type);

// Parse ItemType from its short name
ItemType ParseItemType(const std::string& str);

/// Flag set over ItemType
///
/// Used to express derived unions such as "model data" (set, par, var, equ)
/// and "solution" (var, equ) and to test item kinds against them.
class ItemTypeSet {
public:
    constexpr ItemTypeSet() : bits_(0) {}
    constexpr ItemTypeSet(ItemType type) : bits_(static_cast<uint8_t>(type)) {}

    constexpr bool Contains(ItemType type) const {
        return (bits_ & static_cast<uint8_t>(type)) != 0;
    }

    constexpr bool Empty() const { return bits_ == 0; }

    constexpr uint8_t bits() const { return bits_; }

    constexpr ItemTypeSet operator|(ItemTypeSet other) const {
        return FromBits(static_cast<uint8_t>(bits_ | other.bits_));
    }

    constexpr ItemTypeSet operator&(ItemTypeSet other) const {
        return FromBits(static_cast<uint8_t>(bits_ & other.bits_));
    }

    constexpr bool operator==(ItemTypeSet other) const { return bits_ == other.bits_; }
    constexpr bool operator!=(ItemTypeSet other) const { return bits_ != other.bits_; }

    /// Members of the set in declaration order
    std::vector<ItemType> Members() const;

    /// Names of the members joined by "|", e.g. "set|par"
    std::string ToString() const;

private:
    static constexpr ItemTypeSet FromBits(uint8_t bits) {
        ItemTypeSet set;
        set.bits_ = bits;
        return set;
    }

    uint8_t bits_;
};

constexpr ItemTypeSet operator|(ItemType a, ItemType b) {
    return ItemTypeSet(a) | ItemTypeSet(b);
}

// Derived unions
inline constexpr ItemTypeSet kModelItems =
    ItemType::SET | ItemType::PAR | ItemType::VAR | ItemType::EQU;
inline constexpr ItemTypeSet kSolutionItems = ItemType::VAR | ItemType::EQU;
inline constexpr ItemTypeSet kAllItems = ItemTypeSet(ItemType::TS) | kModelItems;

// Label: one component of an element key
// Numbers are stored in their string form so that 42 and "42" compare equal.
class Label {
public:
    Label() = default;
    Label(const std::string& value) : value_(value) {}
    Label(std::string&& value) : value_(std::move(value)) {}
    Label(const char* value) : value_(value) {}
    Label(int value) : value_(std::to_string(value)) {}
    Label(long value) : value_(std::to_string(value)) {}
    Label(long long value) : value_(std::to_string(value)) {}
    Label(double value);

    const std::string& str() const { return value_; }

    bool operator==(const Label& other) const { return value_ == other.value_; }
    bool operator!=(const Label& other) const { return value_ != other.value_; }
    bool operator<(const Label& other) const { return value_ < other.value_; }

private:
    std::string value_;
};

std::ostream& operator<<(std::ostream& out, const Label& label);

// Format a number the way it is stored as a label (shortest round-trip form)
std::string FormatNumber(double value);

// Key: one label per dimension of an item
using Key = std::vector<std::string>;

// Key from labels
Key MakeKey(const std::vector<Label>& labels);

// Filters: dimension (index name) -> allowed labels
using Filters = std::map<std::string, std::vector<Label>>;

// Element: canonical form of one element to write
// key is absent for 0-dimensional parameters; value and unit are absent for sets.
struct Element {
    std::optional<Key> key;
    std::optional<double> value;
    std::optional<std::string> unit;
    std::optional<std::string> comment;
};

// SolutionElement: one (level, marginal) row written by a solver
struct SolutionElement {
    std::optional<Key> key;
    double level{0.0};
    double marginal{0.0};
};

// ItemRow: one stored element of any item kind
struct ItemRow {
    Key key;
    double value{0.0};
    std::string unit;
    double level{0.0};
    double marginal{0.0};
    std::string comment;

    bool operator==(const ItemRow& other) const;
    bool operator!=(const ItemRow& other) const { return !(*this == other); }
};

// ItemShape: shape of the data returned for an item
enum class ItemShape : uint8_t {
    INDEX_SET = 0,        // flat ordered collection of keys
    SET_TABLE = 1,        // one column per index name
    SCALAR_PAR = 2,       // single (value, unit) record
    SCALAR_SOLUTION = 3,  // single (level, marginal) record
    PAR_TABLE = 4,        // index columns + value, unit
    SOLUTION_TABLE = 5,   // index columns + level, marginal
};

const char* ToString(ItemShape shape);

/// Elements of one item as returned by a read
class ItemData {
public:
    ItemData() = default;
    ItemData(ItemType kind, ItemShape shape, std::vector<std::string> index_names);

    ItemType kind() const { return kind_; }
    ItemShape shape() const { return shape_; }
    const std::vector<std::string>& index_names() const { return index_names_; }

    const std::vector<ItemRow>& rows() const { return rows_; }
    std::vector<ItemRow>& mutable_rows() { return rows_; }

    size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    /// Column names in output order: index names followed by value/unit or
    /// level/marginal where the shape has them
    std::vector<std::string> ColumnNames() const;

    /// Labels of a plain index set in insertion order
    /// @throws ValidationError if the shape is not INDEX_SET
    std::vector<std::string> Keys() const;

    /// Labels along one index dimension, one per row
    /// @throws ValidationError if name is not an index name of this item
    std::vector<std::string> Column(const std::string& index_name) const;

    /// Value and unit of a 0-dimensional parameter
    /// @throws ValidationError for other shapes or when the scalar is unset
    double ScalarValue() const;
    const std::string& ScalarUnit() const;

    /// Level and marginal of a 0-dimensional variable or equation
    double Level() const;
    double Marginal() const;

    bool operator==(const ItemData& other) const;
    bool operator!=(const ItemData& other) const { return !(*this == other); }

private:
    const ItemRow& ScalarRow(bool solution) const;

    ItemType kind_{ItemType::SET};
    ItemShape shape_{ItemShape::INDEX_SET};
    std::vector<std::string> index_names_;
    std::vector<ItemRow> rows_;
};

// MetaValue: scalar annotation value (bool, integer, float or string)
class MetaValue {
public:
    enum class Type : uint8_t { BOOL = 0, INT = 1, FLOAT = 2, STRING = 3 };

    MetaValue() : type_(Type::STRING) {}
    MetaValue(bool value) : type_(Type::BOOL), int_(value ? 1 : 0) {}
    MetaValue(int value) : type_(Type::INT), int_(value) {}
    MetaValue(long value) : type_(Type::INT), int_(value) {}
    MetaValue(long long value) : type_(Type::INT), int_(value) {}
    MetaValue(double value) : type_(Type::FLOAT), float_(value) {}
    MetaValue(const char* value) : type_(Type::STRING), string_(value) {}
    MetaValue(const std::string& value) : type_(Type::STRING), string_(value) {}

    Type type() const { return type_; }

    bool AsBool() const;
    int64_t AsInt() const;
    double AsDouble() const;
    const std::string& AsString() const;

    // String form used for storage and display
    std::string ToString() const;

    // Rebuild from a stored (type, string form) pair
    static MetaValue FromStored(Type type, const std::string& text);

    bool operator==(const MetaValue& other) const;
    bool operator!=(const MetaValue& other) const { return !(*this == other); }

private:
    Type type_;
    int64_t int_{0};
    double float_{0.0};
    std::string string_;
};

std::ostream& operator<<(std::ostream& out, const MetaValue& value);

using MetaMap = std::map<std::string, MetaValue>;

// Version: requested version of a (model, scenario) pair
// Either a number, "new" (engine assigns the next number on init), or
// unset (resolve to the default version).
class Version {
public:
    Version() : kind_(Kind::DEFAULT), number_(0) {}
    Version(int number) : kind_(Kind::NUMBER), number_(number) {}

    static Version New() { return Version(Kind::NEW); }
    static Version Default() { return Version(); }

    bool IsNew() const { return kind_ == Kind::NEW; }
    bool IsDefault() const { return kind_ == Kind::DEFAULT; }
    bool IsNumber() const { return kind_ == Kind::NUMBER; }

    int number() const { return number_; }

    // "new", the number, or "" when unset
    std::string ToString() const;

    bool operator==(const Version& other) const {
        return kind_ == other.kind_ && (kind_ != Kind::NUMBER || number_ == other.number_);
    }
    bool operator!=(const Version& other) const { return !(*this == other); }

private:
    enum class Kind : uint8_t { DEFAULT, NEW, NUMBER };

    explicit Version(Kind kind) : kind_(kind), number_(0) {}

    Kind kind_;
    int number_;
};

// ============================================================================
// Tabular records
// ============================================================================
// Member order of each record matches its published field order.

inline constexpr std::array<const char*, 13> kScenarioFields = {
    "model", "scenario", "scheme", "is_default", "is_locked", "cre_user",
    "cre_date", "upd_user", "upd_date", "lock_user", "lock_date",
    "annotation", "version"};

inline constexpr std::array<const char*, 4> kRegionFields = {
    "region", "mapped_to", "parent", "hierarchy"};

inline constexpr std::array<const char*, 3> kTimesliceFields = {
    "name", "category", "duration"};

inline constexpr std::array<const char*, 6> kTimeseriesFields = {
    "region", "variable", "unit", "subannual", "year", "value"};

inline constexpr std::array<const char*, 7> kGeodataFields = {
    "region", "variable", "subannual", "year", "value", "unit", "meta"};

/// One row of a scenario listing
struct ScenarioInfo {
    std::string model;
    std::string scenario;
    std::string scheme;
    bool is_default{false};
    bool is_locked{false};
    std::string cre_user;
    std::string cre_date;
    std::optional<std::string> upd_user;
    std::optional<std::string> upd_date;
    std::optional<std::string> lock_user;
    std::optional<std::string> lock_date;
    std::string annotation;
    int version{0};

    std::vector<std::string> ToStrings() const;
};

/// Region ("node") definition; synonyms carry the region they map to
struct RegionRecord {
    std::string region;
    std::optional<std::string> mapped_to;
    std::string parent;
    std::string hierarchy;

    std::vector<std::string> ToStrings() const;
};

/// Sub-annual time slice
struct TimesliceRecord {
    std::string name;
    std::string category;
    double duration{1.0};

    std::vector<std::string> ToStrings() const;
};

/// One time-series data point
/// meta is carried alongside the row and is not one of its published fields.
struct TimeseriesRecord {
    std::string region;
    std::string variable;
    std::string unit;
    std::string subannual{"Year"};
    int year{0};
    double value{0.0};
    bool meta{false};

    std::vector<std::string> ToStrings() const;

    bool operator==(const TimeseriesRecord& other) const;
};

/// One geodata point (string valued)
struct GeodataRecord {
    std::string region;
    std::string variable;
    std::string subannual{"Year"};
    int year{0};
    std::string value;
    std::string unit;
    bool meta{false};

    std::vector<std::string> ToStrings() const;

    bool operator==(const GeodataRecord& other) const;
};

} // namespace modelstore

// Hash specialization for std::unordered_map
namespace std {
template<>
struct hash<modelstore::SessionID> {
    size_t operator()(const modelstore::SessionID& id) const {
        return modelstore::SessionID::Hash()(id);
    }
};
} // namespace std
