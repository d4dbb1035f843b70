// File: src/storage/snapshot.cpp
#include "storage/snapshot.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <istream>
#include <ostream>

namespace modelstore {

namespace {

constexpr uint32_t kSnapshotMagic = 0x4d534e31;  // "MSN1"

// ============================================================================
// Binary stream helpers
// ============================================================================

template<typename T>
void WriteValue(std::ostream& out, const T& value) {
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
}

template<typename T>
T ReadValue(std::istream& in) {
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (!in) {
        throw EngineError("Truncated snapshot data");
    }
    return value;
}

void WriteString(std::ostream& out, const std::string& str) {
    WriteValue<uint64_t>(out, str.size());
    out.write(str.data(), static_cast<std::streamsize>(str.size()));
}

std::string ReadString(std::istream& in) {
    uint64_t size = ReadValue<uint64_t>(in);
    std::string str(size, '\0');
    in.read(&str[0], static_cast<std::streamsize>(size));
    if (!in) {
        throw EngineError("Truncated snapshot data");
    }
    return str;
}

void WriteStrings(std::ostream& out, const std::vector<std::string>& strings) {
    WriteValue<uint64_t>(out, strings.size());
    for (const auto& str : strings) {
        WriteString(out, str);
    }
}

std::vector<std::string> ReadStrings(std::istream& in) {
    uint64_t count = ReadValue<uint64_t>(in);
    std::vector<std::string> strings;
    strings.reserve(count);
    for (uint64_t i = 0; i < count; ++i) {
        strings.push_back(ReadString(in));
    }
    return strings;
}

bool KeepRow(bool meta, int year, bool keep_non_meta, std::optional<int> from_year) {
    if (meta || keep_non_meta) {
        return true;
    }
    return from_year.has_value() && year < *from_year;
}

template<typename Record>
void FilterRecords(std::vector<Record>& records, bool keep_non_meta,
                   std::optional<int> from_year) {
    records.erase(
        std::remove_if(records.begin(), records.end(),
                       [&](const Record& r) {
                           return !KeepRow(r.meta, r.year, keep_non_meta, from_year);
                       }),
        records.end());
}

void ClearSolutionItems(ScenarioSnapshot& snapshot) {
    for (auto& item : snapshot.items) {
        if (kSolutionItems.Contains(item.kind)) {
            item.rows.clear();
        }
    }
}

} // namespace

// ============================================================================
// ItemSnapshot
// ============================================================================

size_t ItemSnapshot::Dimension() const {
    return index_sets.empty() && kind == ItemType::SET ? 1 : index_sets.size();
}

bool ItemSnapshot::IsIndexSet() const {
    return kind == ItemType::SET && index_sets.empty();
}

// ============================================================================
// ScenarioSnapshot
// ============================================================================

ItemSnapshot* ScenarioSnapshot::FindItem(const std::string& name) {
    for (auto& item : items) {
        if (item.name == name) {
            return &item;
        }
    }
    return nullptr;
}

const ItemSnapshot* ScenarioSnapshot::FindItem(const std::string& name) const {
    for (const auto& item : items) {
        if (item.name == name) {
            return &item;
        }
    }
    return nullptr;
}

bool ScenarioSnapshot::HasSolution() const {
    return std::any_of(items.begin(), items.end(), [](const ItemSnapshot& item) {
        return kSolutionItems.Contains(item.kind) && !item.rows.empty();
    });
}

void ScenarioSnapshot::Serialize(std::ostream& out) const {
    WriteValue(out, kSnapshotMagic);
    WriteString(out, scheme);
    WriteValue<uint8_t>(out, is_scenario ? 1 : 0);

    WriteValue<uint64_t>(out, items.size());
    for (const auto& item : items) {
        WriteValue<uint8_t>(out, static_cast<uint8_t>(item.kind));
        WriteString(out, item.name);
        WriteStrings(out, item.index_sets);
        WriteStrings(out, item.index_names);
        WriteValue<uint64_t>(out, item.rows.size());
        for (const auto& row : item.rows) {
            WriteStrings(out, row.key);
            WriteValue(out, row.value);
            WriteString(out, row.unit);
            WriteValue(out, row.level);
            WriteValue(out, row.marginal);
            WriteString(out, row.comment);
        }
    }

    WriteValue<uint64_t>(out, timeseries.size());
    for (const auto& ts : timeseries) {
        WriteString(out, ts.region);
        WriteString(out, ts.variable);
        WriteString(out, ts.unit);
        WriteString(out, ts.subannual);
        WriteValue<int32_t>(out, ts.year);
        WriteValue(out, ts.value);
        WriteValue<uint8_t>(out, ts.meta ? 1 : 0);
    }

    WriteValue<uint64_t>(out, geodata.size());
    for (const auto& geo : geodata) {
        WriteString(out, geo.region);
        WriteString(out, geo.variable);
        WriteString(out, geo.subannual);
        WriteValue<int32_t>(out, geo.year);
        WriteString(out, geo.value);
        WriteString(out, geo.unit);
        WriteValue<uint8_t>(out, geo.meta ? 1 : 0);
    }
}

ScenarioSnapshot ScenarioSnapshot::Deserialize(std::istream& in) {
    if (ReadValue<uint32_t>(in) != kSnapshotMagic) {
        throw EngineError("Snapshot data has an unknown format");
    }

    ScenarioSnapshot snapshot;
    snapshot.scheme = ReadString(in);
    snapshot.is_scenario = ReadValue<uint8_t>(in) != 0;

    uint64_t item_count = ReadValue<uint64_t>(in);
    snapshot.items.reserve(item_count);
    for (uint64_t i = 0; i < item_count; ++i) {
        ItemSnapshot item;
        item.kind = static_cast<ItemType>(ReadValue<uint8_t>(in));
        item.name = ReadString(in);
        item.index_sets = ReadStrings(in);
        item.index_names = ReadStrings(in);
        uint64_t row_count = ReadValue<uint64_t>(in);
        item.rows.reserve(row_count);
        for (uint64_t r = 0; r < row_count; ++r) {
            ItemRow row;
            row.key = ReadStrings(in);
            row.value = ReadValue<double>(in);
            row.unit = ReadString(in);
            row.level = ReadValue<double>(in);
            row.marginal = ReadValue<double>(in);
            row.comment = ReadString(in);
            item.rows.push_back(std::move(row));
        }
        snapshot.items.push_back(std::move(item));
    }

    uint64_t ts_count = ReadValue<uint64_t>(in);
    snapshot.timeseries.reserve(ts_count);
    for (uint64_t i = 0; i < ts_count; ++i) {
        TimeseriesRecord ts;
        ts.region = ReadString(in);
        ts.variable = ReadString(in);
        ts.unit = ReadString(in);
        ts.subannual = ReadString(in);
        ts.year = ReadValue<int32_t>(in);
        ts.value = ReadValue<double>(in);
        ts.meta = ReadValue<uint8_t>(in) != 0;
        snapshot.timeseries.push_back(std::move(ts));
    }

    uint64_t geo_count = ReadValue<uint64_t>(in);
    snapshot.geodata.reserve(geo_count);
    for (uint64_t i = 0; i < geo_count; ++i) {
        GeodataRecord geo;
        geo.region = ReadString(in);
        geo.variable = ReadString(in);
        geo.subannual = ReadString(in);
        geo.year = ReadValue<int32_t>(in);
        geo.value = ReadString(in);
        geo.unit = ReadString(in);
        geo.meta = ReadValue<uint8_t>(in) != 0;
        snapshot.geodata.push_back(std::move(geo));
    }

    return snapshot;
}

// ============================================================================
// Solution and clone filters
// ============================================================================

void ClearSolutionData(ScenarioSnapshot& snapshot, std::optional<int> from_year) {
    ClearSolutionItems(snapshot);
    FilterRecords(snapshot.timeseries, false, from_year);
    FilterRecords(snapshot.geodata, false, from_year);
}

void ApplyCloneFilter(ScenarioSnapshot& snapshot,
                      bool keep_solution,
                      std::optional<int> first_model_year) {
    if (keep_solution && !first_model_year) {
        return;
    }
    ClearSolutionData(snapshot, first_model_year);
}

} // namespace modelstore
