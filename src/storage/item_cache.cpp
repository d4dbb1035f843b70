// File: src/storage/item_cache.cpp
#include "storage/item_cache.hpp"
#include <algorithm>
#include <functional>
#include <vector>

namespace modelstore {

namespace {

constexpr uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr uint64_t kFnvPrime = 1099511628211ULL;

// Length prefix keeps ("ab", "c") distinct from ("a", "bc")
void AppendField(std::string& text, const std::string& field) {
    text += std::to_string(field.size());
    text += ':';
    text += field;
}

uint64_t HashText(const std::string& text) {
    uint64_t hash = kFnvOffset;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= kFnvPrime;
    }
    return hash;
}

} // namespace

std::string CanonicalFilters(const Filters& filters) {
    std::string text;
    // std::map iterates dimensions in sorted order
    for (const auto& [dimension, labels] : filters) {
        AppendField(text, dimension);

        std::vector<std::string> values;
        values.reserve(labels.size());
        for (const auto& label : labels) {
            values.push_back(label.str());
        }
        std::sort(values.begin(), values.end());

        text += std::to_string(values.size());
        text += ';';
        for (const auto& value : values) {
            AppendField(text, value);
        }
    }
    return text;
}

uint64_t HashFilters(const Filters& filters) {
    return HashText(CanonicalFilters(filters));
}

CacheKey CacheKey::Make(SessionID session, ItemType kind, const std::string& name,
                        const Filters& filters) {
    CacheKey key;
    key.session = session;
    key.kind = kind;
    key.name = name;
    if (!filters.empty()) {
        key.filters = CanonicalFilters(filters);
        key.filter_hash = HashText(*key.filters);
    }
    return key;
}

size_t CacheKey::Hash::operator()(const CacheKey& key) const {
    size_t hash = std::hash<SessionID::ValueType>()(key.session.value());
    hash ^= std::hash<uint8_t>()(static_cast<uint8_t>(key.kind)) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    hash ^= std::hash<std::string>()(key.name) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    if (key.filter_hash) {
        hash ^= std::hash<uint64_t>()(*key.filter_hash) + 0x9e3779b9 + (hash << 6) + (hash >> 2);
    }
    return hash;
}

} // namespace modelstore
