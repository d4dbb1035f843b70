// File: src/core/scenario.cpp
#include "core/scenario.hpp"
#include "core/errors.hpp"
#include "core/url.hpp"
#include <algorithm>

namespace modelstore {

// ============================================================================
// ItemNameRange
// ============================================================================

ItemNameRange::Iterator::Iterator(const ItemNameRange* range,
                                  std::shared_ptr<const std::vector<std::string>> names)
    : range_(range), names_(std::move(names)), pos_(0) {
    Settle();
}

ItemNameRange::Iterator& ItemNameRange::Iterator::operator++() {
    ++pos_;
    Settle();
    return *this;
}

void ItemNameRange::Iterator::Settle() {
    while (!AtEnd() && !range_->Accepts((*names_)[pos_])) {
        ++pos_;
    }
}

ItemNameRange::Iterator ItemNameRange::begin() const {
    auto names = std::make_shared<std::vector<std::string>>(scenario_->ListItems(kind_));
    std::sort(names->begin(), names->end());
    return Iterator(this, std::move(names));
}

std::vector<std::string> ItemNameRange::ToVector() const {
    return std::vector<std::string>(begin(), end());
}

bool ItemNameRange::Accepts(const std::string& name) const {
    if (!filters_.empty()) {
        std::vector<std::string> idx_names = scenario_->IdxNames(name);
        bool overlap = std::any_of(idx_names.begin(), idx_names.end(),
                                   [&](const std::string& dim) { return filters_.count(dim) > 0; });
        if (!overlap) {
            return false;
        }
    }
    if (indexed_by_) {
        std::vector<std::string> idx_sets = scenario_->IdxSets(name);
        if (std::find(idx_sets.begin(), idx_sets.end(), *indexed_by_) == idx_sets.end()) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Construction
// ============================================================================

Scenario::Scenario(std::shared_ptr<Platform> platform,
                   const std::string& model,
                   const std::string& scenario,
                   const Version& version,
                   const std::string& scheme,
                   const std::string& annotation)
    : TimeSeries(std::move(platform), model, scenario, version, annotation, scheme, true) {}

void Scenario::CheckOut(bool timeseries_only) {
    if (!timeseries_only && HasSolution()) {
        throw PreconditionError("This Scenario has a solution, use remove_solution() or "
                                "clone(keep_solution=false) before check_out()");
    }
    TimeSeries::CheckOut(timeseries_only);
}

// ============================================================================
// Item definitions
// ============================================================================

void Scenario::InitItem(ItemType kind,
                        const std::string& name,
                        const std::vector<std::string>& idx_sets,
                        const std::vector<std::string>& idx_names) {
    if (!kModelItems.Contains(kind)) {
        throw ValidationError(std::string("Cannot initialize an item of kind ") +
                              ToString(kind));
    }
    if (!idx_names.empty() && idx_names.size() != idx_sets.size()) {
        throw ValidationError("Index names " + std::to_string(idx_names.size()) +
                              " do not match the " + std::to_string(idx_sets.size()) +
                              " index sets of '" + name + "'");
    }
    RequireEditable("init_item()");
    Owner()->backend().InitItem(session_, kind, name, idx_sets, idx_names);
}

void Scenario::InitSet(const std::string& name,
                       const std::vector<std::string>& idx_sets,
                       const std::vector<std::string>& idx_names) {
    InitItem(ItemType::SET, name, idx_sets, idx_names);
}

void Scenario::InitPar(const std::string& name,
                       const std::vector<std::string>& idx_sets,
                       const std::vector<std::string>& idx_names) {
    InitItem(ItemType::PAR, name, idx_sets, idx_names);
}

void Scenario::InitVar(const std::string& name,
                       const std::vector<std::string>& idx_sets,
                       const std::vector<std::string>& idx_names) {
    InitItem(ItemType::VAR, name, idx_sets, idx_names);
}

void Scenario::InitEqu(const std::string& name,
                       const std::vector<std::string>& idx_sets,
                       const std::vector<std::string>& idx_names) {
    InitItem(ItemType::EQU, name, idx_sets, idx_names);
}

void Scenario::InitScalar(const std::string& name,
                          double value,
                          const std::string& unit,
                          const std::optional<std::string>& comment) {
    InitPar(name);
    ChangeScalar(name, value, unit, comment);
}

// ============================================================================
// Item queries
// ============================================================================

bool Scenario::HasItem(const std::string& name, ItemTypeSet kinds) {
    auto mp = Owner();
    for (ItemType kind : (kinds & kModelItems).Members()) {
        std::vector<std::string> names = mp->backend().ListItems(session_, kind);
        if (std::find(names.begin(), names.end(), name) != names.end()) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> Scenario::ListItems(ItemType kind) {
    return Owner()->backend().ListItems(session_, kind);
}

std::vector<std::string> Scenario::IdxSets(const std::string& name) {
    return Owner()->backend().ItemIndex(session_, name, IndexField::SETS);
}

std::vector<std::string> Scenario::IdxNames(const std::string& name) {
    return Owner()->backend().ItemIndex(session_, name, IndexField::NAMES);
}

ItemNameRange Scenario::Items(ItemType kind,
                              const Filters& filters,
                              const std::optional<std::string>& indexed_by) {
    return ItemNameRange(*this, kind, filters, indexed_by);
}

std::vector<std::pair<std::string, ItemData>> Scenario::IterItemData(ItemType kind,
                                                                     const Filters& filters) {
    auto mp = Owner();
    std::vector<std::pair<std::string, ItemData>> result;
    for (const auto& name : Items(kind, filters)) {
        // Keep only the filters on this item's dimensions
        Filters own;
        for (const auto& dim : IdxNames(name)) {
            auto it = filters.find(dim);
            if (it != filters.end()) {
                own.insert(*it);
            }
        }
        result.emplace_back(name, mp->backend().ItemGetElements(session_, kind, name, own));
    }
    return result;
}

// ============================================================================
// Item reads
// ============================================================================

ItemData Scenario::Set(const std::string& name, const Filters& filters) {
    return Owner()->backend().ItemGetElements(session_, ItemType::SET, name, filters);
}

ItemData Scenario::Par(const std::string& name, const Filters& filters) {
    return Owner()->backend().ItemGetElements(session_, ItemType::PAR, name, filters);
}

ItemData Scenario::Var(const std::string& name, const Filters& filters) {
    return Owner()->backend().ItemGetElements(session_, ItemType::VAR, name, filters);
}

ItemData Scenario::Equ(const std::string& name, const Filters& filters) {
    return Owner()->backend().ItemGetElements(session_, ItemType::EQU, name, filters);
}

ItemData Scenario::Scalar(const std::string& name) {
    return Par(name);
}

// ============================================================================
// Item writes
// ============================================================================

ElementParser Scenario::ParserFor(ItemType kind, const std::string& name) {
    auto mp = Owner();
    std::vector<std::string> idx_sets = mp->backend().ItemIndex(session_, name, IndexField::SETS);
    std::vector<std::string> idx_names =
        mp->backend().ItemIndex(session_, name, IndexField::NAMES);

    // A plain index set has a single dimension named after itself
    if (kind == ItemType::SET && idx_sets.empty()) {
        return ElementParser(kind, {name});
    }
    return ElementParser(kind, idx_names.empty() ? idx_sets : idx_names);
}

void Scenario::WriteElements(ItemType kind, const std::string& name,
                             const std::vector<Element>& elements) {
    Owner()->backend().ItemSetElements(session_, kind, name, elements);
}

void Scenario::DeleteElements(ItemType kind, const std::string& name,
                              const std::vector<Key>& keys) {
    Owner()->backend().ItemDeleteElements(session_, kind, name, keys);
}

void Scenario::AddSet(const std::string& name, const Label& key, const TextArg& comment) {
    RequireEditable("add_set()");
    ElementParser parser = ParserFor(ItemType::SET, name);
    WriteElements(ItemType::SET, name, parser.SetElements(parser.ParseKeys(key), comment));
}

void Scenario::AddSet(const std::string& name, std::initializer_list<Label> keys,
                      const TextArg& comment) {
    AddSet(name, std::vector<Label>(keys), comment);
}

void Scenario::AddSet(const std::string& name, const std::vector<Label>& keys,
                      const TextArg& comment) {
    RequireEditable("add_set()");
    ElementParser parser = ParserFor(ItemType::SET, name);
    WriteElements(ItemType::SET, name, parser.SetElements(parser.ParseKeys(keys), comment));
}

void Scenario::AddSet(const std::string& name, const std::vector<std::vector<Label>>& keys,
                      const TextArg& comment) {
    RequireEditable("add_set()");
    ElementParser parser = ParserFor(ItemType::SET, name);
    WriteElements(ItemType::SET, name, parser.SetElements(parser.ParseKeys(keys), comment));
}

void Scenario::AddSet(const std::string& name, const DataTable& table, const TextArg& comment) {
    RequireEditable("add_set()");
    ElementParser parser = ParserFor(ItemType::SET, name);
    WriteElements(ItemType::SET, name, parser.FromTable(table, {}, {}, comment));
}

void Scenario::AddPar(const std::string& name,
                      const Label& key,
                      double value,
                      const std::string& unit,
                      const std::optional<std::string>& comment) {
    RequireEditable("add_par()");
    ElementParser parser = ParserFor(ItemType::PAR, name);
    TextArg comment_arg;
    if (comment) {
        comment_arg = *comment;
    }
    WriteElements(ItemType::PAR, name,
                  parser.ParElements(parser.ParseKeys(key), value, unit, comment_arg));
}

void Scenario::AddPar(const std::string& name, std::initializer_list<Label> keys,
                      const ValueArg& value, const TextArg& unit, const TextArg& comment) {
    AddPar(name, std::vector<Label>(keys), value, unit, comment);
}

void Scenario::AddPar(const std::string& name, const std::vector<Label>& keys,
                      const ValueArg& value, const TextArg& unit, const TextArg& comment) {
    RequireEditable("add_par()");
    ElementParser parser = ParserFor(ItemType::PAR, name);
    WriteElements(ItemType::PAR, name,
                  parser.ParElements(parser.ParseKeys(keys), value, unit, comment));
}

void Scenario::AddPar(const std::string& name, const std::vector<std::vector<Label>>& keys,
                      const ValueArg& value, const TextArg& unit, const TextArg& comment) {
    RequireEditable("add_par()");
    ElementParser parser = ParserFor(ItemType::PAR, name);
    WriteElements(ItemType::PAR, name,
                  parser.ParElements(parser.ParseKeys(keys), value, unit, comment));
}

void Scenario::AddPar(const std::string& name, const DataTable& table,
                      const ValueArg& value, const TextArg& unit, const TextArg& comment) {
    RequireEditable("add_par()");
    ElementParser parser = ParserFor(ItemType::PAR, name);
    WriteElements(ItemType::PAR, name, parser.FromTable(table, value, unit, comment));
}

void Scenario::ChangeScalar(const std::string& name,
                            double value,
                            const std::string& unit,
                            const std::optional<std::string>& comment) {
    RequireEditable("change_scalar()");
    ElementParser parser = ParserFor(ItemType::PAR, name);
    WriteElements(ItemType::PAR, name, parser.ScalarElements(value, unit, comment));
}

void Scenario::RemoveSet(const std::string& name) {
    RequireEditable("remove_set()");
    Owner()->backend().DeleteItem(session_, ItemType::SET, name);
}

void Scenario::RemoveSet(const std::string& name, const Label& key) {
    RequireEditable("remove_set()");
    DeleteElements(ItemType::SET, name, ParserFor(ItemType::SET, name).ParseKeys(key));
}

void Scenario::RemoveSet(const std::string& name, std::initializer_list<Label> keys) {
    RemoveSet(name, std::vector<Label>(keys));
}

void Scenario::RemoveSet(const std::string& name, const std::vector<Label>& keys) {
    RequireEditable("remove_set()");
    DeleteElements(ItemType::SET, name, ParserFor(ItemType::SET, name).ParseKeys(keys));
}

void Scenario::RemoveSet(const std::string& name, const std::vector<std::vector<Label>>& keys) {
    RequireEditable("remove_set()");
    DeleteElements(ItemType::SET, name, ParserFor(ItemType::SET, name).ParseKeys(keys));
}

void Scenario::RemovePar(const std::string& name) {
    RequireEditable("remove_par()");
    Owner()->backend().DeleteItem(session_, ItemType::PAR, name);
}

void Scenario::RemovePar(const std::string& name, const Label& key) {
    RequireEditable("remove_par()");
    DeleteElements(ItemType::PAR, name, ParserFor(ItemType::PAR, name).ParseKeys(key));
}

void Scenario::RemovePar(const std::string& name, std::initializer_list<Label> keys) {
    RemovePar(name, std::vector<Label>(keys));
}

void Scenario::RemovePar(const std::string& name, const std::vector<Label>& keys) {
    RequireEditable("remove_par()");
    DeleteElements(ItemType::PAR, name, ParserFor(ItemType::PAR, name).ParseKeys(keys));
}

void Scenario::RemovePar(const std::string& name, const std::vector<std::vector<Label>>& keys) {
    RequireEditable("remove_par()");
    DeleteElements(ItemType::PAR, name, ParserFor(ItemType::PAR, name).ParseKeys(keys));
}

// ============================================================================
// Solution
// ============================================================================

bool Scenario::HasSolution() {
    return Owner()->backend().HasSolution(session_);
}

void Scenario::SetSolution(ItemType kind,
                           const std::string& name,
                           const std::vector<SolutionElement>& elements) {
    if (!kSolutionItems.Contains(kind)) {
        throw ValidationError(std::string("Solution data can only be written to variables "
                                          "and equations, not ") + ToString(kind));
    }
    RequireEditable("set_solution()");
    Owner()->backend().ItemSetSolution(session_, kind, name, elements);
}

void Scenario::RemoveSolution(std::optional<int> first_model_year) {
    auto mp = Owner();
    if (!mp->backend().HasSolution(session_)) {
        throw PreconditionError("This Scenario does not have a solution");
    }
    mp->backend().ClearSolution(session_, first_model_year);
}

// ============================================================================
// Scenario lifecycle
// ============================================================================

std::unique_ptr<Scenario> Scenario::Clone(const CloneOptions& options) {
    auto mp = Owner();
    std::shared_ptr<Platform> dest = options.platform ? options.platform : mp;

    CloneRequest request;
    request.model = options.model.value_or(session_.model);
    request.scenario = options.scenario.value_or(session_.scenario);
    request.annotation = options.annotation;
    request.keep_solution = options.keep_solution;
    request.first_model_year = options.shift_first_model_year;

    if (options.shift_first_model_year) {
        if (request.keep_solution) {
            mp->logger().Warning("Override keep_solution=true for shift_first_model_year");
        }
        request.keep_solution = false;
    }

    int version = mp->backend().Clone(session_, dest->backend(), request);
    return std::make_unique<Scenario>(dest, request.model, request.scenario, Version(version));
}

void Scenario::LoadScenarioData() {
    auto mp = Owner();
    if (!mp->backend().CacheEnabled()) {
        throw PreconditionError("load_scenario_data() requires a backend with caching enabled");
    }
    for (ItemType kind : kModelItems.Members()) {
        for (const auto& name : mp->backend().ListItems(session_, kind)) {
            mp->logger().Debug("Load " + std::string(ToString(kind)) + " '" + name + "'");
            mp->backend().ItemGetElements(session_, kind, name, {});
        }
    }
}

// ============================================================================
// Identity
// ============================================================================

std::unique_ptr<Scenario> Scenario::FromUrl(const std::string& url,
                                            const std::shared_ptr<Platform>& platform) {
    ParsedUrl parsed = ParseUrl(url);
    if (parsed.platform && platform && *parsed.platform != platform->name()) {
        throw ValidationError("URL '" + url + "' names platform '" + *parsed.platform +
                              "', not '" + platform->name() + "'");
    }
    return std::make_unique<Scenario>(platform, parsed.model, parsed.scenario, parsed.version);
}

UrlTarget<Scenario> Scenario::FromUrl(const std::string& url,
                                      const PlatformConfig& config,
                                      bool raise_errors) {
    UrlTarget<Scenario> target;
    target.platform = PlatformForUrl(url, config);
    try {
        target.handle = FromUrl(url, target.platform);
    } catch (const ModelStoreError& e) {
        if (raise_errors) {
            throw;
        }
        target.platform->logger().Warning(std::string("Failed to load ") + url + ": " +
                                          e.what());
    }
    return target;
}

} // namespace modelstore
