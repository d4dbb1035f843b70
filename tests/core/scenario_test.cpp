// File: tests/core/scenario_test.cpp
#include "core/scenario.hpp"
#include "core/errors.hpp"
#include "storage/caching_backend.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace modelstore {
namespace {

// ============================================================================
// Fixture
// ============================================================================
// The transport problem: canning plants i ship to markets j.

class ScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        mp_ = Platform::Create("memory", {}, "local");
        mp_->AddUnit("cases");
        mp_->AddUnit("km");
        mp_->AddUnit("USD/km");
    }

    std::unique_ptr<Scenario> NewScenario() {
        return std::make_unique<Scenario>(mp_, "transport", "standard", Version::New(),
                                          "transport", "test data");
    }

    /// Sets i, j, parameters a(i), b(j), d(i, j) and scalar f
    void Populate(Scenario& scen) {
        scen.InitSet("i");
        scen.AddSet("i", {"seattle", "san-diego"});
        scen.InitSet("j");
        scen.AddSet("j", {"new-york", "chicago", "topeka"});

        scen.InitPar("a", {"i"});
        scen.AddPar("a", {"seattle", "san-diego"}, std::vector<double>{350.0, 600.0},
                    std::string("cases"));
        scen.InitPar("b", {"j"});
        scen.AddPar("b", {"new-york", "chicago", "topeka"},
                    std::vector<double>{325.0, 300.0, 275.0}, std::string("cases"));

        scen.InitPar("d", {"i", "j"});
        DataTable distances({"i", "j", "value"});
        distances.AddRow({"seattle", "new-york", 2.5});
        distances.AddRow({"seattle", "chicago", 1.7});
        distances.AddRow({"seattle", "topeka", 1.8});
        distances.AddRow({"san-diego", "new-york", 2.5});
        distances.AddRow({"san-diego", "chicago", 1.8});
        distances.AddRow({"san-diego", "topeka", 1.4});
        scen.AddPar("d", distances, {}, std::string("km"));

        scen.InitScalar("f", 90.0, "USD/km");
    }

    /// Committed default scenario with a solution in x(i, j) and z
    std::unique_ptr<Scenario> SolvedScenario() {
        auto scen = NewScenario();
        Populate(*scen);
        scen->InitVar("x", {"i", "j"});
        scen->InitVar("z");
        scen->AddTimeseries("World", "Cost", "???", {{2020, 1.0}, {2030, 2.0}});
        scen->Commit("model data");
        scen->SetAsDefault();

        scen->CheckOut();
        scen->SetSolution(ItemType::VAR, "x",
                          {SolutionElement{Key{"seattle", "new-york"}, 50.0, 0.0},
                           SolutionElement{Key{"san-diego", "topeka"}, 275.0, 0.0}});
        scen->SetSolution(ItemType::VAR, "z", {SolutionElement{std::nullopt, 153.675, 0.0}});
        scen->Commit("solution");
        return scen;
    }

    std::shared_ptr<Platform> mp_;
};

// ============================================================================
// Item Definition Tests
// ============================================================================

TEST_F(ScenarioTest, DefinitionsAndQueries) {
    auto scen = NewScenario();
    Populate(*scen);
    scen->InitVar("x", {"i", "j"});
    scen->InitEqu("demand", {"j"});

    EXPECT_TRUE(scen->HasSet("i"));
    EXPECT_TRUE(scen->HasPar("d"));
    EXPECT_TRUE(scen->HasVar("x"));
    EXPECT_TRUE(scen->HasEqu("demand"));
    EXPECT_FALSE(scen->HasPar("i"));
    EXPECT_TRUE(scen->HasItem("i"));
    EXPECT_FALSE(scen->HasItem("nothing"));

    EXPECT_EQ((std::vector<std::string>{"a", "b", "d", "f"}), scen->ListItems(ItemType::PAR));
    EXPECT_EQ((std::vector<std::string>{"i", "j"}), scen->IdxSets("d"));
    EXPECT_EQ((std::vector<std::string>{"i", "j"}), scen->IdxNames("x"));
    EXPECT_TRUE(scen->IdxSets("f").empty());
}

TEST_F(ScenarioTest, IndexNamesMayDifferFromSets) {
    auto scen = NewScenario();
    Populate(*scen);
    scen->InitPar("flow", {"i", "i"}, {"origin", "destination"});

    EXPECT_EQ((std::vector<std::string>{"origin", "destination"}), scen->IdxNames("flow"));

    scen->AddPar("flow", {"seattle", "san-diego"}, 1.0, std::string("cases"));
    ItemData flow = scen->Par("flow");
    EXPECT_EQ((std::vector<std::string>{"origin", "destination", "value", "unit"}),
              flow.ColumnNames());
    EXPECT_EQ((std::vector<std::string>{"san-diego"}), flow.Column("destination"));
}

TEST_F(ScenarioTest, DefinitionErrors) {
    auto scen = NewScenario();
    Populate(*scen);

    EXPECT_THROW(scen->InitPar("i"), ValidationError);
    EXPECT_THROW(scen->InitPar("p", {"k"}), NotFoundError);
    EXPECT_THROW(scen->InitPar("p", {"i", "j"}, {"only_one"}), ValidationError);
    EXPECT_THROW(scen->InitItem(ItemType::TS, "p"), ValidationError);
}

// ============================================================================
// Element Write Tests
// ============================================================================

TEST_F(ScenarioTest, ReadsReturnStoredElements) {
    auto scen = NewScenario();
    Populate(*scen);

    EXPECT_EQ((std::vector<std::string>{"seattle", "san-diego"}), scen->Set("i").Keys());

    ItemData d = scen->Par("d");
    EXPECT_EQ(6u, d.size());
    EXPECT_EQ("km", d.rows()[0].unit);

    ItemData f = scen->Scalar("f");
    EXPECT_DOUBLE_EQ(90.0, f.ScalarValue());
    EXPECT_EQ("USD/km", f.ScalarUnit());
}

TEST_F(ScenarioTest, FilteredReads) {
    auto scen = NewScenario();
    Populate(*scen);

    ItemData d = scen->Par("d", Filters{{"i", {"seattle"}}, {"j", {"chicago", "topeka"}}});
    ASSERT_EQ(2u, d.size());
    EXPECT_EQ((std::vector<std::string>{"seattle", "seattle"}), d.Column("i"));
}

TEST_F(ScenarioTest, SingleElementWrites) {
    auto scen = NewScenario();
    Populate(*scen);

    scen->AddSet("i", Label("portland"));
    scen->AddPar("a", Label("portland"), 100.0, "cases", std::string("new plant"));

    ItemData a = scen->Par("a", Filters{{"i", {"portland"}}});
    ASSERT_EQ(1u, a.size());
    EXPECT_DOUBLE_EQ(100.0, a.rows()[0].value);
    EXPECT_EQ("new plant", a.rows()[0].comment);
}

TEST_F(ScenarioTest, NestedKeyWrites) {
    auto scen = NewScenario();
    Populate(*scen);
    scen->InitSet("route", {"i", "j"});

    scen->AddSet("route", std::vector<std::vector<Label>>{{"seattle", "chicago"},
                                                          {"san-diego", "topeka"}});
    scen->AddSet("route", {"seattle", "new-york"});

    ItemData route = scen->Set("route");
    EXPECT_EQ(3u, route.size());
    EXPECT_EQ(ItemShape::SET_TABLE, route.shape());
}

TEST_F(ScenarioTest, MalformedInputRejectedBeforeWriting) {
    auto scen = NewScenario();
    Populate(*scen);

    EXPECT_THROW(scen->AddPar("d", {"seattle", "chicago", "topeka"}, 1.0), ValidationError);
    EXPECT_THROW(scen->AddPar("a", {"seattle", "san-diego"}, std::vector<double>{1.0}),
                 ValidationError);
    EXPECT_THROW(scen->AddPar("a", {"seattle"}, ValueArg{}), ValidationError);
    EXPECT_THROW(scen->AddSet("i", std::vector<std::vector<Label>>{{"a", "b"}}),
                 ValidationError);

    EXPECT_EQ(2u, scen->Par("a").size());
}

TEST_F(ScenarioTest, ElementsMustBeMembers) {
    auto scen = NewScenario();
    Populate(*scen);

    EXPECT_THROW(scen->AddPar("a", Label("boston"), 1.0, "cases"), ValidationError);
    EXPECT_THROW(scen->AddPar("a", Label("seattle"), 1.0, "furlong"), NotFoundError);
}

TEST_F(ScenarioTest, ChangeScalar) {
    auto scen = NewScenario();
    Populate(*scen);

    scen->ChangeScalar("f", 95.0, "USD/km", std::string("updated"));
    EXPECT_DOUBLE_EQ(95.0, scen->Scalar("f").ScalarValue());

    EXPECT_THROW(scen->ChangeScalar("a", 1.0, "cases"), ValidationError);
}

// ============================================================================
// Removal Tests
// ============================================================================

TEST_F(ScenarioTest, RemoveElements) {
    auto scen = NewScenario();
    Populate(*scen);

    scen->RemovePar("d", std::vector<std::vector<Label>>{{"seattle", "chicago"}});
    EXPECT_EQ(5u, scen->Par("d").size());

    scen->RemovePar("a", Label("seattle"));
    EXPECT_EQ(1u, scen->Par("a").size());

    scen->RemovePar("a", Label("nowhere"));
    EXPECT_EQ(1u, scen->Par("a").size());
}

TEST_F(ScenarioTest, RemoveSetMembersCascades) {
    auto scen = NewScenario();
    Populate(*scen);

    scen->RemoveSet("j", {"topeka"});

    EXPECT_EQ(2u, scen->Set("j").size());
    EXPECT_EQ(2u, scen->Par("b").size());
    EXPECT_EQ(4u, scen->Par("d").size());
}

TEST_F(ScenarioTest, RemoveWholeItems) {
    auto scen = NewScenario();
    Populate(*scen);

    EXPECT_THROW(scen->RemoveSet("i"), ValidationError);

    scen->RemovePar("d");
    scen->RemovePar("a");
    EXPECT_FALSE(scen->HasPar("d"));

    scen->RemoveSet("i");
    EXPECT_FALSE(scen->HasSet("i"));
}

// ============================================================================
// Item Iteration Tests
// ============================================================================

TEST_F(ScenarioTest, ItemsAreSortedAndFiltered) {
    auto scen = NewScenario();
    Populate(*scen);

    EXPECT_EQ((std::vector<std::string>{"a", "b", "d", "f"}), scen->Items().ToVector());
    EXPECT_EQ((std::vector<std::string>{"a", "d"}),
              scen->Items(ItemType::PAR, Filters{{"i", {"seattle"}}}).ToVector());
    EXPECT_EQ((std::vector<std::string>{"b", "d"}),
              scen->Items(ItemType::PAR, {}, std::string("j")).ToVector());
    EXPECT_EQ((std::vector<std::string>{"i", "j"}), scen->Items(ItemType::SET).ToVector());
}

TEST_F(ScenarioTest, ItemRangeIsRestartable) {
    auto scen = NewScenario();
    Populate(*scen);

    auto range = scen->Items(ItemType::SET);
    std::vector<std::string> first(range.begin(), range.end());
    std::vector<std::string> second(range.begin(), range.end());
    EXPECT_EQ(first, second);
}

TEST_F(ScenarioTest, IterItemDataAppliesOwnFilters) {
    auto scen = NewScenario();
    Populate(*scen);

    auto data = scen->IterItemData(ItemType::PAR, Filters{{"i", {"seattle"}}});
    ASSERT_EQ(2u, data.size());
    EXPECT_EQ("a", data[0].first);
    EXPECT_EQ(1u, data[0].second.size());
    EXPECT_EQ("d", data[1].first);
    EXPECT_EQ(3u, data[1].second.size());
}

// ============================================================================
// Solution Tests
// ============================================================================

TEST_F(ScenarioTest, SolutionReads) {
    auto scen = SolvedScenario();

    EXPECT_TRUE(scen->HasSolution());
    ItemData x = scen->Var("x");
    EXPECT_EQ((std::vector<std::string>{"i", "j", "lvl", "mrg"}), x.ColumnNames());
    EXPECT_EQ(2u, x.size());
    EXPECT_DOUBLE_EQ(153.675, scen->Var("z").Level());
}

TEST_F(ScenarioTest, CheckOutRefusedWhileSolved) {
    auto scen = SolvedScenario();

    EXPECT_THROW(scen->CheckOut(), PreconditionError);

    scen->CheckOut(true);
    scen->AddTimeseries("World", "Cost", "???", {{2040, 3.0}});
    EXPECT_TRUE(scen->Commit("time series only"));
}

TEST_F(ScenarioTest, SolutionOnlyForVariablesAndEquations) {
    auto scen = NewScenario();
    Populate(*scen);

    EXPECT_THROW(scen->SetSolution(ItemType::PAR, "a", {}), ValidationError);
}

TEST_F(ScenarioTest, RemoveSolution) {
    auto scen = SolvedScenario();

    scen->RemoveSolution();

    EXPECT_FALSE(scen->HasSolution());
    EXPECT_TRUE(scen->HasVar("x"));
    EXPECT_EQ(6u, scen->Par("d").size());
    EXPECT_EQ(2u, scen->Timeseries().size());
    EXPECT_THROW(scen->RemoveSolution(), PreconditionError);
}

TEST_F(ScenarioTest, RemoveSolutionFromYear) {
    auto scen = SolvedScenario();

    scen->RemoveSolution(2025);

    auto rows = scen->Timeseries();
    ASSERT_EQ(1u, rows.size());
    EXPECT_EQ(2020, rows[0].year);
}

// ============================================================================
// Clone Tests
// ============================================================================

TEST_F(ScenarioTest, CloneKeepsSolution) {
    auto scen = SolvedScenario();

    auto copy = scen->Clone(CloneOptions{nullptr, std::nullopt, std::string("copy"), "cloned"});

    EXPECT_EQ("transport", copy->model());
    EXPECT_EQ("copy", copy->scenario());
    EXPECT_EQ(1, *copy->version());
    EXPECT_FALSE(copy->IsDefault());
    EXPECT_TRUE(copy->HasSolution());
    EXPECT_EQ(6u, copy->Par("d").size());
}

TEST_F(ScenarioTest, CloneWithoutSolution) {
    auto scen = SolvedScenario();

    CloneOptions options;
    options.scenario = "no solution";
    options.keep_solution = false;
    auto copy = scen->Clone(options);

    EXPECT_FALSE(copy->HasSolution());
    EXPECT_TRUE(copy->HasVar("x"));
    EXPECT_TRUE(copy->Timeseries().empty());

    copy->CheckOut();
    copy->ChangeScalar("f", 100.0, "USD/km");
    EXPECT_TRUE(copy->Commit("edited"));
}

TEST_F(ScenarioTest, CloneToAnotherPlatform) {
    auto scen = SolvedScenario();
    auto other = Platform::Create("memory", {}, "other");

    CloneOptions options;
    options.platform = other;
    options.model = "transport-copy";
    auto copy = scen->Clone(options);

    EXPECT_EQ("other", copy->platform()->name());
    EXPECT_EQ("transport-copy", copy->model());
    EXPECT_EQ(2u, copy->Set("i").size());

    auto units = other->Units();
    EXPECT_NE(units.end(), std::find(units.begin(), units.end(), "USD/km"));
}

// ============================================================================
// Cache Tests
// ============================================================================

TEST_F(ScenarioTest, LoadScenarioDataFillsCache) {
    auto scen = NewScenario();
    Populate(*scen);
    scen->LoadScenarioData();

    auto& caching = dynamic_cast<CachingBackend&>(mp_->backend());
    CacheKey key = CacheKey::Make(scen->session().id, ItemType::PAR, "d", {});
    EXPECT_TRUE(caching.CacheGet(key).has_value());

    scen->Par("d");
    EXPECT_EQ(2u, caching.CacheHitCount(key));
}

TEST_F(ScenarioTest, LoadScenarioDataRequiresCache) {
    auto mp = Platform::Create("memory", {{"cache", "false"}});
    Scenario scen(mp, "transport", "standard", Version::New());

    EXPECT_THROW(scen.LoadScenarioData(), PreconditionError);
}

// ============================================================================
// Identity Tests
// ============================================================================

TEST_F(ScenarioTest, FromUrl) {
    auto scen = SolvedScenario();

    auto loaded = Scenario::FromUrl("ixmp://local/transport/standard", mp_);
    EXPECT_EQ(1, *loaded->version());
    EXPECT_TRUE(loaded->HasSolution());

    EXPECT_THROW(Scenario::FromUrl("transport/standard#9", mp_), NotFoundError);
}

} // namespace
} // namespace modelstore
