// File: tests/integration/integration_test.cpp
//
// Integration tests for ModelStore.
// Tests end-to-end workflows across Platform, Scenario and the backends.

#include "core/scenario.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace modelstore {
namespace {

// ============================================================================
// Test Utilities
// ============================================================================

std::string GetTempDbPath() {
    static int counter = 0;
    return "/tmp/test_integration_" + std::to_string(std::time(nullptr)) + "_" +
           std::to_string(counter++) + ".db";
}

/// Register the codes the transport problem uses
void AddTransportCodes(Platform& mp) {
    mp.AddUnit("cases");
    mp.AddUnit("km");
    mp.AddUnit("USD/km");
    mp.AddUnit("USD");
    mp.AddRegion("Seattle", "city");
    mp.AddRegion("San Diego", "city");
}

/// Build and commit the transport problem as the default version
std::unique_ptr<Scenario> BuildTransport(const std::shared_ptr<Platform>& mp) {
    auto scen = std::make_unique<Scenario>(mp, "canning problem", "standard", Version::New(),
                                           "transport", "Dantzig's transportation problem");

    scen->InitSet("i");
    scen->AddSet("i", {"seattle", "san-diego"});
    scen->InitSet("j");
    scen->AddSet("j", {"new-york", "chicago", "topeka"});

    scen->InitPar("a", {"i"});
    scen->AddPar("a", {"seattle", "san-diego"}, std::vector<double>{350.0, 600.0},
                 std::string("cases"));
    scen->InitPar("b", {"j"});
    scen->AddPar("b", {"new-york", "chicago", "topeka"}, std::vector<double>{325.0, 300.0, 275.0},
                 std::string("cases"));

    scen->InitPar("d", {"i", "j"});
    DataTable distances({"i", "j", "value"});
    distances.AddRow({"seattle", "new-york", 2.5});
    distances.AddRow({"seattle", "chicago", 1.7});
    distances.AddRow({"seattle", "topeka", 1.8});
    distances.AddRow({"san-diego", "new-york", 2.5});
    distances.AddRow({"san-diego", "chicago", 1.8});
    distances.AddRow({"san-diego", "topeka", 1.4});
    scen->AddPar("d", distances, {}, std::string("km"));

    scen->InitScalar("f", 90.0, "USD/km");

    scen->InitVar("x", {"i", "j"});
    scen->InitVar("z");
    scen->InitEqu("demand", {"j"});

    scen->AddTimeseries("Seattle", "Capacity", "cases", {{2020, 350.0}, {2030, 400.0}},
                        "Year", true);

    scen->Commit("import transport data");
    scen->SetAsDefault();
    scen->SetMeta("solver", MetaValue("gams"));
    return scen;
}

/// Store a solution the way a solver run would
void StoreSolution(Scenario& scen) {
    scen.CheckOut();
    scen.SetSolution(ItemType::VAR, "x",
                     {SolutionElement{Key{"seattle", "new-york"}, 50.0, 0.0},
                      SolutionElement{Key{"seattle", "chicago"}, 300.0, 0.0},
                      SolutionElement{Key{"san-diego", "new-york"}, 275.0, 0.0},
                      SolutionElement{Key{"san-diego", "topeka"}, 275.0, 0.0}});
    scen.SetSolution(ItemType::VAR, "z", {SolutionElement{std::nullopt, 153.675, 0.0}});
    scen.SetSolution(ItemType::EQU, "demand",
                     {SolutionElement{Key{"new-york"}, 325.0, 0.225},
                      SolutionElement{Key{"chicago"}, 300.0, 0.153},
                      SolutionElement{Key{"topeka"}, 275.0, 0.126}});
    scen.AddTimeseries("Seattle", "Cost", "USD", {{2020, 153.675}, {2030, 160.0}});
    scen.Commit("solution");
}

std::vector<std::string> ReadLines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

// ============================================================================
// Workflow Tests (every backend)
// ============================================================================

class WorkflowTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        db_path_ = GetTempDbPath();
        if (GetParam() == "sqlite") {
            mp_ = Platform::Create("sqlite", {{"path", db_path_}}, "local");
        } else {
            mp_ = Platform::Create("memory", {}, "local");
        }
        AddTransportCodes(*mp_);
    }

    void TearDown() override {
        mp_.reset();
        std::filesystem::remove(db_path_);
        std::filesystem::remove(db_path_ + "-wal");
        std::filesystem::remove(db_path_ + "-shm");
    }

    std::string db_path_;
    std::shared_ptr<Platform> mp_;
};

TEST_P(WorkflowTest, BuildSolveAndRead) {
    auto scen = BuildTransport(mp_);
    EXPECT_EQ(1, *scen->version());
    EXPECT_FALSE(scen->HasSolution());

    StoreSolution(*scen);

    Scenario loaded(mp_, "canning problem", "standard");
    EXPECT_EQ(1, *loaded.version());
    EXPECT_TRUE(loaded.IsDefault());
    EXPECT_TRUE(loaded.HasSolution());
    EXPECT_DOUBLE_EQ(153.675, loaded.Var("z").Level());
    EXPECT_EQ(4u, loaded.Var("x").size());
    EXPECT_EQ(6u, loaded.Par("d").size());
    EXPECT_EQ("gams", loaded.GetMeta("solver")->AsString());

    auto demand = loaded.Equ("demand", Filters{{"j", {"topeka"}}});
    ASSERT_EQ(1u, demand.size());
    EXPECT_DOUBLE_EQ(0.126, demand.rows()[0].marginal);

    auto listing = mp_->ScenarioList();
    ASSERT_EQ(1u, listing.size());
    EXPECT_EQ("transport", listing[0].scheme);
    EXPECT_FALSE(listing[0].is_locked);
}

TEST_P(WorkflowTest, EditDataAfterRemovingSolution) {
    auto scen = BuildTransport(mp_);
    StoreSolution(*scen);

    scen->RemoveSolution();
    scen->Transact("higher freight cost", [&]() {
        scen->ChangeScalar("f", 95.0, "USD/km");
        scen->RemoveSet("j", Label("topeka"));
    });

    Scenario loaded(mp_, "canning problem", "standard");
    EXPECT_FALSE(loaded.HasSolution());
    EXPECT_DOUBLE_EQ(95.0, loaded.Scalar("f").ScalarValue());
    EXPECT_EQ(4u, loaded.Par("d").size());
    EXPECT_EQ(2u, loaded.Par("b").size());
}

TEST_P(WorkflowTest, FailedEditIsRolledBack) {
    auto scen = BuildTransport(mp_);

    EXPECT_THROW(scen->Transact("bad edit", [&]() {
        scen->ChangeScalar("f", 0.0, "USD/km");
        scen->AddPar("a", Label("portland"), 1.0, "cases");
    }, true, true), ValidationError);

    // The cleanup closes the engine
    mp_->OpenDb();
    EXPECT_FALSE(scen->IsCheckedOut());
    EXPECT_DOUBLE_EQ(90.0, scen->Scalar("f").ScalarValue());
}

TEST_P(WorkflowTest, CloneForSensitivityRun) {
    auto scen = BuildTransport(mp_);
    StoreSolution(*scen);

    CloneOptions options;
    options.scenario = "high demand";
    options.annotation = "demand +10%";
    options.keep_solution = false;
    auto copy = scen->Clone(options);

    EXPECT_FALSE(copy->HasSolution());
    // Only the metadata series survive
    auto series = copy->Timeseries();
    ASSERT_EQ(2u, series.size());
    EXPECT_EQ("Capacity", series[0].variable);

    copy->CheckOut();
    copy->AddPar("b", {"new-york", "chicago", "topeka"},
                 std::vector<double>{357.5, 330.0, 302.5}, std::string("cases"));
    copy->Commit("demand +10%");
    copy->SetAsDefault();

    Scenario original(mp_, "canning problem", "standard");
    EXPECT_DOUBLE_EQ(325.0, original.Par("b", Filters{{"j", {"new-york"}}}).rows()[0].value);
    EXPECT_TRUE(original.HasSolution());

    EXPECT_EQ(2u, mp_->ScenarioList().size());
}

TEST_P(WorkflowTest, ShiftFirstModelYear) {
    auto scen = BuildTransport(mp_);
    StoreSolution(*scen);

    CloneOptions options;
    options.scenario = "from 2025";
    options.shift_first_model_year = 2025;
    auto copy = scen->Clone(options);

    EXPECT_FALSE(copy->HasSolution());
    for (const auto& record : copy->Timeseries()) {
        EXPECT_TRUE(record.meta || record.year < 2025) << record.variable << " " << record.year;
    }
}

TEST_P(WorkflowTest, ExportTimeseries) {
    auto scen = BuildTransport(mp_);
    StoreSolution(*scen);
    std::string path = db_path_ + ".csv";

    mp_->ExportTimeseriesData(path);

    auto lines = ReadLines(path);
    ASSERT_EQ(5u, lines.size());
    EXPECT_EQ("canning problem,standard,1,Capacity,cases,Seattle,1,Year,2020,350", lines[1]);

    std::filesystem::remove(path);
}

TEST_P(WorkflowTest, UrlRoundTrip) {
    auto scen = BuildTransport(mp_);

    auto loaded = Scenario::FromUrl("ixmp://local/" + scen->Url(), mp_);
    EXPECT_EQ(scen->Url(), loaded->Url());
    EXPECT_EQ(2u, loaded->Set("i").size());
}

INSTANTIATE_TEST_SUITE_P(Backends, WorkflowTest, ::testing::Values("memory", "sqlite"));

// ============================================================================
// Cross-backend Tests
// ============================================================================

class CrossBackendTest : public ::testing::Test {
protected:
    void SetUp() override { db_path_ = GetTempDbPath(); }

    void TearDown() override {
        std::filesystem::remove(db_path_);
        std::filesystem::remove(db_path_ + "-wal");
        std::filesystem::remove(db_path_ + "-shm");
    }

    std::string db_path_;
};

TEST_F(CrossBackendTest, ReopenedDatabaseKeepsEverything) {
    {
        auto mp = Platform::Create("sqlite", {{"path", db_path_}});
        AddTransportCodes(*mp);
        auto scen = BuildTransport(mp);
        StoreSolution(*scen);
    }

    auto mp = Platform::Create("sqlite", {{"path", db_path_}});
    auto units = mp->Units();
    EXPECT_NE(units.end(), std::find(units.begin(), units.end(), "USD/km"));

    Scenario scen(mp, "canning problem", "standard");
    EXPECT_TRUE(scen.HasSolution());
    EXPECT_EQ((std::vector<std::string>{"i", "j"}), scen.IdxSets("d"));
    EXPECT_EQ(4u, scen.Timeseries().size());
    EXPECT_EQ("gams", scen.GetMeta("solver")->AsString());
}

TEST_F(CrossBackendTest, CloneFromFileToMemory) {
    auto file = Platform::Create("sqlite", {{"path", db_path_}}, "file");
    AddTransportCodes(*file);
    auto scen = BuildTransport(file);
    StoreSolution(*scen);

    auto scratch = Platform::Create("memory", {}, "scratch");
    CloneOptions options;
    options.platform = scratch;
    auto copy = scen->Clone(options);

    EXPECT_EQ("scratch", copy->platform()->name());
    EXPECT_TRUE(copy->HasSolution());
    EXPECT_EQ(4u, copy->Var("x").size());
    EXPECT_EQ(4u, copy->Timeseries().size());

    auto regions = scratch->Regions();
    EXPECT_TRUE(std::any_of(regions.begin(), regions.end(),
                            [](const RegionRecord& r) { return r.region == "San Diego"; }));
}

TEST_F(CrossBackendTest, FromUrlWithConfig) {
    PlatformConfig config;
    config.default_platform = "file";
    config.platforms["file"] = PlatformInfo{"sqlite", {{"path", db_path_}}};
    {
        auto mp = Platform::FromConfig(config);
        AddTransportCodes(*mp);
        BuildTransport(mp);
    }

    auto target = Scenario::FromUrl("ixmp://file/canning problem/standard", config, true);
    ASSERT_NE(nullptr, target.handle);
    EXPECT_EQ("file", target.platform->name());
    EXPECT_EQ(1, *target.handle->version());

    auto missing = Scenario::FromUrl("canning problem/other", config);
    EXPECT_EQ(nullptr, missing.handle);
    ASSERT_NE(nullptr, missing.platform);
}

} // namespace
} // namespace modelstore
