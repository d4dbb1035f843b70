// File: tests/storage/memory_backend_test.cpp
#include "storage/memory_backend.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <thread>
#include <vector>

namespace modelstore {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

MemoryBackend::Config TestConfig() {
    MemoryBackend::Config config;
    config.user = "tester";
    return config;
}

Session InitSession(Backend& backend, const std::string& scenario = "baseline") {
    Session session;
    session.model = "model";
    session.scenario = scenario;
    backend.Init(session, "");
    return session;
}

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

// ============================================================================
// Configuration Tests
// ============================================================================

TEST(MemoryBackendTest, ConfigFromOptions) {
    auto config = MemoryBackend::ConfigFromOptions(
        {{"name", "scratch"}, {"user", "alice"}, {"default_region", "Earth"}});

    EXPECT_EQ("scratch", config.name);
    EXPECT_EQ("alice", config.user);
    EXPECT_EQ("Earth", config.default_region);
    EXPECT_EQ("Year", config.default_timeslice);
}

TEST(MemoryBackendTest, ConfigRejectsUnknownOption) {
    try {
        MemoryBackend::ConfigFromOptions({{"path", "/tmp/x.db"}});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string::npos, std::string(e.what()).find("'path'"));
    }
}

TEST(MemoryBackendTest, CustomDefaultCodes) {
    MemoryBackend::Config config = TestConfig();
    config.default_region = "Earth";
    config.default_timeslice = "Annual";
    MemoryBackend backend(config);

    auto nodes = backend.GetNodes();
    ASSERT_EQ(1u, nodes.size());
    EXPECT_EQ("Earth", nodes[0].region);
    EXPECT_EQ("Earth", nodes[0].parent);

    auto slices = backend.GetTimeslices();
    ASSERT_EQ(1u, slices.size());
    EXPECT_EQ("Annual", slices[0].name);

    EXPECT_EQ((std::vector<std::string>{"???"}), backend.GetUnits());
}

// ============================================================================
// Registry Tests
// ============================================================================

TEST(MemoryBackendTest, SetUnitUpdatesExisting) {
    MemoryBackend backend(TestConfig());
    backend.SetUnit("kg", "kilogram");
    backend.SetUnit("kg", "kilograms");

    EXPECT_EQ(2u, backend.GetUnits().size());
}

TEST(MemoryBackendTest, SetNodeDefaultsParentToDefaultRegion) {
    MemoryBackend backend(TestConfig());
    backend.SetNode("Europe", std::nullopt, std::string("region"), std::nullopt);

    auto nodes = backend.GetNodes();
    ASSERT_EQ(2u, nodes.size());
    EXPECT_EQ((std::vector<std::string>{"Europe", "", "World", "region"}), nodes[1].ToStrings());
}

TEST(MemoryBackendTest, TimesliceUpsert) {
    MemoryBackend backend(TestConfig());
    backend.SetTimeslice("Winter", "Season", 0.25);
    backend.SetTimeslice("Winter", "Season", 0.5);

    auto slices = backend.GetTimeslices();
    ASSERT_EQ(2u, slices.size());
    EXPECT_DOUBLE_EQ(0.5, slices[1].duration);
}

TEST(MemoryBackendTest, ModelAndScenarioNames) {
    MemoryBackend backend(TestConfig());
    backend.AddModelName("MESSAGE");
    backend.AddModelName("MESSAGE");
    InitSession(backend);

    auto models = backend.GetModelNames();
    EXPECT_EQ(2u, models.size());
    EXPECT_TRUE(Contains(models, "MESSAGE"));
    EXPECT_TRUE(Contains(models, "model"));
    EXPECT_TRUE(Contains(backend.GetScenarioNames(), "baseline"));
}

// ============================================================================
// Session Tests
// ============================================================================

TEST(MemoryBackendTest, ScenarioInfoRecordsUsers) {
    MemoryBackend backend(TestConfig());
    Session session = InitSession(backend);
    backend.Commit(session, "first");

    auto listed = backend.GetScenarios(false, std::nullopt, std::nullopt);
    ASSERT_EQ(1u, listed.size());
    EXPECT_EQ("tester", listed[0].cre_user);
    ASSERT_TRUE(listed[0].upd_user.has_value());
    EXPECT_EQ("tester", *listed[0].upd_user);
    EXPECT_FALSE(listed[0].is_locked);
    EXPECT_FALSE(listed[0].lock_user.has_value());
    EXPECT_EQ(1, listed[0].version);
}

TEST(MemoryBackendTest, ReleasedSessionIsUnknown) {
    MemoryBackend backend(TestConfig());
    Session session = InitSession(backend);
    backend.Commit(session, "");

    backend.DelTs(session);

    EXPECT_THROW(backend.RunId(session), NotFoundError);
    EXPECT_EQ(1u, backend.GetScenarios(false, std::nullopt, std::nullopt).size());
}

TEST(MemoryBackendTest, ReleasingLockOwnerRollsBackAndUnlocks) {
    MemoryBackend backend(TestConfig());
    Session owner = InitSession(backend);
    backend.SetData(owner, "World", "GDP", {{2020, 1.0}}, "???", "Year", false);
    backend.Commit(owner, "");

    backend.CheckOut(owner, false);
    backend.SetData(owner, "World", "GDP", {{2030, 2.0}}, "???", "Year", false);
    backend.DelTs(owner);

    Session next;
    next.model = "model";
    next.scenario = "baseline";
    next.version = 1;
    backend.Get(next);
    EXPECT_FALSE(backend.GetScenarios(false, std::nullopt, std::nullopt)[0].is_locked);
    EXPECT_EQ(1u, backend.GetData(next, {}, {}, {}, {}).size());
    EXPECT_NO_THROW(backend.CheckOut(next, false));
}

TEST(MemoryBackendTest, ReleasingCreatorDropsUncommittedRun) {
    MemoryBackend backend(TestConfig());
    Session abandoned = InitSession(backend);
    backend.DelTs(abandoned);

    Session session = InitSession(backend);
    backend.Commit(session, "");
    EXPECT_EQ(1, *session.version);
    EXPECT_EQ(1u, backend.GetScenarios(false, std::nullopt, std::nullopt).size());
}

TEST(MemoryBackendTest, ReleasingReaderKeepsOwnersLock) {
    MemoryBackend backend(TestConfig());
    Session owner = InitSession(backend);
    backend.Commit(owner, "");

    Session reader;
    reader.model = "model";
    reader.scenario = "baseline";
    reader.version = 1;
    backend.Get(reader);

    backend.CheckOut(owner, false);
    backend.DelTs(reader);
    EXPECT_TRUE(backend.IsCheckedOut(owner));
}

TEST(MemoryBackendTest, EmptyNamesRejected) {
    MemoryBackend backend(TestConfig());
    Session session;
    session.model = "model";
    EXPECT_THROW(backend.Init(session, ""), ValidationError);
}

TEST(MemoryBackendTest, ClearSolutionRefusedWhileAnotherSessionHoldsLock) {
    MemoryBackend backend(TestConfig());
    Session owner = InitSession(backend);
    backend.Commit(owner, "");

    Session other;
    other.model = "model";
    other.scenario = "baseline";
    other.version = 1;
    backend.Get(other);

    backend.CheckOut(owner, false);
    EXPECT_THROW(backend.ClearSolution(other, std::nullopt), PreconditionError);
    EXPECT_NO_THROW(backend.ClearSolution(owner, std::nullopt));
}

// ============================================================================
// Snapshot Tests
// ============================================================================

TEST(MemoryBackendTest, ExportSnapshotCopiesContent) {
    MemoryBackend backend(TestConfig());
    Session session = InitSession(backend);
    session.scheme = "";
    backend.InitItem(session, ItemType::SET, "i", {}, {});

    ScenarioSnapshot snapshot = backend.ExportSnapshot(session);
    ASSERT_NE(nullptr, snapshot.FindItem("i"));
    snapshot.items.clear();

    EXPECT_EQ(1u, backend.ListItems(session, ItemType::SET).size());
}

TEST(MemoryBackendTest, ImportSnapshotRegistersMissingCodes) {
    MemoryBackend backend(TestConfig());

    ScenarioSnapshot snapshot;
    snapshot.timeseries.push_back(
        TimeseriesRecord{"Asia", "GDP", "billion USD", "Summer", 2020, 1.0, false});
    ItemSnapshot par;
    par.kind = ItemType::PAR;
    par.name = "cost";
    ItemRow row;
    row.value = 1.0;
    row.unit = "USD/km";
    par.rows.push_back(row);
    snapshot.items.push_back(par);

    int version = backend.ImportSnapshot("model", "imported", "from file", snapshot);
    EXPECT_EQ(1, version);

    auto units = backend.GetUnits();
    EXPECT_TRUE(Contains(units, "billion USD"));
    EXPECT_TRUE(Contains(units, "USD/km"));

    auto nodes = backend.GetNodes();
    EXPECT_TRUE(std::any_of(nodes.begin(), nodes.end(),
                            [](const RegionRecord& r) { return r.region == "Asia"; }));

    auto slices = backend.GetTimeslices();
    EXPECT_TRUE(std::any_of(slices.begin(), slices.end(),
                            [](const TimesliceRecord& t) { return t.name == "Summer"; }));

    auto listed = backend.GetScenarios(false, std::string("model"), std::string("imported"));
    ASSERT_EQ(1u, listed.size());
    EXPECT_FALSE(listed[0].is_default);
    EXPECT_EQ("from file", listed[0].annotation);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST(MemoryBackendTest, ConcurrentSessionsOnSeparateRuns) {
    MemoryBackend backend(TestConfig());
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&backend, t]() {
            Session session = InitSession(backend, "scenario" + std::to_string(t));
            for (int year = 2020; year < 2070; year += 10) {
                backend.SetData(session, "World", "Output", {{year, year * 1.0}}, "???", "Year",
                                false);
            }
            backend.Commit(session, "");
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto listed = backend.GetScenarios(false, std::nullopt, std::nullopt);
    ASSERT_EQ(4u, listed.size());
    for (const auto& info : listed) {
        EXPECT_EQ(1, info.version);
    }
}

} // namespace
} // namespace modelstore
