// File: tests/core/platform_test.cpp
#include "core/platform.hpp"
#include "core/timeseries.hpp"
#include "core/errors.hpp"
#include "storage/memory_backend.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace modelstore {
namespace {

// ============================================================================
// Helper Functions
// ============================================================================

std::string GetTempPath(const std::string& suffix) {
    static int counter = 0;
    return "/tmp/test_platform_" + std::to_string(std::time(nullptr)) + "_" +
           std::to_string(counter++) + suffix;
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

class PlatformTest : public ::testing::Test {
protected:
    void SetUp() override {
        mp_ = Platform::Create("memory");
        mp_->logger().SetStream(&log_);
    }

    /// Commit a version of (model, scenario) with one GDP series
    int CommitRun(const std::string& model, const std::string& scenario, bool make_default) {
        TimeSeries ts(mp_, model, scenario, Version::New(), "test run");
        ts.AddTimeseries("World", "GDP", "???", {{2020, 1.0}, {2030, 2.0}});
        ts.Commit("");
        if (make_default) {
            ts.SetAsDefault();
        }
        return *ts.version();
    }

    std::ostringstream log_;
    std::shared_ptr<Platform> mp_;
};

// ============================================================================
// Construction Tests
// ============================================================================

TEST_F(PlatformTest, NameDefaultsToBackendClass) {
    EXPECT_EQ("memory", mp_->name());
    EXPECT_EQ("scratch", Platform::Create("memory", {}, "scratch")->name());
}

TEST_F(PlatformTest, UnknownClassOrOptionRejected) {
    EXPECT_THROW(Platform::Create("oracle"), ValidationError);
    EXPECT_THROW(Platform::Create("memory", {{"path", "/tmp/x.db"}}), ValidationError);
    EXPECT_THROW(Platform::Create("memory", {{"cache", "sometimes"}}), ValidationError);
}

TEST_F(PlatformTest, CacheOptionsAreHandledByThePlatform) {
    auto cached = Platform::Create("memory", {{"cache", "true"}, {"cache_size", "10"}});
    EXPECT_TRUE(cached->backend().CacheEnabled());

    auto uncached = Platform::Create("memory", {{"cache", "false"}});
    EXPECT_FALSE(uncached->backend().CacheEnabled());
}

TEST_F(PlatformTest, CreateFromBackendUsesItAsIs) {
    auto mp = Platform::Create(std::make_unique<MemoryBackend>(MemoryBackend::Config{}), "raw");
    EXPECT_EQ("raw", mp->name());
    EXPECT_FALSE(mp->backend().CacheEnabled());
}

TEST_F(PlatformTest, CreateWithoutBackendRejected) {
    EXPECT_THROW(Platform::Create(std::unique_ptr<Backend>()), ValidationError);
}

TEST_F(PlatformTest, CreatedPlatformIsSharedOwned) {
    auto mp = Platform::Create("memory");
    EXPECT_EQ(mp, mp->shared_from_this());
    EXPECT_EQ(1, mp.use_count());
}

TEST_F(PlatformTest, FromConfig) {
    PlatformConfig config = PlatformConfig::Default();
    config.platforms["other"] = PlatformInfo{"memory", {{"cache", "false"}}};

    auto local = Platform::FromConfig(config);
    EXPECT_EQ("local", local->name());

    auto other = Platform::FromConfig(config, "other");
    EXPECT_EQ("other", other->name());
    EXPECT_FALSE(other->backend().CacheEnabled());

    EXPECT_THROW(Platform::FromConfig(config, "missing"), NotFoundError);
}

TEST_F(PlatformTest, LogLevel) {
    mp_->SetLogLevel(LogLevel::DEBUG);
    EXPECT_EQ(LogLevel::DEBUG, mp_->GetLogLevel());
}

// ============================================================================
// Registry Tests
// ============================================================================

TEST_F(PlatformTest, DefaultCodesAreSeeded) {
    auto units = mp_->Units();
    EXPECT_NE(units.end(), std::find(units.begin(), units.end(), "???"));

    auto regions = mp_->Regions();
    ASSERT_EQ(1u, regions.size());
    EXPECT_EQ("World", regions[0].region);

    auto slices = mp_->Timeslices();
    ASSERT_EQ(1u, slices.size());
    EXPECT_EQ((std::vector<std::string>{"Year", "Common", "1"}), slices[0].ToStrings());
}

TEST_F(PlatformTest, AddUnitIsIdempotent) {
    mp_->SetLogLevel(LogLevel::INFO);
    mp_->AddUnit("USD/km", "freight cost");
    mp_->AddUnit("USD/km");

    auto units = mp_->Units();
    EXPECT_EQ(1, std::count(units.begin(), units.end(), "USD/km"));
    EXPECT_NE(std::string::npos, log_.str().find("unit 'USD/km' is already defined"));
}

TEST_F(PlatformTest, AddRegionAndSynonym) {
    mp_->AddRegion("Austria", "country");
    mp_->AddRegionSynonym("AT", "Austria");

    auto regions = mp_->Regions();
    ASSERT_EQ(3u, regions.size());
    EXPECT_EQ((std::vector<std::string>{"Austria", "", "World", "country"}),
              regions[1].ToStrings());
    EXPECT_EQ("AT", regions[2].region);
    ASSERT_TRUE(regions[2].mapped_to.has_value());
    EXPECT_EQ("Austria", *regions[2].mapped_to);
}

TEST_F(PlatformTest, ExistingRegionIsLeftAsIs) {
    mp_->AddRegion("Austria", "country");
    mp_->AddRegion("Austria", "province", "Europe");

    auto regions = mp_->Regions();
    ASSERT_EQ(2u, regions.size());
    EXPECT_EQ("country", regions[1].hierarchy);
    EXPECT_NE(std::string::npos, log_.str().find("region 'Austria' is already defined"));
}

TEST_F(PlatformTest, SynonymOfUnknownRegionRejected) {
    EXPECT_THROW(mp_->AddRegionSynonym("XX", "Atlantis"), NotFoundError);
}

TEST_F(PlatformTest, AddTimeslice) {
    mp_->AddTimeslice("Summer", "Season", 0.25);
    mp_->AddTimeslice("Summer", "Season", 0.25);

    EXPECT_EQ(2u, mp_->Timeslices().size());
    EXPECT_THROW(mp_->AddTimeslice("Summer", "Season", 0.5), ValidationError);
}

// ============================================================================
// Scenario Listing Tests
// ============================================================================

TEST_F(PlatformTest, ScenarioListDefaultOnly) {
    CommitRun("m", "s", true);
    CommitRun("m", "s", false);
    CommitRun("m", "other", true);

    EXPECT_EQ(2u, mp_->ScenarioList().size());
    EXPECT_EQ(3u, mp_->ScenarioList(false).size());

    auto filtered = mp_->ScenarioList(false, std::string("m"), std::string("s"));
    ASSERT_EQ(2u, filtered.size());
    EXPECT_NE(filtered[0].version, filtered[1].version);
}

TEST_F(PlatformTest, ModelAndScenarioNames) {
    mp_->AddModelName("MESSAGE");
    mp_->AddScenarioName("baseline");
    CommitRun("GLOBIOM", "ssp2", true);

    auto models = mp_->GetModelNames();
    EXPECT_NE(models.end(), std::find(models.begin(), models.end(), "MESSAGE"));
    EXPECT_NE(models.end(), std::find(models.begin(), models.end(), "GLOBIOM"));

    auto scenarios = mp_->GetScenarioNames();
    EXPECT_NE(scenarios.end(), std::find(scenarios.begin(), scenarios.end(), "baseline"));
}

// ============================================================================
// Access Tests
// ============================================================================

TEST_F(PlatformTest, CheckAccessGrantsEverythingLocally) {
    auto access = mp_->CheckAccess("alice", std::vector<std::string>{"m1", "m2"}, "edit");
    EXPECT_EQ(2u, access.size());
    EXPECT_TRUE(access.at("m1"));
    EXPECT_TRUE(mp_->CheckAccess("alice", "m1"));
}

TEST_F(PlatformTest, CheckAccessRequiresModels) {
    EXPECT_THROW(mp_->CheckAccess("alice", std::vector<std::string>{}), ValidationError);
}

// ============================================================================
// Export Tests
// ============================================================================

TEST_F(PlatformTest, ExportTimeseriesData) {
    CommitRun("m", "s", true);
    CommitRun("m", "s", false);
    std::string path = GetTempPath(".csv");

    mp_->ExportTimeseriesData(path);

    auto lines = ReadLines(path);
    ASSERT_EQ(3u, lines.size());
    EXPECT_EQ("MODEL,SCENARIO,VERSION,VARIABLE,UNIT,REGION,META,SUBANNUAL,YEAR,VALUE", lines[0]);
    EXPECT_EQ("m,s,1,GDP,???,World,0,Year,2020,1", lines[1]);

    TimeseriesExportOptions all;
    all.export_all_runs = true;
    mp_->ExportTimeseriesData(path, all);
    EXPECT_EQ(5u, ReadLines(path).size());

    std::filesystem::remove(path);
}

TEST_F(PlatformTest, ExportFilters) {
    CommitRun("m", "s", true);
    std::string path = GetTempPath(".csv");

    TimeseriesExportOptions options;
    options.variables = {"Population"};
    mp_->ExportTimeseriesData(path, options);
    EXPECT_EQ(1u, ReadLines(path).size());

    std::filesystem::remove(path);
}

TEST_F(PlatformTest, ExportAllRunsExcludesModelFilter) {
    TimeseriesExportOptions options;
    options.export_all_runs = true;
    options.model = "m";
    EXPECT_THROW(mp_->ExportTimeseriesData(GetTempPath(".csv"), options), ValidationError);
}

TEST_F(PlatformTest, ExportToUnwritablePath) {
    EXPECT_THROW(mp_->ExportTimeseriesData("/nonexistent-directory/out.csv"), EngineError);
}

} // namespace
} // namespace modelstore
