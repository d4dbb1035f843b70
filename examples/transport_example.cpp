// File: examples/transport_example.cpp
//
// Transport problem example using ModelStore.
// Demonstrates:
// - Creating a Platform from a YAML configuration (or the default one)
// - Defining sets, parameters and variables of a Scenario
// - Storing a solution the way a solver run would
// - Cloning a Scenario for a sensitivity run
// - Exporting time series to CSV

#include "core/scenario.hpp"
#include "core/errors.hpp"
#include <iomanip>
#include <iostream>

using namespace modelstore;

/// Print one item as a small table
void PrintItem(const std::string& name, const ItemData& data) {
    std::cout << "  " << name << ":\n";
    auto columns = data.ColumnNames();
    std::cout << "   ";
    for (const auto& column : columns) {
        std::cout << " " << std::setw(10) << column;
    }
    std::cout << "\n";
    for (const auto& row : data.rows()) {
        std::cout << "   ";
        for (const auto& label : row.key) {
            std::cout << " " << std::setw(10) << label;
        }
        if (data.shape() == ItemShape::PAR_TABLE || data.shape() == ItemShape::SCALAR_PAR) {
            std::cout << " " << std::setw(10) << FormatNumber(row.value) << " " << std::setw(10)
                      << row.unit;
        } else if (data.shape() == ItemShape::SOLUTION_TABLE ||
                   data.shape() == ItemShape::SCALAR_SOLUTION) {
            std::cout << " " << std::setw(10) << FormatNumber(row.level) << " " << std::setw(10)
                      << FormatNumber(row.marginal);
        }
        std::cout << "\n";
    }
}

int main(int argc, char** argv) {
    std::cout << "=== ModelStore Transport Problem Example ===\n\n";

    // Step 1: Create the Platform
    std::cout << "Step 1: Creating Platform...\n";

    PlatformConfig config = PlatformConfig::Default();
    if (argc > 1) {
        auto loaded = PlatformConfig::LoadFromFile(argv[1]);
        if (!loaded) {
            std::cerr << "Cannot use configuration " << argv[1] << "\n";
            return 1;
        }
        config = *loaded;
    }

    try {
        auto mp = Platform::FromConfig(config);
        mp->AddUnit("cases");
        mp->AddUnit("km");
        mp->AddUnit("USD/km");
        mp->AddUnit("USD");
        std::cout << "  Platform '" << mp->name() << "' ready\n\n";

        // Step 2: Define the model data
        std::cout << "Step 2: Defining the transport problem...\n";

        Scenario scen(mp, "canning problem", "standard", Version::New(), "transport",
                      "Dantzig's transportation problem");

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
        scen.InitVar("x", {"i", "j"});
        scen.InitVar("z");

        scen.Commit("import transport data");
        scen.SetAsDefault();
        std::cout << "  Committed " << scen.Url() << "\n\n";

        // Step 3: Store a solution
        std::cout << "Step 3: Storing the solution...\n";

        scen.Transact("solution", [&]() {
            scen.SetSolution(ItemType::VAR, "x",
                             {SolutionElement{Key{"seattle", "new-york"}, 50.0, 0.0},
                              SolutionElement{Key{"seattle", "chicago"}, 300.0, 0.0},
                              SolutionElement{Key{"san-diego", "new-york"}, 275.0, 0.0},
                              SolutionElement{Key{"san-diego", "topeka"}, 275.0, 0.0}});
            scen.SetSolution(ItemType::VAR, "z", {SolutionElement{std::nullopt, 153.675, 0.0}});
            scen.AddTimeseries("World", "Cost", "USD", {{2020, 153.675}});
        }, true, true);

        PrintItem("d", scen.Par("d"));
        PrintItem("x", scen.Var("x"));
        std::cout << "  Total cost: " << FormatNumber(scen.Var("z").Level()) << "\n\n";

        // Step 4: Clone for a sensitivity run
        std::cout << "Step 4: Cloning with higher freight cost...\n";

        CloneOptions options;
        options.scenario = "high freight";
        options.annotation = "f = 120";
        options.keep_solution = false;
        auto variant = scen.Clone(options);
        variant->Transact("raise freight cost", [&]() {
            variant->ChangeScalar("f", 120.0, "USD/km");
        });
        std::cout << "  Committed " << variant->Url() << "\n\n";

        // Step 5: List and export
        std::cout << "Step 5: Stored scenarios...\n";
        for (const auto& info : mp->ScenarioList(false)) {
            std::cout << "  " << info.model << "/" << info.scenario << "#" << info.version
                      << (info.is_default ? " (default)" : "") << "\n";
        }

        mp->ExportTimeseriesData("transport_timeseries.csv");
        std::cout << "  Time series written to transport_timeseries.csv\n";
    } catch (const ModelStoreError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "\n=== Example Complete ===\n";
    return 0;
}
