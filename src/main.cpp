/**
 * natlib - Command Line Entry Point
 * Runs one algorithm variant on a benchmark problem
 */

// CLI
#include <CLI/CLI.hpp>

#include "natlib/core/solver.hpp"
#include "natlib/problems/benchmarks.hpp"
#include "natlib/utils/config.hpp"
#include "natlib/utils/io.hpp"

int main(int argc, char *argv[])
{
    // -------------------------------------------------------------------------
    // 1. CLI11 SETUP
    // -------------------------------------------------------------------------
    CLI::App app{"natlib - Nature-inspired optimization"};

    std::string problemName = "sphere";
    int dim = 10;
    std::string configPath;
    std::string algorithm;
    std::uint64_t maxGen = 0;
    std::uint64_t seed = 0;
    std::string csvPath;

    app.add_option("-p,--problem", problemName, "Benchmark problem")
       ->check(CLI::IsMember({"sphere", "rastrigin", "shifted", "schaffer"}));

    app.add_option("-d,--dim", dim, "Number of variables (sphere, rastrigin)")
       ->check(CLI::PositiveNumber);

    app.add_option("-c,--config", configPath, "Path to the YAML run file")
       ->check(CLI::ExistingFile);

    CLI::Option *algoOpt = app.add_option("-a,--algorithm", algorithm, "RGA | DE | PSO | FA | TLBO (overrides the run file)");
    CLI::Option *gensOpt = app.add_option("-g,--gens", maxGen, "Number of generations (overrides the run file)");
    CLI::Option *seedOpt = app.add_option("-s,--seed", seed, "Random seed (overrides the run file)");

    app.add_option("--csv", csvPath, "Write the per-generation best values to a csv file");

    CLI11_PARSE(app, argc, argv);

    // -------------------------------------------------------------------------
    // 2. RUN
    // -------------------------------------------------------------------------
    try {
        natlib::utils::TRunConfig cfg;
        if (!configPath.empty()) cfg = natlib::utils::LoadRunConfig(configPath);

        if (algoOpt->count() > 0) cfg.algorithm = algorithm;
        if (gensOpt->count() > 0) cfg.maxGen = maxGen;
        if (seedOpt->count() > 0) {
            cfg.runData.seed = seed;
            cfg.runData.hasSeed = true;
        }

        natlib::problems::TBenchmark bench = natlib::problems::MakeBenchmark(problemName, dim);
        std::unique_ptr<natlib::core::IAlgorithm> method = natlib::utils::CreateAlgorithm(cfg);
        const std::string methodName = method->name();

        natlib::Report report = natlib::Solver::build(std::move(method), bench.objective, bench.bounds)
                                    .runData(cfg.runData)
                                    .task(natlib::core::task::MaxGen(cfg.maxGen))
                                    .solve();

        natlib::utils::WriteReportScreen(report, methodName, problemName);

        if (!csvPath.empty()) natlib::utils::WriteHistoryCsv(report, csvPath);
    }
    catch (const natlib::ConfigurationError &e) {
        std::cerr << "\nERROR (configuration): " << e.what() << "\n";
        return 2;
    }
    catch (const std::exception &e) {
        std::cerr << "\nERROR: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
