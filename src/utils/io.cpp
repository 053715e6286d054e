#include "natlib/utils/io.hpp"

#include <cstdio>

namespace natlib::utils {

    void WriteReportScreen(const natlib::Report &report, const std::string &algorithm, const std::string &problem)
    {
        printf("\n\nnatlib: %s \nProblem: %s \n", algorithm.c_str(), problem.c_str());

        if (report.front().size() > 1 || report.bestFitness().arity() > 1) {
            // print Pareto front
            printf("\nPareto front (%zu points):\n", report.front().size());
            for (const auto &ind : report.front()) {
                printf("x: ");
                for (double v : ind.x) printf("%.5lf ", v);
                printf("| f: ");
                for (double v : ind.f.ofv) printf("%.5lf ", v);
                printf("\n");
            }
        } else {
            printf("sol: ");
            for (double v : report.bestParameters()) printf("%.5lf ", v);
            printf("\nofv: %.10lf", report.bestFitness().eval());
        }

        printf("\nGenerations: %llu", static_cast<unsigned long long>(report.gen()));
        printf("\nEvaluations: %zu", report.evaluations());
        printf("\nSeed: %llu", static_cast<unsigned long long>(report.seed()));
        printf("\nTotal time: %.3f\n\n", report.time());
    }

    void WriteHistoryCsv(const natlib::Report &report, const std::string &path)
    {
        // file to write the convergence history
        FILE *csvFile = fopen(path.c_str(), "w");
        if (!csvFile)
            throw std::runtime_error(std::format("Unable to open {} for writing", path));

        fprintf(csvFile, "gen;best\n");

        const std::vector<double> &history = report.context().bestHistory();
        for (std::size_t g = 0; g < history.size(); g++)
            fprintf(csvFile, "%zu;%.10lf\n", g, history[g]);

        fclose(csvFile);
    }

} // namespace natlib::utils
