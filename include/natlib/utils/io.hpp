#pragma once

#include "natlib/core/solver.hpp"

namespace natlib::utils {

    /**
     * Outputs the best solution (or the Pareto front) and the run statistics
     * to the screen.
     */
    void WriteReportScreen(const natlib::Report &report, const std::string &algorithm, const std::string &problem);

    /**
     * Outputs the archive best of every generation in a csv file
     * (columns: gen;best). Throws std::runtime_error if the file cannot be opened.
     */
    void WriteHistoryCsv(const natlib::Report &report, const std::string &path);

} // namespace natlib::utils
