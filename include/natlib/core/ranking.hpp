#pragma once

#include "natlib/core/data.hpp"

namespace natlib::core {

    enum class Order { Better, Worse, Incomparable };

    // -----------------------------------------------------------------------------
    // Pairwise comparison
    // -----------------------------------------------------------------------------

    /**
     * Method: Compare
     * Description: Orders two fitness values for minimization.
     * Single-objective: scalar order, equal values are Incomparable so the
     * incumbent is kept. Multi-objective: Pareto dominance.
     * An invalid fitness is Worse than any valid one.
     */
    Order Compare(const TFitness &a, const TFitness &b);

    /**
     * Method: Dominates
     * Description: true iff a is no worse than b in every objective and
     * strictly better in at least one. False when either side is invalid.
     */
    bool Dominates(const TFitness &a, const TFitness &b);

    // Greedy replacement rule: Better, or Incomparable between two valid
    // multi-objective values
    bool Replaces(const TFitness &candidate, const TFitness &incumbent);

    // Strict weak ordering on the first objective, invalid values last
    bool sortByFitness(const TIndividual &lhs, const TIndividual &rhs);

    // -----------------------------------------------------------------------------
    // Set operations
    // -----------------------------------------------------------------------------

    // indices of the valid members not dominated by any other member
    std::vector<std::size_t> NonDominated(const std::vector<TIndividual> &set);

    // successive non-dominated fronts; invalid members form the last front
    std::vector<std::vector<std::size_t>> NonDominatedSort(const std::vector<TIndividual> &set);

    /**
     * Method: CrowdingDistance
     * Description: Crowding distance of set[idx[k]] for every k. Boundary
     * members of each objective get +inf, interior members add the normalized
     * gap between their two neighbours.
     */
    std::vector<double> CrowdingDistance(const std::vector<TIndividual> &set, const std::vector<std::size_t> &idx);

    /**
     * Method: SelectSurvivors
     * Description: Reduces the set to n members. Single-objective keeps the n
     * best (stable). Multi-objective admits whole fronts and cuts the last one
     * by descending crowding distance.
     */
    void SelectSurvivors(std::vector<TIndividual> &set, std::size_t n);

    // drops the most crowded member until `limit` remain
    void TruncateFront(std::vector<TIndividual> &front, std::size_t limit);

} // namespace natlib::core
