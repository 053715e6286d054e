#pragma once

#include "natlib/core/bounds.hpp"
#include "natlib/core/random.hpp"

namespace natlib::core {

    /**
     * Generator of one coordinate of the initial population:
     * (dimension index, lower bound, upper bound, random stream) -> value
     */
    using PoolFunc = std::function<double(std::size_t, double, double, Rng&)>;

    // validity filter used for rejection sampling of the initial population
    using PoolFilter = std::function<bool(const std::vector<double>&)>;

    // -----------------------------------------------------------------------------
    // Initial population generators
    // -----------------------------------------------------------------------------

    // uniform over each dimension's bounds (default)
    PoolFunc UniformPool();

    /**
     * Method: GaussianPool
     * Description: Normal distribution per dimension. The values are clipped to
     * the bounds when the population is built. `mean` and `stddev` must have
     * the same length as the bounds.
     */
    PoolFunc GaussianPool(std::vector<double> mean, std::vector<double> stddev);

    // n points drawn with `func`, clipped to the bounds
    std::vector<std::vector<double>> CreatePoolSolutions(const Bounds &bounds, std::size_t n,
                                                         const PoolFunc &func, Rng &rng);

    // n uniform points accepted by `filter`; throws ConfigurationError after maxTries draws
    std::vector<std::vector<double>> CreatePoolSolutionsBy(const Bounds &bounds, std::size_t n,
                                                           const PoolFilter &filter, Rng &rng,
                                                           std::size_t maxTries);

} // namespace natlib::core
