#include "natlib/core/pool.hpp"
#include "natlib/core/errors.hpp"

namespace natlib::core {

    PoolFunc UniformPool()
    {
        return [](std::size_t, double lb, double ub, Rng &rng) { return rng.randomico(lb, ub); };
    }

    PoolFunc GaussianPool(std::vector<double> mean, std::vector<double> stddev)
    {
        if (mean.size() != stddev.size()) {
            throw ConfigurationError(std::format("GaussianPool: {} means but {} standard deviations",
                                                 mean.size(), stddev.size()));
        }

        return [mean = std::move(mean), stddev = std::move(stddev)](std::size_t s, double, double, Rng &rng) {
            return rng.normal(mean.at(s), stddev.at(s));
        };
    }

    std::vector<std::vector<double>> CreatePoolSolutions(const Bounds &bounds, std::size_t n,
                                                         const PoolFunc &func, Rng &rng)
    {
        std::vector<std::vector<double>> pool(n, std::vector<double>(bounds.size()));

        for (auto &x : pool) {
            for (std::size_t s = 0; s < bounds.size(); s++)
                x[s] = bounds.clamp(s, func(s, bounds.lb(s), bounds.ub(s), rng));
        }
        return pool;
    }

    std::vector<std::vector<double>> CreatePoolSolutionsBy(const Bounds &bounds, std::size_t n,
                                                           const PoolFilter &filter, Rng &rng,
                                                           std::size_t maxTries)
    {
        std::vector<std::vector<double>> pool;
        pool.reserve(n);

        const PoolFunc uniform = UniformPool();
        std::vector<double> x(bounds.size());

        for (std::size_t tries = 0; pool.size() < n; tries++) {
            if (tries >= maxTries) {
                throw ConfigurationError(std::format("Initial pool: only {} of {} points passed the filter after {} draws",
                                                     pool.size(), n, maxTries));
            }

            for (std::size_t s = 0; s < bounds.size(); s++)
                x[s] = uniform(s, bounds.lb(s), bounds.ub(s), rng);

            if (filter(x)) pool.push_back(x);
        }
        return pool;
    }

} // namespace natlib::core
