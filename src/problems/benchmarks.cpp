#include "natlib/problems/benchmarks.hpp"
#include "natlib/core/errors.hpp"

#include <numbers>

namespace natlib::problems {

    using namespace natlib::core;

    TFitness Sphere::evaluate(const std::vector<double>& x) const
    {
        double sum = 0.0;
        for (double v : x) sum += v * v;
        return sum;
    }

    TFitness Rastrigin::evaluate(const std::vector<double>& x) const
    {
        double sum = 10.0 * static_cast<double>(x.size());
        for (double v : x) sum += v * v - 10.0 * std::cos(2.0 * std::numbers::pi * v);
        return sum;
    }

    TFitness Shifted::evaluate(const std::vector<double>& x) const
    {
        return OFFSET + x[0] * x[0] + 8.0 * x[1] * x[1] + x[2] * x[2] + x[3] * x[3];
    }

    TFitness Schaffer::evaluate(const std::vector<double>& x) const
    {
        return std::vector<double>{x[0] * x[0], (x[0] - 2.0) * (x[0] - 2.0)};
    }

    TBenchmark MakeBenchmark(const std::string& name, int dim)
    {
        if (name == "sphere" || name == "rastrigin") {
            if (dim < 1) throw ConfigurationError(std::format("{}: dimension must be at least 1, got {}", name, dim));

            if (name == "sphere")
                return {std::make_shared<Sphere>(dim), Bounds::uniform(static_cast<std::size_t>(dim), -10.0, 10.0)};
            return {std::make_shared<Rastrigin>(dim), Bounds::uniform(static_cast<std::size_t>(dim), -5.12, 5.12)};
        }

        if (name == "shifted") return {std::make_shared<Shifted>(), Bounds::uniform(4, 0.0, 50.0)};
        if (name == "schaffer") return {std::make_shared<Schaffer>(), Bounds::uniform(1, -10.0, 10.0)};

        throw ConfigurationError(std::format("Unknown problem '{}'", name));
    }

} // namespace natlib::problems
