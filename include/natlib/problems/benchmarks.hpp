#pragma once

#include "natlib/core/iobjective.hpp"
#include "natlib/core/bounds.hpp"

namespace natlib::problems {

    //----------------- BENCHMARK OBJECTIVES -----------------------

    // sum of x_s^2, minimum 0 at the origin
    class Sphere : public core::IObjective {
        public:
            explicit Sphere(int dim) : dim_(dim) {}
            core::TFitness evaluate(const std::vector<double>& x) const override;
            int getDimension() const override { return dim_; }
        private:
            int dim_;
    };

    // 10 n + sum of (x_s^2 - 10 cos(2 pi x_s)), minimum 0 at the origin
    class Rastrigin : public core::IObjective {
        public:
            explicit Rastrigin(int dim) : dim_(dim) {}
            core::TFitness evaluate(const std::vector<double>& x) const override;
            int getDimension() const override { return dim_; }
        private:
            int dim_;
    };

    // 7 + x0^2 + 8 x1^2 + x2^2 + x3^2 over [0, 50]^4, minimum 7 on the lower bound
    class Shifted : public core::IObjective {
        public:
            static constexpr double OFFSET = 7.0;
            core::TFitness evaluate(const std::vector<double>& x) const override;
            int getDimension() const override { return 4; }
    };

    // Schaffer N.1, two objectives x^2 and (x - 2)^2; Pareto set [0, 2]
    class Schaffer : public core::IObjective {
        public:
            core::TFitness evaluate(const std::vector<double>& x) const override;
            int getDimension() const override { return 1; }
            int getObjectives() const override { return 2; }
    };

    //--------------------------------------------------------------------------
    // Struct: TBenchmark
    // Description: Objective together with its usual search box
    //--------------------------------------------------------------------------
    struct TBenchmark
    {
        std::shared_ptr<const core::IObjective> objective;
        core::Bounds bounds;
    };

    /**
     * Method: MakeBenchmark
     * Description: sphere, rastrigin, shifted or schaffer. `dim` is ignored by
     * the fixed-size problems. Throws ConfigurationError for unknown names.
     */
    TBenchmark MakeBenchmark(const std::string& name, int dim);

} // namespace natlib::problems
