#pragma once
#include "natlib/core/data.hpp"

namespace natlib::core {

    // Abstract interface of the function being minimized
    class IObjective {
        public:
            virtual ~IObjective() = default;

            // Must be a pure function of x for a seeded run to be reproducible.
            // A NaN component marks the result as invalid.
            virtual TFitness evaluate(const std::vector<double>& x) const = 0;

            // expected length of x
            virtual int getDimension() const = 0;

            // number of objectives, 1 for single-objective problems
            virtual int getObjectives() const { return 1; }
        };

    //--------------------------------------------------------------------------
    // Class: FunctionObjective
    // Description: Adapts a callable to IObjective
    //--------------------------------------------------------------------------
    class FunctionObjective : public IObjective {
        public:
            using Func = std::function<TFitness(const std::vector<double>&)>;

            FunctionObjective(int dim, Func func, int objectives = 1)
                : dim_(dim), objectives_(objectives), func_(std::move(func)) {}

            TFitness evaluate(const std::vector<double>& x) const override { return func_(x); }
            int getDimension() const override { return dim_; }
            int getObjectives() const override { return objectives_; }

        private:
            int dim_;
            int objectives_;
            Func func_;
        };

}
