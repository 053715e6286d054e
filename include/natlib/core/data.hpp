#pragma once

#include "natlib/core/common.hpp"

namespace natlib::core {

    //--------------------------------------------------------------------------
    // Struct: TFitness
    // Description: Result of one objective evaluation. A single-objective
    // problem stores one value, a multi-objective problem one value per
    // objective. The product is an opaque payload the objective may attach.
    //--------------------------------------------------------------------------
    struct TFitness
    {
        std::vector<double> ofv;                // objective function value(s)
        std::any product;                       // extra artifacts kept with the score

        TFitness() = default;
        TFitness(double value) : ofv{value} {}
        TFitness(std::vector<double> values) : ofv(std::move(values)) {}
        TFitness(std::vector<double> values, std::any payload)
            : ofv(std::move(values)), product(std::move(payload)) {}

        std::size_t arity() const { return ofv.size(); }

        // empty or NaN results are demoted below every valid value
        bool isValid() const {
            return !ofv.empty() && std::ranges::none_of(ofv, [](double v) { return std::isnan(v); });
        }

        // scalar view: the value itself, or the sum of objectives
        double eval() const {
            if (!isValid()) return INF;
            return std::accumulate(ofv.begin(), ofv.end(), 0.0);
        }

        // bit-exact equality of the scores, the product is not compared
        friend bool operator==(const TFitness &lhs, const TFitness &rhs) {
            return lhs.ofv == rhs.ofv;
        }
    };

    //--------------------------------------------------------------------------
    // Struct: TIndividual
    // Description: One candidate, its parameter vector and its fitness
    //--------------------------------------------------------------------------
    struct TIndividual
    {
        std::vector<double> x;                  // design parameters
        TFitness f;                             // fitness computed by one evaluate call

        TIndividual() = default;
        TIndividual(std::vector<double> xs, TFitness fit) : x(std::move(xs)), f(std::move(fit)) {}
    };

    //--------------------------------------------------------------------------
    // Struct: TRunData
    // Description: Configuration variables for the search process
    //--------------------------------------------------------------------------
    struct TRunData
    {
        std::size_t popNum = 0;                 // population size (0 = algorithm default)
        std::size_t paretoLimit = 20;           // maximum size of the Pareto front
        std::uint64_t seed = 0;                 // seed of the random stream
        bool hasSeed = false;                   // false = draw the seed from std::random_device
        bool parallel = false;                  // evaluate batches with OpenMP
        int debug = 0;                          // 0 silent, 1 progress, 2 also invalid fitness notices
    };

} // namespace natlib::core
