#pragma once

#include "natlib/core/ialgorithm.hpp"

namespace natlib::mh {

    // mutation schemes: base vector / number of difference vectors
    enum class DeStrategy { Best1, Rand1, CurrentToBest1, Best2, Rand2 };

    enum class DeCrossover { Binomial, Exponential };

    //--------------------------------------------------------------------------
    // Struct: TDeSettings
    // Description: Parameters of differential evolution
    //--------------------------------------------------------------------------
    struct TDeSettings
    {
        DeStrategy strategy = DeStrategy::Rand1;
        DeCrossover crossover = DeCrossover::Binomial;
        double f = 0.6;                         // weight of the difference vectors
        double cr = 0.9;                        // crossover rate
    };

    // parse the names used in configuration files ("Rand1", "binomial", ...)
    DeStrategy ParseDeStrategy(const std::string& name);
    DeCrossover ParseDeCrossover(const std::string& name);

    /**
     * Method: De
     * Description: Differential Evolution. One trial vector per target,
     * greedy one-to-one replacement.
     */
    class De : public core::IAlgorithm {
    public:
        De() = default;
        explicit De(const TDeSettings& settings) : s_(settings) {}

        const char* name() const override { return "DE"; }
        std::size_t minPopulation() const override { return donors() + 1; }
        std::size_t defaultPopulation() const override { return 400; }

        void generation(core::Context& ctx) override;

        // distinct population members drawn for one mutant, target excluded
        std::size_t donors() const;

        const TDeSettings& settings() const { return s_; }

    private:
        std::vector<double> mutant(std::size_t i, const std::vector<double>& best, core::Context& ctx) const;
        void recombine(const std::vector<double>& target, std::vector<double>& trial, core::Context& ctx) const;

        TDeSettings s_;
    };

} // namespace natlib::mh
