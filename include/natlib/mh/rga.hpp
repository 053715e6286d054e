#pragma once

#include "natlib/core/ialgorithm.hpp"

namespace natlib::mh {

    //--------------------------------------------------------------------------
    // Struct: TRgaSettings
    // Description: Operator rates of the real-coded genetic algorithm
    //--------------------------------------------------------------------------
    struct TRgaSettings
    {
        double cross = 0.95;                    // crossover probability of a parent pair
        double mutate = 0.05;                   // mutation probability of each gene
        double win = 0.95;                      // probability that the better parent wins a tournament
        double delta = 5.0;                     // decay exponent of the mutation step
        double horizon = 200.0;                 // generations over which the mutation step shrinks
    };

    /**
     * Method: Rga
     * Description: Real-coded Genetic Algorithm. Binary tournament, blend
     * crossover (BLX-0.5), non-uniform mutation and (mu + lambda) survivor
     * selection over parents and offspring.
     */
    class Rga : public core::IAlgorithm {
    public:
        Rga() = default;
        explicit Rga(const TRgaSettings& settings) : s_(settings) {}

        const char* name() const override { return "RGA"; }
        std::size_t defaultPopulation() const override { return 500; }

        void generation(core::Context& ctx) override;

        const TRgaSettings& settings() const { return s_; }

    private:
        std::size_t tournament(core::Context& ctx) const;
        void crossover(const std::vector<double>& a, const std::vector<double>& b,
                       std::vector<double>& c1, std::vector<double>& c2, core::Context& ctx) const;
        void mutation(std::vector<double>& x, core::Context& ctx) const;

        TRgaSettings s_;
    };

} // namespace natlib::mh
