#pragma once

#include "natlib/core/ialgorithm.hpp"

namespace natlib::mh {

    //--------------------------------------------------------------------------
    // Struct: TPsoSettings
    // Description: Coefficients of the velocity update
    //--------------------------------------------------------------------------
    struct TPsoSettings
    {
        double cognition = 2.05;                // attraction to the personal best
        double social = 2.05;                   // attraction to the global leader
        double velocity = 0.4;                  // inertia weight
        double vmax = 0.2;                      // velocity limit, fraction of the bound width
    };

    //--------------------------------------------------------------------------
    // Struct: TParticle
    // Description: Per-particle state kept beside the population slot
    //--------------------------------------------------------------------------
    struct TParticle
    {
        std::vector<double> v;                  // velocity
        core::TIndividual pbest;                // best position visited by the particle
    };

    /**
     * Method: Pso
     * Description: Particle Swarm Optimization. The global leader is drawn
     * from the elite archive, a random front member for multi-objective runs.
     */
    class Pso : public core::IAlgorithm {
    public:
        Pso() = default;
        explicit Pso(const TPsoSettings& settings) : s_(settings) {}

        const char* name() const override { return "PSO"; }
        std::size_t defaultPopulation() const override { return 200; }

        void init(core::Context& ctx) override;
        void generation(core::Context& ctx) override;

        const TPsoSettings& settings() const { return s_; }
        const std::vector<TParticle>& particles() const { return particles_; }

    private:
        TPsoSettings s_;
        std::vector<TParticle> particles_;
    };

} // namespace natlib::mh
