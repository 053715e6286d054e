#pragma once

#include "natlib/core/ialgorithm.hpp"

namespace natlib::mh {

    /**
     * Method: Tlbo
     * Description: Teaching-Learning-Based Optimization. No operator
     * parameters besides the population size.
     *  - teacher phase: x + r * (teacher - TF * mean), TF in {1, 2}
     *  - learner phase: x + r * (peer - x), only toward a Better peer
     * Both phases use greedy replacement.
     */
    class Tlbo : public core::IAlgorithm {
    public:
        const char* name() const override { return "TLBO"; }
        std::size_t defaultPopulation() const override { return 200; }

        void generation(core::Context& ctx) override;

    private:
        void teacherPhase(core::Context& ctx);
        void learnerPhase(core::Context& ctx);
    };

} // namespace natlib::mh
