#pragma once

#include "natlib/core/ialgorithm.hpp"

namespace natlib::mh {

    //--------------------------------------------------------------------------
    // Struct: TFaSettings
    // Description: Attraction and noise coefficients of the firefly algorithm
    //--------------------------------------------------------------------------
    struct TFaSettings
    {
        double alpha = 0.05;                    // noise scale, fraction of the bound width
        double betaMin = 0.2;                   // attraction at infinite distance
        double gamma = 1.0;                     // light absorption coefficient
    };

    /**
     * Method: Fa
     * Description: Firefly Algorithm. Every firefly moves toward each brighter
     * firefly of the generation snapshot, then the moved position is evaluated
     * once and kept if it replaces the old one. O(N^2) distance computations
     * per generation.
     */
    class Fa : public core::IAlgorithm {
    public:
        Fa() = default;
        explicit Fa(const TFaSettings& settings) : s_(settings) {}

        const char* name() const override { return "FA"; }
        std::size_t defaultPopulation() const override { return 80; }

        void generation(core::Context& ctx) override;

        const TFaSettings& settings() const { return s_; }

    private:
        static constexpr double BETA0 = 1.0;    // attraction at distance zero

        TFaSettings s_;
    };

} // namespace natlib::mh
