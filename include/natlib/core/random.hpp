#pragma once

#include "natlib/core/common.hpp"

namespace natlib::core {

    //--------------------------------------------------------------------------
    // Class: Rng
    // Description: Seedable random stream owned by one run. Two streams built
    // from the same seed produce the same sequence of draws.
    //--------------------------------------------------------------------------
    class Rng {
    public:
        explicit Rng(std::uint64_t seed) : seed_(seed), engine_(seed) {}

        // seed drawn from std::random_device
        static std::uint64_t randomSeed();

        std::uint64_t seed() const { return seed_; }

        // real value in [min, max)
        double randomico(double min, double max);

        // integer value in [min, max]
        int irandomico(int min, int max);

        // index in [0, n)
        std::size_t index(std::size_t n);

        // true with probability p
        bool maybe(double p) { return randomico(0.0, 1.0) < p; }

        double normal(double mean, double stddev);

        // k distinct indices in [0, n), none equal to any value in `exclude`
        std::vector<std::size_t> distinct(std::size_t k, std::size_t n, const std::vector<std::size_t>& exclude = {});

        template<class T>
        void shuffle(std::vector<T>& v) { std::shuffle(v.begin(), v.end(), engine_); }

    private:
        std::uint64_t seed_;
        std::mt19937_64 engine_;
    };

} // namespace natlib::core
