#include "natlib/core/random.hpp"

namespace natlib::core {

    std::uint64_t Rng::randomSeed()
    {
        std::random_device rd;
        return (static_cast<std::uint64_t>(rd()) << 32) | rd();
    }

    double Rng::randomico(double min, double max)
    {
        if (min == max) return min;
        return std::uniform_real_distribution<double>(min, max)(engine_);
    }

    int Rng::irandomico(int min, int max)
    {
        return std::uniform_int_distribution<int>(min, max)(engine_);
    }

    std::size_t Rng::index(std::size_t n)
    {
        return std::uniform_int_distribution<std::size_t>(0, n - 1)(engine_);
    }

    double Rng::normal(double mean, double stddev)
    {
        if (stddev <= 0.0) return mean;
        return std::normal_distribution<double>(mean, stddev)(engine_);
    }

    std::vector<std::size_t> Rng::distinct(std::size_t k, std::size_t n, const std::vector<std::size_t>& exclude)
    {
        std::vector<std::size_t> chosen;
        chosen.reserve(k);

        auto taken = [&](std::size_t i) {
            return std::ranges::find(chosen, i) != chosen.end() ||
                   std::ranges::find(exclude, i) != exclude.end();
        };

        // callers guarantee n >= k + exclude.size()
        while (chosen.size() < k) {
            std::size_t i = index(n);
            if (!taken(i)) chosen.push_back(i);
        }
        return chosen;
    }

} // namespace natlib::core
