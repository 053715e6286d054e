#include "natlib/mh/fa.hpp"
#include "natlib/core/ranking.hpp"

namespace natlib::mh {

    using namespace natlib::core;

    void Fa::generation(Context& ctx)
    {
        const std::size_t n = ctx.popNum();
        const std::vector<TIndividual> snapshot = ctx.population();

        std::vector<std::vector<double>> moved(n);
        for (std::size_t i = 0; i < n; i++)
        {
            std::vector<double> x = snapshot[i].x;
            bool attracted = false;

            for (std::size_t j = 0; j < n; j++)
            {
                if (j == i || Compare(snapshot[j].f, snapshot[i].f) != Order::Better) continue;
                attracted = true;

                // squared Euclidean distance
                double r = 0.0;
                for (std::size_t s = 0; s < ctx.dim(); s++) {
                    const double diff = x[s] - snapshot[j].x[s];
                    r += diff * diff;
                }

                const double beta = (BETA0 - s_.betaMin) * std::exp(-s_.gamma * r) + s_.betaMin;
                for (std::size_t s = 0; s < ctx.dim(); s++) {
                    const double noise = s_.alpha * ctx.bounds().width(s) * ctx.rng().randomico(-0.5, 0.5);
                    x[s] = ctx.clamp(s, x[s] + beta * (snapshot[j].x[s] - x[s]) + noise);
                }
            }

            // the brightest firefly walks randomly
            if (!attracted) {
                for (std::size_t s = 0; s < ctx.dim(); s++) {
                    const double noise = s_.alpha * ctx.bounds().width(s) * ctx.rng().randomico(-0.5, 0.5);
                    x[s] = ctx.clamp(s, x[s] + noise);
                }
            }
            moved[i] = std::move(x);
        }

        std::vector<TFitness> fit = ctx.evaluateAll(moved);

        for (std::size_t i = 0; i < n; i++) {
            if (Replaces(fit[i], ctx[i].f))
                ctx.assign(i, TIndividual(std::move(moved[i]), std::move(fit[i])));
        }
    }

} // namespace natlib::mh
