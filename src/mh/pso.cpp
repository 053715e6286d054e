#include "natlib/mh/pso.hpp"
#include "natlib/core/ranking.hpp"

namespace natlib::mh {

    using namespace natlib::core;

    void Pso::init(Context& ctx)
    {
        particles_.assign(ctx.popNum(), TParticle{});

        // random initial velocity inside the velocity limit, personal best = start position
        for (std::size_t i = 0; i < ctx.popNum(); i++)
        {
            TParticle& p = particles_[i];
            p.v.resize(ctx.dim());
            for (std::size_t s = 0; s < ctx.dim(); s++) {
                const double vlim = s_.vmax * ctx.bounds().width(s);
                p.v[s] = ctx.rng().randomico(-vlim, vlim);
            }
            p.pbest = ctx[i];
        }
    }

    void Pso::generation(Context& ctx)
    {
        const std::size_t n = ctx.popNum();
        const double c1 = s_.cognition;
        const double c2 = s_.social;
        const double w = s_.velocity;

        std::vector<std::vector<double>> X(n);
        for (std::size_t i = 0; i < n; i++)
        {
            TParticle& p = particles_[i];
            const TIndividual& leader = ctx.best().sample(ctx.rng());

            X[i] = ctx[i].x;
            for (std::size_t s = 0; s < ctx.dim(); s++)
            {
                const double r1 = ctx.rng().randomico(0, 1);
                const double r2 = ctx.rng().randomico(0, 1);
                const double vlim = s_.vmax * ctx.bounds().width(s);

                // update v[i][s]
                p.v[s] = w * p.v[s] + c1 * r1 * (p.pbest.x[s] - X[i][s]) + c2 * r2 * (leader.x[s] - X[i][s]);
                p.v[s] = std::clamp(p.v[s], -vlim, vlim);

                // update X[i][s]; a particle leaving the box stops on the bound
                const double pos = X[i][s] + p.v[s];
                if (pos < ctx.lb(s) || pos > ctx.ub(s)) {
                    X[i][s] = ctx.clamp(s, pos);
                    p.v[s] = 0;
                } else {
                    X[i][s] = pos;
                }
            }
        }

        std::vector<TFitness> fit = ctx.evaluateAll(X);

        for (std::size_t i = 0; i < n; i++)
        {
            TIndividual ind(std::move(X[i]), std::move(fit[i]));

            // update Pbest
            if (Replaces(ind.f, particles_[i].pbest.f))
                particles_[i].pbest = ind;

            ctx.assign(i, std::move(ind));
        }
    }

} // namespace natlib::mh
