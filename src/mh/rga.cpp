#include "natlib/mh/rga.hpp"
#include "natlib/core/ranking.hpp"

namespace natlib::mh {

    using namespace natlib::core;

    // smallest decay of the mutation step, reached at the horizon and kept after it
    static constexpr double MIN_DECAY = 0.02;

    // -------------------------------------------------------------------------
    // Selection: binary tournament
    // -------------------------------------------------------------------------
    std::size_t Rga::tournament(Context& ctx) const
    {
        std::size_t better = ctx.rng().index(ctx.popNum());
        std::size_t worse = ctx.rng().index(ctx.popNum());

        const Order o = Compare(ctx[worse].f, ctx[better].f);
        if (o == Order::Better || (o == Order::Incomparable && ctx.rng().maybe(0.5)))
            std::swap(better, worse);

        return ctx.rng().maybe(s_.win) ? better : worse;
    }

    // -------------------------------------------------------------------------
    // Crossover: BLX-0.5, each child drawn in the parents' box widened by half
    // its length on both sides
    // -------------------------------------------------------------------------
    void Rga::crossover(const std::vector<double>& a, const std::vector<double>& b,
                        std::vector<double>& c1, std::vector<double>& c2, Context& ctx) const
    {
        for (std::size_t s = 0; s < ctx.dim(); s++)
        {
            const double lo = std::min(a[s], b[s]);
            const double hi = std::max(a[s], b[s]);
            const double d = 0.5 * (hi - lo);

            c1[s] = ctx.clamp(s, ctx.rng().randomico(lo - d, hi + d));
            c2[s] = ctx.clamp(s, ctx.rng().randomico(lo - d, hi + d));
        }
    }

    // -------------------------------------------------------------------------
    // Mutation: non-uniform (Michalewicz), the step toward a bound shrinks
    // with the generation counter down to a floor
    // -------------------------------------------------------------------------
    void Rga::mutation(std::vector<double>& x, Context& ctx) const
    {
        const double t = std::min(static_cast<double>(ctx.gen()) / s_.horizon, 1.0);
        const double decay = std::max(std::pow(1.0 - t, s_.delta), MIN_DECAY);

        for (std::size_t s = 0; s < ctx.dim(); s++)
        {
            if (!ctx.rng().maybe(s_.mutate)) continue;

            const double step = 1.0 - std::pow(ctx.rng().randomico(0.0, 1.0), decay);
            if (ctx.rng().maybe(0.5))
                x[s] += (ctx.ub(s) - x[s]) * step;
            else
                x[s] -= (x[s] - ctx.lb(s)) * step;

            x[s] = ctx.clamp(s, x[s]);
        }
    }

    void Rga::generation(Context& ctx)
    {
        const std::size_t n = ctx.popNum();

        std::vector<std::vector<double>> offspring;
        offspring.reserve(n);

        while (offspring.size() < n)
        {
            const std::vector<double>& a = ctx[tournament(ctx)].x;
            const std::vector<double>& b = ctx[tournament(ctx)].x;

            std::vector<double> c1 = a;
            std::vector<double> c2 = b;
            if (ctx.rng().maybe(s_.cross))
                crossover(a, b, c1, c2, ctx);

            mutation(c1, ctx);
            mutation(c2, ctx);

            offspring.push_back(std::move(c1));
            if (offspring.size() < n)
                offspring.push_back(std::move(c2));
        }

        // (mu + lambda): the best individual always survives
        std::vector<TIndividual> pool = ctx.population();
        std::vector<TIndividual> children = ctx.makeIndividuals(std::move(offspring));
        pool.insert(pool.end(), std::make_move_iterator(children.begin()), std::make_move_iterator(children.end()));

        SelectSurvivors(pool, n);
        ctx.setPopulation(std::move(pool));
    }

} // namespace natlib::mh
