#include "natlib/mh/tlbo.hpp"
#include "natlib/core/ranking.hpp"

namespace natlib::mh {

    using namespace natlib::core;

    // -------------------------------------------------------------------------
    // Teacher phase: shift every learner toward the teacher and away from the
    // class mean
    // -------------------------------------------------------------------------
    void Tlbo::teacherPhase(Context& ctx)
    {
        const std::size_t n = ctx.popNum();
        const std::vector<double> teacher = ctx.best().sample(ctx.rng()).x;

        std::vector<double> mean(ctx.dim(), 0.0);
        for (const auto& ind : ctx.population()) {
            for (std::size_t s = 0; s < ctx.dim(); s++) mean[s] += ind.x[s];
        }
        for (double& m : mean) m /= static_cast<double>(n);

        std::vector<std::vector<double>> X(n);
        for (std::size_t i = 0; i < n; i++)
        {
            const int tf = ctx.rng().irandomico(1, 2);      // teaching factor
            X[i] = ctx[i].x;
            for (std::size_t s = 0; s < ctx.dim(); s++) {
                const double r = ctx.rng().randomico(0, 1);
                X[i][s] = ctx.clamp(s, X[i][s] + r * (teacher[s] - tf * mean[s]));
            }
        }

        std::vector<TFitness> fit = ctx.evaluateAll(X);
        for (std::size_t i = 0; i < n; i++) {
            if (Replaces(fit[i], ctx[i].f))
                ctx.assign(i, TIndividual(std::move(X[i]), std::move(fit[i])));
        }
    }

    // -------------------------------------------------------------------------
    // Learner phase: a learner only learns from a Better peer, otherwise it
    // produces no candidate
    // -------------------------------------------------------------------------
    void Tlbo::learnerPhase(Context& ctx)
    {
        const std::size_t n = ctx.popNum();

        std::vector<std::size_t> learners;
        std::vector<std::vector<double>> X;

        for (std::size_t i = 0; i < n; i++)
        {
            const std::size_t j = ctx.rng().distinct(1, n, {i}).front();
            if (Compare(ctx[j].f, ctx[i].f) != Order::Better) continue;

            std::vector<double> x = ctx[i].x;
            for (std::size_t s = 0; s < ctx.dim(); s++) {
                const double r = ctx.rng().randomico(0, 1);
                x[s] = ctx.clamp(s, x[s] + r * (ctx[j].x[s] - x[s]));
            }
            learners.push_back(i);
            X.push_back(std::move(x));
        }

        std::vector<TFitness> fit = ctx.evaluateAll(X);
        for (std::size_t k = 0; k < learners.size(); k++) {
            if (Replaces(fit[k], ctx[learners[k]].f))
                ctx.assign(learners[k], TIndividual(std::move(X[k]), std::move(fit[k])));
        }
    }

    void Tlbo::generation(Context& ctx)
    {
        teacherPhase(ctx);
        learnerPhase(ctx);
    }

} // namespace natlib::mh
