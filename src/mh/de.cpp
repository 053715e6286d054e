#include "natlib/mh/de.hpp"
#include "natlib/core/ranking.hpp"
#include "natlib/core/errors.hpp"

#include <cctype>

namespace natlib::mh {

    using namespace natlib::core;

    static std::string lowercase(std::string s)
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    DeStrategy ParseDeStrategy(const std::string& name)
    {
        const std::string key = lowercase(name);
        if (key == "best1") return DeStrategy::Best1;
        if (key == "rand1") return DeStrategy::Rand1;
        if (key == "currenttobest1") return DeStrategy::CurrentToBest1;
        if (key == "best2") return DeStrategy::Best2;
        if (key == "rand2") return DeStrategy::Rand2;
        throw ConfigurationError(std::format("DE: unknown strategy '{}'", name));
    }

    DeCrossover ParseDeCrossover(const std::string& name)
    {
        const std::string key = lowercase(name);
        if (key == "binomial") return DeCrossover::Binomial;
        if (key == "exponential") return DeCrossover::Exponential;
        throw ConfigurationError(std::format("DE: unknown crossover '{}'", name));
    }

    std::size_t De::donors() const
    {
        switch (s_.strategy) {
            case DeStrategy::Best1:          return 2;
            case DeStrategy::Rand1:          return 3;
            case DeStrategy::CurrentToBest1: return 2;
            case DeStrategy::Best2:          return 4;
            case DeStrategy::Rand2:          return 5;
        }
        return 5;
    }

    // -------------------------------------------------------------------------
    // Mutation
    // -------------------------------------------------------------------------
    std::vector<double> De::mutant(std::size_t i, const std::vector<double>& best, Context& ctx) const
    {
        const std::vector<std::size_t> r = ctx.rng().distinct(donors(), ctx.popNum(), {i});
        const double F = s_.f;

        std::vector<double> v(ctx.dim());
        for (std::size_t s = 0; s < ctx.dim(); s++)
        {
            auto x = [&](std::size_t k) { return ctx[r[k]].x[s]; };

            switch (s_.strategy) {
                case DeStrategy::Best1:
                    v[s] = best[s] + F * (x(0) - x(1));
                    break;
                case DeStrategy::Rand1:
                    v[s] = x(0) + F * (x(1) - x(2));
                    break;
                case DeStrategy::CurrentToBest1:
                    v[s] = ctx[i].x[s] + F * (best[s] - ctx[i].x[s]) + F * (x(0) - x(1));
                    break;
                case DeStrategy::Best2:
                    v[s] = best[s] + F * (x(0) - x(1)) + F * (x(2) - x(3));
                    break;
                case DeStrategy::Rand2:
                    v[s] = x(0) + F * (x(1) - x(2)) + F * (x(3) - x(4));
                    break;
            }
        }
        return v;
    }

    // -------------------------------------------------------------------------
    // Crossover: genes not inherited from the mutant come from the target
    // -------------------------------------------------------------------------
    void De::recombine(const std::vector<double>& target, std::vector<double>& trial, Context& ctx) const
    {
        const std::size_t dim = ctx.dim();

        if (s_.crossover == DeCrossover::Binomial) {
            // at least one gene always comes from the mutant
            const std::size_t jrand = ctx.rng().index(dim);
            for (std::size_t s = 0; s < dim; s++) {
                if (s != jrand && !ctx.rng().maybe(s_.cr))
                    trial[s] = target[s];
            }
            return;
        }

        // exponential: a circular run of mutant genes starting at a random position
        std::vector<bool> fromMutant(dim, false);
        std::size_t s = ctx.rng().index(dim);
        std::size_t len = 0;
        do {
            fromMutant[s] = true;
            s = (s + 1) % dim;
            len++;
        } while (len < dim && ctx.rng().maybe(s_.cr));

        for (std::size_t k = 0; k < dim; k++) {
            if (!fromMutant[k]) trial[k] = target[k];
        }
    }

    void De::generation(Context& ctx)
    {
        const std::size_t n = ctx.popNum();
        const bool usesBest = s_.strategy == DeStrategy::Best1 || s_.strategy == DeStrategy::Best2 ||
                              s_.strategy == DeStrategy::CurrentToBest1;

        std::vector<std::vector<double>> trials(n);
        for (std::size_t i = 0; i < n; i++)
        {
            std::vector<double> best;
            if (usesBest) best = ctx.best().sample(ctx.rng()).x;

            trials[i] = mutant(i, best, ctx);
            recombine(ctx[i].x, trials[i], ctx);
            ctx.bounds().clamp(trials[i]);
        }

        std::vector<TFitness> fit = ctx.evaluateAll(trials);

        // one-to-one greedy replacement
        for (std::size_t i = 0; i < n; i++) {
            if (Replaces(fit[i], ctx[i].f))
                ctx.assign(i, TIndividual(std::move(trials[i]), std::move(fit[i])));
        }
    }

} // namespace natlib::mh
