#include "natlib/core/context.hpp"

#include <exception>

namespace natlib::core {

    double get_time_in_seconds() {
        #if defined(_WIN32) || defined(_WIN64)
            LARGE_INTEGER frequency;
            LARGE_INTEGER timeCur;
            QueryPerformanceFrequency(&frequency);
            QueryPerformanceCounter(&timeCur);
            return static_cast<double>(timeCur.QuadPart) / frequency.QuadPart;
        #else
            struct timespec timeCur;
            clock_gettime(CLOCK_MONOTONIC, &timeCur);
            return timeCur.tv_sec + timeCur.tv_nsec / 1e9;
        #endif
    }

    Context::Context(std::shared_ptr<const IObjective> objective, Bounds bounds,
                     const TRunData& runData, std::uint64_t seed)
        : objective_(std::move(objective))
        , bounds_(std::move(bounds))
        , runData_(runData)
        , rng_(seed)
        , best_(runData.paretoLimit)
        , startTime_(get_time_in_seconds())
    {
        pop_.reserve(runData_.popNum);
    }

    // -----------------------------------------------------------------------------
    // Evaluation
    // -----------------------------------------------------------------------------

    TFitness Context::checked(TFitness f)
    {
        const std::size_t arity = static_cast<std::size_t>(objective_->getObjectives());

        numEvaluations_++;
        genEvaluations_++;

        if (f.arity() != arity) {
            if (runData_.debug >= 2) {
                std::cout << std::format("\nInvalid fitness: {} values, {} expected (gen: {})", f.arity(), arity, gen_);
            }
            f.ofv.assign(arity, std::numeric_limits<double>::quiet_NaN());
        }

        if (!f.isValid()) {
            genInvalid_++;
            if (runData_.debug >= 2 && f.arity() == arity) {
                std::cout << std::format("\nInvalid fitness: NaN value (gen: {})", gen_);
            }
        }
        return f;
    }

    TFitness Context::evaluate(const std::vector<double>& x)
    {
        return checked(objective_->evaluate(x));
    }

    std::vector<TFitness> Context::evaluateAll(const std::vector<std::vector<double>>& xs)
    {
        const long n = static_cast<long>(xs.size());
        std::vector<TFitness> out(xs.size());

        if (runData_.parallel && n > 1) {
            // exceptions may not leave the parallel region, keep them by index
            std::vector<std::exception_ptr> errors(xs.size());

            #pragma omp parallel for schedule(dynamic)
            for (long i = 0; i < n; i++) {
                try {
                    out[i] = objective_->evaluate(xs[i]);
                } catch (...) {
                    errors[i] = std::current_exception();
                }
            }

            for (const auto& e : errors) {
                if (e) std::rethrow_exception(e);
            }
        }
        else {
            for (long i = 0; i < n; i++)
                out[i] = objective_->evaluate(xs[i]);
        }

        for (auto& f : out)
            f = checked(std::move(f));
        return out;
    }

    std::vector<TIndividual> Context::makeIndividuals(std::vector<std::vector<double>> xs)
    {
        std::vector<TFitness> fs = evaluateAll(xs);

        std::vector<TIndividual> inds;
        inds.reserve(xs.size());
        for (std::size_t i = 0; i < xs.size(); i++)
            inds.emplace_back(std::move(xs[i]), std::move(fs[i]));
        return inds;
    }

    // -----------------------------------------------------------------------------
    // Archive & driver bookkeeping
    // -----------------------------------------------------------------------------

    bool Context::findBest()
    {
        return best_.updateAll(pop_);
    }

    void Context::nextGen()
    {
        gen_++;
        genEvaluations_ = 0;
        genInvalid_ = 0;
    }

    void Context::recordHistory()
    {
        history_.push_back(best_.empty() ? INF : best_.best().f.eval());
    }

} // namespace natlib::core
