/**
 * natlib - Solver Interface
 * Main orchestrator: builds the context and drives the generation loop
 */

#pragma once

#include "natlib/core/data.hpp"
#include "natlib/core/context.hpp"
#include "natlib/core/ialgorithm.hpp"
#include "natlib/core/iobjective.hpp"
#include "natlib/core/pool.hpp"
#include "natlib/core/task.hpp"
#include "natlib/core/errors.hpp"

namespace natlib {

    using core::ConfigurationError;
    using core::RunExhausted;

    /**
    * @brief Outcome of a run. Owns the final context.
    */
    class Report {
    public:
        explicit Report(core::Context ctx) : time_(ctx.time()), ctx_(std::move(ctx)) {}

        // -------------------------------------------------------------------------
        // BEST SOLUTION
        // -------------------------------------------------------------------------
        const std::vector<double>& bestParameters() const { return ctx_.best().best().x; }
        const core::TFitness& bestFitness() const { return ctx_.best().best().f; }

        // Pareto front; a single element for single-objective problems
        const std::vector<core::TIndividual>& front() const { return ctx_.best().front(); }

        bool hasProduct() const { return !ctx_.best().empty() && bestFitness().product.has_value(); }

        // payload attached by the objective to the best fitness; throws std::bad_any_cast
        template<class T>
        T product() const { return std::any_cast<T>(bestFitness().product); }

        // -------------------------------------------------------------------------
        // RUN DATA
        // -------------------------------------------------------------------------
        std::uint64_t gen() const { return ctx_.gen(); }
        std::uint64_t seed() const { return ctx_.seed(); }
        std::size_t evaluations() const { return ctx_.evaluations(); }
        // seconds from the creation of the context to the end of the run
        double time() const { return time_; }

        const core::Context& context() const { return ctx_; }

    private:
        double time_;
        core::Context ctx_;
    };

    /**
    * @brief A callback threw. The run stopped at the current generation and the
    * partial report is kept.
    */
    class CallbackFailure : public std::runtime_error {
    public:
        CallbackFailure(const std::string& what, Report partial)
            : std::runtime_error(what), partial_(std::move(partial)) {}

        const Report& partial() const { return partial_; }

    private:
        Report partial_;
    };

    /**
    * @brief Collects the configuration of a run; solve() executes it.
    */
    class SolverBuilder {
    public:
        using Callback = std::function<void(const core::Context&)>;

        SolverBuilder(std::unique_ptr<core::IAlgorithm> algorithm,
                      std::shared_ptr<const core::IObjective> objective,
                      core::Bounds bounds);

        // -------------------------------------------------------------------------
        // OPTIONS
        // -------------------------------------------------------------------------
        SolverBuilder& seed(std::uint64_t seed);
        SolverBuilder& task(core::task::Task task);
        SolverBuilder& callback(Callback callback);
        SolverBuilder& popNum(std::size_t popNum);
        SolverBuilder& paretoLimit(std::size_t limit);
        SolverBuilder& parallel(bool parallel);
        SolverBuilder& debug(int level);

        // initial population generated coordinate by coordinate
        SolverBuilder& initPool(core::PoolFunc func);

        // initial population sampled uniformly and accepted by a filter
        SolverBuilder& initPoolBy(core::PoolFilter filter);

        // initial population given point by point; sets popNum if it was not set
        SolverBuilder& initPoolReady(std::vector<std::vector<double>> pool);

        // applies every field of a TRunData at once
        SolverBuilder& runData(const core::TRunData& runData);

        // -------------------------------------------------------------------------
        // EXECUTION
        // -------------------------------------------------------------------------

        /**
         * Method: solve
         * Description: Validates the configuration (ConfigurationError), then runs
         * the generation loop until the task returns true.
         * Throws RunExhausted or CallbackFailure.
         */
        Report solve();

    private:
        void validateConfiguration() const;
        std::vector<std::vector<double>> createPool(core::Context& ctx) const;
        void runCallbacks(core::Context& ctx) const;
        void checkGeneration(const core::Context& ctx) const;
        void logProgress(const core::Context& ctx, bool improved) const;

        std::unique_ptr<core::IAlgorithm> algorithm_;
        std::shared_ptr<const core::IObjective> objective_;
        core::Bounds bounds_;
        core::TRunData runData_;

        core::task::Task task_;
        std::vector<Callback> callbacks_;

        core::PoolFunc poolFunc_;
        core::PoolFilter poolFilter_;
        std::vector<std::vector<double>> poolReady_;
    };

    class Solver {
    public:
        /**
         * Method: build
         * Description: Entry point. Defaults: population from the algorithm,
         * 200 generations, random seed, uniform initial pool.
         */
        static SolverBuilder build(std::unique_ptr<core::IAlgorithm> algorithm,
                                   std::shared_ptr<const core::IObjective> objective,
                                   core::Bounds bounds);
    };

} // namespace natlib
