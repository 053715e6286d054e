#include "natlib/core/solver.hpp"

#include <omp.h>
#include <iostream>

namespace natlib {

    using namespace natlib::core;

    SolverBuilder Solver::build(std::unique_ptr<IAlgorithm> algorithm,
                                std::shared_ptr<const IObjective> objective,
                                Bounds bounds)
    {
        return SolverBuilder(std::move(algorithm), std::move(objective), std::move(bounds));
    }

    SolverBuilder::SolverBuilder(std::unique_ptr<IAlgorithm> algorithm,
                                 std::shared_ptr<const IObjective> objective,
                                 Bounds bounds)
        : algorithm_(std::move(algorithm))
        , objective_(std::move(objective))
        , bounds_(std::move(bounds))
        , task_(task::MaxGen(200))
        , poolFunc_(UniformPool())
    {
    }

    // -------------------------------------------------------------------------
    // OPTIONS
    // -------------------------------------------------------------------------

    SolverBuilder& SolverBuilder::seed(std::uint64_t seed) {
        runData_.seed = seed;
        runData_.hasSeed = true;
        return *this;
    }

    SolverBuilder& SolverBuilder::task(task::Task task) { task_ = std::move(task); return *this; }
    SolverBuilder& SolverBuilder::callback(Callback callback) { callbacks_.push_back(std::move(callback)); return *this; }
    SolverBuilder& SolverBuilder::popNum(std::size_t popNum) { runData_.popNum = popNum; return *this; }
    SolverBuilder& SolverBuilder::paretoLimit(std::size_t limit) { runData_.paretoLimit = limit; return *this; }
    SolverBuilder& SolverBuilder::parallel(bool parallel) { runData_.parallel = parallel; return *this; }
    SolverBuilder& SolverBuilder::debug(int level) { runData_.debug = level; return *this; }

    SolverBuilder& SolverBuilder::initPool(PoolFunc func) {
        poolFunc_ = std::move(func);
        poolFilter_ = nullptr;
        poolReady_.clear();
        return *this;
    }

    SolverBuilder& SolverBuilder::initPoolBy(PoolFilter filter) {
        poolFilter_ = std::move(filter);
        poolReady_.clear();
        return *this;
    }

    SolverBuilder& SolverBuilder::initPoolReady(std::vector<std::vector<double>> pool) {
        poolReady_ = std::move(pool);
        poolFilter_ = nullptr;
        if (runData_.popNum == 0) runData_.popNum = poolReady_.size();
        return *this;
    }

    SolverBuilder& SolverBuilder::runData(const TRunData& runData) {
        runData_ = runData;
        return *this;
    }

    // -------------------------------------------------------------------------
    // VALIDATION
    // -------------------------------------------------------------------------

    void SolverBuilder::validateConfiguration() const
    {
        if (!algorithm_) throw ConfigurationError("Solver: no algorithm was given");
        if (!objective_) throw ConfigurationError("Solver: no objective was given");
        if (!task_) throw ConfigurationError("Solver: the termination task is empty");

        bounds_.validate();

        if (objective_->getDimension() < 1 || bounds_.size() != static_cast<std::size_t>(objective_->getDimension())) {
            throw ConfigurationError(std::format("Solver: bounds have {} dimensions but the objective expects {}",
                                                 bounds_.size(), objective_->getDimension()));
        }

        if (objective_->getObjectives() < 1) {
            throw ConfigurationError(std::format("Solver: the objective declares {} objectives",
                                                 objective_->getObjectives()));
        }

        if (runData_.popNum < algorithm_->minPopulation()) {
            throw ConfigurationError(std::format("Solver: {} requires a population of at least {}, got {}",
                                                 algorithm_->name(), algorithm_->minPopulation(), runData_.popNum));
        }

        if (runData_.paretoLimit < 1) throw ConfigurationError("Solver: the Pareto front limit must be at least 1");

        if (!poolReady_.empty()) {
            if (poolReady_.size() != runData_.popNum) {
                throw ConfigurationError(std::format("Solver: the initial pool has {} points but the population size is {}",
                                                     poolReady_.size(), runData_.popNum));
            }
            for (const auto& x : poolReady_) {
                if (x.size() != bounds_.size()) {
                    throw ConfigurationError(std::format("Solver: an initial point has {} values, {} expected",
                                                         x.size(), bounds_.size()));
                }
            }
        }
    }

    // -------------------------------------------------------------------------
    // EXECUTION
    // -------------------------------------------------------------------------

    std::vector<std::vector<double>> SolverBuilder::createPool(Context& ctx) const
    {
        if (!poolReady_.empty()) {
            std::vector<std::vector<double>> pool = poolReady_;
            for (auto& x : pool) bounds_.clamp(x);
            return pool;
        }

        if (poolFilter_) {
            return CreatePoolSolutionsBy(bounds_, ctx.popNum(), poolFilter_, ctx.rng(), ctx.popNum() * 1000);
        }

        return CreatePoolSolutions(bounds_, ctx.popNum(), poolFunc_, ctx.rng());
    }

    void SolverBuilder::runCallbacks(Context& ctx) const
    {
        for (const auto& callback : callbacks_) {
            try {
                callback(ctx);
            } catch (const std::exception& e) {
                throw CallbackFailure(std::format("Callback failed at generation {}: {}", ctx.gen(), e.what()),
                                      Report(std::move(ctx)));
            } catch (...) {
                throw CallbackFailure(std::format("Callback failed at generation {}: unknown exception", ctx.gen()),
                                      Report(std::move(ctx)));
            }
        }
    }

    void SolverBuilder::checkGeneration(const Context& ctx) const
    {
        if (ctx.population().size() != ctx.popNum()) {
            throw std::logic_error(std::format("{}: population size changed from {} to {} at generation {}",
                                               algorithm_->name(), ctx.popNum(), ctx.population().size(), ctx.gen()));
        }

        if (ctx.genEvaluations() > 0 && ctx.genInvalid() == ctx.genEvaluations()) {
            throw RunExhausted(std::format("All {} candidates evaluated at generation {} have an invalid fitness",
                                           ctx.genEvaluations(), ctx.gen()), ctx.gen());
        }
    }

    void SolverBuilder::logProgress(const Context& ctx, bool improved) const
    {
        if (runData_.debug < 1 || !improved || ctx.best().empty()) return;

        if (ctx.best().isMulti()) {
            std::cout << std::format("\nPareto front: {} points (gen: {} - MH: {})",
                                     ctx.best().size(), ctx.gen(), algorithm_->name());
        } else {
            std::cout << std::format("\nBest solution: {:.10f} (gen: {} - MH: {})",
                                     ctx.best().best().f.eval(), ctx.gen(), algorithm_->name());
        }
    }

    Report SolverBuilder::solve()
    {
        if (algorithm_ && runData_.popNum == 0) runData_.popNum = algorithm_->defaultPopulation();

        validateConfiguration();

        const std::uint64_t runSeed = runData_.hasSeed ? runData_.seed : Rng::randomSeed();
        Context ctx(objective_, bounds_, runData_, runSeed);

        if (runData_.debug >= 1) {
            std::cout << std::format("\n{}: dim {} - pop {} - seed {} - threads {}",
                                     algorithm_->name(), ctx.dim(), ctx.popNum(), runSeed,
                                     runData_.parallel ? omp_get_max_threads() : 1);
        }

        // generation 0: initial population
        ctx.setPopulation(ctx.makeIndividuals(createPool(ctx)));
        checkGeneration(ctx);
        algorithm_->init(ctx);
        logProgress(ctx, ctx.findBest());
        ctx.recordHistory();

        while (true)
        {
            runCallbacks(ctx);

            if (task_(ctx)) break;

            ctx.nextGen();
            algorithm_->generation(ctx);
            checkGeneration(ctx);

            logProgress(ctx, ctx.findBest());
            ctx.recordHistory();
        }

        if (runData_.debug >= 1) std::cout << std::endl;

        return Report(std::move(ctx));
    }

} // namespace natlib
