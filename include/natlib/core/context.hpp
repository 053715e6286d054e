/**
 * natlib - Search Context
 * Mutable state of one run, threaded through every algorithm step
 */

#pragma once

#include "natlib/core/data.hpp"
#include "natlib/core/bounds.hpp"
#include "natlib/core/random.hpp"
#include "natlib/core/best.hpp"
#include "natlib/core/iobjective.hpp"

namespace natlib {
    class SolverBuilder;
}

namespace natlib::core {

    /**
    * @brief Population, bounds, random stream, generation counter and elite
    * archive of a single run.
    *
    * Owned exclusively by the run in progress. Callbacks and termination tasks
    * receive a const reference and therefore cannot draw from the stream.
    */
    class Context {
      public:
          Context(std::shared_ptr<const IObjective> objective, Bounds bounds,
                  const TRunData& runData, std::uint64_t seed);

          // -------------------------------------------------------------------------
          // PROBLEM & SETTINGS
          // -------------------------------------------------------------------------

          const IObjective& objective() const { return *objective_; }
          const Bounds& bounds() const { return bounds_; }
          const TRunData& runData() const { return runData_; }

          std::size_t dim() const { return bounds_.size(); }
          std::size_t popNum() const { return runData_.popNum; }
          bool isMulti() const { return objective_->getObjectives() > 1; }

          double lb(std::size_t s) const { return bounds_.lb(s); }
          double ub(std::size_t s) const { return bounds_.ub(s); }
          double clamp(std::size_t s, double v) const { return bounds_.clamp(s, v); }

          std::uint64_t gen() const { return gen_; }
          std::uint64_t seed() const { return rng_.seed(); }
          Rng& rng() { return rng_; }

          // -------------------------------------------------------------------------
          // POPULATION
          // -------------------------------------------------------------------------

          const std::vector<TIndividual>& population() const { return pop_; }
          const TIndividual& operator[](std::size_t i) const { return pop_[i]; }

          void assign(std::size_t i, TIndividual ind) { pop_[i] = std::move(ind); }
          void setPopulation(std::vector<TIndividual> pop) { pop_ = std::move(pop); }

          // -------------------------------------------------------------------------
          // EVALUATION
          // -------------------------------------------------------------------------

          /**
           * Method: evaluate
           * Description: One objective call. Invalid results (NaN, wrong arity)
           * are demoted and counted, never thrown.
           */
          TFitness evaluate(const std::vector<double>& x);

          /**
           * Method: evaluateAll
           * Description: One objective call per point, results in input order.
           * With runData().parallel the calls run in an OpenMP loop; the random
           * stream is never used inside it.
           */
          std::vector<TFitness> evaluateAll(const std::vector<std::vector<double>>& xs);

          std::vector<TIndividual> makeIndividuals(std::vector<std::vector<double>> xs);

          // -------------------------------------------------------------------------
          // ARCHIVE
          // -------------------------------------------------------------------------

          const BestArchive& best() const { return best_; }

          // merges the current population into the archive
          bool findBest();

          // archive best objective sum, one entry per generation
          const std::vector<double>& bestHistory() const { return history_; }

          // -------------------------------------------------------------------------
          // STATISTICS
          // -------------------------------------------------------------------------

          std::size_t evaluations() const { return numEvaluations_; }
          std::size_t genEvaluations() const { return genEvaluations_; }
          std::size_t genInvalid() const { return genInvalid_; }

          // seconds since the context was created
          double time() const { return get_time_in_seconds() - startTime_; }

      private:
          friend class natlib::SolverBuilder;

          // driver side: advance the counter and reset per-generation statistics
          void nextGen();
          void recordHistory();

          TFitness checked(TFitness f);

          std::shared_ptr<const IObjective> objective_;
          Bounds bounds_;
          TRunData runData_;
          Rng rng_;

          std::vector<TIndividual> pop_;
          BestArchive best_;
          std::vector<double> history_;

          std::uint64_t gen_ = 0;
          std::size_t numEvaluations_ = 0;
          std::size_t genEvaluations_ = 0;
          std::size_t genInvalid_ = 0;
          double startTime_ = 0.0;
      };

} // namespace natlib::core
