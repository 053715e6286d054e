#pragma once

#include "natlib/core/data.hpp"
#include "natlib/core/random.hpp"

namespace natlib::core {

    //--------------------------------------------------------------------------
    // Class: BestArchive
    // Description: Elite record of a run. For single-objective problems it holds
    // the best individual seen so far; for multi-objective problems a Pareto
    // front of at most `paretoLimit` mutually non-dominated individuals.
    // Invalid fitness values never enter the archive.
    //--------------------------------------------------------------------------
    class BestArchive {
    public:
        explicit BestArchive(std::size_t paretoLimit = 20) : limit_(paretoLimit) {}

        // returns true if the individual was admitted
        bool update(const TIndividual &ind);

        // returns true if any member of the population was admitted
        bool updateAll(const std::vector<TIndividual> &pop);

        bool empty() const { return members_.empty(); }
        std::size_t size() const { return members_.size(); }
        bool isMulti() const { return !members_.empty() && members_.front().f.arity() > 1; }
        std::size_t paretoLimit() const { return limit_; }

        // single best; for a front, the member with the smallest objective sum
        const TIndividual &best() const;

        // a single best is a front of one
        const std::vector<TIndividual> &front() const { return members_; }

        // leader for the variation operators: the best, or a random front member
        const TIndividual &sample(Rng &rng) const;

    private:
        std::size_t limit_;
        std::vector<TIndividual> members_;
    };

} // namespace natlib::core
