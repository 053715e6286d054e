#pragma once
#include "natlib/core/context.hpp"

namespace natlib::core {

    // Interface of a population-based search method
    class IAlgorithm {
        public:
            virtual ~IAlgorithm() = default;

            virtual const char* name() const = 0;

            // smallest population for which the operators are well-defined
            virtual std::size_t minPopulation() const { return 2; }

            // population used when the builder does not set one
            virtual std::size_t defaultPopulation() const { return 200; }

            // called once, after the initial population has been evaluated
            virtual void init(Context& ctx) { (void)ctx; }

            /**
             * Method: generation
             * Description: One generation step. Must leave exactly popNum()
             * evaluated individuals in the population and evaluate every new
             * candidate exactly once.
             */
            virtual void generation(Context& ctx) = 0;
        };

}
