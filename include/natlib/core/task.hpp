#pragma once

#include "natlib/core/context.hpp"

namespace natlib::core::task {

    // termination predicate, checked once per generation boundary
    using Task = std::function<bool(const Context&)>;

    // stop when the generation counter reaches n
    Task MaxGen(std::uint64_t n);

    // stop when the best single-objective fitness is <= value
    Task MinFit(double value);

    // stop after `seconds` of wall-clock time
    Task MaxTime(double seconds);

    /**
     * Method: SlowDown
     * Description: Plateau detection. Stops when the best objective sum
     * improved by less than `tolerance` over the last `window` generations.
     */
    Task SlowDown(std::uint64_t window, double tolerance);

    // stop when either task says so
    Task Any(Task a, Task b);

} // namespace natlib::core::task
