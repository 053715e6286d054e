#include "natlib/core/task.hpp"

namespace natlib::core::task {

    Task MaxGen(std::uint64_t n)
    {
        return [n](const Context& ctx) { return ctx.gen() >= n; };
    }

    Task MinFit(double value)
    {
        return [value](const Context& ctx) {
            return !ctx.best().empty() && ctx.best().best().f.eval() <= value;
        };
    }

    Task MaxTime(double seconds)
    {
        return [seconds](const Context& ctx) { return ctx.time() >= seconds; };
    }

    Task SlowDown(std::uint64_t window, double tolerance)
    {
        return [window, tolerance](const Context& ctx) {
            const auto& h = ctx.bestHistory();
            if (window == 0 || h.size() <= window) return false;

            const double before = h[h.size() - 1 - window];
            if (std::isinf(before)) return false;
            return before - h.back() < tolerance;
        };
    }

    Task Any(Task a, Task b)
    {
        return [a = std::move(a), b = std::move(b)](const Context& ctx) { return a(ctx) || b(ctx); };
    }

} // namespace natlib::core::task
