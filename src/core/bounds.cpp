#include "natlib/core/bounds.hpp"
#include "natlib/core/errors.hpp"

namespace natlib::core {

    Bounds Bounds::uniform(std::size_t dim, double lower, double upper)
    {
        return Bounds(std::vector<TBound>(dim, TBound{lower, upper}));
    }

    Bounds Bounds::fromVectors(const std::vector<double>& lower, const std::vector<double>& upper)
    {
        if (lower.size() != upper.size()) {
            throw ConfigurationError(std::format("Bounds: {} lower values but {} upper values",
                                                 lower.size(), upper.size()));
        }

        std::vector<TBound> bounds(lower.size());
        for (std::size_t s = 0; s < lower.size(); s++)
            bounds[s] = {lower[s], upper[s]};
        return Bounds(std::move(bounds));
    }

    void Bounds::clamp(std::vector<double>& x) const
    {
        for (std::size_t s = 0; s < x.size() && s < bounds_.size(); s++)
            x[s] = clamp(s, x[s]);
    }

    bool Bounds::contains(const std::vector<double>& x) const
    {
        if (x.size() != bounds_.size()) return false;

        for (std::size_t s = 0; s < x.size(); s++) {
            if (x[s] < lb(s) || x[s] > ub(s)) return false;
        }
        return true;
    }

    void Bounds::validate() const
    {
        if (bounds_.empty())
            throw ConfigurationError("Bounds: at least one dimension is required");

        for (std::size_t s = 0; s < bounds_.size(); s++) {
            // NaN limits fail this test as well
            if (!(lb(s) <= ub(s))) {
                throw ConfigurationError(std::format("Bounds: lower bound {} is greater than upper bound {} in dimension {}",
                                                     lb(s), ub(s), s));
            }
        }
    }

} // namespace natlib::core
