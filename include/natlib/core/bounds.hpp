#pragma once

#include "natlib/core/common.hpp"

namespace natlib::core {

    //--------------------------------------------------------------------------
    // Class: Bounds
    // Description: Box constraints, one [lower, upper] pair per dimension
    //--------------------------------------------------------------------------
    class Bounds {
    public:
        using TBound = std::pair<double, double>;

        Bounds() = default;
        explicit Bounds(std::vector<TBound> bounds) : bounds_(std::move(bounds)) {}
        Bounds(std::initializer_list<TBound> bounds) : bounds_(bounds) {}

        // same [lower, upper] repeated over `dim` dimensions
        static Bounds uniform(std::size_t dim, double lower, double upper);

        // per-dimension lower and upper vectors, which must have equal length
        static Bounds fromVectors(const std::vector<double>& lower, const std::vector<double>& upper);

        std::size_t size() const { return bounds_.size(); }
        bool empty() const { return bounds_.empty(); }

        double lb(std::size_t s) const { return bounds_[s].first; }
        double ub(std::size_t s) const { return bounds_[s].second; }
        double width(std::size_t s) const { return bounds_[s].second - bounds_[s].first; }

        double clamp(std::size_t s, double v) const { return std::clamp(v, lb(s), ub(s)); }
        void clamp(std::vector<double>& x) const;

        bool contains(const std::vector<double>& x) const;

        // throws ConfigurationError if empty or some lower > upper
        void validate() const;

        const std::vector<TBound>& data() const { return bounds_; }

    private:
        std::vector<TBound> bounds_;
    };

} // namespace natlib::core
