#include "natlib/core/best.hpp"
#include "natlib/core/ranking.hpp"

namespace natlib::core {

    bool BestArchive::update(const TIndividual &ind)
    {
        if (!ind.f.isValid()) return false;

        if (members_.empty()) {
            members_.push_back(ind);
            return true;
        }

        // single-objective: replace only on strict improvement, first seen wins ties
        if (ind.f.arity() == 1) {
            if (Compare(ind.f, members_.front().f) == Order::Better) {
                members_.front() = ind;
                return true;
            }
            return false;
        }

        // rejected if dominated by a member, equal values are mutually non-dominating
        for (const auto &m : members_) {
            if (Dominates(m.f, ind.f)) return false;
        }

        std::erase_if(members_, [&](const TIndividual &m) { return Dominates(ind.f, m.f); });
        members_.push_back(ind);

        if (members_.size() <= limit_) return true;

        // truncation keeps the order, so the newcomer survived only if it is still last
        TruncateFront(members_, limit_);
        return members_.back().x == ind.x && members_.back().f == ind.f;
    }

    bool BestArchive::updateAll(const std::vector<TIndividual> &pop)
    {
        bool improved = false;
        for (const auto &ind : pop) {
            if (update(ind)) improved = true;
        }
        return improved;
    }

    const TIndividual &BestArchive::best() const
    {
        if (members_.empty()) throw std::out_of_range("BestArchive: no valid individual has been recorded");

        if (members_.size() == 1) return members_.front();

        return *std::ranges::min_element(members_, {}, [](const TIndividual &m) { return m.f.eval(); });
    }

    const TIndividual &BestArchive::sample(Rng &rng) const
    {
        if (members_.size() <= 1) return best();
        return members_[rng.index(members_.size())];
    }

} // namespace natlib::core
