#include "natlib/core/ranking.hpp"

namespace natlib::core {

    // -----------------------------------------------------------------------------
    // Pairwise comparison
    // -----------------------------------------------------------------------------

    bool Dominates(const TFitness &a, const TFitness &b)
    {
        if (!a.isValid() || !b.isValid() || a.arity() != b.arity()) return false;

        bool strictly = false;
        for (std::size_t k = 0; k < a.arity(); k++) {
            if (a.ofv[k] > b.ofv[k]) return false;
            if (a.ofv[k] < b.ofv[k]) strictly = true;
        }
        return strictly;
    }

    Order Compare(const TFitness &a, const TFitness &b)
    {
        const bool validA = a.isValid();
        const bool validB = b.isValid();

        if (!validA || !validB) {
            if (validA) return Order::Better;
            if (validB) return Order::Worse;
            return Order::Incomparable;
        }

        if (a.arity() == 1 && b.arity() == 1) {
            if (a.ofv[0] < b.ofv[0]) return Order::Better;
            if (b.ofv[0] < a.ofv[0]) return Order::Worse;
            return Order::Incomparable;
        }

        if (Dominates(a, b)) return Order::Better;
        if (Dominates(b, a)) return Order::Worse;
        return Order::Incomparable;
    }

    bool Replaces(const TFitness &candidate, const TFitness &incumbent)
    {
        switch (Compare(candidate, incumbent)) {
            case Order::Better: return true;
            case Order::Worse: return false;
            default:
                return candidate.arity() > 1 && candidate.isValid() && incumbent.isValid();
        }
    }

    bool sortByFitness(const TIndividual &lhs, const TIndividual &rhs)
    {
        if (!lhs.f.isValid()) return false;
        if (!rhs.f.isValid()) return true;
        return lhs.f.ofv[0] < rhs.f.ofv[0];
    }

    // -----------------------------------------------------------------------------
    // Set operations
    // -----------------------------------------------------------------------------

    std::vector<std::size_t> NonDominated(const std::vector<TIndividual> &set)
    {
        std::vector<std::size_t> front;

        for (std::size_t i = 0; i < set.size(); i++) {
            if (!set[i].f.isValid()) continue;

            bool dominated = false;
            for (std::size_t j = 0; j < set.size() && !dominated; j++) {
                if (i != j && Dominates(set[j].f, set[i].f)) dominated = true;
            }
            if (!dominated) front.push_back(i);
        }
        return front;
    }

    std::vector<std::vector<std::size_t>> NonDominatedSort(const std::vector<TIndividual> &set)
    {
        const std::size_t n = set.size();
        std::vector<std::vector<std::size_t>> fronts;
        std::vector<std::vector<std::size_t>> dominatedBy(n);   // members dominated by i
        std::vector<std::size_t> domCount(n, 0);                // number of members dominating i
        std::vector<std::size_t> invalid;
        std::vector<std::size_t> current;

        for (std::size_t i = 0; i < n; i++) {
            if (!set[i].f.isValid()) {
                invalid.push_back(i);
                continue;
            }
            for (std::size_t j = 0; j < n; j++) {
                if (i == j) continue;
                if (Dominates(set[i].f, set[j].f)) dominatedBy[i].push_back(j);
                else if (Dominates(set[j].f, set[i].f)) domCount[i]++;
            }
            if (domCount[i] == 0) current.push_back(i);
        }

        while (!current.empty()) {
            std::vector<std::size_t> next;
            for (std::size_t i : current) {
                for (std::size_t j : dominatedBy[i]) {
                    if (--domCount[j] == 0) next.push_back(j);
                }
            }
            std::ranges::sort(next);
            fronts.push_back(std::move(current));
            current = std::move(next);
        }

        if (!invalid.empty()) fronts.push_back(std::move(invalid));
        return fronts;
    }

    std::vector<double> CrowdingDistance(const std::vector<TIndividual> &set, const std::vector<std::size_t> &idx)
    {
        const std::size_t m = idx.size();
        std::vector<double> dist(m, 0.0);
        if (m == 0) return dist;
        if (m <= 2) {
            std::ranges::fill(dist, INF);
            return dist;
        }

        const std::size_t arity = set[idx[0]].f.arity();
        std::vector<std::size_t> order(m);

        for (std::size_t k = 0; k < arity; k++) {
            std::iota(order.begin(), order.end(), 0);
            std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
                return set[idx[a]].f.ofv[k] < set[idx[b]].f.ofv[k];
            });

            const double fmin = set[idx[order.front()]].f.ofv[k];
            const double fmax = set[idx[order.back()]].f.ofv[k];

            dist[order.front()] = INF;
            dist[order.back()] = INF;

            // degenerate objective, every member sits at the same value
            if (fmax - fmin <= 0.0) continue;

            for (std::size_t r = 1; r + 1 < m; r++) {
                const double gap = set[idx[order[r + 1]]].f.ofv[k] - set[idx[order[r - 1]]].f.ofv[k];
                dist[order[r]] += gap / (fmax - fmin);
            }
        }
        return dist;
    }

    void SelectSurvivors(std::vector<TIndividual> &set, std::size_t n)
    {
        if (set.size() <= n) return;

        const bool multi = std::ranges::any_of(set, [](const TIndividual &ind) { return ind.f.arity() > 1; });

        if (!multi) {
            std::ranges::stable_sort(set, sortByFitness);
            set.resize(n);
            return;
        }

        std::vector<TIndividual> survivors;
        survivors.reserve(n);

        for (const auto &front : NonDominatedSort(set)) {
            if (survivors.size() + front.size() <= n) {
                for (std::size_t i : front) survivors.push_back(std::move(set[i]));
                if (survivors.size() == n) break;
                continue;
            }

            // invalid members have no distance, keep them in order
            if (!set[front.front()].f.isValid()) {
                for (std::size_t r = 0; survivors.size() < n; r++)
                    survivors.push_back(std::move(set[front[r]]));
                break;
            }

            // last admitted front: prefer the least crowded members
            std::vector<double> dist = CrowdingDistance(set, front);
            std::vector<std::size_t> order(front.size());
            std::iota(order.begin(), order.end(), 0);
            std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) { return dist[a] > dist[b]; });

            for (std::size_t r = 0; survivors.size() < n; r++)
                survivors.push_back(std::move(set[front[order[r]]]));
            break;
        }

        set = std::move(survivors);
    }

    void TruncateFront(std::vector<TIndividual> &front, std::size_t limit)
    {
        std::vector<std::size_t> idx;

        while (front.size() > limit) {
            idx.resize(front.size());
            std::iota(idx.begin(), idx.end(), 0);

            std::vector<double> dist = CrowdingDistance(front, idx);
            auto worst = std::ranges::min_element(dist);
            front.erase(front.begin() + std::distance(dist.begin(), worst));
        }
    }

} // namespace natlib::core
