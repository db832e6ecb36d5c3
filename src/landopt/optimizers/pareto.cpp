// pareto.cpp
#include "pareto.hpp"

#include <algorithm>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace landopt::optim {

using evaluation::FitnessVector;
using evaluation::kObjectiveCount;

double violationSeverity(const FitnessVector& f)
{
    if (f.report.feasible) return 0.0;
    return static_cast<double>(f.report.hardViolationCount()) + f.report.soft_penalty;
}

bool dominates(const FitnessVector& a, const FitnessVector& b)
{
    if (a.feasible() != b.feasible()) return a.feasible();
    if (!a.feasible()) {
        const double sa = violationSeverity(a);
        const double sb = violationSeverity(b);
        if (sa != sb) return sa < sb;
    }

    bool strictly = false;
    for (std::size_t i = 0; i < kObjectiveCount; ++i) {
        if (a[i] < b[i]) return false;
        if (a[i] > b[i]) strictly = true;
    }
    return strictly;
}

std::vector<std::vector<std::size_t>> nonDominatedSort(const Population& pop)
{
    const std::size_t n = pop.size();
    for (const auto& ind : pop) {
        if (!ind.fitness) throw std::invalid_argument("Cannot rank an unevaluated individual.");
    }

    std::vector<std::vector<std::size_t>> dominated(n);
    std::vector<std::size_t> dom_count(n, 0);
    std::vector<std::vector<std::size_t>> fronts(1);

    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            if (dominates(*pop[i].fitness, *pop[j].fitness)) {
                dominated[i].push_back(j);
                ++dom_count[j];
            } else if (dominates(*pop[j].fitness, *pop[i].fitness)) {
                dominated[j].push_back(i);
                ++dom_count[i];
            }
        }
    }
    for (std::size_t i = 0; i < n; ++i) {
        if (dom_count[i] == 0) fronts[0].push_back(i);
    }

    std::size_t f = 0;
    while (f < fronts.size() && !fronts[f].empty()) {
        std::vector<std::size_t> next;
        for (std::size_t i : fronts[f]) {
            for (std::size_t j : dominated[i]) {
                if (--dom_count[j] == 0) next.push_back(j);
            }
        }
        std::sort(next.begin(), next.end());
        if (next.empty()) break;
        fronts.push_back(std::move(next));
        ++f;
    }
    if (fronts.back().empty()) fronts.pop_back();
    return fronts;
}

void assignCrowding(Population& pop, const std::vector<std::size_t>& front)
{
    constexpr double inf = std::numeric_limits<double>::infinity();
    for (std::size_t i : front) pop[i].crowding = 0.0;
    if (front.size() <= 2) {
        for (std::size_t i : front) pop[i].crowding = inf;
        return;
    }

    std::vector<std::size_t> order(front);
    for (std::size_t m = 0; m < kObjectiveCount; ++m) {
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return (*pop[a].fitness)[m] < (*pop[b].fitness)[m];
        });
        const double lo = (*pop[order.front()].fitness)[m];
        const double hi = (*pop[order.back()].fitness)[m];
        pop[order.front()].crowding = inf;
        pop[order.back()].crowding = inf;
        if (!(hi > lo)) continue;

        for (std::size_t k = 1; k + 1 < order.size(); ++k) {
            Individual& ind = pop[order[k]];
            if (ind.crowding == inf) continue;
            ind.crowding += ((*pop[order[k + 1]].fitness)[m] - (*pop[order[k - 1]].fitness)[m]) / (hi - lo);
        }
    }
}

void rankPopulation(Population& pop)
{
    const auto fronts = nonDominatedSort(pop);
    for (std::size_t f = 0; f < fronts.size(); ++f) {
        for (std::size_t i : fronts[f]) pop[i].rank = f;
        assignCrowding(pop, fronts[f]);
    }
}

} // namespace landopt::optim
