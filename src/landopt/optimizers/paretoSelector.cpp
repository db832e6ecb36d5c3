// paretoSelector.cpp
#include "paretoSelector.hpp"
#include "pareto.hpp"

#include <algorithm>
#include <cmath>

namespace landopt::optim {

namespace {

constexpr double kTieEps = 1e-9;

// -1 when a < b, 1 when a > b, 0 within tolerance
int compare(double a, double b)
{
    const double tol = kTieEps * std::max(1.0, std::max(std::abs(a), std::abs(b)));
    if (a < b - tol) return -1;
    if (a > b + tol) return 1;
    return 0;
}

} // namespace

std::vector<std::size_t> ParetoSelector::frontIndices(const Population& pop)
{
    if (pop.empty()) return {};
    auto fronts = nonDominatedSort(pop);
    return fronts.front();
}

ParetoFront ParetoSelector::extract(const Population& pop)
{
    ParetoFront front;
    for (std::size_t i : frontIndices(pop)) front.push_back(pop[i]);
    return front;
}

bool ParetoSelector::preferred(const Individual& a, std::size_t ia, const Individual& b, std::size_t ib)
{
    const auto& fa = *a.fitness;
    const auto& fb = *b.fitness;

    if (int c = compare(fa.financialObjective(), fb.financialObjective())) return c > 0;
    if (int c = compare(fa.total_road_length, fb.total_road_length)) return c < 0;
    if (int c = compare(fa.lotCount(), fb.lotCount())) return c > 0;
    return ia < ib;
}

std::optional<std::size_t> ParetoSelector::recommend(const Population& pop)
{
    std::optional<std::size_t> best;
    for (std::size_t i : frontIndices(pop)) {
        if (!best || preferred(pop[i], i, pop[*best], *best)) best = i;
    }
    return best;
}

} // namespace landopt::optim
