// pareto.hpp
#pragma once

#include "individual.hpp"

#include <cstddef>
#include <vector>

namespace landopt::optim {

/// Hard violation count plus soft penalty; 0 for feasible vectors.
double violationSeverity(const evaluation::FitnessVector& f);

/**
 * @brief Constrained dominance (all objectives maximized).
 *
 * A feasible vector dominates every infeasible one. Between infeasible
 * vectors the lower severity dominates; equal severity and two feasible
 * vectors fall back to Pareto dominance.
 */
bool dominates(const evaluation::FitnessVector& a, const evaluation::FitnessVector& b);

/**
 * @brief Fast non-dominated sort.
 * @return Population indices grouped by front, best front first.
 * @throws std::invalid_argument if an individual has no fitness.
 */
std::vector<std::vector<std::size_t>> nonDominatedSort(const Population& pop);

/// Crowding distance of each member of one front, written into the individuals.
void assignCrowding(Population& pop, const std::vector<std::size_t>& front);

/// Sets rank and crowding for every individual.
void rankPopulation(Population& pop);

} // namespace landopt::optim
