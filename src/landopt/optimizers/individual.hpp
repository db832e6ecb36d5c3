// individual.hpp
#pragma once

#include "../evaluation/fitnessEvaluator.hpp"
#include "../layout/genome.hpp"
#include "../layout/layout.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace landopt::optim {

/**
 * @brief One candidate: genome plus its memoized layout and fitness.
 * Layouts are shared between individuals carrying the same genome.
 */
struct Individual {
    layout::Genome genome;
    std::shared_ptr<const layout::Layout> layout;
    std::optional<evaluation::FitnessVector> fitness;

    std::size_t rank = 0;        // Pareto front index, 0 = non-dominated
    double      crowding = 0.0;

    bool evaluated() const { return layout && fitness.has_value(); }
};

using Population  = std::vector<Individual>;
using ParetoFront = std::vector<Individual>;

} // namespace landopt::optim
