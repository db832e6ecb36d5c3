// paretoSelector.hpp
#pragma once

#include "individual.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace landopt::optim {

/**
 * @brief Extracts the non-dominated front and picks the recommended layout.
 *
 * Recommendation order: highest financial objective, then shortest total
 * road length, then most lots, then lowest population index.
 */
class ParetoSelector {
public:
    /// Indices of the non-dominated individuals, ascending.
    static std::vector<std::size_t> frontIndices(const Population& pop);

    static ParetoFront extract(const Population& pop);

    /// Population index of the recommended individual; empty for an empty population.
    static std::optional<std::size_t> recommend(const Population& pop);

    /// True when `a` ranks ahead of `b` under the recommendation order (indices break ties).
    static bool preferred(const Individual& a, std::size_t ia, const Individual& b, std::size_t ib);
};

} // namespace landopt::optim
