//
// Genome representation, random generation and repair.
//

#ifndef LANDOPT_GENOME_HPP
#define LANDOPT_GENOME_HPP

#include "../rngManager.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace landopt::layout {

/// Position of each header gene. Cut genes follow FirstCut.
enum GeneIndex : std::size_t {
    Orientation      = 0,   // angle around the reference direction
    PrimaryOffset    = 1,   // primary road position across the working box
    CutFraction      = 2,   // share of cut genes that become secondary roads
    LotSize          = 3,   // target lot area between the minimum and the span
    AspectRatio      = 4,   // target depth/width ratio inside the allowed range
    RowStretch       = 5,   // lot row depth stretch, trades collectors for depth
    GreenThreshold   = 6,   // quality below which a lot turns into green space
    FirstCut         = 7
};

inline constexpr std::size_t kHeaderGenes = FirstCut;

/// Genes are snapped to this many steps per unit so repair is exactly idempotent.
inline constexpr std::uint32_t kGeneResolution = 1u << 20;

struct GenomeSchema {
    std::size_t max_secondary_cuts = 6;
    double      min_cut_gap        = 0.05;   // minimum separation of cut positions

    std::size_t length() const { return kHeaderGenes + max_secondary_cuts; }
};

/**
 * @brief Fixed-structure sequence of normalized values in [0,1].
 * The only representation the genetic operators act on.
 */
struct Genome {
    std::vector<double> genes;

    std::size_t size() const { return genes.size(); }
    double operator[](std::size_t i) const { return genes[i]; }
    double& operator[](std::size_t i) { return genes[i]; }

    /// FNV-1a over the bit patterns of the genes.
    std::uint64_t hash() const;

    /// Number of cut genes that become secondary roads.
    std::size_t activeCuts(const GenomeSchema& schema) const;
};

inline bool operator==(const Genome& a, const Genome& b) { return a.genes == b.genes; }
inline bool operator!=(const Genome& a, const Genome& b) { return !(a == b); }

/**
 * @brief Returns a structurally valid genome for any input.
 *
 * @details Non-finite values become 0.5, values are clamped into [0,1] and
 * snapped to kGeneResolution, the length is padded with 0.5 or truncated to
 * the schema length, and cut genes are sorted and spread to respect the
 * minimum gap. Never throws; repair(repair(g)) == repair(g).
 */
Genome repair(const Genome& raw, const GenomeSchema& schema);

/// Uniform random genome, already repaired.
Genome randomGenome(const GenomeSchema& schema, rng::Engine& engine);

} // namespace landopt::layout

#endif // LANDOPT_GENOME_HPP
