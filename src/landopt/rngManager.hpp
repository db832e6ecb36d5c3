//
// Seeded random streams threaded explicitly through the genetic operators.
//

#ifndef LANDOPT_RNGMANAGER_HPP
#define LANDOPT_RNGMANAGER_HPP

#include <cstdint>
#include <random>

namespace landopt::rng {

using Engine = std::mt19937_64;

/// Stream ids so each stochastic component draws from its own sequence.
enum class Stream : std::uint32_t {
    Initialization = 1,
    Variation      = 2,
    Tests          = 99
};

class RngManager {
public:
    explicit RngManager(std::uint64_t seed) : master_seed(seed) {}

    Engine make_rng(Stream stream, std::uint32_t run_id = 0) const {
        std::seed_seq seq{
            static_cast<std::uint32_t>(master_seed),
            static_cast<std::uint32_t>(master_seed >> 32),
            static_cast<std::uint32_t>(stream),
            run_id
        };
        return Engine(seq);
    }

private:
    std::uint64_t master_seed;
};

} // namespace landopt::rng

#endif // LANDOPT_RNGMANAGER_HPP
