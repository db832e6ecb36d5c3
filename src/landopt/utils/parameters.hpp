//
// key = value parameter files for engine, decoder and genome settings.
//

#ifndef LANDOPT_PARAMETERS_HPP
#define LANDOPT_PARAMETERS_HPP

#include "../layout/genome.hpp"
#include "../layout/layoutDecoder.hpp"
#include "../optimizers/evolutionaryEngine.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace landopt::utils {

struct RunParameters {
    optim::EngineConfig   engine;
    layout::DecoderConfig decoder;
    layout::GenomeSchema  schema;
};

/**
 * @brief Applies `key = value` lines over the given defaults.
 *
 * @details Blank lines and `#` comments are ignored. Unknown keys and values
 * that do not parse are reported on std::cerr and skipped.
 *
 * @code
 * population_size = 80
 * crossover       = uniform
 * min_frontage    = 25    # metres
 * @endcode
 */
RunParameters parseParameters(std::istream& in, const RunParameters& defaults = RunParameters{});

/// @throws std::runtime_error when the file cannot be opened.
RunParameters loadParameters(const std::string& filename, const RunParameters& defaults = RunParameters{});

/// Every key parseParameters() accepts.
std::vector<std::string> parameterKeys();

} // namespace landopt::utils

#endif // LANDOPT_PARAMETERS_HPP
