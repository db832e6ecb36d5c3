//
// Exception types raised by the site loader and the optimizer front door.
//

#ifndef LANDOPT_ERRORS_HPP
#define LANDOPT_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace landopt {

/**
 * @brief Raised when a site boundary is not a closed, simple, positive-area polygon.
 * Thrown before any optimization work starts.
 */
class InvalidBoundary : public std::invalid_argument {
public:
    explicit InvalidBoundary(const std::string& what)
        : std::invalid_argument("Invalid boundary: " + what) {}
};

} // namespace landopt

#endif // LANDOPT_ERRORS_HPP
