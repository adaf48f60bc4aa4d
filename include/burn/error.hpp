#pragma once
#include <stdexcept>
#include <string>

namespace burn { // Begin of namespace burn

// Thrown when options or a palette violate their invariants. Nothing is
// applied when this is thrown.
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what)
    {
    }
};

} // End of namespace burn
