#pragma once

#include <stdexcept>
#include <string>

namespace cirrus {

/**
 * @brief Raised when the flight dynamics model faults in the middle of a tick.
 *
 * The model state can no longer be trusted once this is thrown; the session
 * should be torn down. The model's own exception is nested inside.
 */
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& what)
        : std::runtime_error(what) {}
};

/**
 * @brief Raised for unusable configuration: unreadable files, bad values,
 * or a flight model that refuses to load.
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace cirrus
