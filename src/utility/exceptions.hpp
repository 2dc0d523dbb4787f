#pragma once

#include <stdexcept>
#include <string>

namespace gridbreak {

/**
 * Base exception class for all gridbreak errors
 */
class GridbreakException : public std::runtime_error {
  public:
    explicit GridbreakException(const std::string &message)
        : std::runtime_error(message) {}
};

/**
 * Rejected geometry, grid shape or tuning values, raised at construction
 */
class ConfigError : public GridbreakException {
  public:
    explicit ConfigError(const std::string &message)
        : GridbreakException("Configuration error: " + message) {}
};

/**
 * Misuse of the engine API (e.g. querying a brick index that does not exist)
 */
class SimulationError : public GridbreakException {
  public:
    explicit SimulationError(const std::string &message)
        : GridbreakException("Simulation error: " + message) {}
};

/**
 * File read/write and JSON parsing failures
 */
class IOError : public GridbreakException {
  public:
    explicit IOError(const std::string &message)
        : GridbreakException("I/O error: " + message) {}
};

/**
 * Frame drawing and image export failures
 */
class RenderError : public GridbreakException {
  public:
    explicit RenderError(const std::string &message)
        : GridbreakException("Render error: " + message) {}
};

} // namespace gridbreak
