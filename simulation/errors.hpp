/**
 * @file errors.hpp
 * @brief Exception types raised by the simulation engine.
 *
 * Setup problems (geometry, structure factor input, configuration) are
 * raised before any pixel is computed. BackendUnavailable is raised
 * when an execution backend cannot be brought up, and
 * NumericalInstabilityError only under the strict numerical policy.
 * CPU/accelerator disagreement is not an exception, see
 * NumericalDivergenceWarning in simulation_image.hpp.
 */
#pragma once

#include <stdexcept>
#include <string>

class InvalidGeometryError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class DuplicateIndexError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class BackendUnavailable : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class NumericalInstabilityError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};
