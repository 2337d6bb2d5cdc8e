/**
 * @file simulator.hpp
 * @brief Top level entry point: one configured simulation run.
 */
#pragma once

#include <memory>
#include <optional>

#include "assembler.hpp"
#include "backend.hpp"
#include "geometry.hpp"
#include "integrator.hpp"
#include "simulation_image.hpp"
#include "structure_factors.hpp"

/// Relative tolerance between the backends for a precision
auto default_tolerance(Precision precision) -> double;

struct SimulationConfig {
    BackendConfig backend;
    /// Use the reference backend if the accelerator cannot be brought up
    bool allow_fallback = true;
    /// Also run the reference backend and compare pixel by pixel
    bool verify_parity = false;
    /// Defaults to default_tolerance(backend.precision)
    std::optional<double> parity_tolerance;
    NoiseModel noise;
};

struct ParityReport {
    double max_relative_difference = 0.0;
    size_t divergent_pixels = 0;
    std::vector<NumericalDivergenceWarning> warnings;
};

/**
 * @brief Compare two backend results over the same grid.
 *
 * Pixels whose magnitudes are both below 1e-9 of the image maximum are
 * considered equal. At most max_warnings pixels are listed.
 */
auto compare_results(const BackendResult &reference,
                     const BackendResult &accelerator,
                     const PixelGrid &grid,
                     double tolerance,
                     size_t max_warnings = 1000) -> ParityReport;

/**
 * @brief Orchestrates a simulation.
 *
 * Construction validates everything (geometry, region of interest,
 * sampling) so setup errors surface before any computation. run()
 * selects the backend, falling back to the reference backend on
 * BackendUnavailable when allowed, and either returns a complete image
 * or throws.
 *
 * The geometry and structure factors are referenced, not copied, and
 * must outlive the Simulator.
 */
class Simulator {
  public:
    Simulator(const GeometryModel &geometry,
              const StructureFactorTable &structure_factors,
              const SamplingParameters &sampling,
              const SimulationConfig &config);

    auto run() -> SimulationImage;

    /// r_e² × fluence × spot_scale
    auto global_scale() const -> double;

    auto integrator() const -> const SamplingIntegrator & {
        return _integrator;
    }
    auto config() const -> const SimulationConfig & {
        return _config;
    }

  private:
    const GeometryModel &_geometry;
    SamplingIntegrator _integrator;
    SimulationConfig _config;
};
