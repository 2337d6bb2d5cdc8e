#include "simulator.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

#include "braggsim_logger.hpp"
#include "common.hpp"
#include "errors.hpp"

namespace {
// Pixels below this fraction of the brightest pixel are not compared
constexpr double PARITY_FLOOR_FRACTION = 1e-9;
constexpr size_t LOGGED_WARNINGS = 10;
}  // namespace

auto default_tolerance(Precision precision) -> double {
    return precision == Precision::DOUBLE ? 1e-6 : 1e-3;
}

auto compare_results(const BackendResult &reference,
                     const BackendResult &accelerator,
                     const PixelGrid &grid,
                     double tolerance,
                     size_t max_warnings) -> ParityReport {
    if (reference.intensities.size() != grid.size()
        || accelerator.intensities.size() != grid.size()) {
        throw std::invalid_argument("Backend results do not match the pixel grid");
    }
    double image_max = 0.0;
    for (double value : reference.intensities) {
        image_max = std::max(image_max, std::abs(value));
    }
    double floor = image_max * PARITY_FLOOR_FRACTION;

    ParityReport report;
    for (size_t i = 0; i < grid.size(); ++i) {
        double ref = reference.intensities[i];
        double acc = accelerator.intensities[i];
        double diff = relative_difference(ref, acc, floor);
        if (!std::isfinite(acc) || !std::isfinite(ref)) {
            diff = std::numeric_limits<double>::infinity();
        }
        report.max_relative_difference = std::max(report.max_relative_difference, diff);
        if (diff > tolerance) {
            ++report.divergent_pixels;
            if (report.warnings.size() < max_warnings) {
                report.warnings.push_back({grid.fast_begin + i % grid.width,
                                           grid.slow_begin + i / grid.width,
                                           ref,
                                           acc,
                                           diff,
                                           tolerance});
            }
        }
    }
    return report;
}

Simulator::Simulator(const GeometryModel &geometry,
                     const StructureFactorTable &structure_factors,
                     const SamplingParameters &sampling,
                     const SimulationConfig &config)
    : _geometry(geometry), _integrator(geometry, structure_factors, sampling), _config(config) {
    if (!(_integrator.sampling().spot_scale > 0.0)) {
        throw InvalidGeometryError(
          fmt::format("Spot scale must be positive, got {}", _integrator.sampling().spot_scale));
    }
    if (_config.parity_tolerance && !(*_config.parity_tolerance > 0.0)) {
        throw std::invalid_argument("Parity tolerance must be positive");
    }
}

auto Simulator::global_scale() const -> double {
    return R_E_SQR * _geometry.beam().fluence() * _integrator.sampling().spot_scale;
}

auto Simulator::run() -> SimulationImage {
    const PixelGrid &grid = _integrator.grid();
    ImageMetadata metadata;

    std::unique_ptr<ExecutionBackend> backend;
    try {
        backend = make_backend(_config.backend);
    } catch (const BackendUnavailable &e) {
        if (!_config.allow_fallback || _config.backend.kind == BackendKind::REFERENCE) {
            throw;
        }
        logger.warn("Accelerator unavailable ({}), falling back to the reference backend",
                    e.what());
        metadata.fell_back = true;
        metadata.fallback_reason = e.what();
        BackendConfig reference_config = _config.backend;
        reference_config.kind = BackendKind::REFERENCE;
        backend = make_backend(reference_config);
    }

    logger.info("Simulating {}x{} pixels with {} in {} precision, {} samples per pixel",
                grid.width,
                grid.height,
                backend->name(),
                to_string(_config.backend.precision),
                _integrator.samples_per_pixel());

    BackendResult result = backend->run(_integrator, grid);

    if (result.clamped_samples > 0) {
        logger.warn("{} of {} samples were clamped or dropped",
                    result.clamped_samples,
                    result.samples);
    }

    if (_config.verify_parity) {
        if (backend->kind() == BackendKind::ACCELERATOR) {
            BackendConfig reference_config = _config.backend;
            reference_config.kind = BackendKind::REFERENCE;
            BackendResult reference = make_backend(reference_config)->run(_integrator, grid);
            double tolerance =
              _config.parity_tolerance.value_or(default_tolerance(_config.backend.precision));
            ParityReport report = compare_results(reference, result, grid, tolerance);
            metadata.parity_checked = true;
            metadata.max_relative_difference = report.max_relative_difference;
            metadata.divergent_pixels = report.divergent_pixels;
            metadata.warnings = std::move(report.warnings);
            if (metadata.divergent_pixels > 0) {
                logger.warn("{} pixels differ from the reference backend by more than {:.1e}",
                            metadata.divergent_pixels,
                            tolerance);
                for (size_t i = 0; i < std::min(LOGGED_WARNINGS, metadata.warnings.size());
                     ++i) {
                    const auto &w = metadata.warnings[i];
                    logger.warn("  pixel ({}, {}): reference {:.6e}, accelerator {:.6e}, "
                                "relative difference {:.3e}",
                                w.fast,
                                w.slow,
                                w.reference,
                                w.accelerator,
                                w.relative_difference);
                }
            } else {
                logger.info("Parity check passed, max relative difference {:.3e}",
                            metadata.max_relative_difference);
            }
        } else {
            logger.info("Parity check skipped: the reference backend produced the image");
        }
    }

    SimulationImage image =
      assemble(result, grid, _geometry.detector(), global_scale(), _config.noise);

    metadata.backend = to_string(backend->kind());
    metadata.backend_description = backend->name();
    metadata.precision = to_string(_config.backend.precision);
    metadata.numerical_policy = to_string(_config.backend.policy);
    metadata.oversample = _integrator.oversample();
    metadata.sensor_layers = _integrator.layer_count();
    metadata.mosaic_domains = _integrator.domain_count();
    metadata.sources = _integrator.source_count();
    metadata.total_samples = result.samples;
    metadata.clamped_samples = result.clamped_samples;
    metadata.elapsed_ms = result.elapsed_ms;
    metadata.global_scale = image.metadata.global_scale;
    metadata.noise = image.metadata.noise;
    metadata.noise_seed = image.metadata.noise_seed;
    image.metadata = std::move(metadata);

    logger.info("Simulation finished in {:.1f} ms", result.elapsed_ms);
    return image;
}
