#include "assembler.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

#include "braggsim_logger.hpp"

auto to_string(NoiseKind kind) -> std::string {
    switch (kind) {
    case NoiseKind::NONE:
        return "none";
    case NoiseKind::POISSON:
        return "poisson";
    case NoiseKind::GAUSSIAN:
        return "gaussian";
    }
    return "unknown";
}

namespace {
class DetectorResponse {
  public:
    explicit DetectorResponse(const NoiseModel &model)
        : _model(model), _rng(model.seed), _calibration_rng(model.calibration_seed) {}

    auto operator()(double expected) -> double {
        if (_model.flicker > 0.0) {
            expected *= 1.0 + _model.flicker * _gauss(_rng);
        }
        if (_model.calibration > 0.0) {
            expected *= 1.0 + _model.calibration * _gauss(_calibration_rng);
        }
        expected = std::max(expected, 0.0);

        double observed = expected;
        switch (_model.kind) {
        case NoiseKind::NONE:
            break;
        case NoiseKind::POISSON:
            observed = sample_poisson(expected);
            break;
        case NoiseKind::GAUSSIAN:
            observed = expected + std::sqrt(expected) * _gauss(_rng);
            break;
        }

        double adu = observed * _model.quantum_gain + _model.adc_offset;
        if (_model.readout > 0.0) {
            adu += _model.readout * _gauss(_rng);
        }
        return adu;
    }

  private:
    auto sample_poisson(double mean) -> double {
        if (mean <= 0.0) return 0.0;
        std::poisson_distribution<int64_t> poisson(mean);
        return static_cast<double>(poisson(_rng));
    }

    const NoiseModel &_model;
    std::mt19937_64 _rng;
    std::mt19937_64 _calibration_rng;
    std::normal_distribution<double> _gauss{0.0, 1.0};
};
}  // namespace

auto assemble(const BackendResult &result,
              const PixelGrid &grid,
              const DetectorGeometry &detector,
              double global_scale,
              const NoiseModel &noise) -> SimulationImage {
    if (result.intensities.size() != grid.size()) {
        throw std::invalid_argument(
          fmt::format("Backend returned {} intensities for a grid of {} pixels",
                      result.intensities.size(),
                      grid.size()));
    }
    if (grid.fast_begin + grid.width > detector.width()
        || grid.slow_begin + grid.height > detector.height()) {
        throw std::invalid_argument("Pixel grid extends beyond the detector");
    }

    SimulationImage image;
    image.width = detector.width();
    image.height = detector.height();
    image.data.assign(image.width * image.height, 0.0);
    image.metadata.global_scale = global_scale;
    image.metadata.noise = to_string(noise.kind);
    image.metadata.noise_seed = noise.seed;

    DetectorResponse respond(noise);
    size_t negative = 0;
    for (size_t row = 0; row < grid.height; ++row) {
        size_t slow = grid.slow_begin + row;
        for (size_t col = 0; col < grid.width; ++col) {
            size_t fast = grid.fast_begin + col;
            double value = respond(result.intensities[row * grid.width + col] * global_scale);
            if (value < 0.0) ++negative;
            image.data[slow * image.width + fast] = value;
        }
    }
    if (negative > 0) {
        logger.debug("{} pixels are negative after readout noise", negative);
    }
    return image;
}
