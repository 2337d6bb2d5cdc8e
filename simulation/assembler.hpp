/**
 * @file assembler.hpp
 * @brief Scale backend output into a detector image and apply detector noise.
 */
#pragma once

#include <cstdint>
#include <string>

#include "backend.hpp"
#include "simulation_image.hpp"

enum class NoiseKind {
    NONE,
    POISSON,   ///< Photon counting
    GAUSSIAN,  ///< Normal approximation, sigma = sqrt(I)
};

/**
 * @brief Detector response applied after all accumulation.
 *
 * Per pixel, in row-major order: flicker (fractional, Gaussian),
 * calibration (fractional, fixed per pixel by calibration_seed), photon
 * noise of the chosen kind, then the ADC stage
 * value * quantum_gain + adc_offset + readout noise. The defaults make
 * every stage other than the photon noise a no-op.
 */
struct NoiseModel {
    NoiseKind kind = NoiseKind::NONE;
    uint64_t seed = 0;
    double flicker = 0.0;
    double calibration = 0.0;
    uint64_t calibration_seed = 123456789;
    double readout = 0.0;  ///< ADU
    double quantum_gain = 1.0;
    double adc_offset = 0.0;
};

auto to_string(NoiseKind kind) -> std::string;

/**
 * @brief Build the detector image from a backend result.
 *
 * @param result Unscaled intensities over the grid
 * @param grid Pixels covered by the result; everything else is zero
 * @param detector Full detector extent
 * @param global_scale Multiplies every pixel before noise
 * @param noise Detector response model
 */
auto assemble(const BackendResult &result,
              const PixelGrid &grid,
              const DetectorGeometry &detector,
              double global_scale,
              const NoiseModel &noise) -> SimulationImage;
