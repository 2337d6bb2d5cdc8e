/**
 * @file simulation_image.hpp
 * @brief Simulated image and the metadata describing how it was produced.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief A pixel where the accelerator and reference results disagree
 * beyond the tolerance for the run precision.
 *
 * Reported in the image metadata and the log, never thrown.
 */
struct NumericalDivergenceWarning {
    size_t fast;
    size_t slow;
    double reference;
    double accelerator;
    double relative_difference;
    double tolerance;
};

struct ImageMetadata {
    std::string backend;  ///< "reference" or "accelerator", the one that produced the data
    std::string backend_description;
    std::string precision;
    std::string numerical_policy;
    bool fell_back = false;
    std::string fallback_reason;

    int oversample = 1;
    size_t sensor_layers = 1;
    size_t mosaic_domains = 1;
    size_t sources = 1;
    uint64_t total_samples = 0;
    uint64_t clamped_samples = 0;
    double elapsed_ms = 0.0;

    double global_scale = 1.0;
    std::string noise;
    uint64_t noise_seed = 0;

    bool parity_checked = false;
    double max_relative_difference = 0.0;
    size_t divergent_pixels = 0;  ///< May exceed warnings.size(), which is capped
    std::vector<NumericalDivergenceWarning> warnings;
};

/// Row-major (slow, fast) intensities covering the whole detector
struct SimulationImage {
    size_t width = 0;
    size_t height = 0;
    std::vector<double> data;
    ImageMetadata metadata;

    auto at(size_t fast, size_t slow) const -> double {
        return data.at(slow * width + fast);
    }
};
