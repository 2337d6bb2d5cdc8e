/**
 * @file config.hpp
 * @brief Loading a simulation description from JSON and plain text inputs.
 *
 * The JSON document has the sections "beam", "detector", "crystal",
 * "structure_factors", "simulation" and "noise". Vector-valued keys
 * follow the dx2 experiment models (origin, fast_axis, slow_axis,
 * real_space_a/b/c, polarization_normal ...). Relative file names are
 * resolved against the directory of the JSON file.
 */
#pragma once

#include <complex>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "geometry.hpp"
#include "simulator.hpp"
#include "structure_factors.hpp"

/// Everything needed to build and run one simulation
struct SimulationSetup {
    DetectorGeometry detector;
    BeamParameters beam;
    CrystalParameters crystal;
    std::vector<StructureFactorEntry> structure_factors;
    std::complex<double> default_amplitude;
    MissingIndexPolicy missing_policy;
    SamplingParameters sampling;
    SimulationConfig config;
};

/**
 * @brief Read a reflection list.
 *
 * One reflection per line: "h k l F" or "h k l F phase", with the phase
 * in degrees. Blank lines and text after '#' are ignored.
 *
 * @throws ConfigError naming the file and line of a malformed entry
 */
auto read_hkl_file(const std::filesystem::path &path) -> std::vector<StructureFactorEntry>;

/**
 * @brief Read a spectrum as "wavelength weight" lines (Å, arbitrary units).
 *
 * @param stride Keep every stride-th line, starting with the first
 */
auto read_spectrum_file(const std::filesystem::path &path, size_t stride = 1)
  -> std::vector<SpectrumLine>;

auto parse_setup(const nlohmann::json &document,
                 const std::filesystem::path &base_directory = {}) -> SimulationSetup;

/// Parse a JSON file; relative paths inside are taken from its directory
auto load_setup(const std::filesystem::path &path) -> SimulationSetup;

// Names as they appear in the JSON document and on the command line
auto parse_lattice_shape(const std::string &name) -> LatticeShape;
auto parse_interpolation(const std::string &name) -> InterpolationMode;
auto parse_backend_kind(const std::string &name) -> BackendKind;
auto parse_precision(const std::string &name) -> Precision;
auto parse_numerical_policy(const std::string &name) -> NumericalPolicy;
auto parse_noise_kind(const std::string &name) -> NoiseKind;
