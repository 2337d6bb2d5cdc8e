#include "config.hpp"

#include <fmt/core.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <fstream>
#include <sstream>

#include "braggsim_logger.hpp"
#include "errors.hpp"

using json = nlohmann::json;

namespace {

#pragma region JSON helpers
auto section(const json &document, const char *name) -> const json & {
    static const json empty = json::object();
    if (!document.contains(name)) return empty;
    const json &value = document.at(name);
    if (!value.is_object()) {
        throw ConfigError(fmt::format("Section \"{}\" must be an object", name));
    }
    return value;
}

template <typename T>
auto get(const json &obj, const char *section_name, const char *key) -> T {
    if (!obj.contains(key)) {
        throw ConfigError(fmt::format("Missing required key {}.{}", section_name, key));
    }
    try {
        return obj.at(key).template get<T>();
    } catch (const json::exception &e) {
        throw ConfigError(fmt::format("Bad value for {}.{}: {}", section_name, key, e.what()));
    }
}

template <typename T>
auto get(const json &obj, const char *section_name, const char *key, T fallback) -> T {
    if (!obj.contains(key)) return fallback;
    return get<T>(obj, section_name, key);
}

auto get_vector(const json &obj, const char *section_name, const char *key) -> Vector3d {
    auto values = get<std::array<double, 3>>(obj, section_name, key);
    return {values[0], values[1], values[2]};
}

auto get_vector(const json &obj, const char *section_name, const char *key, Vector3d fallback)
  -> Vector3d {
    if (!obj.contains(key)) return fallback;
    return get_vector(obj, section_name, key);
}

/// One of h, k, l from a structure_factors.entries row
auto miller_component(const json &value) -> int {
    bool in_range = false;
    if (value.is_number_unsigned()) {
        in_range = value.get<uint64_t>()
                   <= static_cast<uint64_t>(std::numeric_limits<int>::max());
    } else if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        in_range =
          v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max();
    } else {
        throw ConfigError(fmt::format(
          "structure_factors.entries: Miller indices must be integers, got {}", value.dump()));
    }
    if (!in_range) {
        throw ConfigError(fmt::format(
          "structure_factors.entries: Miller index {} is out of range", value.dump()));
    }
    return static_cast<int>(value.get<int64_t>());
}

auto resolve(const std::filesystem::path &base, const std::string &name)
  -> std::filesystem::path {
    std::filesystem::path path{name};
    if (path.is_relative() && !base.empty()) return base / path;
    return path;
}
#pragma endregion JSON helpers

auto parse_detector(const json &document) -> DetectorGeometry {
    const json &det = section(document, "detector");
    auto pixel_size = get<std::array<double, 2>>(det, "detector", "pixel_size");
    auto image_size = get<std::array<size_t, 2>>(det, "detector", "image_size");
    SensorParameters sensor;
    sensor.thickness_mm = get<double>(det, "detector", "thickness_mm", sensor.thickness_mm);
    sensor.thicksteps = get<int>(det, "detector", "thicksteps", sensor.thicksteps);
    sensor.attenuation_length_mm =
      get<double>(det, "detector", "attenuation_length_mm", sensor.attenuation_length_mm);
    if (det.contains("origin")) {
        return DetectorGeometry(get_vector(det, "detector", "origin"),
                                get_vector(det, "detector", "fast_axis"),
                                get_vector(det, "detector", "slow_axis"),
                                pixel_size,
                                image_size,
                                sensor);
    }
    // Beam centre defaults to the middle of the detector
    std::array<double, 2> centre{pixel_size[0] * image_size[0] / 2.0,
                                 pixel_size[1] * image_size[1] / 2.0};
    centre = get<std::array<double, 2>>(det, "detector", "beam_center", centre);
    return DetectorGeometry::from_distance(
      get<double>(det, "detector", "distance"), centre, pixel_size, image_size, sensor);
}

auto parse_beam(const json &document, const std::filesystem::path &base) -> BeamParameters {
    const json &b = section(document, "beam");
    BeamParameters beam;
    beam.direction = get_vector(b, "beam", "direction", beam.direction);
    beam.wavelength = get<double>(b, "beam", "wavelength", beam.wavelength);
    if (b.contains("spectrum")) {
        for (const auto &line : get<std::vector<std::array<double, 2>>>(b, "beam", "spectrum")) {
            beam.spectrum.push_back({line[0], line[1]});
        }
    }
    if (b.contains("spectrum_file")) {
        auto extra =
          read_spectrum_file(resolve(base, get<std::string>(b, "beam", "spectrum_file")),
                             get<size_t>(b, "beam", "spectrum_stride", 1));
        beam.spectrum.insert(beam.spectrum.end(), extra.begin(), extra.end());
    }
    beam.divergence = get<double>(b, "beam", "divergence_mrad", 0.0) / 1000.0;
    beam.divergence_steps = get<int>(b, "beam", "divergence_steps", beam.divergence_steps);
    beam.polarization_normal =
      get_vector(b, "beam", "polarization_normal", beam.polarization_normal);
    beam.polarization_fraction =
      get<double>(b, "beam", "polarization_fraction", beam.polarization_fraction);
    beam.flux = get<double>(b, "beam", "flux", beam.flux);
    beam.exposure = get<double>(b, "beam", "exposure", beam.exposure);
    beam.beam_size_mm = get<double>(b, "beam", "beam_size_mm", beam.beam_size_mm);
    beam.fluence = get<double>(b, "beam", "fluence", beam.fluence);
    return beam;
}

auto parse_crystal(const json &document) -> CrystalParameters {
    const json &c = section(document, "crystal");
    CrystalParameters crystal;
    if (c.contains("A_matrix")) {
        auto values = get<std::array<double, 9>>(c, "crystal", "A_matrix");
        for (int i = 0; i < 9; ++i) {
            crystal.reciprocal_matrix(i / 3, i % 3) = values[i];
        }
    } else {
        crystal.reciprocal_matrix =
          CrystalModel::reciprocal_from_real(get_vector(c, "crystal", "real_space_a"),
                                             get_vector(c, "crystal", "real_space_b"),
                                             get_vector(c, "crystal", "real_space_c"));
    }
    crystal.ncells = get<std::array<double, 3>>(c, "crystal", "ncells", crystal.ncells);
    if (c.contains("shape")) {
        crystal.shape = parse_lattice_shape(get<std::string>(c, "crystal", "shape"));
    }
    crystal.mosaicity_deg = get<double>(c, "crystal", "mosaicity_deg", crystal.mosaicity_deg);
    if (c.contains("anisotropic_mosaicity")) {
        auto spread = get<std::vector<double>>(c, "crystal", "anisotropic_mosaicity");
        if (spread.size() != 3 && spread.size() != 6) {
            throw ConfigError(fmt::format(
              "crystal.anisotropic_mosaicity needs 3 or 6 values, got {}", spread.size()));
        }
        crystal.anisotropic_mosaicity = spread;
    }
    crystal.mosaic_domains = get<int>(c, "crystal", "mosaic_domains", crystal.mosaic_domains);
    std::string sampling = get<std::string>(c, "crystal", "mosaic_sampling", "even");
    if (sampling == "even") {
        crystal.sampling = MosaicSampling::EVEN;
    } else if (sampling == "random") {
        crystal.sampling = MosaicSampling::RANDOM;
    } else {
        throw ConfigError(
          fmt::format("crystal.mosaic_sampling must be \"even\" or \"random\", got \"{}\"",
                      sampling));
    }
    crystal.seed = get<uint64_t>(c, "crystal", "mosaic_seed", crystal.seed);
    return crystal;
}

auto parse_entries(const json &sf, const std::filesystem::path &base)
  -> std::vector<StructureFactorEntry> {
    std::vector<StructureFactorEntry> entries;
    if (sf.contains("file")) {
        entries = read_hkl_file(resolve(base, get<std::string>(sf, "structure_factors", "file")));
    }
    if (sf.contains("entries")) {
        for (const auto &row :
             get<std::vector<std::vector<json>>>(sf, "structure_factors", "entries")) {
            if (row.size() != 4 && row.size() != 5) {
                throw ConfigError(
                  "structure_factors.entries rows must be [h, k, l, F] or [h, k, l, F, phase]");
            }
            for (size_t i = 3; i < row.size(); ++i) {
                if (!row[i].is_number()) {
                    throw ConfigError(fmt::format(
                      "structure_factors.entries: amplitude and phase must be numbers, got {}",
                      json(row).dump()));
                }
            }
            double amplitude = row[3].get<double>();
            double phase = row.size() == 5 ? row[4].get<double>() * M_PI / 180.0 : 0.0;
            entries.push_back(
              {{miller_component(row[0]), miller_component(row[1]), miller_component(row[2])},
               std::polar(amplitude, phase)});
        }
    }
    return entries;
}

auto parse_sampling(const json &sim) -> SamplingParameters {
    SamplingParameters sampling;
    sampling.oversample = get<int>(sim, "simulation", "oversample", sampling.oversample);
    sampling.point_pixel = get<bool>(sim, "simulation", "point_pixel", sampling.point_pixel);
    if (sim.contains("interpolation")) {
        sampling.interpolation =
          parse_interpolation(get<std::string>(sim, "simulation", "interpolation"));
    }
    if (sim.contains("roi")) {
        auto roi = get<std::array<size_t, 4>>(sim, "simulation", "roi");
        sampling.roi = PixelGrid{roi[0], roi[1], roi[2], roi[3]};
    }
    sampling.spot_scale = get<double>(sim, "simulation", "spot_scale", sampling.spot_scale);
    sampling.min_airpath =
      get<double>(sim, "simulation", "min_airpath_mm", sampling.min_airpath);
    return sampling;
}

auto parse_config(const json &sim, const json &noise_section) -> SimulationConfig {
    SimulationConfig config;
    auto &backend = config.backend;
    if (sim.contains("backend")) {
        backend.kind = parse_backend_kind(get<std::string>(sim, "simulation", "backend"));
    }
    if (sim.contains("precision")) {
        backend.precision = parse_precision(get<std::string>(sim, "simulation", "precision"));
    }
    if (sim.contains("numerical_policy")) {
        backend.policy =
          parse_numerical_policy(get<std::string>(sim, "simulation", "numerical_policy"));
    }
    backend.threads = get<size_t>(sim, "simulation", "threads", backend.threads);
    backend.device_id = get<int>(sim, "simulation", "device", backend.device_id);
    config.allow_fallback = get<bool>(sim, "simulation", "allow_fallback", true);
    config.verify_parity = get<bool>(sim, "simulation", "verify_parity", false);
    if (sim.contains("parity_tolerance")) {
        config.parity_tolerance = get<double>(sim, "simulation", "parity_tolerance");
    }

    auto &noise = config.noise;
    if (noise_section.contains("kind")) {
        noise.kind = parse_noise_kind(get<std::string>(noise_section, "noise", "kind"));
    }
    noise.seed = get<uint64_t>(noise_section, "noise", "seed", noise.seed);
    noise.flicker = get<double>(noise_section, "noise", "flicker", noise.flicker);
    noise.calibration = get<double>(noise_section, "noise", "calibration", noise.calibration);
    noise.calibration_seed =
      get<uint64_t>(noise_section, "noise", "calibration_seed", noise.calibration_seed);
    noise.readout = get<double>(noise_section, "noise", "readout", noise.readout);
    noise.quantum_gain = get<double>(noise_section, "noise", "quantum_gain", noise.quantum_gain);
    noise.adc_offset = get<double>(noise_section, "noise", "adc_offset", noise.adc_offset);
    return config;
}

auto open_text(const std::filesystem::path &path) -> std::ifstream {
    std::ifstream f(path);
    if (!f) {
        throw ConfigError(fmt::format("Could not open {}", path.string()));
    }
    return f;
}

/// Strip comments; false for lines with nothing left
bool content_of(std::string &line) {
    auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);
    return line.find_first_not_of(" \t\r") != std::string::npos;
}
}  // namespace

auto read_hkl_file(const std::filesystem::path &path) -> std::vector<StructureFactorEntry> {
    std::ifstream f = open_text(path);
    std::vector<StructureFactorEntry> entries;
    std::string line;
    size_t line_number = 0;
    while (std::getline(f, line)) {
        ++line_number;
        if (!content_of(line)) continue;
        std::istringstream fields(line);
        int h, k, l;
        double amplitude;
        if (!(fields >> h >> k >> l >> amplitude)) {
            throw ConfigError(fmt::format(
              "{}:{}: expected \"h k l F [phase]\"", path.string(), line_number));
        }
        double phase_deg = 0.0;
        if (!(fields >> phase_deg)) {
            if (!fields.eof()) {
                throw ConfigError(
                  fmt::format("{}:{}: phase is not a number", path.string(), line_number));
            }
            phase_deg = 0.0;
        }
        entries.push_back({{h, k, l}, std::polar(amplitude, phase_deg * M_PI / 180.0)});
    }
    logger.debug("Read {} reflections from {}", entries.size(), path.string());
    return entries;
}

auto read_spectrum_file(const std::filesystem::path &path, size_t stride)
  -> std::vector<SpectrumLine> {
    if (stride == 0) {
        throw ConfigError("Spectrum stride must be at least one");
    }
    std::ifstream f = open_text(path);
    std::vector<SpectrumLine> spectrum;
    std::string line;
    size_t line_number = 0, data_line = 0;
    while (std::getline(f, line)) {
        ++line_number;
        if (!content_of(line)) continue;
        std::istringstream fields(line);
        double wavelength, weight;
        if (!(fields >> wavelength >> weight)) {
            throw ConfigError(fmt::format(
              "{}:{}: expected \"wavelength weight\"", path.string(), line_number));
        }
        if (data_line++ % stride == 0) {
            spectrum.push_back({wavelength, weight});
        }
    }
    if (spectrum.empty()) {
        throw ConfigError(fmt::format("{} contains no spectrum lines", path.string()));
    }
    return spectrum;
}

auto parse_setup(const json &document, const std::filesystem::path &base_directory)
  -> SimulationSetup {
    if (!document.is_object()) {
        throw ConfigError("Simulation description must be a JSON object");
    }
    const json &sf = section(document, "structure_factors");
    const json &sim = section(document, "simulation");

    std::string missing = get<std::string>(sf, "structure_factors", "missing", "default");
    MissingIndexPolicy policy;
    if (missing == "default") {
        policy = MissingIndexPolicy::DEFAULT;
    } else if (missing == "nearest") {
        policy = MissingIndexPolicy::NEAREST;
    } else {
        throw ConfigError(fmt::format(
          "structure_factors.missing must be \"default\" or \"nearest\", got \"{}\"",
          missing));
    }

    return SimulationSetup{
      parse_detector(document),
      parse_beam(document, base_directory),
      parse_crystal(document),
      parse_entries(sf, base_directory),
      {get<double>(sf, "structure_factors", "default_F", 0.0), 0.0},
      policy,
      parse_sampling(sim),
      parse_config(sim, section(document, "noise")),
    };
}

auto load_setup(const std::filesystem::path &path) -> SimulationSetup {
    std::ifstream f = open_text(path);
    json document;
    try {
        document = json::parse(f);
    } catch (const json::parse_error &e) {
        throw ConfigError(fmt::format(
          "Unable to read {}: JSON parse error at byte {}", path.string(), e.byte));
    }
    return parse_setup(document, path.parent_path());
}

#pragma region Names
auto parse_lattice_shape(const std::string &name) -> LatticeShape {
    if (name == "square") return LatticeShape::SQUARE;
    if (name == "round") return LatticeShape::ROUND;
    if (name == "gauss") return LatticeShape::GAUSS;
    if (name == "tophat") return LatticeShape::TOPHAT;
    throw ConfigError(fmt::format(
      "Unknown lattice shape \"{}\" (square, round, gauss, tophat)", name));
}

auto parse_interpolation(const std::string &name) -> InterpolationMode {
    if (name == "nearest") return InterpolationMode::NEAREST;
    if (name == "trilinear") return InterpolationMode::TRILINEAR;
    throw ConfigError(
      fmt::format("Unknown interpolation \"{}\" (nearest, trilinear)", name));
}

auto parse_backend_kind(const std::string &name) -> BackendKind {
    if (name == "reference" || name == "cpu") return BackendKind::REFERENCE;
    if (name == "accelerator" || name == "cuda") return BackendKind::ACCELERATOR;
    throw ConfigError(fmt::format("Unknown backend \"{}\" (reference, accelerator)", name));
}

auto parse_precision(const std::string &name) -> Precision {
    if (name == "double") return Precision::DOUBLE;
    if (name == "float" || name == "single") return Precision::SINGLE;
    throw ConfigError(fmt::format("Unknown precision \"{}\" (double, float)", name));
}

auto parse_numerical_policy(const std::string &name) -> NumericalPolicy {
    if (name == "clamp") return NumericalPolicy::CLAMP;
    if (name == "strict") return NumericalPolicy::STRICT;
    throw ConfigError(fmt::format("Unknown numerical policy \"{}\" (clamp, strict)", name));
}

auto parse_noise_kind(const std::string &name) -> NoiseKind {
    if (name == "none") return NoiseKind::NONE;
    if (name == "poisson") return NoiseKind::POISSON;
    if (name == "gaussian") return NoiseKind::GAUSSIAN;
    throw ConfigError(fmt::format("Unknown noise \"{}\" (none, poisson, gaussian)", name));
}
#pragma endregion Names
